#include <slate/block-store.h>
#include <ytrace/ytrace.hpp>
#include <chrono>
#include <cmath>
#include <ctime>
#include <string>
#include <type_traits>

#include <sqlite3.h>

namespace slate {

const char* categoryName(UpdateCategory category) {
    switch (category) {
        case UpdateCategory::Position: return "position";
        case UpdateCategory::Size: return "size";
        case UpdateCategory::Content: return "content";
    }
    return "unknown";
}

namespace {

constexpr const char* SCHEMA_SQL = R"sql(
CREATE TABLE IF NOT EXISTS canvas_blocks (
    id           TEXT PRIMARY KEY NOT NULL,
    position_x   INTEGER NOT NULL DEFAULT 0,
    position_y   INTEGER NOT NULL DEFAULT 0,
    width        INTEGER NOT NULL DEFAULT 0,
    height       INTEGER NOT NULL DEFAULT 0,
    note_content TEXT,
    updated_at   TEXT
)
)sql";

constexpr const char* UPDATE_POSITION_SQL =
    "UPDATE canvas_blocks SET position_x = ?, position_y = ?, updated_at = ? WHERE id = ?";
constexpr const char* UPDATE_SIZE_SQL =
    "UPDATE canvas_blocks SET width = ?, height = ?, updated_at = ? WHERE id = ?";
constexpr const char* UPDATE_CONTENT_SQL =
    "UPDATE canvas_blocks SET note_content = ?, updated_at = ? WHERE id = ?";
constexpr const char* INSERT_SQL =
    "INSERT OR REPLACE INTO canvas_blocks "
    "(id, position_x, position_y, width, height, note_content, updated_at) "
    "VALUES (?, ?, ?, ?, ?, ?, ?)";
constexpr const char* SELECT_SQL =
    "SELECT id, position_x, position_y, width, height, note_content, updated_at "
    "FROM canvas_blocks WHERE id = ?";

constexpr int BUSY_TIMEOUT_MS = 5000;

// ISO-8601 UTC, second resolution
std::string iso8601Now() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

// Coordinates are persisted as whole canvas units. Values a double cannot
// hold as an exact integer (beyond 2^53) or non-finite ones are rejected.
Result<int64_t> canvasUnits(double value) {
    constexpr double LIMIT = 9007199254740992.0;
    if (!std::isfinite(value) || value < -LIMIT || value > LIMIT) {
        return Err<int64_t>("coordinate " + std::to_string(value) + " is not a storable canvas unit");
    }
    return Ok(static_cast<int64_t>(value));
}

// Owns one prepared statement
class Statement {
public:
    Statement() = default;
    ~Statement() { sqlite3_finalize(_stmt); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Result<void> prepare(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &_stmt, nullptr) != SQLITE_OK) {
            return Err<void>(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
        }
        return Ok();
    }

    void reset() {
        sqlite3_reset(_stmt);
        sqlite3_clear_bindings(_stmt);
    }

    void bind(int index, int64_t value) { sqlite3_bind_int64(_stmt, index, value); }
    void bind(int index, const std::string& value) {
        sqlite3_bind_text(_stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }

    sqlite3_stmt* get() const { return _stmt; }

private:
    sqlite3_stmt* _stmt = nullptr;
};

class SqliteBlockStoreImpl : public BlockStore {
public:
    SqliteBlockStoreImpl(std::string path, bool createSchema)
        : _path(std::move(path)), _createSchema(createSchema) {}

    ~SqliteBlockStoreImpl() override {
        if (_db) {
            // Statements must be finalized before the connection closes
            _updatePosition.reset();
            _updateSize.reset();
            _updateContent.reset();
            sqlite3_close(_db);
        }
    }

    Result<void> init() noexcept {
        int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
        if (sqlite3_open_v2(_path.c_str(), &_db, flags, nullptr) != SQLITE_OK) {
            std::string msg = _db ? sqlite3_errmsg(_db) : "out of memory";
            return Err<void>("sqlite open failed for " + _path + ": " + msg);
        }
        sqlite3_busy_timeout(_db, BUSY_TIMEOUT_MS);

        if (_createSchema) {
            if (auto res = exec(SCHEMA_SQL); !res) {
                return Err<void>("failed to create canvas_blocks", res);
            }
        }

        _updatePosition = std::make_unique<Statement>();
        _updateSize = std::make_unique<Statement>();
        _updateContent = std::make_unique<Statement>();
        if (auto res = _updatePosition->prepare(_db, UPDATE_POSITION_SQL); !res) return res;
        if (auto res = _updateSize->prepare(_db, UPDATE_SIZE_SQL); !res) return res;
        if (auto res = _updateContent->prepare(_db, UPDATE_CONTENT_SQL); !res) return res;

        yinfo("SqliteBlockStore: opened {}", _path);
        return Ok();
    }

    Result<void> write(const WriteBatch& batch) override {
        if (batch.updates.empty()) return Ok();

        if (auto res = exec("BEGIN IMMEDIATE"); !res) {
            return Err<void>("failed to begin transaction", res);
        }

        const std::string now = iso8601Now();
        for (const auto& update : batch.updates) {
            if (auto res = apply(update, now); !res) {
                if (auto rb = exec("ROLLBACK"); !rb) {
                    yerror("SqliteBlockStore: rollback failed: {}", error_msg(rb));
                }
                return Err<void>(std::string("failed to write ") + categoryName(batch.category) +
                                 " of block " + update.blockId, res);
            }
        }

        if (auto res = exec("COMMIT"); !res) {
            if (auto rb = exec("ROLLBACK"); !rb) {
                yerror("SqliteBlockStore: rollback failed: {}", error_msg(rb));
            }
            return Err<void>("failed to commit transaction", res);
        }

        ydebug("SqliteBlockStore: wrote {} {} updates", batch.updates.size(), categoryName(batch.category));
        return Ok();
    }

    Result<void> insert(const BlockRecord& record) override {
        auto x = canvasUnits(record.position.x);
        auto y = canvasUnits(record.position.y);
        auto width = canvasUnits(record.size.width);
        auto height = canvasUnits(record.size.height);
        if (!x) return Err<void>("invalid position of block " + record.id, x);
        if (!y) return Err<void>("invalid position of block " + record.id, y);
        if (!width) return Err<void>("invalid size of block " + record.id, width);
        if (!height) return Err<void>("invalid size of block " + record.id, height);

        Statement stmt;
        if (auto res = stmt.prepare(_db, INSERT_SQL); !res) return res;
        stmt.bind(1, record.id);
        stmt.bind(2, *x);
        stmt.bind(3, *y);
        stmt.bind(4, *width);
        stmt.bind(5, *height);
        stmt.bind(6, record.content);
        stmt.bind(7, record.updatedAt.empty() ? iso8601Now() : record.updatedAt);
        return step(stmt);
    }

    Result<std::optional<BlockRecord>> read(const std::string& id) override {
        Statement stmt;
        if (auto res = stmt.prepare(_db, SELECT_SQL); !res) {
            return Err<std::optional<BlockRecord>>("read failed", res);
        }
        stmt.bind(1, id);

        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            return Ok(std::optional<BlockRecord>());
        }
        if (rc != SQLITE_ROW) {
            return Err<std::optional<BlockRecord>>(std::string("sqlite step failed: ") + sqlite3_errmsg(_db));
        }

        BlockRecord record;
        record.id = columnText(stmt.get(), 0);
        record.position = {static_cast<double>(sqlite3_column_int64(stmt.get(), 1)),
                           static_cast<double>(sqlite3_column_int64(stmt.get(), 2))};
        record.size = {static_cast<double>(sqlite3_column_int64(stmt.get(), 3)),
                       static_cast<double>(sqlite3_column_int64(stmt.get(), 4))};
        record.content = columnText(stmt.get(), 5);
        record.updatedAt = columnText(stmt.get(), 6);
        return Ok(std::optional<BlockRecord>(std::move(record)));
    }

private:
    Result<void> apply(const BlockUpdate& update, const std::string& now) {
        return std::visit([&](const auto& value) -> Result<void> {
            using V = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<V, Point>) {
                auto x = canvasUnits(value.x);
                if (!x) return Err<void>("invalid position", x);
                auto y = canvasUnits(value.y);
                if (!y) return Err<void>("invalid position", y);
                auto& stmt = *_updatePosition;
                stmt.reset();
                stmt.bind(1, *x);
                stmt.bind(2, *y);
                stmt.bind(3, now);
                stmt.bind(4, update.blockId);
                return step(stmt);
            } else if constexpr (std::is_same_v<V, Extent>) {
                auto width = canvasUnits(value.width);
                if (!width) return Err<void>("invalid size", width);
                auto height = canvasUnits(value.height);
                if (!height) return Err<void>("invalid size", height);
                auto& stmt = *_updateSize;
                stmt.reset();
                stmt.bind(1, *width);
                stmt.bind(2, *height);
                stmt.bind(3, now);
                stmt.bind(4, update.blockId);
                return step(stmt);
            } else {
                auto& stmt = *_updateContent;
                stmt.reset();
                stmt.bind(1, value);
                stmt.bind(2, now);
                stmt.bind(3, update.blockId);
                return step(stmt);
            }
        }, update.value);
    }

    Result<void> step(Statement& stmt) {
        int rc = sqlite3_step(stmt.get());
        if (rc != SQLITE_DONE) {
            return Err<void>(std::string("sqlite step failed: ") + sqlite3_errmsg(_db));
        }
        return Ok();
    }

    Result<void> exec(const char* sql) {
        char* errmsg = nullptr;
        if (sqlite3_exec(_db, sql, nullptr, nullptr, &errmsg) != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : sqlite3_errmsg(_db);
            sqlite3_free(errmsg);
            return Err<void>("sqlite exec failed: " + msg);
        }
        return Ok();
    }

    static std::string columnText(sqlite3_stmt* stmt, int column) {
        const unsigned char* text = sqlite3_column_text(stmt, column);
        return text ? reinterpret_cast<const char*>(text) : std::string();
    }

    std::string _path;
    bool _createSchema;
    sqlite3* _db = nullptr;
    std::unique_ptr<Statement> _updatePosition;
    std::unique_ptr<Statement> _updateSize;
    std::unique_ptr<Statement> _updateContent;
};

} // namespace

Result<BlockStore::Ptr> SqliteBlockStore::create(const std::string& path, bool createSchema) noexcept {
    auto impl = std::make_shared<SqliteBlockStoreImpl>(path, createSchema);
    if (auto res = impl->init(); !res) {
        return Err<BlockStore::Ptr>("SqliteBlockStore init failed", res);
    }
    return Ok(BlockStore::Ptr(std::move(impl)));
}

} // namespace slate
