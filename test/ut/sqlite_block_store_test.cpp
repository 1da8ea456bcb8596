//=============================================================================
// SqliteBlockStore Tests
//=============================================================================

// Standard headers before boost/ut.hpp
#include <cstddef>
#include <version>
#include <filesystem>
#include <limits>
#include <string>

#include <boost/ut.hpp>
#include <slate/block-store.h>
#include <sqlite3.h>
#include <unistd.h>

using namespace boost::ut;
using namespace slate;

namespace {

BlockRecord makeBlock(const std::string& id) {
    BlockRecord r;
    r.id = id;
    r.position = {10, 20};
    r.size = {300, 200};
    r.content = "note " + id;
    return r;
}

// Database file removed when the test ends
struct TempDb {
    std::filesystem::path path;

    explicit TempDb(const std::string& name)
        : path(std::filesystem::temp_directory_path() /
               ("slate-" + name + "-" + std::to_string(::getpid()) + ".db")) {
        std::filesystem::remove(path);
    }
    ~TempDb() { std::filesystem::remove(path); }
};

} // namespace

suite sqlite_block_store_tests = [] {
    "insert then read"_test = [] {
        auto store = SqliteBlockStore::create(":memory:");
        expect(store.has_value() >> fatal);

        expect((*store)->insert(makeBlock("b1")).has_value());
        auto rec = (*store)->read("b1");
        expect((rec.has_value() && rec->has_value()) >> fatal);

        const auto& row = **rec;
        expect(row.id == "b1");
        expect(row.position == Point{10, 20});
        expect(row.size == Extent{300, 200});
        expect(row.content == "note b1");
        expect(!row.updatedAt.empty());
    };

    "read of an unknown block is empty"_test = [] {
        auto store = SqliteBlockStore::create(":memory:");
        expect(store.has_value() >> fatal);
        auto rec = (*store)->read("missing");
        expect(rec.has_value() >> fatal);
        expect(!rec->has_value());
    };

    "batch write updates each category"_test = [] {
        auto store = SqliteBlockStore::create(":memory:");
        expect(store.has_value() >> fatal);
        expect((*store)->insert(makeBlock("b1")).has_value());
        expect((*store)->insert(makeBlock("b2")).has_value());

        WriteBatch positions{UpdateCategory::Position, {{"b1", Point{30, 30}}, {"b2", Point{-5, 7}}}};
        WriteBatch sizes{UpdateCategory::Size, {{"b1", Extent{640, 480}}}};
        WriteBatch content{UpdateCategory::Content, {{"b2", std::string("edited")}}};

        expect((*store)->write(positions).has_value());
        expect((*store)->write(sizes).has_value());
        expect((*store)->write(content).has_value());

        auto b1 = (*store)->read("b1");
        auto b2 = (*store)->read("b2");
        expect((b1.has_value() && b1->has_value() && b2.has_value() && b2->has_value()) >> fatal);
        expect((**b1).position == Point{30, 30});
        expect((**b1).size == Extent{640, 480});
        expect((**b1).content == "note b1");
        expect((**b2).position == Point{-5, 7});
        expect((**b2).content == "edited");
    };

    "empty batch is a no-op"_test = [] {
        auto store = SqliteBlockStore::create(":memory:");
        expect(store.has_value() >> fatal);
        expect((*store)->write(WriteBatch{}).has_value());
    };

    "failing statement rolls back the whole batch"_test = [] {
        TempDb db("rollback");
        auto store = SqliteBlockStore::create(db.path.string());
        expect(store.has_value() >> fatal);
        expect((*store)->insert(makeBlock("good")).has_value());
        expect((*store)->insert(makeBlock("bad")).has_value());

        // Reject any update of "bad" from a second connection
        sqlite3* raw = nullptr;
        expect((sqlite3_open(db.path.c_str(), &raw) == SQLITE_OK) >> fatal);
        int rc = sqlite3_exec(raw,
            "CREATE TRIGGER reject_bad BEFORE UPDATE ON canvas_blocks "
            "WHEN NEW.id = 'bad' BEGIN SELECT RAISE(ABORT, 'rejected'); END",
            nullptr, nullptr, nullptr);
        sqlite3_close(raw);
        expect((rc == SQLITE_OK) >> fatal);

        WriteBatch batch{UpdateCategory::Position, {{"good", Point{99, 99}}, {"bad", Point{1, 1}}}};
        auto res = (*store)->write(batch);
        expect(!res);
        expect(error_msg(res).find("bad") != std::string::npos);

        auto good = (*store)->read("good");
        expect((good.has_value() && good->has_value()) >> fatal);
        expect((**good).position == Point{10, 20}) << "first update rolled back";

        // The store is still usable after a rollback
        WriteBatch next{UpdateCategory::Position, {{"good", Point{42, 42}}}};
        expect((*store)->write(next).has_value());
    };

    "non-finite or huge coordinates are rejected"_test = [] {
        auto store = SqliteBlockStore::create(":memory:");
        expect(store.has_value() >> fatal);
        expect((*store)->insert(makeBlock("b1")).has_value());

        const double nan = std::numeric_limits<double>::quiet_NaN();
        const double inf = std::numeric_limits<double>::infinity();

        WriteBatch positions{UpdateCategory::Position, {{"b1", Point{55, 55}}, {"b1", Point{nan, 0}}}};
        auto res = (*store)->write(positions);
        expect(!res);
        expect(error_msg(res).find("canvas unit") != std::string::npos);

        WriteBatch sizes{UpdateCategory::Size, {{"b1", Extent{inf, 10}}}};
        expect(!(*store)->write(sizes));
        WriteBatch huge{UpdateCategory::Size, {{"b1", Extent{10, 1e300}}}};
        expect(!(*store)->write(huge));

        auto rec = (*store)->read("b1");
        expect((rec.has_value() && rec->has_value()) >> fatal);
        expect((**rec).position == Point{10, 20}) << "batch rolled back";
        expect((**rec).size == Extent{300, 200});

        auto bad = makeBlock("b2");
        bad.position = {-inf, 0};
        expect(!(*store)->insert(bad));
        auto missing = (*store)->read("b2");
        expect((missing.has_value() && !missing->has_value()));
    };

    "fractional coordinates are truncated"_test = [] {
        auto store = SqliteBlockStore::create(":memory:");
        expect(store.has_value() >> fatal);
        expect((*store)->insert(makeBlock("b1")).has_value());

        WriteBatch positions{UpdateCategory::Position, {{"b1", Point{12.9, -3.7}}}};
        expect((*store)->write(positions).has_value());
        auto rec = (*store)->read("b1");
        expect((rec.has_value() && rec->has_value()) >> fatal);
        expect((**rec).position == Point{12, -3});
    };

    "schema survives reopen"_test = [] {
        TempDb db("reopen");
        {
            auto store = SqliteBlockStore::create(db.path.string());
            expect(store.has_value() >> fatal);
            expect((*store)->insert(makeBlock("persisted")).has_value());
        }
        auto store = SqliteBlockStore::create(db.path.string(), false);
        expect(store.has_value() >> fatal);
        auto rec = (*store)->read("persisted");
        expect((rec.has_value() && rec->has_value()) >> fatal);
        expect((**rec).content == "note persisted");
    };

    "open fails for an unreachable path"_test = [] {
        auto store = SqliteBlockStore::create("/nonexistent-dir/slate/canvas.db");
        expect(!store);
    };
};
