#pragma once

#include <slate/geometry.h>
#include <slate/result.hpp>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace slate {

// Mutation categories the persistence scheduler debounces independently
enum class UpdateCategory {
    Position,
    Size,
    Content
};

const char* categoryName(UpdateCategory category);

struct BlockUpdate {
    std::string blockId;
    std::variant<Point, Extent, std::string> value;
};

// Everything one flush writes: one statement per update, one transaction
struct WriteBatch {
    UpdateCategory category = UpdateCategory::Position;
    std::vector<BlockUpdate> updates;
};

struct BlockRecord {
    std::string id;
    Point position;
    Extent size;
    std::string content;
    std::string updatedAt;
};

/**
 * BlockStore is the durable store behind the canvas. write() applies a batch
 * atomically: either every update lands or none does.
 *
 * Implementations are not required to be thread-safe; StoreWriter serializes
 * all writes onto one thread.
 */
class BlockStore {
public:
    using Ptr = std::shared_ptr<BlockStore>;

    virtual ~BlockStore() = default;

    virtual Result<void> write(const WriteBatch& batch) = 0;

    virtual Result<void> insert(const BlockRecord& record) = 0;
    virtual Result<std::optional<BlockRecord>> read(const std::string& id) = 0;
};

// SQLite store on the canvas_blocks table. path may be ":memory:".
class SqliteBlockStore {
public:
    static Result<BlockStore::Ptr> create(const std::string& path, bool createSchema = true) noexcept;
};

} // namespace slate
