#pragma once

#include <slate/base/base.h>
#include <slate/block-store.h>
#include <slate/clock.h>
#include <slate/geometry.h>
#include <slate/store-writer.h>
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace slate {

struct DebouncedPositionSaverConfig {
    std::chrono::milliseconds positionDebounce{50};
    std::chrono::milliseconds sizeDebounce{100};
    std::chrono::milliseconds contentDebounce{300};
    // A category pending this long is flushed without waiting for quiet
    std::chrono::milliseconds maxPendingTime{2000};
    // Scheduler tick period once attached to an event loop
    std::chrono::milliseconds tickInterval{10};
};

/**
 * DebouncedPositionSaver turns the stream of drag/resize/edit mutations into
 * batched block-store writes.
 *
 * Positions, sizes and content are debounced independently. Each queue call
 * overwrites the block's pending value and pushes the category's deadline to
 * now + interval, so a burst produces one flush after it goes quiet. A
 * category that stays pending for maxPendingTime is flushed regardless.
 *
 * A flush captures the whole pending map and submits it as one WriteBatch.
 * If the write fails, captured values come back for the next cycle unless a
 * newer value arrived meanwhile.
 *
 * Confined to the event-loop thread. Deadlines are checked by tick(), which
 * the loop timer calls once attach() has run.
 */
class DebouncedPositionSaver : public base::EventListener,
                               public base::ObjectFactory<DebouncedPositionSaver> {
public:
    using Ptr = std::shared_ptr<DebouncedPositionSaver>;
    using Config = DebouncedPositionSaverConfig;
    using FlushCallback = std::function<void(Result<void>)>;

    static Result<Ptr> createImpl(StoreWriter::Ptr writer, Clock::Ptr clock, Config config = {}) noexcept;

    ~DebouncedPositionSaver() override = default;

    virtual void queuePositionUpdate(const std::string& blockId, Point position) = 0;
    virtual void queueSizeUpdate(const std::string& blockId, Extent size) = 0;
    virtual void queueContentUpdate(const std::string& blockId, std::string content) = 0;

    // Drag finished: queue the final position and flush positions now
    virtual void endDrag(const std::string& blockId, Point finalPosition, FlushCallback done = {}) = 0;

    virtual void flushPositions(FlushCallback done = {}) = 0;
    virtual void flushSizes(FlushCallback done = {}) = 0;
    virtual void flushContent(FlushCallback done = {}) = 0;

    // Position, size, content in sequence; done gets the first error
    virtual void flushAll(FlushCallback done = {}) = 0;

    // Start every flush whose deadline has passed
    virtual void tick() = 0;

    virtual bool hasPendingUpdates() const = 0;
    virtual bool isFlushing(UpdateCategory category) const = 0;
    virtual size_t pendingCount(UpdateCategory category) const = 0;

    // Read-your-writes for visual feedback before a flush lands
    virtual std::optional<Point> pendingPosition(const std::string& blockId) const = 0;
    virtual std::optional<Extent> pendingSize(const std::string& blockId) const = 0;
    virtual std::optional<std::string> pendingContent(const std::string& blockId) const = 0;

    // Drive tick() from a loop timer and flushAll() on WillResignActive / WillTerminate
    virtual Result<void> attach(base::EventLoop::Ptr loop) = 0;
    virtual Result<void> detach() = 0;

    const char* typeName() const override { return "DebouncedPositionSaver"; }

protected:
    DebouncedPositionSaver() = default;
};

} // namespace slate
