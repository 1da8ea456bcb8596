#pragma once

#include <slate/base/event-loop.h>
#include <slate/block-store.h>
#include <functional>
#include <memory>

namespace slate {

/**
 * StoreWriter moves block-store writes off the event-loop thread.
 *
 * submit() queues a batch and returns immediately; the completion runs on the
 * event-loop thread with the store's result. Batches execute one at a time in
 * submission order.
 */
class StoreWriter {
public:
    using Ptr = std::shared_ptr<StoreWriter>;
    using Completion = std::function<void(Result<void>)>;

    virtual ~StoreWriter() = default;

    virtual void submit(WriteBatch batch, Completion done) = 0;

    // Batches queued or executing
    virtual size_t pendingCount() const = 0;

    // Finish queued batches, then stop the writer thread. Later submits fail.
    virtual Result<void> stop() = 0;

    // One writer thread fed by a bounded queue of `capacity` batches
    static Result<Ptr> createThreaded(BlockStore::Ptr store, base::EventLoop::Ptr loop,
                                      size_t capacity = 64) noexcept;
};

} // namespace slate
