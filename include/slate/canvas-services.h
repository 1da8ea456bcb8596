#pragma once

#include <slate/base/base.h>
#include <slate/block-store.h>
#include <slate/config.h>
#include <slate/debounced-position-saver.h>
#include <slate/frame-buffer-manager.h>
#include <slate/gpu-buffer-pool.h>
#include <slate/memory-pressure-monitor.h>
#include <slate/store-writer.h>
#include <functional>
#include <memory>

namespace slate {

/**
 * CanvasServices wires the canvas runtime together: one buffer pool for the
 * device, the store writer and the persistence scheduler attached to the
 * event loop, and the memory-pressure monitor when the system supports it.
 *
 * The loop defaults to the calling thread's EventLoop instance.
 */
class CanvasServices : public base::ObjectFactory<CanvasServices> {
public:
    using Ptr = std::shared_ptr<CanvasServices>;
    using ShutdownCallback = std::function<void(Result<void>)>;

    static Result<Ptr> createImpl(Config::Ptr config, GpuBufferDevice::Ptr device,
                                  BlockStore::Ptr store,
                                  base::EventLoop::Ptr loop = nullptr) noexcept;

    virtual ~CanvasServices() = default;

    virtual const GpuBufferPool::Ptr& pool() const = 0;
    virtual const DebouncedPositionSaver::Ptr& saver() const = 0;
    virtual const StoreWriter::Ptr& writer() const = 0;
    virtual const BlockStore::Ptr& store() const = 0;
    virtual const base::EventLoop::Ptr& loop() const = 0;

    // Null when memory pressure monitoring is disabled or unavailable
    virtual const MemoryPressureMonitor::Ptr& memoryMonitor() const = 0;

    // Frame manager leasing from the shared pool
    virtual std::unique_ptr<FrameBufferManager> newFrame() const = 0;

    // Flush every pending update, then stop the writer and the monitor.
    // done runs on the loop thread with the flush result.
    virtual void shutdown(ShutdownCallback done = {}) = 0;

protected:
    CanvasServices() = default;
};

} // namespace slate
