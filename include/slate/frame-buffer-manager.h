#pragma once

#include <slate/gpu-buffer-pool.h>
#include <memory>
#include <vector>

namespace slate {

// Leases pool buffers for one render frame. Every buffer acquired through the
// manager goes back to the pool at endFrame(); callers must not touch a buffer
// after the endFrame() of the frame it was acquired in.
class FrameBufferManager {
public:
    using Ptr = std::shared_ptr<FrameBufferManager>;

    // Buffers a typical frame checks out
    static constexpr size_t TYPICAL_FRAME_BUFFERS = 64;

    explicit FrameBufferManager(GpuBufferPool::Ptr pool, size_t reserve = TYPICAL_FRAME_BUFFERS);
    ~FrameBufferManager();

    FrameBufferManager(const FrameBufferManager&) = delete;
    FrameBufferManager& operator=(const FrameBufferManager&) = delete;

    Result<GpuBuffer::Ptr> acquire(size_t length);
    Result<GpuBuffer::Ptr> acquire(const void* bytes, size_t length);

    template<typename T>
    Result<GpuBuffer::Ptr> acquire(const std::vector<T>& array) {
        return track(_pool->acquire(array));
    }

    // Return every buffer of this frame to the pool
    void endFrame();

    size_t bufferCount() const { return _frameBuffers.size(); }
    size_t frameCount() const { return _frameCount; }

    const GpuBufferPool::Ptr& pool() const { return _pool; }

private:
    Result<GpuBuffer::Ptr> track(Result<GpuBuffer::Ptr> res);

    GpuBufferPool::Ptr _pool;
    std::vector<GpuBuffer::Ptr> _frameBuffers;
    size_t _frameCount = 0;
};

} // namespace slate
