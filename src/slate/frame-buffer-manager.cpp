#include <slate/frame-buffer-manager.h>
#include <ytrace/ytrace.hpp>

namespace slate {

FrameBufferManager::FrameBufferManager(GpuBufferPool::Ptr pool, size_t reserve)
    : _pool(std::move(pool)) {
    _frameBuffers.reserve(reserve);
}

FrameBufferManager::~FrameBufferManager() {
    if (!_frameBuffers.empty()) {
        ydebug("FrameBufferManager: returning {} buffers of an unfinished frame", _frameBuffers.size());
        endFrame();
    }
}

Result<GpuBuffer::Ptr> FrameBufferManager::acquire(size_t length) {
    return track(_pool->acquire(length));
}

Result<GpuBuffer::Ptr> FrameBufferManager::acquire(const void* bytes, size_t length) {
    return track(_pool->acquire(bytes, length));
}

Result<GpuBuffer::Ptr> FrameBufferManager::track(Result<GpuBuffer::Ptr> res) {
    if (res) {
        _frameBuffers.push_back(*res);
    }
    return res;
}

void FrameBufferManager::endFrame() {
    _pool->release(_frameBuffers);
    _frameBuffers.clear();  // keeps capacity
    _frameCount++;
}

} // namespace slate
