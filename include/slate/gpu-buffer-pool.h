#pragma once

#include <slate/base/factory.h>
#include <slate/bucket-math.h>
#include <slate/gpu-buffer.h>
#include <cstdint>
#include <memory>
#include <type_traits>
#include <vector>

namespace slate {

struct GpuBufferPoolConfig {
    // Idle buffers kept per bucket; releases beyond this are dropped
    uint32_t maxBuffersPerBucket = 32;
};

/**
 * GpuBufferPool caches fixed-size GPU buffers across frames.
 *
 * Buffers live in POOL_BUCKET_COUNT power-of-two buckets (64 B .. 64 KiB).
 * acquire() pops an idle buffer from the bucket that fits the request or
 * allocates a new one of the bucket's nominal size; release() pushes it back
 * unless the bucket is full.
 *
 * Thread-safe: the render thread and the memory-pressure thread may call in
 * concurrently. Every access to buckets and counters takes one mutex; the
 * device is never called with the mutex held.
 */
class GpuBufferPool : public base::ObjectFactory<GpuBufferPool> {
public:
    using Ptr = std::shared_ptr<GpuBufferPool>;
    using Config = GpuBufferPoolConfig;

    struct Stats {
        uint64_t allocations;  // new buffers created by the device
        uint64_t reuses;       // buffers served from a bucket
        uint64_t releases;     // buffers returned to a bucket
        uint64_t discards;     // releases dropped because the bucket was full
        uint64_t failures;     // device allocations that failed
        uint64_t pooled;       // idle buffers currently held
    };

    static Result<Ptr> createImpl(GpuBufferDevice::Ptr device, Config config = {}) noexcept;

    virtual ~GpuBufferPool() = default;

    // Buffer of at least `length` bytes; its length() is the bucket size.
    // An error means the device could not allocate: skip the draw this frame.
    virtual Result<GpuBuffer::Ptr> acquire(size_t length) = 0;

    // Acquire and copy `length` bytes from `bytes` into the buffer
    virtual Result<GpuBuffer::Ptr> acquire(const void* bytes, size_t length) = 0;

    template<typename T>
    Result<GpuBuffer::Ptr> acquire(const std::vector<T>& array) {
        static_assert(std::is_trivially_copyable_v<T>, "pooled buffer contents must be trivially copyable");
        return acquire(static_cast<const void*>(array.data()), array.size() * sizeof(T));
    }

    virtual void release(GpuBuffer::Ptr buffer) = 0;
    virtual void release(const std::vector<GpuBuffer::Ptr>& buffers) = 0;

    // Drop every idle buffer (memory pressure). Checked-out buffers are unaffected.
    // Returns the idle bytes released.
    virtual uint64_t drain() = 0;

    virtual Stats statistics() const = 0;

    // Idle-pool estimate: sum of bucket size x idle count
    virtual uint64_t estimatedMemoryUsage() const = 0;

    uint32_t bucketCount() const { return POOL_BUCKET_COUNT; }
    virtual size_t idleCount(uint32_t bucket) const = 0;
    virtual uint32_t maxBuffersPerBucket() const = 0;
    virtual const GpuBufferDevice::Ptr& device() const = 0;

protected:
    GpuBufferPool() = default;
};

} // namespace slate
