#pragma once

#include <slate/result.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace slate {

// Byte range [offset, offset + size)
struct ByteRange {
    size_t offset = 0;
    size_t size = 0;

    bool operator==(const ByteRange&) const = default;
};

// Widen [offset, offset + size) outward to `alignment` (a power of two),
// without running past `capacity`. An empty range stays empty.
constexpr ByteRange alignedRange(size_t offset, size_t size, size_t alignment, size_t capacity) noexcept {
    if (size == 0) return {offset, 0};
    const size_t mask = alignment - 1;
    const size_t begin = offset & ~mask;
    size_t end = (offset + size + mask) & ~mask;
    if (end > capacity) end = capacity;
    return {begin, end - begin};
}

/**
 * GpuBuffer is a fixed-capacity block of GPU-addressable memory.
 *
 * The caller writes through contents() and publishes the written range with
 * didModify(). Backends with unified memory treat didModify() as a no-op;
 * backends with a separate GPU copy (WebGPU) upload the range to the queue.
 *
 * The backend resource is released when the last reference goes away.
 */
class GpuBuffer {
public:
    using Ptr = std::shared_ptr<GpuBuffer>;

    virtual ~GpuBuffer() = default;

    // Allocated capacity in bytes
    virtual size_t length() const = 0;

    // Host-visible memory, length() bytes
    virtual uint8_t* contents() = 0;

    // Publish CPU writes in [offset, offset + size) to the GPU
    virtual Result<void> didModify(size_t offset, size_t size) = 0;

    // Backend handle (WGPUBuffer for the WebGPU device, nullptr for host memory)
    virtual void* handle() const = 0;
};

/**
 * GpuBufferDevice creates GpuBuffers. It is the allocation backend behind
 * GpuBufferPool, one per GPU device.
 */
class GpuBufferDevice {
public:
    using Ptr = std::shared_ptr<GpuBufferDevice>;

    virtual ~GpuBufferDevice() = default;

    // Create a buffer of exactly `length` bytes
    virtual Result<GpuBuffer::Ptr> createBuffer(size_t length) = 0;

    virtual const char* name() const = 0;

    // Bytes held by live buffers created by this device (pooled or checked out)
    virtual uint64_t allocatedBytes() const = 0;
    virtual uint32_t liveBuffers() const = 0;

    // Host-memory device: headless rendering and tests.
    // maxAllocationBytes == 0 means unlimited.
    static Result<Ptr> createHost(uint64_t maxAllocationBytes = 0) noexcept;
};

} // namespace slate
