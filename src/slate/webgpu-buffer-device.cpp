#include <slate/webgpu-buffer-device.h>
#include <ytrace/ytrace.hpp>
#include <atomic>
#include <cstring>
#include <string>
#include <vector>

namespace slate {

namespace {

struct AllocationCounters {
    std::atomic<uint64_t> bytes{0};
    std::atomic<uint32_t> buffers{0};
};

// wgpuQueueWriteBuffer needs 4-byte aligned offset and size
constexpr size_t WRITE_ALIGNMENT = 4;

class WebGpuBuffer : public GpuBuffer {
public:
    WebGpuBuffer(WGPUBuffer buffer, WGPUQueue queue, size_t length,
                 std::shared_ptr<AllocationCounters> counters)
        : _buffer(buffer), _queue(queue), _shadow(length, 0), _counters(std::move(counters)) {
        wgpuQueueAddRef(_queue);
    }

    ~WebGpuBuffer() override {
        _counters->bytes -= _shadow.size();
        _counters->buffers--;
        wgpuBufferDestroy(_buffer);
        wgpuBufferRelease(_buffer);
        wgpuQueueRelease(_queue);
    }

    size_t length() const override { return _shadow.size(); }
    uint8_t* contents() override { return _shadow.data(); }

    Result<void> didModify(size_t offset, size_t size) override {
        if (offset + size > _shadow.size()) {
            return Err<void>("WebGpuBuffer: modified range exceeds buffer length");
        }
        if (size == 0) return Ok();

        // Bucket sizes are multiples of 64, so the widened range keeps its alignment
        auto range = alignedRange(offset, size, WRITE_ALIGNMENT, _shadow.size());
        wgpuQueueWriteBuffer(_queue, _buffer, range.offset, _shadow.data() + range.offset, range.size);
        return Ok();
    }

    void* handle() const override { return _buffer; }

private:
    WGPUBuffer _buffer;
    WGPUQueue _queue;
    std::vector<uint8_t> _shadow;
    std::shared_ptr<AllocationCounters> _counters;
};

class WebGpuBufferDeviceImpl : public GpuBufferDevice {
public:
    WebGpuBufferDeviceImpl(WGPUDevice device, WGPUQueue queue, WGPUBufferUsage usage)
        : _device(device), _queue(queue), _usage(usage),
          _counters(std::make_shared<AllocationCounters>()) {
        wgpuDeviceAddRef(_device);
        wgpuQueueAddRef(_queue);
    }

    ~WebGpuBufferDeviceImpl() override {
        wgpuQueueRelease(_queue);
        wgpuDeviceRelease(_device);
    }

    Result<GpuBuffer::Ptr> createBuffer(size_t length) override {
        if (length == 0) {
            return Err<GpuBuffer::Ptr>("WebGpuBufferDevice: zero-length buffer");
        }

        std::string label = "slate-pool-" + std::to_string(length);

        WGPUBufferDescriptor desc = {};
        desc.label = {.data = label.c_str(), .length = label.size()};
        desc.size = length;
        desc.usage = _usage;
        desc.mappedAtCreation = false;

        WGPUBuffer buffer = wgpuDeviceCreateBuffer(_device, &desc);
        if (!buffer) {
            yerror("WebGpuBufferDevice: failed to create buffer '{}'", label);
            return Err<GpuBuffer::Ptr>("WebGpuBufferDevice: wgpuDeviceCreateBuffer failed for " +
                                       std::to_string(length) + " bytes");
        }

        _counters->bytes += length;
        _counters->buffers++;
        ydebug("GPU [+] buffer '{}': {} bytes - total: {} bytes ({:.2f} MB)",
               label, length, _counters->bytes.load(),
               _counters->bytes.load() / (1024.0 * 1024.0));

        return Ok(GpuBuffer::Ptr(std::make_shared<WebGpuBuffer>(buffer, _queue, length, _counters)));
    }

    const char* name() const override { return "webgpu"; }

    uint64_t allocatedBytes() const override { return _counters->bytes.load(); }
    uint32_t liveBuffers() const override { return _counters->buffers.load(); }

private:
    WGPUDevice _device;
    WGPUQueue _queue;
    WGPUBufferUsage _usage;
    std::shared_ptr<AllocationCounters> _counters;
};

} // namespace

Result<GpuBufferDevice::Ptr> WebGpuBufferDevice::create(WGPUDevice device, WGPUQueue queue,
                                                        WGPUBufferUsage usage) noexcept {
    if (!device) {
        return Err<GpuBufferDevice::Ptr>("WebGpuBufferDevice: null device");
    }
    if (!queue) {
        return Err<GpuBufferDevice::Ptr>("WebGpuBufferDevice: null queue");
    }
    return Ok(GpuBufferDevice::Ptr(std::make_shared<WebGpuBufferDeviceImpl>(device, queue, usage)));
}

} // namespace slate
