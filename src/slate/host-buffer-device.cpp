#include <slate/gpu-buffer.h>
#include <ytrace/ytrace.hpp>
#include <atomic>
#include <cstring>
#include <new>
#include <string>

namespace slate {

namespace {

struct AllocationCounters {
    std::atomic<uint64_t> bytes{0};
    std::atomic<uint32_t> buffers{0};
};

class HostBuffer : public GpuBuffer {
public:
    HostBuffer(std::unique_ptr<uint8_t[]> data, size_t length,
               std::shared_ptr<AllocationCounters> counters)
        : _data(std::move(data)), _length(length), _counters(std::move(counters)) {}

    ~HostBuffer() override {
        _counters->bytes -= _length;
        _counters->buffers--;
    }

    size_t length() const override { return _length; }
    uint8_t* contents() override { return _data.get(); }

    Result<void> didModify(size_t offset, size_t size) override {
        if (offset + size > _length) {
            return Err<void>("HostBuffer: modified range exceeds buffer length");
        }
        return Ok();
    }

    void* handle() const override { return nullptr; }

private:
    std::unique_ptr<uint8_t[]> _data;
    size_t _length;
    std::shared_ptr<AllocationCounters> _counters;
};

class HostBufferDevice : public GpuBufferDevice {
public:
    explicit HostBufferDevice(uint64_t maxAllocationBytes)
        : _maxAllocationBytes(maxAllocationBytes),
          _counters(std::make_shared<AllocationCounters>()) {}

    Result<GpuBuffer::Ptr> createBuffer(size_t length) override {
        if (length == 0) {
            return Err<GpuBuffer::Ptr>("HostBufferDevice: zero-length buffer");
        }
        // Reserve the bytes before allocating; the counter never passes the limit
        uint64_t current = _counters->bytes.load();
        do {
            if (_maxAllocationBytes != 0 && current + length > _maxAllocationBytes) {
                return Err<GpuBuffer::Ptr>("HostBufferDevice: allocation limit of " +
                                           std::to_string(_maxAllocationBytes) + " bytes reached");
            }
        } while (!_counters->bytes.compare_exchange_weak(current, current + length));

        std::unique_ptr<uint8_t[]> data(new (std::nothrow) uint8_t[length]);
        if (!data) {
            _counters->bytes -= length;
            yerror("HostBufferDevice: failed to allocate {} bytes", length);
            return Err<GpuBuffer::Ptr>("HostBufferDevice: out of memory");
        }
        std::memset(data.get(), 0, length);

        _counters->buffers++;
        ydebug("HOST [+] buffer: {} bytes - total: {} bytes in {} buffers",
               length, _counters->bytes.load(), _counters->buffers.load());

        return Ok(GpuBuffer::Ptr(std::make_shared<HostBuffer>(std::move(data), length, _counters)));
    }

    const char* name() const override { return "host"; }

    uint64_t allocatedBytes() const override { return _counters->bytes.load(); }
    uint32_t liveBuffers() const override { return _counters->buffers.load(); }

private:
    uint64_t _maxAllocationBytes;
    std::shared_ptr<AllocationCounters> _counters;
};

} // namespace

Result<GpuBufferDevice::Ptr> GpuBufferDevice::createHost(uint64_t maxAllocationBytes) noexcept {
    return Ok(Ptr(std::make_shared<HostBufferDevice>(maxAllocationBytes)));
}

} // namespace slate
