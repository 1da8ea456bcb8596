#include <slate/gpu-buffer-pool.h>
#include <ytrace/ytrace.hpp>
#include <array>
#include <cstring>
#include <mutex>

namespace slate {

class GpuBufferPoolImpl : public GpuBufferPool {
public:
    GpuBufferPoolImpl(GpuBufferDevice::Ptr device, Config config)
        : _device(std::move(device)), _config(config) {}

    ~GpuBufferPoolImpl() override = default;

    Result<void> init() noexcept {
        if (!_device) {
            return Err<void>("GpuBufferPool: null device");
        }
        if (_config.maxBuffersPerBucket == 0) {
            return Err<void>("GpuBufferPool: maxBuffersPerBucket must be > 0");
        }
        for (auto& bucket : _buckets) {
            bucket.reserve(_config.maxBuffersPerBucket);
        }
        yinfo("GpuBufferPool: device={} buckets={} ({}..{} bytes) max-per-bucket={}",
              _device->name(), POOL_BUCKET_COUNT, POOL_MIN_BUCKET_SIZE,
              POOL_MAX_BUCKET_SIZE, _config.maxBuffersPerBucket);
        return Ok();
    }

    Result<GpuBuffer::Ptr> acquire(size_t length) override {
        const uint32_t index = bucketIndex(length);

        {
            std::lock_guard<std::mutex> lock(_mutex);
            auto& bucket = _buckets[index];
            if (!bucket.empty()) {
                GpuBuffer::Ptr buffer = std::move(bucket.back());
                bucket.pop_back();
                _stats.reuses++;
                _stats.pooled--;
                return Ok(std::move(buffer));
            }
        }

        // Allocate outside the lock
        auto res = _device->createBuffer(bucketSize(index));

        std::lock_guard<std::mutex> lock(_mutex);
        if (!res) {
            _stats.failures++;
            ywarn("GpuBufferPool: allocation of {} bytes failed: {}", bucketSize(index), error_msg(res));
            return Err<GpuBuffer::Ptr>("GpuBufferPool: acquire failed", res);
        }
        _stats.allocations++;
        return res;
    }

    Result<GpuBuffer::Ptr> acquire(const void* bytes, size_t length) override {
        if (length > POOL_MAX_BUCKET_SIZE) {
            return Err<GpuBuffer::Ptr>("GpuBufferPool: " + std::to_string(length) +
                                       " bytes exceeds the largest bucket");
        }
        if (!bytes && length > 0) {
            return Err<GpuBuffer::Ptr>("GpuBufferPool: null source for " + std::to_string(length) + " bytes");
        }

        auto res = acquire(length);
        if (!res) return res;

        auto& buffer = *res;
        if (length > 0) {
            std::memcpy(buffer->contents(), bytes, length);
            if (auto mod = buffer->didModify(0, length); !mod) {
                release(buffer);
                return Err<GpuBuffer::Ptr>("GpuBufferPool: upload failed", mod);
            }
        }
        return res;
    }

    void release(GpuBuffer::Ptr buffer) override {
        if (!buffer) return;

        const uint32_t index = bucketIndex(buffer->length());

        std::lock_guard<std::mutex> lock(_mutex);
        auto& bucket = _buckets[index];
        if (bucket.size() < _config.maxBuffersPerBucket) {
            bucket.push_back(std::move(buffer));
            _stats.releases++;
            _stats.pooled++;
        } else {
            // Last reference goes away with `buffer`; the device reclaims it
            _stats.discards++;
        }
    }

    void release(const std::vector<GpuBuffer::Ptr>& buffers) override {
        for (const auto& buffer : buffers) {
            release(buffer);
        }
    }

    uint64_t drain() override {
        // Destroy the buffers after unlocking; backend release may be slow
        std::array<std::vector<GpuBuffer::Ptr>, POOL_BUCKET_COUNT> drained;
        uint64_t bytes = 0;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            for (uint32_t i = 0; i < POOL_BUCKET_COUNT; ++i) {
                bytes += bucketSize(i) * _buckets[i].size();
                drained[i].swap(_buckets[i]);
                _buckets[i].reserve(_config.maxBuffersPerBucket);
            }
            _stats.pooled = 0;
        }
        yinfo("GpuBufferPool: drained {} bytes", bytes);
        return bytes;
    }

    Stats statistics() const override {
        std::lock_guard<std::mutex> lock(_mutex);
        return _stats;
    }

    uint64_t estimatedMemoryUsage() const override {
        std::lock_guard<std::mutex> lock(_mutex);
        uint64_t total = 0;
        for (uint32_t i = 0; i < POOL_BUCKET_COUNT; ++i) {
            total += bucketSize(i) * _buckets[i].size();
        }
        return total;
    }

    size_t idleCount(uint32_t bucket) const override {
        if (bucket >= POOL_BUCKET_COUNT) return 0;
        std::lock_guard<std::mutex> lock(_mutex);
        return _buckets[bucket].size();
    }

    uint32_t maxBuffersPerBucket() const override { return _config.maxBuffersPerBucket; }
    const GpuBufferDevice::Ptr& device() const override { return _device; }

private:
    GpuBufferDevice::Ptr _device;
    Config _config;

    mutable std::mutex _mutex;
    std::array<std::vector<GpuBuffer::Ptr>, POOL_BUCKET_COUNT> _buckets;
    Stats _stats{};
};

Result<GpuBufferPool::Ptr> GpuBufferPool::createImpl(GpuBufferDevice::Ptr device, Config config) noexcept {
    auto impl = Ptr(new GpuBufferPoolImpl(std::move(device), config));
    if (auto res = static_cast<GpuBufferPoolImpl*>(impl.get())->init(); !res) {
        return Err<Ptr>("GpuBufferPool init failed", res);
    }
    return Ok(std::move(impl));
}

} // namespace slate
