#include <slate/canvas-services.h>
#include <ytrace/ytrace.hpp>

namespace slate {

namespace {

DebouncedPositionSaverConfig saverConfig(const Config& config) {
    DebouncedPositionSaverConfig c;
    c.positionDebounce = std::chrono::milliseconds(
        config.get<int>(Config::KEY_POSITION_DEBOUNCE_MS, 50));
    c.sizeDebounce = std::chrono::milliseconds(
        config.get<int>(Config::KEY_SIZE_DEBOUNCE_MS, 100));
    c.contentDebounce = std::chrono::milliseconds(
        config.get<int>(Config::KEY_CONTENT_DEBOUNCE_MS, 300));
    c.maxPendingTime = std::chrono::milliseconds(
        config.get<int>(Config::KEY_MAX_PENDING_MS, 2000));
    c.tickInterval = std::chrono::milliseconds(
        config.get<int>(Config::KEY_TICK_MS, 10));
    return c;
}

MemoryPressureMonitorConfig monitorConfig(const Config& config) {
    MemoryPressureMonitorConfig c;
    c.enabled = config.get<bool>(Config::KEY_MEMORY_PRESSURE_ENABLED, true);
    c.stallUs = config.get<uint32_t>(Config::KEY_MEMORY_PRESSURE_STALL_US, 150000);
    c.windowUs = config.get<uint32_t>(Config::KEY_MEMORY_PRESSURE_WINDOW_US, 1000000);
    return c;
}

} // namespace

class CanvasServicesImpl : public CanvasServices {
public:
    CanvasServicesImpl(Config::Ptr config, GpuBufferDevice::Ptr device, BlockStore::Ptr store,
                       base::EventLoop::Ptr loop) noexcept
        : _config(std::move(config)), _device(std::move(device)),
          _store(std::move(store)), _loop(std::move(loop)) {}

    ~CanvasServicesImpl() override {
        if (_monitor) {
            _monitor->stop();
        }
        if (_saver) {
            if (auto res = _saver->detach(); !res) {
                ywarn("CanvasServices: saver detach failed: {}", error_msg(res));
            }
        }
    }

    Result<void> init() noexcept {
        if (!_config || !_device || !_store) {
            return Err<void>("CanvasServices: config, device and store are required");
        }
        if (!_loop) {
            auto loopRes = base::EventLoop::instance();
            if (!loopRes) {
                return Err<void>("CanvasServices: no event loop", loopRes);
            }
            _loop = *loopRes;
        }

        GpuBufferPoolConfig poolConfig;
        poolConfig.maxBuffersPerBucket =
            _config->get<uint32_t>(Config::KEY_POOL_MAX_BUFFERS_PER_BUCKET, 32);
        auto poolRes = GpuBufferPool::create(_device, poolConfig);
        if (!poolRes) {
            return Err<void>("CanvasServices: buffer pool", poolRes);
        }
        _pool = *poolRes;

        auto capacity = _config->get<size_t>(Config::KEY_WRITER_QUEUE_CAPACITY, 64);
        auto writerRes = StoreWriter::createThreaded(_store, _loop, capacity);
        if (!writerRes) {
            return Err<void>("CanvasServices: store writer", writerRes);
        }
        _writer = *writerRes;

        auto saverRes = DebouncedPositionSaver::create(_writer, Clock::steady(), saverConfig(*_config));
        if (!saverRes) {
            return Err<void>("CanvasServices: position saver", saverRes);
        }
        _saver = *saverRes;
        if (auto res = _saver->attach(_loop); !res) {
            return Err<void>("CanvasServices: attach saver", res);
        }

        auto monConfig = monitorConfig(*_config);
        if (monConfig.enabled) {
            auto monRes = MemoryPressureMonitor::create(_loop, monConfig);
            if (!monRes) {
                return Err<void>("CanvasServices: memory monitor", monRes);
            }
            (*monRes)->addPool(_pool);
            if (auto res = (*monRes)->start(); !res) {
                ywarn("CanvasServices: memory pressure monitoring unavailable: {}", error_msg(res));
            } else {
                _monitor = *monRes;
            }
        }

        _frameReserve = _config->get<size_t>(Config::KEY_FRAME_RESERVE,
                                             FrameBufferManager::TYPICAL_FRAME_BUFFERS);

        yinfo("CanvasServices: device={} maxBuffersPerBucket={} writerCapacity={} monitor={}",
              _device->name(), poolConfig.maxBuffersPerBucket, capacity, _monitor ? "on" : "off");
        return Ok();
    }

    const GpuBufferPool::Ptr& pool() const override { return _pool; }
    const DebouncedPositionSaver::Ptr& saver() const override { return _saver; }
    const StoreWriter::Ptr& writer() const override { return _writer; }
    const BlockStore::Ptr& store() const override { return _store; }
    const base::EventLoop::Ptr& loop() const override { return _loop; }
    const MemoryPressureMonitor::Ptr& memoryMonitor() const override { return _monitor; }

    std::unique_ptr<FrameBufferManager> newFrame() const override {
        return std::make_unique<FrameBufferManager>(_pool, _frameReserve);
    }

    void shutdown(ShutdownCallback done) override {
        ydebug("CanvasServices: shutdown");
        std::weak_ptr<DebouncedPositionSaver> weakSaver = _saver;
        _saver->flushAll([writer = _writer, monitor = _monitor, weakSaver,
                          done = std::move(done)](Result<void> flushRes) {
            if (!flushRes) {
                yerror("CanvasServices: final flush failed: {}", error_msg(flushRes));
            }
            if (auto res = writer->stop(); !res) {
                ywarn("CanvasServices: writer stop: {}", error_msg(res));
            }
            if (monitor) {
                monitor->stop();
            }
            if (auto saver = weakSaver.lock()) {
                if (auto res = saver->detach(); !res) {
                    ywarn("CanvasServices: saver detach failed: {}", error_msg(res));
                }
            }
            if (done) {
                done(std::move(flushRes));
            }
        });
    }

private:
    Config::Ptr _config;
    GpuBufferDevice::Ptr _device;
    BlockStore::Ptr _store;
    base::EventLoop::Ptr _loop;

    GpuBufferPool::Ptr _pool;
    StoreWriter::Ptr _writer;
    DebouncedPositionSaver::Ptr _saver;
    MemoryPressureMonitor::Ptr _monitor;
    size_t _frameReserve = FrameBufferManager::TYPICAL_FRAME_BUFFERS;
};

Result<CanvasServices::Ptr> CanvasServices::createImpl(Config::Ptr config, GpuBufferDevice::Ptr device,
                                                       BlockStore::Ptr store,
                                                       base::EventLoop::Ptr loop) noexcept {
    auto impl = Ptr(new CanvasServicesImpl(std::move(config), std::move(device),
                                           std::move(store), std::move(loop)));
    if (auto res = static_cast<CanvasServicesImpl*>(impl.get())->init(); !res) {
        return Err<Ptr>("Failed to initialize CanvasServices", res);
    }
    return Ok(std::move(impl));
}

} // namespace slate
