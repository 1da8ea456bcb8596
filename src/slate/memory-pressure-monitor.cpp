#include <slate/memory-pressure-monitor.h>
#include <ytrace/ytrace.hpp>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <unistd.h>
#include <uv.h>

namespace slate {

class MemoryPressureMonitorImpl : public MemoryPressureMonitor {
public:
    MemoryPressureMonitorImpl(base::EventLoop::Ptr loop, Config config) noexcept
        : _loop(std::move(loop)), _config(std::move(config)) {}

    ~MemoryPressureMonitorImpl() override {
        stop();
    }

    Result<void> init() noexcept {
        if (!_loop) {
            return Err<void>("MemoryPressureMonitor: null event loop");
        }
        return Ok();
    }

    void addPool(GpuBufferPool::Ptr pool) override {
        if (!pool) return;
        std::lock_guard<std::mutex> lock(_poolsMutex);
        _pools.push_back(std::move(pool));
    }

    Result<void> start() override {
        if (_running) {
            return Ok();
        }
        if (!_config.enabled) {
            return Err<void>("memory pressure monitoring disabled");
        }

        int fd = ::open(_config.psiPath.c_str(), O_RDWR | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0) {
            return Err<void>("cannot open " + _config.psiPath + ": " + std::strerror(errno));
        }
        std::string trigger = "some " + std::to_string(_config.stallUs) + " " +
                              std::to_string(_config.windowUs);
        // The trigger string includes its terminating NUL
        if (::write(fd, trigger.c_str(), trigger.size() + 1) < 0) {
            int err = errno;
            ::close(fd);
            return Err<void>("cannot arm PSI trigger '" + trigger + "': " + std::strerror(err));
        }

        if (auto res = initThreadLoop(fd); !res) {
            ::close(fd);
            return res;
        }
        _fd = fd;
        _running = true;
        _thread = std::thread([this]() { threadMain(); });

        yinfo("MemoryPressureMonitor: watching {} (some {} {})", _config.psiPath,
              _config.stallUs, _config.windowUs);
        return Ok();
    }

    void stop() override {
        if (!_running) return;
        _running = false;

        uv_async_send(&_stopAsync);
        if (_thread.joinable()) {
            _thread.join();
        }

        int r = uv_loop_close(&_threadLoop);
        if (r != 0) {
            ywarn("MemoryPressureMonitor: uv_loop_close failed: {}", uv_strerror(r));
        }
        ::close(_fd);
        _fd = -1;
        ydebug("MemoryPressureMonitor: stopped");
    }

    bool running() const override { return _running; }

    uint64_t signal() override {
        std::vector<GpuBufferPool::Ptr> pools;
        {
            std::lock_guard<std::mutex> lock(_poolsMutex);
            pools = _pools;
        }

        uint64_t drained = 0;
        for (auto& pool : pools) {
            drained += pool->drain();
        }
        ywarn("MemoryPressureMonitor: memory pressure, drained {} bytes from {} pools",
              drained, pools.size());

        std::weak_ptr<base::EventLoop> weakLoop = _loop;
        auto res = _loop->post([weakLoop, drained]() {
            auto loop = weakLoop.lock();
            if (!loop) return;
            if (auto r = loop->dispatch(base::Event::memoryPressureEvent(drained)); !r) {
                ywarn("MemoryPressureMonitor: dispatch failed: {}", error_msg(r));
            }
        });
        if (!res) {
            ywarn("MemoryPressureMonitor: cannot notify event loop: {}", error_msg(res));
        }
        return drained;
    }

private:
    Result<void> initThreadLoop(int fd) {
        int r = uv_loop_init(&_threadLoop);
        if (r != 0) {
            return Err<void>(std::string("uv_loop_init failed: ") + uv_strerror(r));
        }
        r = uv_async_init(&_threadLoop, &_stopAsync, onStopAsync);
        if (r != 0) {
            uv_loop_close(&_threadLoop);
            return Err<void>(std::string("uv_async_init failed: ") + uv_strerror(r));
        }
        _stopAsync.data = this;

        r = uv_poll_init(&_threadLoop, &_poll, fd);
        if (r == 0) {
            _poll.data = this;
            r = uv_poll_start(&_poll, UV_PRIORITIZED, onPoll);
        }
        if (r != 0) {
            uv_close(reinterpret_cast<uv_handle_t*>(&_stopAsync), nullptr);
            uv_run(&_threadLoop, UV_RUN_DEFAULT);
            uv_loop_close(&_threadLoop);
            return Err<void>(std::string("uv_poll on PSI fd failed: ") + uv_strerror(r));
        }
        return Ok();
    }

    void threadMain() {
        ydebug("MemoryPressureMonitor: thread started");
        uv_run(&_threadLoop, UV_RUN_DEFAULT);
        ydebug("MemoryPressureMonitor: thread exiting");
    }

    static void onPoll(uv_poll_t* handle, int status, int events) {
        auto* self = static_cast<MemoryPressureMonitorImpl*>(handle->data);
        if (status < 0) {
            yerror("MemoryPressureMonitor: poll error: {}", uv_strerror(status));
            uv_poll_stop(handle);
            return;
        }
        if (events & UV_PRIORITIZED) {
            self->signal();
        }
    }

    static void onStopAsync(uv_async_t* handle) {
        auto* self = static_cast<MemoryPressureMonitorImpl*>(handle->data);
        uv_poll_stop(&self->_poll);
        uv_close(reinterpret_cast<uv_handle_t*>(&self->_poll), nullptr);
        uv_close(reinterpret_cast<uv_handle_t*>(&self->_stopAsync), nullptr);
    }

    base::EventLoop::Ptr _loop;
    Config _config;

    std::mutex _poolsMutex;
    std::vector<GpuBufferPool::Ptr> _pools;

    std::atomic<bool> _running{false};
    std::thread _thread;
    int _fd = -1;
    uv_loop_t _threadLoop;
    uv_async_t _stopAsync;
    uv_poll_t _poll;
};

Result<MemoryPressureMonitor::Ptr> MemoryPressureMonitor::createImpl(base::EventLoop::Ptr loop,
                                                                     Config config) noexcept {
    auto impl = Ptr(new MemoryPressureMonitorImpl(std::move(loop), std::move(config)));
    if (auto res = static_cast<MemoryPressureMonitorImpl*>(impl.get())->init(); !res) {
        return Err<Ptr>("Failed to initialize MemoryPressureMonitor", res);
    }
    return Ok(std::move(impl));
}

} // namespace slate
