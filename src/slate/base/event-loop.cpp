#include <slate/base/event-loop.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <mutex>
#include <unordered_map>
#include <vector>

#include <uv.h>

namespace slate {
namespace base {

struct EventTypeHash {
    std::size_t operator()(Event::Type t) const noexcept {
        return static_cast<std::size_t>(t);
    }
};

struct TimerHandle {
    uv_timer_t timer;
    int id = -1;
    Timeout timeout = 0;
    std::vector<std::weak_ptr<EventListener>> listeners;
};

class EventLoopImpl : public EventLoop {
public:
    EventLoopImpl() = default;

    ~EventLoopImpl() override {
        if (!_initialized) return;

        for (auto& [id, th] : _timers) {
            uv_timer_stop(&th->timer);
            uv_close(reinterpret_cast<uv_handle_t*>(&th->timer), nullptr);
        }
        uv_close(reinterpret_cast<uv_handle_t*>(&_async), nullptr);

        // Let libuv process the close callbacks before the handles go away
        uv_run(&_loop, UV_RUN_DEFAULT);
        _timers.clear();

        int r = uv_loop_close(&_loop);
        if (r != 0) {
            ywarn("EventLoop: uv_loop_close failed: {}", uv_strerror(r));
        }
    }

    Result<void> init() noexcept {
        int r = uv_loop_init(&_loop);
        if (r != 0) {
            return Err<void>(std::string("uv_loop_init failed: ") + uv_strerror(r));
        }
        r = uv_async_init(&_loop, &_async, onAsyncCallback);
        if (r != 0) {
            uv_loop_close(&_loop);
            return Err<void>(std::string("uv_async_init failed: ") + uv_strerror(r));
        }
        _async.data = this;
        _initialized = true;
        return Ok();
    }

    int start() override {
        yinfo("EventLoop::start");
        return uv_run(&_loop, UV_RUN_DEFAULT);
    }

    int runOnce() override {
        _executed = 0;
        uv_run(&_loop, UV_RUN_NOWAIT);
        return _executed;
    }

    Result<void> stop() override {
        yinfo("EventLoop::stop");
        uv_stop(&_loop);
        return Ok();
    }

    Result<void> registerListener(Event::Type type, EventListener::Ptr listener, int priority = 0) override {
        if (!listener) return Err<void>("EventLoop: null listener");
        auto& vec = _listeners[type];
        // Highest priority first; equal priorities keep registration order
        auto pos = std::find_if(vec.begin(), vec.end(), [priority](const PrioritizedListener& pl) {
            return pl.priority < priority;
        });
        vec.insert(pos, PrioritizedListener{listener, priority});
        return Ok();
    }

    Result<void> deregisterListener(EventListener::Ptr listener) override {
        for (auto& [type, vec] : _listeners) {
            eraseListener(vec, listener);
        }
        return Ok();
    }

    Result<bool> dispatch(const Event& event) override {
        auto it = _listeners.find(event.type);
        if (it == _listeners.end()) return Ok(false);

        // A handler may (de)register listeners
        const auto listeners = it->second;
        for (const auto& pl : listeners) {
            auto sp = pl.listener.lock();
            if (!sp) continue;
            auto consumed = sp->onEvent(event);
            if (!consumed) {
                return Err<bool>(std::string("EventLoop: ") + sp->typeName() + " failed", consumed);
            }
            if (*consumed) return Ok(true);
        }
        return Ok(false);
    }

    Result<TimerId> createTimer() override {
        auto th = std::make_unique<TimerHandle>();
        th->id = _nextTimerId++;
        if (int r = uv_timer_init(&_loop, &th->timer); r != 0) {
            return Err<TimerId>(std::string("uv_timer_init failed: ") + uv_strerror(r));
        }
        th->timer.data = th.get();
        const TimerId id = th->id;
        _timers.emplace(id, std::move(th));
        ydebug("EventLoop: timer {} created", id);
        return Ok(id);
    }

    Result<void> configTimer(TimerId id, Timeout timeoutMs) override {
        TimerHandle* th = findTimer(id);
        if (!th) return Err<void>("EventLoop: no timer " + std::to_string(id));

        th->timeout = timeoutMs;
        if (uv_is_active(reinterpret_cast<uv_handle_t*>(&th->timer))) {
            return arm(th);
        }
        return Ok();
    }

    Result<void> startTimer(TimerId id) override {
        TimerHandle* th = findTimer(id);
        if (!th) return Err<void>("EventLoop: no timer " + std::to_string(id));
        ydebug("EventLoop: timer {} every {}ms", id, th->timeout);
        return arm(th);
    }

    Result<void> stopTimer(TimerId id) override {
        TimerHandle* th = findTimer(id);
        if (!th) return Err<void>("EventLoop: no timer " + std::to_string(id));
        uv_timer_stop(&th->timer);
        return Ok();
    }

    Result<void> destroyTimer(TimerId id) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) return Err<void>("EventLoop: no timer " + std::to_string(id));

        // Freed by the close callback; libuv still owns the handle until then
        TimerHandle* th = it->second.release();
        _timers.erase(it);
        uv_timer_stop(&th->timer);
        uv_close(reinterpret_cast<uv_handle_t*>(&th->timer), [](uv_handle_t* handle) {
            delete static_cast<TimerHandle*>(handle->data);
        });
        return Ok();
    }

    Result<void> registerTimerListener(TimerId id, EventListener::Ptr listener) override {
        TimerHandle* th = findTimer(id);
        if (!th) return Err<void>("EventLoop: no timer " + std::to_string(id));
        th->listeners.push_back(listener);
        return Ok();
    }

    Result<void> post(Task task) override {
        if (!task) return Ok();
        {
            std::lock_guard<std::mutex> lock(_postMutex);
            _posted.push_back(std::move(task));
        }
        int r = uv_async_send(&_async);
        if (r != 0) {
            return Err<void>(std::string("uv_async_send failed: ") + uv_strerror(r));
        }
        return Ok();
    }

private:
    TimerHandle* findTimer(TimerId id) {
        auto it = _timers.find(id);
        return it == _timers.end() ? nullptr : it->second.get();
    }

    Result<void> arm(TimerHandle* th) {
        if (int r = uv_timer_start(&th->timer, onTimerCallback, th->timeout, th->timeout); r != 0) {
            return Err<void>(std::string("uv_timer_start failed: ") + uv_strerror(r));
        }
        return Ok();
    }

    struct PrioritizedListener {
        std::weak_ptr<EventListener> listener;
        int priority;
    };

    static void eraseListener(std::vector<PrioritizedListener>& vec, const EventListener::Ptr& listener) {
        vec.erase(
            std::remove_if(vec.begin(), vec.end(),
                [&](const PrioritizedListener& pl) {
                    auto sp = pl.listener.lock();
                    return !sp || sp == listener;
                }),
            vec.end());
    }

    static void onTimerCallback(uv_timer_t* handle) {
        auto* th = static_cast<TimerHandle*>(handle->data);

        Event event = Event::timerEvent(th->id);

        auto listeners = th->listeners;  // a listener may destroy this timer
        for (const auto& wp : listeners) {
            if (auto sp = wp.lock()) {
                if (auto res = sp->onEvent(event); !res) {
                    ywarn("EventLoop: timer {} listener failed: {}", event.timer.timerId, error_msg(res));
                }
            }
        }
    }

    static void onAsyncCallback(uv_async_t* handle) {
        auto* self = static_cast<EventLoopImpl*>(handle->data);

        std::vector<Task> tasks;
        {
            std::lock_guard<std::mutex> lock(self->_postMutex);
            tasks.swap(self->_posted);
        }
        for (auto& task : tasks) {
            task();
            self->_executed++;
        }
    }

    std::unordered_map<Event::Type, std::vector<PrioritizedListener>, EventTypeHash> _listeners;

    uv_loop_t _loop{};
    uv_async_t _async{};
    bool _initialized = false;
    std::unordered_map<TimerId, std::unique_ptr<TimerHandle>> _timers;
    TimerId _nextTimerId = 1;

    std::mutex _postMutex;
    std::vector<Task> _posted;
    int _executed = 0;
};

Result<EventLoop::Ptr> EventLoop::createImpl() noexcept {
    auto impl = std::make_shared<EventLoopImpl>();
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("EventLoop init failed", res);
    }
    return Ok(Ptr(std::move(impl)));
}

} // namespace base
} // namespace slate
