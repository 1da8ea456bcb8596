#pragma once

#include "factory.h"
#include "event.h"
#include "event-listener.h"
#include <functional>

namespace slate {
namespace base {

using TimerId = int;
using Timeout = int;

// Per-thread libuv event loop. Listeners are held weakly; a listener that
// goes away is simply skipped.
class EventLoop : public ThreadSingleton<EventLoop> {
public:
    using Ptr = std::shared_ptr<EventLoop>;
    using Task = std::function<void()>;

    // Factory for ThreadSingleton
    static Result<Ptr> createImpl() noexcept;

    virtual ~EventLoop() = default;

    // Run the loop until stop() (blocking)
    virtual int start() = 0;

    // Run one non-blocking iteration; returns number of posted tasks executed
    virtual int runOnce() = 0;

    virtual Result<void> stop() = 0;

    // Event listener registration by type
    // priority: higher value = called first (default 0)
    virtual Result<void> registerListener(Event::Type type, EventListener::Ptr listener, int priority = 0) = 0;
    virtual Result<void> deregisterListener(EventListener::Ptr listener) = 0;

    // Deliver to the listeners of event.type until one consumes it
    virtual Result<bool> dispatch(const Event& event) = 0;

    // Timer management (timers repeat every timeout until stopped)
    virtual Result<TimerId> createTimer() = 0;
    virtual Result<void> configTimer(TimerId id, Timeout timeoutMs) = 0;
    virtual Result<void> startTimer(TimerId id) = 0;
    virtual Result<void> stopTimer(TimerId id) = 0;
    virtual Result<void> destroyTimer(TimerId id) = 0;
    virtual Result<void> registerTimerListener(TimerId id, EventListener::Ptr listener) = 0;

    // Queue a task to run on the loop thread. Safe to call from any thread.
    virtual Result<void> post(Task task) = 0;

protected:
    EventLoop() = default;
};

} // namespace base
} // namespace slate
