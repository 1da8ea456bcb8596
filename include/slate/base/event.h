#pragma once

#include "types.h"
#include <cstdint>

namespace slate {
namespace base {

struct Event {
    enum class Type {
        None,
        // Timer
        Timer,
        // System memory pressure (PSI trigger or manual signal)
        MemoryPressure,
        // Host application lifecycle
        WillResignActive,
        WillTerminate
    };

    struct TimerEvent {
        int timerId;
    };

    struct MemoryPressureEvent {
        // Idle pool bytes released by the drain that preceded this event
        uint64_t drainedBytes;
    };

    Type type = Type::None;

    union {
        TimerEvent timer;
        MemoryPressureEvent memoryPressure;
    };

    Event() : timer{0} {}

    static Event timerEvent(int timerId) {
        Event e;
        e.type = Type::Timer;
        e.timer = {timerId};
        return e;
    }

    static Event memoryPressureEvent(uint64_t drainedBytes) {
        Event e;
        e.type = Type::MemoryPressure;
        e.memoryPressure = {drainedBytes};
        return e;
    }

    static Event willResignActive() {
        Event e;
        e.type = Type::WillResignActive;
        return e;
    }

    static Event willTerminate() {
        Event e;
        e.type = Type::WillTerminate;
        return e;
    }
};

} // namespace base
} // namespace slate
