#pragma once

#include <chrono>
#include <memory>

namespace slate {

// Monotonic time source. The persistence scheduler reads time only through
// this interface so tests can drive it with a manual clock.
class Clock {
public:
    using Ptr = std::shared_ptr<Clock>;
    using TimePoint = std::chrono::steady_clock::time_point;
    using Duration = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;

    // Process-wide std::chrono::steady_clock source
    static Ptr steady();
};

} // namespace slate
