#include <slate/clock.h>

namespace slate {

namespace {

class SteadyClock : public Clock {
public:
    TimePoint now() const override {
        return std::chrono::steady_clock::now();
    }
};

} // namespace

Clock::Ptr Clock::steady() {
    static Ptr instance = std::make_shared<SteadyClock>();
    return instance;
}

} // namespace slate
