#pragma once

#include <slate/base/base.h>
#include <slate/gpu-buffer-pool.h>
#include <cstdint>
#include <string>

namespace slate {

struct MemoryPressureMonitorConfig {
    bool enabled = true;
    // PSI trigger: "some <stallUs> <windowUs>"
    uint32_t stallUs = 150000;
    uint32_t windowUs = 1000000;
    std::string psiPath = "/proc/pressure/memory";
};

/**
 * MemoryPressureMonitor drains registered pools when the system runs short
 * of memory.
 *
 * start() spawns a thread with its own libuv loop polling a Linux PSI
 * trigger. When the trigger fires every pool is drained on that thread and
 * a MemoryPressure event is dispatched on the owning event loop.
 */
class MemoryPressureMonitor : public base::ObjectFactory<MemoryPressureMonitor> {
public:
    using Ptr = std::shared_ptr<MemoryPressureMonitor>;
    using Config = MemoryPressureMonitorConfig;

    static Result<Ptr> createImpl(base::EventLoop::Ptr loop, Config config = {}) noexcept;

    virtual ~MemoryPressureMonitor() = default;

    virtual void addPool(GpuBufferPool::Ptr pool) = 0;

    // Error when PSI is unavailable (old kernel, no permission, disabled)
    virtual Result<void> start() = 0;
    virtual void stop() = 0;
    virtual bool running() const = 0;

    // Drain all pools and notify the loop, as if the trigger had fired.
    // Returns the idle bytes released. Safe from any thread.
    virtual uint64_t signal() = 0;

protected:
    MemoryPressureMonitor() = default;
};

} // namespace slate
