//=============================================================================
// GpuBuffer Tests
//
// Upload range widening and the host device allocation limit
//=============================================================================

// Standard headers before boost/ut.hpp
#include <cstddef>
#include <version>
#include <atomic>
#include <thread>
#include <vector>

#include <boost/ut.hpp>
#include <slate/gpu-buffer.h>

using namespace boost::ut;
using namespace slate;

suite gpu_buffer_tests = [] {
    "aligned range keeps an aligned write"_test = [] {
        static_assert(alignedRange(8, 16, 4, 64) == ByteRange{8, 16});
        expect(alignedRange(0, 64, 4, 64) == ByteRange{0, 64});
    };

    "aligned range widens both ends"_test = [] {
        expect(alignedRange(5, 2, 4, 64) == ByteRange{4, 4});
        expect(alignedRange(3, 6, 4, 64) == ByteRange{0, 12});
        expect(alignedRange(1, 1, 4, 64) == ByteRange{0, 4});
    };

    "aligned range stops at the capacity"_test = [] {
        expect(alignedRange(61, 3, 4, 64) == ByteRange{60, 4});
        expect(alignedRange(9, 1, 4, 10) == ByteRange{8, 2});
    };

    "empty range stays empty"_test = [] {
        expect(alignedRange(7, 0, 4, 64) == ByteRange{7, 0});
    };

    "host device refuses allocations past its limit"_test = [] {
        auto device = GpuBufferDevice::createHost(1024);
        expect(device.has_value() >> fatal);

        auto a = (*device)->createBuffer(512);
        auto b = (*device)->createBuffer(512);
        expect((a.has_value() && b.has_value()) >> fatal);

        auto c = (*device)->createBuffer(64);
        expect(!c);
        expect((*device)->allocatedBytes() == 1024_ull) << "failed allocation leaves no reservation";
        expect((*device)->liveBuffers() == 2_u);

        a->reset();
        auto d = (*device)->createBuffer(256);
        expect(d.has_value());
        expect((*device)->allocatedBytes() == 768_ull);
    };

    "concurrent allocations never exceed the host limit"_test = [] {
        constexpr uint64_t limit = 64 * 1024;
        auto device = GpuBufferDevice::createHost(limit);
        expect(device.has_value() >> fatal);
        auto dev = *device;

        std::atomic<bool> overshoot{false};
        auto allocate = [&dev, &overshoot] {
            std::vector<GpuBuffer::Ptr> held;
            for (int i = 0; i < 500; ++i) {
                auto buf = dev->createBuffer(1024);
                if (dev->allocatedBytes() > limit) overshoot = true;
                if (buf) held.push_back(*buf);
                if (held.size() > 40) held.clear();
            }
        };

        std::thread t1(allocate);
        std::thread t2(allocate);
        std::thread t3(allocate);
        t1.join();
        t2.join();
        t3.join();

        expect(!overshoot.load());
        expect(dev->allocatedBytes() == 0_ull);
        expect(dev->liveBuffers() == 0_u);
    };
};
