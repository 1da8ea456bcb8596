// slate: headless canvas runtime driver
//
// Opens the block store, renders synthetic frames through the buffer pool,
// replays a drag through the persistence scheduler and reports the result.

#include <slate/canvas-services.h>
#include <spdlog/spdlog.h>
#if SLATE_WEBGPU
#include <slate/webgpu-buffer-device.h>
#endif

#include <args.hxx>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace slate;

namespace {

constexpr const char* DEMO_BLOCK_ID = "demo-block";

// Pump the loop until `done` is set
void runUntil(const base::EventLoop::Ptr& loop, const bool& done) {
    while (!done) {
        loop->runOnce();
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

Result<void> ensureParentDir(const std::string& path) {
    if (path == ":memory:") return Ok();
    auto parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) return Ok();
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        return Err<void>("cannot create " + parent.string() + ": " + ec.message());
    }
    return Ok();
}

#if SLATE_WEBGPU
// Headless WebGPU instance, adapter and device. Released in reverse order.
struct WebGpuContext {
    WGPUInstance instance = nullptr;
    WGPUAdapter adapter = nullptr;
    WGPUDevice device = nullptr;
    WGPUQueue queue = nullptr;

    WebGpuContext() = default;
    WebGpuContext(const WebGpuContext&) = delete;
    WebGpuContext& operator=(const WebGpuContext&) = delete;

    ~WebGpuContext() {
        if (queue) wgpuQueueRelease(queue);
        if (device) wgpuDeviceRelease(device);
        if (adapter) wgpuAdapterRelease(adapter);
        if (instance) wgpuInstanceRelease(instance);
    }

    Result<void> init() {
        WGPUInstanceDescriptor instanceDesc = {};
        instance = wgpuCreateInstance(&instanceDesc);
        if (!instance) return Err<void>("failed to create WebGPU instance");

        bool adapterReady = false;
        WGPURequestAdapterOptions adapterOpts = {};
        adapterOpts.powerPreference = WGPUPowerPreference_HighPerformance;

        WGPURequestAdapterCallbackInfo adapterCb = {};
        adapterCb.mode = WGPUCallbackMode_AllowProcessEvents;
        adapterCb.callback = [](WGPURequestAdapterStatus status, WGPUAdapter result,
                                WGPUStringView, void* userdata1, void* userdata2) {
            if (status == WGPURequestAdapterStatus_Success) {
                *static_cast<WGPUAdapter*>(userdata1) = result;
            }
            *static_cast<bool*>(userdata2) = true;
        };
        adapterCb.userdata1 = &adapter;
        adapterCb.userdata2 = &adapterReady;
        wgpuInstanceRequestAdapter(instance, &adapterOpts, adapterCb);
        while (!adapterReady) {
            wgpuInstanceProcessEvents(instance);
        }
        if (!adapter) return Err<void>("failed to get WebGPU adapter");

        bool deviceReady = false;
        WGPUDeviceDescriptor deviceDesc = {};
        deviceDesc.label = {"slate-device", 12};

        WGPURequestDeviceCallbackInfo deviceCb = {};
        deviceCb.mode = WGPUCallbackMode_AllowProcessEvents;
        deviceCb.callback = [](WGPURequestDeviceStatus status, WGPUDevice result,
                               WGPUStringView, void* userdata1, void* userdata2) {
            if (status == WGPURequestDeviceStatus_Success) {
                *static_cast<WGPUDevice*>(userdata1) = result;
            }
            *static_cast<bool*>(userdata2) = true;
        };
        deviceCb.userdata1 = &device;
        deviceCb.userdata2 = &deviceReady;
        wgpuAdapterRequestDevice(adapter, &deviceDesc, deviceCb);
        while (!deviceReady) {
            wgpuInstanceProcessEvents(instance);
        }
        if (!device) return Err<void>("failed to get WebGPU device");

        queue = wgpuDeviceGetQueue(device);
        spdlog::info("WebGPU initialized");
        return Ok();
    }
};
#else
struct WebGpuContext {};
#endif

// Buffer device named on the command line; `gpu` keeps a WebGPU device alive
Result<GpuBufferDevice::Ptr> createDevice(const std::string& kind,
                                          [[maybe_unused]] std::unique_ptr<WebGpuContext>& gpu) {
    if (kind == "host") {
        return GpuBufferDevice::createHost();
    }
    if (kind == "webgpu") {
#if SLATE_WEBGPU
        gpu = std::make_unique<WebGpuContext>();
        if (auto res = gpu->init(); !res) {
            return Err<GpuBufferDevice::Ptr>("WebGPU device unavailable", res);
        }
        return WebGpuBufferDevice::create(gpu->device, gpu->queue);
#else
        return Err<GpuBufferDevice::Ptr>("slate was built without WebGPU support");
#endif
    }
    return Err<GpuBufferDevice::Ptr>("unknown device '" + kind + "' (expected host or webgpu)");
}

void renderFrames(const CanvasServices& services, int frames) {
    auto frame = services.newFrame();
    std::vector<float> vertices(6 * 4, 0.5f);

    for (int i = 0; i < frames; i++) {
        // Vertex data, a uniform block and an instance buffer per frame
        if (auto res = frame->acquire(vertices); !res) {
            spdlog::warn("frame {}: vertex buffer: {}", i, error_msg(res));
        }
        if (auto res = frame->acquire(256); !res) {
            spdlog::warn("frame {}: uniform buffer: {}", i, error_msg(res));
        }
        if (auto res = frame->acquire(4096 + static_cast<size_t>(i % 8) * 512); !res) {
            spdlog::warn("frame {}: instance buffer: {}", i, error_msg(res));
        }
        frame->endFrame();
    }
}

void printStats(const GpuBufferPool& pool) {
    auto stats = pool.statistics();
    std::cout << "pool: allocations=" << stats.allocations
              << " reuses=" << stats.reuses
              << " releases=" << stats.releases
              << " discards=" << stats.discards
              << " failures=" << stats.failures
              << " pooled=" << stats.pooled
              << " idle-bytes=" << pool.estimatedMemoryUsage() << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    args::ArgumentParser parser("slate - canvas GPU buffer pool and block persistence");
    args::HelpFlag help(parser, "help", "Show help", {'h', "help"});
    args::ValueFlag<std::string> configFlag(parser, "FILE", "Config file", {'c', "config"});
    args::ValueFlag<std::string> storeFlag(parser, "PATH", "SQLite block store (:memory: allowed)", {"store"});
    args::ValueFlag<int> framesFlag(parser, "N", "Synthetic frames to render", {"frames"}, 120);
    args::ValueFlag<int> dragStepsFlag(parser, "N", "Drag steps to replay", {"drag-steps"}, 40);
    args::ValueFlag<std::string> logLevelFlag(parser, "LEVEL", "trace|debug|info|warn|error", {"log-level"}, "info");
    args::ValueFlag<std::string> deviceFlag(parser, "DEVICE", "Buffer device: host|webgpu", {"device"}, "host");
    args::Flag pressureFlag(parser, "memory-pressure", "Simulate a memory pressure signal after rendering",
                            {"memory-pressure"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    spdlog::set_level(spdlog::level::from_str(args::get(logLevelFlag)));
    spdlog::info("slate starting...");

    YAML::Node overrides;
    if (storeFlag) {
        overrides["store"]["path"] = args::get(storeFlag);
    }

    auto configRes = Config::create(configFlag ? args::get(configFlag) : std::string(), overrides);
    if (!configRes) {
        spdlog::error("{}", error_msg(configRes));
        return 1;
    }
    auto config = *configRes;

    auto storePath = config->get<std::string>(Config::KEY_STORE_PATH, ":memory:");
    if (auto res = ensureParentDir(storePath); !res) {
        spdlog::error("{}", error_msg(res));
        return 1;
    }
    auto storeRes = SqliteBlockStore::create(storePath, config->get<bool>(Config::KEY_STORE_CREATE_SCHEMA, true));
    if (!storeRes) {
        spdlog::error("{}", error_msg(storeRes));
        return 1;
    }
    auto store = *storeRes;

    std::unique_ptr<WebGpuContext> gpu;
    auto deviceRes = createDevice(args::get(deviceFlag), gpu);
    if (!deviceRes) {
        spdlog::error("{}", error_msg(deviceRes));
        return 1;
    }

    auto loopRes = base::EventLoop::instance();
    if (!loopRes) {
        spdlog::error("{}", error_msg(loopRes));
        return 1;
    }
    auto loop = *loopRes;

    auto servicesRes = CanvasServices::create(config, *deviceRes, store, loop);
    if (!servicesRes) {
        spdlog::error("{}", error_msg(servicesRes));
        return 1;
    }
    auto services = *servicesRes;

    auto existing = store->read(DEMO_BLOCK_ID);
    if (!existing) {
        spdlog::error("{}", error_msg(existing));
        return 1;
    }
    if (!*existing) {
        BlockRecord seed;
        seed.id = DEMO_BLOCK_ID;
        seed.position = {0.0, 0.0};
        seed.size = {240.0, 160.0};
        seed.content = "hello";
        if (auto res = store->insert(seed); !res) {
            spdlog::error("{}", error_msg(res));
            return 1;
        }
    }

    renderFrames(*services, args::get(framesFlag));
    printStats(*services->pool());

    if (pressureFlag) {
        uint64_t drained = services->memoryMonitor() ? services->memoryMonitor()->signal()
                                                     : services->pool()->drain();
        std::cout << "memory pressure: drained " << drained << " bytes" << std::endl;
        loop->runOnce();
    }

    // Replay a drag at roughly 120 Hz
    const int dragSteps = args::get(dragStepsFlag);
    auto saver = services->saver();
    Point position{0.0, 0.0};
    for (int i = 1; i <= dragSteps; i++) {
        position = {i * 4.0, i * 2.5};
        saver->queuePositionUpdate(DEMO_BLOCK_ID, position);
        loop->runOnce();
        std::this_thread::sleep_for(std::chrono::milliseconds(8));
    }

    bool dragDone = false;
    saver->endDrag(DEMO_BLOCK_ID, position, [&dragDone](Result<void> res) {
        if (!res) spdlog::error("drag flush failed: {}", error_msg(res));
        dragDone = true;
    });
    runUntil(loop, dragDone);

    saver->queueSizeUpdate(DEMO_BLOCK_ID, {320.0, 200.0});
    saver->queueContentUpdate(DEMO_BLOCK_ID, "edited after " + std::to_string(dragSteps) + " drag steps");

    bool shutdownDone = false;
    bool shutdownOk = true;
    services->shutdown([&](Result<void> res) {
        shutdownOk = static_cast<bool>(res);
        shutdownDone = true;
    });
    runUntil(loop, shutdownDone);

    auto record = store->read(DEMO_BLOCK_ID);
    if (!record || !*record) {
        spdlog::error("cannot read back {}", DEMO_BLOCK_ID);
        return 1;
    }
    const auto& row = **record;
    std::cout << "block " << row.id
              << ": position=(" << row.position.x << "," << row.position.y << ")"
              << " size=(" << row.size.width << "x" << row.size.height << ")"
              << " content=\"" << row.content << "\""
              << " updated=" << row.updatedAt << std::endl;

    spdlog::info("slate done");
    return shutdownOk ? 0 : 1;
}
