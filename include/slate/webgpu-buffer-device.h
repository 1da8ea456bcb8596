#pragma once

#include <slate/gpu-buffer.h>
#include <webgpu/webgpu.h>

namespace slate {

// GpuBufferDevice backed by a WebGPU device. Buffers carry a CPU shadow copy;
// didModify() uploads the written range with wgpuQueueWriteBuffer.
class WebGpuBufferDevice {
public:
    static constexpr WGPUBufferUsage DEFAULT_USAGE =
        WGPUBufferUsage_Vertex | WGPUBufferUsage_Index |
        WGPUBufferUsage_Uniform | WGPUBufferUsage_Storage |
        WGPUBufferUsage_CopyDst;

    static Result<GpuBufferDevice::Ptr> create(WGPUDevice device, WGPUQueue queue,
                                               WGPUBufferUsage usage = DEFAULT_USAGE) noexcept;
};

} // namespace slate
