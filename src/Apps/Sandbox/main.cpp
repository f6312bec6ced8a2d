#include <cstdint>
#include <cstdlib>
#include <memory>
#include <utility>

#include "RHI.Vulkan.hpp"

import Core;
import RHI;

using namespace Core;

namespace
{
    constexpr uint32_t FrameCount = 24;
    constexpr VkDeviceSize ScratchBytes = 64 * 1024;

    // One headless "frame": clear a leased scratch buffer on the GPU and time it.
    bool RecordFrame(RHI::Pool& pool, uint32_t family, uint32_t frame)
    {
        auto cmd = pool.AcquireCommandBuffer(family);
        if (!cmd)
        {
            Log::Error("Frame {}: no command buffer ({})", frame, ErrorCodeToString(cmd.error().Code));
            return false;
        }

        // Odd frames ask for less, so the larger buffer from the previous frame is reused.
        auto scratch = pool.AcquireData((frame % 2 == 0) ? ScratchBytes : ScratchBytes / 2);
        if (!scratch)
        {
            Log::Error("Frame {}: no scratch buffer ({})", frame, ErrorCodeToString(scratch.error().Code));
            return false;
        }

        if (!(*cmd)->Begin()) return false;

        bool timed = (*cmd)->WriteTimestamp(0, VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT).has_value();
        vkCmdFillBuffer((*cmd)->GetHandle(), (*scratch)->GetHandle(), 0, VK_WHOLE_SIZE, frame);
        if (timed)
        {
            if (auto end = (*cmd)->WriteTimestamp(1, VK_PIPELINE_STAGE_BOTTOM_OF_PIPE_BIT); !end)
            {
                Log::Warn("Frame {}: end timestamp not written ({})", frame, ErrorCodeToString(end.error()));
                timed = false;
            }
        }

        if (!(*cmd)->End()) return false;
        if (!(*cmd)->Submit()) return false;

        // The buffer goes back to the pool only once this submission has executed.
        (*cmd)->PushFencedDrop(std::move(*scratch));

        if (auto waited = (*cmd)->WaitUntilExecuted(); !waited)
        {
            Log::Error("Frame {}: wait failed ({})", frame, ErrorCodeToString(waited.error()));
            return false;
        }

        if (timed)
        {
            if (auto elapsed = (*cmd)->GetElapsedNanoseconds())
                Log::Debug("Frame {}: fill took {:.3f} us", frame, *elapsed / 1000.0);
        }
        return true;
    }
}

int main()
{
    RHI::VulkanContext context(RHI::ContextConfig{.AppName = "LeaseholdDemo"});
    if (!context.IsValid())
    {
        Log::Error("No Vulkan instance available");
        return EXIT_FAILURE;
    }

    RHI::VulkanDevice device(context);
    if (!device.IsValid())
    {
        Log::Error("No suitable Vulkan device");
        return EXIT_FAILURE;
    }

    RHI::ShaderLibrary shaders(device, Filesystem::GetAssetPath("shaders"));
    RHI::Pool pool(device, shaders, RHI::PoolConfig{.LruThreshold = 4});

    const uint32_t family = device.GetQueueIndices().GraphicsFamily.value();

    for (uint32_t frame = 0; frame < FrameCount; ++frame)
    {
        if (!RecordFrame(pool, family, frame))
            return EXIT_FAILURE;

        pool.AdvanceFrame();
        pool.Drain([](RHI::ResourceKind kind, uint64_t idleFrames)
        {
            Log::Info("Evicting {} after {} idle frames", RHI::ResourceKindToString(kind), idleFrames);
        });
    }

    // Pipelines need SPIR-V; report instead of failing when the shaders were not built.
    if (auto compute = pool.AcquireCompute(RHI::ComputeMode::DecodeRgbRgba); !compute)
        Log::Warn("Compute pipeline unavailable: {}", ErrorCodeToString(compute.error().Code));

    if (auto pass = pool.GetRenderPass(RHI::DrawRenderPassMode{}); pass)
        Log::Info("Draw render pass ready with {} subpasses", (*pass)->GetSubpassCount());

    const RHI::PoolStats stats = pool.GetStats();
    Log::Info("Constructed {} command buffers and {} data buffers over {} frames",
              stats.ConstructedOf(RHI::ResourceKind::CommandBuffer),
              stats.ConstructedOf(RHI::ResourceKind::Data),
              pool.GetFrameNumber());

    device.WaitIdle();
    return EXIT_SUCCESS;
}
