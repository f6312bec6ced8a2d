module;
#include <array>
#include <cstdint>
#include <exception>
#include <memory>
#include "RHI.Vulkan.hpp"
#include "Core.Profiling.Macros.hpp"

module RHI:CommandBuffer.Impl;
import :CommandBuffer;
import :Device;
import Core;

namespace RHI
{
    Core::Expected<std::unique_ptr<CommandBuffer>> CommandBuffer::Create(VulkanDevice& device, const CommandBufferInfo& info)
    {
        PROFILE_FUNCTION();

        VkDevice vkDevice = device.GetLogicalDevice();

        // Partially built objects clean up through the destructor.
        std::unique_ptr<CommandBuffer> cmd(new CommandBuffer(device, info));

        VkCommandPoolCreateInfo poolInfo{};
        poolInfo.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
        poolInfo.flags = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT | VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
        poolInfo.queueFamilyIndex = info.QueueFamilyIndex;

        if (VkResult result = vkCreateCommandPool(vkDevice, &poolInfo, nullptr, &cmd->m_Pool); result != VK_SUCCESS)
        {
            Core::Log::Warn("CommandBuffer::Create(): vkCreateCommandPool failed ({})", static_cast<int>(result));
            cmd->m_Pool = VK_NULL_HANDLE;
            return std::unexpected(Core::ErrorCode::Unsupported);
        }

        VkCommandBufferAllocateInfo allocInfo{};
        allocInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
        allocInfo.commandPool = cmd->m_Pool;
        allocInfo.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
        allocInfo.commandBufferCount = 1;

        if (VkResult result = vkAllocateCommandBuffers(vkDevice, &allocInfo, &cmd->m_Cmd); result != VK_SUCCESS)
        {
            Core::Log::Warn("CommandBuffer::Create(): vkAllocateCommandBuffers failed ({})", static_cast<int>(result));
            cmd->m_Cmd = VK_NULL_HANDLE;
            return std::unexpected(Core::ErrorCode::Unsupported);
        }

        // Starts signaled: no pending work.
        VkFenceCreateInfo fenceInfo{};
        fenceInfo.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
        fenceInfo.flags = VK_FENCE_CREATE_SIGNALED_BIT;

        if (VkResult result = vkCreateFence(vkDevice, &fenceInfo, nullptr, &cmd->m_Fence); result != VK_SUCCESS)
        {
            Core::Log::Warn("CommandBuffer::Create(): vkCreateFence failed ({})", static_cast<int>(result));
            cmd->m_Fence = VK_NULL_HANDLE;
            return std::unexpected(ToErrorCode(result));
        }

        VkQueryPoolCreateInfo queryInfo{};
        queryInfo.sType = VK_STRUCTURE_TYPE_QUERY_POOL_CREATE_INFO;
        queryInfo.queryType = VK_QUERY_TYPE_TIMESTAMP;
        queryInfo.queryCount = TimestampSlotCount;

        if (VkResult result = vkCreateQueryPool(vkDevice, &queryInfo, nullptr, &cmd->m_QueryPool); result != VK_SUCCESS)
        {
            Core::Log::Warn("CommandBuffer::Create(): vkCreateQueryPool failed ({})", static_cast<int>(result));
            cmd->m_QueryPool = VK_NULL_HANDLE;
            return std::unexpected(ToErrorCode(result));
        }

        return cmd;
    }

    CommandBuffer::~CommandBuffer()
    {
        // Tearing down mid-unwind could free objects the GPU is still reading. Leak instead.
        if (std::uncaught_exceptions() > 0) return;

        VkDevice device = m_Device.GetLogicalDevice();

        if (m_Fence)
        {
            if (auto waited = m_Device.WaitForFence(m_Fence); !waited)
            {
                Core::Log::Error("CommandBuffer: final fence wait failed ({}). Leaking driver objects.",
                                 Core::ErrorCodeToString(waited.error()));
                return;
            }
        }

        m_Retired.Clear();

        if (m_Cmd) vkFreeCommandBuffers(device, m_Pool, 1, &m_Cmd);
        if (m_Pool) vkDestroyCommandPool(device, m_Pool, nullptr);
        if (m_QueryPool) vkDestroyQueryPool(device, m_QueryPool, nullptr);
        if (m_Fence) vkDestroyFence(device, m_Fence, nullptr);
    }

    Core::Result CommandBuffer::Begin()
    {
        if (m_State == CommandBufferState::Recording)
        {
            Core::Log::Error("CommandBuffer::Begin(): already recording");
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        if (m_State == CommandBufferState::Submitted)
        {
            auto executed = HasExecuted();
            if (!executed) return Core::Err(executed.error());
            if (!*executed)
            {
                Core::Log::Error("CommandBuffer::Begin(): previous submission is still executing");
                return Core::Err(Core::ErrorCode::InvalidState);
            }
        }

        if (VkResult result = vkResetCommandBuffer(m_Cmd, 0); result != VK_SUCCESS)
            return Core::Err(ToErrorCode(result));

        VkCommandBufferBeginInfo beginInfo{};
        beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
        beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;

        if (VkResult result = vkBeginCommandBuffer(m_Cmd, &beginInfo); result != VK_SUCCESS)
            return Core::Err(ToErrorCode(result));

        // Every recording starts from unavailable queries, so WriteTimestamp never hits a stale slot.
        if (m_Device.SupportsTimestamps(m_Info.QueueFamilyIndex))
            vkCmdResetQueryPool(m_Cmd, m_QueryPool, 0, TimestampSlotCount);

        m_RecordedTimestamps = 0;
        m_State = CommandBufferState::Recording;
        return Core::Ok();
    }

    Core::Result CommandBuffer::End()
    {
        if (m_State != CommandBufferState::Recording)
        {
            Core::Log::Error("CommandBuffer::End(): not recording");
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        if (VkResult result = vkEndCommandBuffer(m_Cmd); result != VK_SUCCESS)
            return Core::Err(ToErrorCode(result));

        m_State = CommandBufferState::Recorded;
        return Core::Ok();
    }

    Core::Result CommandBuffer::Submit()
    {
        PROFILE_FUNCTION();

        if (m_State != CommandBufferState::Recorded)
        {
            Core::Log::Error("CommandBuffer::Submit(): nothing recorded (call Begin()/End() first)");
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        VkDevice device = m_Device.GetLogicalDevice();
        if (VkResult result = vkResetFences(device, 1, &m_Fence); result != VK_SUCCESS)
            return Core::Err(ToErrorCode(result));

        VkSubmitInfo submitInfo{};
        submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
        submitInfo.commandBufferCount = 1;
        submitInfo.pCommandBuffers = &m_Cmd;

        if (VkResult result = m_Device.Submit(m_Info.QueueFamilyIndex, submitInfo, m_Fence); result != VK_SUCCESS)
        {
            Core::Log::Error("CommandBuffer::Submit(): vkQueueSubmit failed ({})", static_cast<int>(result));

            // The fence was reset but nothing will ever signal it.
            if (auto restored = RecreateSignaledFence(); !restored)
                Core::Log::Error("CommandBuffer::Submit(): could not restore the fence");

            return Core::Err(ToErrorCode(result));
        }

        ++m_SubmitCount;
        m_SubmittedTimestamps = m_RecordedTimestamps;
        m_State = CommandBufferState::Submitted;
        return Core::Ok();
    }

    Core::Expected<bool> CommandBuffer::HasExecuted() const
    {
        if (m_Fence == VK_NULL_HANDLE) return std::unexpected(Core::ErrorCode::InvalidState);

        auto status = m_Device.GetFenceStatus(m_Fence);
        if (status) return *status;

        if (status.error() == Core::ErrorCode::DeviceLost)
        {
            Core::Log::Error("Device lost");
            return std::unexpected(Core::ErrorCode::DeviceLost);
        }

        Core::Log::Error("CommandBuffer::HasExecuted(): fence status query failed ({})",
                         Core::ErrorCodeToString(status.error()));
        return std::unexpected(Core::ErrorCode::InvalidData);
    }

    Core::Result CommandBuffer::WaitUntilExecuted() const
    {
        PROFILE_FUNCTION();
        return m_Device.WaitForFence(m_Fence);
    }

    Core::Expected<size_t> CommandBuffer::DropFenced()
    {
        if (m_Retired.Empty()) return size_t{0};

        auto executed = HasExecuted();
        if (!executed) return std::unexpected(executed.error());

        // Begin() refuses to reuse a pending buffer, so every earlier submission has completed.
        uint64_t completed = m_SubmitCount;
        if (!*executed && m_State == CommandBufferState::Submitted)
            completed = m_SubmitCount - 1;

        const size_t dropped = m_Retired.Sweep(completed);
        if (dropped > 0)
            Core::Log::Trace("CommandBuffer: dropping {} fenced references", dropped);

        return dropped;
    }

    Core::Result CommandBuffer::Recycle()
    {
        auto executed = HasExecuted();
        if (!executed) return Core::Err(executed.error());
        if (!*executed)
        {
            Core::Log::Error("CommandBuffer::Recycle(): previous submission is still executing");
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        auto dropped = DropFenced();
        if (!dropped) return Core::Err(dropped.error());

        if (VkResult result = vkResetCommandBuffer(m_Cmd, 0); result != VK_SUCCESS)
            return Core::Err(ToErrorCode(result));

        m_RecordedTimestamps = 0;
        m_SubmittedTimestamps = 0;
        m_State = CommandBufferState::Idle;
        return Core::Ok();
    }

    Core::Result CommandBuffer::WriteTimestamp(uint32_t slot, VkPipelineStageFlagBits stage)
    {
        if (slot >= TimestampSlotCount)
            return Core::Err(Core::ErrorCode::InvalidArgument);

        if (!m_Device.SupportsTimestamps(m_Info.QueueFamilyIndex))
            return Core::Err(Core::ErrorCode::Unsupported);

        if (m_State != CommandBufferState::Recording)
        {
            Core::Log::Error("CommandBuffer::WriteTimestamp(): not recording");
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        vkCmdWriteTimestamp(m_Cmd, stage, m_QueryPool, slot);
        m_RecordedTimestamps |= (1u << slot);
        return Core::Ok();
    }

    Core::Expected<std::array<uint64_t, 2>> CommandBuffer::GetQueryResults() const
    {
        constexpr uint32_t allSlots = (1u << TimestampSlotCount) - 1;
        if (m_State != CommandBufferState::Submitted || m_SubmittedTimestamps != allSlots)
        {
            Core::Log::Error("CommandBuffer::GetQueryResults(): the last submission did not write both timestamps");
            return std::unexpected(Core::ErrorCode::InvalidState);
        }

        std::array<uint64_t, 2> results{};
        const VkResult result = vkGetQueryPoolResults(m_Device.GetLogicalDevice(), m_QueryPool,
                                                      0, TimestampSlotCount,
                                                      sizeof(results), results.data(), sizeof(uint64_t),
                                                      VK_QUERY_RESULT_64_BIT | VK_QUERY_RESULT_WAIT_BIT);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("CommandBuffer::GetQueryResults(): vkGetQueryPoolResults failed ({})", static_cast<int>(result));
            return std::unexpected(Core::ErrorCode::InvalidData);
        }

        return results;
    }

    Core::Expected<double> CommandBuffer::GetElapsedNanoseconds() const
    {
        auto results = GetQueryResults();
        if (!results) return std::unexpected(results.error());

        const auto& [start, end] = *results;
        const uint64_t ticks = end >= start ? end - start : 0;
        return static_cast<double>(ticks) * static_cast<double>(m_Device.GetTimestampPeriod());
    }

    Core::Result CommandBuffer::RecreateSignaledFence()
    {
        VkDevice device = m_Device.GetLogicalDevice();
        vkDestroyFence(device, m_Fence, nullptr);
        m_Fence = VK_NULL_HANDLE;

        VkFenceCreateInfo fenceInfo{};
        fenceInfo.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
        fenceInfo.flags = VK_FENCE_CREATE_SIGNALED_BIT;

        if (VkResult result = vkCreateFence(device, &fenceInfo, nullptr, &m_Fence); result != VK_SUCCESS)
        {
            m_Fence = VK_NULL_HANDLE;
            return Core::Err(ToErrorCode(result));
        }
        return Core::Ok();
    }
}
