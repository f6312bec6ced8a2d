module;
#include <memory>
#include "RHI.Vulkan.hpp"

module RHI:Fence.Impl;
import :Fence;
import :Device;
import Core;

namespace RHI
{
    Core::Expected<std::unique_ptr<Fence>> Fence::Create(VulkanDevice& device, bool signaled)
    {
        VkFenceCreateInfo fenceInfo{};
        fenceInfo.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
        fenceInfo.flags = signaled ? VK_FENCE_CREATE_SIGNALED_BIT : 0;

        VkFence fence = VK_NULL_HANDLE;
        const VkResult result = vkCreateFence(device.GetLogicalDevice(), &fenceInfo, nullptr, &fence);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create fence! Error Code: {}", static_cast<int>(result));
            return std::unexpected(ToErrorCode(result));
        }

        return std::unique_ptr<Fence>(new Fence(device, fence));
    }

    Fence::~Fence()
    {
        if (m_Fence) vkDestroyFence(m_Device.GetLogicalDevice(), m_Fence, nullptr);
    }

    Core::Result Fence::Reset()
    {
        const VkResult result = vkResetFences(m_Device.GetLogicalDevice(), 1, &m_Fence);
        if (result != VK_SUCCESS) return Core::Err(ToErrorCode(result));
        return Core::Ok();
    }

    Core::Result Fence::Wait() const
    {
        return m_Device.WaitForFence(m_Fence);
    }

    Core::Expected<bool> Fence::IsSignaled() const
    {
        return m_Device.GetFenceStatus(m_Fence);
    }
}
