module;
#include <cstdint>
#include <memory>
#include "RHI.Vulkan.hpp"

module RHI:CommandPool.Impl;
import :CommandPool;
import :Device;
import Core;

namespace RHI
{
    Core::Expected<std::unique_ptr<CommandPool>> CommandPool::Create(VulkanDevice& device, uint32_t queueFamily)
    {
        VkCommandPoolCreateInfo poolInfo{};
        poolInfo.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
        poolInfo.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
        poolInfo.queueFamilyIndex = queueFamily;

        VkCommandPool pool = VK_NULL_HANDLE;
        const VkResult result = vkCreateCommandPool(device.GetLogicalDevice(), &poolInfo, nullptr, &pool);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create command pool for family {}! Error Code: {}", queueFamily, static_cast<int>(result));
            return std::unexpected(ToErrorCode(result));
        }

        return std::unique_ptr<CommandPool>(new CommandPool(device, pool, queueFamily));
    }

    CommandPool::~CommandPool()
    {
        if (m_Pool) vkDestroyCommandPool(m_Device.GetLogicalDevice(), m_Pool, nullptr);
    }

    Core::Result CommandPool::Reset(bool releaseResources)
    {
        const VkCommandPoolResetFlags flags = releaseResources ? VK_COMMAND_POOL_RESET_RELEASE_RESOURCES_BIT : 0;
        const VkResult result = vkResetCommandPool(m_Device.GetLogicalDevice(), m_Pool, flags);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("CommandPool::Reset(): vkResetCommandPool failed ({})", static_cast<int>(result));
            return Core::Err(ToErrorCode(result));
        }

        ++m_ResetCount;
        return Core::Ok();
    }

    Core::Expected<VkCommandBuffer> CommandPool::AllocatePrimary()
    {
        VkCommandBufferAllocateInfo allocInfo{};
        allocInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
        allocInfo.commandPool = m_Pool;
        allocInfo.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
        allocInfo.commandBufferCount = 1;

        VkCommandBuffer cmd = VK_NULL_HANDLE;
        const VkResult result = vkAllocateCommandBuffers(m_Device.GetLogicalDevice(), &allocInfo, &cmd);
        if (result != VK_SUCCESS) return std::unexpected(ToErrorCode(result));
        return cmd;
    }

    void CommandPool::Free(VkCommandBuffer cmd)
    {
        if (cmd) vkFreeCommandBuffers(m_Device.GetLogicalDevice(), m_Pool, 1, &cmd);
    }
}
