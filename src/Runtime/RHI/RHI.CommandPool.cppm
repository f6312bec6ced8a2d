module;
#include "RHI.Vulkan.hpp"
#include <cstdint>
#include <memory>

export module RHI:CommandPool;

import :Device;
import Core;

export namespace RHI
{
    // A command pool bound to one queue family. Buffers allocated from it are
    // owned by the pool and recycled by Reset().
    class CommandPool
    {
    public:
        [[nodiscard]] static Core::Expected<std::unique_ptr<CommandPool>> Create(VulkanDevice& device, uint32_t queueFamily);

        ~CommandPool();

        CommandPool(const CommandPool&) = delete;
        CommandPool& operator=(const CommandPool&) = delete;

        [[nodiscard]] VkCommandPool GetHandle() const { return m_Pool; }
        [[nodiscard]] uint32_t GetQueueFamily() const { return m_QueueFamily; }

        // Returns every buffer allocated from this pool to the initial state.
        [[nodiscard]] Core::Result Reset(bool releaseResources = false);

        [[nodiscard]] Core::Expected<VkCommandBuffer> AllocatePrimary();
        void Free(VkCommandBuffer cmd);

        // Number of Reset() calls since creation.
        [[nodiscard]] uint64_t GetResetCount() const { return m_ResetCount; }

    private:
        CommandPool(VulkanDevice& device, VkCommandPool pool, uint32_t family)
            : m_Device(device), m_Pool(pool), m_QueueFamily(family)
        {
        }

        VulkanDevice& m_Device;
        VkCommandPool m_Pool = VK_NULL_HANDLE;
        uint32_t m_QueueFamily = 0;
        uint64_t m_ResetCount = 0;
    };
}
