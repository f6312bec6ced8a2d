module;
#include "RHI.Vulkan.hpp"
#include <memory>

export module RHI:Fence;

import :Device;
import Core;

export namespace RHI
{
    class Fence
    {
    public:
        // signaled = true means "no pending work", the state a fresh command buffer starts in.
        [[nodiscard]] static Core::Expected<std::unique_ptr<Fence>> Create(VulkanDevice& device, bool signaled);

        ~Fence();

        Fence(const Fence&) = delete;
        Fence& operator=(const Fence&) = delete;

        [[nodiscard]] VkFence GetHandle() const { return m_Fence; }

        // Back to unsignaled.
        [[nodiscard]] Core::Result Reset();

        // Blocks with no timeout.
        [[nodiscard]] Core::Result Wait() const;

        [[nodiscard]] Core::Expected<bool> IsSignaled() const;

    private:
        Fence(VulkanDevice& device, VkFence fence) : m_Device(device), m_Fence(fence) {}

        VulkanDevice& m_Device;
        VkFence m_Fence = VK_NULL_HANDLE;
    };
}
