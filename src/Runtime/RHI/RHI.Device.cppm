module;
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>
#include "RHI.Vulkan.hpp"

export module RHI:Device;

import :Context;
import Core;

export namespace RHI
{
    struct QueueFamilyIndices
    {
        std::optional<uint32_t> GraphicsFamily;
        std::optional<uint32_t> ComputeFamily;  // Dedicated if the device has one, else the graphics family.
        std::optional<uint32_t> TransferFamily; // Dedicated if the device has one, else the compute family.

        [[nodiscard]] bool IsComplete() const
        {
            return GraphicsFamily.has_value() && ComputeFamily.has_value() && TransferFamily.has_value();
        }
    };

    // Driver results -> engine error codes. VK_SUCCESS has no mapping; do not pass it.
    [[nodiscard]] Core::ErrorCode ToErrorCode(VkResult result);

    class VulkanDevice
    {
    public:
        explicit VulkanDevice(VulkanContext& context);
        ~VulkanDevice();

        // No copy
        VulkanDevice(const VulkanDevice&) = delete;
        VulkanDevice& operator=(const VulkanDevice&) = delete;

        [[nodiscard]] VkDevice GetLogicalDevice() const { return m_Device; }
        [[nodiscard]] VkPhysicalDevice GetPhysicalDevice() const { return m_PhysicalDevice; }
        [[nodiscard]] VmaAllocator GetAllocator() const { return m_Allocator; }
        [[nodiscard]] QueueFamilyIndices GetQueueIndices() const { return m_Indices; }
        [[nodiscard]] const VkPhysicalDeviceProperties& GetProperties() const { return m_Properties; }
        [[nodiscard]] bool IsValid() const { return m_IsValid; }

        // VK_NULL_HANDLE for families no queue was created on.
        [[nodiscard]] VkQueue GetQueue(uint32_t family) const;

        // Queue access is externally synchronized in Vulkan; all submissions go through here.
        [[nodiscard]] VkResult Submit(uint32_t family, const VkSubmitInfo& submitInfo, VkFence fence);

        // Non-blocking. true = signaled.
        [[nodiscard]] Core::Expected<bool> GetFenceStatus(VkFence fence) const;
        // Blocks with no timeout.
        [[nodiscard]] Core::Result WaitForFence(VkFence fence) const;

        [[nodiscard]] std::optional<uint32_t> FindMemoryType(uint32_t typeBits, VkMemoryPropertyFlags properties) const;

        // Graphics or compute family with valid timestamp bits.
        [[nodiscard]] bool SupportsTimestamps(uint32_t family) const;
        [[nodiscard]] float GetTimestampPeriod() const { return m_Properties.limits.timestampPeriod; }

        // No-op without VK_EXT_debug_utils.
        void SetDebugName(VkObjectType type, uint64_t handle, std::string_view name) const;

        void WaitIdle() const;

    private:
        VkPhysicalDevice m_PhysicalDevice = VK_NULL_HANDLE;
        VkDevice m_Device = VK_NULL_HANDLE;
        VmaAllocator m_Allocator = VK_NULL_HANDLE;

        QueueFamilyIndices m_Indices;
        std::vector<VkQueueFamilyProperties> m_FamilyProperties;
        std::vector<VkQueue> m_Queues; // Indexed by family.
        VkPhysicalDeviceProperties m_Properties{};
        VkPhysicalDeviceMemoryProperties m_MemoryProperties{};

        std::mutex m_QueueMutex;
        bool m_DebugUtils = false;
        bool m_IsValid = true;

        void PickPhysicalDevice(VkInstance instance);
        void CreateLogicalDevice(VulkanContext& context);

        [[nodiscard]] static QueueFamilyIndices FindQueueFamilies(const std::vector<VkQueueFamilyProperties>& families);
    };
}
