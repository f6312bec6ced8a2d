module;
#include "RHI.Vulkan.hpp"
#include <cstdint>
#include <memory>

export module RHI:Memory;

import :Device;
import Core;

export namespace RHI
{
    // A raw vkAllocateMemory block of one memory type, for callers that sub-allocate themselves.
    class DeviceMemory
    {
    public:
        [[nodiscard]] static Core::Expected<std::unique_ptr<DeviceMemory>> Create(VulkanDevice& device, uint32_t memoryTypeIndex, VkDeviceSize size);

        ~DeviceMemory();

        DeviceMemory(const DeviceMemory&) = delete;
        DeviceMemory& operator=(const DeviceMemory&) = delete;

        [[nodiscard]] VkDeviceMemory GetHandle() const { return m_Memory; }
        [[nodiscard]] uint32_t GetMemoryTypeIndex() const { return m_MemoryTypeIndex; }
        [[nodiscard]] VkDeviceSize GetSize() const { return m_Size; }

    private:
        DeviceMemory(VulkanDevice& device, VkDeviceMemory memory, uint32_t typeIndex, VkDeviceSize size)
            : m_Device(device), m_Memory(memory), m_MemoryTypeIndex(typeIndex), m_Size(size)
        {
        }

        VulkanDevice& m_Device;
        VkDeviceMemory m_Memory = VK_NULL_HANDLE;
        uint32_t m_MemoryTypeIndex = 0;
        VkDeviceSize m_Size = 0;
    };
}
