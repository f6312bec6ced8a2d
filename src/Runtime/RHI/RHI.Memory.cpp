module;
#include "RHI.Vulkan.hpp"
#include <cstdint>
#include <memory>

module RHI:Memory.Impl;
import :Memory;
import :Device;
import Core;

namespace RHI
{
    Core::Expected<std::unique_ptr<DeviceMemory>> DeviceMemory::Create(VulkanDevice& device, uint32_t memoryTypeIndex, VkDeviceSize size)
    {
        if (size == 0)
            return std::unexpected(Core::ErrorCode::InvalidArgument);

        VkMemoryAllocateInfo allocInfo{};
        allocInfo.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
        allocInfo.allocationSize = size;
        allocInfo.memoryTypeIndex = memoryTypeIndex;

        VkDeviceMemory memory = VK_NULL_HANDLE;
        const VkResult res = vkAllocateMemory(device.GetLogicalDevice(), &allocInfo, nullptr, &memory);
        if (res != VK_SUCCESS)
        {
            Core::Log::Error("DeviceMemory: vkAllocateMemory failed (size={} bytes, typeIndex={}, res={})",
                             static_cast<uint64_t>(size), memoryTypeIndex, static_cast<int>(res));
            return std::unexpected(ToErrorCode(res));
        }

        return std::unique_ptr<DeviceMemory>(new DeviceMemory(device, memory, memoryTypeIndex, size));
    }

    DeviceMemory::~DeviceMemory()
    {
        if (m_Memory) vkFreeMemory(m_Device.GetLogicalDevice(), m_Memory, nullptr);
    }
}
