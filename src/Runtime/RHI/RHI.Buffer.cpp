module;
#include <cstdint>
#include <limits>
#include <memory>
#include "RHI.Vulkan.hpp"

module RHI:Buffer.Impl;
import :Buffer;
import :Device;
import Core;

namespace RHI {

    Core::Expected<std::unique_ptr<VulkanBuffer>> VulkanBuffer::Create(
        VulkanDevice& device, VkDeviceSize capacity, VkBufferUsageFlags usage, VmaMemoryUsage memoryUsage)
    {
        if (capacity == 0)
        {
            Core::Log::Error("VulkanBuffer::Create(): zero-sized buffer requested");
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        // Callers may key on an empty usage; the driver still needs at least one bit.
        const VkBufferUsageFlags effectiveUsage = usage | VK_BUFFER_USAGE_TRANSFER_SRC_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT;

        VkBufferCreateInfo bufferInfo{};
        bufferInfo.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
        bufferInfo.size = capacity;
        bufferInfo.usage = effectiveUsage;
        bufferInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

        VmaAllocationCreateInfo allocInfo{};
        allocInfo.usage = memoryUsage;
        if (memoryUsage == VMA_MEMORY_USAGE_AUTO_PREFER_HOST || memoryUsage == VMA_MEMORY_USAGE_CPU_TO_GPU) {
            allocInfo.flags = VMA_ALLOCATION_CREATE_HOST_ACCESS_RANDOM_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT;
        }

        std::unique_ptr<VulkanBuffer> buffer(new VulkanBuffer(device, capacity, usage));

        VmaAllocationInfo resultInfo{};
        if (VkResult result = vmaCreateBuffer(device.GetAllocator(), &bufferInfo, &allocInfo, &buffer->m_Buffer, &buffer->m_Allocation, &resultInfo); result != VK_SUCCESS) {
            Core::Log::Error("Failed to create buffer! capacity={} Error Code: {}", capacity, static_cast<int>(result));
            buffer->m_Buffer = VK_NULL_HANDLE;
            buffer->m_Allocation = VK_NULL_HANDLE;
            return std::unexpected(ToErrorCode(result));
        }

        buffer->m_MappedData = resultInfo.pMappedData;
        return buffer;
    }

    VulkanBuffer::~VulkanBuffer() {
        if (m_Buffer) vmaDestroyBuffer(m_Device.GetAllocator(), m_Buffer, m_Allocation);
    }

    void VulkanBuffer::Invalidate(size_t offset, size_t size) {
        if (!m_MappedData) return;
        const VkDeviceSize vkSize = (size == std::numeric_limits<size_t>::max()) ? VK_WHOLE_SIZE : size;
        VK_CHECK(vmaInvalidateAllocation(m_Device.GetAllocator(), m_Allocation, offset, vkSize));
    }

    void VulkanBuffer::Flush(size_t offset, size_t size) {
        if (!m_MappedData) return;
        const VkDeviceSize vkSize = (size == std::numeric_limits<size_t>::max()) ? VK_WHOLE_SIZE : size;
        VK_CHECK(vmaFlushAllocation(m_Device.GetAllocator(), m_Allocation, offset, vkSize));
    }
}
