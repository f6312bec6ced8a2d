module;
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include "RHI.Vulkan.hpp"

export module RHI:Buffer;

import :Device;
import Core;

export namespace RHI {
    // A VMA-backed buffer. Host-visible buffers are persistently mapped at creation.
    class VulkanBuffer {
    public:
        // usage: VertexBuffer, IndexBuffer, TransferSrc, etc. Transfer src/dst are always added.
        // memoryUsage: AUTO_PREFER_HOST (CPU writable, mapped) or AUTO_PREFER_DEVICE (GPU only).
        [[nodiscard]] static Core::Expected<std::unique_ptr<VulkanBuffer>> Create(
            VulkanDevice& device, VkDeviceSize capacity, VkBufferUsageFlags usage,
            VmaMemoryUsage memoryUsage = VMA_MEMORY_USAGE_AUTO_PREFER_HOST);

        ~VulkanBuffer();

        // Disable copy
        VulkanBuffer(const VulkanBuffer&) = delete;
        VulkanBuffer& operator=(const VulkanBuffer&) = delete;

        [[nodiscard]] VkBuffer GetHandle() const { return m_Buffer; }
        [[nodiscard]] VkDeviceSize GetCapacity() const { return m_Capacity; }
        [[nodiscard]] VkBufferUsageFlags GetUsage() const { return m_Usage; }
        [[nodiscard]] bool IsHostVisible() const { return m_MappedData != nullptr; }

        // nullptr if memory is GPU-only. Valid until destruction.
        [[nodiscard]] void* GetMappedData() const { return m_MappedData; }

        void Write(const void* data, size_t size, size_t offset = 0)
        {
            if (!data || size == 0) return;
            if (size > m_Capacity || offset > m_Capacity - size)
            {
                Core::Log::Error("VulkanBuffer::Write(): Out of bounds. size={} offset={} cap={}", size, offset, m_Capacity);
                return;
            }

            if (!m_MappedData)
            {
                Core::Log::Error("VulkanBuffer::Write(): buffer={} is not host-visible (GPU-only). size={} offset={} cap={}",
                                 static_cast<void*>(m_Buffer), size, offset, m_Capacity);
                return;
            }

            std::memcpy(static_cast<uint8_t*>(m_MappedData) + offset, data, size);

            // Flush host writes. Safe for coherent memory too (no-op in driver/VMA).
            Flush(offset, size);
        }

        // Helper to read data from a mapped buffer (GPU->CPU).
        template<typename T>
        void Read(T* outData, size_t count = 1, size_t byteOffset = 0)
        {
            if (!outData || count == 0) return;

            if (count > m_Capacity / sizeof(T))
            {
                Core::Log::Error("VulkanBuffer::Read(): Out of bounds. count={} cap={}", count, m_Capacity);
                return;
            }

            const size_t byteSize = count * sizeof(T);
            if (byteOffset > m_Capacity - byteSize)
            {
                Core::Log::Error("VulkanBuffer::Read(): Out of bounds. size={} offset={} cap={}", byteSize, byteOffset, m_Capacity);
                return;
            }

            if (!m_MappedData) return;

            // Invalidate CPU cache to see GPU writes (if non-coherent).
            Invalidate(byteOffset, byteSize);
            std::memcpy(outData, static_cast<uint8_t*>(m_MappedData) + byteOffset, byteSize);
        }

        // Explicit cache management for host-visible memory.
        void Invalidate(size_t offset = 0, size_t size = std::numeric_limits<size_t>::max());
        void Flush(size_t offset = 0, size_t size = std::numeric_limits<size_t>::max());

    private:
        VulkanBuffer(VulkanDevice& device, VkDeviceSize capacity, VkBufferUsageFlags usage)
            : m_Device(device), m_Capacity(capacity), m_Usage(usage)
        {
        }

        VulkanDevice& m_Device;
        VkBuffer m_Buffer = VK_NULL_HANDLE;
        VmaAllocation m_Allocation = VK_NULL_HANDLE;

        // The persistent pointer. nullptr if memory is GPU-only.
        void* m_MappedData = nullptr;

        VkDeviceSize m_Capacity = 0;
        VkBufferUsageFlags m_Usage = 0;
    };
}
