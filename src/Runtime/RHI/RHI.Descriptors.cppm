module;
#include "RHI.Vulkan.hpp"
#include <compare>
#include <cstdint>
#include <memory>
#include <span>
#include <utility>
#include <vector>

export module RHI:Descriptors;

import :Device;
import Core;

namespace RHI
{
    // Native pool shared by a DescriptorPool and every set allocated from it.
    // Destroyed when the last of them goes away.
    struct DescriptorPoolState
    {
        DescriptorPoolState(VulkanDevice& device, VkDescriptorPool pool, uint32_t maxSets)
            : Device(device), Pool(pool), MaxSets(maxSets)
        {
        }

        ~DescriptorPoolState();

        DescriptorPoolState(const DescriptorPoolState&) = delete;
        DescriptorPoolState& operator=(const DescriptorPoolState&) = delete;

        VulkanDevice& Device;
        VkDescriptorPool Pool = VK_NULL_HANDLE;
        uint32_t MaxSets = 0;
        uint32_t AllocatedSets = 0;
    };
}

export namespace RHI
{
    struct DescriptorPoolSize
    {
        VkDescriptorType Type = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
        uint32_t DescriptorCount = 0;

        auto operator<=>(const DescriptorPoolSize&) const = default;
    };

    struct DescriptorPoolInfo
    {
        uint32_t MaxSets = 1;
        std::vector<DescriptorPoolSize> PoolSizes;

        bool operator==(const DescriptorPoolInfo&) const = default;
    };

    // Sorted by type, one entry per type (counts summed), zero counts removed.
    // Two lists describing the same capacity normalize to the same value.
    [[nodiscard]] std::vector<DescriptorPoolSize> NormalizePoolSizes(std::span<const DescriptorPoolSize> sizes);

    class DescriptorLayout
    {
    public:
        [[nodiscard]] static Core::Expected<std::unique_ptr<DescriptorLayout>> Create(
            VulkanDevice& device, std::span<const VkDescriptorSetLayoutBinding> bindings);

        ~DescriptorLayout();

        DescriptorLayout(const DescriptorLayout&) = delete;
        DescriptorLayout& operator=(const DescriptorLayout&) = delete;

        [[nodiscard]] VkDescriptorSetLayout GetHandle() const { return m_Layout; }
        [[nodiscard]] const std::vector<VkDescriptorSetLayoutBinding>& GetBindings() const { return m_Bindings; }

        // Pool sizes needed to allocate `sets` sets of this layout.
        [[nodiscard]] std::vector<DescriptorPoolSize> PoolSizesFor(uint32_t sets) const;

    private:
        DescriptorLayout(VulkanDevice& device, VkDescriptorSetLayout layout, std::vector<VkDescriptorSetLayoutBinding> bindings)
            : m_Device(device), m_Layout(layout), m_Bindings(std::move(bindings))
        {
        }

        VulkanDevice& m_Device;
        VkDescriptorSetLayout m_Layout = VK_NULL_HANDLE;
        std::vector<VkDescriptorSetLayoutBinding> m_Bindings;
    };

    // A set frees itself from its pool on destruction.
    class DescriptorSet
    {
    public:
        DescriptorSet(std::shared_ptr<DescriptorPoolState> pool, VkDescriptorSet set) noexcept
            : m_Pool(std::move(pool)), m_Set(set)
        {
        }

        ~DescriptorSet();

        DescriptorSet(const DescriptorSet&) = delete;
        DescriptorSet& operator=(const DescriptorSet&) = delete;

        DescriptorSet(DescriptorSet&& other) noexcept;
        DescriptorSet& operator=(DescriptorSet&& other) noexcept;

        [[nodiscard]] VkDescriptorSet GetHandle() const { return m_Set; }

        void WriteBuffer(uint32_t binding, VkDescriptorType type, VkBuffer buffer, VkDeviceSize offset, VkDeviceSize range);
        void WriteImage(uint32_t binding, VkDescriptorType type, VkImageView view, VkImageLayout layout, VkSampler sampler = VK_NULL_HANDLE);

    private:
        void Free() noexcept;

        std::shared_ptr<DescriptorPoolState> m_Pool;
        VkDescriptorSet m_Set = VK_NULL_HANDLE;
    };

    // -------------------------------------------------------------------------
    // DescriptorPool - fixed-capacity allocator for descriptor sets
    // -------------------------------------------------------------------------
    // Capacity is MaxSets sets. Allocating past it fails with
    // ErrorCode::OutOfPoolMemory and leaves the pool as it was.
    // The object itself is uniquely owned so it can be leased; sets share its
    // native state, so destroying the DescriptorPool while sets are alive is safe.
    // -------------------------------------------------------------------------
    class DescriptorPool
    {
    public:
        [[nodiscard]] static Core::Expected<std::unique_ptr<DescriptorPool>> Create(VulkanDevice& device, const DescriptorPoolInfo& info);

        DescriptorPool(const DescriptorPool&) = delete;
        DescriptorPool& operator=(const DescriptorPool&) = delete;

        [[nodiscard]] VkDescriptorPool GetHandle() const { return m_State->Pool; }
        [[nodiscard]] const DescriptorPoolInfo& GetInfo() const { return m_Info; }
        [[nodiscard]] uint32_t GetMaxSets() const { return m_Info.MaxSets; }
        [[nodiscard]] uint32_t GetAllocatedSetCount() const { return m_State->AllocatedSets; }
        [[nodiscard]] uint32_t GetAvailableSetCount() const { return m_Info.MaxSets - m_State->AllocatedSets; }

        [[nodiscard]] Core::Expected<std::vector<DescriptorSet>> AllocateDescriptorSets(const DescriptorLayout& layout, uint32_t count);
        [[nodiscard]] Core::Expected<DescriptorSet> AllocateDescriptorSet(const DescriptorLayout& layout);

    private:
        DescriptorPool(std::shared_ptr<DescriptorPoolState> state, DescriptorPoolInfo info)
            : m_State(std::move(state)), m_Info(std::move(info))
        {
        }

        std::shared_ptr<DescriptorPoolState> m_State;
        DescriptorPoolInfo m_Info;
    };

    [[nodiscard]] Core::Expected<std::vector<DescriptorSet>> AllocateDescriptorSets(DescriptorPool& pool, const DescriptorLayout& layout, uint32_t count);
}
