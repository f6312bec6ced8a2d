module;
#include "RHI.Vulkan.hpp"
#include <algorithm>
#include <cstdint>
#include <memory>
#include <span>
#include <utility>
#include <vector>

module RHI:Descriptors.Impl;
import :Descriptors;
import :Device;
import Core;

namespace RHI
{
    DescriptorPoolState::~DescriptorPoolState()
    {
        if (Pool) vkDestroyDescriptorPool(Device.GetLogicalDevice(), Pool, nullptr);
    }

    std::vector<DescriptorPoolSize> NormalizePoolSizes(std::span<const DescriptorPoolSize> sizes)
    {
        std::vector<DescriptorPoolSize> sorted(sizes.begin(), sizes.end());
        std::ranges::sort(sorted);

        std::vector<DescriptorPoolSize> merged;
        merged.reserve(sorted.size());
        for (const DescriptorPoolSize& size : sorted)
        {
            if (size.DescriptorCount == 0) continue;

            if (!merged.empty() && merged.back().Type == size.Type)
                merged.back().DescriptorCount += size.DescriptorCount;
            else
                merged.push_back(size);
        }
        return merged;
    }

    // --- Descriptor Layout ---

    Core::Expected<std::unique_ptr<DescriptorLayout>> DescriptorLayout::Create(
        VulkanDevice& device, std::span<const VkDescriptorSetLayoutBinding> bindings)
    {
        VkDescriptorSetLayoutCreateInfo layoutInfo{};
        layoutInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
        layoutInfo.bindingCount = static_cast<uint32_t>(bindings.size());
        layoutInfo.pBindings = bindings.data();

        VkDescriptorSetLayout layout = VK_NULL_HANDLE;
        if (VkResult result = vkCreateDescriptorSetLayout(device.GetLogicalDevice(), &layoutInfo, nullptr, &layout); result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create descriptor set layout! Error Code: {}", static_cast<int>(result));
            return std::unexpected(ToErrorCode(result));
        }

        return std::unique_ptr<DescriptorLayout>(new DescriptorLayout(
            device, layout, std::vector<VkDescriptorSetLayoutBinding>(bindings.begin(), bindings.end())));
    }

    DescriptorLayout::~DescriptorLayout()
    {
        if (m_Layout) vkDestroyDescriptorSetLayout(m_Device.GetLogicalDevice(), m_Layout, nullptr);
    }

    std::vector<DescriptorPoolSize> DescriptorLayout::PoolSizesFor(uint32_t sets) const
    {
        std::vector<DescriptorPoolSize> sizes;
        sizes.reserve(m_Bindings.size());
        for (const auto& binding : m_Bindings)
            sizes.push_back({binding.descriptorType, binding.descriptorCount * sets});
        return NormalizePoolSizes(sizes);
    }

    // --- Descriptor Set ---

    DescriptorSet::~DescriptorSet()
    {
        Free();
    }

    DescriptorSet::DescriptorSet(DescriptorSet&& other) noexcept
        : m_Pool(std::move(other.m_Pool)), m_Set(std::exchange(other.m_Set, VK_NULL_HANDLE))
    {
    }

    DescriptorSet& DescriptorSet::operator=(DescriptorSet&& other) noexcept
    {
        if (this != &other)
        {
            Free();
            m_Pool = std::move(other.m_Pool);
            m_Set = std::exchange(other.m_Set, VK_NULL_HANDLE);
        }
        return *this;
    }

    void DescriptorSet::Free() noexcept
    {
        if (m_Set == VK_NULL_HANDLE || !m_Pool) return;

        if (vkFreeDescriptorSets(m_Pool->Device.GetLogicalDevice(), m_Pool->Pool, 1, &m_Set) != VK_SUCCESS)
        {
            Core::Log::Warn("Unable to free descriptor set");
        }
        else if (m_Pool->AllocatedSets > 0)
        {
            --m_Pool->AllocatedSets;
        }

        m_Set = VK_NULL_HANDLE;
        m_Pool.reset();
    }

    void DescriptorSet::WriteBuffer(uint32_t binding, VkDescriptorType type, VkBuffer buffer, VkDeviceSize offset, VkDeviceSize range)
    {
        VkDescriptorBufferInfo bufferInfo{};
        bufferInfo.buffer = buffer;
        bufferInfo.offset = offset;
        bufferInfo.range = range;

        VkWriteDescriptorSet write{};
        write.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        write.dstSet = m_Set;
        write.dstBinding = binding;
        write.descriptorCount = 1;
        write.descriptorType = type;
        write.pBufferInfo = &bufferInfo;

        vkUpdateDescriptorSets(m_Pool->Device.GetLogicalDevice(), 1, &write, 0, nullptr);
    }

    void DescriptorSet::WriteImage(uint32_t binding, VkDescriptorType type, VkImageView view, VkImageLayout layout, VkSampler sampler)
    {
        VkDescriptorImageInfo imageInfo{};
        imageInfo.sampler = sampler;
        imageInfo.imageView = view;
        imageInfo.imageLayout = layout;

        VkWriteDescriptorSet write{};
        write.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        write.dstSet = m_Set;
        write.dstBinding = binding;
        write.descriptorCount = 1;
        write.descriptorType = type;
        write.pImageInfo = &imageInfo;

        vkUpdateDescriptorSets(m_Pool->Device.GetLogicalDevice(), 1, &write, 0, nullptr);
    }

    // --- Descriptor Pool ---

    Core::Expected<std::unique_ptr<DescriptorPool>> DescriptorPool::Create(VulkanDevice& device, const DescriptorPoolInfo& info)
    {
        if (info.MaxSets == 0 || info.PoolSizes.empty())
        {
            Core::Log::Error("DescriptorPool::Create(): MaxSets and PoolSizes must be non-empty");
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        std::vector<VkDescriptorPoolSize> poolSizes;
        poolSizes.reserve(info.PoolSizes.size());
        for (const auto& size : info.PoolSizes)
        {
            VkDescriptorPoolSize vkSize{};
            vkSize.type = size.Type;
            vkSize.descriptorCount = size.DescriptorCount;
            poolSizes.push_back(vkSize);
        }

        VkDescriptorPoolCreateInfo poolInfo{};
        poolInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
        poolInfo.flags = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT;
        poolInfo.maxSets = info.MaxSets;
        poolInfo.poolSizeCount = static_cast<uint32_t>(poolSizes.size());
        poolInfo.pPoolSizes = poolSizes.data();

        VkDescriptorPool pool = VK_NULL_HANDLE;
        if (VkResult result = vkCreateDescriptorPool(device.GetLogicalDevice(), &poolInfo, nullptr, &pool); result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create descriptor pool! Error Code: {}", static_cast<int>(result));
            return std::unexpected(Core::ErrorCode::Unsupported);
        }

        auto state = std::make_shared<DescriptorPoolState>(device, pool, info.MaxSets);
        return std::unique_ptr<DescriptorPool>(new DescriptorPool(std::move(state), info));
    }

    Core::Expected<std::vector<DescriptorSet>> DescriptorPool::AllocateDescriptorSets(const DescriptorLayout& layout, uint32_t count)
    {
        if (count == 0) return std::vector<DescriptorSet>{};

        // Checked on the host so a failed request never reaches the driver.
        if (count > GetAvailableSetCount())
        {
            Core::Log::Debug("DescriptorPool: {} sets requested, {} of {} available", count, GetAvailableSetCount(), m_Info.MaxSets);
            return std::unexpected(Core::ErrorCode::OutOfPoolMemory);
        }

        std::vector<VkDescriptorSetLayout> layouts(count, layout.GetHandle());
        std::vector<VkDescriptorSet> handles(count, VK_NULL_HANDLE);

        VkDescriptorSetAllocateInfo allocInfo{};
        allocInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
        allocInfo.descriptorPool = m_State->Pool;
        allocInfo.descriptorSetCount = count;
        allocInfo.pSetLayouts = layouts.data();

        if (VkResult result = vkAllocateDescriptorSets(m_State->Device.GetLogicalDevice(), &allocInfo, handles.data()); result != VK_SUCCESS)
        {
            Core::Log::Warn("Failed to allocate {} descriptor sets ({})", count, static_cast<int>(result));
            return std::unexpected(ToErrorCode(result));
        }

        m_State->AllocatedSets += count;

        std::vector<DescriptorSet> sets;
        sets.reserve(count);
        for (VkDescriptorSet handle : handles)
            sets.emplace_back(m_State, handle);

        Core::Log::Trace("DescriptorPool: allocated {} sets", count);
        return sets;
    }

    Core::Expected<DescriptorSet> DescriptorPool::AllocateDescriptorSet(const DescriptorLayout& layout)
    {
        auto sets = AllocateDescriptorSets(layout, 1);
        if (!sets) return std::unexpected(sets.error());
        return std::move(sets->front());
    }

    Core::Expected<std::vector<DescriptorSet>> AllocateDescriptorSets(DescriptorPool& pool, const DescriptorLayout& layout, uint32_t count)
    {
        return pool.AllocateDescriptorSets(layout, count);
    }
}
