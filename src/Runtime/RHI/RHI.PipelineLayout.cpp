module;
#include "RHI.Vulkan.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

module RHI:PipelineLayout.Impl;
import :PipelineLayout;
import :Device;
import :Descriptors;
import :Types;
import Core;

namespace RHI
{
    std::vector<VkPushConstantRange> ToVkPushConstantRanges(std::span<const PushConstantRange> ranges)
    {
        std::vector<VkPushConstantRange> result;
        result.reserve(ranges.size());
        for (const PushConstantRange& range : ranges)
        {
            if (range.IsEmpty()) continue;

            VkPushConstantRange vkRange{};
            vkRange.stageFlags = range.Stages;
            vkRange.offset = range.Begin;
            vkRange.size = range.Size();
            result.push_back(vkRange);
        }
        return result;
    }

    Core::Expected<std::unique_ptr<PipelineLayout>> PipelineLayout::Create(
        VulkanDevice& device,
        std::span<const VkDescriptorSetLayoutBinding> bindings,
        std::span<const PushConstantRange> pushConstants,
        uint32_t maxSets)
    {
        std::unique_ptr<PipelineLayout> layout(new PipelineLayout(device, maxSets));

        if (!bindings.empty() && maxSets > 0)
        {
            auto setLayout = DescriptorLayout::Create(device, bindings);
            if (!setLayout) return std::unexpected(setLayout.error());
            layout->m_SetLayout = std::move(*setLayout);

            DescriptorPoolInfo poolInfo{};
            poolInfo.MaxSets = maxSets;
            poolInfo.PoolSizes = layout->m_SetLayout->PoolSizesFor(maxSets);

            auto pool = DescriptorPool::Create(device, poolInfo);
            if (!pool) return std::unexpected(pool.error());
            layout->m_DescriptorPool = std::move(*pool);

            auto sets = layout->m_DescriptorPool->AllocateDescriptorSets(*layout->m_SetLayout, maxSets);
            if (!sets) return std::unexpected(sets.error());
            layout->m_Sets = std::move(*sets);
        }

        const std::vector<VkPushConstantRange> ranges = ToVkPushConstantRanges(pushConstants);
        VkDescriptorSetLayout setLayoutHandle = layout->m_SetLayout ? layout->m_SetLayout->GetHandle() : VK_NULL_HANDLE;

        VkPipelineLayoutCreateInfo pipelineLayoutInfo{};
        pipelineLayoutInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
        pipelineLayoutInfo.setLayoutCount = layout->m_SetLayout ? 1u : 0u;
        pipelineLayoutInfo.pSetLayouts = layout->m_SetLayout ? &setLayoutHandle : nullptr;
        pipelineLayoutInfo.pushConstantRangeCount = static_cast<uint32_t>(ranges.size());
        pipelineLayoutInfo.pPushConstantRanges = ranges.data();

        if (VkResult result = vkCreatePipelineLayout(device.GetLogicalDevice(), &pipelineLayoutInfo, nullptr, &layout->m_Layout); result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create pipeline layout! Error Code: {}", static_cast<int>(result));
            layout->m_Layout = VK_NULL_HANDLE;
            return std::unexpected(ToErrorCode(result));
        }

        return layout;
    }

    PipelineLayout::~PipelineLayout()
    {
        if (m_Layout) vkDestroyPipelineLayout(m_Device.GetLogicalDevice(), m_Layout, nullptr);
    }
}
