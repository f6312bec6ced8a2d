module;
#include "RHI.Vulkan.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

export module RHI:PipelineLayout;

import :Device;
import :Descriptors;
import :Types;
import Core;

export namespace RHI
{
    // The binding interface of one pipeline: a single descriptor set layout,
    // a private descriptor pool holding MaxSets sets of it, and the push-constant ranges.
    class PipelineLayout
    {
    public:
        [[nodiscard]] static Core::Expected<std::unique_ptr<PipelineLayout>> Create(
            VulkanDevice& device,
            std::span<const VkDescriptorSetLayoutBinding> bindings,
            std::span<const PushConstantRange> pushConstants,
            uint32_t maxSets);

        ~PipelineLayout();

        PipelineLayout(const PipelineLayout&) = delete;
        PipelineLayout& operator=(const PipelineLayout&) = delete;

        [[nodiscard]] VkPipelineLayout GetHandle() const { return m_Layout; }
        [[nodiscard]] uint32_t GetMaxSets() const { return m_MaxSets; }

        // Empty when the pipeline binds no descriptors.
        [[nodiscard]] std::span<DescriptorSet> GetDescriptorSets() { return m_Sets; }
        [[nodiscard]] const DescriptorLayout* GetDescriptorLayout() const { return m_SetLayout.get(); }

    private:
        PipelineLayout(VulkanDevice& device, uint32_t maxSets) : m_Device(device), m_MaxSets(maxSets) {}

        VulkanDevice& m_Device;
        uint32_t m_MaxSets = 0;
        std::unique_ptr<DescriptorLayout> m_SetLayout;
        std::unique_ptr<DescriptorPool> m_DescriptorPool;
        std::vector<DescriptorSet> m_Sets;
        VkPipelineLayout m_Layout = VK_NULL_HANDLE;
    };

    [[nodiscard]] std::vector<VkPushConstantRange> ToVkPushConstantRanges(std::span<const PushConstantRange> ranges);
}
