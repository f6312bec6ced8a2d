module;
#include "RHI.Vulkan.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

export module RHI:ComputePipeline;

import :Device;
import :Shader;
import :Types;
import :PipelineLayout;
import Core;

export namespace RHI
{
    struct ComputePipelineDesc
    {
        std::string_view Shader;
        std::span<const PushConstantRange> PushConstantRanges;
        std::vector<VkDescriptorSetLayoutBinding> DescriptorBindings;
    };

    [[nodiscard]] ComputePipelineDesc DescribeCompute(ComputeMode mode);

    class ComputePipeline
    {
    public:
        [[nodiscard]] static Core::Expected<std::unique_ptr<ComputePipeline>> Create(
            VulkanDevice& device, ShaderLibrary& shaders, ComputeMode mode, uint32_t maxSets);

        ~ComputePipeline();

        ComputePipeline(const ComputePipeline&) = delete;
        ComputePipeline& operator=(const ComputePipeline&) = delete;

        [[nodiscard]] VkPipeline GetHandle() const { return m_Pipeline; }
        [[nodiscard]] VkPipelineLayout GetLayout() const { return m_Layout->GetHandle(); }
        [[nodiscard]] ComputeMode GetMode() const { return m_Mode; }
        [[nodiscard]] uint32_t GetMaxSets() const { return m_Layout->GetMaxSets(); }
        [[nodiscard]] std::span<DescriptorSet> GetDescriptorSets() { return m_Layout->GetDescriptorSets(); }

    private:
        ComputePipeline(VulkanDevice& device, ComputeMode mode, std::unique_ptr<PipelineLayout> layout)
            : m_Device(device), m_Mode(mode), m_Layout(std::move(layout))
        {
        }

        VulkanDevice& m_Device;
        ComputeMode m_Mode;
        std::unique_ptr<PipelineLayout> m_Layout;
        VkPipeline m_Pipeline = VK_NULL_HANDLE;
    };
}
