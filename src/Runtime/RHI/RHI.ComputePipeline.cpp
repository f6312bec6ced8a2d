module;
#include "RHI.Vulkan.hpp"
#include <cstdint>
#include <memory>
#include <vector>

module RHI:ComputePipeline.Impl;
import :ComputePipeline;
import :Device;
import :Shader;
import :Types;
import :PipelineLayout;
import Core;

namespace RHI
{
    namespace
    {
        VkDescriptorSetLayoutBinding ComputeBinding(uint32_t binding, VkDescriptorType type)
        {
            VkDescriptorSetLayoutBinding b{};
            b.binding = binding;
            b.descriptorType = type;
            b.descriptorCount = 1;
            b.stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;
            return b;
        }
    }

    ComputePipelineDesc DescribeCompute(ComputeMode mode)
    {
        switch (mode)
        {
            case ComputeMode::CalculateVertexAttributes:
                // Indices, packed positions in, expanded vertices out.
                return ComputePipelineDesc{
                    .Shader = "calc_vertex_attrs.comp",
                    .PushConstantRanges = PushConstants::CalcVertexAttrs,
                    .DescriptorBindings = {
                        ComputeBinding(0, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER),
                        ComputeBinding(1, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER),
                        ComputeBinding(2, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER),
                    },
                };
            case ComputeMode::DecodeRgbRgba:
                // Tightly packed RGB bytes in, RGBA texture out.
                return ComputePipelineDesc{
                    .Shader = "decode_rgb_rgba.comp",
                    .PushConstantRanges = PushConstants::DecodeRgbRgba,
                    .DescriptorBindings = {
                        ComputeBinding(0, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER),
                        ComputeBinding(1, VK_DESCRIPTOR_TYPE_STORAGE_IMAGE),
                    },
                };
        }
        return {};
    }

    Core::Expected<std::unique_ptr<ComputePipeline>> ComputePipeline::Create(
        VulkanDevice& device, ShaderLibrary& shaders, ComputeMode mode, uint32_t maxSets)
    {
        const ComputePipelineDesc desc = DescribeCompute(mode);

        auto shader = shaders.Get(desc.Shader, ShaderStage::Compute);
        if (!shader) return std::unexpected(shader.error());

        auto layout = PipelineLayout::Create(device, desc.DescriptorBindings, desc.PushConstantRanges, maxSets);
        if (!layout) return std::unexpected(layout.error());

        std::unique_ptr<ComputePipeline> pipeline(new ComputePipeline(device, mode, std::move(*layout)));

        VkComputePipelineCreateInfo pipelineInfo{};
        pipelineInfo.sType = VK_STRUCTURE_TYPE_COMPUTE_PIPELINE_CREATE_INFO;
        pipelineInfo.stage = (*shader)->GetStageInfo();
        pipelineInfo.layout = pipeline->m_Layout->GetHandle();

        if (VkResult res = vkCreateComputePipelines(device.GetLogicalDevice(), VK_NULL_HANDLE, 1, &pipelineInfo, nullptr, &pipeline->m_Pipeline); res != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create compute pipeline {}! Error Code: {}", ComputeModeToString(mode), static_cast<int>(res));
            pipeline->m_Pipeline = VK_NULL_HANDLE;
            return std::unexpected(ToErrorCode(res));
        }

        device.SetDebugName(VK_OBJECT_TYPE_PIPELINE, reinterpret_cast<uint64_t>(pipeline->m_Pipeline), ComputeModeToString(mode));
        return pipeline;
    }

    ComputePipeline::~ComputePipeline()
    {
        if (m_Pipeline) vkDestroyPipeline(m_Device.GetLogicalDevice(), m_Pipeline, nullptr);
    }
}
