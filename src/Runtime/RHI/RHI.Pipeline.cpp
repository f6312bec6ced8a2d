module;
#include "RHI.Vulkan.hpp"
#include <array>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

module RHI:Pipeline.Impl;
import :Pipeline;
import :Device;
import :Shader;
import :Types;
import :RenderPass;
import :PipelineLayout;
import Core;

namespace RHI
{
    namespace
    {
        struct VertexAttr
        {
            VkFormat Format;
            uint32_t Size;
        };

        // One interleaved vertex buffer at binding 0, locations in declaration order.
        void SetInterleaved(GraphicsPipelineDesc& desc, std::initializer_list<VertexAttr> attrs)
        {
            uint32_t offset = 0;
            uint32_t location = 0;
            for (const VertexAttr& attr : attrs)
            {
                VkVertexInputAttributeDescription a{};
                a.binding = 0;
                a.location = location++;
                a.format = attr.Format;
                a.offset = offset;
                desc.VertexAttributes.push_back(a);
                offset += attr.Size;
            }

            VkVertexInputBindingDescription b{};
            b.binding = 0;
            b.stride = offset;
            b.inputRate = VK_VERTEX_INPUT_RATE_VERTEX;
            desc.VertexBindings.push_back(b);
        }

        VkDescriptorSetLayoutBinding Binding(uint32_t binding, VkDescriptorType type, VkShaderStageFlags stages)
        {
            VkDescriptorSetLayoutBinding b{};
            b.binding = binding;
            b.descriptorType = type;
            b.descriptorCount = 1;
            b.stageFlags = stages;
            return b;
        }

        constexpr VertexAttr Vec2{VK_FORMAT_R32G32_SFLOAT, 8};
        constexpr VertexAttr Vec3{VK_FORMAT_R32G32B32_SFLOAT, 12};
        constexpr VertexAttr Vec4{VK_FORMAT_R32G32B32A32_SFLOAT, 16};

        GraphicsPipelineDesc DescribeLight(std::string_view fragmentShader)
        {
            GraphicsPipelineDesc desc{};
            desc.VertexShader = "light_volume.vert";
            desc.FragmentShader = fragmentShader;
            desc.PushConstantRanges = PushConstants::DrawLight;
            desc.DescriptorBindings = {
                Binding(0, VK_DESCRIPTOR_TYPE_INPUT_ATTACHMENT, VK_SHADER_STAGE_FRAGMENT_BIT),
                Binding(1, VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, VK_SHADER_STAGE_FRAGMENT_BIT),
            };
            SetInterleaved(desc, {Vec3});
            desc.Blend = BlendState::Additive;
            return desc;
        }

        GraphicsPipelineDesc DescribeGradient(BlendState blend)
        {
            GraphicsPipelineDesc desc{};
            desc.VertexShader = "gradient.vert";
            desc.FragmentShader = "gradient.frag";
            desc.PushConstantRanges = PushConstants::VertexMat4;
            SetInterleaved(desc, {Vec2, Vec4});
            desc.Blend = blend;
            return desc;
        }

        VkPipelineColorBlendAttachmentState MakeBlendAttachment(BlendState blend)
        {
            VkPipelineColorBlendAttachmentState state{};
            state.colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT |
                VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;

            switch (blend)
            {
                case BlendState::Opaque:
                    state.blendEnable = VK_FALSE;
                    break;
                case BlendState::Alpha:
                    state.blendEnable = VK_TRUE;
                    state.srcColorBlendFactor = VK_BLEND_FACTOR_SRC_ALPHA;
                    state.dstColorBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
                    state.colorBlendOp = VK_BLEND_OP_ADD;
                    state.srcAlphaBlendFactor = VK_BLEND_FACTOR_ONE;
                    state.dstAlphaBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
                    state.alphaBlendOp = VK_BLEND_OP_ADD;
                    break;
                case BlendState::Additive:
                    state.blendEnable = VK_TRUE;
                    state.srcColorBlendFactor = VK_BLEND_FACTOR_ONE;
                    state.dstColorBlendFactor = VK_BLEND_FACTOR_ONE;
                    state.colorBlendOp = VK_BLEND_OP_ADD;
                    state.srcAlphaBlendFactor = VK_BLEND_FACTOR_ONE;
                    state.dstAlphaBlendFactor = VK_BLEND_FACTOR_ONE;
                    state.alphaBlendOp = VK_BLEND_OP_ADD;
                    break;
            }
            return state;
        }
    }

    GraphicsPipelineDesc DescribeGraphics(GraphicsMode mode)
    {
        GraphicsPipelineDesc desc{};

        switch (mode)
        {
            case GraphicsMode::BlendNormal:
                // Composites a source texture over a destination texture.
                desc.VertexShader = "blend.vert";
                desc.FragmentShader = "blend_normal.frag";
                desc.PushConstantRanges = PushConstants::Blend;
                desc.DescriptorBindings = {
                    Binding(0, VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, VK_SHADER_STAGE_FRAGMENT_BIT),
                    Binding(1, VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, VK_SHADER_STAGE_FRAGMENT_BIT),
                };
                SetInterleaved(desc, {Vec2});
                return desc;

            case GraphicsMode::DrawLine:
                desc.VertexShader = "line.vert";
                desc.FragmentShader = "line.frag";
                desc.PushConstantRanges = PushConstants::VertexMat4;
                SetInterleaved(desc, {Vec3, Vec4});
                desc.Topology = VK_PRIMITIVE_TOPOLOGY_LINE_LIST;
                desc.Blend = BlendState::Alpha;
                desc.DepthTest = true;
                return desc;

            case GraphicsMode::DrawMesh:
                desc.VertexShader = "mesh.vert";
                desc.FragmentShader = "mesh.frag";
                desc.PushConstantRanges = PushConstants::VertexMat4;
                desc.DescriptorBindings = {
                    Binding(0, VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, VK_SHADER_STAGE_FRAGMENT_BIT),
                };
                SetInterleaved(desc, {Vec3, Vec3, Vec2});
                desc.DepthTest = true;
                desc.DepthWrite = true;
                return desc;

            case GraphicsMode::DrawPointLight:
                return DescribeLight("point_light.frag");
            case GraphicsMode::DrawRectLight:
                return DescribeLight("rect_light.frag");
            case GraphicsMode::DrawSpotlight:
                return DescribeLight("spotlight.frag");

            case GraphicsMode::DrawSunlight:
                // Fullscreen triangle generated in the vertex shader.
                desc = DescribeLight("sunlight.frag");
                desc.VertexShader = "fullscreen.vert";
                desc.VertexBindings.clear();
                desc.VertexAttributes.clear();
                return desc;

            case GraphicsMode::Font:
            case GraphicsMode::FontOutline:
                desc.VertexShader = "font.vert";
                desc.FragmentShader = (mode == GraphicsMode::Font) ? "font.frag" : "font_outline.frag";
                desc.PushConstantRanges = (mode == GraphicsMode::Font)
                    ? std::span<const PushConstantRange>(PushConstants::Font)
                    : std::span<const PushConstantRange>(PushConstants::FontOutline);
                desc.DescriptorBindings = {
                    Binding(0, VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, VK_SHADER_STAGE_FRAGMENT_BIT),
                };
                SetInterleaved(desc, {Vec2, Vec2});
                desc.Blend = BlendState::Alpha;
                return desc;

            case GraphicsMode::Gradient:
                return DescribeGradient(BlendState::Opaque);
            case GraphicsMode::GradientTransparency:
                return DescribeGradient(BlendState::Alpha);

            case GraphicsMode::Texture:
                desc.VertexShader = "texture.vert";
                desc.FragmentShader = "texture.frag";
                desc.PushConstantRanges = PushConstants::Texture;
                desc.DescriptorBindings = {
                    Binding(0, VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, VK_SHADER_STAGE_FRAGMENT_BIT),
                };
                SetInterleaved(desc, {Vec2, Vec2});
                desc.Blend = BlendState::Alpha;
                return desc;
        }
        return desc;
    }

    Core::Expected<std::unique_ptr<GraphicsPipeline>> GraphicsPipeline::Create(
        VulkanDevice& device, ShaderLibrary& shaders, GraphicsMode mode, const Subpass& subpass, uint32_t maxSets)
    {
        const GraphicsPipelineDesc desc = DescribeGraphics(mode);

        // 1. Shaders
        auto vertex = shaders.Get(desc.VertexShader, ShaderStage::Vertex);
        if (!vertex) return std::unexpected(vertex.error());
        auto fragment = shaders.Get(desc.FragmentShader, ShaderStage::Fragment);
        if (!fragment) return std::unexpected(fragment.error());

        const std::array<VkPipelineShaderStageCreateInfo, 2> shaderStages = {
            (*vertex)->GetStageInfo(),
            (*fragment)->GetStageInfo()
        };

        auto layout = PipelineLayout::Create(device, desc.DescriptorBindings, desc.PushConstantRanges, maxSets);
        if (!layout) return std::unexpected(layout.error());

        std::unique_ptr<GraphicsPipeline> pipeline(new GraphicsPipeline(device, mode, subpass.Index, std::move(*layout)));

        // 2. Vertex Input
        VkPipelineVertexInputStateCreateInfo vertexInputInfo{};
        vertexInputInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
        vertexInputInfo.vertexBindingDescriptionCount = static_cast<uint32_t>(desc.VertexBindings.size());
        vertexInputInfo.pVertexBindingDescriptions = desc.VertexBindings.data();
        vertexInputInfo.vertexAttributeDescriptionCount = static_cast<uint32_t>(desc.VertexAttributes.size());
        vertexInputInfo.pVertexAttributeDescriptions = desc.VertexAttributes.data();

        // 3. Input Assembly
        VkPipelineInputAssemblyStateCreateInfo inputAssembly{};
        inputAssembly.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
        inputAssembly.topology = desc.Topology;
        inputAssembly.primitiveRestartEnable = VK_FALSE;

        // 4. Viewport & Scissor (Dynamic State)
        VkPipelineViewportStateCreateInfo viewportState{};
        viewportState.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
        viewportState.viewportCount = 1;
        viewportState.scissorCount = 1;

        // 5. Rasterizer
        VkPipelineRasterizationStateCreateInfo rasterizer{};
        rasterizer.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
        rasterizer.depthClampEnable = VK_FALSE;
        rasterizer.rasterizerDiscardEnable = VK_FALSE;
        rasterizer.polygonMode = VK_POLYGON_MODE_FILL;
        rasterizer.lineWidth = 1.0f;
        rasterizer.cullMode = (mode == GraphicsMode::DrawMesh) ? VK_CULL_MODE_BACK_BIT : VK_CULL_MODE_NONE;
        rasterizer.frontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE;

        // 6. Multisampling
        VkPipelineMultisampleStateCreateInfo multisampling{};
        multisampling.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
        multisampling.sampleShadingEnable = VK_FALSE;
        multisampling.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

        // 7. Color Blending
        const VkPipelineColorBlendAttachmentState colorBlendAttachment = MakeBlendAttachment(desc.Blend);

        VkPipelineColorBlendStateCreateInfo colorBlending{};
        colorBlending.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
        colorBlending.logicOpEnable = VK_FALSE;
        colorBlending.attachmentCount = 1;
        colorBlending.pAttachments = &colorBlendAttachment;

        // 8. Dynamic States
        const std::array<VkDynamicState, 2> dynamicStates = {
            VK_DYNAMIC_STATE_VIEWPORT,
            VK_DYNAMIC_STATE_SCISSOR
        };
        VkPipelineDynamicStateCreateInfo dynamicState{};
        dynamicState.sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
        dynamicState.dynamicStateCount = static_cast<uint32_t>(dynamicStates.size());
        dynamicState.pDynamicStates = dynamicStates.data();

        // 9. Depth (only meaningful when the subpass has a depth attachment)
        VkPipelineDepthStencilStateCreateInfo depthStencil{};
        depthStencil.sType = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO;
        depthStencil.depthTestEnable = (desc.DepthTest && subpass.HasDepth) ? VK_TRUE : VK_FALSE;
        depthStencil.depthWriteEnable = (desc.DepthWrite && subpass.HasDepth) ? VK_TRUE : VK_FALSE;
        depthStencil.depthCompareOp = VK_COMPARE_OP_LESS;
        depthStencil.depthBoundsTestEnable = VK_FALSE;
        depthStencil.stencilTestEnable = VK_FALSE;

        // 10. Create
        VkGraphicsPipelineCreateInfo pipelineInfo{};
        pipelineInfo.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
        pipelineInfo.stageCount = static_cast<uint32_t>(shaderStages.size());
        pipelineInfo.pStages = shaderStages.data();
        pipelineInfo.pVertexInputState = &vertexInputInfo;
        pipelineInfo.pInputAssemblyState = &inputAssembly;
        pipelineInfo.pViewportState = &viewportState;
        pipelineInfo.pRasterizationState = &rasterizer;
        pipelineInfo.pMultisampleState = &multisampling;
        pipelineInfo.pColorBlendState = &colorBlending;
        pipelineInfo.pDynamicState = &dynamicState;
        pipelineInfo.pDepthStencilState = &depthStencil;
        pipelineInfo.layout = pipeline->m_Layout->GetHandle();
        pipelineInfo.renderPass = subpass.RenderPass;
        pipelineInfo.subpass = subpass.Index;

        if (VkResult res = vkCreateGraphicsPipelines(device.GetLogicalDevice(), VK_NULL_HANDLE, 1, &pipelineInfo, nullptr, &pipeline->m_Pipeline);
            res != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create graphics pipeline {}! Error Code: {}", GraphicsModeToString(mode), static_cast<int>(res));
            pipeline->m_Pipeline = VK_NULL_HANDLE;
            return std::unexpected(ToErrorCode(res));
        }

        device.SetDebugName(VK_OBJECT_TYPE_PIPELINE, reinterpret_cast<uint64_t>(pipeline->m_Pipeline), GraphicsModeToString(mode));
        return pipeline;
    }

    GraphicsPipeline::~GraphicsPipeline()
    {
        if (m_Pipeline) vkDestroyPipeline(m_Device.GetLogicalDevice(), m_Pipeline, nullptr);
    }
}
