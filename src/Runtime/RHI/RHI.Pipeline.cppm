module;
#include "RHI.Vulkan.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

export module RHI:Pipeline;

import :Device;
import :Shader;
import :Types;
import :RenderPass;
import :PipelineLayout;
import Core;

export namespace RHI
{
    enum class BlendState : uint8_t
    {
        Opaque,
        Alpha,
        Additive,
    };

    // Everything a GraphicsMode decides about its pipeline.
    struct GraphicsPipelineDesc
    {
        std::string_view VertexShader;
        std::string_view FragmentShader;
        std::span<const PushConstantRange> PushConstantRanges;
        std::vector<VkDescriptorSetLayoutBinding> DescriptorBindings;
        std::vector<VkVertexInputBindingDescription> VertexBindings;
        std::vector<VkVertexInputAttributeDescription> VertexAttributes;
        VkPrimitiveTopology Topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
        BlendState Blend = BlendState::Opaque;
        bool DepthTest = false;
        bool DepthWrite = false;
    };

    [[nodiscard]] GraphicsPipelineDesc DescribeGraphics(GraphicsMode mode);

    class GraphicsPipeline
    {
    public:
        [[nodiscard]] static Core::Expected<std::unique_ptr<GraphicsPipeline>> Create(
            VulkanDevice& device, ShaderLibrary& shaders, GraphicsMode mode, const Subpass& subpass, uint32_t maxSets);

        ~GraphicsPipeline();

        GraphicsPipeline(const GraphicsPipeline&) = delete;
        GraphicsPipeline& operator=(const GraphicsPipeline&) = delete;

        [[nodiscard]] VkPipeline GetHandle() const { return m_Pipeline; }
        [[nodiscard]] VkPipelineLayout GetLayout() const { return m_Layout->GetHandle(); }
        [[nodiscard]] GraphicsMode GetMode() const { return m_Mode; }
        [[nodiscard]] uint32_t GetSubpassIndex() const { return m_SubpassIndex; }
        [[nodiscard]] uint32_t GetMaxSets() const { return m_Layout->GetMaxSets(); }
        [[nodiscard]] std::span<DescriptorSet> GetDescriptorSets() { return m_Layout->GetDescriptorSets(); }

    private:
        GraphicsPipeline(VulkanDevice& device, GraphicsMode mode, uint32_t subpassIndex, std::unique_ptr<PipelineLayout> layout)
            : m_Device(device), m_Mode(mode), m_SubpassIndex(subpassIndex), m_Layout(std::move(layout))
        {
        }

        VulkanDevice& m_Device;
        GraphicsMode m_Mode;
        uint32_t m_SubpassIndex = 0;
        std::unique_ptr<PipelineLayout> m_Layout;
        VkPipeline m_Pipeline = VK_NULL_HANDLE;
    };
}
