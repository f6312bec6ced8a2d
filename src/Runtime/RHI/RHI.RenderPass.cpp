module;
#include "RHI.Vulkan.hpp"
#include <array>
#include <cassert>
#include <cstdint>
#include <memory>
#include <type_traits>
#include <variant>

module RHI:RenderPass.Impl;
import :RenderPass;
import :Device;
import Core;

namespace RHI
{
    namespace
    {
        Core::Expected<VkRenderPass> CreateVkRenderPass(VulkanDevice& device, const VkRenderPassCreateInfo& info)
        {
            VkRenderPass renderPass = VK_NULL_HANDLE;
            if (VkResult result = vkCreateRenderPass(device.GetLogicalDevice(), &info, nullptr, &renderPass); result != VK_SUCCESS)
            {
                Core::Log::Error("Failed to create render pass! Error Code: {}", static_cast<int>(result));
                return std::unexpected(ToErrorCode(result));
            }
            return renderPass;
        }
    }

    RenderPass::~RenderPass()
    {
        if (m_RenderPass) vkDestroyRenderPass(m_Device.GetLogicalDevice(), m_RenderPass, nullptr);
    }

    Subpass RenderPass::GetSubpass(uint32_t index) const
    {
        assert(index < m_SubpassCount && "RenderPass::GetSubpass(): index out of range");
        return Subpass{m_RenderPass, index, (m_DepthSubpassMask & (1u << index)) != 0};
    }

    Core::Expected<std::unique_ptr<RenderPass>> BuildColorRenderPass(VulkanDevice& device, const ColorRenderPassMode& mode)
    {
        VkAttachmentDescription color{};
        color.format = mode.Format;
        color.samples = VK_SAMPLE_COUNT_1_BIT;
        color.loadOp = mode.PreserveContents ? VK_ATTACHMENT_LOAD_OP_LOAD : VK_ATTACHMENT_LOAD_OP_CLEAR;
        color.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
        color.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
        color.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
        color.initialLayout = mode.PreserveContents ? VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL : VK_IMAGE_LAYOUT_UNDEFINED;
        color.finalLayout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;

        VkAttachmentReference colorRef{};
        colorRef.attachment = 0;
        colorRef.layout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;

        VkSubpassDescription subpass{};
        subpass.pipelineBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
        subpass.colorAttachmentCount = 1;
        subpass.pColorAttachments = &colorRef;

        VkSubpassDependency dependency{};
        dependency.srcSubpass = VK_SUBPASS_EXTERNAL;
        dependency.dstSubpass = 0;
        dependency.srcStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
        dependency.dstStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
        dependency.srcAccessMask = 0;
        dependency.dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_READ_BIT | VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;

        VkRenderPassCreateInfo info{};
        info.sType = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO;
        info.attachmentCount = 1;
        info.pAttachments = &color;
        info.subpassCount = 1;
        info.pSubpasses = &subpass;
        info.dependencyCount = 1;
        info.pDependencies = &dependency;

        auto renderPass = CreateVkRenderPass(device, info);
        if (!renderPass) return std::unexpected(renderPass.error());

        Core::Log::Debug("Built color render pass (format={}, preserve={})", static_cast<int>(mode.Format), mode.PreserveContents);
        return std::make_unique<RenderPass>(device, *renderPass, 1u, 0u);
    }

    Core::Expected<std::unique_ptr<RenderPass>> BuildDrawRenderPass(VulkanDevice& device, const DrawRenderPassMode& mode)
    {
        std::array<VkAttachmentDescription, 2> attachments{};

        VkAttachmentDescription& color = attachments[0];
        color.format = mode.ColorFormat;
        color.samples = VK_SAMPLE_COUNT_1_BIT;
        color.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
        color.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
        color.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
        color.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
        color.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
        color.finalLayout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;

        VkAttachmentDescription& depth = attachments[1];
        depth.format = mode.DepthFormat;
        depth.samples = VK_SAMPLE_COUNT_1_BIT;
        depth.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
        depth.storeOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
        depth.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
        depth.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
        depth.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
        depth.finalLayout = VK_IMAGE_LAYOUT_DEPTH_STENCIL_READ_ONLY_OPTIMAL;

        VkAttachmentReference colorRef{};
        colorRef.attachment = 0;
        colorRef.layout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;

        VkAttachmentReference depthWriteRef{};
        depthWriteRef.attachment = 1;
        depthWriteRef.layout = VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL;

        VkAttachmentReference depthReadRef{};
        depthReadRef.attachment = 1;
        depthReadRef.layout = VK_IMAGE_LAYOUT_DEPTH_STENCIL_READ_ONLY_OPTIMAL;

        std::array<VkSubpassDescription, 2> subpasses{};

        // Geometry
        subpasses[0].pipelineBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
        subpasses[0].colorAttachmentCount = 1;
        subpasses[0].pColorAttachments = &colorRef;
        subpasses[0].pDepthStencilAttachment = &depthWriteRef;

        // Lighting
        subpasses[1].pipelineBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
        subpasses[1].colorAttachmentCount = 1;
        subpasses[1].pColorAttachments = &colorRef;
        subpasses[1].inputAttachmentCount = 1;
        subpasses[1].pInputAttachments = &depthReadRef;

        std::array<VkSubpassDependency, 2> dependencies{};

        dependencies[0].srcSubpass = VK_SUBPASS_EXTERNAL;
        dependencies[0].dstSubpass = 0;
        dependencies[0].srcStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT | VK_PIPELINE_STAGE_EARLY_FRAGMENT_TESTS_BIT;
        dependencies[0].dstStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT | VK_PIPELINE_STAGE_EARLY_FRAGMENT_TESTS_BIT;
        dependencies[0].srcAccessMask = 0;
        dependencies[0].dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT | VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT;

        dependencies[1].srcSubpass = 0;
        dependencies[1].dstSubpass = 1;
        dependencies[1].srcStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT | VK_PIPELINE_STAGE_LATE_FRAGMENT_TESTS_BIT;
        dependencies[1].dstStageMask = VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT | VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
        dependencies[1].srcAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT | VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT;
        dependencies[1].dstAccessMask = VK_ACCESS_INPUT_ATTACHMENT_READ_BIT | VK_ACCESS_COLOR_ATTACHMENT_READ_BIT | VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;
        dependencies[1].dependencyFlags = VK_DEPENDENCY_BY_REGION_BIT;

        VkRenderPassCreateInfo info{};
        info.sType = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO;
        info.attachmentCount = static_cast<uint32_t>(attachments.size());
        info.pAttachments = attachments.data();
        info.subpassCount = static_cast<uint32_t>(subpasses.size());
        info.pSubpasses = subpasses.data();
        info.dependencyCount = static_cast<uint32_t>(dependencies.size());
        info.pDependencies = dependencies.data();

        auto renderPass = CreateVkRenderPass(device, info);
        if (!renderPass) return std::unexpected(renderPass.error());

        Core::Log::Debug("Built draw render pass (color={}, depth={})", static_cast<int>(mode.ColorFormat), static_cast<int>(mode.DepthFormat));
        return std::make_unique<RenderPass>(device, *renderPass, 2u, 0b01u);
    }

    Core::Expected<std::unique_ptr<RenderPass>> BuildRenderPass(VulkanDevice& device, const RenderPassMode& mode)
    {
        return std::visit([&device](const auto& alternative) -> Core::Expected<std::unique_ptr<RenderPass>>
        {
            using T = std::decay_t<decltype(alternative)>;

            if constexpr (std::is_same_v<T, ColorRenderPassMode>)
                return BuildColorRenderPass(device, alternative);
            else if constexpr (std::is_same_v<T, DrawRenderPassMode>)
                return BuildDrawRenderPass(device, alternative);
            else
                static_assert(sizeof(T) == 0, "BuildRenderPass: unhandled RenderPassMode alternative");
        }, mode);
    }
}
