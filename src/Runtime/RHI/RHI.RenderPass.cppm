module;
#include "RHI.Vulkan.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <variant>

export module RHI:RenderPass;

import :Device;
import Core;

export namespace RHI
{
    // Single color attachment. PreserveContents loads the previous image instead of clearing it.
    struct ColorRenderPassMode
    {
        VkFormat Format = VK_FORMAT_R8G8B8A8_UNORM;
        bool PreserveContents = false;

        bool operator==(const ColorRenderPassMode&) const = default;
    };

    // Two subpasses over color + depth:
    //   0 - geometry, writes color and depth.
    //   1 - lighting, reads depth as an input attachment and accumulates into color.
    struct DrawRenderPassMode
    {
        VkFormat ColorFormat = VK_FORMAT_R8G8B8A8_UNORM;
        VkFormat DepthFormat = VK_FORMAT_D32_SFLOAT;

        bool operator==(const DrawRenderPassMode&) const = default;
    };

    using RenderPassMode = std::variant<ColorRenderPassMode, DrawRenderPassMode>;

    // A render pass and one of its subpasses, as pipelines are built against.
    struct Subpass
    {
        VkRenderPass RenderPass = VK_NULL_HANDLE;
        uint32_t Index = 0;
        bool HasDepth = false;
    };

    class RenderPass
    {
    public:
        RenderPass(VulkanDevice& device, VkRenderPass renderPass, uint32_t subpassCount, uint32_t depthSubpassMask)
            : m_Device(device), m_RenderPass(renderPass), m_SubpassCount(subpassCount), m_DepthSubpassMask(depthSubpassMask)
        {
        }

        ~RenderPass();

        RenderPass(const RenderPass&) = delete;
        RenderPass& operator=(const RenderPass&) = delete;

        [[nodiscard]] VkRenderPass GetHandle() const { return m_RenderPass; }
        [[nodiscard]] uint32_t GetSubpassCount() const { return m_SubpassCount; }

        // index must be < GetSubpassCount().
        [[nodiscard]] Subpass GetSubpass(uint32_t index) const;

    private:
        VulkanDevice& m_Device;
        VkRenderPass m_RenderPass = VK_NULL_HANDLE;
        uint32_t m_SubpassCount = 0;
        uint32_t m_DepthSubpassMask = 0;
    };

    [[nodiscard]] Core::Expected<std::unique_ptr<RenderPass>> BuildColorRenderPass(VulkanDevice& device, const ColorRenderPassMode& mode);
    [[nodiscard]] Core::Expected<std::unique_ptr<RenderPass>> BuildDrawRenderPass(VulkanDevice& device, const DrawRenderPassMode& mode);

    // Dispatches to the builder for the active alternative.
    [[nodiscard]] Core::Expected<std::unique_ptr<RenderPass>> BuildRenderPass(VulkanDevice& device, const RenderPassMode& mode);
}

// std::hash<std::variant> requires every alternative to be hashable.
template <>
struct std::hash<RHI::ColorRenderPassMode>
{
    size_t operator()(const RHI::ColorRenderPassMode& mode) const noexcept
    {
        return Core::Hash::HashAll(static_cast<int32_t>(mode.Format), mode.PreserveContents);
    }
};

template <>
struct std::hash<RHI::DrawRenderPassMode>
{
    size_t operator()(const RHI::DrawRenderPassMode& mode) const noexcept
    {
        return Core::Hash::HashAll(static_cast<int32_t>(mode.ColorFormat), static_cast<int32_t>(mode.DepthFormat));
    }
};
