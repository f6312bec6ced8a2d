module;
#include "RHI.Vulkan.hpp"
#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

export module RHI:Image;

import :Device;
import Core;

export namespace RHI
{
    // Everything that decides whether two textures are interchangeable.
    struct TextureInfo
    {
        glm::uvec2 Extent{1, 1};
        VkFormat Format = VK_FORMAT_R8G8B8A8_UNORM;
        VkImageUsageFlags Usage = VK_IMAGE_USAGE_SAMPLED_BIT;
        uint16_t Layers = 1;
        uint8_t Mips = 1;
        uint8_t Samples = 1;

        bool operator==(const TextureInfo&) const = default;
    };

    [[nodiscard]] VkImageAspectFlags AspectFromFormat(VkFormat format);

    // A 2-D (optionally layered) VMA image plus a view over all of it.
    class VulkanImage
    {
    public:
        [[nodiscard]] static Core::Expected<std::unique_ptr<VulkanImage>> Create(VulkanDevice& device, const TextureInfo& info);

        ~VulkanImage();

        VulkanImage(const VulkanImage&) = delete;
        VulkanImage& operator=(const VulkanImage&) = delete;

        [[nodiscard]] VkImage GetHandle() const { return m_Image; }
        [[nodiscard]] VkImageView GetView() const { return m_ImageView; }
        [[nodiscard]] const TextureInfo& GetInfo() const { return m_Info; }
        [[nodiscard]] VkFormat GetFormat() const { return m_Info.Format; }
        [[nodiscard]] uint32_t GetWidth() const { return m_Info.Extent.x; }
        [[nodiscard]] uint32_t GetHeight() const { return m_Info.Extent.y; }

        // Labels the image for debug tools. The last name set is kept even without VK_EXT_debug_utils.
        void SetDebugName(std::string_view name);
        [[nodiscard]] const std::string& GetDebugName() const { return m_DebugName; }

        // Helper to find a supported depth format
        [[nodiscard]] static std::optional<VkFormat> FindDepthFormat(const VulkanDevice& device);

    private:
        VulkanImage(VulkanDevice& device, const TextureInfo& info) : m_Device(device), m_Info(info) {}

        VulkanDevice& m_Device;
        TextureInfo m_Info;
        VkImage m_Image = VK_NULL_HANDLE;
        VkImageView m_ImageView = VK_NULL_HANDLE;
        VmaAllocation m_Allocation = VK_NULL_HANDLE;
        std::string m_DebugName;
    };
}

// Allow TextureInfo to key unordered containers.
template <>
struct std::hash<RHI::TextureInfo>
{
    size_t operator()(const RHI::TextureInfo& info) const noexcept
    {
        return Core::Hash::HashAll(info.Extent.x, info.Extent.y,
                                   static_cast<int32_t>(info.Format), info.Usage,
                                   info.Layers, info.Mips, info.Samples);
    }
};
