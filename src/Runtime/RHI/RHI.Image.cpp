module;
#include "RHI.Vulkan.hpp"
#include <array>
#include <bit>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

module RHI:Image.Impl;
import :Image;
import :Device;
import Core;

namespace RHI
{
    VkImageAspectFlags AspectFromFormat(VkFormat format)
    {
        switch (format)
        {
            case VK_FORMAT_D16_UNORM:
            case VK_FORMAT_X8_D24_UNORM_PACK32:
            case VK_FORMAT_D32_SFLOAT:
                return VK_IMAGE_ASPECT_DEPTH_BIT;
            case VK_FORMAT_S8_UINT:
                return VK_IMAGE_ASPECT_STENCIL_BIT;
            case VK_FORMAT_D16_UNORM_S8_UINT:
            case VK_FORMAT_D24_UNORM_S8_UINT:
            case VK_FORMAT_D32_SFLOAT_S8_UINT:
                return VK_IMAGE_ASPECT_DEPTH_BIT | VK_IMAGE_ASPECT_STENCIL_BIT;
            default:
                return VK_IMAGE_ASPECT_COLOR_BIT;
        }
    }

    Core::Expected<std::unique_ptr<VulkanImage>> VulkanImage::Create(VulkanDevice& device, const TextureInfo& info)
    {
        if (info.Extent.x == 0 || info.Extent.y == 0 || info.Layers == 0 || info.Mips == 0)
        {
            Core::Log::Error("VulkanImage::Create(): degenerate texture {}x{} layers={} mips={}",
                             info.Extent.x, info.Extent.y, info.Layers, info.Mips);
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        // VkSampleCountFlagBits: a single bit from 1 to 64.
        if (!std::has_single_bit(static_cast<unsigned>(info.Samples)) || info.Samples > 64)
        {
            Core::Log::Error("VulkanImage::Create(): {} is not a valid sample count", static_cast<int>(info.Samples));
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        std::unique_ptr<VulkanImage> image(new VulkanImage(device, info));

        // 1. Create Image
        VkImageCreateInfo imageInfo{};
        imageInfo.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
        imageInfo.imageType = VK_IMAGE_TYPE_2D;
        imageInfo.extent.width = info.Extent.x;
        imageInfo.extent.height = info.Extent.y;
        imageInfo.extent.depth = 1;
        imageInfo.mipLevels = info.Mips;
        imageInfo.arrayLayers = info.Layers;
        imageInfo.format = info.Format;
        imageInfo.tiling = VK_IMAGE_TILING_OPTIMAL;
        imageInfo.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
        imageInfo.usage = info.Usage;
        imageInfo.samples = static_cast<VkSampleCountFlagBits>(info.Samples);
        imageInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

        VmaAllocationCreateInfo allocInfo{};
        allocInfo.usage = VMA_MEMORY_USAGE_AUTO_PREFER_DEVICE;

        if (VkResult result = vmaCreateImage(device.GetAllocator(), &imageInfo, &allocInfo, &image->m_Image, &image->m_Allocation, nullptr);
            result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create image! {}x{} format={} Error Code: {}",
                             info.Extent.x, info.Extent.y, static_cast<int>(info.Format), static_cast<int>(result));
            image->m_Image = VK_NULL_HANDLE;
            image->m_Allocation = VK_NULL_HANDLE;
            return std::unexpected(ToErrorCode(result));
        }

        // 2. Create View
        VkImageViewCreateInfo viewInfo{};
        viewInfo.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
        viewInfo.image = image->m_Image;
        viewInfo.viewType = info.Layers > 1 ? VK_IMAGE_VIEW_TYPE_2D_ARRAY : VK_IMAGE_VIEW_TYPE_2D;
        viewInfo.format = info.Format;
        viewInfo.subresourceRange.aspectMask = AspectFromFormat(info.Format);
        viewInfo.subresourceRange.baseMipLevel = 0;
        viewInfo.subresourceRange.levelCount = info.Mips;
        viewInfo.subresourceRange.baseArrayLayer = 0;
        viewInfo.subresourceRange.layerCount = info.Layers;

        if (VkResult result = vkCreateImageView(device.GetLogicalDevice(), &viewInfo, nullptr, &image->m_ImageView); result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create image view! Error Code: {}", static_cast<int>(result));
            image->m_ImageView = VK_NULL_HANDLE;
            return std::unexpected(ToErrorCode(result));
        }

        return image;
    }

    VulkanImage::~VulkanImage()
    {
        if (m_ImageView) vkDestroyImageView(m_Device.GetLogicalDevice(), m_ImageView, nullptr);
        if (m_Image) vmaDestroyImage(m_Device.GetAllocator(), m_Image, m_Allocation);
    }

    void VulkanImage::SetDebugName(std::string_view name)
    {
        m_DebugName = name;
        m_Device.SetDebugName(VK_OBJECT_TYPE_IMAGE, reinterpret_cast<uint64_t>(m_Image), name);
    }

    std::optional<VkFormat> VulkanImage::FindDepthFormat(const VulkanDevice& device)
    {
        constexpr std::array candidates = {
            VK_FORMAT_D32_SFLOAT, VK_FORMAT_D32_SFLOAT_S8_UINT, VK_FORMAT_D24_UNORM_S8_UINT
        };
        for (VkFormat format : candidates)
        {
            VkFormatProperties props;
            vkGetPhysicalDeviceFormatProperties(device.GetPhysicalDevice(), format, &props);
            if ((props.optimalTilingFeatures & VK_FORMAT_FEATURE_DEPTH_STENCIL_ATTACHMENT_BIT) ==
                VK_FORMAT_FEATURE_DEPTH_STENCIL_ATTACHMENT_BIT)
            {
                return format;
            }
        }
        Core::Log::Error("Failed to find supported depth format!");
        return std::nullopt;
    }
}
