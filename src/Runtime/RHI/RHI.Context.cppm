module;

#include <string_view>
#include "RHI.Vulkan.hpp"

export module RHI:Context;

import Core;

namespace RHI {

    export struct ContextConfig {
        std::string_view AppName = "Leasehold";
        // Requested, not required: silently off when the layer is not installed.
        bool EnableValidation = true;
    };

    // Headless Vulkan instance. There is no surface; all work is offscreen.
    export class VulkanContext {
    public:
        explicit VulkanContext(const ContextConfig& config);
        ~VulkanContext();

        // No copy
        VulkanContext(const VulkanContext&) = delete;
        VulkanContext& operator=(const VulkanContext&) = delete;

        [[nodiscard]] VkInstance GetInstance() const { return m_Instance; }
        [[nodiscard]] bool IsValid() const { return m_Instance != VK_NULL_HANDLE; }
        [[nodiscard]] bool HasDebugUtils() const { return m_DebugUtilsEnabled; }

    private:
        VkInstance m_Instance = VK_NULL_HANDLE;
        VkDebugUtilsMessengerEXT m_DebugMessenger = VK_NULL_HANDLE;
        bool m_DebugUtilsEnabled = false;

        // Internal helpers
        void CreateInstance(const ContextConfig& config);
        void SetupDebugMessenger();
    };
}
