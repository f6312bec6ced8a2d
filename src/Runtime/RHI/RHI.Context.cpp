module;

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include "RHI.Vulkan.hpp"

module RHI:Context.Impl;
import :Context;
import Core;

namespace RHI {

    namespace {
        constexpr const char* VALIDATION_LAYER = "VK_LAYER_KHRONOS_validation";

        VKAPI_ATTR VkBool32 VKAPI_CALL DebugCallback(
            VkDebugUtilsMessageSeverityFlagBitsEXT severity,
            VkDebugUtilsMessageTypeFlagsEXT,
            const VkDebugUtilsMessengerCallbackDataEXT* pCallbackData,
            void*)
        {
            if (severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT) {
                Core::Log::Error("[Vulkan Validation]: {}", pCallbackData->pMessage);
            } else if (severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT) {
                Core::Log::Warn("[Vulkan Validation]: {}", pCallbackData->pMessage);
            }
            return VK_FALSE;
        }

        bool IsLayerAvailable(const char* name) {
            uint32_t count = 0;
            vkEnumerateInstanceLayerProperties(&count, nullptr);
            std::vector<VkLayerProperties> layers(count);
            vkEnumerateInstanceLayerProperties(&count, layers.data());

            for (const auto& layer : layers) {
                if (std::strcmp(layer.layerName, name) == 0) return true;
            }
            return false;
        }

        bool IsInstanceExtensionAvailable(const char* name) {
            uint32_t count = 0;
            vkEnumerateInstanceExtensionProperties(nullptr, &count, nullptr);
            std::vector<VkExtensionProperties> extensions(count);
            vkEnumerateInstanceExtensionProperties(nullptr, &count, extensions.data());

            for (const auto& ext : extensions) {
                if (std::strcmp(ext.extensionName, name) == 0) return true;
            }
            return false;
        }

        VkDebugUtilsMessengerCreateInfoEXT MakeMessengerInfo() {
            VkDebugUtilsMessengerCreateInfoEXT createInfo{};
            createInfo.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
            createInfo.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT | VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
            createInfo.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT | VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT | VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
            createInfo.pfnUserCallback = DebugCallback;
            return createInfo;
        }
    }

    VulkanContext::VulkanContext(const ContextConfig& config) {
        // 1. Initialize Volk (Load basic function pointers)
        if (volkInitialize() != VK_SUCCESS) {
            Core::Log::Error("Failed to initialize Volk! Is a Vulkan loader installed?");
            return;
        }

        CreateInstance(config);
        if (m_Instance == VK_NULL_HANDLE) return;

        // 2. Load Instance functions
        volkLoadInstance(m_Instance);

        if (m_DebugUtilsEnabled && config.EnableValidation) {
            SetupDebugMessenger();
        }

        Core::Log::Info("Vulkan Instance Initialized (headless).");
    }

    VulkanContext::~VulkanContext() {
        if (m_Instance == VK_NULL_HANDLE) return;

        if (m_DebugMessenger != VK_NULL_HANDLE) {
            vkDestroyDebugUtilsMessengerEXT(m_Instance, m_DebugMessenger, nullptr);
        }
        vkDestroyInstance(m_Instance, nullptr);
    }

    void VulkanContext::CreateInstance(const ContextConfig& config) {
        // string_view is not guaranteed to be null-terminated.
        const std::string appName(config.AppName);

        VkApplicationInfo appInfo{};
        appInfo.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
        appInfo.pApplicationName = appName.c_str();
        appInfo.applicationVersion = VK_MAKE_VERSION(1, 0, 0);
        appInfo.pEngineName = "Leasehold";
        appInfo.engineVersion = VK_MAKE_VERSION(1, 0, 0);
        appInfo.apiVersion = VK_API_VERSION_1_2;

        VkInstanceCreateInfo createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
        createInfo.pApplicationInfo = &appInfo;

        // --- Extensions ---
        std::vector<const char*> extensions;
        m_DebugUtilsEnabled = IsInstanceExtensionAvailable(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
        if (m_DebugUtilsEnabled) {
            extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
        }

        createInfo.enabledExtensionCount = static_cast<uint32_t>(extensions.size());
        createInfo.ppEnabledExtensionNames = extensions.data();

        // --- Layers ---
        const bool validation = config.EnableValidation && IsLayerAvailable(VALIDATION_LAYER);
        if (config.EnableValidation && !validation) {
            Core::Log::Warn("Validation requested but {} is not installed. Continuing without it.", VALIDATION_LAYER);
        }

        VkDebugUtilsMessengerCreateInfoEXT debugCreateInfo = MakeMessengerInfo();
        if (validation) {
            createInfo.enabledLayerCount = 1;
            createInfo.ppEnabledLayerNames = &VALIDATION_LAYER;

            // Also report problems in vkCreateInstance itself
            if (m_DebugUtilsEnabled) {
                createInfo.pNext = &debugCreateInfo;
            }
        }

        VkResult result = vkCreateInstance(&createInfo, nullptr, &m_Instance);
        if (result != VK_SUCCESS) {
            Core::Log::Error("Failed to create Vulkan Instance! Error Code: {}", static_cast<int>(result));
            m_Instance = VK_NULL_HANDLE;
            m_DebugUtilsEnabled = false;
        }
    }

    void VulkanContext::SetupDebugMessenger() {
        VkDebugUtilsMessengerCreateInfoEXT createInfo = MakeMessengerInfo();

        // volkLoadInstance resolved the extension entry points.
        if (vkCreateDebugUtilsMessengerEXT(m_Instance, &createInfo, nullptr, &m_DebugMessenger) != VK_SUCCESS) {
            Core::Log::Error("Failed to set up debug messenger!");
            m_DebugMessenger = VK_NULL_HANDLE;
        }
    }
}
