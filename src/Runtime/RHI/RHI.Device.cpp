module;
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "RHI.Vulkan.hpp"

module RHI:Device.Impl;
import :Device;
import :Context;
import Core;

namespace RHI
{
    Core::ErrorCode ToErrorCode(VkResult result)
    {
        switch (result)
        {
            case VK_ERROR_DEVICE_LOST:
                return Core::ErrorCode::DeviceLost;
            case VK_ERROR_OUT_OF_HOST_MEMORY:
                return Core::ErrorCode::OutOfMemory;
            case VK_ERROR_OUT_OF_DEVICE_MEMORY:
                return Core::ErrorCode::OutOfDeviceMemory;
            case VK_ERROR_OUT_OF_POOL_MEMORY:
            case VK_ERROR_FRAGMENTED_POOL:
                return Core::ErrorCode::OutOfPoolMemory;
            case VK_ERROR_FEATURE_NOT_PRESENT:
            case VK_ERROR_EXTENSION_NOT_PRESENT:
            case VK_ERROR_LAYER_NOT_PRESENT:
            case VK_ERROR_FORMAT_NOT_SUPPORTED:
            case VK_ERROR_INCOMPATIBLE_DRIVER:
            case VK_ERROR_TOO_MANY_OBJECTS:
                return Core::ErrorCode::Unsupported;
            case VK_NOT_READY:
            case VK_TIMEOUT:
                return Core::ErrorCode::NotReady;
            default:
                return Core::ErrorCode::InvalidData;
        }
    }

    VulkanDevice::VulkanDevice(VulkanContext& context)
        : m_DebugUtils(context.HasDebugUtils())
    {
        if (!context.IsValid())
        {
            m_IsValid = false;
            return;
        }

        PickPhysicalDevice(context.GetInstance());

        // Abort initialization if no physical device was selected
        if (m_PhysicalDevice == VK_NULL_HANDLE)
        {
            m_IsValid = false;
            return;
        }

        CreateLogicalDevice(context);
    }

    VulkanDevice::~VulkanDevice()
    {
        if (m_Device) vkDeviceWaitIdle(m_Device);
        if (m_Allocator) vmaDestroyAllocator(m_Allocator);
        if (m_Device) vkDestroyDevice(m_Device, nullptr);
    }

    VkQueue VulkanDevice::GetQueue(uint32_t family) const
    {
        return family < m_Queues.size() ? m_Queues[family] : VK_NULL_HANDLE;
    }

    VkResult VulkanDevice::Submit(uint32_t family, const VkSubmitInfo& submitInfo, VkFence fence)
    {
        VkQueue queue = GetQueue(family);
        if (queue == VK_NULL_HANDLE)
        {
            Core::Log::Error("VulkanDevice::Submit(): no queue was created for family {}", family);
            return VK_ERROR_FEATURE_NOT_PRESENT;
        }

        std::scoped_lock lock(m_QueueMutex);
        return vkQueueSubmit(queue, 1, &submitInfo, fence);
    }

    Core::Expected<bool> VulkanDevice::GetFenceStatus(VkFence fence) const
    {
        const VkResult result = vkGetFenceStatus(m_Device, fence);
        if (result == VK_SUCCESS) return true;
        if (result == VK_NOT_READY) return false;
        return std::unexpected(ToErrorCode(result));
    }

    Core::Result VulkanDevice::WaitForFence(VkFence fence) const
    {
        const VkResult result = vkWaitForFences(m_Device, 1, &fence, VK_TRUE, UINT64_MAX);
        if (result != VK_SUCCESS) return Core::Err(ToErrorCode(result));
        return Core::Ok();
    }

    std::optional<uint32_t> VulkanDevice::FindMemoryType(uint32_t typeBits, VkMemoryPropertyFlags properties) const
    {
        for (uint32_t i = 0; i < m_MemoryProperties.memoryTypeCount; ++i)
        {
            const bool allowed = (typeBits & (1u << i)) != 0;
            const bool matches = (m_MemoryProperties.memoryTypes[i].propertyFlags & properties) == properties;
            if (allowed && matches) return i;
        }
        return std::nullopt;
    }

    bool VulkanDevice::SupportsTimestamps(uint32_t family) const
    {
        if (family >= m_FamilyProperties.size()) return false;
        if (m_Properties.limits.timestampPeriod <= 0.0f) return false;

        // vkCmdResetQueryPool is not available on transfer-only queues.
        const VkQueueFlags flags = m_FamilyProperties[family].queueFlags;
        if ((flags & (VK_QUEUE_GRAPHICS_BIT | VK_QUEUE_COMPUTE_BIT)) == 0) return false;

        return m_FamilyProperties[family].timestampValidBits != 0;
    }

    void VulkanDevice::SetDebugName(VkObjectType type, uint64_t handle, std::string_view name) const
    {
        if (!m_DebugUtils || vkSetDebugUtilsObjectNameEXT == nullptr || name.empty()) return;

        const std::string nameCopy(name);

        VkDebugUtilsObjectNameInfoEXT info{};
        info.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_OBJECT_NAME_INFO_EXT;
        info.objectType = type;
        info.objectHandle = handle;
        info.pObjectName = nameCopy.c_str();

        if (vkSetDebugUtilsObjectNameEXT(m_Device, &info) != VK_SUCCESS)
        {
            Core::Log::Warn("Failed to set debug name '{}'", name);
        }
    }

    void VulkanDevice::WaitIdle() const
    {
        if (m_Device) VK_CHECK(vkDeviceWaitIdle(m_Device));
    }

    void VulkanDevice::PickPhysicalDevice(VkInstance instance)
    {
        uint32_t deviceCount = 0;
        vkEnumeratePhysicalDevices(instance, &deviceCount, nullptr);

        if (deviceCount == 0)
        {
            Core::Log::Error("Failed to find GPUs with Vulkan support!");
            m_IsValid = false;
            return;
        }

        std::vector<VkPhysicalDevice> devices(deviceCount);
        vkEnumeratePhysicalDevices(instance, &deviceCount, devices.data());

        // Prefer a discrete GPU, accept anything with a graphics queue.
        for (const auto& device : devices)
        {
            uint32_t familyCount = 0;
            vkGetPhysicalDeviceQueueFamilyProperties(device, &familyCount, nullptr);
            std::vector<VkQueueFamilyProperties> families(familyCount);
            vkGetPhysicalDeviceQueueFamilyProperties(device, &familyCount, families.data());

            VkPhysicalDeviceProperties props;
            vkGetPhysicalDeviceProperties(device, &props);

            if (!FindQueueFamilies(families).IsComplete())
            {
                Core::Log::Warn("GPU '{}' rejected: No Graphics Queue.", props.deviceName);
                continue;
            }

            const bool discrete = props.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU;
            if (m_PhysicalDevice == VK_NULL_HANDLE || discrete)
            {
                m_PhysicalDevice = device;
                m_FamilyProperties = std::move(families);
                if (discrete) break;
            }
        }

        if (m_PhysicalDevice == VK_NULL_HANDLE)
        {
            Core::Log::Error("Failed to find a suitable GPU! Checked {} devices.", deviceCount);
            m_IsValid = false;
            return;
        }

        vkGetPhysicalDeviceProperties(m_PhysicalDevice, &m_Properties);
        vkGetPhysicalDeviceMemoryProperties(m_PhysicalDevice, &m_MemoryProperties);
        Core::Log::Info("Selected GPU: {}", m_Properties.deviceName);
    }

    void VulkanDevice::CreateLogicalDevice(VulkanContext& context)
    {
        m_Indices = FindQueueFamilies(m_FamilyProperties);

        std::set<uint32_t> uniqueQueueFamilies = {
            m_Indices.GraphicsFamily.value(),
            m_Indices.ComputeFamily.value(),
            m_Indices.TransferFamily.value()
        };

        std::vector<VkDeviceQueueCreateInfo> queueCreateInfos;
        float queuePriority = 1.0f;
        for (uint32_t queueFamily : uniqueQueueFamilies)
        {
            VkDeviceQueueCreateInfo queueCreateInfo{};
            queueCreateInfo.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
            queueCreateInfo.queueFamilyIndex = queueFamily;
            queueCreateInfo.queueCount = 1;
            queueCreateInfo.pQueuePriorities = &queuePriority;
            queueCreateInfos.push_back(queueCreateInfo);
        }

        VkPhysicalDeviceFeatures features{};

        VkDeviceCreateInfo createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
        createInfo.queueCreateInfoCount = static_cast<uint32_t>(queueCreateInfos.size());
        createInfo.pQueueCreateInfos = queueCreateInfos.data();
        createInfo.pEnabledFeatures = &features;
        createInfo.enabledExtensionCount = 0;
        createInfo.enabledLayerCount = 0;

        if (vkCreateDevice(m_PhysicalDevice, &createInfo, nullptr, &m_Device) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create logical device!");
            m_Device = VK_NULL_HANDLE;
            m_IsValid = false;
            return;
        }

        volkLoadDevice(m_Device);

        VmaVulkanFunctions vulkanFunctions = {};
        vulkanFunctions.vkGetInstanceProcAddr = vkGetInstanceProcAddr;
        vulkanFunctions.vkGetDeviceProcAddr = vkGetDeviceProcAddr;

        VmaAllocatorCreateInfo allocatorInfo = {};
        allocatorInfo.vulkanApiVersion = VK_API_VERSION_1_2;
        allocatorInfo.physicalDevice = m_PhysicalDevice;
        allocatorInfo.device = m_Device;
        allocatorInfo.instance = context.GetInstance();
        allocatorInfo.pVulkanFunctions = &vulkanFunctions;

        if (vmaCreateAllocator(&allocatorInfo, &m_Allocator) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create VMA allocator!");
            m_Allocator = VK_NULL_HANDLE;
            m_IsValid = false;
            return;
        }

        m_Queues.assign(m_FamilyProperties.size(), VK_NULL_HANDLE);
        for (uint32_t queueFamily : uniqueQueueFamilies)
        {
            vkGetDeviceQueue(m_Device, queueFamily, 0, &m_Queues[queueFamily]);
        }
    }

    QueueFamilyIndices VulkanDevice::FindQueueFamilies(const std::vector<VkQueueFamilyProperties>& families)
    {
        QueueFamilyIndices indices;

        for (uint32_t i = 0; i < families.size(); ++i)
        {
            const VkQueueFlags flags = families[i].queueFlags;

            if ((flags & VK_QUEUE_GRAPHICS_BIT) && !indices.GraphicsFamily)
                indices.GraphicsFamily = i;

            if ((flags & VK_QUEUE_COMPUTE_BIT) && !(flags & VK_QUEUE_GRAPHICS_BIT) && !indices.ComputeFamily)
                indices.ComputeFamily = i;

            if ((flags & VK_QUEUE_TRANSFER_BIT) && !(flags & (VK_QUEUE_GRAPHICS_BIT | VK_QUEUE_COMPUTE_BIT)) && !indices.TransferFamily)
                indices.TransferFamily = i;
        }

        // Fall back to shared families. Graphics queues always support compute and transfer.
        if (!indices.ComputeFamily) indices.ComputeFamily = indices.GraphicsFamily;
        if (!indices.TransferFamily) indices.TransferFamily = indices.ComputeFamily;

        return indices;
    }
}
