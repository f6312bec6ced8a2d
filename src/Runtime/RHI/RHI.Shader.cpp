module;
#include "RHI.Vulkan.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

module RHI:Shader.Impl;
import :Shader;
import :Device;
import Core;

namespace RHI {

    VkShaderStageFlagBits ToVkStage(ShaderStage stage) {
        switch (stage) {
            case ShaderStage::Vertex:   return VK_SHADER_STAGE_VERTEX_BIT;
            case ShaderStage::Fragment: return VK_SHADER_STAGE_FRAGMENT_BIT;
            case ShaderStage::Compute:  return VK_SHADER_STAGE_COMPUTE_BIT;
        }
        return VK_SHADER_STAGE_VERTEX_BIT;
    }

    Core::Expected<std::unique_ptr<ShaderModule>> ShaderModule::Create(
        VulkanDevice& device, const std::filesystem::path& filepath, ShaderStage stage)
    {
        auto code = Core::Filesystem::ReadWords(filepath);
        if (!code) return std::unexpected(code.error());

        VkShaderModuleCreateInfo createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
        createInfo.codeSize = code->size() * sizeof(uint32_t);
        createInfo.pCode = code->data();

        VkShaderModule shaderModule = VK_NULL_HANDLE;
        if (VkResult result = vkCreateShaderModule(device.GetLogicalDevice(), &createInfo, nullptr, &shaderModule); result != VK_SUCCESS) {
            Core::Log::Error("Failed to create shader module: {}", filepath.string());
            return std::unexpected(ToErrorCode(result));
        }

        return std::unique_ptr<ShaderModule>(new ShaderModule(device, shaderModule, stage));
    }

    ShaderModule::~ShaderModule() {
        if (m_Module) vkDestroyShaderModule(m_Device.GetLogicalDevice(), m_Module, nullptr);
    }

    VkPipelineShaderStageCreateInfo ShaderModule::GetStageInfo() const {
        VkPipelineShaderStageCreateInfo info{};
        info.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        info.stage = ToVkStage(m_Stage);
        info.module = m_Module;
        info.pName = "main";
        return info;
    }

    ShaderLibrary::ShaderLibrary(VulkanDevice& device, std::filesystem::path rootDirectory)
        : m_Device(device), m_Root(std::move(rootDirectory))
    {
    }

    Core::Expected<const ShaderModule*> ShaderLibrary::Get(std::string_view name, ShaderStage stage) {
        std::string key(name);
        if (auto it = m_Modules.find(key); it != m_Modules.end()) {
            if (it->second->GetStage() != stage) {
                Core::Log::Error("ShaderLibrary: '{}' already loaded for a different stage", name);
                return std::unexpected(Core::ErrorCode::InvalidArgument);
            }
            return it->second.get();
        }

        auto loaded = ShaderModule::Create(m_Device, m_Root / (key + ".spv"), stage);
        if (!loaded) return std::unexpected(loaded.error());

        const ShaderModule* result = loaded->get();
        m_Modules.emplace(std::move(key), std::move(*loaded));
        return result;
    }
}
