module;
#include "RHI.Vulkan.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

export module RHI:Shader;

import :Device;
import Core;

export namespace RHI {

    enum class ShaderStage { Vertex, Fragment, Compute };

    [[nodiscard]] VkShaderStageFlagBits ToVkStage(ShaderStage stage);

    class ShaderModule {
    public:
        [[nodiscard]] static Core::Expected<std::unique_ptr<ShaderModule>> Create(
            VulkanDevice& device, const std::filesystem::path& filepath, ShaderStage stage);

        ~ShaderModule();

        ShaderModule(const ShaderModule&) = delete;
        ShaderModule& operator=(const ShaderModule&) = delete;

        [[nodiscard]] VkShaderModule GetHandle() const { return m_Module; }
        [[nodiscard]] ShaderStage GetStage() const { return m_Stage; }
        [[nodiscard]] VkPipelineShaderStageCreateInfo GetStageInfo() const;

    private:
        ShaderModule(VulkanDevice& device, VkShaderModule module, ShaderStage stage)
            : m_Device(device), m_Module(module), m_Stage(stage)
        {
        }

        VulkanDevice& m_Device;
        VkShaderModule m_Module = VK_NULL_HANDLE;
        ShaderStage m_Stage;
    };

    // Loads compiled SPIR-V (<root>/<name>.spv) on first use and keeps the module for the library's lifetime.
    class ShaderLibrary {
    public:
        ShaderLibrary(VulkanDevice& device, std::filesystem::path rootDirectory);

        ShaderLibrary(const ShaderLibrary&) = delete;
        ShaderLibrary& operator=(const ShaderLibrary&) = delete;

        // name is the source file name without the .spv suffix, e.g. "mesh.vert".
        [[nodiscard]] Core::Expected<const ShaderModule*> Get(std::string_view name, ShaderStage stage);

        [[nodiscard]] const std::filesystem::path& GetRootDirectory() const { return m_Root; }
        [[nodiscard]] size_t GetLoadedCount() const { return m_Modules.size(); }

    private:
        VulkanDevice& m_Device;
        std::filesystem::path m_Root;
        std::unordered_map<std::string, std::unique_ptr<ShaderModule>> m_Modules;
    };
}
