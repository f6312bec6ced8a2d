#pragma once

// =============================================================================
// Headless Vulkan device for RHI test suites.
//
// Usage: #include "TestDevice.h" AFTER `import RHI;` in each test file.
// Tests derived from DeviceTest are skipped when no Vulkan device is present.
// =============================================================================

#include <filesystem>
#include <memory>

#include <gtest/gtest.h>

class DeviceTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_Context = std::make_unique<RHI::VulkanContext>(RHI::ContextConfig{
            .AppName = "LeaseholdTests",
            .EnableValidation = true,
        });
        if (!m_Context->IsValid())
            GTEST_SKIP() << "No Vulkan instance available";

        m_Device = std::make_unique<RHI::VulkanDevice>(*m_Context);
        if (!m_Device->IsValid())
            GTEST_SKIP() << "No Vulkan device available";

        // Directory without any SPIR-V: pipeline construction fails predictably.
        m_Shaders = std::make_unique<RHI::ShaderLibrary>(*m_Device, std::filesystem::temp_directory_path() / "leasehold_no_shaders");
    }

    void TearDown() override
    {
        if (m_Device && m_Device->IsValid())
            m_Device->WaitIdle();
    }

    [[nodiscard]] uint32_t GraphicsFamily() const { return m_Device->GetQueueIndices().GraphicsFamily.value(); }

    std::unique_ptr<RHI::VulkanContext> m_Context;
    std::unique_ptr<RHI::VulkanDevice> m_Device;
    std::unique_ptr<RHI::ShaderLibrary> m_Shaders;
};
