#include <gtest/gtest.h>
#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <memory>
#include <vector>

#include "RHI.Vulkan.hpp"

import Core;
import RHI;

#include "TestDevice.h"

namespace
{
    class PoolTest : public DeviceTest
    {
    protected:
        void SetUp() override
        {
            DeviceTest::SetUp();
            if (IsSkipped()) return;
            m_Pool = std::make_unique<RHI::Pool>(*m_Device, *m_Shaders);
        }

        std::unique_ptr<RHI::Pool> m_Pool;
    };

    RHI::TextureInfo SmallTarget()
    {
        return RHI::TextureInfo{
            .Extent = {64, 64},
            .Format = VK_FORMAT_R8G8B8A8_UNORM,
            .Usage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_SAMPLED_BIT,
        };
    }
}

TEST_F(PoolTest, DataBufferIsReusedForSmallerRequest)
{
    VkBuffer first = VK_NULL_HANDLE;
    {
        auto data = m_Pool->AcquireData(1024);
        ASSERT_TRUE(data.has_value());
        EXPECT_GE((*data)->GetCapacity(), 1024u);
        first = (*data)->GetHandle();
    }

    auto data = m_Pool->AcquireData(512);
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ((*data)->GetHandle(), first);
    EXPECT_EQ(m_Pool->GetStats().ConstructedOf(RHI::ResourceKind::Data), 1u);
}

TEST_F(PoolTest, ReusedDataBufferKeepsHostContents)
{
    const std::array<uint32_t, 4> written = {1u, 2u, 3u, 4u};
    {
        auto data = m_Pool->AcquireData(sizeof(written));
        ASSERT_TRUE(data.has_value());
        if (!(*data)->IsHostVisible())
            GTEST_SKIP() << "Data buffers are not host-visible on this device";
        (*data)->Write(written.data(), sizeof(written));
    }

    auto data = m_Pool->AcquireData(sizeof(written));
    ASSERT_TRUE(data.has_value());

    std::array<uint32_t, 4> read{};
    (*data)->Read(read.data(), read.size());
    EXPECT_EQ(read, written);
}

TEST_F(PoolTest, WrappingOffsetsAreRejected)
{
    const std::array<uint32_t, 4> written = {5u, 6u, 7u, 8u};
    auto data = m_Pool->AcquireData(sizeof(written));
    ASSERT_TRUE(data.has_value());
    if (!(*data)->IsHostVisible())
        GTEST_SKIP() << "Data buffers are not host-visible on this device";
    (*data)->Write(written.data(), sizeof(written));

    // offset + size overflows to a small value; neither call may touch memory.
    const size_t wrappingOffset = std::numeric_limits<size_t>::max() - 3;
    const std::array<uint32_t, 2> junk = {0xdeadbeefu, 0xdeadbeefu};
    (*data)->Write(junk.data(), sizeof(junk), wrappingOffset);

    std::array<uint32_t, 4> read{};
    (*data)->Read(read.data(), read.size());
    EXPECT_EQ(read, written);

    std::array<uint32_t, 2> untouched = {1u, 1u};
    (*data)->Read(untouched.data(), untouched.size(), wrappingOffset);
    EXPECT_EQ(untouched[0], 1u);
    EXPECT_EQ(untouched[1], 1u);
}

TEST_F(PoolTest, DataBufferUsageIsPartOfTheKey)
{
    {
        auto plain = m_Pool->AcquireData(256);
        ASSERT_TRUE(plain.has_value());
    }

    auto storage = m_Pool->AcquireData(256, VK_BUFFER_USAGE_STORAGE_BUFFER_BIT);
    ASSERT_TRUE(storage.has_value());
    EXPECT_EQ(m_Pool->GetStats().ConstructedOf(RHI::ResourceKind::Data), 2u);
    EXPECT_EQ(m_Pool->GetStats().IdleOf(RHI::ResourceKind::Data), 1u);
}

TEST_F(PoolTest, ZeroLengthDataFails)
{
    auto data = m_Pool->AcquireData(0);
    ASSERT_FALSE(data.has_value());
    EXPECT_EQ(data.error().Kind, RHI::ResourceKind::Data);
    EXPECT_EQ(data.error().Code, Core::ErrorCode::InvalidArgument);
}

TEST_F(PoolTest, TextureMissSeedsASpare)
{
    auto a = m_Pool->AcquireTexture(SmallTarget(), "PingTarget");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(m_Pool->GetStats().ConstructedOf(RHI::ResourceKind::Texture), 2u);
    EXPECT_EQ(m_Pool->GetStats().IdleOf(RHI::ResourceKind::Texture), 1u);

    auto b = m_Pool->AcquireTexture(SmallTarget(), "PongTarget");
    ASSERT_TRUE(b.has_value());
    EXPECT_NE((*a)->GetHandle(), (*b)->GetHandle());
    EXPECT_EQ(m_Pool->GetStats().ConstructedOf(RHI::ResourceKind::Texture), 2u);
    EXPECT_EQ((*b)->GetInfo(), SmallTarget());
}

TEST_F(PoolTest, SeededSpareIsLabelledUntilRenamed)
{
    auto ping = m_Pool->AcquireTexture(SmallTarget(), "PingTarget");
    ASSERT_TRUE(ping.has_value());
    EXPECT_EQ((*ping)->GetDebugName(), "PingTarget");

    {
        auto unnamed = m_Pool->AcquireTexture(SmallTarget());
        ASSERT_TRUE(unnamed.has_value());
        EXPECT_EQ((*unnamed)->GetDebugName(), "PingTarget (Unused)");
    }

    auto pong = m_Pool->AcquireTexture(SmallTarget(), "PongTarget");
    ASSERT_TRUE(pong.has_value());
    EXPECT_EQ((*pong)->GetDebugName(), "PongTarget");
    EXPECT_EQ(m_Pool->GetStats().ConstructedOf(RHI::ResourceKind::Texture), 2u);
}

TEST_F(PoolTest, InvalidSampleCountsAreRejected)
{
    for (uint8_t samples : {uint8_t{0}, uint8_t{3}, uint8_t{128}})
    {
        RHI::TextureInfo info = SmallTarget();
        info.Samples = samples;

        auto texture = m_Pool->AcquireTexture(info);
        ASSERT_FALSE(texture.has_value()) << "samples=" << static_cast<int>(samples);
        EXPECT_EQ(texture.error().Kind, RHI::ResourceKind::Texture);
        EXPECT_EQ(texture.error().Code, Core::ErrorCode::InvalidArgument);
    }
    EXPECT_EQ(m_Pool->GetStats().ConstructedOf(RHI::ResourceKind::Texture), 0u);
}

TEST_F(PoolTest, TextureSeedingCanBeDisabled)
{
    RHI::Pool pool(*m_Device, *m_Shaders, RHI::PoolConfig{.SeedTextures = false});
    auto a = pool.AcquireTexture(SmallTarget());
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(pool.GetStats().ConstructedOf(RHI::ResourceKind::Texture), 1u);
    EXPECT_EQ(pool.GetStats().IdleOf(RHI::ResourceKind::Texture), 0u);
}

TEST_F(PoolTest, TexturesMatchExactly)
{
    {
        auto a = m_Pool->AcquireTexture(SmallTarget());
        ASSERT_TRUE(a.has_value());
    }

    RHI::TextureInfo larger = SmallTarget();
    larger.Extent = {128, 64};
    auto b = m_Pool->AcquireTexture(larger);
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ((*b)->GetWidth(), 128u);
    EXPECT_EQ(m_Pool->GetStats().ConstructedOf(RHI::ResourceKind::Texture), 4u);
}

TEST_F(PoolTest, RecycledCommandPoolIsReset)
{
    VkCommandPool handle = VK_NULL_HANDLE;
    {
        auto pool = m_Pool->AcquireCommandPool(GraphicsFamily());
        ASSERT_TRUE(pool.has_value());
        EXPECT_EQ((*pool)->GetResetCount(), 0u);
        handle = (*pool)->GetHandle();

        auto cmd = (*pool)->AllocatePrimary();
        ASSERT_TRUE(cmd.has_value());
    }

    auto pool = m_Pool->AcquireCommandPool(GraphicsFamily());
    ASSERT_TRUE(pool.has_value());
    EXPECT_EQ((*pool)->GetHandle(), handle);
    EXPECT_EQ((*pool)->GetResetCount(), 1u);
}

TEST_F(PoolTest, RecycledFenceIsUnsignaled)
{
    VkFence handle = VK_NULL_HANDLE;
    {
        auto fence = m_Pool->AcquireFence();
        ASSERT_TRUE(fence.has_value());
        handle = (*fence)->GetHandle();

        auto signaled = (*fence)->IsSignaled();
        ASSERT_TRUE(signaled.has_value());
        EXPECT_FALSE(*signaled);

        // Signal it through an empty submission.
        VkSubmitInfo submit{};
        submit.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
        ASSERT_EQ(m_Device->Submit(GraphicsFamily(), submit, handle), VK_SUCCESS);
        ASSERT_TRUE((*fence)->Wait().has_value());
    }

    auto fence = m_Pool->AcquireFence();
    ASSERT_TRUE(fence.has_value());
    EXPECT_EQ((*fence)->GetHandle(), handle);
    auto signaled = (*fence)->IsSignaled();
    ASSERT_TRUE(signaled.has_value());
    EXPECT_FALSE(*signaled);
}

TEST_F(PoolTest, MemoryIsMatchedBySize)
{
    const auto typeIndex = m_Device->FindMemoryType(~0u, VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT);
    ASSERT_TRUE(typeIndex.has_value());

    VkDeviceMemory first = VK_NULL_HANDLE;
    {
        auto memory = m_Pool->AcquireMemory(*typeIndex, 64 * 1024);
        ASSERT_TRUE(memory.has_value());
        first = (*memory)->GetHandle();
    }

    {
        auto smaller = m_Pool->AcquireMemory(*typeIndex, 4 * 1024);
        ASSERT_TRUE(smaller.has_value());
        EXPECT_EQ((*smaller)->GetHandle(), first);
        EXPECT_EQ((*smaller)->GetSize(), 64u * 1024u);
    }

    auto larger = m_Pool->AcquireMemory(*typeIndex, 128 * 1024);
    ASSERT_TRUE(larger.has_value());
    EXPECT_NE((*larger)->GetHandle(), first);
    EXPECT_EQ(m_Pool->GetStats().ConstructedOf(RHI::ResourceKind::Memory), 2u);
}

TEST_F(PoolTest, DescriptorPoolKeyIgnoresRangeOrder)
{
    const std::array<RHI::DescriptorPoolSize, 3> ab = {{
        {VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, 2},
        {VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, 1},
        {VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, 1},
    }};
    const std::array<RHI::DescriptorPoolSize, 2> ba = {{
        {VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, 1},
        {VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, 3},
    }};

    VkDescriptorPool first = VK_NULL_HANDLE;
    {
        auto pool = m_Pool->AcquireDescriptorPool(4, ab);
        ASSERT_TRUE(pool.has_value());
        first = (*pool)->GetHandle();
    }

    auto pool = m_Pool->AcquireDescriptorPool(2, ba);
    ASSERT_TRUE(pool.has_value());
    EXPECT_EQ((*pool)->GetHandle(), first);
    EXPECT_EQ((*pool)->GetMaxSets(), 4u);
}

TEST_F(PoolTest, DescriptorPoolNeedsEnoughSets)
{
    const std::array<RHI::DescriptorPoolSize, 1> sizes = {{{VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, 4}}};
    {
        auto pool = m_Pool->AcquireDescriptorPool(2, sizes);
        ASSERT_TRUE(pool.has_value());
    }

    auto pool = m_Pool->AcquireDescriptorPool(8, sizes);
    ASSERT_TRUE(pool.has_value());
    EXPECT_EQ((*pool)->GetMaxSets(), 8u);
    EXPECT_EQ(m_Pool->GetStats().ConstructedOf(RHI::ResourceKind::DescriptorPool), 2u);
}

TEST_F(PoolTest, CommandBufferReusedOnlyAfterExecution)
{
    VkCommandBuffer first = VK_NULL_HANDLE;
    {
        auto cmd = m_Pool->AcquireCommandBuffer(GraphicsFamily());
        ASSERT_TRUE(cmd.has_value());
        first = (*cmd)->GetHandle();

        ASSERT_TRUE((*cmd)->Begin().has_value());
        ASSERT_TRUE((*cmd)->End().has_value());
        ASSERT_TRUE((*cmd)->Submit().has_value());
        ASSERT_TRUE((*cmd)->WaitUntilExecuted().has_value());
    }

    auto cmd = m_Pool->AcquireCommandBuffer(GraphicsFamily());
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ((*cmd)->GetHandle(), first);
    EXPECT_EQ((*cmd)->GetState(), RHI::CommandBufferState::Idle);
    EXPECT_EQ(m_Pool->GetStats().ConstructedOf(RHI::ResourceKind::CommandBuffer), 1u);
}

TEST_F(PoolTest, RecycledCommandBufferDropsFencedLeases)
{
    {
        auto cmd = m_Pool->AcquireCommandBuffer(GraphicsFamily());
        ASSERT_TRUE(cmd.has_value());
        auto data = m_Pool->AcquireData(256);
        ASSERT_TRUE(data.has_value());

        ASSERT_TRUE((*cmd)->Begin().has_value());
        vkCmdFillBuffer((*cmd)->GetHandle(), (*data)->GetHandle(), 0, VK_WHOLE_SIZE, 0u);
        ASSERT_TRUE((*cmd)->End().has_value());
        ASSERT_TRUE((*cmd)->Submit().has_value());
        (*cmd)->PushFencedDrop(std::move(*data));
        ASSERT_TRUE((*cmd)->WaitUntilExecuted().has_value());
    }

    // The data buffer is still held by the idle command buffer.
    EXPECT_EQ(m_Pool->GetStats().IdleOf(RHI::ResourceKind::Data), 0u);

    auto cmd = m_Pool->AcquireCommandBuffer(GraphicsFamily());
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ((*cmd)->GetPendingDropCount(), 0u);
    EXPECT_EQ(m_Pool->GetStats().IdleOf(RHI::ResourceKind::Data), 1u);
}

TEST_F(PoolTest, DrainEvictsOnlyStaleObjects)
{
    {
        auto stale = m_Pool->AcquireData(128);
        ASSERT_TRUE(stale.has_value());
    }

    for (int i = 0; i < 5; ++i) m_Pool->AdvanceFrame();
    {
        auto fence = m_Pool->AcquireFence();
        ASSERT_TRUE(fence.has_value());
    }
    for (int i = 0; i < 4; ++i) m_Pool->AdvanceFrame();
    EXPECT_EQ(m_Pool->GetFrameNumber(), 9u);

    std::vector<RHI::ResourceKind> evicted;
    const size_t count = m_Pool->Drain([&](RHI::ResourceKind kind, uint64_t idleFrames)
    {
        evicted.push_back(kind);
        EXPECT_GT(idleFrames, m_Pool->GetConfig().LruThreshold);
    });

    EXPECT_EQ(count, 1u);
    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted[0], RHI::ResourceKind::Data);
    EXPECT_EQ(m_Pool->GetStats().IdleOf(RHI::ResourceKind::Data), 0u);
    EXPECT_EQ(m_Pool->GetStats().IdleOf(RHI::ResourceKind::Fence), 1u);
}

TEST_F(PoolTest, LeaseOutlivesPool)
{
    auto data = m_Pool->AcquireData(64);
    ASSERT_TRUE(data.has_value());
    EXPECT_TRUE(data->IsPooled());

    m_Pool.reset();
    EXPECT_FALSE(data->IsPooled());
    EXPECT_NE((*data)->GetHandle(), VK_NULL_HANDLE);
}
