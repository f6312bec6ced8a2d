#include <gtest/gtest.h>
#include <array>
#include <cstdint>
#include <memory>

#include "RHI.Vulkan.hpp"

import Core;
import RHI;

#include "TestDevice.h"

namespace
{
    class CommandBufferTest : public DeviceTest
    {
    protected:
        void SetUp() override
        {
            DeviceTest::SetUp();
            if (IsSkipped()) return;

            auto cmd = RHI::CommandBuffer::Create(*m_Device, RHI::CommandBufferInfo{.QueueFamilyIndex = GraphicsFamily()});
            ASSERT_TRUE(cmd.has_value());
            m_Cmd = std::move(*cmd);
        }

        void TearDown() override
        {
            if (m_Event != VK_NULL_HANDLE)
            {
                // Unblock anything still waiting before the buffer's destructor waits on its fence.
                vkSetEvent(m_Device->GetLogicalDevice(), m_Event);
                if (m_Cmd) (void)m_Cmd->WaitUntilExecuted();
                vkDestroyEvent(m_Device->GetLogicalDevice(), m_Event, nullptr);
                m_Event = VK_NULL_HANDLE;
            }
            m_Cmd.reset();
            DeviceTest::TearDown();
        }

        // Records a wait on a host-signaled event so the submission stays pending until ReleaseGpu().
        void RecordBlockedSubmission()
        {
            VkEventCreateInfo eventInfo{};
            eventInfo.sType = VK_STRUCTURE_TYPE_EVENT_CREATE_INFO;
            ASSERT_EQ(vkCreateEvent(m_Device->GetLogicalDevice(), &eventInfo, nullptr, &m_Event), VK_SUCCESS);

            ASSERT_TRUE(m_Cmd->Begin().has_value());
            vkCmdWaitEvents(m_Cmd->GetHandle(), 1, &m_Event,
                            VK_PIPELINE_STAGE_HOST_BIT, VK_PIPELINE_STAGE_ALL_COMMANDS_BIT,
                            0, nullptr, 0, nullptr, 0, nullptr);
            ASSERT_TRUE(m_Cmd->End().has_value());
            ASSERT_TRUE(m_Cmd->Submit().has_value());
        }

        void ReleaseGpu()
        {
            ASSERT_EQ(vkSetEvent(m_Device->GetLogicalDevice(), m_Event), VK_SUCCESS);
        }

        std::unique_ptr<RHI::CommandBuffer> m_Cmd;
        VkEvent m_Event = VK_NULL_HANDLE;
    };

    struct DropCounter
    {
        explicit DropCounter(int* counter) : Counter(counter) {}
        DropCounter(DropCounter&& other) noexcept : Counter(other.Counter) { other.Counter = nullptr; }
        ~DropCounter()
        {
            if (Counter) ++*Counter;
        }

        int* Counter = nullptr;
    };
}

TEST_F(CommandBufferTest, FreshBufferHasExecuted)
{
    EXPECT_EQ(m_Cmd->GetState(), RHI::CommandBufferState::Idle);
    EXPECT_EQ(m_Cmd->GetSubmitCount(), 0u);

    auto executed = m_Cmd->HasExecuted();
    ASSERT_TRUE(executed.has_value());
    EXPECT_TRUE(*executed);
}

TEST_F(CommandBufferTest, HasExecutedFollowsTheFence)
{
    RecordBlockedSubmission();
    EXPECT_EQ(m_Cmd->GetState(), RHI::CommandBufferState::Submitted);
    EXPECT_EQ(m_Cmd->GetSubmitCount(), 1u);

    auto pending = m_Cmd->HasExecuted();
    ASSERT_TRUE(pending.has_value());
    EXPECT_FALSE(*pending);

    ReleaseGpu();
    ASSERT_TRUE(m_Cmd->WaitUntilExecuted().has_value());

    auto done = m_Cmd->HasExecuted();
    ASSERT_TRUE(done.has_value());
    EXPECT_TRUE(*done);
}

TEST_F(CommandBufferTest, BeginRefusesPendingSubmission)
{
    RecordBlockedSubmission();

    auto begin = m_Cmd->Begin();
    ASSERT_FALSE(begin.has_value());
    EXPECT_EQ(begin.error(), Core::ErrorCode::InvalidState);

    ReleaseGpu();
    ASSERT_TRUE(m_Cmd->WaitUntilExecuted().has_value());
    EXPECT_TRUE(m_Cmd->Begin().has_value());
    EXPECT_TRUE(m_Cmd->End().has_value());
}

TEST_F(CommandBufferTest, RecordingStateIsEnforced)
{
    auto submit = m_Cmd->Submit();
    ASSERT_FALSE(submit.has_value());
    EXPECT_EQ(submit.error(), Core::ErrorCode::InvalidState);

    auto end = m_Cmd->End();
    ASSERT_FALSE(end.has_value());
    EXPECT_EQ(end.error(), Core::ErrorCode::InvalidState);

    ASSERT_TRUE(m_Cmd->Begin().has_value());
    auto again = m_Cmd->Begin();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), Core::ErrorCode::InvalidState);
    ASSERT_TRUE(m_Cmd->End().has_value());
}

TEST_F(CommandBufferTest, FencedDropWaitsForExecution)
{
    int dropped = 0;

    ASSERT_TRUE(m_Cmd->Begin().has_value());
    m_Cmd->PushFencedDrop(DropCounter{&dropped});
    EXPECT_EQ(m_Cmd->GetPendingDropCount(), 1u);

    // Nothing submitted yet: the drop belongs to the upcoming submission.
    auto early = m_Cmd->DropFenced();
    ASSERT_TRUE(early.has_value());
    EXPECT_EQ(*early, 0u);
    EXPECT_EQ(dropped, 0);

    ASSERT_TRUE(m_Cmd->End().has_value());
    ASSERT_TRUE(m_Cmd->Submit().has_value());
    ASSERT_TRUE(m_Cmd->WaitUntilExecuted().has_value());

    auto swept = m_Cmd->DropFenced();
    ASSERT_TRUE(swept.has_value());
    EXPECT_EQ(*swept, 1u);
    EXPECT_EQ(dropped, 1);
    EXPECT_EQ(m_Cmd->GetPendingDropCount(), 0u);
}

TEST_F(CommandBufferTest, FencedDropHeldWhileSubmissionPending)
{
    int dropped = 0;
    RecordBlockedSubmission();
    m_Cmd->PushFencedDrop(DropCounter{&dropped});

    auto pending = m_Cmd->DropFenced();
    ASSERT_TRUE(pending.has_value());
    EXPECT_EQ(*pending, 0u);
    EXPECT_EQ(dropped, 0);

    ReleaseGpu();
    ASSERT_TRUE(m_Cmd->WaitUntilExecuted().has_value());

    auto swept = m_Cmd->DropFenced();
    ASSERT_TRUE(swept.has_value());
    EXPECT_EQ(*swept, 1u);
    EXPECT_EQ(dropped, 1);
}

TEST_F(CommandBufferTest, DestructorWaitsAndDropsEverything)
{
    int dropped = 0;
    ASSERT_TRUE(m_Cmd->Begin().has_value());
    m_Cmd->PushFencedDrop(DropCounter{&dropped});
    ASSERT_TRUE(m_Cmd->End().has_value());
    ASSERT_TRUE(m_Cmd->Submit().has_value());

    m_Cmd.reset();
    EXPECT_EQ(dropped, 1);
}

TEST_F(CommandBufferTest, RecycleReturnsToIdle)
{
    int dropped = 0;
    ASSERT_TRUE(m_Cmd->Begin().has_value());
    ASSERT_TRUE(m_Cmd->End().has_value());
    ASSERT_TRUE(m_Cmd->Submit().has_value());
    m_Cmd->PushFencedDrop(DropCounter{&dropped});
    ASSERT_TRUE(m_Cmd->WaitUntilExecuted().has_value());

    ASSERT_TRUE(m_Cmd->Recycle().has_value());
    EXPECT_EQ(m_Cmd->GetState(), RHI::CommandBufferState::Idle);
    EXPECT_EQ(dropped, 1);
}

TEST_F(CommandBufferTest, QueryResultsRequireBothTimestamps)
{
    auto none = m_Cmd->GetQueryResults();
    ASSERT_FALSE(none.has_value());
    EXPECT_EQ(none.error(), Core::ErrorCode::InvalidState);

    auto outOfRange = m_Cmd->WriteTimestamp(RHI::CommandBuffer::TimestampSlotCount, VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT);
    ASSERT_FALSE(outOfRange.has_value());
    EXPECT_EQ(outOfRange.error(), Core::ErrorCode::InvalidArgument);
}

TEST_F(CommandBufferTest, TimestampsBracketSubmission)
{
    if (!m_Device->SupportsTimestamps(GraphicsFamily()))
        GTEST_SKIP() << "Queue family has no timestamp support";

    ASSERT_TRUE(m_Cmd->Begin().has_value());
    ASSERT_TRUE(m_Cmd->WriteTimestamp(0, VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT).has_value());
    ASSERT_TRUE(m_Cmd->WriteTimestamp(1, VK_PIPELINE_STAGE_BOTTOM_OF_PIPE_BIT).has_value());
    ASSERT_TRUE(m_Cmd->End().has_value());
    ASSERT_TRUE(m_Cmd->Submit().has_value());
    ASSERT_TRUE(m_Cmd->WaitUntilExecuted().has_value());

    auto results = m_Cmd->GetQueryResults();
    ASSERT_TRUE(results.has_value());
    EXPECT_GE((*results)[1], (*results)[0]);

    auto elapsed = m_Cmd->GetElapsedNanoseconds();
    ASSERT_TRUE(elapsed.has_value());
    EXPECT_GE(*elapsed, 0.0);
}

TEST_F(CommandBufferTest, TimestampsAreFreshOnEveryRecording)
{
    if (!m_Device->SupportsTimestamps(GraphicsFamily()))
        GTEST_SKIP() << "Queue family has no timestamp support";

    for (int submission = 0; submission < 2; ++submission)
    {
        ASSERT_TRUE(m_Cmd->Begin().has_value());
        ASSERT_TRUE(m_Cmd->WriteTimestamp(0, VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT).has_value());
        ASSERT_TRUE(m_Cmd->WriteTimestamp(1, VK_PIPELINE_STAGE_BOTTOM_OF_PIPE_BIT).has_value());
        ASSERT_TRUE(m_Cmd->End().has_value());
        ASSERT_TRUE(m_Cmd->Submit().has_value());
        ASSERT_TRUE(m_Cmd->WaitUntilExecuted().has_value());

        auto results = m_Cmd->GetQueryResults();
        ASSERT_TRUE(results.has_value()) << "submission " << submission;
        EXPECT_GE((*results)[1], (*results)[0]);
        EXPECT_TRUE(m_Cmd->GetElapsedNanoseconds().has_value());
    }
}

TEST_F(CommandBufferTest, TimestampsRequireRecording)
{
    auto early = m_Cmd->WriteTimestamp(0, VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT);
    ASSERT_FALSE(early.has_value());
    EXPECT_TRUE(early.error() == Core::ErrorCode::InvalidState || early.error() == Core::ErrorCode::Unsupported);
}
