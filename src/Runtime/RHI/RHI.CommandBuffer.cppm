module;
#include "RHI.Vulkan.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <type_traits>
#include <utility>

export module RHI:CommandBuffer;

import :Device;
import Core;

export namespace RHI
{
    struct CommandBufferInfo
    {
        uint32_t QueueFamilyIndex = 0;

        bool operator==(const CommandBufferInfo&) const = default;
    };

    enum class CommandBufferState : uint8_t
    {
        Idle,      // Nothing recorded, or the last submission was reclaimed.
        Recording, // Between Begin() and End().
        Recorded,  // Executable, not yet submitted.
        Submitted, // Handed to the queue. HasExecuted() tells when the GPU is done.
    };

    // -------------------------------------------------------------------------
    // CommandBuffer - one primary buffer with its own pool, fence and timestamps
    // -------------------------------------------------------------------------
    // Objects referenced by recorded work can be handed to PushFencedDrop(); they
    // are destroyed by DropFenced() only once the fence confirms the submission
    // that used them has completed.
    //
    // Timestamp slots: 0 = start, 1 = end. Both are reset at the start of every recording.
    // -------------------------------------------------------------------------
    class CommandBuffer
    {
    public:
        static constexpr uint32_t TimestampSlotCount = 2;

        [[nodiscard]] static Core::Expected<std::unique_ptr<CommandBuffer>> Create(VulkanDevice& device, const CommandBufferInfo& info);

        ~CommandBuffer();

        CommandBuffer(const CommandBuffer&) = delete;
        CommandBuffer& operator=(const CommandBuffer&) = delete;

        [[nodiscard]] VkCommandBuffer GetHandle() const { return m_Cmd; }
        [[nodiscard]] VkFence GetFence() const { return m_Fence; }
        [[nodiscard]] VkQueryPool GetQueryPool() const { return m_QueryPool; }
        [[nodiscard]] const CommandBufferInfo& GetInfo() const { return m_Info; }
        [[nodiscard]] CommandBufferState GetState() const { return m_State; }

        // Number of successful Submit() calls. The generation fenced drops are tagged with.
        [[nodiscard]] uint64_t GetSubmitCount() const { return m_SubmitCount; }
        [[nodiscard]] size_t GetPendingDropCount() const { return m_Retired.Size(); }

        // Resets the buffer and opens it for one-time-submit recording.
        // Fails with InvalidState while the previous submission is still executing.
        [[nodiscard]] Core::Result Begin();
        [[nodiscard]] Core::Result End();

        // Resets the fence, submits to the queue of this buffer's family and advances the generation.
        [[nodiscard]] Core::Result Submit();

        // Non-blocking fence poll. A lost device is reported as ErrorCode::DeviceLost and is terminal.
        [[nodiscard]] Core::Expected<bool> HasExecuted() const;

        // Blocks until the fence signals. No timeout.
        [[nodiscard]] Core::Result WaitUntilExecuted() const;

        // Keeps `thing` alive until the submission that may reference it has executed.
        // While recording (or before the first submit) that is the next submission.
        template <typename T>
        void PushFencedDrop(T&& thing)
        {
            static_assert(std::is_move_constructible_v<std::decay_t<T>>, "PushFencedDrop(): type must be movable");
            const uint64_t generation = (m_State == CommandBufferState::Submitted) ? m_SubmitCount : m_SubmitCount + 1;
            m_Retired.Push(generation, std::forward<T>(thing));
        }

        // Destroys every fenced drop whose submission has completed. Returns how many were dropped.
        [[nodiscard]] Core::Expected<size_t> DropFenced();

        // Readies an executed buffer for a new user: drops everything fenced and returns to Idle.
        [[nodiscard]] Core::Result Recycle();

        // Recording helpers. Begin() resets both timestamp slots.
        [[nodiscard]] Core::Result WriteTimestamp(uint32_t slot, VkPipelineStageFlagBits stage);

        template <typename T>
        void PushConstants(VkPipelineLayout layout, VkShaderStageFlags stages, uint32_t offset, const T& value)
        {
            static_assert(std::is_trivially_copyable_v<T>, "PushConstants(): payload must be trivially copyable");
            vkCmdPushConstants(m_Cmd, layout, stages, offset, static_cast<uint32_t>(sizeof(T)), &value);
        }

        // Blocking read of both timestamps of the last submission.
        // InvalidState if the recording did not write both slots.
        [[nodiscard]] Core::Expected<std::array<uint64_t, 2>> GetQueryResults() const;
        [[nodiscard]] Core::Expected<double> GetElapsedNanoseconds() const;

    private:
        CommandBuffer(VulkanDevice& device, const CommandBufferInfo& info) : m_Device(device), m_Info(info) {}

        [[nodiscard]] Core::Result RecreateSignaledFence();

        VulkanDevice& m_Device;
        CommandBufferInfo m_Info;

        VkCommandPool m_Pool = VK_NULL_HANDLE;
        VkCommandBuffer m_Cmd = VK_NULL_HANDLE;
        VkFence m_Fence = VK_NULL_HANDLE;
        VkQueryPool m_QueryPool = VK_NULL_HANDLE;

        CommandBufferState m_State = CommandBufferState::Idle;
        uint64_t m_SubmitCount = 0;

        // Bit per timestamp slot written in the current recording / last submission.
        uint32_t m_RecordedTimestamps = 0;
        uint32_t m_SubmittedTimestamps = 0;

        Core::RetireQueue m_Retired;
    };
}
