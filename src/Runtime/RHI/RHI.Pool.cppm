module;
#include "RHI.Vulkan.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <span>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

export module RHI:Pool;

import :Device;
import :Types;
import :Fence;
import :CommandPool;
import :CommandBuffer;
import :Descriptors;
import :Buffer;
import :Image;
import :Memory;
import :Shader;
import :RenderPass;
import :ComputePipeline;
import :Pipeline;
import Core;

export namespace RHI
{
    enum class ResourceKind : uint8_t
    {
        CommandPool,
        CommandBuffer,
        Fence,
        DescriptorPool,
        ComputePipeline,
        GraphicsPipeline,
        Memory,
        Texture,
        Data,
    };

    inline constexpr size_t ResourceKindCount = 9;

    [[nodiscard]] constexpr std::string_view ResourceKindToString(ResourceKind kind)
    {
        switch (kind)
        {
            case ResourceKind::CommandPool: return "CommandPool";
            case ResourceKind::CommandBuffer: return "CommandBuffer";
            case ResourceKind::Fence: return "Fence";
            case ResourceKind::DescriptorPool: return "DescriptorPool";
            case ResourceKind::ComputePipeline: return "ComputePipeline";
            case ResourceKind::GraphicsPipeline: return "GraphicsPipeline";
            case ResourceKind::Memory: return "Memory";
            case ResourceKind::Texture: return "Texture";
            case ResourceKind::Data: return "Data";
        }
        return "Unknown";
    }

    // A failed acquisition: which kind of object could not be constructed, and why.
    struct PoolError
    {
        ResourceKind Kind;
        Core::ErrorCode Code;

        bool operator==(const PoolError&) const = default;
    };

    template <typename T>
    using PoolResult = std::expected<Core::Lease<T>, PoolError>;

    struct PoolConfig
    {
        // Frames an idle object may go unused before Drain() destroys it.
        uint64_t LruThreshold = 8;
        // A texture miss also constructs a spare of the same description.
        bool SeedTextures = true;
    };

    struct GraphicsPipelineKey
    {
        GraphicsMode Mode;
        RenderPassMode RenderPass;
        uint32_t SubpassIndex = 0;

        bool operator==(const GraphicsPipelineKey&) const = default;
    };

    struct PoolStats
    {
        std::array<size_t, ResourceKindCount> Idle{};
        std::array<size_t, ResourceKindCount> Constructed{};

        [[nodiscard]] size_t IdleOf(ResourceKind kind) const { return Idle[static_cast<size_t>(kind)]; }
        [[nodiscard]] size_t ConstructedOf(ResourceKind kind) const { return Constructed[static_cast<size_t>(kind)]; }
    };

    // visitor(kind, idleFrames), called right before an evicted object is destroyed.
    using DrainVisitor = std::function<void(ResourceKind, uint64_t)>;
}

namespace RHI
{
    struct GraphicsPipelineKeyHash
    {
        size_t operator()(const GraphicsPipelineKey& key) const noexcept
        {
            return Core::Hash::HashAll(static_cast<uint32_t>(key.Mode),
                                       std::hash<RenderPassMode>{}(key.RenderPass),
                                       key.SubpassIndex);
        }
    };

    struct PoolSizesHash
    {
        size_t operator()(const std::vector<DescriptorPoolSize>& sizes) const noexcept
        {
            size_t seed = sizes.size();
            for (const DescriptorPoolSize& size : sizes)
                Core::Hash::HashCombine(seed, Core::Hash::HashAll(static_cast<int32_t>(size.Type), size.DescriptorCount));
            return seed;
        }
    };
}

export namespace RHI
{
    // -------------------------------------------------------------------------
    // Pool - leases short-lived GPU objects, constructing only on a miss
    // -------------------------------------------------------------------------
    // One Core::LeaseArena per resource kind. Leases return their object to
    // the arena when they die; Drain() destroys what stayed idle too long.
    // Leases may outlive the Pool: their objects are then destroyed on release.
    //
    // Single-threaded: owned by the frame-building thread.
    // -------------------------------------------------------------------------
    class Pool
    {
    public:
        Pool(VulkanDevice& device, ShaderLibrary& shaders, PoolConfig config = {});
        ~Pool();

        Pool(const Pool&) = delete;
        Pool& operator=(const Pool&) = delete;
        Pool(Pool&&) = delete;
        Pool& operator=(Pool&&) = delete;

        // Reset before it is handed out again.
        [[nodiscard]] PoolResult<CommandPool> AcquireCommandPool(uint32_t queueFamily);
        // Only buffers whose last submission executed are reused; their fenced drops are swept first.
        [[nodiscard]] PoolResult<CommandBuffer> AcquireCommandBuffer(uint32_t queueFamily);
        // Unsignaled.
        [[nodiscard]] PoolResult<Fence> AcquireFence();
        [[nodiscard]] PoolResult<DescriptorPool> AcquireDescriptorPool(uint32_t maxSets, std::span<const DescriptorPoolSize> poolSizes);
        [[nodiscard]] PoolResult<ComputePipeline> AcquireCompute(ComputeMode mode, uint32_t maxSets = 1);
        [[nodiscard]] PoolResult<GraphicsPipeline> AcquireGraphics(GraphicsMode mode, const RenderPassMode& renderPass,
                                                                   uint32_t subpassIndex, uint32_t maxSets = 1);
        [[nodiscard]] PoolResult<DeviceMemory> AcquireMemory(uint32_t memoryTypeIndex, VkDeviceSize size);
        [[nodiscard]] PoolResult<VulkanImage> AcquireTexture(const TextureInfo& info, std::string_view debugName = {});
        [[nodiscard]] PoolResult<VulkanBuffer> AcquireData(VkDeviceSize length, VkBufferUsageFlags usage = 0);

        // Memoized per mode. Never evicted by Drain().
        [[nodiscard]] Core::Expected<const RenderPass*> GetRenderPass(const RenderPassMode& mode);

        void AdvanceFrame() { ++m_FrameNumber; }
        [[nodiscard]] uint64_t GetFrameNumber() const { return m_FrameNumber; }

        // Destroys every idle object unused for more than LruThreshold frames. Returns how many.
        size_t Drain(const DrainVisitor& visitor = {});

        [[nodiscard]] PoolStats GetStats() const;
        [[nodiscard]] const PoolConfig& GetConfig() const { return m_Config; }
        [[nodiscard]] size_t GetRenderPassCount() const { return m_RenderPasses.size(); }

    private:
        VulkanDevice& m_Device;
        ShaderLibrary& m_Shaders;
        PoolConfig m_Config;
        uint64_t m_FrameNumber = 0;

        std::unordered_map<RenderPassMode, std::unique_ptr<RenderPass>> m_RenderPasses;

        Core::LeaseArena<uint32_t, CommandPool> m_CommandPools{&m_FrameNumber};
        Core::LeaseArena<uint32_t, CommandBuffer> m_CommandBuffers{&m_FrameNumber};
        Core::LeaseArena<std::monostate, Fence> m_Fences{&m_FrameNumber};
        Core::LeaseArena<std::vector<DescriptorPoolSize>, DescriptorPool, PoolSizesHash> m_DescriptorPools{&m_FrameNumber};
        Core::LeaseArena<ComputeMode, ComputePipeline> m_ComputePipelines{&m_FrameNumber};
        Core::LeaseArena<GraphicsPipelineKey, GraphicsPipeline, GraphicsPipelineKeyHash> m_GraphicsPipelines{&m_FrameNumber};
        Core::LeaseArena<uint32_t, DeviceMemory> m_Memory{&m_FrameNumber};
        Core::LeaseArena<TextureInfo, VulkanImage> m_Textures{&m_FrameNumber};
        Core::LeaseArena<VkBufferUsageFlags, VulkanBuffer> m_Data{&m_FrameNumber};
    };
}
