module;
#include "RHI.Vulkan.hpp"
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <memory>
#include <span>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "Core.Profiling.Macros.hpp"

module RHI:Pool.Impl;
import :Pool;
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

namespace RHI
{
    namespace
    {
        // Attaches the resource kind to a construction failure.
        template <typename T>
        std::expected<std::unique_ptr<T>, PoolError> Tagged(ResourceKind kind, Core::Expected<std::unique_ptr<T>> created)
        {
            if (!created)
            {
                Core::Log::Error("Pool: failed to construct {} ({})", ResourceKindToString(kind),
                                 Core::ErrorCodeToString(created.error()));
                return std::unexpected(PoolError{kind, created.error()});
            }
            return std::move(*created);
        }

        // Runs `prepare` on an object that came out of an idle queue. If it fails the
        // object is not returned to the queue: it is destroyed and the error reported.
        template <typename T, typename Prepare>
        PoolResult<T> PrepareReused(ResourceKind kind, PoolResult<T> lease, Prepare&& prepare)
        {
            if (!lease) return lease;

            if (Core::Result prepared = prepare(**lease); !prepared)
            {
                Core::Log::Warn("Pool: discarding recycled {} ({})", ResourceKindToString(kind),
                                Core::ErrorCodeToString(prepared.error()));
                std::unique_ptr<T> discarded = lease->Release();
                return std::unexpected(PoolError{kind, prepared.error()});
            }
            return lease;
        }

        template <typename Key, typename T, typename Hash>
        void Collect(PoolStats& stats, ResourceKind kind, const Core::LeaseArena<Key, T, Hash>& arena)
        {
            stats.Idle[static_cast<size_t>(kind)] = arena.IdleCount();
            stats.Constructed[static_cast<size_t>(kind)] = arena.ConstructedCount();
        }

        template <typename Key, typename T, typename Hash>
        size_t EvictKind(Core::LeaseArena<Key, T, Hash>& arena, ResourceKind kind, uint64_t threshold, const DrainVisitor& visitor)
        {
            return arena.Evict(threshold, [&](const Key&, const T&, uint64_t idleFrames)
            {
                if (visitor) visitor(kind, idleFrames);
            });
        }
    }

    Pool::Pool(VulkanDevice& device, ShaderLibrary& shaders, PoolConfig config)
        : m_Device(device), m_Shaders(shaders), m_Config(config)
    {
    }

    Pool::~Pool()
    {
        const PoolStats stats = GetStats();
        size_t idle = 0;
        for (size_t count : stats.Idle) idle += count;
        Core::Log::Debug("Pool: destroying {} idle objects and {} render passes", idle, m_RenderPasses.size());
    }

    PoolResult<CommandPool> Pool::AcquireCommandPool(uint32_t queueFamily)
    {
        const size_t reused = m_CommandPools.ReuseCount();
        auto lease = m_CommandPools.Acquire(queueFamily,
            [](const CommandPool&) { return true; },
            [&] { return Tagged(ResourceKind::CommandPool, CommandPool::Create(m_Device, queueFamily)); });

        if (m_CommandPools.ReuseCount() == reused) return lease;
        return PrepareReused(ResourceKind::CommandPool, std::move(lease), [](CommandPool& pool) { return pool.Reset(); });
    }

    PoolResult<CommandBuffer> Pool::AcquireCommandBuffer(uint32_t queueFamily)
    {
        const size_t reused = m_CommandBuffers.ReuseCount();
        auto lease = m_CommandBuffers.Acquire(queueFamily,
            [](const CommandBuffer& cmd)
            {
                auto executed = cmd.HasExecuted();
                return executed && *executed;
            },
            [&]
            {
                return Tagged(ResourceKind::CommandBuffer,
                              CommandBuffer::Create(m_Device, CommandBufferInfo{.QueueFamilyIndex = queueFamily}));
            });

        if (m_CommandBuffers.ReuseCount() == reused) return lease;
        return PrepareReused(ResourceKind::CommandBuffer, std::move(lease), [](CommandBuffer& cmd) { return cmd.Recycle(); });
    }

    PoolResult<Fence> Pool::AcquireFence()
    {
        const size_t reused = m_Fences.ReuseCount();
        auto lease = m_Fences.Acquire(std::monostate{},
            [](const Fence&) { return true; },
            [&] { return Tagged(ResourceKind::Fence, Fence::Create(m_Device, false)); });

        if (m_Fences.ReuseCount() == reused) return lease;
        return PrepareReused(ResourceKind::Fence, std::move(lease), [](Fence& fence) { return fence.Reset(); });
    }

    PoolResult<DescriptorPool> Pool::AcquireDescriptorPool(uint32_t maxSets, std::span<const DescriptorPoolSize> poolSizes)
    {
        std::vector<DescriptorPoolSize> key = NormalizePoolSizes(poolSizes);

        return m_DescriptorPools.Acquire(key,
            [maxSets](const DescriptorPool& pool) { return pool.GetAvailableSetCount() >= maxSets; },
            [&]
            {
                return Tagged(ResourceKind::DescriptorPool,
                              DescriptorPool::Create(m_Device, DescriptorPoolInfo{.MaxSets = maxSets, .PoolSizes = key}));
            });
    }

    PoolResult<ComputePipeline> Pool::AcquireCompute(ComputeMode mode, uint32_t maxSets)
    {
        return m_ComputePipelines.Acquire(mode,
            [maxSets](const ComputePipeline& pipeline) { return pipeline.GetMaxSets() >= maxSets; },
            [&] { return Tagged(ResourceKind::ComputePipeline, ComputePipeline::Create(m_Device, m_Shaders, mode, maxSets)); });
    }

    PoolResult<GraphicsPipeline> Pool::AcquireGraphics(GraphicsMode mode, const RenderPassMode& renderPass,
                                                       uint32_t subpassIndex, uint32_t maxSets)
    {
        auto pass = GetRenderPass(renderPass);
        if (!pass)
            return std::unexpected(PoolError{ResourceKind::GraphicsPipeline, pass.error()});

        if (subpassIndex >= (*pass)->GetSubpassCount())
        {
            Core::Log::Error("Pool: {} requested for subpass {} of a {}-subpass render pass",
                             GraphicsModeToString(mode), subpassIndex, (*pass)->GetSubpassCount());
            return std::unexpected(PoolError{ResourceKind::GraphicsPipeline, Core::ErrorCode::InvalidArgument});
        }

        const Subpass subpass = (*pass)->GetSubpass(subpassIndex);
        const GraphicsPipelineKey key{.Mode = mode, .RenderPass = renderPass, .SubpassIndex = subpassIndex};

        return m_GraphicsPipelines.Acquire(key,
            [maxSets](const GraphicsPipeline& pipeline) { return pipeline.GetMaxSets() >= maxSets; },
            [&]
            {
                return Tagged(ResourceKind::GraphicsPipeline,
                              GraphicsPipeline::Create(m_Device, m_Shaders, mode, subpass, maxSets));
            });
    }

    PoolResult<DeviceMemory> Pool::AcquireMemory(uint32_t memoryTypeIndex, VkDeviceSize size)
    {
        return m_Memory.Acquire(memoryTypeIndex,
            [size](const DeviceMemory& memory) { return memory.GetSize() >= size; },
            [&] { return Tagged(ResourceKind::Memory, DeviceMemory::Create(m_Device, memoryTypeIndex, size)); });
    }

    PoolResult<VulkanImage> Pool::AcquireTexture(const TextureInfo& info, std::string_view debugName)
    {
        PROFILE_SCOPE("Pool::AcquireTexture");

        const size_t constructed = m_Textures.ConstructedCount();
        auto lease = m_Textures.Acquire(info,
            [](const VulkanImage&) { return true; },
            [&] { return Tagged(ResourceKind::Texture, VulkanImage::Create(m_Device, info)); });
        if (!lease) return lease;

        // Textures of one description tend to be requested in pairs (ping-pong targets).
        if (m_Config.SeedTextures && m_Textures.ConstructedCount() != constructed)
        {
            if (auto spare = VulkanImage::Create(m_Device, info))
            {
                if (!debugName.empty())
                    (*spare)->SetDebugName(std::format("{} (Unused)", debugName));
                m_Textures.Seed(info, std::move(*spare));
            }
            else
                Core::Log::Warn("Pool: could not seed a spare texture ({})", Core::ErrorCodeToString(spare.error()));
        }

        // A reused spare keeps its "(Unused)" label until a caller names it.
        if (!debugName.empty())
            (*lease)->SetDebugName(debugName);

        return lease;
    }

    PoolResult<VulkanBuffer> Pool::AcquireData(VkDeviceSize length, VkBufferUsageFlags usage)
    {
        return m_Data.Acquire(usage,
            [length](const VulkanBuffer& buffer) { return buffer.GetCapacity() >= length; },
            [&] { return Tagged(ResourceKind::Data, VulkanBuffer::Create(m_Device, length, usage)); });
    }

    Core::Expected<const RenderPass*> Pool::GetRenderPass(const RenderPassMode& mode)
    {
        if (auto it = m_RenderPasses.find(mode); it != m_RenderPasses.end())
            return it->second.get();

        auto built = BuildRenderPass(m_Device, mode);
        if (!built) return std::unexpected(built.error());

        const RenderPass* pass = built->get();
        m_RenderPasses.emplace(mode, std::move(*built));
        return pass;
    }

    size_t Pool::Drain(const DrainVisitor& visitor)
    {
        PROFILE_FUNCTION();

        const uint64_t threshold = m_Config.LruThreshold;
        size_t evicted = 0;
        evicted += EvictKind(m_CommandPools, ResourceKind::CommandPool, threshold, visitor);
        evicted += EvictKind(m_CommandBuffers, ResourceKind::CommandBuffer, threshold, visitor);
        evicted += EvictKind(m_Fences, ResourceKind::Fence, threshold, visitor);
        evicted += EvictKind(m_DescriptorPools, ResourceKind::DescriptorPool, threshold, visitor);
        evicted += EvictKind(m_ComputePipelines, ResourceKind::ComputePipeline, threshold, visitor);
        evicted += EvictKind(m_GraphicsPipelines, ResourceKind::GraphicsPipeline, threshold, visitor);
        evicted += EvictKind(m_Memory, ResourceKind::Memory, threshold, visitor);
        evicted += EvictKind(m_Textures, ResourceKind::Texture, threshold, visitor);
        evicted += EvictKind(m_Data, ResourceKind::Data, threshold, visitor);

        if (evicted > 0)
            Core::Log::Debug("Pool: drained {} idle objects at frame {}", evicted, m_FrameNumber);
        return evicted;
    }

    PoolStats Pool::GetStats() const
    {
        PoolStats stats{};
        Collect(stats, ResourceKind::CommandPool, m_CommandPools);
        Collect(stats, ResourceKind::CommandBuffer, m_CommandBuffers);
        Collect(stats, ResourceKind::Fence, m_Fences);
        Collect(stats, ResourceKind::DescriptorPool, m_DescriptorPools);
        Collect(stats, ResourceKind::ComputePipeline, m_ComputePipelines);
        Collect(stats, ResourceKind::GraphicsPipeline, m_GraphicsPipelines);
        Collect(stats, ResourceKind::Memory, m_Memory);
        Collect(stats, ResourceKind::Texture, m_Textures);
        Collect(stats, ResourceKind::Data, m_Data);
        return stats;
    }
}
