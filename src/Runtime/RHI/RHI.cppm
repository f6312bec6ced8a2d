export module RHI;

export import :Context;
export import :Device;
export import :Types;
export import :Fence;
export import :CommandPool;
export import :CommandBuffer;
export import :Descriptors;
export import :Buffer;
export import :Image;
export import :Memory;
export import :Shader;
export import :RenderPass;
export import :PipelineLayout;
export import :ComputePipeline;
export import :Pipeline;
export import :Pool;
