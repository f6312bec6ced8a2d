// RHI.Vma.cpp - plain translation unit (no module declaration) holding the VMA implementation.

#include <cstdlib>
#include <cstdio>

#ifndef VK_NO_PROTOTYPES
    #define VK_NO_PROTOTYPES
#endif
#include <volk.h>

// Must match every other inclusion of vk_mem_alloc.h.
#define VMA_IMPLEMENTATION
#define VMA_STATIC_VULKAN_FUNCTIONS 0
#define VMA_DYNAMIC_VULKAN_FUNCTIONS 1
#define VMA_USE_NULLABILITY_ANNOTATIONS 0

#define VMA_SYSTEM_MALLOC(size) std::malloc(size)
#define VMA_SYSTEM_FREE(ptr) std::free(ptr)
#define VMA_SYSTEM_ALIGNED_MALLOC(size, align) std::aligned_alloc(align, size)
#define VMA_SYSTEM_ALIGNED_FREE(ptr) std::free(ptr)

#include <vk_mem_alloc.h>
