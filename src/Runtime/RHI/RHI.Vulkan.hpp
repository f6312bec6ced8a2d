#pragma once

// Every translation unit that touches Vulkan goes through this header so that
// the prototype configuration cannot diverge between files.
#ifndef VK_NO_PROTOTYPES
    #define VK_NO_PROTOTYPES
#endif

#include <volk.h>
#include <cstdio>

// VMA declarations only. The implementation lives in RHI.Vma.cpp.
#include <vk_mem_alloc.h>

// For calls with no recovery path (teardown, resets of objects we own).
// Fallible calls return Core::Expected through RHI::ToErrorCode instead.
#ifndef NDEBUG
    #define VK_CHECK(x)                                                              \
        do {                                                                         \
            VkResult result = x;                                                     \
            if (result != VK_SUCCESS) {                                              \
                std::fprintf(stderr, "Vulkan Error: %s failed with result %d at %s:%d\n", \
                       #x, static_cast<int>(result), __FILE__, __LINE__);            \
            }                                                                        \
        } while(0)
#else
    #define VK_CHECK(x) (void)(x)
#endif
