module;
#include "RHI.Vulkan.hpp"
#include <glm/glm.hpp>
#include <array>
#include <cstdint>
#include <string_view>

export module RHI:Types;

export namespace RHI {

    // Closed set of graphics pipelines. Every switch over this enum is exhaustive (no default).
    enum class GraphicsMode : uint8_t {
        BlendNormal,
        DrawLine,
        DrawMesh,
        DrawPointLight,
        DrawRectLight,
        DrawSpotlight,
        DrawSunlight,
        Font,
        FontOutline,
        Gradient,
        GradientTransparency,
        Texture,
    };

    enum class ComputeMode : uint8_t {
        CalculateVertexAttributes,
        DecodeRgbRgba,
    };

    constexpr std::string_view GraphicsModeToString(GraphicsMode mode) {
        switch (mode) {
            case GraphicsMode::BlendNormal:          return "BlendNormal";
            case GraphicsMode::DrawLine:             return "DrawLine";
            case GraphicsMode::DrawMesh:             return "DrawMesh";
            case GraphicsMode::DrawPointLight:       return "DrawPointLight";
            case GraphicsMode::DrawRectLight:        return "DrawRectLight";
            case GraphicsMode::DrawSpotlight:        return "DrawSpotlight";
            case GraphicsMode::DrawSunlight:         return "DrawSunlight";
            case GraphicsMode::Font:                 return "Font";
            case GraphicsMode::FontOutline:          return "FontOutline";
            case GraphicsMode::Gradient:             return "Gradient";
            case GraphicsMode::GradientTransparency: return "GradientTransparency";
            case GraphicsMode::Texture:              return "Texture";
        }
        return "Unknown";
    }

    constexpr std::string_view ComputeModeToString(ComputeMode mode) {
        switch (mode) {
            case ComputeMode::CalculateVertexAttributes: return "CalculateVertexAttributes";
            case ComputeMode::DecodeRgbRgba:             return "DecodeRgbRgba";
        }
        return "Unknown";
    }

    // -------------------------------------------------------------------------
    // Push constants
    // -------------------------------------------------------------------------
    // Byte range [Begin, End) visible to Stages. Empty ranges are allowed in the
    // tables below (a stage that reads nothing) and skipped when building layouts.
    struct PushConstantRange {
        VkShaderStageFlags Stages = 0;
        uint32_t Begin = 0;
        uint32_t End = 0;

        [[nodiscard]] constexpr uint32_t Size() const { return End - Begin; }
        [[nodiscard]] constexpr bool IsEmpty() const { return End <= Begin; }
    };

    namespace PushConstants {
        inline constexpr std::array<PushConstantRange, 1> VertexMat4 = {{
            {VK_SHADER_STAGE_VERTEX_BIT, 0, 64},
        }};

        inline constexpr std::array<PushConstantRange, 2> Blend = {{
            {VK_SHADER_STAGE_VERTEX_BIT, 0, 64},
            {VK_SHADER_STAGE_FRAGMENT_BIT, 64, 72},
        }};

        inline constexpr std::array<PushConstantRange, 1> CalcVertexAttrs = {{
            {VK_SHADER_STAGE_COMPUTE_BIT, 0, 8},
        }};

        inline constexpr std::array<PushConstantRange, 1> DecodeRgbRgba = {{
            {VK_SHADER_STAGE_COMPUTE_BIT, 0, 4},
        }};

        // Light volumes: the fragment stage reads per-light values from descriptors.
        inline constexpr std::array<PushConstantRange, 2> DrawLight = {{
            {VK_SHADER_STAGE_VERTEX_BIT, 0, 64},
            {VK_SHADER_STAGE_FRAGMENT_BIT, 0, 0},
        }};

        inline constexpr std::array<PushConstantRange, 2> Font = {{
            {VK_SHADER_STAGE_VERTEX_BIT, 0, 64},
            {VK_SHADER_STAGE_FRAGMENT_BIT, 64, 80},
        }};

        inline constexpr std::array<PushConstantRange, 2> FontOutline = {{
            {VK_SHADER_STAGE_VERTEX_BIT, 0, 64},
            {VK_SHADER_STAGE_FRAGMENT_BIT, 64, 96},
        }};

        inline constexpr std::array<PushConstantRange, 1> Texture = {{
            {VK_SHADER_STAGE_VERTEX_BIT, 0, 80},
        }};
    }

    // General-use payloads
    struct Mat4PushConst {
        glm::mat4 Value{1.0f};
    };

    struct U32PushConst {
        uint32_t Value = 0;
    };

    // Specific-use payloads (field order fixes the std430-compatible layout)
    struct CalcVertexAttrsPushConsts {
        uint32_t BaseIdx = 0;
        uint32_t BaseVertex = 0;
    };

    struct PointLightPushConsts {
        glm::vec3 Intensity{0.0f};
        float Radius = 0.0f;
    };

    struct SunlightPushConsts {
        glm::vec3 Intensity{0.0f};
        glm::vec3 Normal{0.0f};
    };

    struct SpotlightPushConsts {
        glm::vec3 Intensity{0.0f};
        glm::vec3 Normal{0.0f};
    };

    struct WritePushConsts {
        glm::vec2 Offset{0.0f};
        glm::vec2 Scale{1.0f};
        glm::mat4 Transform{1.0f};
    };
}

namespace RHI {
    static_assert(sizeof(Mat4PushConst) == 64);
    static_assert(sizeof(U32PushConst) == 4);
    static_assert(sizeof(CalcVertexAttrsPushConsts) == PushConstants::CalcVertexAttrs[0].Size());
    static_assert(sizeof(PointLightPushConsts) == 16);
    static_assert(sizeof(SunlightPushConsts) == 24);
    static_assert(sizeof(SpotlightPushConsts) == 24);
    static_assert(sizeof(WritePushConsts) == PushConstants::Texture[0].Size());
}
