module;
#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include <glm/glm.hpp>

export module RHI:Types;

import Core;

export namespace RHI
{
    struct ProgramTag;
    struct BufferTag;
    struct VertexLayoutTag;
    struct TextureTag;
    struct FramebufferTag;
    struct DepthStencilTag;

    using ProgramHandle = Core::StrongHandle<ProgramTag>;
    using BufferHandle = Core::StrongHandle<BufferTag>;
    using VertexLayoutHandle = Core::StrongHandle<VertexLayoutTag>;
    using TextureHandle = Core::StrongHandle<TextureTag>;
    using FramebufferHandle = Core::StrongHandle<FramebufferTag>;
    using DepthStencilHandle = Core::StrongHandle<DepthStencilTag>;

    // Simultaneous colour attachments on one framebuffer (GL 3.3 guarantees 8).
    inline constexpr uint32_t kMaxColorAttachments = 8;
    inline constexpr uint32_t kMaxTextureUnits = 16;

    enum class TextureFormat : uint8_t
    {
        RGBA8,
        RGBA16F,
        R32F,
    };

    enum class DepthTest : uint8_t
    {
        Disabled,
        Never,
        Less,
        Equal,
        LessEqual,
        Greater,
        NotEqual,
        GreaterEqual,
        Always,
    };

    enum class BlendFactor : uint8_t
    {
        Zero,
        One,
        SrcColor,
        OneMinusSrcColor,
        DstColor,
        OneMinusDstColor,
        SrcAlpha,
        OneMinusSrcAlpha,
        DstAlpha,
        OneMinusDstAlpha,
    };

    // Values arriving through casts or config are not trusted to be in range.
    [[nodiscard]] constexpr bool IsValid(TextureFormat f) { return static_cast<uint8_t>(f) <= static_cast<uint8_t>(TextureFormat::R32F); }
    [[nodiscard]] constexpr bool IsValid(DepthTest d) { return static_cast<uint8_t>(d) <= static_cast<uint8_t>(DepthTest::Always); }
    [[nodiscard]] constexpr bool IsValid(BlendFactor b) { return static_cast<uint8_t>(b) <= static_cast<uint8_t>(BlendFactor::OneMinusDstAlpha); }

    struct BlendState
    {
        bool Enabled = true;
        BlendFactor Src = BlendFactor::SrcAlpha;
        BlendFactor Dst = BlendFactor::OneMinusSrcAlpha;
    };

    struct PipelineState
    {
        DepthTest Depth = DepthTest::Always;
        bool DepthWrite = false;
        BlendState Blend{};
    };

    enum class AttributeKind : uint8_t
    {
        Float,
        Int, // integer attribute, no conversion (glVertexAttribIPointer)
    };

    // One vertex attribute location. Matrices occupy one location per column,
    // so a mat3 is described by three of these.
    struct VertexAttributeDesc
    {
        uint32_t Location = 0;
        uint32_t Components = 1;
        AttributeKind Kind = AttributeKind::Float;
        uint32_t StrideBytes = 0;
        uint32_t OffsetBytes = 0;
        uint32_t Divisor = 0; // 0 = per-vertex, 1 = per-instance
        BufferHandle Buffer{};
    };

    using UniformValue = std::variant<float, int32_t, glm::vec2, glm::mat3>;

    struct ProgramDesc
    {
        std::string VertexSource;
        std::string FragmentSource;
        // Fragment outputs, bound to colour locations 0..N-1 in this order before link.
        std::vector<std::string> Outputs;
    };
}
