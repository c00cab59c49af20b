module;
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

export module Graphics:ShaderRegistry;

import Core;
import RHI;

export namespace Graphics
{
    enum class ShaderMode : uint8_t
    {
        World,      // one quad per entity, placed by its TRANSFORM
        Fullscreen, // quad corners are screen coordinates in [0,1]
    };

    enum class PropertyType : uint8_t
    {
        Float,
        Int,
        Vec2,
        Mat3,
    };

    enum class UniformType : uint8_t
    {
        Float,
        Int,
        Vec2,
        Mat3,
        Sampler2D,
        Sampler2DArray,
    };

    // Per-instance values and uniform values share the device's value type.
    using PropertyValue = RHI::UniformValue;
    using UniformValue = RHI::UniformValue;

    // Float slots one property occupies in the instance buffer.
    [[nodiscard]] constexpr uint32_t SlotCount(PropertyType type)
    {
        switch (type)
        {
        case PropertyType::Float: return 1;
        case PropertyType::Int: return 1;
        case PropertyType::Vec2: return 2;
        case PropertyType::Mat3: return 9;
        }
        return 0;
    }

    [[nodiscard]] constexpr bool IsSampler(UniformType type)
    {
        return type == UniformType::Sampler2D || type == UniformType::Sampler2DArray;
    }

    [[nodiscard]] std::string_view ToGLSL(PropertyType type);
    [[nodiscard]] std::string_view ToGLSL(UniformType type);

    // True when 'value' holds the alternative matching the declared type.
    [[nodiscard]] bool Matches(PropertyType type, const PropertyValue& value);
    [[nodiscard]] bool Matches(UniformType type, const UniformValue& value);

    struct PropertyDecl
    {
        std::string Name;
        PropertyType Type = PropertyType::Float;
    };

    struct UniformDecl
    {
        std::string Name;
        UniformType Type = UniformType::Float;
    };

    // What a fragment stage promises to consume and produce.
    //
    // The fragment source is a complete GLSL 330 stage. It may read the
    // varyings SCREEN_POS, WORLD_POS, LOCAL_POS (vec2), `flat in float LAYER`
    // and one `flat in <type> <name>` per property; it declares a sampler
    // uniform per input and writes `out vec4 COLOR` plus every output.
    // A stage that reads COLOR does not write it; a name listed in both
    // Inputs and Outputs is rejected.
    struct ShaderContract
    {
        std::vector<UniformDecl> Uniforms;
        std::vector<PropertyDecl> Properties; // instance layout follows this order
        std::vector<std::string> Inputs;      // render texture names read
        std::vector<std::string> Outputs;     // render texture names written besides COLOR
    };

    inline constexpr std::string_view kWorldToScreen = "WORLD_TO_SCREEN";
    inline constexpr std::string_view kScreenToWorld = "SCREEN_TO_WORLD";
    inline constexpr std::string_view kTransformProperty = "TRANSFORM";
    inline constexpr std::string_view kDepthProperty = "DEPTH";
    inline constexpr std::string_view kLayerProperty = "LAYER";
    inline constexpr std::string_view kColorTarget = "COLOR";

    struct ShaderProperty
    {
        std::string Name;
        PropertyType Type = PropertyType::Float;
        uint32_t Offset = 0;    // in floats, from the start of an instance record
        int32_t Location = -1;  // first attribute location, -1 if inactive
        bool BuiltIn = false;
    };

    struct ShaderUniform
    {
        std::string Name;
        UniformType Type = UniformType::Float;
        int32_t Location = -1;
        int32_t TextureUnit = -1; // samplers only
        bool BuiltIn = false;
    };

    struct Shader
    {
        ShaderMode Mode = ShaderMode::World;
        RHI::ProgramHandle Program{};

        std::vector<ShaderUniform> Uniforms;    // built-ins, declared, then input samplers
        std::vector<ShaderProperty> Properties; // [TRANSFORM], DEPTH, LAYER, declared...
        std::vector<std::string> Inputs;
        std::vector<std::string> Outputs;       // COLOR first unless it is an input
        uint32_t InstanceStride = 0;            // floats per instance record

        std::string VertexSource;

        [[nodiscard]] const ShaderProperty* FindProperty(std::string_view name) const;
        [[nodiscard]] const ShaderUniform* FindUniform(std::string_view name) const;
    };

    struct ShaderTag;
    using ShaderHandle = Core::StrongHandle<ShaderTag>;

    // Builds the vertex stage matching a property layout.
    [[nodiscard]] std::string GenerateVertexSource(ShaderMode mode, std::span<const ShaderProperty> properties);

    class ShaderRegistry
    {
    public:
        explicit ShaderRegistry(RHI::IDevice& device);
        ~ShaderRegistry();

        ShaderRegistry(const ShaderRegistry&) = delete;
        ShaderRegistry& operator=(const ShaderRegistry&) = delete;

        // Synthesizes the vertex stage, compiles and links. Nothing is
        // registered on failure.
        [[nodiscard]] Core::Expected<ShaderHandle> Create(std::string_view fragmentSource, ShaderMode mode,
                                                          const ShaderContract& contract = {});

        [[nodiscard]] const Shader* Get(ShaderHandle handle) const { return m_Shaders.Get(handle); }
        void Destroy(ShaderHandle handle);

        [[nodiscard]] size_t Size() const { return m_Shaders.Size(); }

    private:
        RHI::IDevice& m_Device;
        Core::ResourcePool<Shader, ShaderTag> m_Shaders;
    };
}
