module;
#include <algorithm>
#include <array>
#include <cstdint>
#include <expected>
#include <format>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>
#include <glm/glm.hpp>

module Graphics:ShaderRegistry.Impl;

import Core;
import RHI;
import :ShaderRegistry;

namespace Graphics
{
    namespace
    {
        // Names the generated vertex stage owns.
        constexpr std::array<std::string_view, 8> kReservedNames = {
            kWorldToScreen, kScreenToWorld, kTransformProperty, kDepthProperty, kLayerProperty,
            "SCREEN_POS", "WORLD_POS", "LOCAL_POS",
        };

        bool IsReserved(std::string_view name)
        {
            return std::find(kReservedNames.begin(), kReservedNames.end(), name) != kReservedNames.end();
        }

        bool IsValid(PropertyType type) { return static_cast<uint8_t>(type) <= static_cast<uint8_t>(PropertyType::Mat3); }
        bool IsValid(UniformType type) { return static_cast<uint8_t>(type) <= static_cast<uint8_t>(UniformType::Sampler2DArray); }
        bool IsValid(ShaderMode mode) { return static_cast<uint8_t>(mode) <= static_cast<uint8_t>(ShaderMode::Fullscreen); }

        Core::Result ValidateContract(ShaderMode mode, const ShaderContract& contract)
        {
            if (!IsValid(mode))
            {
                Core::Log::Error("Shader: unsupported mode {}", static_cast<int>(mode));
                return Core::Err(Core::ErrorCode::InvalidArgument);
            }

            std::unordered_set<std::string_view> seen;
            for (const PropertyDecl& p : contract.Properties)
            {
                if (!IsValid(p.Type))
                {
                    Core::Log::Error("Shader: property '{}' has unsupported type {}", p.Name, static_cast<int>(p.Type));
                    return Core::Err(Core::ErrorCode::InvalidArgument);
                }
                if (p.Name.empty() || IsReserved(p.Name) || !seen.insert(p.Name).second)
                {
                    Core::Log::Error("Shader: property name '{}' is reserved or repeated", p.Name);
                    return Core::Err(Core::ErrorCode::InvalidArgument);
                }
            }

            seen.clear();
            for (const UniformDecl& u : contract.Uniforms)
            {
                if (!IsValid(u.Type))
                {
                    Core::Log::Error("Shader: uniform '{}' has unsupported type {}", u.Name, static_cast<int>(u.Type));
                    return Core::Err(Core::ErrorCode::InvalidArgument);
                }
                if (u.Name.empty() || IsReserved(u.Name) || !seen.insert(u.Name).second)
                {
                    Core::Log::Error("Shader: uniform name '{}' is reserved or repeated", u.Name);
                    return Core::Err(Core::ErrorCode::InvalidArgument);
                }
            }

            return Core::Ok();
        }
    }

    std::string_view ToGLSL(PropertyType type)
    {
        switch (type)
        {
        case PropertyType::Float: return "float";
        case PropertyType::Int: return "int";
        case PropertyType::Vec2: return "vec2";
        case PropertyType::Mat3: return "mat3";
        }
        return "float";
    }

    std::string_view ToGLSL(UniformType type)
    {
        switch (type)
        {
        case UniformType::Float: return "float";
        case UniformType::Int: return "int";
        case UniformType::Vec2: return "vec2";
        case UniformType::Mat3: return "mat3";
        case UniformType::Sampler2D: return "sampler2D";
        case UniformType::Sampler2DArray: return "sampler2DArray";
        }
        return "float";
    }

    bool Matches(PropertyType type, const PropertyValue& value)
    {
        switch (type)
        {
        case PropertyType::Float: return std::holds_alternative<float>(value);
        case PropertyType::Int: return std::holds_alternative<int32_t>(value);
        case PropertyType::Vec2: return std::holds_alternative<glm::vec2>(value);
        case PropertyType::Mat3: return std::holds_alternative<glm::mat3>(value);
        }
        return false;
    }

    bool Matches(UniformType type, const UniformValue& value)
    {
        switch (type)
        {
        case UniformType::Float: return std::holds_alternative<float>(value);
        case UniformType::Int: return std::holds_alternative<int32_t>(value);
        case UniformType::Vec2: return std::holds_alternative<glm::vec2>(value);
        case UniformType::Mat3: return std::holds_alternative<glm::mat3>(value);
        case UniformType::Sampler2D:
        case UniformType::Sampler2DArray: return false;
        }
        return false;
    }

    const ShaderProperty* Shader::FindProperty(std::string_view name) const
    {
        for (const ShaderProperty& p : Properties)
            if (p.Name == name) return &p;
        return nullptr;
    }

    const ShaderUniform* Shader::FindUniform(std::string_view name) const
    {
        for (const ShaderUniform& u : Uniforms)
            if (u.Name == name) return &u;
        return nullptr;
    }

    // -------------------------------------------------------------------------
    // Vertex stage synthesis
    // -------------------------------------------------------------------------
    // Attributes are the property names prefixed with '_'. Every non-builtin
    // property (and LAYER) is forwarded to a flat varying of the same name.
    // The quad spans [0,1]^2 in local space.
    // -------------------------------------------------------------------------
    std::string GenerateVertexSource(ShaderMode mode, std::span<const ShaderProperty> properties)
    {
        std::string attributes;
        std::string varyings;
        std::string copies;

        for (const ShaderProperty& p : properties)
        {
            const std::string_view type = ToGLSL(p.Type);
            attributes += std::format("in {} _{};\n", type, p.Name);

            if (p.Name == kTransformProperty || p.Name == kDepthProperty) continue;

            varyings += std::format("flat out {} {};\n", type, p.Name);
            copies += std::format("    {} = _{};\n", p.Name, p.Name);
        }

        const bool fullscreen = mode == ShaderMode::Fullscreen;
        const std::string_view worldCalc = fullscreen
            ? "SCREEN_TO_WORLD * vec3(_LOCAL_POS, 1.0)"
            : "_TRANSFORM * vec3(_LOCAL_POS, 1.0)";
        const std::string_view screenCalc = fullscreen
            ? "_LOCAL_POS"
            : "(WORLD_TO_SCREEN * world).xy";

        return std::format(
            "#version 330 core\n"
            "uniform mat3 WORLD_TO_SCREEN;\n"
            "uniform mat3 SCREEN_TO_WORLD;\n"
            "\n"
            "in vec2 _LOCAL_POS;\n"
            "{}"
            "\n"
            "out vec2 SCREEN_POS;\n"
            "out vec2 WORLD_POS;\n"
            "out vec2 LOCAL_POS;\n"
            "{}"
            "\n"
            "void main()\n"
            "{{\n"
            "    vec3 world = {};\n"
            "    SCREEN_POS = {};\n"
            "    WORLD_POS = world.xy;\n"
            "    LOCAL_POS = _LOCAL_POS;\n"
            "{}"
            "    gl_Position = vec4((SCREEN_POS - 0.5) * 2.0, _DEPTH * 2.0 - 1.0, 1.0);\n"
            "}}\n",
            attributes, varyings, worldCalc, screenCalc, copies);
    }

    // -------------------------------------------------------------------------
    // ShaderRegistry
    // -------------------------------------------------------------------------

    ShaderRegistry::ShaderRegistry(RHI::IDevice& device)
        : m_Device(device)
    {
    }

    ShaderRegistry::~ShaderRegistry()
    {
        m_Shaders.ForEach([this](ShaderHandle, Shader& shader)
        {
            m_Device.DestroyProgram(shader.Program);
        });
    }

    Core::Expected<ShaderHandle> ShaderRegistry::Create(std::string_view fragmentSource, ShaderMode mode,
                                                        const ShaderContract& contract)
    {
        if (auto valid = ValidateContract(mode, contract); !valid)
            return std::unexpected(valid.error());

        Shader shader;
        shader.Mode = mode;

        // ----- Properties: built-ins first, then declared order -----
        auto addProperty = [&shader](std::string_view name, PropertyType type, bool builtIn)
        {
            shader.Properties.push_back(ShaderProperty{
                .Name = std::string(name),
                .Type = type,
                .Offset = shader.InstanceStride,
                .Location = -1,
                .BuiltIn = builtIn,
            });
            shader.InstanceStride += SlotCount(type);
        };

        if (mode == ShaderMode::World)
            addProperty(kTransformProperty, PropertyType::Mat3, true);
        addProperty(kDepthProperty, PropertyType::Float, true);
        addProperty(kLayerProperty, PropertyType::Float, true);
        for (const PropertyDecl& p : contract.Properties)
            addProperty(p.Name, p.Type, false);

        // ----- Uniforms -----
        shader.Uniforms.push_back({.Name = std::string(kWorldToScreen), .Type = UniformType::Mat3, .BuiltIn = true});
        shader.Uniforms.push_back({.Name = std::string(kScreenToWorld), .Type = UniformType::Mat3, .BuiltIn = true});
        for (const UniformDecl& u : contract.Uniforms)
            shader.Uniforms.push_back({.Name = u.Name, .Type = u.Type});

        // Each input reads through a same-named sampler.
        for (const std::string& input : contract.Inputs)
        {
            if (std::find(shader.Inputs.begin(), shader.Inputs.end(), input) != shader.Inputs.end()) continue;
            shader.Inputs.push_back(input);

            if (!shader.FindUniform(input))
                shader.Uniforms.push_back({.Name = input, .Type = UniformType::Sampler2D});
        }

        int32_t nextUnit = 0;
        for (ShaderUniform& u : shader.Uniforms)
        {
            if (IsSampler(u.Type)) u.TextureUnit = nextUnit++;
        }
        if (nextUnit > static_cast<int32_t>(RHI::kMaxTextureUnits))
        {
            Core::Log::Error("Shader: {} samplers exceed {} texture units", nextUnit, RHI::kMaxTextureUnits);
            return Core::Err<ShaderHandle>(Core::ErrorCode::OutOfRange);
        }

        // ----- Outputs -----
        // Inputs and outputs share the GLSL namespace, so a name is either
        // sampled or written. COLOR is implied unless the stage reads it.
        for (const std::string& output : contract.Outputs)
        {
            if (std::find(shader.Inputs.begin(), shader.Inputs.end(), output) != shader.Inputs.end())
            {
                Core::Log::Error("Shader: '{}' is both an input and an output", output);
                return Core::Err<ShaderHandle>(Core::ErrorCode::InvalidArgument);
            }
        }

        if (std::find(shader.Inputs.begin(), shader.Inputs.end(), kColorTarget) == shader.Inputs.end())
            shader.Outputs.emplace_back(kColorTarget);
        for (const std::string& output : contract.Outputs)
        {
            if (std::find(shader.Outputs.begin(), shader.Outputs.end(), output) == shader.Outputs.end())
                shader.Outputs.push_back(output);
        }

        // ----- Compile & link -----
        shader.VertexSource = GenerateVertexSource(mode, shader.Properties);

        RHI::ProgramDesc desc{
            .VertexSource = shader.VertexSource,
            .FragmentSource = std::string(fragmentSource),
            .Outputs = shader.Outputs,
        };

        auto program = m_Device.CreateProgram(desc);
        if (!program)
        {
            Core::Log::Error("Shader creation failed: {}", Core::ErrorCodeToString(program.error()));
            return std::unexpected(program.error());
        }
        shader.Program = *program;

        // ----- Reflection -----
        for (ShaderProperty& p : shader.Properties)
            p.Location = m_Device.GetAttributeLocation(shader.Program, "_" + p.Name);

        for (ShaderUniform& u : shader.Uniforms)
            u.Location = m_Device.GetUniformLocation(shader.Program, u.Name);

        Core::Log::Debug("Shader created: {} properties, stride {}, {} inputs, {} outputs",
                         shader.Properties.size(), shader.InstanceStride, shader.Inputs.size(), shader.Outputs.size());

        return m_Shaders.Add(std::move(shader));
    }

    void ShaderRegistry::Destroy(ShaderHandle handle)
    {
        if (Shader* shader = m_Shaders.Get(handle))
        {
            m_Device.DestroyProgram(shader->Program);
            m_Shaders.Remove(handle);
        }
    }
}
