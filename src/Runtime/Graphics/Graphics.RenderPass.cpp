module;
#include <algorithm>
#include <array>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

module Graphics:RenderPass.Impl;

import Core;
import RHI;
import :ShaderRegistry;
import :RenderTexture;
import :Components;
import :RenderPass;

namespace Graphics
{
    namespace
    {
        constexpr std::array<float, kQuadVertexCount * 2> kQuadVertices = {
            0.0f, 0.0f, 1.0f, 0.0f, 1.0f, 1.0f,
            0.0f, 0.0f, 0.0f, 1.0f, 1.0f, 1.0f,
        };

        Core::Result ValidateOptions(const RenderPassOptions& options)
        {
            if (!RHI::IsValid(options.DepthTest))
            {
                Core::Log::Error("Render pass: unsupported depth test {}", static_cast<int>(options.DepthTest));
                return Core::Err(Core::ErrorCode::InvalidArgument);
            }
            if (!RHI::IsValid(options.Blend.Src) || !RHI::IsValid(options.Blend.Dst))
            {
                Core::Log::Error("Render pass: unsupported blend factor ({}, {})",
                                 static_cast<int>(options.Blend.Src), static_cast<int>(options.Blend.Dst));
                return Core::Err(Core::ErrorCode::InvalidArgument);
            }
            return Core::Ok();
        }

        // One attribute per location; a mat3 spans three consecutive locations.
        void ConfigureInstanceAttributes(RHI::IDevice& device, RHI::VertexLayoutHandle layout,
                                         RHI::BufferHandle buffer, const Shader& shader)
        {
            const uint32_t strideBytes = shader.InstanceStride * sizeof(float);

            for (const ShaderProperty& p : shader.Properties)
            {
                // Inactive attributes keep their slots in the record.
                if (p.Location < 0) continue;

                RHI::VertexAttributeDesc attribute{
                    .Location = static_cast<uint32_t>(p.Location),
                    .Components = SlotCount(p.Type),
                    .Kind = p.Type == PropertyType::Int ? RHI::AttributeKind::Int : RHI::AttributeKind::Float,
                    .StrideBytes = strideBytes,
                    .OffsetBytes = p.Offset * static_cast<uint32_t>(sizeof(float)),
                    .Divisor = 1,
                    .Buffer = buffer,
                };

                if (p.Type == PropertyType::Mat3)
                {
                    attribute.Components = 3;
                    for (uint32_t column = 0; column < 3; ++column)
                    {
                        RHI::VertexAttributeDesc columnAttribute = attribute;
                        columnAttribute.Location += column;
                        columnAttribute.OffsetBytes += column * 3 * static_cast<uint32_t>(sizeof(float));
                        device.SetVertexAttribute(layout, columnAttribute);
                    }
                    continue;
                }

                device.SetVertexAttribute(layout, attribute);
            }
        }
    }

    RenderPassGraph::RenderPassGraph(RHI::IDevice& device, ShaderRegistry& shaders, RenderTextureRegistry& textures)
        : m_Device(device), m_Shaders(shaders), m_Textures(textures)
    {
    }

    RenderPassGraph::~RenderPassGraph()
    {
        m_Passes.ForEach([this](RenderPassHandle, RenderPass& pass)
        {
            ReleaseDeviceObjects(pass);
        });
    }

    void RenderPassGraph::ReleaseDeviceObjects(RenderPass& pass)
    {
        m_Device.DestroyVertexLayout(pass.Layout);
        m_Device.DestroyBuffer(pass.ModelBuffer);
        m_Device.DestroyBuffer(pass.InstanceBuffer);
        pass.Layout = {};
        pass.ModelBuffer = {};
        pass.InstanceBuffer = {};
    }

    Core::Expected<RenderPassHandle> RenderPassGraph::CreateRenderPass(ShaderHandle shaderHandle, const RenderPassOptions& options)
    {
        const Shader* shader = m_Shaders.Get(shaderHandle);
        if (!shader) return Core::Err<RenderPassHandle>(Core::ErrorCode::ResourceNotFound);

        if (auto valid = ValidateOptions(options); !valid)
            return std::unexpected(valid.error());

        if (shader->Outputs.size() > RHI::kMaxColorAttachments)
        {
            Core::Log::Error("Render pass: shader writes {} targets, the limit is {} colour attachments",
                             shader->Outputs.size(), RHI::kMaxColorAttachments);
            return Core::Err<RenderPassHandle>(Core::ErrorCode::OutOfRange);
        }

        if (!options.Present && shader->Outputs.empty())
        {
            Core::Log::Error("Render pass: shader writes no render texture");
            return Core::Err<RenderPassHandle>(Core::ErrorCode::InvalidArgument);
        }

        RenderPass pass;
        pass.Shader = shaderHandle;
        pass.Options = options;

        // ----- Resolve render textures by name -----
        for (const std::string& name : shader->Inputs)
        {
            auto texture = m_Textures.Acquire(name);
            if (!texture) return std::unexpected(texture.error());
            pass.Inputs.push_back(*texture);
        }

        if (!options.Present)
        {
            for (const std::string& name : shader->Outputs)
            {
                auto texture = m_Textures.Acquire(name);
                if (!texture) return std::unexpected(texture.error());
                pass.Outputs.push_back(*texture);
            }
        }

        // ----- Device state -----
        pass.Layout = m_Device.CreateVertexLayout();
        pass.ModelBuffer = m_Device.CreateBuffer();
        pass.InstanceBuffer = m_Device.CreateBuffer();
        m_Device.UploadBuffer(pass.ModelBuffer, kQuadVertices);

        if (const int32_t location = m_Device.GetAttributeLocation(shader->Program, "_LOCAL_POS"); location >= 0)
        {
            m_Device.SetVertexAttribute(pass.Layout, RHI::VertexAttributeDesc{
                .Location = static_cast<uint32_t>(location),
                .Components = 2,
                .Kind = RHI::AttributeKind::Float,
                .StrideBytes = 2 * sizeof(float),
                .OffsetBytes = 0,
                .Divisor = 0,
                .Buffer = pass.ModelBuffer,
            });
        }
        ConfigureInstanceAttributes(m_Device, pass.Layout, pass.InstanceBuffer, *shader);

        const RenderPassHandle handle = m_Passes.Add(std::move(pass));

        // Ordered insert: after every pass whose DrawOrder is <= ours.
        auto position = std::upper_bound(m_Order.begin(), m_Order.end(), options.DrawOrder,
            [this](int32_t order, RenderPassHandle other)
            {
                return order < m_Passes.Get(other)->Options.DrawOrder;
            });
        m_Order.insert(position, handle);

        return handle;
    }

    void RenderPassGraph::DestroyRenderPass(RenderPassHandle handle)
    {
        RenderPass* pass = m_Passes.Get(handle);
        if (!pass) return;

        ReleaseDeviceObjects(*pass);
        std::erase(m_Order, handle);
        m_Passes.Remove(handle);
    }

    void RenderPassGraph::SetUniform(RenderPassHandle handle, std::string_view name, const UniformValue& value)
    {
        RenderPass* pass = m_Passes.Get(handle);
        if (!pass) return;

        const Shader* shader = m_Shaders.Get(pass->Shader);
        const ShaderUniform* uniform = shader ? shader->FindUniform(name) : nullptr;
        if (!uniform || uniform->BuiltIn)
        {
            Core::Log::Warn("undefined uniform '{}'", name);
            return;
        }
        if (IsSampler(uniform->Type))
        {
            Core::Log::Warn("uniform '{}' is a sampler; bind it with SetTexture", name);
            return;
        }
        if (!Matches(uniform->Type, value))
        {
            Core::Log::Warn("uniform '{}' expects {}", name, ToGLSL(uniform->Type));
            return;
        }

        pass->Uniforms.insert_or_assign(std::string(name), value);
    }

    void RenderPassGraph::SetTexture(RenderPassHandle handle, std::string_view name, RHI::TextureHandle texture)
    {
        RenderPass* pass = m_Passes.Get(handle);
        if (!pass) return;

        const Shader* shader = m_Shaders.Get(pass->Shader);
        const ShaderUniform* uniform = shader ? shader->FindUniform(name) : nullptr;
        if (!uniform || !IsSampler(uniform->Type))
        {
            Core::Log::Warn("undefined sampler uniform '{}'", name);
            return;
        }
        if (std::find(shader->Inputs.begin(), shader->Inputs.end(), name) != shader->Inputs.end())
        {
            Core::Log::Warn("sampler '{}' is bound from its render texture", name);
            return;
        }

        pass->Textures.insert_or_assign(std::string(name), texture);
    }

    void RenderPassGraph::SetProperty(ECS::Components::Renderer::Component& renderer, std::string_view name,
                                      const PropertyValue& value) const
    {
        const RenderPass* pass = m_Passes.Get(renderer.Pass);
        if (!pass) return;

        const Shader* shader = m_Shaders.Get(pass->Shader);
        const ShaderProperty* property = shader ? shader->FindProperty(name) : nullptr;
        if (!property || property->BuiltIn)
        {
            Core::Log::Warn("undefined property '{}'", name);
            return;
        }
        if (!Matches(property->Type, value))
        {
            Core::Log::Warn("property '{}' expects {}", name, ToGLSL(property->Type));
            return;
        }

        renderer.Properties.insert_or_assign(std::string(name), value);
    }

    void RenderPassGraph::SetEnabled(RenderPassHandle handle, bool enabled)
    {
        if (RenderPass* pass = m_Passes.Get(handle))
            pass->Enabled = enabled;
    }
}
