module;
#include <algorithm>
#include <bit>
#include <cstdint>
#include <expected>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include <glm/glm.hpp>
#include <entt/entity/entity.hpp>

module Graphics:FrameExecutor.Impl;

import Core;
import RHI;
import ECS;
import Runtime.SignalGraph;
import :ShaderRegistry;
import :RenderTexture;
import :Components;
import :RenderPass;
import :Camera;
import :FrameExecutor;

namespace Graphics
{
    namespace
    {
        // Samples COLOR across the screen. The output is left unnamed in the
        // contract so it can differ from the COLOR sampler; a single output
        // lands on location 0.
        constexpr const char* kPresentFragment = R"(#version 330 core
uniform sampler2D COLOR;
in vec2 SCREEN_POS;
out vec4 PRESENT;

void main()
{
    PRESENT = texture(COLOR, SCREEN_POS);
}
)";

        void PushMat3(std::vector<float>& out, const glm::mat3& m)
        {
            for (int column = 0; column < 3; ++column)
                for (int row = 0; row < 3; ++row)
                    out.push_back(m[column][row]);
        }

        void PushValue(std::vector<float>& out, PropertyType type, const PropertyValue* value)
        {
            if (!value || !Matches(type, *value))
            {
                out.insert(out.end(), SlotCount(type), 0.0f);
                return;
            }

            std::visit([&out](const auto& v)
            {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, float>)
                    out.push_back(v);
                else if constexpr (std::is_same_v<T, int32_t>)
                    out.push_back(std::bit_cast<float>(v)); // read back with an integer attribute
                else if constexpr (std::is_same_v<T, glm::vec2>)
                    out.insert(out.end(), {v.x, v.y});
                else if constexpr (std::is_same_v<T, glm::mat3>)
                    PushMat3(out, v);
            }, *value);
        }

        void ResetBatch(RenderPass& pass)
        {
            pass.InstanceCount = 0;
            pass.InstanceData.clear();
        }
    }

    FrameExecutor::FrameExecutor(RHI::IDevice& device, ECS::Scene& scene, ShaderRegistry& shaders,
                                 RenderTextureRegistry& textures, RenderPassGraph& passes, const Camera2D& camera)
        : m_Device(device), m_Scene(scene), m_Shaders(shaders), m_Textures(textures), m_Passes(passes), m_Camera(camera)
    {
    }

    FrameExecutor::~FrameExecutor()
    {
        m_Device.DestroyFramebuffer(m_Framebuffer);
        m_Device.DestroyDepthStencil(m_DepthStencil);
    }

    Core::Result FrameExecutor::Initialize()
    {
        auto color = m_Textures.Declare(kColorTarget, RenderTextureDesc{});
        if (!color) return std::unexpected(color.error());

        m_Framebuffer = m_Device.CreateFramebuffer();
        ResizeTargets(m_Device.GetRenderSize());

        ShaderContract contract;
        contract.Inputs = {std::string(kColorTarget)};

        auto shader = m_Shaders.Create(kPresentFragment, ShaderMode::Fullscreen, contract);
        if (!shader) return std::unexpected(shader.error());
        m_PresentShader = *shader;

        RenderPassOptions options;
        options.DrawOrder = kPresentDrawOrder;
        options.DepthTest = RHI::DepthTest::Disabled;
        options.Blend.Enabled = false;
        options.Present = true;

        auto pass = m_Passes.CreateRenderPass(m_PresentShader, options);
        if (!pass) return std::unexpected(pass.error());
        m_PresentPass = *pass;

        return Core::Ok();
    }

    void FrameExecutor::ResizeTargets(glm::uvec2 size)
    {
        const glm::uvec2 clamped = glm::max(size, glm::uvec2(1));

        // Destroy and recreate; storage is never resized in place.
        m_Device.DestroyDepthStencil(m_DepthStencil);
        m_DepthStencil = m_Device.CreateDepthStencil(clamped.x, clamped.y);
        m_Device.AttachDepthStencil(m_Framebuffer, m_DepthStencil);

        if (auto r = m_Textures.Resize(size); !r)
            Core::Log::Error("Render targets not resized: {}", Core::ErrorCodeToString(r.error()));

        m_RenderSize = size;
    }

    // -------------------------------------------------------------------------
    // Collect
    // -------------------------------------------------------------------------

    void FrameExecutor::Collect(entt::entity entity, const Runtime::TaskContext&)
    {
        Enqueue(entity);
    }

    void FrameExecutor::Enqueue(entt::entity entity)
    {
        const auto* renderer = m_Scene.TryGet<ECS::Components::Renderer::Component>(entity);
        if (!renderer) return;

        RenderPass* pass = m_Passes.Get(renderer->Pass);
        if (!pass) return;

        const Shader* shader = m_Shaders.Get(pass->Shader);
        if (!shader) return;

        const auto* transform = m_Scene.TryGet<ECS::Components::Transform::Component>(entity);
        if (shader->Mode == ShaderMode::World && !transform)
        {
            Core::Log::Warn("world shaders require a Transform (entity {})", static_cast<uint32_t>(entt::to_integral(entity)));
            return;
        }

        std::vector<float>& data = pass->InstanceData;
        data.reserve(data.size() + shader->InstanceStride);

        for (const ShaderProperty& p : shader->Properties)
        {
            if (p.BuiltIn)
            {
                if (p.Name == kTransformProperty)
                    PushMat3(data, ECS::Components::Transform::GetMatrix(*transform));
                else if (p.Name == kDepthProperty)
                    data.push_back(std::clamp(renderer->Depth, 0.0f, 1.0f));
                else if (p.Name == kLayerProperty)
                    data.push_back(renderer->Layer);
                continue;
            }

            auto it = renderer->Properties.find(p.Name);
            PushValue(data, p.Type, it != renderer->Properties.end() ? &it->second : nullptr);
        }

        ++pass->InstanceCount;
    }

    // -------------------------------------------------------------------------
    // Dispatch
    // -------------------------------------------------------------------------

    void FrameExecutor::Dispatch(const Runtime::TaskContext&)
    {
        const glm::uvec2 size = m_Device.GetRenderSize();
        const std::vector<RenderPassHandle>& order = m_Passes.GetOrder();

        // Minimised: nothing to draw into, drop the batches.
        if (size.x == 0 || size.y == 0)
        {
            for (RenderPassHandle handle : order)
                if (RenderPass* pass = m_Passes.Get(handle)) ResetBatch(*pass);
            return;
        }

        if (size != m_RenderSize) ResizeTargets(size);

        m_Device.SetViewport(size.x, size.y);

        m_Device.BindFramebuffer({});
        m_Device.Clear(m_ClearColor);

        ClearRenderTextures();

        const glm::mat3 screenToWorld = m_Camera.ScreenToWorld(size);
        const glm::mat3 worldToScreen = m_Camera.WorldToScreen(size);

        for (RenderPassHandle handle : order)
        {
            RenderPass* pass = m_Passes.Get(handle);
            if (!pass) continue;

            const Shader* shader = m_Shaders.Get(pass->Shader);
            if (pass->Enabled && shader)
                ExecutePass(*pass, *shader, worldToScreen, screenToWorld);

            ResetBatch(*pass);
        }

        m_Device.BindFramebuffer({});
        ++m_FrameCount;
    }

    // Every write half starts the frame cleared, and swappable ones are synced
    // so this frame's first reader does not see last frame's image. Targets
    // are batched by size and kind, at most one framebuffer's worth per clear.
    void FrameExecutor::ClearRenderTextures()
    {
        std::vector<const RenderTexture*> pending;
        m_Textures.ForEach([&pending](const RenderTexture& texture) { pending.push_back(&texture); });
        std::sort(pending.begin(), pending.end(), [](const RenderTexture* a, const RenderTexture* b)
        {
            return a->GetName() < b->GetName();
        });

        m_Device.BindFramebuffer(m_Framebuffer);

        while (!pending.empty())
        {
            const RenderTexture* first = pending.front();
            std::vector<const RenderTexture*> batch;
            std::vector<const RenderTexture*> rest;
            for (const RenderTexture* t : pending)
            {
                const bool fits = batch.size() < RHI::kMaxColorAttachments
                    && t->GetSize() == first->GetSize() && t->IsArray() == first->IsArray();
                (fits ? batch : rest).push_back(t);
            }
            pending = std::move(rest);

            const auto count = static_cast<uint32_t>(batch.size());
            for (uint32_t slot = 0; slot < count; ++slot)
                m_Device.SetColorAttachment(m_Framebuffer, slot, batch[slot]->GetWriteTexture());
            for (uint32_t slot = count; slot < m_AttachedOutputs; ++slot)
                m_Device.SetColorAttachment(m_Framebuffer, slot, {});
            m_AttachedOutputs = count;

            m_Device.SetDrawBuffers(m_Framebuffer, count);
            m_Device.Clear(m_ClearColor);

            for (const RenderTexture* texture : batch)
                m_Textures.Synchronize(*texture);
        }
    }

    void FrameExecutor::ExecutePass(RenderPass& pass, const Shader& shader, const glm::mat3& worldToScreen, const glm::mat3& screenToWorld)
    {
        const bool present = pass.Options.Present;
        const uint32_t instances = present ? 1u : pass.InstanceCount;
        if (instances == 0) return;

        // The present quad needs one record even when no entity fed it.
        if (present && pass.InstanceData.size() < shader.InstanceStride)
            pass.InstanceData.resize(shader.InstanceStride, 0.0f);

        m_Device.SetPipelineState(RHI::PipelineState{
            .Depth = pass.Options.DepthTest,
            .DepthWrite = pass.Options.DepthWrite,
            .Blend = pass.Options.Blend,
        });
        m_Device.UseProgram(shader.Program);
        m_Device.BindVertexLayout(pass.Layout);

        // ----- Inputs: read halves, one unit each -----
        std::vector<uint32_t> boundUnits;
        for (size_t i = 0; i < pass.Inputs.size() && i < shader.Inputs.size(); ++i)
        {
            const ShaderUniform* sampler = shader.FindUniform(shader.Inputs[i]);
            if (!sampler || sampler->TextureUnit < 0) continue;

            const auto unit = static_cast<uint32_t>(sampler->TextureUnit);
            m_Device.BindTexture(unit, pass.Inputs[i]->GetReadTexture());
            m_Device.SetUniform(sampler->Location, static_cast<int32_t>(unit));
            boundUnits.push_back(unit);
        }

        for (const auto& [name, texture] : pass.Textures)
        {
            const ShaderUniform* sampler = shader.FindUniform(name);
            if (!sampler || sampler->TextureUnit < 0) continue;

            const auto unit = static_cast<uint32_t>(sampler->TextureUnit);
            m_Device.BindTexture(unit, texture);
            m_Device.SetUniform(sampler->Location, static_cast<int32_t>(unit));
            boundUnits.push_back(unit);
        }

        // ----- Outputs: exactly the declared attachment slots -----
        if (present)
        {
            m_Device.BindFramebuffer({});
        }
        else
        {
            const auto outputCount = static_cast<uint32_t>(pass.Outputs.size());
            for (uint32_t slot = 0; slot < outputCount; ++slot)
                m_Device.SetColorAttachment(m_Framebuffer, slot, pass.Outputs[slot]->GetWriteTexture());
            for (uint32_t slot = outputCount; slot < m_AttachedOutputs; ++slot)
                m_Device.SetColorAttachment(m_Framebuffer, slot, {});
            m_AttachedOutputs = outputCount;

            m_Device.SetDrawBuffers(m_Framebuffer, outputCount);
            m_Device.BindFramebuffer(m_Framebuffer);
        }

        // ----- Uniforms -----
        if (const ShaderUniform* u = shader.FindUniform(kWorldToScreen))
            m_Device.SetUniform(u->Location, worldToScreen);
        if (const ShaderUniform* u = shader.FindUniform(kScreenToWorld))
            m_Device.SetUniform(u->Location, screenToWorld);

        for (const auto& [name, value] : pass.Uniforms)
        {
            if (const ShaderUniform* u = shader.FindUniform(name))
                m_Device.SetUniform(u->Location, value);
        }

        // ----- Draw -----
        m_Device.UploadBuffer(pass.InstanceBuffer, pass.InstanceData);
        m_Device.DrawInstanced(kQuadVertexCount, instances);

        if (!present)
        {
            for (const RenderTexture* output : pass.Outputs)
                m_Textures.Synchronize(*output);
        }

        // ----- Unbind -----
        for (uint32_t unit : boundUnits)
            m_Device.BindTexture(unit, {});
        m_Device.BindVertexLayout({});
        m_Device.UseProgram({});
    }
}
