module;
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <glm/glm.hpp>

module RHI:HeadlessDevice.Impl;

import Core;
import :Types;
import :HeadlessDevice;

namespace RHI
{
    namespace
    {
        int32_t LocationSlots(std::string_view type)
        {
            if (type == "mat2") return 2;
            if (type == "mat3") return 3;
            if (type == "mat4") return 4;
            return 1;
        }

        std::vector<std::string_view> Tokenize(std::string_view statement)
        {
            std::vector<std::string_view> tokens;
            size_t i = 0;
            while (i < statement.size())
            {
                while (i < statement.size() && std::isspace(static_cast<unsigned char>(statement[i]))) ++i;
                const size_t start = i;
                while (i < statement.size() && !std::isspace(static_cast<unsigned char>(statement[i]))) ++i;
                if (i > start) tokens.push_back(statement.substr(start, i - start));
            }
            return tokens;
        }

        // Drops // comments and preprocessor lines, keeping line structure.
        std::string StripSource(std::string_view source)
        {
            std::string out;
            out.reserve(source.size());

            size_t pos = 0;
            while (pos < source.size())
            {
                size_t end = source.find('\n', pos);
                if (end == std::string_view::npos) end = source.size();

                std::string_view line = source.substr(pos, end - pos);
                if (const size_t comment = line.find("//"); comment != std::string_view::npos)
                    line = line.substr(0, comment);

                const size_t first = line.find_first_not_of(" \t");
                if (first == std::string_view::npos || line[first] != '#')
                    out.append(line);
                out.push_back('\n');

                pos = end + 1;
            }
            return out;
        }

        // Collects `<keyword> <type> <name>;` declarations in source order.
        void Reflect(std::string_view source, std::string_view keyword, bool countSlots,
                     std::unordered_map<std::string, int32_t>& out, int32_t& nextLocation)
        {
            const std::string stripped = StripSource(source);
            std::string_view text = stripped;

            size_t pos = 0;
            while (pos < text.size())
            {
                size_t end = text.find(';', pos);
                if (end == std::string_view::npos) end = text.size();

                const auto tokens = Tokenize(text.substr(pos, end - pos));
                for (size_t t = 0; t + 2 < tokens.size(); ++t)
                {
                    if (tokens[t] != keyword) continue;

                    const std::string_view type = tokens[t + 1];
                    std::string_view name = tokens[t + 2];
                    if (const size_t bracket = name.find('['); bracket != std::string_view::npos)
                        name = name.substr(0, bracket);

                    if (!name.empty() && !out.contains(std::string(name)))
                    {
                        out.emplace(std::string(name), nextLocation);
                        nextLocation += countSlots ? LocationSlots(type) : 1;
                    }
                    break;
                }

                pos = end + 1;
            }
        }

        Core::Result CompileStage(std::string_view stage, std::string_view source)
        {
            if (const size_t error = source.find("#error"); error != std::string_view::npos)
            {
                const size_t eol = source.find('\n', error);
                Core::Log::Error("[Headless] {} stage: {}", stage, source.substr(error, eol == std::string_view::npos ? std::string_view::npos : eol - error));
                return Core::Err(Core::ErrorCode::ShaderCompilationFailed);
            }

            if (source.find("main") == std::string_view::npos)
            {
                Core::Log::Error("[Headless] {} stage: no entry point main()", stage);
                return Core::Err(Core::ErrorCode::ShaderCompilationFailed);
            }

            return Core::Ok();
        }
    }

    HeadlessDevice::HeadlessDevice(glm::uvec2 renderSize)
        : m_RenderSize(renderSize)
    {
    }

    // -------------------------------------------------------------------------
    // Programs
    // -------------------------------------------------------------------------

    Core::Expected<ProgramHandle> HeadlessDevice::CreateProgram(const ProgramDesc& desc)
    {
        if (auto r = CompileStage("vertex", desc.VertexSource); !r) return std::unexpected(r.error());
        if (auto r = CompileStage("fragment", desc.FragmentSource); !r) return std::unexpected(r.error());

        Program program;
        int32_t nextAttribute = 0;
        Reflect(desc.VertexSource, "in", true, program.Attributes, nextAttribute);

        int32_t nextUniform = 0;
        Reflect(desc.VertexSource, "uniform", false, program.Uniforms, nextUniform);
        Reflect(desc.FragmentSource, "uniform", false, program.Uniforms, nextUniform);

        return m_Programs.Add(std::move(program));
    }

    void HeadlessDevice::DestroyProgram(ProgramHandle program)
    {
        m_Programs.Remove(program);
    }

    int32_t HeadlessDevice::GetAttributeLocation(ProgramHandle program, std::string_view name) const
    {
        const Program* p = m_Programs.Get(program);
        if (!p) return -1;
        auto it = p->Attributes.find(std::string(name));
        return it != p->Attributes.end() ? it->second : -1;
    }

    int32_t HeadlessDevice::GetUniformLocation(ProgramHandle program, std::string_view name) const
    {
        const Program* p = m_Programs.Get(program);
        if (!p) return -1;
        auto it = p->Uniforms.find(std::string(name));
        return it != p->Uniforms.end() ? it->second : -1;
    }

    // -------------------------------------------------------------------------
    // Buffers & layouts
    // -------------------------------------------------------------------------

    BufferHandle HeadlessDevice::CreateBuffer()
    {
        return m_Buffers.Add({});
    }

    void HeadlessDevice::UploadBuffer(BufferHandle buffer, std::span<const float> data)
    {
        std::vector<float>* storage = m_Buffers.Get(buffer);
        if (!storage) return;

        storage->assign(data.begin(), data.end());
        Record({.Type = CommandType::UploadBuffer, .Buffer = buffer, .Count = static_cast<uint32_t>(data.size())});
    }

    void HeadlessDevice::DestroyBuffer(BufferHandle buffer)
    {
        m_Buffers.Remove(buffer);
    }

    std::span<const float> HeadlessDevice::GetBufferData(BufferHandle buffer) const
    {
        const std::vector<float>* storage = m_Buffers.Get(buffer);
        if (!storage) return {};
        return *storage;
    }

    VertexLayoutHandle HeadlessDevice::CreateVertexLayout()
    {
        return m_Layouts.Add({});
    }

    void HeadlessDevice::SetVertexAttribute(VertexLayoutHandle layout, const VertexAttributeDesc& attribute)
    {
        if (auto* attributes = m_Layouts.Get(layout))
            attributes->push_back(attribute);
    }

    void HeadlessDevice::DestroyVertexLayout(VertexLayoutHandle layout)
    {
        m_Layouts.Remove(layout);
    }

    // -------------------------------------------------------------------------
    // Textures, depth/stencil, framebuffers
    // -------------------------------------------------------------------------

    Core::Expected<TextureHandle> HeadlessDevice::CreateTexture(uint32_t width, uint32_t height, TextureFormat format)
    {
        if (!IsValid(format)) return Core::Err<TextureHandle>(Core::ErrorCode::InvalidFormat);
        if (width == 0 || height == 0) return Core::Err<TextureHandle>(Core::ErrorCode::InvalidArgument);

        return m_Textures.Add(TextureInfo{.Width = width, .Height = height, .Layers = 1, .Format = format, .IsArray = false});
    }

    Core::Expected<TextureHandle> HeadlessDevice::CreateTextureArray(uint32_t width, uint32_t height, uint32_t layers, TextureFormat format)
    {
        if (!IsValid(format)) return Core::Err<TextureHandle>(Core::ErrorCode::InvalidFormat);
        if (width == 0 || height == 0 || layers == 0) return Core::Err<TextureHandle>(Core::ErrorCode::InvalidArgument);

        return m_Textures.Add(TextureInfo{.Width = width, .Height = height, .Layers = layers, .Format = format, .IsArray = true});
    }

    void HeadlessDevice::DestroyTexture(TextureHandle texture)
    {
        m_Textures.Remove(texture);
    }

    void HeadlessDevice::CopyTexture(TextureHandle source, TextureHandle destination, uint32_t width, uint32_t height)
    {
        if (!m_Textures.Contains(source) || !m_Textures.Contains(destination)) return;
        Record({.Type = CommandType::CopyTexture, .Texture = source, .Destination = destination, .Count = width * height});
    }

    DepthStencilHandle HeadlessDevice::CreateDepthStencil(uint32_t width, uint32_t height)
    {
        return m_DepthStencils.Add(glm::uvec2{width, height});
    }

    void HeadlessDevice::DestroyDepthStencil(DepthStencilHandle depthStencil)
    {
        m_DepthStencils.Remove(depthStencil);
    }

    FramebufferHandle HeadlessDevice::CreateFramebuffer()
    {
        return m_Framebuffers.Add({});
    }

    void HeadlessDevice::DestroyFramebuffer(FramebufferHandle framebuffer)
    {
        m_Framebuffers.Remove(framebuffer);
    }

    void HeadlessDevice::AttachDepthStencil(FramebufferHandle framebuffer, DepthStencilHandle depthStencil)
    {
        if (Framebuffer* fb = m_Framebuffers.Get(framebuffer))
            fb->DepthStencil = depthStencil;
    }

    void HeadlessDevice::SetColorAttachment(FramebufferHandle framebuffer, uint32_t slot, TextureHandle texture)
    {
        Framebuffer* fb = m_Framebuffers.Get(framebuffer);
        if (!fb || slot >= kMaxColorAttachments) return;

        fb->Color[slot] = texture;
        Record({.Type = CommandType::SetColorAttachment, .Framebuffer = framebuffer, .Texture = texture, .Slot = slot});
    }

    void HeadlessDevice::SetDrawBuffers(FramebufferHandle framebuffer, uint32_t count)
    {
        Framebuffer* fb = m_Framebuffers.Get(framebuffer);
        if (!fb) return;

        fb->DrawBuffers = std::min(count, kMaxColorAttachments);
        Record({.Type = CommandType::SetDrawBuffers, .Framebuffer = framebuffer, .Slot = fb->DrawBuffers});
    }

    void HeadlessDevice::BindFramebuffer(FramebufferHandle framebuffer)
    {
        Record({.Type = CommandType::BindFramebuffer, .Framebuffer = framebuffer});
    }

    TextureHandle HeadlessDevice::GetColorAttachment(FramebufferHandle framebuffer, uint32_t slot) const
    {
        const Framebuffer* fb = m_Framebuffers.Get(framebuffer);
        if (!fb || slot >= kMaxColorAttachments) return {};
        return fb->Color[slot];
    }

    // -------------------------------------------------------------------------
    // State & draw
    // -------------------------------------------------------------------------

    void HeadlessDevice::SetPipelineState(const PipelineState& state)
    {
        Record({.Type = CommandType::SetPipelineState, .Pipeline = state});
    }

    void HeadlessDevice::UseProgram(ProgramHandle program)
    {
        m_CurrentProgram = program;
        Record({.Type = CommandType::UseProgram, .Program = program});
    }

    void HeadlessDevice::BindVertexLayout(VertexLayoutHandle)
    {
        Record({.Type = CommandType::BindVertexLayout});
    }

    void HeadlessDevice::SetUniform(int32_t location, const UniformValue& value)
    {
        if (location < 0) return;
        Record({.Type = CommandType::SetUniform, .Location = location, .Value = value});
    }

    void HeadlessDevice::BindTexture(uint32_t unit, TextureHandle texture)
    {
        Record({.Type = CommandType::BindTexture, .Texture = texture, .Slot = unit});
    }

    void HeadlessDevice::Clear(const glm::vec4&)
    {
        Record({.Type = CommandType::Clear});
    }

    void HeadlessDevice::SetViewport(uint32_t width, uint32_t height)
    {
        Record({.Type = CommandType::SetViewport, .Count = width * height});
    }

    void HeadlessDevice::DrawInstanced(uint32_t vertexCount, uint32_t instanceCount)
    {
        Record({.Type = CommandType::DrawInstanced, .Program = m_CurrentProgram, .Count = vertexCount, .Instances = instanceCount});
    }
}
