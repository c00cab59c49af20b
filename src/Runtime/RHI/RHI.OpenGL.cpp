module;
#include <GL/glew.h>

#include <array>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <glm/glm.hpp>
#include <glm/gtc/type_ptr.hpp>

module RHI:OpenGL.Impl;

import Core;
import :Types;
import :OpenGL;

namespace RHI
{
    namespace
    {
        struct FormatInfo
        {
            GLenum Internal;
            GLenum Layout;
            GLenum Type;
        };

        FormatInfo ToGL(TextureFormat format)
        {
            switch (format)
            {
            case TextureFormat::RGBA8: return {GL_RGBA8, GL_RGBA, GL_UNSIGNED_BYTE};
            case TextureFormat::RGBA16F: return {GL_RGBA16F, GL_RGBA, GL_HALF_FLOAT};
            case TextureFormat::R32F: return {GL_R32F, GL_RED, GL_FLOAT};
            }
            return {GL_RGBA8, GL_RGBA, GL_UNSIGNED_BYTE};
        }

        GLenum ToGL(DepthTest test)
        {
            switch (test)
            {
            case DepthTest::Never: return GL_NEVER;
            case DepthTest::Less: return GL_LESS;
            case DepthTest::Equal: return GL_EQUAL;
            case DepthTest::LessEqual: return GL_LEQUAL;
            case DepthTest::Greater: return GL_GREATER;
            case DepthTest::NotEqual: return GL_NOTEQUAL;
            case DepthTest::GreaterEqual: return GL_GEQUAL;
            case DepthTest::Disabled:
            case DepthTest::Always: return GL_ALWAYS;
            }
            return GL_ALWAYS;
        }

        GLenum ToGL(BlendFactor factor)
        {
            switch (factor)
            {
            case BlendFactor::Zero: return GL_ZERO;
            case BlendFactor::One: return GL_ONE;
            case BlendFactor::SrcColor: return GL_SRC_COLOR;
            case BlendFactor::OneMinusSrcColor: return GL_ONE_MINUS_SRC_COLOR;
            case BlendFactor::DstColor: return GL_DST_COLOR;
            case BlendFactor::OneMinusDstColor: return GL_ONE_MINUS_DST_COLOR;
            case BlendFactor::SrcAlpha: return GL_SRC_ALPHA;
            case BlendFactor::OneMinusSrcAlpha: return GL_ONE_MINUS_SRC_ALPHA;
            case BlendFactor::DstAlpha: return GL_DST_ALPHA;
            case BlendFactor::OneMinusDstAlpha: return GL_ONE_MINUS_DST_ALPHA;
            }
            return GL_ONE;
        }

        Core::Expected<GLuint> CompileStage(GLenum stage, const std::string& source)
        {
            GLuint shader = glCreateShader(stage);
            const char* text = source.c_str();
            glShaderSource(shader, 1, &text, nullptr);
            glCompileShader(shader);

            GLint success = GL_FALSE;
            glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
            if (success == GL_TRUE) return shader;

            GLint length = 0;
            glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &length);
            std::string log(static_cast<size_t>(length > 0 ? length : 1), '\0');
            glGetShaderInfoLog(shader, length, nullptr, log.data());

            Core::Log::Error("[GL] {} stage failed to compile:\n{}", stage == GL_VERTEX_SHADER ? "vertex" : "fragment", log);
            glDeleteShader(shader);
            return Core::Err<GLuint>(Core::ErrorCode::ShaderCompilationFailed);
        }
    }

    Core::Expected<std::unique_ptr<OpenGLDevice>> OpenGLDevice::Create(Core::Windowing::Window& window)
    {
        if (!window.IsValid())
            return Core::Err<std::unique_ptr<OpenGLDevice>>(Core::ErrorCode::WindowCreationFailed);

        // Needed for core profile contexts.
        glewExperimental = GL_TRUE;
        if (const GLenum err = glewInit(); err != GLEW_OK)
        {
            Core::Log::Error("[GL] glewInit failed: {}", reinterpret_cast<const char*>(glewGetErrorString(err)));
            return Core::Err<std::unique_ptr<OpenGLDevice>>(Core::ErrorCode::LoaderInitFailed);
        }
        glGetError(); // glewInit leaves GL_INVALID_ENUM behind on core contexts

        if (!GLEW_VERSION_3_3)
        {
            Core::Log::Error("[GL] OpenGL 3.3 is not available");
            return Core::Err<std::unique_ptr<OpenGLDevice>>(Core::ErrorCode::LoaderInitFailed);
        }

        return std::make_unique<OpenGLDevice>(window);
    }

    OpenGLDevice::OpenGLDevice(Core::Windowing::Window& window)
        : m_Window(window)
    {
        glGenFramebuffers(2, m_CopyFramebuffers);

        const auto* version = reinterpret_cast<const char*>(glGetString(GL_VERSION));
        const auto* renderer = reinterpret_cast<const char*>(glGetString(GL_RENDERER));
        Core::Log::Info("OpenGL {} ({})", version ? version : "?", renderer ? renderer : "?");
    }

    OpenGLDevice::~OpenGLDevice()
    {
        m_Programs.ForEach([](ProgramHandle, uint32_t& id) { glDeleteProgram(id); });
        m_Buffers.ForEach([](BufferHandle, uint32_t& id) { glDeleteBuffers(1, &id); });
        m_Layouts.ForEach([](VertexLayoutHandle, uint32_t& id) { glDeleteVertexArrays(1, &id); });
        m_Textures.ForEach([](TextureHandle, Texture& t) { glDeleteTextures(1, &t.Id); });
        m_DepthStencils.ForEach([](DepthStencilHandle, uint32_t& id) { glDeleteRenderbuffers(1, &id); });
        m_Framebuffers.ForEach([](FramebufferHandle, uint32_t& id) { glDeleteFramebuffers(1, &id); });
        glDeleteFramebuffers(2, m_CopyFramebuffers);
    }

    // -------------------------------------------------------------------------
    // Programs
    // -------------------------------------------------------------------------

    Core::Expected<ProgramHandle> OpenGLDevice::CreateProgram(const ProgramDesc& desc)
    {
        auto vertex = CompileStage(GL_VERTEX_SHADER, desc.VertexSource);
        if (!vertex) return std::unexpected(vertex.error());

        auto fragment = CompileStage(GL_FRAGMENT_SHADER, desc.FragmentSource);
        if (!fragment)
        {
            glDeleteShader(*vertex);
            return std::unexpected(fragment.error());
        }

        GLuint program = glCreateProgram();
        glAttachShader(program, *vertex);
        glAttachShader(program, *fragment);

        // Outputs past the attachment limit are left to the linker to place;
        // render passes refuse such shaders.
        for (size_t i = 0; i < desc.Outputs.size() && i < kMaxColorAttachments; ++i)
        {
            glBindFragDataLocation(program, static_cast<GLuint>(i), desc.Outputs[i].c_str());
        }

        glLinkProgram(program);
        glDetachShader(program, *vertex);
        glDetachShader(program, *fragment);
        glDeleteShader(*vertex);
        glDeleteShader(*fragment);

        GLint success = GL_FALSE;
        glGetProgramiv(program, GL_LINK_STATUS, &success);
        if (success != GL_TRUE)
        {
            GLint length = 0;
            glGetProgramiv(program, GL_INFO_LOG_LENGTH, &length);
            std::string log(static_cast<size_t>(length > 0 ? length : 1), '\0');
            glGetProgramInfoLog(program, length, nullptr, log.data());

            Core::Log::Error("[GL] program failed to link:\n{}", log);
            glDeleteProgram(program);
            return Core::Err<ProgramHandle>(Core::ErrorCode::PipelineCreationFailed);
        }

        return m_Programs.Add(program);
    }

    void OpenGLDevice::DestroyProgram(ProgramHandle program)
    {
        if (uint32_t* id = m_Programs.Get(program))
        {
            glDeleteProgram(*id);
            m_Programs.Remove(program);
        }
    }

    int32_t OpenGLDevice::GetAttributeLocation(ProgramHandle program, std::string_view name) const
    {
        const uint32_t* id = m_Programs.Get(program);
        if (!id) return -1;
        return glGetAttribLocation(*id, std::string(name).c_str());
    }

    int32_t OpenGLDevice::GetUniformLocation(ProgramHandle program, std::string_view name) const
    {
        const uint32_t* id = m_Programs.Get(program);
        if (!id) return -1;
        return glGetUniformLocation(*id, std::string(name).c_str());
    }

    // -------------------------------------------------------------------------
    // Buffers & layouts
    // -------------------------------------------------------------------------

    BufferHandle OpenGLDevice::CreateBuffer()
    {
        GLuint id = 0;
        glGenBuffers(1, &id);
        return m_Buffers.Add(id);
    }

    void OpenGLDevice::UploadBuffer(BufferHandle buffer, std::span<const float> data)
    {
        const uint32_t* id = m_Buffers.Get(buffer);
        if (!id) return;

        glBindBuffer(GL_ARRAY_BUFFER, *id);
        glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(data.size_bytes()), data.data(), GL_DYNAMIC_DRAW);
        glBindBuffer(GL_ARRAY_BUFFER, 0);
    }

    void OpenGLDevice::DestroyBuffer(BufferHandle buffer)
    {
        if (uint32_t* id = m_Buffers.Get(buffer))
        {
            glDeleteBuffers(1, id);
            m_Buffers.Remove(buffer);
        }
    }

    VertexLayoutHandle OpenGLDevice::CreateVertexLayout()
    {
        GLuint id = 0;
        glGenVertexArrays(1, &id);
        return m_Layouts.Add(id);
    }

    void OpenGLDevice::SetVertexAttribute(VertexLayoutHandle layout, const VertexAttributeDesc& attribute)
    {
        const uint32_t* vao = m_Layouts.Get(layout);
        const uint32_t* vbo = m_Buffers.Get(attribute.Buffer);
        if (!vao || !vbo) return;

        glBindVertexArray(*vao);
        glBindBuffer(GL_ARRAY_BUFFER, *vbo);
        glEnableVertexAttribArray(attribute.Location);

        const auto* offset = reinterpret_cast<const void*>(static_cast<uintptr_t>(attribute.OffsetBytes));
        if (attribute.Kind == AttributeKind::Int)
        {
            glVertexAttribIPointer(attribute.Location, static_cast<GLint>(attribute.Components), GL_INT,
                                   static_cast<GLsizei>(attribute.StrideBytes), offset);
        }
        else
        {
            glVertexAttribPointer(attribute.Location, static_cast<GLint>(attribute.Components), GL_FLOAT, GL_FALSE,
                                  static_cast<GLsizei>(attribute.StrideBytes), offset);
        }
        glVertexAttribDivisor(attribute.Location, attribute.Divisor);

        glBindVertexArray(0);
        glBindBuffer(GL_ARRAY_BUFFER, 0);
    }

    void OpenGLDevice::DestroyVertexLayout(VertexLayoutHandle layout)
    {
        if (uint32_t* id = m_Layouts.Get(layout))
        {
            glDeleteVertexArrays(1, id);
            m_Layouts.Remove(layout);
        }
    }

    // -------------------------------------------------------------------------
    // Textures
    // -------------------------------------------------------------------------

    Core::Expected<TextureHandle> OpenGLDevice::CreateTexture(uint32_t width, uint32_t height, TextureFormat format)
    {
        if (!IsValid(format)) return Core::Err<TextureHandle>(Core::ErrorCode::InvalidFormat);
        if (width == 0 || height == 0) return Core::Err<TextureHandle>(Core::ErrorCode::InvalidArgument);

        const FormatInfo info = ToGL(format);

        GLuint id = 0;
        glGenTextures(1, &id);
        glBindTexture(GL_TEXTURE_2D, id);
        glTexImage2D(GL_TEXTURE_2D, 0, static_cast<GLint>(info.Internal), static_cast<GLsizei>(width),
                     static_cast<GLsizei>(height), 0, info.Layout, info.Type, nullptr);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
        glBindTexture(GL_TEXTURE_2D, 0);

        return m_Textures.Add(Texture{.Id = id, .Target = GL_TEXTURE_2D, .Width = width, .Height = height, .Layers = 1});
    }

    Core::Expected<TextureHandle> OpenGLDevice::CreateTextureArray(uint32_t width, uint32_t height, uint32_t layers, TextureFormat format)
    {
        if (!IsValid(format)) return Core::Err<TextureHandle>(Core::ErrorCode::InvalidFormat);
        if (width == 0 || height == 0 || layers == 0) return Core::Err<TextureHandle>(Core::ErrorCode::InvalidArgument);

        const FormatInfo info = ToGL(format);

        GLuint id = 0;
        glGenTextures(1, &id);
        glBindTexture(GL_TEXTURE_2D_ARRAY, id);
        glTexImage3D(GL_TEXTURE_2D_ARRAY, 0, static_cast<GLint>(info.Internal), static_cast<GLsizei>(width),
                     static_cast<GLsizei>(height), static_cast<GLsizei>(layers), 0, info.Layout, info.Type, nullptr);
        glTexParameteri(GL_TEXTURE_2D_ARRAY, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D_ARRAY, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D_ARRAY, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
        glTexParameteri(GL_TEXTURE_2D_ARRAY, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
        glBindTexture(GL_TEXTURE_2D_ARRAY, 0);

        return m_Textures.Add(Texture{.Id = id, .Target = GL_TEXTURE_2D_ARRAY, .Width = width, .Height = height, .Layers = layers});
    }

    void OpenGLDevice::DestroyTexture(TextureHandle texture)
    {
        if (Texture* t = m_Textures.Get(texture))
        {
            glDeleteTextures(1, &t->Id);
            m_Textures.Remove(texture);
        }
    }

    void OpenGLDevice::BindTextureToRead(uint32_t framebuffer, const Texture& texture, uint32_t layer) const
    {
        glBindFramebuffer(GL_READ_FRAMEBUFFER, framebuffer);
        if (texture.Target == GL_TEXTURE_2D_ARRAY)
            glFramebufferTextureLayer(GL_READ_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, texture.Id, 0, static_cast<GLint>(layer));
        else
            glFramebufferTexture2D(GL_READ_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, texture.Id, 0);
        glReadBuffer(GL_COLOR_ATTACHMENT0);
    }

    void OpenGLDevice::BindTextureToDraw(uint32_t framebuffer, const Texture& texture, uint32_t layer) const
    {
        glBindFramebuffer(GL_DRAW_FRAMEBUFFER, framebuffer);
        if (texture.Target == GL_TEXTURE_2D_ARRAY)
            glFramebufferTextureLayer(GL_DRAW_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, texture.Id, 0, static_cast<GLint>(layer));
        else
            glFramebufferTexture2D(GL_DRAW_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, texture.Id, 0);
        const GLenum buffer = GL_COLOR_ATTACHMENT0;
        glDrawBuffers(1, &buffer);
    }

    void OpenGLDevice::CopyTexture(TextureHandle source, TextureHandle destination, uint32_t width, uint32_t height)
    {
        const Texture* src = m_Textures.Get(source);
        const Texture* dst = m_Textures.Get(destination);
        if (!src || !dst) return;

        const uint32_t layers = src->Layers < dst->Layers ? src->Layers : dst->Layers;
        const auto w = static_cast<GLint>(width);
        const auto h = static_cast<GLint>(height);

        for (uint32_t layer = 0; layer < layers; ++layer)
        {
            BindTextureToRead(m_CopyFramebuffers[0], *src, layer);
            BindTextureToDraw(m_CopyFramebuffers[1], *dst, layer);
            glBlitFramebuffer(0, 0, w, h, 0, 0, w, h, GL_COLOR_BUFFER_BIT, GL_NEAREST);
        }

        glBindFramebuffer(GL_FRAMEBUFFER, m_BoundFramebuffer);
    }

    // -------------------------------------------------------------------------
    // Depth/stencil & framebuffers
    // -------------------------------------------------------------------------

    DepthStencilHandle OpenGLDevice::CreateDepthStencil(uint32_t width, uint32_t height)
    {
        GLuint id = 0;
        glGenRenderbuffers(1, &id);
        glBindRenderbuffer(GL_RENDERBUFFER, id);
        glRenderbufferStorage(GL_RENDERBUFFER, GL_DEPTH24_STENCIL8, static_cast<GLsizei>(width), static_cast<GLsizei>(height));
        glBindRenderbuffer(GL_RENDERBUFFER, 0);
        return m_DepthStencils.Add(id);
    }

    void OpenGLDevice::DestroyDepthStencil(DepthStencilHandle depthStencil)
    {
        if (uint32_t* id = m_DepthStencils.Get(depthStencil))
        {
            glDeleteRenderbuffers(1, id);
            m_DepthStencils.Remove(depthStencil);
        }
    }

    FramebufferHandle OpenGLDevice::CreateFramebuffer()
    {
        GLuint id = 0;
        glGenFramebuffers(1, &id);
        return m_Framebuffers.Add(id);
    }

    void OpenGLDevice::DestroyFramebuffer(FramebufferHandle framebuffer)
    {
        if (uint32_t* id = m_Framebuffers.Get(framebuffer))
        {
            if (m_BoundFramebuffer == *id)
            {
                glBindFramebuffer(GL_FRAMEBUFFER, 0);
                m_BoundFramebuffer = 0;
            }
            glDeleteFramebuffers(1, id);
            m_Framebuffers.Remove(framebuffer);
        }
    }

    void OpenGLDevice::AttachDepthStencil(FramebufferHandle framebuffer, DepthStencilHandle depthStencil)
    {
        const uint32_t* fbo = m_Framebuffers.Get(framebuffer);
        if (!fbo) return;

        const uint32_t* rbo = m_DepthStencils.Get(depthStencil);
        glBindFramebuffer(GL_FRAMEBUFFER, *fbo);
        glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_DEPTH_STENCIL_ATTACHMENT, GL_RENDERBUFFER, rbo ? *rbo : 0);
        glBindFramebuffer(GL_FRAMEBUFFER, m_BoundFramebuffer);
    }

    void OpenGLDevice::SetColorAttachment(FramebufferHandle framebuffer, uint32_t slot, TextureHandle texture)
    {
        const uint32_t* fbo = m_Framebuffers.Get(framebuffer);
        if (!fbo || slot >= kMaxColorAttachments) return;

        const Texture* t = m_Textures.Get(texture);
        glBindFramebuffer(GL_FRAMEBUFFER, *fbo);
        glFramebufferTexture(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0 + slot, t ? t->Id : 0, 0);
        glBindFramebuffer(GL_FRAMEBUFFER, m_BoundFramebuffer);
    }

    void OpenGLDevice::SetDrawBuffers(FramebufferHandle framebuffer, uint32_t count)
    {
        const uint32_t* fbo = m_Framebuffers.Get(framebuffer);
        if (!fbo) return;

        std::array<GLenum, kMaxColorAttachments> buffers{};
        const uint32_t active = count < kMaxColorAttachments ? count : kMaxColorAttachments;
        for (uint32_t i = 0; i < active; ++i)
            buffers[i] = GL_COLOR_ATTACHMENT0 + i;

        glBindFramebuffer(GL_FRAMEBUFFER, *fbo);
        if (active == 0)
            glDrawBuffer(GL_NONE);
        else
            glDrawBuffers(static_cast<GLsizei>(active), buffers.data());

        if (glCheckFramebufferStatus(GL_FRAMEBUFFER) != GL_FRAMEBUFFER_COMPLETE)
            Core::Log::Warn("[GL] framebuffer incomplete with {} draw buffers", active);

        glBindFramebuffer(GL_FRAMEBUFFER, m_BoundFramebuffer);
    }

    void OpenGLDevice::BindFramebuffer(FramebufferHandle framebuffer)
    {
        const uint32_t* fbo = m_Framebuffers.Get(framebuffer);
        m_BoundFramebuffer = fbo ? *fbo : 0;
        glBindFramebuffer(GL_FRAMEBUFFER, m_BoundFramebuffer);
    }

    // -------------------------------------------------------------------------
    // State & draw
    // -------------------------------------------------------------------------

    void OpenGLDevice::SetPipelineState(const PipelineState& state)
    {
        if (state.Depth == DepthTest::Disabled)
        {
            glDisable(GL_DEPTH_TEST);
        }
        else
        {
            glEnable(GL_DEPTH_TEST);
            glDepthFunc(ToGL(state.Depth));
        }
        glDepthMask(state.DepthWrite ? GL_TRUE : GL_FALSE);

        if (state.Blend.Enabled)
        {
            glEnable(GL_BLEND);
            glBlendFunc(ToGL(state.Blend.Src), ToGL(state.Blend.Dst));
        }
        else
        {
            glDisable(GL_BLEND);
        }
    }

    void OpenGLDevice::UseProgram(ProgramHandle program)
    {
        const uint32_t* id = m_Programs.Get(program);
        glUseProgram(id ? *id : 0);
    }

    void OpenGLDevice::BindVertexLayout(VertexLayoutHandle layout)
    {
        const uint32_t* id = m_Layouts.Get(layout);
        glBindVertexArray(id ? *id : 0);
    }

    void OpenGLDevice::SetUniform(int32_t location, const UniformValue& value)
    {
        if (location < 0) return;

        std::visit([location](const auto& v)
        {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, float>)
                glUniform1f(location, v);
            else if constexpr (std::is_same_v<T, int32_t>)
                glUniform1i(location, v);
            else if constexpr (std::is_same_v<T, glm::vec2>)
                glUniform2fv(location, 1, glm::value_ptr(v));
            else if constexpr (std::is_same_v<T, glm::mat3>)
                glUniformMatrix3fv(location, 1, GL_FALSE, glm::value_ptr(v));
        }, value);
    }

    void OpenGLDevice::BindTexture(uint32_t unit, TextureHandle texture)
    {
        glActiveTexture(GL_TEXTURE0 + unit);
        if (const Texture* t = m_Textures.Get(texture))
            glBindTexture(t->Target, t->Id);
        else
            glBindTexture(GL_TEXTURE_2D, 0);
    }

    void OpenGLDevice::Clear(const glm::vec4& color)
    {
        // Depth writes may be masked off by the last pass; a clear must reach depth.
        glDepthMask(GL_TRUE);
        glClearColor(color.r, color.g, color.b, color.a);
        glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT | GL_STENCIL_BUFFER_BIT);
    }

    void OpenGLDevice::SetViewport(uint32_t width, uint32_t height)
    {
        glViewport(0, 0, static_cast<GLsizei>(width), static_cast<GLsizei>(height));
    }

    void OpenGLDevice::DrawInstanced(uint32_t vertexCount, uint32_t instanceCount)
    {
        glDrawArraysInstanced(GL_TRIANGLES, 0, static_cast<GLsizei>(vertexCount), static_cast<GLsizei>(instanceCount));
    }

    glm::uvec2 OpenGLDevice::GetRenderSize() const
    {
        const int w = m_Window.GetFramebufferWidth();
        const int h = m_Window.GetFramebufferHeight();
        return {static_cast<uint32_t>(w > 0 ? w : 0), static_cast<uint32_t>(h > 0 ? h : 0)};
    }
}
