module;
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>
#include <glm/glm.hpp>

export module RHI:HeadlessDevice;

import Core;
import :Types;
import :Device;

export namespace RHI
{
    enum class CommandType : uint8_t
    {
        Clear,
        SetViewport,
        BindFramebuffer,
        SetColorAttachment,
        SetDrawBuffers,
        SetPipelineState,
        UseProgram,
        BindVertexLayout,
        SetUniform,
        BindTexture,
        UploadBuffer,
        DrawInstanced,
        CopyTexture,
    };

    // One recorded device call. Only the fields relevant to Type are set.
    struct RecordedCommand
    {
        CommandType Type = CommandType::Clear;
        ProgramHandle Program{};
        FramebufferHandle Framebuffer{};
        TextureHandle Texture{};      // BindTexture, SetColorAttachment, CopyTexture source
        TextureHandle Destination{};  // CopyTexture
        BufferHandle Buffer{};
        uint32_t Slot = 0;            // texture unit, attachment slot or draw buffer count
        uint32_t Count = 0;           // vertex count, or floats uploaded
        uint32_t Instances = 0;
        int32_t Location = -1;
        UniformValue Value{};
        PipelineState Pipeline{};
    };

    struct TextureInfo
    {
        uint32_t Width = 0;
        uint32_t Height = 0;
        uint32_t Layers = 1;
        TextureFormat Format = TextureFormat::RGBA8;
        bool IsArray = false;
    };

    // -------------------------------------------------------------------------
    // HeadlessDevice - IDevice without a GPU
    // -------------------------------------------------------------------------
    // Keeps every object in memory and records the command stream, so the
    // render graph runs in tests and in headless engines. Program reflection
    // comes from the `in` and `uniform` declarations in the sources. A stage
    // fails to compile when it has no main() or contains #error.
    // -------------------------------------------------------------------------
    class HeadlessDevice final : public IDevice
    {
    public:
        explicit HeadlessDevice(glm::uvec2 renderSize = {1280, 720});

        [[nodiscard]] Core::Expected<ProgramHandle> CreateProgram(const ProgramDesc& desc) override;
        void DestroyProgram(ProgramHandle program) override;
        [[nodiscard]] int32_t GetAttributeLocation(ProgramHandle program, std::string_view name) const override;
        [[nodiscard]] int32_t GetUniformLocation(ProgramHandle program, std::string_view name) const override;

        [[nodiscard]] BufferHandle CreateBuffer() override;
        void UploadBuffer(BufferHandle buffer, std::span<const float> data) override;
        void DestroyBuffer(BufferHandle buffer) override;

        [[nodiscard]] VertexLayoutHandle CreateVertexLayout() override;
        void SetVertexAttribute(VertexLayoutHandle layout, const VertexAttributeDesc& attribute) override;
        void DestroyVertexLayout(VertexLayoutHandle layout) override;

        [[nodiscard]] Core::Expected<TextureHandle> CreateTexture(uint32_t width, uint32_t height, TextureFormat format) override;
        [[nodiscard]] Core::Expected<TextureHandle> CreateTextureArray(uint32_t width, uint32_t height, uint32_t layers, TextureFormat format) override;
        void DestroyTexture(TextureHandle texture) override;
        void CopyTexture(TextureHandle source, TextureHandle destination, uint32_t width, uint32_t height) override;

        [[nodiscard]] DepthStencilHandle CreateDepthStencil(uint32_t width, uint32_t height) override;
        void DestroyDepthStencil(DepthStencilHandle depthStencil) override;

        [[nodiscard]] FramebufferHandle CreateFramebuffer() override;
        void DestroyFramebuffer(FramebufferHandle framebuffer) override;
        void AttachDepthStencil(FramebufferHandle framebuffer, DepthStencilHandle depthStencil) override;
        void SetColorAttachment(FramebufferHandle framebuffer, uint32_t slot, TextureHandle texture) override;
        void SetDrawBuffers(FramebufferHandle framebuffer, uint32_t count) override;
        void BindFramebuffer(FramebufferHandle framebuffer) override;

        void SetPipelineState(const PipelineState& state) override;
        void UseProgram(ProgramHandle program) override;
        void BindVertexLayout(VertexLayoutHandle layout) override;
        void SetUniform(int32_t location, const UniformValue& value) override;
        void BindTexture(uint32_t unit, TextureHandle texture) override;
        void Clear(const glm::vec4& color) override;
        void SetViewport(uint32_t width, uint32_t height) override;
        void DrawInstanced(uint32_t vertexCount, uint32_t instanceCount) override;

        [[nodiscard]] glm::uvec2 GetRenderSize() const override { return m_RenderSize; }

        // ----- Test inspection -----
        void SetRenderSize(glm::uvec2 size) { m_RenderSize = size; }

        [[nodiscard]] const std::vector<RecordedCommand>& GetCommands() const { return m_Commands; }
        void ClearCommands() { m_Commands.clear(); }

        [[nodiscard]] std::span<const float> GetBufferData(BufferHandle buffer) const;
        [[nodiscard]] const TextureInfo* GetTextureInfo(TextureHandle texture) const { return m_Textures.Get(texture); }
        [[nodiscard]] const std::vector<VertexAttributeDesc>* GetVertexAttributes(VertexLayoutHandle layout) const { return m_Layouts.Get(layout); }
        [[nodiscard]] TextureHandle GetColorAttachment(FramebufferHandle framebuffer, uint32_t slot) const;

        [[nodiscard]] size_t GetLiveProgramCount() const { return m_Programs.Size(); }
        [[nodiscard]] size_t GetLiveTextureCount() const { return m_Textures.Size(); }
        [[nodiscard]] size_t GetLiveDepthStencilCount() const { return m_DepthStencils.Size(); }

    private:
        struct Program
        {
            std::unordered_map<std::string, int32_t> Attributes;
            std::unordered_map<std::string, int32_t> Uniforms;
        };

        struct Framebuffer
        {
            std::array<TextureHandle, kMaxColorAttachments> Color{};
            DepthStencilHandle DepthStencil{};
            uint32_t DrawBuffers = 0;
        };

        void Record(RecordedCommand command) { m_Commands.push_back(std::move(command)); }

        glm::uvec2 m_RenderSize;

        Core::ResourcePool<Program, ProgramTag> m_Programs;
        Core::ResourcePool<std::vector<float>, BufferTag> m_Buffers;
        Core::ResourcePool<std::vector<VertexAttributeDesc>, VertexLayoutTag> m_Layouts;
        Core::ResourcePool<TextureInfo, TextureTag> m_Textures;
        Core::ResourcePool<glm::uvec2, DepthStencilTag> m_DepthStencils;
        Core::ResourcePool<Framebuffer, FramebufferTag> m_Framebuffers;

        std::vector<RecordedCommand> m_Commands;
        ProgramHandle m_CurrentProgram{};
    };
}
