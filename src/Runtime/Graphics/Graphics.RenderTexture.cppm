module;
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <glm/glm.hpp>

export module Graphics:RenderTexture;

import Core;
import RHI;

export namespace Graphics
{
    struct RenderTextureDesc
    {
        RHI::TextureFormat Format = RHI::TextureFormat::RGBA8;
        float ResolutionScale = 1.0f; // relative to the render size
        bool Swappable = true;        // keeps a read half passes can sample while the write half is bound
        uint32_t ArrayLayers = 0;     // 0: plain 2D texture, otherwise a 2D array

        bool operator==(const RenderTextureDesc&) const = default;
    };

    // max(1, ceil(renderSize * scale)) per axis.
    [[nodiscard]] glm::uvec2 ComputeTextureSize(glm::uvec2 renderSize, float scale);

    // A viewport-relative render target shared by name between passes.
    class RenderTexture
    {
    public:
        [[nodiscard]] const std::string& GetName() const { return m_Name; }
        [[nodiscard]] const RenderTextureDesc& GetDesc() const { return m_Desc; }
        [[nodiscard]] glm::uvec2 GetSize() const { return m_Size; }
        [[nodiscard]] bool IsSwappable() const { return m_Desc.Swappable; }
        [[nodiscard]] bool IsArray() const { return m_Desc.ArrayLayers > 0; }

        // Half bound as a colour attachment.
        [[nodiscard]] RHI::TextureHandle GetWriteTexture() const { return m_Write; }
        // Half bound for sampling; the write half when not swappable.
        [[nodiscard]] RHI::TextureHandle GetReadTexture() const { return m_Desc.Swappable ? m_Read : m_Write; }

    private:
        friend class RenderTextureRegistry;

        std::string m_Name;
        RenderTextureDesc m_Desc{};
        glm::uvec2 m_Size{0};
        RHI::TextureHandle m_Write{};
        RHI::TextureHandle m_Read{};
    };

    // -------------------------------------------------------------------------
    // RenderTextureRegistry
    // -------------------------------------------------------------------------
    // Texture identity is the name: every Declare/Acquire of "COLOR" yields the
    // same RenderTexture object for the registry's lifetime. GPU storage behind
    // it is destroyed and recreated when the render size or the desc changes.
    //
    // Swappable textures use copy-sync: after a pass writes, Synchronize()
    // copies write -> read, so read handles held elsewhere stay valid.
    // -------------------------------------------------------------------------
    class RenderTextureRegistry
    {
    public:
        explicit RenderTextureRegistry(RHI::IDevice& device);
        ~RenderTextureRegistry();

        RenderTextureRegistry(const RenderTextureRegistry&) = delete;
        RenderTextureRegistry& operator=(const RenderTextureRegistry&) = delete;

        [[nodiscard]] Core::Expected<RenderTexture*> Declare(std::string_view name, const RenderTextureDesc& desc);

        // Existing texture, or a new one with the default desc.
        [[nodiscard]] Core::Expected<RenderTexture*> Acquire(std::string_view name);

        [[nodiscard]] RenderTexture* Find(std::string_view name) const;

        // Recreates every texture whose pixel size depends on the new size.
        Core::Result Resize(glm::uvec2 renderSize);

        void Synchronize(const RenderTexture& texture);

        template <typename F>
        void ForEach(F&& func) const
        {
            for (const auto& [name, texture] : m_Textures)
                func(*texture);
        }

        [[nodiscard]] glm::uvec2 GetRenderSize() const { return m_RenderSize; }
        [[nodiscard]] size_t Size() const { return m_Textures.size(); }

    private:
        Core::Result Allocate(RenderTexture& texture);
        void Release(RenderTexture& texture);

        RHI::IDevice& m_Device;
        glm::uvec2 m_RenderSize{0};
        std::unordered_map<std::string, std::unique_ptr<RenderTexture>> m_Textures;
    };
}
