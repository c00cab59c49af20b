module;
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <glm/glm.hpp>

module Graphics:RenderTexture.Impl;

import Core;
import RHI;
import :RenderTexture;

namespace Graphics
{
    glm::uvec2 ComputeTextureSize(glm::uvec2 renderSize, float scale)
    {
        const auto axis = [scale](uint32_t size)
        {
            const double scaled = std::ceil(static_cast<double>(size) * static_cast<double>(scale));
            return static_cast<uint32_t>(std::max(1.0, scaled));
        };
        return {axis(renderSize.x), axis(renderSize.y)};
    }

    RenderTextureRegistry::RenderTextureRegistry(RHI::IDevice& device)
        : m_Device(device), m_RenderSize(device.GetRenderSize())
    {
    }

    RenderTextureRegistry::~RenderTextureRegistry()
    {
        for (auto& [name, texture] : m_Textures)
            Release(*texture);
    }

    Core::Result RenderTextureRegistry::Allocate(RenderTexture& texture)
    {
        const RenderTextureDesc& desc = texture.m_Desc;
        const glm::uvec2 size = ComputeTextureSize(m_RenderSize, desc.ResolutionScale);

        const auto create = [&]() -> Core::Expected<RHI::TextureHandle>
        {
            if (desc.ArrayLayers > 0)
                return m_Device.CreateTextureArray(size.x, size.y, desc.ArrayLayers, desc.Format);
            return m_Device.CreateTexture(size.x, size.y, desc.Format);
        };

        auto write = create();
        if (!write) return std::unexpected(write.error());

        RHI::TextureHandle read{};
        if (desc.Swappable)
        {
            auto second = create();
            if (!second)
            {
                m_Device.DestroyTexture(*write);
                return std::unexpected(second.error());
            }
            read = *second;
        }

        texture.m_Write = *write;
        texture.m_Read = read;
        texture.m_Size = size;
        return Core::Ok();
    }

    void RenderTextureRegistry::Release(RenderTexture& texture)
    {
        m_Device.DestroyTexture(texture.m_Write);
        m_Device.DestroyTexture(texture.m_Read);
        texture.m_Write = {};
        texture.m_Read = {};
        texture.m_Size = {0, 0};
    }

    Core::Expected<RenderTexture*> RenderTextureRegistry::Declare(std::string_view name, const RenderTextureDesc& desc)
    {
        if (!RHI::IsValid(desc.Format))
        {
            Core::Log::Error("Render texture '{}': unsupported format {}", name, static_cast<int>(desc.Format));
            return Core::Err<RenderTexture*>(Core::ErrorCode::InvalidFormat);
        }
        if (!(desc.ResolutionScale > 0.0f))
        {
            Core::Log::Error("Render texture '{}': resolution scale must be positive", name);
            return Core::Err<RenderTexture*>(Core::ErrorCode::InvalidArgument);
        }

        const std::string key(name);
        if (auto it = m_Textures.find(key); it != m_Textures.end())
        {
            RenderTexture& existing = *it->second;
            if (existing.m_Desc == desc) return &existing;

            Release(existing);
            existing.m_Desc = desc;
            if (auto r = Allocate(existing); !r)
            {
                Core::Log::Error("Render texture '{}': reallocation failed ({})", name, Core::ErrorCodeToString(r.error()));
                return std::unexpected(r.error());
            }
            return &existing;
        }

        auto texture = std::make_unique<RenderTexture>();
        texture->m_Name = key;
        texture->m_Desc = desc;
        if (auto r = Allocate(*texture); !r)
        {
            Core::Log::Error("Render texture '{}': allocation failed ({})", name, Core::ErrorCodeToString(r.error()));
            return std::unexpected(r.error());
        }

        RenderTexture* result = texture.get();
        m_Textures.emplace(key, std::move(texture));
        Core::Log::Debug("Render texture '{}' declared ({}x{})", name, result->m_Size.x, result->m_Size.y);
        return result;
    }

    Core::Expected<RenderTexture*> RenderTextureRegistry::Acquire(std::string_view name)
    {
        if (RenderTexture* existing = Find(name)) return existing;
        return Declare(name, RenderTextureDesc{});
    }

    RenderTexture* RenderTextureRegistry::Find(std::string_view name) const
    {
        auto it = m_Textures.find(std::string(name));
        return it != m_Textures.end() ? it->second.get() : nullptr;
    }

    Core::Result RenderTextureRegistry::Resize(glm::uvec2 renderSize)
    {
        if (renderSize == m_RenderSize) return Core::Ok();
        m_RenderSize = renderSize;

        for (auto& [name, texture] : m_Textures)
        {
            if (ComputeTextureSize(renderSize, texture->m_Desc.ResolutionScale) == texture->m_Size) continue;

            Release(*texture);
            if (auto r = Allocate(*texture); !r)
            {
                Core::Log::Error("Render texture '{}': resize failed ({})", name, Core::ErrorCodeToString(r.error()));
                return r;
            }
        }
        return Core::Ok();
    }

    void RenderTextureRegistry::Synchronize(const RenderTexture& texture)
    {
        if (!texture.m_Desc.Swappable) return;
        m_Device.CopyTexture(texture.m_Write, texture.m_Read, texture.m_Size.x, texture.m_Size.y);
    }
}
