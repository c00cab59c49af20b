module;
#include <string>
#include <unordered_map>

export module Graphics:Components;

import Core;
import :ShaderRegistry;

export namespace Graphics
{
    struct RenderPassTag;
    using RenderPassHandle = Core::StrongHandle<RenderPassTag>;
}

export namespace ECS::Components::Renderer
{
    // Draw this entity as one instance of Pass. Values for the pass shader's
    // declared properties are set through RenderPassGraph::SetProperty; any
    // property left unset is packed as zeros.
    struct Component
    {
        Graphics::RenderPassHandle Pass{};
        std::unordered_map<std::string, Graphics::PropertyValue> Properties;
        float Depth = 0.0f; // [0,1], written to the depth buffer
        float Layer = 0.0f; // forwarded to the fragment stage as LAYER
    };
}
