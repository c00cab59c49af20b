export module Graphics;

export import :ShaderRegistry;
export import :RenderTexture;
export import :Components;
export import :RenderPass;
export import :Camera;
export import :FrameExecutor;
