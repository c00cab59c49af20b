export module RHI;

export import :Types;
export import :Device;
export import :HeadlessDevice;
export import :OpenGL;
