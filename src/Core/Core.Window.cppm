module;
#include <functional>
#include <string>
#include <variant>

export module Core:Window;

export namespace Core::Windowing
{
    struct WindowProps
    {
        std::string Title = "Zen";
        int WindowWidth = 1280;
        int WindowHeight = 720;
        bool VSync = true;
    };

    struct WindowCloseEvent
    {
    };

    struct WindowResizeEvent
    {
        int Width;
        int Height;
    };

    struct KeyEvent
    {
        int KeyCode;
        bool IsPressed; // true = pressed, false = released
    };

    using Event = std::variant<WindowCloseEvent, WindowResizeEvent, KeyEvent>;

    using EventCallbackFn = std::function<void(const Event&)>;

    // GLFW key codes the runtime and sandbox poll.
    namespace Key
    {
        constexpr int W = 87;
        constexpr int A = 65;
        constexpr int S = 83;
        constexpr int D = 68;
        constexpr int Space = 32;
        constexpr int Escape = 256;
    }

    // GLFW window owning an OpenGL 3.3 core context, current on the creating
    // thread.
    class Window
    {
    public:
        explicit Window(const WindowProps& props);
        ~Window();

        Window(const Window&) = delete;
        Window& operator=(const Window&) = delete;

        void OnUpdate(); // polls events and refreshes the framebuffer size
        void SwapBuffers() const;

        [[nodiscard]] bool ShouldClose() const;
        [[nodiscard]] int GetFramebufferWidth() const { return m_Data.FramebufferWidth; }
        [[nodiscard]] int GetFramebufferHeight() const { return m_Data.FramebufferHeight; }
        [[nodiscard]] bool IsValid() const { return m_Window != nullptr; }
        [[nodiscard]] bool IsKeyPressed(int keyCode) const;

        void SetEventCallback(const EventCallbackFn& callback) { m_Data.Callback = callback; }

        // Reached from GLFW callbacks through the window user pointer.
        struct WindowData
        {
            int FramebufferWidth = 0;
            int FramebufferHeight = 0;
            EventCallbackFn Callback;
        };

    private:
        void* m_Window = nullptr; // GLFWwindow*
        WindowData m_Data;
    };
}
