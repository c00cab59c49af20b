module;
#include <GLFW/glfw3.h>
#include <string>

module Core:Window.Impl;
import :Logging;
import :Window;

namespace Core::Windowing
{
    namespace
    {
        // GLFW is initialised by the first window and terminated with the last.
        int s_LiveWindows = 0;

        bool AcquireGLFW()
        {
            if (s_LiveWindows == 0)
            {
                glfwSetErrorCallback([](int error, const char* description)
                {
                    Log::Error("GLFW error {}: {}", error, description);
                });
                if (!glfwInit()) return false;
            }
            ++s_LiveWindows;
            return true;
        }

        void ReleaseGLFW()
        {
            if (--s_LiveWindows == 0) glfwTerminate();
        }

        GLFWwindow* Native(void* handle) { return static_cast<GLFWwindow*>(handle); }

        template <typename E>
        void Emit(GLFWwindow* window, const E& event)
        {
            auto* data = static_cast<Window::WindowData*>(glfwGetWindowUserPointer(window));
            if (data && data->Callback) data->Callback(event);
        }
    }

    Window::Window(const WindowProps& props)
    {
        Log::Info("Creating window '{}' ({}x{})", props.Title, props.WindowWidth, props.WindowHeight);

        if (!AcquireGLFW())
        {
            Log::Error("GLFW initialisation failed");
            return;
        }

        glfwWindowHint(GLFW_CLIENT_API, GLFW_OPENGL_API);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
        glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
        glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);

        GLFWwindow* window = glfwCreateWindow(props.WindowWidth, props.WindowHeight, props.Title.c_str(), nullptr, nullptr);
        if (!window)
        {
            Log::Error("GLFW window creation failed");
            ReleaseGLFW();
            return;
        }
        m_Window = window;

        glfwMakeContextCurrent(window);
        glfwSwapInterval(props.VSync ? 1 : 0);
        glfwGetFramebufferSize(window, &m_Data.FramebufferWidth, &m_Data.FramebufferHeight);
        glfwSetWindowUserPointer(window, &m_Data);

        glfwSetFramebufferSizeCallback(window, [](GLFWwindow* w, int width, int height)
        {
            auto* data = static_cast<WindowData*>(glfwGetWindowUserPointer(w));
            data->FramebufferWidth = width;
            data->FramebufferHeight = height;
            Emit(w, WindowResizeEvent{width, height});
        });

        glfwSetWindowCloseCallback(window, [](GLFWwindow* w) { Emit(w, WindowCloseEvent{}); });

        glfwSetKeyCallback(window, [](GLFWwindow* w, int key, int, int action, int)
        {
            if (action == GLFW_REPEAT) return;
            Emit(w, KeyEvent{key, action == GLFW_PRESS});
        });
    }

    Window::~Window()
    {
        if (!m_Window) return;
        glfwDestroyWindow(Native(m_Window));
        m_Window = nullptr;
        ReleaseGLFW();
    }

    void Window::OnUpdate()
    {
        if (!m_Window) return;
        glfwPollEvents();
        glfwGetFramebufferSize(Native(m_Window), &m_Data.FramebufferWidth, &m_Data.FramebufferHeight);
    }

    void Window::SwapBuffers() const
    {
        if (m_Window) glfwSwapBuffers(Native(m_Window));
    }

    bool Window::ShouldClose() const
    {
        return !m_Window || glfwWindowShouldClose(Native(m_Window));
    }

    bool Window::IsKeyPressed(int keyCode) const
    {
        return m_Window && glfwGetKey(Native(m_Window), keyCode) == GLFW_PRESS;
    }
}
