module;
#include <expected>
#include <memory>
#include <type_traits>
#include <utility>
#include <variant>
#include <glm/glm.hpp>

module Runtime.Engine;

import Core;
import ECS;
import RHI;
import Graphics;
import Runtime.SignalGraph;

namespace Runtime
{
    Engine::Engine(const EngineConfig& config, std::unique_ptr<RHI::IDevice> device)
        : m_Config(config), m_Device(std::move(device)), m_Signals(m_Scene), m_Clock(config.MaxFrameDelta)
    {
        Core::Log::Info("Initializing Engine ({})...", m_Config.AppName);

        // 1. Device (and window, unless headless or injected)
        if (!m_Device)
        {
            if (m_Config.Headless)
            {
                m_Device = std::make_unique<RHI::HeadlessDevice>(
                    glm::uvec2(static_cast<uint32_t>(m_Config.Width), static_cast<uint32_t>(m_Config.Height)));
            }
            else
            {
                Core::Windowing::WindowProps props{m_Config.AppName, m_Config.Width, m_Config.Height, m_Config.VSync};
                m_Window = std::make_unique<Core::Windowing::Window>(props);

                if (!m_Window->IsValid())
                {
                    Core::Log::Error("FATAL: Window initialization failed");
                    return;
                }

                m_Window->SetEventCallback([this](const Core::Windowing::Event& e)
                {
                    std::visit([this](auto&& event)
                    {
                        using T = std::decay_t<decltype(event)>;

                        if constexpr (std::is_same_v<T, Core::Windowing::WindowCloseEvent>)
                        {
                            RequestQuit();
                        }
                        else if constexpr (std::is_same_v<T, Core::Windowing::KeyEvent>)
                        {
                            if (event.IsPressed && event.KeyCode == Core::Windowing::Key::Escape) RequestQuit();
                        }
                    }, e);
                });

                auto device = RHI::OpenGLDevice::Create(*m_Window);
                if (!device)
                {
                    Core::Log::Error("FATAL: OpenGL device creation failed: {}", Core::ErrorCodeToString(device.error()));
                    return;
                }
                m_Device = std::move(*device);
            }
        }

        // 2. Render machinery on top of the device
        m_Shaders = std::make_unique<Graphics::ShaderRegistry>(*m_Device);
        m_Textures = std::make_unique<Graphics::RenderTextureRegistry>(*m_Device);
        m_Passes = std::make_unique<Graphics::RenderPassGraph>(*m_Device, *m_Shaders, *m_Textures);
        m_Executor = std::make_unique<Graphics::FrameExecutor>(*m_Device, m_Scene, *m_Shaders, *m_Textures, *m_Passes, m_Camera);
        m_Executor->SetClearColor(m_Config.ClearColor);

        // 3. Fixed-rate gameplay signal
        if (m_Config.UpdateFrequency > 0.0)
        {
            m_FixedUpdate = m_Signals.CreateSignal(SignalOptions{
                .Frequency = m_Config.UpdateFrequency,
                .MaxSteps = m_Config.MaxUpdateSteps,
            });
        }
    }

    Engine::~Engine()
    {
        // Order matters! The render task references the executor.
        m_Signals.CancelTask(m_RenderTask);
        m_Executor.reset();
        m_Passes.reset();
        m_Shaders.reset();
        m_Textures.reset();
        m_Device.reset();
        m_Window.reset();
    }

    Core::Result Engine::Initialize()
    {
        if (m_Initialized) return Core::Ok();

        if (!m_Device)
        {
            Core::Log::Error("Engine has no device; initialization aborted");
            return Core::Err(Core::ErrorCode::WindowCreationFailed);
        }

        if (auto result = m_Executor->Initialize(); !result)
        {
            Core::Log::Error("Frame executor initialization failed: {}", Core::ErrorCodeToString(result.error()));
            return result;
        }

        // Rendering consumes the state left by every Update() task.
        m_RenderSignal = m_Signals.SignalAfter(m_Signals.Update());
        m_RenderTask = m_Signals.OnSignal(m_RenderSignal,
            std::make_unique<PhasedTask>(ECS::Query::Of<ECS::Components::Renderer::Component>(), *m_Executor, *m_Executor));

        m_Initialized = true;
        Core::Log::Info("Engine initialized.");
        return Core::Ok();
    }

    void Engine::Tick(double delta)
    {
        if (!m_Initialized) return;
        m_Signals.Tick(delta);
    }

    void Engine::RequestQuit()
    {
        if (!m_Running) return;
        m_Running = false;

        for (const Callback& callback : m_QuitCallbacks) callback();
    }

    void Engine::Run()
    {
        if (!m_Initialized)
        {
            Core::Log::Error("Engine::Run called before a successful Initialize()");
            return;
        }

        m_Running = true;
        for (const Callback& callback : m_StartCallbacks) callback();

        m_Clock.Start();

        while (m_Running)
        {
            if (m_Window)
            {
                m_Window->OnUpdate();
                if (m_Window->ShouldClose())
                {
                    RequestQuit();
                    break;
                }
            }

            const Core::FrameTime time = m_Clock.Tick();
            Tick(time.Delta);

            if (m_Window) m_Window->SwapBuffers();
        }
    }
}
