module;
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <glm/glm.hpp>

export module Runtime.Engine;

import Core;
import ECS;
import RHI;
import Graphics;
import Runtime.SignalGraph;

export namespace Runtime
{
    struct EngineConfig
    {
        std::string AppName = "Zen App";
        int Width = 1280;
        int Height = 720;
        bool Headless = false; // HeadlessDevice, no window
        bool VSync = true;
        glm::vec4 ClearColor{0.07f, 0.07f, 0.07f, 1.0f};
        double UpdateFrequency = 0.0; // > 0 creates the FixedUpdate signal
        uint32_t MaxUpdateSteps = kDefaultMaxSteps;
        double MaxFrameDelta = 0.25;
    };

    // Owns one complete runtime: entity store, scheduler, device and the
    // render pass machinery. Engines share no state, several may coexist.
    class Engine
    {
    public:
        using Callback = std::function<void()>;

        // 'device' overrides the device the config would pick.
        explicit Engine(const EngineConfig& config, std::unique_ptr<RHI::IDevice> device = nullptr);
        ~Engine();

        Engine(const Engine&) = delete;
        Engine& operator=(const Engine&) = delete;

        // Creates the built-in render state and attaches the frame executor to
        // SignalAfter(Update()). Must succeed before Tick() or Run().
        [[nodiscard]] Core::Result Initialize();

        // One frame: advances the signal graph by 'delta' seconds.
        void Tick(double delta);

        // Window loop. Fires the start callbacks, ticks with the frame clock
        // until the window closes or RequestQuit() is called.
        void Run();
        void RequestQuit();
        [[nodiscard]] bool IsRunning() const { return m_Running; }

        void OnStart(Callback callback) { m_StartCallbacks.push_back(std::move(callback)); }
        void OnQuit(Callback callback) { m_QuitCallbacks.push_back(std::move(callback)); }

        [[nodiscard]] ECS::Scene& GetScene() { return m_Scene; }
        [[nodiscard]] SignalGraph& GetSignals() { return m_Signals; }
        [[nodiscard]] RHI::IDevice& GetDevice() { return *m_Device; }
        [[nodiscard]] Graphics::ShaderRegistry& GetShaders() { return *m_Shaders; }
        [[nodiscard]] Graphics::RenderTextureRegistry& GetRenderTextures() { return *m_Textures; }
        [[nodiscard]] Graphics::RenderPassGraph& GetRenderPasses() { return *m_Passes; }
        [[nodiscard]] Graphics::FrameExecutor& GetFrameExecutor() { return *m_Executor; }
        [[nodiscard]] Graphics::Camera2D& GetCamera() { return m_Camera; }
        [[nodiscard]] Core::Windowing::Window* GetWindow() const { return m_Window.get(); }
        [[nodiscard]] const EngineConfig& GetConfig() const { return m_Config; }

        // Fixed-rate signal, invalid unless UpdateFrequency > 0.
        [[nodiscard]] SignalHandle GetFixedUpdate() const { return m_FixedUpdate; }
        [[nodiscard]] SignalHandle GetRenderSignal() const { return m_RenderSignal; }

    private:
        EngineConfig m_Config;

        // Destruction runs bottom-up: the executor and registries release
        // their device objects before the device, the device before the window.
        std::unique_ptr<Core::Windowing::Window> m_Window;
        std::unique_ptr<RHI::IDevice> m_Device;

        ECS::Scene m_Scene;
        SignalGraph m_Signals;

        std::unique_ptr<Graphics::ShaderRegistry> m_Shaders;
        std::unique_ptr<Graphics::RenderTextureRegistry> m_Textures;
        std::unique_ptr<Graphics::RenderPassGraph> m_Passes;
        Graphics::Camera2D m_Camera;
        std::unique_ptr<Graphics::FrameExecutor> m_Executor;

        Core::FrameClock m_Clock;

        SignalHandle m_FixedUpdate{};
        SignalHandle m_RenderSignal{};
        TaskHandle m_RenderTask{};

        std::vector<Callback> m_StartCallbacks;
        std::vector<Callback> m_QuitCallbacks;

        bool m_Initialized = false;
        bool m_Running = false;
    };
}
