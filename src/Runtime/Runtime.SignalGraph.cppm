module;
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <vector>
#include <entt/entity/entity.hpp>

export module Runtime.SignalGraph;

import Core;
import ECS;

// -------------------------------------------------------------------------
// Runtime::SignalGraph - per-tick task scheduler
// -------------------------------------------------------------------------
// A signal is a named point in the frame timeline carrying an ordered list of
// tasks. Executing a signal runs, depth-first:
//
//   precededBy signals -> own tasks (registration order) -> followedBy signals
//
// Signals fire either when invoked (the built-in Update() signal is invoked
// once per Tick), when chained from another signal, or on a fixed timestep.
// Fixed-timestep signals accumulate elapsed time and fire floor(t/duration)
// times per tick, clamped to MaxSteps; the whole steps beyond MaxSteps are
// dropped, the fractional remainder carries over.
//
// Cycles in precededBy/followedBy are a caller error and are not detected.
// Unknown signal or task handles are silently ignored.
// -------------------------------------------------------------------------

export namespace Runtime
{
    struct SignalTag;
    struct TaskTag;
    using SignalHandle = Core::StrongHandle<SignalTag>;
    using TaskHandle = Core::StrongHandle<TaskTag>;

    inline constexpr uint32_t kDefaultMaxSteps = 10;

    struct TaskContext
    {
        std::span<const entt::entity> Entities; // query result, empty without a query
        double DeltaTime = 0.0;                 // time since the owning signal last fired
        double FixedDeltaTime = 0.0;            // step duration on fixed-timestep signals, else 0
    };

    // A unit of work. RunEach is invoked for every entity matched by GetQuery()
    // and RunOnce exactly once afterwards, both with the same context.
    class ITask
    {
    public:
        virtual ~ITask() = default;

        // nullptr: no query, the task sees no entities.
        [[nodiscard]] virtual const ECS::Query* GetQuery() const { return nullptr; }

        virtual void RunEach([[maybe_unused]] entt::entity entity, [[maybe_unused]] const TaskContext& ctx) {}
        virtual void RunOnce([[maybe_unused]] const TaskContext& ctx) {}
    };

    struct TaskDesc
    {
        std::optional<ECS::Query> Query;
        std::function<void(entt::entity, const TaskContext&)> ForEach;
        std::function<void(const TaskContext&)> Once;
    };

    // ITask built from callables, for call sites that do not warrant a class.
    class FunctionTask final : public ITask
    {
    public:
        explicit FunctionTask(TaskDesc desc) : m_Desc(std::move(desc)) {}

        [[nodiscard]] const ECS::Query* GetQuery() const override
        {
            return m_Desc.Query ? &*m_Desc.Query : nullptr;
        }

        void RunEach(entt::entity entity, const TaskContext& ctx) override
        {
            if (m_Desc.ForEach) m_Desc.ForEach(entity, ctx);
        }

        void RunOnce(const TaskContext& ctx) override
        {
            if (m_Desc.Once) m_Desc.Once(ctx);
        }

    private:
        TaskDesc m_Desc;
    };

    // Two-phase task shape: every Collect() of a tick completes before the
    // single Dispatch() of that tick.
    class ICollectPhase
    {
    public:
        virtual ~ICollectPhase() = default;
        virtual void Collect(entt::entity entity, const TaskContext& ctx) = 0;
    };

    class IDispatchPhase
    {
    public:
        virtual ~IDispatchPhase() = default;
        virtual void Dispatch(const TaskContext& ctx) = 0;
    };

    // Does not own the phases; they must outlive the task.
    class PhasedTask final : public ITask
    {
    public:
        PhasedTask(ECS::Query query, ICollectPhase& collect, IDispatchPhase& dispatch)
            : m_Query(std::move(query)), m_Collect(collect), m_Dispatch(dispatch)
        {
        }

        [[nodiscard]] const ECS::Query* GetQuery() const override { return &m_Query; }
        void RunEach(entt::entity entity, const TaskContext& ctx) override { m_Collect.Collect(entity, ctx); }
        void RunOnce(const TaskContext& ctx) override { m_Dispatch.Dispatch(ctx); }

    private:
        ECS::Query m_Query;
        ICollectPhase& m_Collect;
        IDispatchPhase& m_Dispatch;
    };

    struct SignalOptions
    {
        double Frequency = 0.0; // executions per second; <= 0 means not time-driven
        uint32_t MaxSteps = kDefaultMaxSteps;
    };

    class SignalGraph
    {
    public:
        explicit SignalGraph(ECS::Scene& scene);

        SignalGraph(const SignalGraph&) = delete;
        SignalGraph& operator=(const SignalGraph&) = delete;

        // ----- Signals -----
        SignalHandle CreateSignal();
        SignalHandle CreateSignal(const SignalOptions& options);

        // New signal that runs every time 'signal' runs, just before/after its
        // own tasks. Invalid handle if 'signal' is unknown.
        SignalHandle SignalBefore(SignalHandle signal);
        SignalHandle SignalAfter(SignalHandle signal);

        // Variable-rate signal invoked once per Tick().
        [[nodiscard]] SignalHandle Update() const { return m_Update; }

        // ----- Tasks -----
        TaskHandle OnSignal(SignalHandle signal, std::unique_ptr<ITask> task);
        TaskHandle OnSignal(SignalHandle signal, TaskDesc desc);

        // One-shot: runs on the first tick whose accumulated delta exceeds
        // 'seconds', then cancels itself. Resolution is one tick.
        TaskHandle AfterDelay(double seconds, std::unique_ptr<ITask> task);
        TaskHandle AfterDelay(double seconds, TaskDesc desc);

        // The task never runs again once this returns. Its entry in signal
        // task lists is swept on that signal's next traversal.
        void CancelTask(TaskHandle task);

        // ----- Execution -----
        void InvokeSignal(SignalHandle signal, double fixedDeltaTime = 0.0);

        // Advances delays, signal clocks and fixed timesteps by 'delta' seconds,
        // then invokes Update().
        void Tick(double delta);

        // ----- Introspection -----
        [[nodiscard]] bool IsTaskAlive(TaskHandle task) const { return m_Tasks.Contains(task); }
        [[nodiscard]] bool IsSignalValid(SignalHandle signal) const { return m_Signals.Contains(signal); }
        // Entries in the signal's task list, including cancelled ones not yet swept.
        [[nodiscard]] size_t GetTaskCount(SignalHandle signal) const;
        [[nodiscard]] double GetTimeSinceLastRun(SignalHandle signal) const;
        [[nodiscard]] double GetElapsed() const { return m_Elapsed; }

    private:
        struct SignalState
        {
            std::vector<TaskHandle> Tasks;
            std::vector<SignalHandle> PrecededBy;
            std::vector<SignalHandle> FollowedBy;
            double TimeSinceRun = 0.0;
        };

        struct Timestep
        {
            SignalHandle Signal;
            double Duration = 0.0;
            double Elapsed = 0.0;
            uint32_t MaxSteps = kDefaultMaxSteps;
        };

        struct Delay
        {
            TaskHandle Task;
            double Duration = 0.0;
            double Elapsed = 0.0;
        };

        // Tasks cancelled while something is executing are parked here so a
        // task may cancel itself from inside RunEach/RunOnce.
        class ExecutionScope
        {
        public:
            explicit ExecutionScope(SignalGraph& graph) : m_Graph(graph) { ++m_Graph.m_ExecutionDepth; }
            ~ExecutionScope();

        private:
            SignalGraph& m_Graph;
        };

        TaskHandle RegisterTask(std::unique_ptr<ITask> task);
        void ExecuteSignal(SignalHandle signal, double fixedDeltaTime);
        void ExecuteTask(TaskHandle handle, double deltaTime, double fixedDeltaTime);

        ECS::Scene& m_Scene;
        Core::ResourcePool<SignalState, SignalTag> m_Signals;
        Core::ResourcePool<std::unique_ptr<ITask>, TaskTag> m_Tasks;
        std::vector<Timestep> m_Timesteps;
        std::vector<Delay> m_Delays;
        std::vector<std::unique_ptr<ITask>> m_Retired;
        uint32_t m_ExecutionDepth = 0;
        SignalHandle m_Update;
        double m_Elapsed = 0.0;
    };
}
