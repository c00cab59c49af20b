module;
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>
#include <entt/entity/entity.hpp>

module Runtime.SignalGraph;

import Core;
import ECS;

namespace Runtime
{
    SignalGraph::ExecutionScope::~ExecutionScope()
    {
        if (--m_Graph.m_ExecutionDepth == 0)
        {
            m_Graph.m_Retired.clear();
        }
    }

    SignalGraph::SignalGraph(ECS::Scene& scene)
        : m_Scene(scene)
    {
        m_Update = CreateSignal();
    }

    // -------------------------------------------------------------------------
    // Signals
    // -------------------------------------------------------------------------

    SignalHandle SignalGraph::CreateSignal()
    {
        return m_Signals.Add(SignalState{});
    }

    SignalHandle SignalGraph::CreateSignal(const SignalOptions& options)
    {
        const SignalHandle signal = CreateSignal();

        if (options.Frequency > 0.0)
        {
            m_Timesteps.push_back(Timestep{
                .Signal = signal,
                .Duration = 1.0 / options.Frequency,
                .Elapsed = 0.0,
                .MaxSteps = std::max<uint32_t>(1, options.MaxSteps),
            });
        }

        return signal;
    }

    SignalHandle SignalGraph::SignalBefore(SignalHandle signal)
    {
        if (!m_Signals.Contains(signal)) return {};

        const SignalHandle before = CreateSignal();
        m_Signals.Get(signal)->PrecededBy.push_back(before);
        return before;
    }

    SignalHandle SignalGraph::SignalAfter(SignalHandle signal)
    {
        if (!m_Signals.Contains(signal)) return {};

        const SignalHandle after = CreateSignal();
        m_Signals.Get(signal)->FollowedBy.push_back(after);
        return after;
    }

    // -------------------------------------------------------------------------
    // Tasks
    // -------------------------------------------------------------------------

    TaskHandle SignalGraph::RegisterTask(std::unique_ptr<ITask> task)
    {
        return m_Tasks.Add(std::move(task));
    }

    TaskHandle SignalGraph::OnSignal(SignalHandle signal, std::unique_ptr<ITask> task)
    {
        SignalState* state = m_Signals.Get(signal);
        if (!state || !task) return {};

        const TaskHandle handle = RegisterTask(std::move(task));
        state->Tasks.push_back(handle);
        return handle;
    }

    TaskHandle SignalGraph::OnSignal(SignalHandle signal, TaskDesc desc)
    {
        return OnSignal(signal, std::make_unique<FunctionTask>(std::move(desc)));
    }

    TaskHandle SignalGraph::AfterDelay(double seconds, std::unique_ptr<ITask> task)
    {
        if (!task) return {};

        const TaskHandle handle = RegisterTask(std::move(task));
        m_Delays.push_back(Delay{.Task = handle, .Duration = seconds, .Elapsed = 0.0});
        return handle;
    }

    TaskHandle SignalGraph::AfterDelay(double seconds, TaskDesc desc)
    {
        return AfterDelay(seconds, std::make_unique<FunctionTask>(std::move(desc)));
    }

    void SignalGraph::CancelTask(TaskHandle task)
    {
        std::unique_ptr<ITask>* slot = m_Tasks.Get(task);
        if (!slot) return;

        if (m_ExecutionDepth > 0)
        {
            m_Retired.push_back(std::move(*slot));
        }
        m_Tasks.Remove(task);

        std::erase_if(m_Delays, [task](const Delay& d) { return d.Task == task; });
    }

    // -------------------------------------------------------------------------
    // Execution
    // -------------------------------------------------------------------------

    void SignalGraph::ExecuteTask(TaskHandle handle, double deltaTime, double fixedDeltaTime)
    {
        std::unique_ptr<ITask>* slot = m_Tasks.Get(handle);
        if (!slot) return;

        // Keep a raw pointer: a cancelled task is parked in m_Retired until the
        // outermost execution returns, so the object stays valid here.
        ITask* task = slot->get();

        std::vector<entt::entity> entities;
        if (const ECS::Query* query = task->GetQuery())
        {
            entities = m_Scene.Query(*query);
        }

        const TaskContext ctx{
            .Entities = entities,
            .DeltaTime = deltaTime,
            .FixedDeltaTime = fixedDeltaTime,
        };

        for (entt::entity e : entities)
        {
            if (!m_Tasks.Contains(handle)) return;
            if (!m_Scene.IsValid(e)) continue;
            task->RunEach(e, ctx);
        }

        if (!m_Tasks.Contains(handle)) return;
        task->RunOnce(ctx);
    }

    void SignalGraph::ExecuteSignal(SignalHandle signal, double fixedDeltaTime)
    {
        // Slot data is heap-allocated, so this pointer survives new signals
        // being created by the tasks below.
        SignalState* state = m_Signals.Get(signal);
        if (!state) return;

        ExecutionScope scope(*this);

        for (size_t i = 0; i < state->PrecededBy.size(); ++i)
        {
            ExecuteSignal(state->PrecededBy[i], fixedDeltaTime);
        }

        // Tasks registered while this list runs wait for the next execution.
        const size_t taskCount = state->Tasks.size();
        bool sweep = false;
        for (size_t i = 0; i < taskCount; ++i)
        {
            const TaskHandle handle = state->Tasks[i];
            if (!m_Tasks.Contains(handle))
            {
                sweep = true;
                continue;
            }
            ExecuteTask(handle, state->TimeSinceRun, fixedDeltaTime);
        }

        if (sweep)
        {
            std::erase_if(state->Tasks, [this](TaskHandle h) { return !m_Tasks.Contains(h); });
        }

        for (size_t i = 0; i < state->FollowedBy.size(); ++i)
        {
            ExecuteSignal(state->FollowedBy[i], fixedDeltaTime);
        }

        state->TimeSinceRun = 0.0;
    }

    void SignalGraph::InvokeSignal(SignalHandle signal, double fixedDeltaTime)
    {
        ExecuteSignal(signal, fixedDeltaTime);
    }

    void SignalGraph::Tick(double delta)
    {
        ExecutionScope scope(*this);
        m_Elapsed += delta;

        // 1. Delays. Collect first: firing a task may register or cancel others.
        std::vector<Delay> due;
        for (Delay& d : m_Delays)
        {
            d.Elapsed += delta;
            if (d.Elapsed > d.Duration) due.push_back(d);
        }

        for (const Delay& d : due)
        {
            if (!m_Tasks.Contains(d.Task)) continue;
            ExecuteTask(d.Task, d.Duration, 0.0);
            CancelTask(d.Task);
        }

        // 2. Signal clocks.
        m_Signals.ForEach([delta](SignalHandle, SignalState& state)
        {
            state.TimeSinceRun += delta;
        });

        // 3. Fixed timesteps. Index loop: a step may create new timed signals.
        for (size_t i = 0; i < m_Timesteps.size(); ++i)
        {
            Timestep& step = m_Timesteps[i];
            step.Elapsed += delta;

            const double fractionalSteps = step.Elapsed / step.Duration;
            const double wholeSteps = std::floor(fractionalSteps);
            step.Elapsed = (fractionalSteps - wholeSteps) * step.Duration;

            const uint32_t steps = static_cast<uint32_t>(std::min(wholeSteps, static_cast<double>(step.MaxSteps)));
            const SignalHandle signal = step.Signal;
            const double duration = step.Duration;

            for (uint32_t s = 0; s < steps; ++s)
            {
                ExecuteSignal(signal, duration);
            }
        }

        // 4. Variable-rate update chain.
        ExecuteSignal(m_Update, 0.0);
    }

    // -------------------------------------------------------------------------
    // Introspection
    // -------------------------------------------------------------------------

    size_t SignalGraph::GetTaskCount(SignalHandle signal) const
    {
        const SignalState* state = m_Signals.Get(signal);
        return state ? state->Tasks.size() : 0;
    }

    double SignalGraph::GetTimeSinceLastRun(SignalHandle signal) const
    {
        const SignalState* state = m_Signals.Get(signal);
        return state ? state->TimeSinceRun : 0.0;
    }
}
