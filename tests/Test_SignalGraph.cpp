#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include <glm/glm.hpp>
#include <entt/entity/entity.hpp>

import Core;
import ECS;
import Runtime.SignalGraph;

using namespace Runtime;

namespace
{
    struct Tracked
    {
        int Hits = 0;
    };

    TaskDesc Record(std::vector<std::string>& log, std::string name)
    {
        return TaskDesc{
            .Once = [&log, name](const TaskContext&) { log.push_back(name); },
        };
    }

    class CountingTask final : public ITask
    {
    public:
        CountingTask(int& each, int& once) : m_Each(each), m_Once(once) {}

        [[nodiscard]] const ECS::Query* GetQuery() const override { return &m_Query; }
        void RunEach(entt::entity, const TaskContext&) override { ++m_Each; }
        void RunOnce(const TaskContext& ctx) override
        {
            ++m_Once;
            LastEntityCount = ctx.Entities.size();
        }

        size_t LastEntityCount = 0;

    private:
        ECS::Query m_Query = ECS::Query::Of<Tracked>();
        int& m_Each;
        int& m_Once;
    };
}

// -----------------------------------------------------------------------------
// Ordering
// -----------------------------------------------------------------------------

TEST(SignalGraph, TasksRunInRegistrationOrder)
{
    ECS::Scene scene;
    SignalGraph graph(scene);
    std::vector<std::string> log;

    const SignalHandle signal = graph.CreateSignal();
    graph.OnSignal(signal, Record(log, "a"));
    graph.OnSignal(signal, Record(log, "b"));
    graph.OnSignal(signal, Record(log, "c"));

    graph.InvokeSignal(signal);

    EXPECT_EQ(log, (std::vector<std::string>{"a", "b", "c"}));
}

TEST(SignalGraph, BeforeOwnAfterOrder)
{
    ECS::Scene scene;
    SignalGraph graph(scene);
    std::vector<std::string> log;

    const SignalHandle main = graph.CreateSignal();
    const SignalHandle before = graph.SignalBefore(main);
    const SignalHandle after = graph.SignalAfter(main);
    const SignalHandle afterAfter = graph.SignalAfter(after);

    graph.OnSignal(after, Record(log, "after"));
    graph.OnSignal(afterAfter, Record(log, "after-after"));
    graph.OnSignal(main, Record(log, "main"));
    graph.OnSignal(before, Record(log, "before"));

    graph.InvokeSignal(main);

    EXPECT_EQ(log, (std::vector<std::string>{"before", "main", "after", "after-after"}));
}

TEST(SignalGraph, UnknownHandlesAreIgnored)
{
    ECS::Scene scene;
    SignalGraph graph(scene);
    std::vector<std::string> log;

    EXPECT_FALSE(graph.SignalAfter(SignalHandle{}).IsValid());
    EXPECT_FALSE(graph.OnSignal(SignalHandle{42, 1}, Record(log, "x")).IsValid());

    graph.InvokeSignal(SignalHandle{42, 1});
    graph.CancelTask(TaskHandle{7, 3});
    EXPECT_TRUE(log.empty());
}

// -----------------------------------------------------------------------------
// Queries and context
// -----------------------------------------------------------------------------

TEST(SignalGraph, TaskSeesQueryResult)
{
    ECS::Scene scene;
    SignalGraph graph(scene);

    for (int i = 0; i < 3; ++i) scene.Add<Tracked>(scene.CreateEntity());
    scene.CreateEntity("untracked");

    int each = 0;
    int once = 0;
    auto task = std::make_unique<CountingTask>(each, once);
    CountingTask* raw = task.get();
    graph.OnSignal(graph.Update(), std::move(task));

    graph.Tick(0.016);

    EXPECT_EQ(each, 3);
    EXPECT_EQ(once, 1);
    EXPECT_EQ(raw->LastEntityCount, 3u);
}

TEST(SignalGraph, TaskWithoutQuerySeesNoEntities)
{
    ECS::Scene scene;
    SignalGraph graph(scene);
    scene.Add<Tracked>(scene.CreateEntity());

    int eachCalls = 0;
    size_t seen = 99;
    graph.OnSignal(graph.Update(), TaskDesc{
        .ForEach = [&](entt::entity, const TaskContext&) { ++eachCalls; },
        .Once = [&](const TaskContext& ctx) { seen = ctx.Entities.size(); },
    });

    graph.Tick(0.016);
    EXPECT_EQ(eachCalls, 0);
    EXPECT_EQ(seen, 0u);
}

TEST(SignalGraph, MovementTaskIntegratesTickDelta)
{
    using namespace ECS::Components;

    ECS::Scene scene;
    SignalGraph graph(scene);

    entt::entity e = scene.CreateEntity("player");
    scene.Add<Transform::Component>(e);
    scene.Add<Movement::Component>(e, Movement::Component{.Force = {1.0f, 0.0f}, .Mass = 1.0f});

    graph.OnSignal(graph.Update(), TaskDesc{
        .Query = ECS::Query::Of<Movement::Component>(),
        .ForEach = [&scene](entt::entity entity, const TaskContext& ctx)
        {
            ECS::Systems::Movement::OnUpdate(scene.GetRegistry(), entity, static_cast<float>(ctx.DeltaTime));
        },
    });

    graph.Tick(0.5);

    const auto* movement = scene.TryGet<Movement::Component>(e);
    ASSERT_NE(movement, nullptr);
    EXPECT_FLOAT_EQ(movement->Velocity.x, 0.5f);
    EXPECT_FLOAT_EQ(movement->Velocity.y, 0.0f);
    EXPECT_EQ(movement->Force, glm::vec2(0.0f));
}

TEST(SignalGraph, DeltaTimeIsTimeSinceSignalLastRan)
{
    ECS::Scene scene;
    SignalGraph graph(scene);

    std::vector<double> deltas;
    graph.OnSignal(graph.Update(), TaskDesc{
        .Once = [&](const TaskContext& ctx) { deltas.push_back(ctx.DeltaTime); },
    });

    graph.Tick(0.25);
    graph.Tick(0.5);

    ASSERT_EQ(deltas.size(), 2u);
    EXPECT_DOUBLE_EQ(deltas[0], 0.25);
    EXPECT_DOUBLE_EQ(deltas[1], 0.5);
    EXPECT_DOUBLE_EQ(graph.GetTimeSinceLastRun(graph.Update()), 0.0);
    EXPECT_DOUBLE_EQ(graph.GetElapsed(), 0.75);
}

TEST(SignalGraph, EntityDestroyedMidTaskIsSkipped)
{
    ECS::Scene scene;
    SignalGraph graph(scene);

    entt::entity first = scene.CreateEntity();
    entt::entity second = scene.CreateEntity();
    scene.Add<Tracked>(first);
    scene.Add<Tracked>(second);

    int visited = 0;
    graph.OnSignal(graph.Update(), TaskDesc{
        .Query = ECS::Query::Of<Tracked>(),
        .ForEach = [&](entt::entity e, const TaskContext&)
        {
            ++visited;
            // Whichever comes first destroys the other.
            scene.DestroyEntity(e == first ? second : first);
        },
    });

    graph.Tick(0.016);
    EXPECT_EQ(visited, 1);
}

// -----------------------------------------------------------------------------
// Fixed timestep
// -----------------------------------------------------------------------------

TEST(SignalGraph, FixedTimestepRunsWholeStepsAndCarriesRemainder)
{
    ECS::Scene scene;
    SignalGraph graph(scene);

    const SignalHandle fixed = graph.CreateSignal(SignalOptions{.Frequency = 10.0, .MaxSteps = 5});

    std::vector<double> fixedDeltas;
    graph.OnSignal(fixed, TaskDesc{
        .Once = [&](const TaskContext& ctx) { fixedDeltas.push_back(ctx.FixedDeltaTime); },
    });

    graph.Tick(0.35);
    ASSERT_EQ(fixedDeltas.size(), 3u);
    for (double d : fixedDeltas) EXPECT_DOUBLE_EQ(d, 0.1);

    // 0.05 carried + 0.06 crosses one more step.
    graph.Tick(0.06);
    EXPECT_EQ(fixedDeltas.size(), 4u);
}

TEST(SignalGraph, FixedTimestepClampsToMaxSteps)
{
    ECS::Scene scene;
    SignalGraph graph(scene);

    const SignalHandle fixed = graph.CreateSignal(SignalOptions{.Frequency = 10.0, .MaxSteps = 2});

    int runs = 0;
    graph.OnSignal(fixed, TaskDesc{.Once = [&](const TaskContext&) { ++runs; }});

    graph.Tick(0.35);
    EXPECT_EQ(runs, 2);

    // Dropped whole steps do not come back; only the 0.05 remainder does.
    graph.Tick(0.04);
    EXPECT_EQ(runs, 2);
    graph.Tick(0.02);
    EXPECT_EQ(runs, 3);
}

TEST(SignalGraph, FixedTimestepsRunBeforeUpdate)
{
    ECS::Scene scene;
    SignalGraph graph(scene);
    std::vector<std::string> log;

    const SignalHandle fixed = graph.CreateSignal(SignalOptions{.Frequency = 60.0});
    graph.OnSignal(graph.Update(), Record(log, "update"));
    graph.OnSignal(fixed, Record(log, "fixed"));

    graph.Tick(1.0 / 30.0 + 1e-6);

    EXPECT_EQ(log, (std::vector<std::string>{"fixed", "fixed", "update"}));
}

TEST(SignalGraph, ZeroFrequencyIsNotTimeDriven)
{
    ECS::Scene scene;
    SignalGraph graph(scene);

    const SignalHandle manual = graph.CreateSignal(SignalOptions{.Frequency = 0.0});
    int runs = 0;
    graph.OnSignal(manual, TaskDesc{.Once = [&](const TaskContext&) { ++runs; }});

    graph.Tick(10.0);
    EXPECT_EQ(runs, 0);
    EXPECT_DOUBLE_EQ(graph.GetTimeSinceLastRun(manual), 10.0);
}

// -----------------------------------------------------------------------------
// Cancellation and delays
// -----------------------------------------------------------------------------

TEST(SignalGraph, CancelledTaskNeverRunsAgain)
{
    ECS::Scene scene;
    SignalGraph graph(scene);

    int runs = 0;
    const TaskHandle task = graph.OnSignal(graph.Update(), TaskDesc{.Once = [&](const TaskContext&) { ++runs; }});

    graph.Tick(0.016);
    graph.CancelTask(task);
    EXPECT_FALSE(graph.IsTaskAlive(task));

    // The list entry lingers until the next traversal sweeps it.
    EXPECT_EQ(graph.GetTaskCount(graph.Update()), 1u);
    graph.Tick(0.016);
    EXPECT_EQ(graph.GetTaskCount(graph.Update()), 0u);
    EXPECT_EQ(runs, 1);

    graph.CancelTask(task); // second cancel is a no-op
}

TEST(SignalGraph, TaskCanCancelItself)
{
    ECS::Scene scene;
    SignalGraph graph(scene);
    for (int i = 0; i < 4; ++i) scene.Add<Tracked>(scene.CreateEntity());

    TaskHandle self{};
    int each = 0;
    int once = 0;
    self = graph.OnSignal(graph.Update(), TaskDesc{
        .Query = ECS::Query::Of<Tracked>(),
        .ForEach = [&](entt::entity, const TaskContext&)
        {
            ++each;
            graph.CancelTask(self);
        },
        .Once = [&](const TaskContext&) { ++once; },
    });

    graph.Tick(0.016);
    graph.Tick(0.016);

    EXPECT_EQ(each, 1);
    EXPECT_EQ(once, 0);
}

TEST(SignalGraph, CancellingALaterTaskSkipsIt)
{
    ECS::Scene scene;
    SignalGraph graph(scene);
    std::vector<std::string> log;

    TaskHandle second{};
    graph.OnSignal(graph.Update(), TaskDesc{
        .Once = [&](const TaskContext&)
        {
            log.push_back("first");
            graph.CancelTask(second);
        },
    });
    second = graph.OnSignal(graph.Update(), Record(log, "second"));

    graph.Tick(0.016);
    EXPECT_EQ(log, (std::vector<std::string>{"first"}));
}

TEST(SignalGraph, TaskAddedDuringExecutionRunsNextTime)
{
    ECS::Scene scene;
    SignalGraph graph(scene);
    std::vector<std::string> log;

    bool added = false;
    graph.OnSignal(graph.Update(), TaskDesc{
        .Once = [&](const TaskContext&)
        {
            log.push_back("outer");
            if (added) return;
            added = true;
            graph.OnSignal(graph.Update(), Record(log, "inner"));
        },
    });

    graph.Tick(0.016);
    EXPECT_EQ(log, (std::vector<std::string>{"outer"}));

    graph.Tick(0.016);
    EXPECT_EQ(log, (std::vector<std::string>{"outer", "outer", "inner"}));
}

TEST(SignalGraph, AfterDelayFiresOnceWhenElapsedExceedsDuration)
{
    ECS::Scene scene;
    SignalGraph graph(scene);

    std::vector<double> deltas;
    const TaskHandle task = graph.AfterDelay(0.5, TaskDesc{
        .Once = [&](const TaskContext& ctx) { deltas.push_back(ctx.DeltaTime); },
    });

    graph.Tick(0.25);
    graph.Tick(0.25); // exactly 0.5 is not past the delay
    EXPECT_TRUE(deltas.empty());

    graph.Tick(0.01);
    ASSERT_EQ(deltas.size(), 1u);
    EXPECT_DOUBLE_EQ(deltas[0], 0.5);
    EXPECT_FALSE(graph.IsTaskAlive(task));

    graph.Tick(1.0);
    EXPECT_EQ(deltas.size(), 1u);
}

TEST(SignalGraph, CancelledDelayNeverFires)
{
    ECS::Scene scene;
    SignalGraph graph(scene);

    int runs = 0;
    const TaskHandle task = graph.AfterDelay(0.1, TaskDesc{.Once = [&](const TaskContext&) { ++runs; }});
    graph.CancelTask(task);

    graph.Tick(1.0);
    EXPECT_EQ(runs, 0);
}

TEST(SignalGraph, DelaysRunBeforeSignals)
{
    ECS::Scene scene;
    SignalGraph graph(scene);
    std::vector<std::string> log;

    graph.OnSignal(graph.Update(), Record(log, "update"));
    graph.AfterDelay(0.0, Record(log, "delay"));

    graph.Tick(0.016);
    EXPECT_EQ(log, (std::vector<std::string>{"delay", "update"}));
}
