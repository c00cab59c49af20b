#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

import Core;

namespace
{
    struct TestTag {};
    using Pool = Core::ResourcePool<int, TestTag>;
    using Handle = Pool::Handle;
}

TEST(ResourcePool, AddGetRemoveRecycle)
{
    Pool pool;

    const Handle h0 = pool.Add(123);
    ASSERT_TRUE(h0.IsValid());

    int* p0 = pool.Get(h0);
    ASSERT_NE(p0, nullptr);
    EXPECT_EQ(*p0, 123);

    // Removal is immediate.
    EXPECT_TRUE(pool.Remove(h0));
    EXPECT_EQ(pool.Get(h0), nullptr);
    EXPECT_FALSE(pool.Contains(h0));
    EXPECT_FALSE(pool.Remove(h0));

    // Slot recycles with a new generation.
    const Handle h1 = pool.Add(456);
    EXPECT_EQ(h1.Index, h0.Index);
    EXPECT_NE(h1.Generation, h0.Generation);

    EXPECT_EQ(pool.Get(h0), nullptr); // stale handle

    int* p1 = pool.Get(h1);
    ASSERT_NE(p1, nullptr);
    EXPECT_EQ(*p1, 456);
}

TEST(ResourcePool, InvalidHandlesAreRejected)
{
    Pool pool;
    (void)pool.Add(1);

    EXPECT_EQ(pool.Get(Handle{}), nullptr);
    EXPECT_EQ(pool.Get(Handle{57, 1}), nullptr);
    EXPECT_FALSE(pool.Remove(Handle{}));
    EXPECT_EQ(pool.Size(), 1u);
}

TEST(ResourcePool, PointersSurviveGrowth)
{
    Pool pool;
    const Handle first = pool.Add(7);
    int* p = pool.Get(first);

    for (int i = 0; i < 1000; ++i) (void)pool.Add(i);

    EXPECT_EQ(pool.Get(first), p);
    EXPECT_EQ(*p, 7);
}

TEST(ResourcePool, ForEachVisitsLiveEntriesInSlotOrder)
{
    Pool pool;
    const Handle a = pool.Add(1);
    const Handle b = pool.Add(2);
    const Handle c = pool.Add(3);
    pool.Remove(b);

    std::vector<Handle> seen;
    int sum = 0;
    pool.ForEach([&](Handle h, int& v)
    {
        seen.push_back(h);
        sum += v;
    });

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], a);
    EXPECT_EQ(seen[1], c);
    EXPECT_EQ(sum, 4);
    EXPECT_EQ(pool.Size(), 2u);
    EXPECT_EQ(pool.Capacity(), 3u);
}

TEST(ResourcePool, MoveOnlyValues)
{
    struct StringTag {};
    Core::ResourcePool<std::unique_ptr<std::string>, StringTag> pool;

    auto h = pool.Add(std::make_unique<std::string>("task"));
    ASSERT_NE(pool.Get(h), nullptr);
    EXPECT_EQ(**pool.Get(h), "task");

    pool.Clear();
    EXPECT_EQ(pool.Size(), 0u);
    EXPECT_EQ(pool.Get(h), nullptr);
}
