#include <gtest/gtest.h>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

import Core;

namespace
{
    struct Widget
    {
        explicit Widget(int capacity) : Capacity(capacity) { ++Alive; }
        ~Widget() { --Alive; }

        Widget(const Widget&) = delete;
        Widget& operator=(const Widget&) = delete;

        int Capacity = 0;
        int Uses = 0;

        static inline int Alive = 0;
    };

    using WidgetArena = Core::LeaseArena<std::string, Widget>;

    auto MakeWidget(int capacity)
    {
        return [capacity]() -> Core::Expected<std::unique_ptr<Widget>>
        {
            return std::make_unique<Widget>(capacity);
        };
    }

    auto FitsAtLeast(int capacity)
    {
        return [capacity](const Widget& w) { return w.Capacity >= capacity; };
    }

    class LeaseArenaTest : public ::testing::Test
    {
    protected:
        void SetUp() override { Widget::Alive = 0; }
        void TearDown() override { EXPECT_EQ(Widget::Alive, 0); }

        uint64_t m_Frame = 0;
    };
}

static_assert(!std::is_copy_constructible_v<Core::Lease<Widget>>);
static_assert(!std::is_copy_assignable_v<Core::Lease<Widget>>);
static_assert(std::is_nothrow_move_constructible_v<Core::Lease<Widget>>);
static_assert(std::is_nothrow_destructible_v<Core::Lease<Widget>>);

TEST_F(LeaseArenaTest, MissConstructsThenReleaseReturnsToQueue)
{
    WidgetArena arena(&m_Frame);
    Widget* first = nullptr;

    {
        auto lease = arena.Acquire("a", FitsAtLeast(4), MakeWidget(4));
        ASSERT_TRUE(lease.has_value());
        ASSERT_TRUE(*lease);
        EXPECT_TRUE(lease->IsPooled());
        first = lease->Get();
        EXPECT_EQ(arena.IdleCount(), 0u);
    }

    EXPECT_EQ(arena.IdleCount(), 1u);
    EXPECT_EQ(arena.ConstructedCount(), 1u);

    auto again = arena.Acquire("a", FitsAtLeast(4), MakeWidget(4));
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->Get(), first);
    EXPECT_EQ(arena.ConstructedCount(), 1u);
    EXPECT_EQ(arena.ReuseCount(), 1u);
}

TEST_F(LeaseArenaTest, SmallerRequestReusesLargerObject)
{
    WidgetArena arena(&m_Frame);
    Widget* big = nullptr;
    {
        auto lease = arena.Acquire("data", FitsAtLeast(1024), MakeWidget(1024));
        ASSERT_TRUE(lease.has_value());
        big = lease->Get();
    }

    auto small = arena.Acquire("data", FitsAtLeast(512), MakeWidget(512));
    ASSERT_TRUE(small.has_value());
    EXPECT_EQ(small->Get(), big);
    EXPECT_EQ((*small)->Capacity, 1024);
}

TEST_F(LeaseArenaTest, LargerRequestDoesNotReuseSmallerObject)
{
    WidgetArena arena(&m_Frame);
    {
        auto lease = arena.Acquire("data", FitsAtLeast(512), MakeWidget(512));
        ASSERT_TRUE(lease.has_value());
    }

    auto big = arena.Acquire("data", FitsAtLeast(1024), MakeWidget(1024));
    ASSERT_TRUE(big.has_value());
    EXPECT_EQ((*big)->Capacity, 1024);
    EXPECT_EQ(arena.ConstructedCount(), 2u);
    EXPECT_EQ(arena.IdleCount(), 1u);
}

TEST_F(LeaseArenaTest, KeysAreSeparateQueues)
{
    WidgetArena arena(&m_Frame);
    {
        auto a = arena.Acquire("a", FitsAtLeast(1), MakeWidget(1));
        ASSERT_TRUE(a.has_value());
    }

    auto b = arena.Acquire("b", FitsAtLeast(1), MakeWidget(1));
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(arena.ConstructedCount(), 2u);
    EXPECT_EQ(arena.QueueCount(), 2u);
    ASSERT_NE(arena.FindQueue("a"), nullptr);
    EXPECT_EQ(arena.FindQueue("a")->Size(), 1u);
    EXPECT_EQ(arena.FindQueue("missing"), nullptr);
}

TEST_F(LeaseArenaTest, ScanPrefersMostRecentlyReleased)
{
    WidgetArena arena(&m_Frame);
    Widget* older = nullptr;
    Widget* newer = nullptr;
    {
        auto a = arena.Acquire("k", FitsAtLeast(8), MakeWidget(8));
        auto b = arena.Acquire("k", FitsAtLeast(8), MakeWidget(8));
        ASSERT_TRUE(a && b);
        older = a->Get();
        newer = b->Get();

        // Release a first, then b: b is the warmest.
        *a = Core::Lease<Widget>{};
    }
    ASSERT_EQ(arena.IdleCount(), 2u);

    auto lease = arena.Acquire("k", FitsAtLeast(8), MakeWidget(8));
    ASSERT_TRUE(lease.has_value());
    EXPECT_EQ(lease->Get(), newer);
    EXPECT_NE(lease->Get(), older);
}

TEST_F(LeaseArenaTest, FactoryErrorPropagatesAndNothingIsQueued)
{
    WidgetArena arena(&m_Frame);

    auto lease = arena.Acquire("k", FitsAtLeast(1), []() -> Core::Expected<std::unique_ptr<Widget>>
    {
        return std::unexpected(Core::ErrorCode::OutOfDeviceMemory);
    });

    ASSERT_FALSE(lease.has_value());
    EXPECT_EQ(lease.error(), Core::ErrorCode::OutOfDeviceMemory);
    EXPECT_EQ(arena.ConstructedCount(), 0u);
    EXPECT_EQ(arena.IdleCount(), 0u);
}

TEST_F(LeaseArenaTest, MovedFromLeaseReturnsNothing)
{
    WidgetArena arena(&m_Frame);
    {
        auto lease = arena.Acquire("k", FitsAtLeast(1), MakeWidget(1));
        ASSERT_TRUE(lease.has_value());

        Core::Lease<Widget> moved = std::move(*lease);
        EXPECT_FALSE(*lease);
        EXPECT_TRUE(moved);
        moved->Uses = 3;
    }

    ASSERT_EQ(arena.IdleCount(), 1u);
    auto again = arena.Acquire("k", FitsAtLeast(1), MakeWidget(1));
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ((*again)->Uses, 3);
}

TEST_F(LeaseArenaTest, MoveAssignReturnsPreviousObject)
{
    WidgetArena arena(&m_Frame);

    auto a = arena.Acquire("k", FitsAtLeast(1), MakeWidget(1));
    auto b = arena.Acquire("k", FitsAtLeast(1), MakeWidget(1));
    ASSERT_TRUE(a && b);
    Widget* kept = b->Get();

    *a = std::move(*b);
    EXPECT_EQ(arena.IdleCount(), 1u);
    EXPECT_EQ(a->Get(), kept);
}

TEST_F(LeaseArenaTest, ReleaseDetachesFromPooling)
{
    WidgetArena arena(&m_Frame);
    std::unique_ptr<Widget> owned;
    {
        auto lease = arena.Acquire("k", FitsAtLeast(1), MakeWidget(1));
        ASSERT_TRUE(lease.has_value());
        owned = lease->Release();
        EXPECT_FALSE(*lease);
        EXPECT_FALSE(lease->IsPooled());
    }

    EXPECT_EQ(arena.IdleCount(), 0u);
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(Widget::Alive, 1);
    owned.reset();
}

TEST_F(LeaseArenaTest, LeaseOutlivingArenaDestroysItsObject)
{
    Core::Lease<Widget> survivor;
    {
        WidgetArena arena(&m_Frame);
        auto lease = arena.Acquire("k", FitsAtLeast(1), MakeWidget(1));
        ASSERT_TRUE(lease.has_value());
        survivor = std::move(*lease);
        EXPECT_TRUE(survivor.IsPooled());
    }

    EXPECT_FALSE(survivor.IsPooled());
    EXPECT_EQ(Widget::Alive, 1);
    survivor = Core::Lease<Widget>{};
    EXPECT_EQ(Widget::Alive, 0);
}

TEST_F(LeaseArenaTest, SeedGoesToColdEnd)
{
    WidgetArena arena(&m_Frame);
    Widget* warm = nullptr;
    {
        auto lease = arena.Acquire("k", FitsAtLeast(1), MakeWidget(1));
        ASSERT_TRUE(lease.has_value());
        warm = lease->Get();
        arena.Seed("k", std::make_unique<Widget>(1));
    }

    EXPECT_EQ(arena.IdleCount(), 2u);
    EXPECT_EQ(arena.ConstructedCount(), 2u);

    auto first = arena.Acquire("k", FitsAtLeast(1), MakeWidget(1));
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->Get(), warm);
}

TEST_F(LeaseArenaTest, EvictRemovesOnlyEntriesIdlePastThreshold)
{
    WidgetArena arena(&m_Frame);

    {
        auto stale = arena.Acquire("stale", FitsAtLeast(1), MakeWidget(1));
        ASSERT_TRUE(stale.has_value());
    }

    m_Frame = 5;
    {
        auto fresh = arena.Acquire("fresh", FitsAtLeast(1), MakeWidget(1));
        ASSERT_TRUE(fresh.has_value());
    }

    m_Frame = 9;
    std::vector<std::pair<std::string, uint64_t>> evicted;
    const size_t count = arena.Evict(8, [&](const std::string& key, const Widget&, uint64_t idleFrames)
    {
        evicted.emplace_back(key, idleFrames);
    });

    EXPECT_EQ(count, 1u);
    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted[0].first, "stale");
    EXPECT_EQ(evicted[0].second, 9u);
    EXPECT_EQ(arena.IdleCount(), 1u);
    EXPECT_EQ(Widget::Alive, 1);

    // Exactly at the threshold is kept.
    m_Frame = 13;
    EXPECT_EQ(arena.Evict(8, [](const std::string&, const Widget&, uint64_t) {}), 0u);
    m_Frame = 14;
    EXPECT_EQ(arena.Evict(8, [](const std::string&, const Widget&, uint64_t) {}), 1u);
    EXPECT_EQ(arena.IdleCount(), 0u);
}

TEST_F(LeaseArenaTest, ReleaseStampsCurrentFrame)
{
    WidgetArena arena(&m_Frame);
    auto lease = arena.Acquire("k", FitsAtLeast(1), MakeWidget(1));
    ASSERT_TRUE(lease.has_value());

    m_Frame = 42;
    *lease = Core::Lease<Widget>{};

    const auto* queue = arena.FindQueue("k");
    ASSERT_NE(queue, nullptr);
    ASSERT_EQ(queue->Size(), 1u);
    EXPECT_EQ(queue->Entries().back().LastReleasedFrame, 42u);
}

TEST(IdleQueue, TakeIfScansFromBack)
{
    uint64_t frame = 0;
    Core::IdleQueue<int> queue(&frame);
    queue.Push(std::make_unique<int>(1));
    queue.Push(std::make_unique<int>(2));
    queue.Push(std::make_unique<int>(3));
    queue.PushCold(std::make_unique<int>(0));

    auto even = queue.TakeIf([](const int& v) { return v % 2 == 0; });
    ASSERT_NE(even, nullptr);
    EXPECT_EQ(*even, 2);

    auto back = queue.TakeBack();
    ASSERT_NE(back, nullptr);
    EXPECT_EQ(*back, 3);

    EXPECT_EQ(queue.TakeIf([](const int& v) { return v > 10; }), nullptr);
    EXPECT_EQ(queue.Size(), 2u);
    EXPECT_EQ(*queue.Entries().front().Item, 0);
}
