#include <gtest/gtest.h>
#include <cstdint>
#include <memory>
#include <vector>

import Core;

namespace
{
    // Records its id into a shared log when destroyed.
    struct Tracked
    {
        Tracked(int id, std::shared_ptr<std::vector<int>> log) : Id(id), Log(std::move(log)) {}
        Tracked(Tracked&& other) noexcept : Id(other.Id), Log(std::move(other.Log)) {}
        ~Tracked()
        {
            if (Log) Log->push_back(Id);
        }

        int Id;
        std::shared_ptr<std::vector<int>> Log;
    };
}

TEST(RetireQueue, SweepDestroysCompletedGenerationsOldestFirst)
{
    auto log = std::make_shared<std::vector<int>>();
    Core::RetireQueue queue;

    queue.Push(1, Tracked{10, log});
    queue.Push(1, Tracked{11, log});
    queue.Push(2, Tracked{20, log});
    queue.Push(4, Tracked{40, log});
    EXPECT_EQ(queue.Size(), 4u);
    EXPECT_EQ(queue.OldestGeneration(), 1u);

    EXPECT_EQ(queue.Sweep(0), 0u);
    EXPECT_TRUE(log->empty());

    EXPECT_EQ(queue.Sweep(2), 3u);
    EXPECT_EQ(*log, (std::vector<int>{10, 11, 20}));
    EXPECT_EQ(queue.OldestGeneration(), 4u);

    EXPECT_EQ(queue.Sweep(3), 0u);
    EXPECT_EQ(queue.Sweep(4), 1u);
    EXPECT_TRUE(queue.Empty());
    EXPECT_EQ(queue.OldestGeneration(), 0u);
}

TEST(RetireQueue, HoldsSharedOwnershipUntilSwept)
{
    auto resource = std::make_shared<int>(7);
    std::weak_ptr<int> observer = resource;

    Core::RetireQueue queue;
    queue.Push(3, std::move(resource));
    EXPECT_FALSE(observer.expired());

    queue.Sweep(2);
    EXPECT_FALSE(observer.expired());

    queue.Sweep(3);
    EXPECT_TRUE(observer.expired());
}

TEST(RetireQueue, ClearDestroysEverything)
{
    auto log = std::make_shared<std::vector<int>>();
    Core::RetireQueue queue;
    queue.Push(5, Tracked{1, log});
    queue.Push(9, Tracked{2, log});

    queue.Clear();
    EXPECT_TRUE(queue.Empty());
    EXPECT_EQ(log->size(), 2u);
}

TEST(RetireQueue, MoveTransfersPendingValues)
{
    auto log = std::make_shared<std::vector<int>>();
    Core::RetireQueue source;
    source.Push(1, Tracked{1, log});

    Core::RetireQueue target = std::move(source);
    EXPECT_EQ(target.Size(), 1u);
    EXPECT_TRUE(log->empty());

    target.Sweep(1);
    EXPECT_EQ(*log, (std::vector<int>{1}));
}
