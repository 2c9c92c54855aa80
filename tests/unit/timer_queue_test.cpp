#include <gtest/gtest.h>
#include <vector>

#include "core/TimerQueue.h"

TEST(TimerQueueTest, RunsDueCallbacksInOrder) {
    TimerQueue q;
    std::vector<int> order;
    q.schedule(200, [&] { order.push_back(2); });
    q.schedule(100, [&] { order.push_back(1); });
    q.schedule(300, [&] { order.push_back(3); });

    EXPECT_EQ(q.runDue(250), 2u);
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
    EXPECT_EQ(q.pending(), 1u);

    EXPECT_EQ(q.runDue(300), 1u);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(TimerQueueTest, SameDueTimeRunsInScheduleOrder) {
    TimerQueue q;
    std::vector<int> order;
    q.schedule(50, [&] { order.push_back(1); });
    q.schedule(50, [&] { order.push_back(2); });
    q.runDue(50);
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST(TimerQueueTest, CancelPreventsRun) {
    TimerQueue q;
    bool ran = false;
    TimerId id = q.schedule(10, [&] { ran = true; });
    EXPECT_NE(id, 0u);
    EXPECT_TRUE(q.isPending(id));
    EXPECT_TRUE(q.cancel(id));
    EXPECT_FALSE(q.cancel(id));
    EXPECT_EQ(q.runDue(100), 0u);
    EXPECT_FALSE(ran);
}

TEST(TimerQueueTest, CallbackMayCancelAnotherDueTimer) {
    TimerQueue q;
    bool secondRan = false;
    TimerId second = 0;
    q.schedule(10, [&] { q.cancel(second); });
    second = q.schedule(20, [&] { secondRan = true; });

    EXPECT_EQ(q.runDue(100), 1u);
    EXPECT_FALSE(secondRan);
}

TEST(TimerQueueTest, TimersScheduledFromCallbacksWaitForNextPass) {
    TimerQueue q;
    int runs = 0;
    q.schedule(10, [&] {
        ++runs;
        q.schedule(10, [&] { ++runs; });
    });

    EXPECT_EQ(q.runDue(10), 1u);
    EXPECT_EQ(runs, 1);
    EXPECT_EQ(q.runDue(10), 1u);
    EXPECT_EQ(runs, 2);
}

TEST(TimerQueueTest, ClearDropsEverything) {
    TimerQueue q;
    bool ran = false;
    q.schedule(1, [&] { ran = true; });
    q.clear();
    EXPECT_EQ(q.pending(), 0u);
    q.runDue(100);
    EXPECT_FALSE(ran);
}
