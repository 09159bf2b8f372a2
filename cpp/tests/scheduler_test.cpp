#include <gtest/gtest.h>
#include "composer/core/scheduler.h"

#include <functional>
#include <string>
#include <vector>

using namespace composer;

TEST(SchedulerTest, TimersFireInDueOrderThenScheduleOrder) {
    Scheduler scheduler;
    std::vector<std::string> log;

    scheduler.schedule(50.0, [&]() { log.push_back("b"); });
    scheduler.schedule(10.0, [&]() { log.push_back("a"); });
    scheduler.schedule(50.0, [&]() { log.push_back("c"); });

    EXPECT_EQ(scheduler.advanceBy(49.0), 1u);
    EXPECT_EQ(log, (std::vector<std::string>{"a"}));

    EXPECT_EQ(scheduler.advanceBy(1.0), 2u);
    EXPECT_EQ(log, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_DOUBLE_EQ(scheduler.now(), 50.0);
}

TEST(SchedulerTest, CancelledTimerNeverFires) {
    Scheduler scheduler;
    int fired = 0;
    const TimerId id = scheduler.schedule(10.0, [&]() { ++fired; });

    EXPECT_TRUE(scheduler.isPending(id));
    EXPECT_TRUE(scheduler.cancel(id));
    EXPECT_FALSE(scheduler.cancel(id));
    scheduler.advanceBy(100.0);
    EXPECT_EQ(fired, 0);
    EXPECT_FALSE(scheduler.cancel(kInvalidTimer));
}

TEST(SchedulerTest, DeferredTasksPostedWhileRunningWaitForNextTick) {
    Scheduler scheduler;
    std::vector<int> log;

    scheduler.defer([&]() {
        log.push_back(1);
        scheduler.defer([&]() { log.push_back(2); });
    });

    EXPECT_EQ(scheduler.runDeferred(), 1u);
    EXPECT_EQ(log, (std::vector<int>{1}));
    EXPECT_EQ(scheduler.pendingDeferredCount(), 1u);

    EXPECT_EQ(scheduler.runDeferred(), 1u);
    EXPECT_EQ(log, (std::vector<int>{1, 2}));
}

TEST(SchedulerTest, FiredTimerFlushesItsDeferredWork) {
    Scheduler scheduler;
    std::vector<std::string> log;

    scheduler.schedule(10.0, [&]() {
        log.push_back("timer");
        scheduler.defer([&]() { log.push_back("after-timer"); });
    });
    scheduler.schedule(20.0, [&]() { log.push_back("second"); });

    scheduler.advanceBy(30.0);
    EXPECT_EQ(log, (std::vector<std::string>{"timer", "after-timer", "second"}));
}

TEST(SchedulerTest, TimerScheduledFromTimerFiresWhenDueWithinSameAdvance) {
    Scheduler scheduler;
    double firedAt = -1.0;

    scheduler.schedule(10.0, [&]() {
        scheduler.schedule(5.0, [&]() { firedAt = scheduler.now(); });
    });

    EXPECT_EQ(scheduler.advanceTo(100.0), 2u);
    EXPECT_DOUBLE_EQ(firedAt, 15.0);
    EXPECT_DOUBLE_EQ(scheduler.now(), 100.0);
}

TEST(SchedulerTest, TimeNeverMovesBackwards) {
    Scheduler scheduler;
    scheduler.advanceTo(100.0);
    scheduler.advanceTo(40.0);
    EXPECT_DOUBLE_EQ(scheduler.now(), 100.0);
}

TEST(SchedulerTest, CancelAllDropsTimersAndDeferredTasks) {
    Scheduler scheduler;
    int count = 0;
    scheduler.schedule(1.0, [&]() { ++count; });
    scheduler.defer([&]() { ++count; });

    scheduler.cancelAll();
    scheduler.runDeferred();
    scheduler.advanceBy(10.0);
    EXPECT_EQ(count, 0);
    EXPECT_EQ(scheduler.pendingTimerCount(), 0u);
}

// =============================================================================
// DebounceTimer
// =============================================================================

TEST(DebounceTimerTest, RestartReplacesPendingTimer) {
    Scheduler scheduler;
    DebounceTimer timer(scheduler);
    std::vector<int> fired;

    timer.restart(100.0, [&]() { fired.push_back(1); });
    scheduler.advanceBy(60.0);
    timer.restart(100.0, [&]() { fired.push_back(2); });

    scheduler.advanceBy(60.0);
    EXPECT_TRUE(fired.empty());
    EXPECT_TRUE(timer.pending());

    scheduler.advanceBy(40.0);
    EXPECT_EQ(fired, (std::vector<int>{2}));
    EXPECT_FALSE(timer.pending());
    EXPECT_EQ(scheduler.pendingTimerCount(), 0u);
}

TEST(DebounceTimerTest, DestructionCancelsPendingTimer) {
    Scheduler scheduler;
    int fired = 0;
    {
        DebounceTimer timer(scheduler);
        timer.restart(10.0, [&]() { ++fired; });
    }
    scheduler.advanceBy(20.0);
    EXPECT_EQ(fired, 0);
}

TEST(DebounceTimerTest, TaskMayRestartItsOwnTimer) {
    Scheduler scheduler;
    DebounceTimer timer(scheduler);
    int fired = 0;

    std::function<void()> tick = [&]() {
        ++fired;
        if (fired < 3) {
            timer.restart(10.0, tick);
        }
    };
    timer.restart(10.0, tick);

    scheduler.advanceBy(100.0);
    EXPECT_EQ(fired, 3);
    EXPECT_FALSE(timer.pending());
}
