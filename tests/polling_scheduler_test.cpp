#include <gtest/gtest.h>

#include <deque>
#include <stdexcept>
#include <thread>

#include "scheduler/polling_scheduler.hpp"

using detector::CycleResult;
using scheduler::PollingPolicy;
using scheduler::PollingScheduler;
using scheduler::PollMode;

namespace
{
    const std::uintmax_t SMALL = 2ull * 1024 * 1024;
    const std::uintmax_t LARGE = 50ull * 1024 * 1024;

    PollingPolicy policy()
    {
        PollingPolicy p;
        p.size_threshold_bytes = 10ull * 1024 * 1024;
        p.dense_interval = std::chrono::seconds(5);
        p.dense_duration = std::chrono::seconds(15);
        p.sparse_interval = std::chrono::seconds(15);
        p.max_failed_ticks = 3;
        return p;
    }

    CycleResult changed()
    {
        CycleResult r;
        r.changes_found = true;
        r.change_count = 1;
        return r;
    }

    CycleResult quiet()
    {
        return CycleResult();
    }

    CycleResult failed(errors::Status status)
    {
        CycleResult r;
        r.status = status;
        return r;
    }

    // Hands out queued results, then quiet cycles.
    struct ScriptedProbe
    {
        std::deque<CycleResult> script;
        int calls = 0;

        CycleResult operator()(const std::string &)
        {
            ++calls;
            if (script.empty())
                return quiet();
            CycleResult r = script.front();
            script.pop_front();
            return r;
        }
    };
}

TEST(PollingScheduler, SizePicksMode)
{
    PollingScheduler scheduler([](const std::string &)
                               { return CycleResult(); },
                               policy(), true);
    EXPECT_EQ(scheduler.modeFor(SMALL), PollMode::Dense);
    EXPECT_EQ(scheduler.modeFor(LARGE), PollMode::Sparse);
    EXPECT_EQ(scheduler.modeFor(10ull * 1024 * 1024), PollMode::Sparse);
    EXPECT_STREQ(scheduler::toString(PollMode::Dense), "dense");
}

TEST(PollingScheduler, DenseWindowExtendsOnChangeThenExpires)
{
    ScriptedProbe probe;
    probe.script = {changed()};
    PollingScheduler scheduler(std::ref(probe), policy(), true);

    EXPECT_EQ(scheduler.start("/a.xlsx", SMALL), PollMode::Dense);
    auto info = scheduler.taskInfo("/a.xlsx");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->interval, std::chrono::seconds(5));
    EXPECT_EQ(info->remaining, std::chrono::seconds(15));

    EXPECT_EQ(scheduler.runPendingTicks(), 1u);
    ASSERT_TRUE(scheduler.hasTask("/a.xlsx"));
    EXPECT_EQ(scheduler.taskInfo("/a.xlsx")->remaining, std::chrono::seconds(15));

    scheduler.runPendingTicks();
    ASSERT_TRUE(scheduler.hasTask("/a.xlsx"));
    EXPECT_EQ(scheduler.taskInfo("/a.xlsx")->remaining, std::chrono::seconds(10));

    scheduler.runPendingTicks();
    ASSERT_TRUE(scheduler.hasTask("/a.xlsx"));
    EXPECT_EQ(scheduler.taskInfo("/a.xlsx")->remaining, std::chrono::seconds(5));

    scheduler.runPendingTicks();
    EXPECT_FALSE(scheduler.hasTask("/a.xlsx"));
    EXPECT_EQ(probe.calls, 4);
    EXPECT_EQ(scheduler.runPendingTicks(), 0u);
}

TEST(PollingScheduler, SparseTaskEndsOnFirstQuietTick)
{
    ScriptedProbe probe;
    probe.script = {changed(), changed()};
    PollingScheduler scheduler(std::ref(probe), policy(), true);

    EXPECT_EQ(scheduler.start("/big.xlsx", LARGE), PollMode::Sparse);
    EXPECT_EQ(scheduler.taskInfo("/big.xlsx")->interval, std::chrono::seconds(15));

    scheduler.runPendingTicks();
    scheduler.runPendingTicks();
    EXPECT_TRUE(scheduler.hasTask("/big.xlsx"));
    scheduler.runPendingTicks();
    EXPECT_FALSE(scheduler.hasTask("/big.xlsx"));
    EXPECT_EQ(probe.calls, 3);
}

TEST(PollingScheduler, RestartReplacesTask)
{
    PollingScheduler scheduler([](const std::string &)
                               { return CycleResult(); },
                               policy(), true);
    scheduler.start("/a.xlsx", SMALL);
    auto firstGeneration = scheduler.taskInfo("/a.xlsx")->generation;

    EXPECT_EQ(scheduler.start("/a.xlsx", LARGE), PollMode::Sparse);
    EXPECT_EQ(scheduler.taskCount(), 1u);
    auto info = scheduler.taskInfo("/a.xlsx");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->mode, PollMode::Sparse);
    EXPECT_GT(info->generation, firstGeneration);
    EXPECT_EQ(info->ticks, 0u);
}

TEST(PollingScheduler, FailedTicksRetryThenGiveUp)
{
    ScriptedProbe probe;
    probe.script = {failed(errors::Status::AccessDenied), failed(errors::Status::Timeout),
                    failed(errors::Status::AccessDenied)};
    PollingScheduler scheduler(std::ref(probe), policy(), true);
    scheduler.start("/locked.xlsx", SMALL);

    scheduler.runPendingTicks();
    scheduler.runPendingTicks();
    auto info = scheduler.taskInfo("/locked.xlsx");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->failures, 2u);
    EXPECT_EQ(info->remaining, std::chrono::seconds(15));

    scheduler.runPendingTicks();
    EXPECT_FALSE(scheduler.hasTask("/locked.xlsx"));
}

TEST(PollingScheduler, SuccessResetsFailureCount)
{
    ScriptedProbe probe;
    probe.script = {failed(errors::Status::AccessDenied), failed(errors::Status::AccessDenied), changed(),
                    failed(errors::Status::AccessDenied), failed(errors::Status::AccessDenied)};
    PollingScheduler scheduler(std::ref(probe), policy(), true);
    scheduler.start("/flaky.xlsx", SMALL);

    for (int i = 0; i < 5; ++i)
        scheduler.runPendingTicks();
    auto info = scheduler.taskInfo("/flaky.xlsx");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->failures, 2u);
    EXPECT_EQ(info->ticks, 5u);
}

TEST(PollingScheduler, MissingBaselineCountsAsQuiet)
{
    ScriptedProbe probe;
    probe.script = {failed(errors::Status::NotFound)};
    PollingScheduler scheduler(std::ref(probe), policy(), true);
    scheduler.start("/new.xlsx", LARGE);
    scheduler.runPendingTicks();
    EXPECT_FALSE(scheduler.hasTask("/new.xlsx"));
}

TEST(PollingScheduler, CancelAndStopAll)
{
    PollingScheduler scheduler([](const std::string &)
                               { return CycleResult(); },
                               policy(), true);
    scheduler.start("/a.xlsx", SMALL);
    scheduler.start("/b.xlsx", SMALL);
    scheduler.start("/c.xlsx", LARGE);
    EXPECT_EQ(scheduler.taskCount(), 3u);

    scheduler.cancel("/a.xlsx");
    EXPECT_FALSE(scheduler.hasTask("/a.xlsx"));
    EXPECT_EQ(scheduler.taskCount(), 2u);

    scheduler.stopAll();
    EXPECT_EQ(scheduler.taskCount(), 0u);
    EXPECT_EQ(scheduler.runPendingTicks(), 0u);
}

TEST(PollingScheduler, ThrowingProbeCountsAsFailure)
{
    PollingScheduler scheduler([](const std::string &) -> CycleResult
                               { throw std::runtime_error("boom"); },
                               policy(), true);
    scheduler.start("/a.xlsx", SMALL);
    scheduler.runPendingTicks();
    auto info = scheduler.taskInfo("/a.xlsx");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->failures, 1u);
}

TEST(PollingScheduler, ThreadedDenseWindowExpires)
{
    std::atomic<int> calls{0};
    PollingPolicy p = policy();
    p.dense_interval = std::chrono::milliseconds(20);
    p.dense_duration = std::chrono::milliseconds(60);
    PollingScheduler scheduler([&calls](const std::string &)
                               {
                                   ++calls;
                                   return CycleResult(); },
                               p);

    scheduler.start("/a.xlsx", SMALL);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (scheduler.hasTask("/a.xlsx") && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));

    EXPECT_FALSE(scheduler.hasTask("/a.xlsx"));
    EXPECT_EQ(calls.load(), 3);
}

TEST(PollingScheduler, OneCycleAtATimePerPath)
{
    std::atomic<int> active{0};
    std::atomic<int> maxActive{0};
    std::atomic<int> calls{0};
    PollingPolicy p = policy();
    p.dense_interval = std::chrono::milliseconds(1);
    p.dense_duration = std::chrono::seconds(60);
    p.worker_threads = 4;

    PollingScheduler scheduler([&](const std::string &)
                               {
                                   int now = ++active;
                                   int seen = maxActive.load();
                                   while (now > seen && !maxActive.compare_exchange_weak(seen, now))
                                   {
                                   }
                                   std::this_thread::sleep_for(std::chrono::milliseconds(10));
                                   --active;
                                   ++calls;
                                   CycleResult r;
                                   r.changes_found = true;
                                   return r; },
                               p);

    for (int i = 0; i < 20; ++i)
    {
        scheduler.start("/hot.xlsx", SMALL);
        std::this_thread::sleep_for(std::chrono::milliseconds(3));
    }
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (calls.load() < 5 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));

    scheduler.stopAll();
    EXPECT_EQ(scheduler.taskCount(), 0u);
    EXPECT_GE(calls.load(), 5);
    EXPECT_EQ(maxActive.load(), 1);
}
