#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "cron/scheduler_service.hpp"
#include "cron/trigger_parser.hpp"
#include "test_support.hpp"

using llmtrigger::cron::LoopState;
using llmtrigger::cron::ParseTrigger;
using llmtrigger::cron::SchedulerService;
using llmtrigger::cron::TriggerCategory;
using llmtrigger::cron::TriggerState;
using llmtrigger::testing::ExecutorHarness;
using llmtrigger::testing::FakeProvider;
using llmtrigger::testing::LocalTime;
using llmtrigger::testing::LogCapture;

namespace {

std::vector<TriggerState> Parse(const std::vector<std::string>& raw,
                                std::chrono::system_clock::time_point parsed_at) {
    std::vector<TriggerState> states;
    for (const auto& entry : raw) {
        states.push_back(ParseTrigger(entry, TriggerCategory::Room, parsed_at));
    }
    return states;
}

}  // namespace

TEST(SchedulerServiceTest, PastDueTriggerFiresOnceAndAdvancesPastNow) {
    ExecutorHarness harness;
    const auto now = LocalTime(2024, 1, 3, 9, 2);
    SchedulerService scheduler(Parse({"p1::g1::provA::*/5 * * * *::tick"}, now - std::chrono::hours(1)),
                               *harness.executor);

    EXPECT_EQ(scheduler.RunDueTriggers(now), 1u);
    EXPECT_EQ(harness.provider->Calls(), 1);

    const auto triggers = scheduler.ListTriggers();
    ASSERT_EQ(triggers.size(), 1u);
    EXPECT_EQ(triggers[0].next_run, LocalTime(2024, 1, 3, 9, 5));
    ASSERT_TRUE(triggers[0].last_run.has_value());
    EXPECT_EQ(triggers[0].last_run.value(), now);

    EXPECT_EQ(scheduler.RunDueTriggers(now), 0u);
    EXPECT_EQ(harness.provider->Calls(), 1);
}

TEST(SchedulerServiceTest, TriggerThatIsNotDueIsLeftAlone) {
    ExecutorHarness harness;
    const auto now = LocalTime(2024, 1, 3, 9, 2);
    SchedulerService scheduler(Parse({"p1::g1::provA::0 18 * * *::evening"}, now), *harness.executor);

    EXPECT_EQ(scheduler.RunDueTriggers(now + std::chrono::minutes(30)), 0u);
    EXPECT_EQ(harness.provider->Calls(), 0);
    EXPECT_FALSE(scheduler.ListTriggers()[0].last_run.has_value());
}

TEST(SchedulerServiceTest, TriggerDueExactlyNowFires) {
    ExecutorHarness harness;
    const auto parsed_at = LocalTime(2024, 1, 3, 8, 59);
    SchedulerService scheduler(Parse({"p1::g1::provA::0 9 * * *::morning"}, parsed_at), *harness.executor);

    EXPECT_EQ(scheduler.RunDueTriggers(LocalTime(2024, 1, 3, 9, 0)), 1u);
    EXPECT_EQ(scheduler.ListTriggers()[0].next_run, LocalTime(2024, 1, 4, 9, 0));
}

TEST(SchedulerServiceTest, FailingTriggerDoesNotStopTheScan) {
    LogCapture capture;
    ExecutorHarness harness;
    auto broken = std::make_unique<FakeProvider>();
    broken->error = "upstream down";
    auto* broken_ptr = broken.get();
    harness.providers.Register("broken", std::move(broken));

    const auto now = LocalTime(2024, 1, 3, 9, 2);
    SchedulerService scheduler(
        Parse({"p1::g1::broken::*/5 * * * *::first", "p1::g2::provA::*/5 * * * *::second"},
              now - std::chrono::hours(1)),
        *harness.executor);

    EXPECT_EQ(scheduler.RunDueTriggers(now), 2u);
    EXPECT_EQ(broken_ptr->Calls(), 1);
    EXPECT_EQ(harness.provider->Calls(), 1);

    const auto sent = harness.channel->Sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].chat_id, "g2");

    ASSERT_EQ(harness.route->notices.size(), 1u);
    EXPECT_EQ(harness.route->notices[0].message, "Scheduled trigger failed: p1:g1: upstream down");

    for (const auto& state : scheduler.ListTriggers()) {
        EXPECT_GT(state.next_run, now);
        EXPECT_TRUE(state.last_run.has_value());
    }
}

TEST(SchedulerServiceTest, MissingProviderStillAdvancesSchedule) {
    LogCapture capture;
    ExecutorHarness harness;
    const auto now = LocalTime(2024, 1, 3, 9, 2);
    SchedulerService scheduler(Parse({"p1::g1::ghost::*/5 * * * *::hi"}, now - std::chrono::hours(1)),
                               *harness.executor);

    EXPECT_EQ(scheduler.RunDueTriggers(now), 1u);
    EXPECT_GT(scheduler.ListTriggers()[0].next_run, now);
    EXPECT_TRUE(harness.route->notices.empty());
}

TEST(SchedulerServiceTest, StopInterruptsLongSleep) {
    ExecutorHarness harness;
    SchedulerService scheduler({}, *harness.executor, std::chrono::seconds(3600));
    EXPECT_EQ(scheduler.State(), LoopState::Idle);

    scheduler.Start();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_TRUE(scheduler.GetStatus().running);

    const auto started = std::chrono::steady_clock::now();
    scheduler.Stop();
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(elapsed, std::chrono::seconds(2));
    EXPECT_EQ(scheduler.State(), LoopState::Terminated);
    EXPECT_FALSE(scheduler.GetStatus().running);
}

TEST(SchedulerServiceTest, LoopFiresDueTriggersOnItsOwn) {
    ExecutorHarness harness;
    // The yearly slot after `past` has already gone by, the one after it has not.
    const auto past = std::chrono::system_clock::now() - std::chrono::hours(24 * 400);
    SchedulerService scheduler(Parse({"p1::g1::provA::0 0 1 1 *::loop"}, past), *harness.executor,
                               std::chrono::seconds(1));

    scheduler.Start();
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (harness.provider->Calls() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    scheduler.Stop();

    EXPECT_EQ(harness.provider->Calls(), 1);
    EXPECT_EQ(harness.channel->Sent().size(), 1u);
}

TEST(SchedulerServiceTest, NonPositiveIntervalFallsBackToDefault) {
    ExecutorHarness harness;
    SchedulerService scheduler({}, *harness.executor, std::chrono::seconds(0));
    EXPECT_EQ(scheduler.GetStatus().interval, std::chrono::seconds(30));
}

TEST(SchedulerServiceTest, StatusReportsEarliestNextRun) {
    ExecutorHarness harness;
    const auto now = LocalTime(2024, 1, 3, 9, 2);
    SchedulerService scheduler(
        Parse({"p1::g1::provA::0 18 * * *::late", "p1::g2::provA::30 9 * * *::early"}, now),
        *harness.executor);

    const auto status = scheduler.GetStatus();
    EXPECT_EQ(status.triggers, 2u);
    ASSERT_TRUE(status.next_wake_at.has_value());
    EXPECT_EQ(status.next_wake_at.value(), LocalTime(2024, 1, 3, 9, 30));
}

TEST(SchedulerServiceTest, RunAllNowCountsDeliveriesAndKeepsSchedule) {
    LogCapture capture;
    ExecutorHarness harness;
    const auto now = LocalTime(2024, 1, 3, 9, 2);
    SchedulerService scheduler(
        Parse({"p1::g1::provA::0 18 * * *::one", "p1::g2::ghost::0 18 * * *::two"}, now),
        *harness.executor);
    const auto before = scheduler.ListTriggers();

    const auto report = scheduler.RunAllNow();

    EXPECT_EQ(report.total, 2u);
    EXPECT_EQ(report.succeeded, 1u);
    const auto after = scheduler.ListTriggers();
    for (std::size_t i = 0; i < after.size(); ++i) {
        EXPECT_EQ(after[i].next_run, before[i].next_run);
        EXPECT_FALSE(after[i].last_run.has_value());
    }
}

TEST(SchedulerServiceTest, ConcurrentScansFireADueTriggerOnce) {
    ExecutorHarness harness;
    std::promise<void> entered;
    std::promise<void> release;
    auto release_future = release.get_future().share();
    bool first = true;
    harness.provider->on_chat = [&]() {
        if (first) {
            first = false;
            entered.set_value();
            release_future.wait();
        }
    };

    const auto now = LocalTime(2024, 1, 3, 9, 2);
    SchedulerService scheduler(Parse({"p1::g1::provA::*/5 * * * *::once"}, now - std::chrono::hours(1)),
                               *harness.executor);

    std::size_t fired_a = 0;
    std::size_t fired_b = 0;
    std::thread scan_a([&]() { fired_a = scheduler.RunDueTriggers(now); });
    entered.get_future().wait();
    std::thread scan_b([&]() { fired_b = scheduler.RunDueTriggers(now); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    release.set_value();
    scan_a.join();
    scan_b.join();

    EXPECT_EQ(harness.provider->Calls(), 1);
    EXPECT_EQ(fired_a + fired_b, 1u);
    EXPECT_EQ(harness.channel->Sent().size(), 1u);
}

TEST(SchedulerServiceTest, StopAbandonsRestOfScan) {
    LogCapture capture;
    ExecutorHarness harness;
    const auto now = LocalTime(2024, 1, 3, 9, 2);
    SchedulerService scheduler(
        Parse({"p1::g1::provA::*/5 * * * *::first", "p1::g2::provA::*/5 * * * *::second"},
              now - std::chrono::hours(1)),
        *harness.executor);
    const auto before = scheduler.ListTriggers();
    harness.provider->on_chat = [&scheduler]() { scheduler.Stop(); };

    EXPECT_EQ(scheduler.RunDueTriggers(now), 1u);
    EXPECT_EQ(harness.provider->Calls(), 1);

    const auto after = scheduler.ListTriggers();
    ASSERT_EQ(after.size(), 2u);
    EXPECT_GT(after[0].next_run, now);
    EXPECT_TRUE(after[0].last_run.has_value());
    EXPECT_EQ(after[1].next_run, before[1].next_run);
    EXPECT_FALSE(after[1].last_run.has_value());
    EXPECT_TRUE(capture.Contains(llmtrigger::utils::LogLevel::kInfo, "abandoning scan"));
}

TEST(SchedulerServiceTest, StopEndsTestRunAfterTriggerInFlight) {
    LogCapture capture;
    ExecutorHarness harness;
    const auto now = LocalTime(2024, 1, 3, 9, 2);
    SchedulerService scheduler(
        Parse({"p1::g1::provA::0 18 * * *::one", "p1::g2::provA::0 18 * * *::two",
               "p1::g3::provA::0 18 * * *::three"},
              now),
        *harness.executor);
    harness.provider->on_chat = [&scheduler]() { scheduler.Stop(); };

    const auto report = scheduler.RunAllNow();

    EXPECT_EQ(report.total, 3u);
    EXPECT_EQ(report.succeeded, 1u);
    EXPECT_EQ(harness.provider->Calls(), 1);
    EXPECT_EQ(harness.channel->Sent().size(), 1u);
}

TEST(SchedulerServiceTest, FailedScanIsLoggedAndLoopKeepsRunning) {
    std::mutex mutex;
    std::vector<std::string> errors;
    bool thrown = false;
    llmtrigger::utils::SetLogSink([&](const llmtrigger::utils::LogMessage& msg) {
        std::lock_guard<std::mutex> lock(mutex);
        if (!thrown && msg.message.find("running trigger") == 0) {
            thrown = true;
            throw std::runtime_error("log backend unavailable");
        }
        if (msg.level == llmtrigger::utils::LogLevel::kError) {
            errors.push_back(msg.message);
        }
    });

    {
        ExecutorHarness harness;
        const auto past = std::chrono::system_clock::now() - std::chrono::hours(24 * 400);
        SchedulerService scheduler(Parse({"p1::g1::provA::0 0 1 1 *::retry"}, past), *harness.executor,
                                   std::chrono::seconds(1));

        scheduler.Start();
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(6);
        while (harness.provider->Calls() == 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        EXPECT_NE(scheduler.State(), LoopState::Terminated);
        scheduler.Stop();

        EXPECT_EQ(harness.provider->Calls(), 1);
    }
    llmtrigger::utils::SetLogSink({});

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_TRUE(thrown);
    ASSERT_FALSE(errors.empty());
    EXPECT_NE(errors[0].find("scan failed: log backend unavailable"), std::string::npos);
}
