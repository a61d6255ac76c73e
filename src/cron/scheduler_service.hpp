#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "cron/cron_types.hpp"
#include "cron/trigger_executor.hpp"

namespace llmtrigger::cron {

enum class LoopState {
    Idle,
    Sleeping,
    Scanning,
    Terminated
};

const char* ToString(LoopState state);

// Polls the trigger list every `interval` and fires due triggers on a single
// worker thread. Scans are serialized, so a direct RunDueTriggers call never
// overlaps the worker's scan.
class SchedulerService {
public:
    using Clock = std::chrono::system_clock;

    struct Status {
        bool running = false;
        LoopState state = LoopState::Idle;
        std::size_t triggers = 0;
        std::chrono::seconds interval{0};
        std::optional<Clock::time_point> next_wake_at;
    };

    struct TestReport {
        std::size_t succeeded = 0;
        std::size_t total = 0;
    };

    SchedulerService(std::vector<TriggerState> triggers,
                     TriggerExecutor& executor,
                     std::chrono::seconds interval = std::chrono::seconds(30));
    ~SchedulerService();

    SchedulerService(const SchedulerService&) = delete;
    SchedulerService& operator=(const SchedulerService&) = delete;

    void Start();
    // Cancels the sleeping loop and waits for the worker to exit.
    void Stop();

    // One scan. Each due trigger is executed once, then last_run = now and
    // next_run = Next(now). Returns the number of triggers fired.
    std::size_t RunDueTriggers();
    std::size_t RunDueTriggers(Clock::time_point now);

    // Executes every trigger once without touching its schedule. A stop
    // request ends the run after the trigger in flight.
    TestReport RunAllNow();

    std::vector<TriggerState> ListTriggers() const;
    Status GetStatus() const;
    LoopState State() const { return state_.load(); }

private:
    void RunLoop();
    // False once a stop was requested.
    bool SleepUntilNextCycle();

    TriggerExecutor& executor_;
    std::chrono::seconds interval_;

    std::mutex scan_mutex_;
    mutable std::mutex triggers_mutex_;
    std::vector<TriggerState> triggers_;

    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> running_{false};
    std::atomic<LoopState> state_{LoopState::Idle};
    std::thread worker_;
};

}  // namespace llmtrigger::cron
