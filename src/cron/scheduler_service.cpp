#include "cron/scheduler_service.hpp"

#include <utility>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace llmtrigger::cron {

const char* ToString(LoopState state) {
    switch (state) {
        case LoopState::Idle:
            return "idle";
        case LoopState::Sleeping:
            return "sleeping";
        case LoopState::Scanning:
            return "scanning";
        case LoopState::Terminated:
            return "terminated";
    }
    return "idle";
}

SchedulerService::SchedulerService(std::vector<TriggerState> triggers,
                                   TriggerExecutor& executor,
                                   std::chrono::seconds interval)
    : executor_(executor)
    , interval_(interval.count() > 0 ? interval : std::chrono::seconds(30))
    , triggers_(std::move(triggers)) {}

SchedulerService::~SchedulerService() {
    Stop();
}

void SchedulerService::Start() {
    if (running_.exchange(true)) {
        return;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    stop_requested_ = false;
    state_ = LoopState::Idle;
    worker_ = std::thread([this]() { RunLoop(); });
    utils::LogInfo("scheduler", "started with " + std::to_string(ListTriggers().size()) +
                                    " trigger(s), interval " + std::to_string(interval_.count()) + "s");
}

void SchedulerService::Stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        stop_requested_ = true;
    }
    wake_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    if (running_.exchange(false)) {
        utils::LogInfo("scheduler", "stopped");
    }
}

bool SchedulerService::SleepUntilNextCycle() {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    if (stop_requested_) {
        return false;
    }
    state_ = LoopState::Sleeping;
    wake_cv_.wait_for(lock, interval_, [this] { return stop_requested_.load(); });
    return !stop_requested_;
}

void SchedulerService::RunLoop() {
    while (SleepUntilNextCycle()) {
        state_ = LoopState::Scanning;
        try {
            RunDueTriggers();
        } catch (const std::exception& ex) {
            utils::LogError("scheduler", std::string("scan failed: ") + ex.what());
        }
    }
    state_ = LoopState::Terminated;
}

std::size_t SchedulerService::RunDueTriggers() {
    return RunDueTriggers(utils::Now());
}

std::size_t SchedulerService::RunDueTriggers(Clock::time_point now) {
    std::lock_guard<std::mutex> scan_lock(scan_mutex_);
    std::size_t fired = 0;
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(triggers_mutex_);
        count = triggers_.size();
    }

    for (std::size_t i = 0; i < count; ++i) {
        if (stop_requested_) {
            utils::LogInfo("scheduler", "stop requested, abandoning scan");
            break;
        }

        TriggerDefinition definition;
        {
            std::lock_guard<std::mutex> lock(triggers_mutex_);
            if (triggers_[i].next_run > now) {
                continue;
            }
            definition = triggers_[i].definition;
        }

        utils::LogInfo("scheduler", "running trigger " + definition.Target() + " (" +
                                        definition.cron_expression + ")");
        try {
            const auto result = executor_.Execute(definition);
            utils::LogDebug("scheduler", "trigger " + definition.Target() + " finished: " +
                                             ToString(result.status));
        } catch (const std::exception& ex) {
            utils::LogError("scheduler", "trigger " + definition.Target() + " raised: " + ex.what());
        }
        ++fired;

        std::lock_guard<std::mutex> lock(triggers_mutex_);
        auto& state = triggers_[i];
        state.last_run = now;
        try {
            state.next_run = state.schedule.Next(now);
            utils::LogInfo("scheduler", "next run of " + definition.Target() + " at " +
                                            utils::FormatLocalTime(state.next_run));
        } catch (const ScheduleError& ex) {
            state.next_run = Clock::time_point::max();
            utils::LogError("scheduler", "disabling trigger " + definition.Target() + ": " + ex.what());
        }
    }
    return fired;
}

SchedulerService::TestReport SchedulerService::RunAllNow() {
    std::vector<TriggerDefinition> definitions;
    {
        std::lock_guard<std::mutex> lock(triggers_mutex_);
        definitions.reserve(triggers_.size());
        for (const auto& state : triggers_) {
            definitions.push_back(state.definition);
        }
    }

    TestReport report{};
    report.total = definitions.size();
    for (const auto& definition : definitions) {
        if (stop_requested_) {
            utils::LogInfo("scheduler", "stop requested, abandoning test run");
            break;
        }
        const auto result = executor_.Execute(definition);
        if (result.Succeeded()) {
            ++report.succeeded;
        } else {
            utils::LogWarn("scheduler", "test run of " + definition.Target() + " ended with " +
                                            ToString(result.status) +
                                            (result.error.empty() ? "" : ": " + result.error));
        }
    }
    return report;
}

std::vector<TriggerState> SchedulerService::ListTriggers() const {
    std::lock_guard<std::mutex> lock(triggers_mutex_);
    return triggers_;
}

SchedulerService::Status SchedulerService::GetStatus() const {
    Status status{};
    status.running = running_;
    status.state = state_;
    status.interval = interval_;
    std::lock_guard<std::mutex> lock(triggers_mutex_);
    status.triggers = triggers_.size();
    for (const auto& state : triggers_) {
        if (!status.next_wake_at.has_value() || state.next_run < status.next_wake_at.value()) {
            status.next_wake_at = state.next_run;
        }
    }
    return status;
}

}  // namespace llmtrigger::cron
