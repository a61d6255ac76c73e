#include "cron/trigger_parser.hpp"

#include <utility>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace llmtrigger::cron {
namespace {

constexpr const char* kSeparator = "::";
constexpr std::size_t kMinSegments = 5;

const char* CategoryLabel(TriggerCategory category) {
    return category == TriggerCategory::Room ? "group" : "private";
}

}  // namespace

TriggerState ParseTrigger(const std::string& raw,
                          TriggerCategory category,
                          std::chrono::system_clock::time_point now) {
    auto parts = utils::Split(raw, kSeparator);
    if (parts.size() < kMinSegments) {
        throw FormatError("expected channel::destination::provider::cron::prompt, got " +
                          std::to_string(parts.size()) + " segment(s)");
    }

    TriggerDefinition definition{};
    definition.category = category;
    definition.channel = parts[0];
    definition.destination_id = parts[1];
    definition.provider_name = parts[2];
    definition.cron_expression = parts[3];
    definition.prompt = utils::Join(
        std::vector<std::string>(parts.begin() + 4, parts.end()), kSeparator);

    CronExpression schedule = [&]() {
        try {
            return CronExpression::Parse(definition.cron_expression);
        } catch (const ParseError& ex) {
            throw ScheduleError(ex.what());
        }
    }();
    const auto next_run = schedule.Next(now);

    return TriggerState{std::move(definition), std::move(schedule), next_run, std::nullopt};
}

ParseReport ParseTriggers(const std::vector<std::string>& raw_entries,
                          TriggerCategory category,
                          std::chrono::system_clock::time_point now) {
    ParseReport report{};
    for (const auto& raw : raw_entries) {
        try {
            auto state = ParseTrigger(raw, category, now);
            utils::LogInfo("parser", std::string("added ") + CategoryLabel(category) + " trigger " +
                                         state.definition.Target() + ", cron: " +
                                         state.definition.cron_expression + ", next run: " +
                                         utils::FormatLocalTime(state.next_run));
            report.triggers.push_back(std::move(state));
        } catch (const FormatError& ex) {
            utils::LogWarn("parser", std::string("malformed ") + CategoryLabel(category) +
                                         " trigger '" + raw + "': " + ex.what());
            report.rejected.push_back(RejectedEntry{raw, category, RejectReason::Format, ex.what()});
        } catch (const ScheduleError& ex) {
            utils::LogError("parser", std::string("invalid cron in ") + CategoryLabel(category) +
                                          " trigger '" + raw + "': " + ex.what());
            report.rejected.push_back(RejectedEntry{raw, category, RejectReason::Schedule, ex.what()});
        }
    }
    return report;
}

ParseReport LoadTriggers(const llmtrigger::config::Config& config,
                         std::chrono::system_clock::time_point now) {
    auto report = ParseTriggers(config.scheduler.group_triggers, TriggerCategory::Room, now);
    auto direct = ParseTriggers(config.scheduler.friend_triggers, TriggerCategory::Direct, now);
    for (auto& state : direct.triggers) {
        report.triggers.push_back(std::move(state));
    }
    for (auto& entry : direct.rejected) {
        report.rejected.push_back(std::move(entry));
    }
    utils::LogInfo("parser", "loaded " + std::to_string(report.triggers.size()) + " trigger(s), rejected " +
                                 std::to_string(report.rejected.size()));
    return report;
}

}  // namespace llmtrigger::cron
