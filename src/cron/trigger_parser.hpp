#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "cron/cron_types.hpp"

namespace llmtrigger::cron {

class FormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class RejectReason {
    Format,
    Schedule
};

struct RejectedEntry {
    std::string raw;
    TriggerCategory category = TriggerCategory::Room;
    RejectReason reason = RejectReason::Format;
    std::string message;
};

struct ParseReport {
    std::vector<TriggerState> triggers;
    std::vector<RejectedEntry> rejected;
};

// Parses `channel::destination_id::provider_name::cron_expr::prompt`.
// Everything after the fourth separator belongs to the prompt.
// Throws FormatError or ScheduleError.
TriggerState ParseTrigger(const std::string& raw,
                          TriggerCategory category,
                          std::chrono::system_clock::time_point now);

// Parses every entry independently; bad entries are logged and reported,
// never fatal to the batch. Initial next_run is computed from `now`.
ParseReport ParseTriggers(const std::vector<std::string>& raw_entries,
                          TriggerCategory category,
                          std::chrono::system_clock::time_point now);

// Room entries first, then Direct entries.
ParseReport LoadTriggers(const llmtrigger::config::Config& config,
                         std::chrono::system_clock::time_point now);

}  // namespace llmtrigger::cron
