#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "cron/cron_expression.hpp"

namespace llmtrigger::cron {

enum class TriggerCategory {
    Room,
    Direct
};

inline const char* ToString(TriggerCategory category) {
    switch (category) {
        case TriggerCategory::Room:
            return "room";
        case TriggerCategory::Direct:
            return "direct";
    }
    return "room";
}

struct TriggerDefinition {
    TriggerCategory category = TriggerCategory::Room;
    std::string channel;
    std::string destination_id;
    std::string provider_name;
    std::string cron_expression;
    std::string prompt;

    std::string Target() const {
        return channel + ":" + destination_id;
    }
};

struct TriggerState {
    TriggerDefinition definition;
    CronExpression schedule;
    std::chrono::system_clock::time_point next_run;
    std::optional<std::chrono::system_clock::time_point> last_run;
};

}  // namespace llmtrigger::cron
