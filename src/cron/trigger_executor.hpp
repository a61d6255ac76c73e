#pragma once

#include <string>

#include "bus/events.hpp"
#include "config/config_schema.hpp"
#include "cron/cron_types.hpp"

namespace llmtrigger::channels {
class ChannelManager;
}  // namespace llmtrigger::channels

namespace llmtrigger::notify {
class Notifier;
}  // namespace llmtrigger::notify

namespace llmtrigger::providers {
class ProviderRegistry;
}  // namespace llmtrigger::providers

namespace llmtrigger::cron {

enum class ExecutionStatus {
    Delivered,
    EmptyResult,
    ProviderNotFound,
    Failed
};

const char* ToString(ExecutionStatus status);

struct ExecutionResult {
    ExecutionStatus status = ExecutionStatus::Failed;
    std::string error;

    bool Succeeded() const { return status == ExecutionStatus::Delivered; }
};

llmtrigger::bus::MessageKind ToMessageKind(TriggerCategory category);

// Runs one trigger: resolve provider, generate, deliver, notify.
// Never throws; every outcome is reported through ExecutionResult.
class TriggerExecutor {
public:
    TriggerExecutor(llmtrigger::providers::ProviderRegistry& providers,
                    llmtrigger::channels::ChannelManager& channels,
                    llmtrigger::notify::Notifier& notifier,
                    llmtrigger::config::GenerationConfig generation);

    ExecutionResult Execute(const TriggerDefinition& trigger);

private:
    llmtrigger::providers::ProviderRegistry& providers_;
    llmtrigger::channels::ChannelManager& channels_;
    llmtrigger::notify::Notifier& notifier_;
    llmtrigger::config::GenerationConfig generation_;
};

}  // namespace llmtrigger::cron
