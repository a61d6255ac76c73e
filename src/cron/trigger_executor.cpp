#include "cron/trigger_executor.hpp"

#include <utility>

#include "channels/channel_manager.hpp"
#include "notify/notifier.hpp"
#include "providers/llm_provider.hpp"
#include "utils/logging.hpp"

namespace llmtrigger::cron {

const char* ToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::Delivered:
            return "delivered";
        case ExecutionStatus::EmptyResult:
            return "empty_result";
        case ExecutionStatus::ProviderNotFound:
            return "provider_not_found";
        case ExecutionStatus::Failed:
            return "failed";
    }
    return "failed";
}

llmtrigger::bus::MessageKind ToMessageKind(TriggerCategory category) {
    return category == TriggerCategory::Room
        ? llmtrigger::bus::MessageKind::Group
        : llmtrigger::bus::MessageKind::Private;
}

TriggerExecutor::TriggerExecutor(llmtrigger::providers::ProviderRegistry& providers,
                                 llmtrigger::channels::ChannelManager& channels,
                                 llmtrigger::notify::Notifier& notifier,
                                 llmtrigger::config::GenerationConfig generation)
    : providers_(providers)
    , channels_(channels)
    , notifier_(notifier)
    , generation_(std::move(generation)) {}

ExecutionResult TriggerExecutor::Execute(const TriggerDefinition& trigger) {
    llmtrigger::bus::OutboundMessage outbound{};
    outbound.channel = trigger.channel;
    outbound.kind = ToMessageKind(trigger.category);
    outbound.chat_id = trigger.destination_id;

    try {
        auto* provider = providers_.Get(trigger.provider_name);
        if (!provider) {
            utils::LogWarn("executor", "provider '" + trigger.provider_name + "' not found, skipping " +
                                           outbound.Address());
            return ExecutionResult{ExecutionStatus::ProviderNotFound, {}};
        }

        const auto response = provider->TextChat(
            trigger.prompt,
            {},
            generation_.system_prompt,
            generation_.max_tokens,
            generation_.temperature);

        if (!response.HasContent()) {
            utils::LogWarn("executor", "provider '" + trigger.provider_name + "' returned no content for " +
                                           outbound.Address());
            return ExecutionResult{ExecutionStatus::EmptyResult, {}};
        }

        outbound.content = response.content;
        channels_.Deliver(outbound);
        utils::LogInfo("executor", "delivered response to " + outbound.Address());
    } catch (const std::exception& ex) {
        utils::LogError("executor", "trigger " + outbound.Address() + " failed: " + ex.what());
        notifier_.NotifyFailure(trigger, ex.what());
        return ExecutionResult{ExecutionStatus::Failed, ex.what()};
    }

    notifier_.NotifySuccess(trigger);
    return ExecutionResult{ExecutionStatus::Delivered, {}};
}

}  // namespace llmtrigger::cron
