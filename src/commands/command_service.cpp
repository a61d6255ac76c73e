#include "commands/command_service.hpp"

#include <chrono>
#include <sstream>
#include <utility>

#include "channels/channel_base.hpp"
#include "config/config_schema.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace llmtrigger::commands {

std::string ExtractCommand(const std::string& content) {
    const auto trimmed = utils::Trim(content);
    if (trimmed.empty() || trimmed.front() != '/') {
        return {};
    }
    auto command = trimmed.substr(0, trimmed.find_first_of(" \t\n"));
    const auto at = command.find('@');
    if (at != std::string::npos) {
        command.erase(at);
    }
    return command;
}

CommandService::CommandService(llmtrigger::bus::MessageBus& bus,
                               llmtrigger::cron::SchedulerService& scheduler,
                               std::string admin_user_id)
    : bus_(bus)
    , scheduler_(scheduler)
    , admin_user_id_(std::move(admin_user_id)) {}

void CommandService::Run() {
    while (!stop_requested_) {
        llmtrigger::bus::InboundMessage msg{};
        if (!bus_.TryConsumeInbound(msg, std::chrono::milliseconds(1000))) {
            continue;
        }
        try {
            Handle(msg);
        } catch (const std::exception& ex) {
            utils::LogError("command", std::string("command failed: ") + ex.what());
        }
    }
}

void CommandService::Stop() {
    stop_requested_ = true;
}

bool CommandService::Handle(const llmtrigger::bus::InboundMessage& msg) {
    const auto command = ExtractCommand(msg.content);
    if (command == kStatusCommand) {
        Reply(msg, FormatStatus());
        return true;
    }
    if (command == kTestCommand) {
        // The log-only sentinel names no real user, so nobody may match it.
        if (admin_user_id_ == llmtrigger::config::kLogOnlyAdmin ||
            !llmtrigger::channels::SenderMatches(msg.sender_id, admin_user_id_)) {
            utils::LogWarn("command", "rejected trigger test from " + msg.sender_id);
            Reply(msg, "Only the administrator can run trigger tests");
            return true;
        }
        Reply(msg, "Testing all triggers...");
        const auto report = scheduler_.RunAllNow();
        Reply(msg, "Trigger test finished\nSucceeded: " + std::to_string(report.succeeded) + "/" +
                       std::to_string(report.total));
        return true;
    }
    return false;
}

std::string CommandService::FormatStatus() const {
    const auto status = scheduler_.GetStatus();
    const auto triggers = scheduler_.ListTriggers();

    std::ostringstream out;
    out << "LLM trigger status\n\n";
    out << "Configured triggers: " << triggers.size() << "\n";
    out << "Check interval: " << status.interval.count() << " s\n\n";
    out << "Triggers:\n";
    if (triggers.empty()) {
        out << "No triggers configured";
        return out.str();
    }
    for (std::size_t i = 0; i < triggers.size(); ++i) {
        const auto& state = triggers[i];
        if (i > 0) {
            out << "\n";
        }
        out << "- " << state.definition.Target() << " (" << state.definition.cron_expression << ") -> ";
        if (state.next_run == std::chrono::system_clock::time_point::max()) {
            out << "never";
        } else {
            out << utils::FormatLocalTime(state.next_run);
        }
    }
    return out.str();
}

void CommandService::Reply(const llmtrigger::bus::InboundMessage& msg, const std::string& content) {
    llmtrigger::bus::OutboundMessage outbound{};
    outbound.channel = msg.channel;
    outbound.kind = msg.kind;
    outbound.chat_id = msg.chat_id;
    outbound.content = content;
    bus_.PublishOutbound(outbound);
}

}  // namespace llmtrigger::commands
