#pragma once

#include <atomic>
#include <string>

#include "bus/message_bus.hpp"
#include "cron/scheduler_service.hpp"

namespace llmtrigger::commands {

inline constexpr const char* kStatusCommand = "/llm_trigger";
inline constexpr const char* kTestCommand = "/llm_trigger_test";

// Answers chat commands arriving on the bus. Replies are published as
// outbound messages to the chat the command came from.
class CommandService {
public:
    CommandService(llmtrigger::bus::MessageBus& bus,
                   llmtrigger::cron::SchedulerService& scheduler,
                   std::string admin_user_id);

    // Consumes inbound messages until Stop() is called.
    void Run();
    void Stop();

    // Handles one inbound message; returns false when it is not a command.
    bool Handle(const llmtrigger::bus::InboundMessage& msg);

    std::string FormatStatus() const;

private:
    void Reply(const llmtrigger::bus::InboundMessage& msg, const std::string& content);

    llmtrigger::bus::MessageBus& bus_;
    llmtrigger::cron::SchedulerService& scheduler_;
    std::string admin_user_id_;
    std::atomic<bool> stop_requested_{false};
};

// "/llm_trigger@my_bot args" -> "/llm_trigger"
std::string ExtractCommand(const std::string& content);

}  // namespace llmtrigger::commands
