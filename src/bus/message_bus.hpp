#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>

#include "bus/events.hpp"

namespace llmtrigger::bus {

// Inbound: channels -> command service. Outbound: command replies -> channels.
class MessageBus {
public:
    void PublishInbound(const InboundMessage& msg);
    bool TryConsumeInbound(InboundMessage& msg, std::chrono::milliseconds timeout);
    void PublishOutbound(const OutboundMessage& msg);
    bool TryConsumeOutbound(OutboundMessage& msg, std::chrono::milliseconds timeout);

private:
    std::queue<InboundMessage> inbound_;
    std::queue<OutboundMessage> outbound_;
    mutable std::mutex mutex_;
    std::condition_variable inbound_cv_;
    std::condition_variable outbound_cv_;
};

}  // namespace llmtrigger::bus
