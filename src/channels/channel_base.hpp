#pragma once

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "bus/events.hpp"
#include "bus/message_bus.hpp"

namespace llmtrigger::channels {

class DeliveryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ChannelBase {
public:
    ChannelBase(std::string name,
                llmtrigger::bus::MessageBus& bus,
                std::vector<std::string> allow_from);
    virtual ~ChannelBase() = default;
    virtual std::string Name() const { return name_; }
    virtual void Start() = 0;
    virtual void Stop() = 0;
    // Throws DeliveryError when the platform rejects the message.
    virtual void Send(const llmtrigger::bus::OutboundMessage& msg) = 0;

    bool IsAllowed(const std::string& sender_id) const;
    void HandleMessage(
        const std::string& sender_id,
        const std::string& chat_id,
        llmtrigger::bus::MessageKind kind,
        const std::string& content,
        const std::unordered_map<std::string, std::string>& metadata);

    bool IsRunning() const { return running_; }

protected:
    std::string name_;
    llmtrigger::bus::MessageBus& bus_;
    std::vector<std::string> allow_from_;
    bool running_ = false;
};

// Sender ids may carry aliases joined by '|', e.g. "12345|alice".
bool SenderMatches(const std::string& sender_id, const std::string& expected);

}  // namespace llmtrigger::channels
