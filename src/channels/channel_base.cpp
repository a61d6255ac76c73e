#include "channels/channel_base.hpp"

#include <algorithm>
#include <sstream>

#include "utils/logging.hpp"

namespace llmtrigger::channels {

bool SenderMatches(const std::string& sender_id, const std::string& expected) {
    if (expected.empty()) {
        return false;
    }
    if (sender_id == expected) {
        return true;
    }
    if (sender_id.find('|') == std::string::npos) {
        return false;
    }
    std::stringstream ss(sender_id);
    std::string part;
    while (std::getline(ss, part, '|')) {
        if (part == expected) {
            return true;
        }
    }
    return false;
}

ChannelBase::ChannelBase(std::string name,
                         llmtrigger::bus::MessageBus& bus,
                         std::vector<std::string> allow_from)
    : name_(std::move(name))
    , bus_(bus)
    , allow_from_(std::move(allow_from)) {}

bool ChannelBase::IsAllowed(const std::string& sender_id) const {
    if (allow_from_.empty()) {
        return true;
    }
    return std::any_of(allow_from_.begin(), allow_from_.end(), [&](const std::string& allowed) {
        return SenderMatches(sender_id, allowed);
    });
}

void ChannelBase::HandleMessage(
    const std::string& sender_id,
    const std::string& chat_id,
    llmtrigger::bus::MessageKind kind,
    const std::string& content,
    const std::unordered_map<std::string, std::string>& metadata) {
    if (!IsAllowed(sender_id)) {
        utils::LogWarn(name_, "message blocked by allow_from: " + sender_id);
        return;
    }
    llmtrigger::bus::InboundMessage msg{};
    msg.channel = name_;
    msg.sender_id = sender_id;
    msg.chat_id = chat_id;
    msg.kind = kind;
    msg.content = content;
    msg.metadata = metadata;
    bus_.PublishInbound(msg);
}

}  // namespace llmtrigger::channels
