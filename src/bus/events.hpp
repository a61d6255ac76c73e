#pragma once

#include <chrono>
#include <string>
#include <unordered_map>

namespace llmtrigger::bus {

enum class MessageKind {
    Group,
    Private
};

inline const char* ToString(MessageKind kind) {
    switch (kind) {
        case MessageKind::Group:
            return "group_message";
        case MessageKind::Private:
            return "private_message";
    }
    return "group_message";
}

struct InboundMessage {
    std::string channel;
    std::string sender_id;
    std::string chat_id;
    MessageKind kind = MessageKind::Private;
    std::string content;
    std::unordered_map<std::string, std::string> metadata;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

struct OutboundMessage {
    std::string channel;
    MessageKind kind = MessageKind::Private;
    std::string chat_id;
    std::string content;
    std::unordered_map<std::string, std::string> metadata;

    // Composite destination, e.g. "telegram:group_message:-100123".
    std::string Address() const {
        return channel + ":" + ToString(kind) + ":" + chat_id;
    }
};

}  // namespace llmtrigger::bus
