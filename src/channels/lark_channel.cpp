#include "channels/lark_channel.hpp"

#include <nlohmann/json.hpp>

#include "lark/im/v1/im_service.h"
#include "utils/logging.hpp"

namespace llmtrigger::channels {

LarkChannel::LarkChannel(const llmtrigger::config::LarkConfig& config,
                         llmtrigger::bus::MessageBus& bus)
    : ChannelBase("lark", bus, {})
    , config_(config) {
    lark_config_.app_id = config_.app_id;
    lark_config_.app_secret = config_.app_secret;
    lark_config_.domain = config_.domain.empty() ? "https://open.feishu.cn" : config_.domain;
    lark_config_.timeout_ms = config_.timeout_ms;
}

LarkChannel::~LarkChannel() = default;

const char* LarkChannel::ReceiveIdType(llmtrigger::bus::MessageKind kind) {
    return kind == llmtrigger::bus::MessageKind::Group ? "chat_id" : "open_id";
}

void LarkChannel::Start() {
    if (running_) {
        return;
    }
    if (config_.app_id.empty() || config_.app_secret.empty()) {
        utils::LogWarn("lark", "app_id or app_secret is empty; channel disabled");
        return;
    }
    im_service_ = std::make_unique<lark::im::v1::ImService>(lark_config_);
    running_ = true;
}

void LarkChannel::Stop() {
    running_ = false;
    im_service_.reset();
}

void LarkChannel::Send(const llmtrigger::bus::OutboundMessage& msg) {
    if (!im_service_) {
        throw DeliveryError("lark channel is not started");
    }
    if (msg.chat_id.empty()) {
        throw DeliveryError("lark message has no receive id");
    }
    if (msg.content.empty()) {
        return;
    }
    nlohmann::json body;
    body["text"] = msg.content;
    const std::string receive_id_type = ReceiveIdType(msg.kind);
    if (!im_service_->CreateMessage(msg.chat_id, "text", body.dump(), receive_id_type)) {
        throw DeliveryError("lark CreateMessage failed for " + receive_id_type + "=" + msg.chat_id);
    }
}

}  // namespace llmtrigger::channels
