#pragma once

#include <memory>
#include <string>

#include "channels/channel_base.hpp"
#include "config/config_schema.hpp"
#include "lark/core/config.h"

namespace lark::im::v1 {
class ImService;
}  // namespace lark::im::v1

namespace llmtrigger::channels {

// Send-only Lark/Feishu channel. Group messages go to a chat_id, private
// messages to a user's open_id.
class LarkChannel : public ChannelBase {
public:
    LarkChannel(const llmtrigger::config::LarkConfig& config,
                llmtrigger::bus::MessageBus& bus);
    ~LarkChannel() override;

    void Start() override;
    void Stop() override;
    void Send(const llmtrigger::bus::OutboundMessage& msg) override;

    static const char* ReceiveIdType(llmtrigger::bus::MessageKind kind);

private:
    llmtrigger::config::LarkConfig config_;
    lark::core::Config lark_config_;
    std::unique_ptr<lark::im::v1::ImService> im_service_;
};

}  // namespace llmtrigger::channels
