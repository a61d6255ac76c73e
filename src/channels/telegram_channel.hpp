#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include <tgbot/tgbot.h>

#include "channels/channel_base.hpp"
#include "config/config_schema.hpp"

namespace llmtrigger::channels {

// Telegram chat ids address groups and users alike, so both message kinds
// are sent with sendMessage. Incoming text is forwarded to the bus for the
// command service.
class TelegramChannel : public ChannelBase {
public:
    TelegramChannel(const llmtrigger::config::TelegramConfig& config,
                    llmtrigger::bus::MessageBus& bus);
    void Start() override;
    void Stop() override;
    void Send(const llmtrigger::bus::OutboundMessage& msg) override;

    static std::string ConvertMarkdownToHtml(const std::string& text);

private:
    llmtrigger::config::TelegramConfig config_;
    std::unique_ptr<TgBot::HttpClient> http_client_;
    std::unique_ptr<TgBot::Bot> bot_;
    std::unique_ptr<TgBot::TgLongPoll> long_poll_;
    std::unique_ptr<std::thread> polling_thread_;
    std::atomic<bool> polling_{false};
};

}  // namespace llmtrigger::channels
