#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "channels/channel_base.hpp"
#include "config/config_schema.hpp"

namespace llmtrigger::channels {

class ChannelManager {
public:
    ChannelManager(const llmtrigger::config::Config& config, llmtrigger::bus::MessageBus& bus);
    ~ChannelManager();

    void Register(std::unique_ptr<ChannelBase> channel);
    ChannelBase* GetChannel(const std::string& name);

    // Synchronous delivery. Throws DeliveryError for an unknown channel or
    // when the channel fails to send.
    void Deliver(const llmtrigger::bus::OutboundMessage& msg);

    void StartAll();
    void StopAll();

    std::unordered_map<std::string, bool> Status() const;

private:
    void InitChannels();
    void RegisterTelegram(const llmtrigger::config::TelegramConfig& config);
    void RegisterLark(const llmtrigger::config::LarkConfig& config);
    void RunOutboundDispatcher();

    llmtrigger::bus::MessageBus& bus_;
    llmtrigger::config::Config config_;
    std::atomic<bool> dispatch_running_{false};
    std::thread dispatch_thread_;
    // Serializes Send calls from the scheduler, command and dispatcher threads.
    std::mutex send_mutex_;

private:
    std::unordered_map<std::string, std::unique_ptr<ChannelBase>> channels_;
};

}  // namespace llmtrigger::channels
