#include "channels/channel_manager.hpp"

#include "channels/telegram_channel.hpp"
#include "utils/logging.hpp"

#ifdef LLMTRIGGER_HAVE_LARK
#include "channels/lark_channel.hpp"
#endif

namespace llmtrigger::channels {

ChannelManager::ChannelManager(const llmtrigger::config::Config& config,
                               llmtrigger::bus::MessageBus& bus)
    : bus_(bus)
    , config_(config) {
    InitChannels();
}

ChannelManager::~ChannelManager() {
    StopAll();
}

void ChannelManager::InitChannels() {
    RegisterTelegram(config_.channels.telegram);
    RegisterLark(config_.channels.lark);
}

void ChannelManager::Register(std::unique_ptr<ChannelBase> channel) {
    auto name = channel->Name();
    channels_[std::move(name)] = std::move(channel);
}

ChannelBase* ChannelManager::GetChannel(const std::string& name) {
    auto it = channels_.find(name);
    if (it == channels_.end()) {
        return nullptr;
    }
    return it->second.get();
}

void ChannelManager::Deliver(const llmtrigger::bus::OutboundMessage& msg) {
    auto channel = GetChannel(msg.channel);
    if (!channel) {
        throw DeliveryError("channel '" + msg.channel + "' is not configured");
    }
    std::lock_guard<std::mutex> lock(send_mutex_);
    try {
        channel->Send(msg);
    } catch (const DeliveryError&) {
        throw;
    } catch (const std::exception& ex) {
        throw DeliveryError("send to " + msg.Address() + " failed: " + ex.what());
    }
}

void ChannelManager::StartAll() {
    for (auto& [_, channel] : channels_) {
        channel->Start();
    }
    if (!dispatch_running_.exchange(true)) {
        dispatch_thread_ = std::thread([this] { RunOutboundDispatcher(); });
    }
}

void ChannelManager::StopAll() {
    dispatch_running_ = false;
    if (dispatch_thread_.joinable()) {
        dispatch_thread_.join();
    }
    for (auto& [_, channel] : channels_) {
        if (channel->IsRunning()) {
            channel->Stop();
        }
    }
}

std::unordered_map<std::string, bool> ChannelManager::Status() const {
    std::unordered_map<std::string, bool> status;
    for (const auto& [name, channel] : channels_) {
        status[name] = channel->IsRunning();
    }
    return status;
}

void ChannelManager::RegisterTelegram(const llmtrigger::config::TelegramConfig& config) {
    if (!config.enabled) {
        return;
    }
    Register(std::make_unique<TelegramChannel>(config, bus_));
}

void ChannelManager::RegisterLark(const llmtrigger::config::LarkConfig& config) {
    if (!config.enabled) {
        return;
    }
#ifdef LLMTRIGGER_HAVE_LARK
    Register(std::make_unique<LarkChannel>(config, bus_));
#else
    utils::LogWarn("channels", "lark is enabled but this build has no lark support");
#endif
}

void ChannelManager::RunOutboundDispatcher() {
    while (dispatch_running_) {
        llmtrigger::bus::OutboundMessage msg{};
        if (!bus_.TryConsumeOutbound(msg, std::chrono::milliseconds(1000))) {
            continue;
        }
        try {
            Deliver(msg);
        } catch (const DeliveryError& ex) {
            utils::LogError("channels", ex.what());
        }
    }
}

}  // namespace llmtrigger::channels
