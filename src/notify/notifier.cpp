#include "notify/notifier.hpp"

#include <utility>

#include "channels/channel_manager.hpp"
#include "utils/logging.hpp"

namespace llmtrigger::notify {

LogRoute::LogRoute(std::string admin_user_id)
    : admin_user_id_(std::move(admin_user_id)) {}

void LogRoute::Deliver(const std::string& message, NotificationLevel level) {
    const auto severity = level == NotificationLevel::Error ? utils::LogLevel::kWarn : utils::LogLevel::kInfo;
    if (admin_user_id_.empty()) {
        utils::Log(severity, "notify", message);
        return;
    }
    utils::Log(severity, "notify", "to admin " + admin_user_id_ + ": " + message);
}

AdminChannelRoute::AdminChannelRoute(llmtrigger::channels::ChannelManager& channels,
                                     std::string channel,
                                     std::string admin_user_id)
    : channels_(channels)
    , channel_(std::move(channel))
    , admin_user_id_(std::move(admin_user_id)) {}

void AdminChannelRoute::Deliver(const std::string& message, NotificationLevel level) {
    llmtrigger::bus::OutboundMessage outbound{};
    outbound.channel = channel_;
    outbound.kind = llmtrigger::bus::MessageKind::Private;
    outbound.chat_id = admin_user_id_;
    outbound.content = message;
    outbound.metadata["notification"] = ToString(level);
    channels_.Deliver(outbound);
}

std::unique_ptr<NotificationRoute> CreateNotificationRoute(
    const llmtrigger::config::NotificationConfig& config,
    llmtrigger::channels::ChannelManager& channels) {
    if (config.admin_user_id == llmtrigger::config::kLogOnlyAdmin) {
        return std::make_unique<LogRoute>();
    }
    if (config.admin_channel.empty()) {
        return std::make_unique<LogRoute>(config.admin_user_id);
    }
    return std::make_unique<AdminChannelRoute>(channels, config.admin_channel, config.admin_user_id);
}

Notifier::Notifier(llmtrigger::config::NotificationConfig config, std::unique_ptr<NotificationRoute> route)
    : config_(std::move(config))
    , route_(std::move(route)) {}

void Notifier::NotifySuccess(const llmtrigger::cron::TriggerDefinition& trigger) {
    if (!config_.on_success) {
        return;
    }
    Send("Scheduled trigger succeeded: " + trigger.Target(), NotificationLevel::Success);
}

void Notifier::NotifyFailure(const llmtrigger::cron::TriggerDefinition& trigger, const std::string& error) {
    if (!config_.on_failure) {
        return;
    }
    Send("Scheduled trigger failed: " + trigger.Target() + ": " + error, NotificationLevel::Error);
}

void Notifier::Send(const std::string& message, NotificationLevel level) {
    if (!route_) {
        utils::LogInfo("notify", message);
        return;
    }
    try {
        route_->Deliver(message, level);
    } catch (const std::exception& ex) {
        utils::LogError("notify", std::string("failed to send notification: ") + ex.what());
    }
}

}  // namespace llmtrigger::notify
