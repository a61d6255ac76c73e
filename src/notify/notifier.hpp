#pragma once

#include <memory>
#include <string>

#include "config/config_schema.hpp"
#include "cron/cron_types.hpp"

namespace llmtrigger::channels {
class ChannelManager;
}  // namespace llmtrigger::channels

namespace llmtrigger::notify {

enum class NotificationLevel {
    Success,
    Error
};

inline const char* ToString(NotificationLevel level) {
    return level == NotificationLevel::Success ? "success" : "error";
}

class NotificationRoute {
public:
    virtual ~NotificationRoute() = default;
    virtual void Deliver(const std::string& message, NotificationLevel level) = 0;
};

// Writes notices to the log only.
class LogRoute : public NotificationRoute {
public:
    explicit LogRoute(std::string admin_user_id = {});
    void Deliver(const std::string& message, NotificationLevel level) override;

private:
    std::string admin_user_id_;
};

// Sends notices as private messages to the admin on one channel.
class AdminChannelRoute : public NotificationRoute {
public:
    AdminChannelRoute(llmtrigger::channels::ChannelManager& channels,
                      std::string channel,
                      std::string admin_user_id);
    void Deliver(const std::string& message, NotificationLevel level) override;

private:
    llmtrigger::channels::ChannelManager& channels_;
    std::string channel_;
    std::string admin_user_id_;
};

std::unique_ptr<NotificationRoute> CreateNotificationRoute(
    const llmtrigger::config::NotificationConfig& config,
    llmtrigger::channels::ChannelManager& channels);

class Notifier {
public:
    Notifier(llmtrigger::config::NotificationConfig config, std::unique_ptr<NotificationRoute> route);

    void NotifySuccess(const llmtrigger::cron::TriggerDefinition& trigger);
    void NotifyFailure(const llmtrigger::cron::TriggerDefinition& trigger, const std::string& error);

    // Route failures are logged, never thrown.
    void Send(const std::string& message, NotificationLevel level);

private:
    llmtrigger::config::NotificationConfig config_;
    std::unique_ptr<NotificationRoute> route_;
};

}  // namespace llmtrigger::notify
