#pragma once

#include <map>
#include <string>
#include <vector>

namespace llmtrigger::config {

inline constexpr const char* kLogOnlyAdmin = "admin";

struct TelegramConfig {
    bool enabled = false;
    std::string token;
    std::vector<std::string> allow_from;
};

struct LarkConfig {
    bool enabled = false;
    std::string app_id;
    std::string app_secret;
    std::string domain;
    int timeout_ms = 10000;
};

struct ChannelsConfig {
    TelegramConfig telegram;
    LarkConfig lark;
};

struct ProviderConfig {
    std::string api_key;
    std::string api_base;
    std::string model;
    int timeout_s = 60;
};

struct ProvidersConfig {
    std::map<std::string, ProviderConfig> entries;
    bool use_proxy_for_llm = false;
};

struct GenerationConfig {
    std::string system_prompt = "You are a helpful AI assistant.";
    int max_tokens = 1024;
    double temperature = 0.7;
};

struct SchedulerConfig {
    int check_interval_s = 30;
    std::vector<std::string> group_triggers;
    std::vector<std::string> friend_triggers;
};

struct NotificationConfig {
    std::string admin_user_id = kLogOnlyAdmin;
    std::string admin_channel;
    bool on_failure = true;
    bool on_success = false;
};

struct HttpConfig {
    bool enabled = false;
    std::string host = "127.0.0.1";
    int port = 18790;
};

struct Config {
    SchedulerConfig scheduler;
    NotificationConfig notification;
    GenerationConfig generation;
    ProvidersConfig providers;
    ChannelsConfig channels;
    HttpConfig http;
    std::string log_level = "info";
};

}  // namespace llmtrigger::config
