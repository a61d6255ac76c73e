#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace llmtrigger::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnv(const std::string& name) {
    return GetEnv(name.c_str());
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::string ToEnvName(const std::string& value) {
    std::string upper = value;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_';
    });
    return upper;
}

std::vector<std::string> ReadStringList(const nlohmann::json& source) {
    std::vector<std::string> items;
    if (!source.is_array()) {
        return items;
    }
    for (const auto& item : source) {
        if (item.is_string()) {
            items.push_back(item.get<std::string>());
        }
    }
    return items;
}

void ApplyProviderConfig(ProviderConfig& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    if (source.contains("apiKey") && source["apiKey"].is_string()) {
        target.api_key = source["apiKey"].get<std::string>();
    }
    if (source.contains("apiBase") && source["apiBase"].is_string()) {
        target.api_base = source["apiBase"].get<std::string>();
    }
    if (source.contains("model") && source["model"].is_string()) {
        target.model = source["model"].get<std::string>();
    }
    if (source.contains("timeoutS") && source["timeoutS"].is_number_integer()) {
        target.timeout_s = source["timeoutS"].get<int>();
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("scheduler_check_interval") && data["scheduler_check_interval"].is_number_integer()) {
        config.scheduler.check_interval_s = data["scheduler_check_interval"].get<int>();
    }
    if (data.contains("platform_group_provider_map")) {
        config.scheduler.group_triggers = ReadStringList(data["platform_group_provider_map"]);
    }
    if (data.contains("platform_friend_provider_map")) {
        config.scheduler.friend_triggers = ReadStringList(data["platform_friend_provider_map"]);
    }

    if (data.contains("admin_user_id") && data["admin_user_id"].is_string()) {
        config.notification.admin_user_id = data["admin_user_id"].get<std::string>();
    }
    if (data.contains("admin_channel") && data["admin_channel"].is_string()) {
        config.notification.admin_channel = data["admin_channel"].get<std::string>();
    }
    if (data.contains("notification_on_failure") && data["notification_on_failure"].is_boolean()) {
        config.notification.on_failure = data["notification_on_failure"].get<bool>();
    }
    if (data.contains("notification_on_success") && data["notification_on_success"].is_boolean()) {
        config.notification.on_success = data["notification_on_success"].get<bool>();
    }

    if (data.contains("logLevel") && data["logLevel"].is_string()) {
        config.log_level = data["logLevel"].get<std::string>();
    }

    if (data.contains("generation") && data["generation"].is_object()) {
        const auto& generation = data["generation"];
        if (generation.contains("systemPrompt") && generation["systemPrompt"].is_string()) {
            config.generation.system_prompt = generation["systemPrompt"].get<std::string>();
        }
        if (generation.contains("maxTokens") && generation["maxTokens"].is_number_integer()) {
            config.generation.max_tokens = generation["maxTokens"].get<int>();
        }
        if (generation.contains("temperature") && generation["temperature"].is_number()) {
            config.generation.temperature = generation["temperature"].get<double>();
        }
    }

    if (data.contains("providers") && data["providers"].is_object()) {
        for (const auto& item : data["providers"].items()) {
            if (item.key() == "useProxyForLLM") {
                if (item.value().is_boolean()) {
                    config.providers.use_proxy_for_llm = item.value().get<bool>();
                }
                continue;
            }
            ApplyProviderConfig(config.providers.entries[item.key()], item.value());
        }
    }

    if (data.contains("channels") && data["channels"].is_object()) {
        const auto& channels = data["channels"];
        if (channels.contains("telegram") && channels["telegram"].is_object()) {
            const auto& telegram = channels["telegram"];
            if (telegram.contains("enabled") && telegram["enabled"].is_boolean()) {
                config.channels.telegram.enabled = telegram["enabled"].get<bool>();
            }
            if (telegram.contains("token") && telegram["token"].is_string()) {
                config.channels.telegram.token = telegram["token"].get<std::string>();
            }
            if (telegram.contains("allowFrom")) {
                config.channels.telegram.allow_from = ReadStringList(telegram["allowFrom"]);
            }
        }
        if (channels.contains("lark") && channels["lark"].is_object()) {
            const auto& lark = channels["lark"];
            if (lark.contains("enabled") && lark["enabled"].is_boolean()) {
                config.channels.lark.enabled = lark["enabled"].get<bool>();
            }
            if (lark.contains("appId") && lark["appId"].is_string()) {
                config.channels.lark.app_id = lark["appId"].get<std::string>();
            }
            if (lark.contains("appSecret") && lark["appSecret"].is_string()) {
                config.channels.lark.app_secret = lark["appSecret"].get<std::string>();
            }
            if (lark.contains("domain") && lark["domain"].is_string()) {
                config.channels.lark.domain = lark["domain"].get<std::string>();
            }
            if (lark.contains("timeoutMs") && lark["timeoutMs"].is_number_integer()) {
                config.channels.lark.timeout_ms = lark["timeoutMs"].get<int>();
            }
        }
    }

    if (data.contains("http") && data["http"].is_object()) {
        const auto& http = data["http"];
        if (http.contains("enabled") && http["enabled"].is_boolean()) {
            config.http.enabled = http["enabled"].get<bool>();
        }
        if (http.contains("host") && http["host"].is_string()) {
            config.http.host = http["host"].get<std::string>();
        }
        if (http.contains("port") && http["port"].is_number_integer()) {
            config.http.port = http["port"].get<int>();
        }
    }
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        utils::LogWarn("config", "ignoring non-integer value '" + value + "'");
        return fallback;
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void ApplyEnvOverrides(Config& config) {
    const auto interval = GetEnv("LLMTRIGGER_SCHEDULER_CHECK_INTERVAL");
    if (!interval.empty()) {
        config.scheduler.check_interval_s = ParseInt(interval, config.scheduler.check_interval_s);
    }

    const auto admin_user_id = GetEnv("LLMTRIGGER_ADMIN_USER_ID");
    if (!admin_user_id.empty()) {
        config.notification.admin_user_id = admin_user_id;
    }

    const auto admin_channel = GetEnv("LLMTRIGGER_ADMIN_CHANNEL");
    if (!admin_channel.empty()) {
        config.notification.admin_channel = admin_channel;
    }

    const auto on_failure = GetEnv("LLMTRIGGER_NOTIFICATION_ON_FAILURE");
    if (!on_failure.empty()) {
        config.notification.on_failure = ParseBool(on_failure);
    }

    const auto on_success = GetEnv("LLMTRIGGER_NOTIFICATION_ON_SUCCESS");
    if (!on_success.empty()) {
        config.notification.on_success = ParseBool(on_success);
    }

    const auto telegram_enabled = GetEnv("LLMTRIGGER_TELEGRAM_ENABLED");
    if (!telegram_enabled.empty()) {
        config.channels.telegram.enabled = ParseBool(telegram_enabled);
    }

    const auto telegram_token = GetEnv("LLMTRIGGER_TELEGRAM_TOKEN");
    if (!telegram_token.empty()) {
        config.channels.telegram.token = telegram_token;
        config.channels.telegram.enabled = true;
    }

    const auto telegram_allow_from = GetEnv("LLMTRIGGER_TELEGRAM_ALLOW_FROM");
    if (!telegram_allow_from.empty()) {
        config.channels.telegram.allow_from = SplitCsv(telegram_allow_from);
    }

    const auto log_level = GetEnv("LLMTRIGGER_LOG_LEVEL");
    if (!log_level.empty()) {
        config.log_level = log_level;
    }

    const auto http_port = GetEnv("LLMTRIGGER_HTTP_PORT");
    if (!http_port.empty()) {
        config.http.port = ParseInt(http_port, config.http.port);
    }

    for (auto& [name, provider] : config.providers.entries) {
        const auto prefix = "LLMTRIGGER_PROVIDERS__" + ToEnvName(name) + "__";
        const auto api_key = GetEnv(prefix + "API_KEY");
        if (!api_key.empty()) {
            provider.api_key = api_key;
        }
        const auto api_base = GetEnv(prefix + "API_BASE");
        if (!api_base.empty()) {
            provider.api_base = api_base;
        }
        const auto model = GetEnv(prefix + "MODEL");
        if (!model.empty()) {
            provider.model = model;
        }
    }
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    return GetHomePath() / ".llmtrigger" / "config.json";
}

void ApplyConfigJson(Config& config, const std::string& json_text) {
    const auto data = nlohmann::json::parse(json_text);
    ApplyConfigFromJson(config, data);
}

std::vector<std::string> ValidateConfig(Config& config) {
    const Config defaults{};
    std::vector<std::string> warnings;
    if (config.scheduler.check_interval_s <= 0) {
        warnings.push_back("scheduler_check_interval must be positive, using " +
                           std::to_string(defaults.scheduler.check_interval_s));
        config.scheduler.check_interval_s = defaults.scheduler.check_interval_s;
    }
    if (config.generation.max_tokens <= 0) {
        warnings.push_back("generation.maxTokens must be positive, using " +
                           std::to_string(defaults.generation.max_tokens));
        config.generation.max_tokens = defaults.generation.max_tokens;
    }
    if (config.http.port <= 0 || config.http.port > 65535) {
        warnings.push_back("http.port out of range, using " + std::to_string(defaults.http.port));
        config.http.port = defaults.http.port;
    }
    for (auto& [name, provider] : config.providers.entries) {
        if (provider.timeout_s <= 0) {
            warnings.push_back("providers." + name + ".timeoutS must be positive, using " +
                               std::to_string(ProviderConfig{}.timeout_s));
            provider.timeout_s = ProviderConfig{}.timeout_s;
        }
    }
    if (config.notification.admin_user_id.empty()) {
        warnings.push_back("admin_user_id is empty, notifications are log only");
        config.notification.admin_user_id = kLogOnlyAdmin;
    }
    return warnings;
}

Config LoadConfig() {
    return LoadConfig(DefaultConfigPath());
}

Config LoadConfig(const std::filesystem::path& path) {
    Config config{};

    if (std::filesystem::exists(path)) {
        try {
            std::ifstream input(path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::LogWarn("config", "failed to parse " + path.string() + ", using defaults: " + ex.what());
        }
    } else {
        utils::LogInfo("config", "no config file at " + path.string() + ", using defaults");
    }

    ApplyEnvOverrides(config);

    for (const auto& warning : ValidateConfig(config)) {
        utils::LogWarn("config", warning);
    }
    return config;
}

}  // namespace llmtrigger::config
