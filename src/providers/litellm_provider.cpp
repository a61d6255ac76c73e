#include "providers/litellm_provider.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <string>

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace llmtrigger::providers {
namespace {

constexpr const char* kFallbackModel = "gpt-4o-mini";

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string base_path;
};

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        parsed.https = true;
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.base_path = working.substr(slash_pos);
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        try {
            parsed.port = std::stoi(host_port.substr(colon_pos + 1));
        } catch (const std::exception&) {
            throw ProviderError("invalid port in api base '" + url + "'");
        }
    } else {
        parsed.host = host_port;
    }

    if (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
        parsed.base_path.pop_back();
    }

    return parsed;
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

bool ParseProxyHostPort(const std::string& proxy, std::string& host, int& port) {
    if (proxy.empty()) {
        return false;
    }
    std::string working = proxy;
    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        working = working.substr(scheme_pos + 3);
    }
    const auto slash_pos = working.find('/');
    if (slash_pos != std::string::npos) {
        working = working.substr(0, slash_pos);
    }
    const auto colon_pos = working.rfind(':');
    if (colon_pos == std::string::npos) {
        return false;
    }
    host = working.substr(0, colon_pos);
    try {
        port = std::stoi(working.substr(colon_pos + 1));
    } catch (const std::exception&) {
        return false;
    }
    return !host.empty() && port > 0;
}

std::string MaskKey(const std::string& key) {
    if (key.size() <= 8) {
        return "****";
    }
    return key.substr(0, 4) + "****" + key.substr(key.size() - 4);
}

bool ShouldUseAnthropicMessages(const std::string& model, const std::string& api_base) {
    const auto combined = ToLower(model + " " + api_base);
    return combined.find("kimi") != std::string::npos ||
        combined.find("moonshot") != std::string::npos ||
        combined.find("anthropic") != std::string::npos;
}

nlohmann::json BuildAnthropicPayload(const std::vector<Message>& messages,
                                     const std::string& model,
                                     int max_tokens,
                                     double temperature) {
    nlohmann::json payload;
    payload["model"] = model;
    payload["max_tokens"] = max_tokens;
    payload["temperature"] = temperature;
    payload["messages"] = nlohmann::json::array();

    std::string system_prompt;
    for (const auto& msg : messages) {
        if (msg.role == "system") {
            if (!system_prompt.empty()) {
                system_prompt.append("\n");
            }
            system_prompt.append(msg.content);
            continue;
        }
        payload["messages"].push_back({
            {"role", msg.role},
            {"content", nlohmann::json::array({{{"type", "text"}, {"text", msg.content}}})}
        });
    }
    if (!system_prompt.empty()) {
        payload["system"] = system_prompt;
    }
    return payload;
}

nlohmann::json BuildOpenAIPayload(const std::vector<Message>& messages,
                                  const std::string& model,
                                  int max_tokens,
                                  double temperature) {
    nlohmann::json payload;
    payload["model"] = model;
    payload["max_tokens"] = max_tokens;
    payload["temperature"] = temperature;
    payload["messages"] = nlohmann::json::array();
    for (const auto& msg : messages) {
        payload["messages"].push_back({{"role", msg.role}, {"content", msg.content}});
    }
    return payload;
}

LLMResponse ParseAnthropicResponse(const nlohmann::json& json) {
    LLMResponse parsed{};
    if (json.contains("content") && json["content"].is_array()) {
        for (const auto& block : json["content"]) {
            if (block.value("type", "") == "text") {
                parsed.content += block.value("text", "");
            }
        }
    }
    if (json.contains("stop_reason") && json["stop_reason"].is_string()) {
        parsed.finish_reason = json["stop_reason"].get<std::string>();
    }
    if (json.contains("usage") && json["usage"].is_object()) {
        const auto& usage = json["usage"];
        const int input = usage.value("input_tokens", 0);
        const int output = usage.value("output_tokens", 0);
        parsed.usage["prompt_tokens"] = input;
        parsed.usage["completion_tokens"] = output;
        parsed.usage["total_tokens"] = input + output;
    }
    return parsed;
}

LLMResponse ParseOpenAIResponse(const nlohmann::json& json) {
    if (!json.contains("choices") || !json["choices"].is_array() || json["choices"].empty()) {
        throw ProviderError("invalid response: no choices");
    }
    LLMResponse parsed{};
    const auto& choice = json["choices"][0];
    if (choice.contains("message") && choice["message"].is_object()) {
        const auto& message = choice["message"];
        if (message.contains("content") && message["content"].is_string()) {
            parsed.content = message["content"].get<std::string>();
        }
    }
    if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
        parsed.finish_reason = choice["finish_reason"].get<std::string>();
    }
    if (json.contains("usage") && json["usage"].is_object()) {
        const auto& usage = json["usage"];
        for (const char* key : {"prompt_tokens", "completion_tokens", "total_tokens"}) {
            if (usage.contains(key) && usage[key].is_number_integer()) {
                parsed.usage[key] = usage[key].get<int>();
            }
        }
    }
    return parsed;
}

}  // namespace

LiteLLMProvider::LiteLLMProvider(std::string api_key,
                                 std::string api_base,
                                 std::string default_model,
                                 int timeout_s,
                                 bool use_proxy_for_llm)
    : api_key_(std::move(api_key))
    , api_base_(std::move(api_base))
    , default_model_(default_model.empty() ? kFallbackModel : std::move(default_model))
    , timeout_s_(timeout_s)
    , use_proxy_for_llm_(use_proxy_for_llm) {
    is_openrouter_ = (!api_key_.empty() && api_key_.rfind("sk-or-", 0) == 0) ||
        (api_base_.find("openrouter") != std::string::npos);
}

LLMResponse LiteLLMProvider::Chat(
    const std::vector<Message>& messages,
    const std::string& model,
    int max_tokens,
    double temperature) {
    const auto chosen_model = model.empty() ? default_model_ : model;
    const bool use_anthropic = ShouldUseAnthropicMessages(chosen_model, api_base_);

    const auto payload = use_anthropic
        ? BuildAnthropicPayload(messages, chosen_model, max_tokens, temperature)
        : BuildOpenAIPayload(messages, chosen_model, max_tokens, temperature);

    std::string base_url = api_base_;
    if (base_url.empty()) {
        if (use_anthropic) {
            base_url = "https://api.anthropic.com/v1";
        } else if (chosen_model.rfind("moonshot/", 0) == 0) {
            base_url = "https://api.moonshot.cn/v1";
        } else {
            base_url = is_openrouter_ ? "https://openrouter.ai/api/v1" : "https://api.openai.com/v1";
        }
    }

    const auto parsed = ParseUrl(base_url);
    const std::string endpoint = parsed.base_path + (use_anthropic ? "/messages" : "/chat/completions");

    std::string scheme_host_port = parsed.https ? "https://" : "http://";
    scheme_host_port += parsed.host + ":" + std::to_string(parsed.port);
    auto client = std::make_unique<httplib::Client>(scheme_host_port);
    client->set_connection_timeout(timeout_s_);
    client->set_read_timeout(timeout_s_);
    client->set_write_timeout(timeout_s_);

    if (use_proxy_for_llm_) {
        std::string proxy_host;
        int proxy_port = 0;
        bool proxied = false;
        for (const char* name : {"HTTPS_PROXY", "HTTP_PROXY", "https_proxy", "http_proxy"}) {
            if (ParseProxyHostPort(GetEnv(name), proxy_host, proxy_port)) {
                client->set_proxy(proxy_host, proxy_port);
                proxied = true;
                break;
            }
        }
        if (!proxied && (!GetEnv("ALL_PROXY").empty() || !GetEnv("all_proxy").empty())) {
            utils::LogWarn("llm", "ALL_PROXY is set but cpp-httplib only supports HTTP proxy");
        }
    }

    utils::LogDebug("llm", "POST " + scheme_host_port + endpoint +
                               " model=" + chosen_model +
                               " api_key=" + MaskKey(api_key_) +
                               " style=" + (use_anthropic ? "anthropic" : "openai"));

    httplib::Headers headers{{"Content-Type", "application/json"}};
    if (!api_key_.empty()) {
        if (use_anthropic) {
            headers.emplace("x-api-key", api_key_);
            headers.emplace("anthropic-version", "2023-06-01");
        } else {
            headers.emplace("Authorization", "Bearer " + api_key_);
        }
    }

    auto response = client->Post(endpoint, headers, payload.dump(), "application/json");
    if (!response) {
        const auto err = response.error();
        throw ProviderError("request failed (httplib error=" + std::to_string(static_cast<int>(err)) +
                            ", " + httplib::to_string(err) + ")");
    }
    if (response->status >= 400) {
        utils::LogDebug("llm", "HTTP " + std::to_string(response->status) + " body=" + response->body);
        throw ProviderError("HTTP " + std::to_string(response->status));
    }

    const auto json = nlohmann::json::parse(response->body, nullptr, false);
    if (json.is_discarded()) {
        throw ProviderError("invalid response: body is not JSON");
    }
    try {
        return use_anthropic ? ParseAnthropicResponse(json) : ParseOpenAIResponse(json);
    } catch (const nlohmann::json::exception& ex) {
        throw ProviderError(std::string("invalid response: ") + ex.what());
    }
}

}  // namespace llmtrigger::providers
