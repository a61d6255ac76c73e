#include "channels/telegram_channel.hpp"

#include <chrono>
#include <cstdlib>
#include <regex>
#include <unordered_map>
#include <vector>

#include <tgbot/net/CurlHttpClient.h>

#include "utils/logging.hpp"

namespace llmtrigger::channels {
namespace {

bool ProxyConfigured() {
    for (const char* name : {"LLMTRIGGER_TELEGRAM_USE_CURL", "HTTPS_PROXY", "HTTP_PROXY", "ALL_PROXY",
                             "https_proxy", "http_proxy", "all_proxy"}) {
        if (std::getenv(name) != nullptr) {
            return true;
        }
    }
    return false;
}

std::string EscapeHtml(const std::string& input) {
    std::string output;
    output.reserve(input.size());
    for (const auto ch : input) {
        switch (ch) {
            case '&': output += "&amp;"; break;
            case '<': output += "&lt;"; break;
            case '>': output += "&gt;"; break;
            default: output += ch; break;
        }
    }
    return output;
}

void ReplaceAll(std::string& input, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return;
    }
    std::size_t start = 0;
    while ((start = input.find(from, start)) != std::string::npos) {
        input.replace(start, from.size(), to);
        start += to.size();
    }
}

}  // namespace

TelegramChannel::TelegramChannel(const llmtrigger::config::TelegramConfig& config,
                                 llmtrigger::bus::MessageBus& bus)
    : ChannelBase("telegram", bus, config.allow_from)
    , config_(config) {}

void TelegramChannel::Start() {
    if (running_) {
        return;
    }
    if (config_.token.empty()) {
        utils::LogWarn("telegram", "token is empty; channel disabled");
        running_ = false;
        return;
    }
    running_ = true;
    polling_ = true;

    if (ProxyConfigured()) {
#ifdef HAVE_CURL
        http_client_ = std::make_unique<TgBot::CurlHttpClient>();
        bot_ = std::make_unique<TgBot::Bot>(config_.token, *http_client_);
        utils::LogInfo("telegram", "bot initialized with CurlHttpClient (proxy-aware)");
#else
        bot_ = std::make_unique<TgBot::Bot>(config_.token);
        utils::LogWarn("telegram", "curl not available, fallback to BoostHttpOnlySslClient");
#endif
    } else {
        bot_ = std::make_unique<TgBot::Bot>(config_.token);
        utils::LogInfo("telegram", "bot initialized with BoostHttpOnlySslClient");
    }

    bot_->getEvents().onAnyMessage([this](TgBot::Message::Ptr message) {
        if (!message || !message->from || !message->chat || message->text.empty()) {
            return;
        }
        std::string sender_id = std::to_string(message->from->id);
        if (!message->from->username.empty()) {
            sender_id += "|" + message->from->username;
        }
        const std::string chat_id = std::to_string(message->chat->id);
        const auto kind = message->chat->type == TgBot::Chat::Type::Private
            ? llmtrigger::bus::MessageKind::Private
            : llmtrigger::bus::MessageKind::Group;

        std::unordered_map<std::string, std::string> metadata;
        metadata["message_id"] = std::to_string(message->messageId);
        metadata["username"] = message->from->username;
        HandleMessage(sender_id, chat_id, kind, message->text, metadata);
    });

    polling_thread_ = std::make_unique<std::thread>([this]() {
        long_poll_ = std::make_unique<TgBot::TgLongPoll>(*bot_);
        while (running_ && polling_) {
            try {
                long_poll_->start();
            } catch (const TgBot::TgException& ex) {
                utils::LogWarn("telegram", std::string("long poll error: ") + ex.what());
                std::this_thread::sleep_for(std::chrono::seconds(1));
            } catch (const std::exception& ex) {
                utils::LogWarn("telegram", std::string("long poll error: ") + ex.what());
                std::this_thread::sleep_for(std::chrono::seconds(1));
            }
        }
    });
}

void TelegramChannel::Stop() {
    running_ = false;
    polling_ = false;
    if (polling_thread_ && polling_thread_->joinable()) {
        polling_thread_->join();
    }
    polling_thread_.reset();
    long_poll_.reset();
    bot_.reset();
    http_client_.reset();
}

void TelegramChannel::Send(const llmtrigger::bus::OutboundMessage& msg) {
    if (!bot_) {
        throw DeliveryError("telegram channel is not started");
    }
    if (msg.chat_id.empty()) {
        throw DeliveryError("telegram message has no chat id");
    }
    long long chat_id = 0;
    try {
        chat_id = std::stoll(msg.chat_id);
    } catch (const std::exception&) {
        throw DeliveryError("telegram chat id '" + msg.chat_id + "' is not numeric");
    }

    const auto html = ConvertMarkdownToHtml(msg.content);
    try {
        bot_->getApi().sendMessage(chat_id, html, false, 0, nullptr, "HTML");
        return;
    } catch (const TgBot::TgException& ex) {
        utils::LogDebug("telegram", std::string("HTML send rejected, retrying as plain text: ") + ex.what());
    }
    try {
        bot_->getApi().sendMessage(chat_id, msg.content);
    } catch (const TgBot::TgException& ex) {
        throw DeliveryError(std::string("telegram sendMessage failed: ") + ex.what());
    }
}

std::string TelegramChannel::ConvertMarkdownToHtml(const std::string& text) {
    if (text.empty()) {
        return {};
    }

    std::vector<std::string> code_blocks;
    std::vector<std::string> inline_codes;

    auto replace_and_store = [](const std::string& input,
                                const std::regex& pattern,
                                std::vector<std::string>& store,
                                const std::string& token_prefix) {
        std::string output;
        std::smatch match;
        std::string::const_iterator search_start = input.begin();
        while (std::regex_search(search_start, input.end(), match, pattern)) {
            output.append(search_start, match[0].first);
            store.push_back(match[1].str());
            output.append("[[LLMTRIGGER_" + token_prefix + "_" + std::to_string(store.size() - 1) + "]]");
            search_start = match[0].second;
        }
        output.append(search_start, input.end());
        return output;
    };

    std::string result = text;
    result = replace_and_store(result, std::regex(R"(```[\w]*\n?([\s\S]*?)```)"), code_blocks, "CB");
    result = replace_and_store(result, std::regex(R"(`([^`]+)`)"), inline_codes, "IC");

    result = std::regex_replace(result, std::regex(R"((^|\n)#{1,6}\s+([^\n]+))"), "$1$2");
    result = std::regex_replace(result, std::regex(R"((^|\n)>\s*([^\n]*))"), "$1$2");
    result = EscapeHtml(result);

    result = std::regex_replace(result, std::regex(R"(\[([^\]]+)\]\(([^)]+)\))"), "<a href=\"$2\">$1</a>");
    result = std::regex_replace(result, std::regex(R"(\*\*(.+?)\*\*)"), "<b>$1</b>");
    result = std::regex_replace(result, std::regex(R"(__(.+?)__)"), "<b>$1</b>");
    result = std::regex_replace(result, std::regex(R"(~~(.+?)~~)"), "<s>$1</s>");

    for (std::size_t i = 0; i < inline_codes.size(); ++i) {
        ReplaceAll(result, "[[LLMTRIGGER_IC_" + std::to_string(i) + "]]",
                   "<code>" + EscapeHtml(inline_codes[i]) + "</code>");
    }
    for (std::size_t i = 0; i < code_blocks.size(); ++i) {
        ReplaceAll(result, "[[LLMTRIGGER_CB_" + std::to_string(i) + "]]",
                   "<pre><code>" + EscapeHtml(code_blocks[i]) + "</code></pre>");
    }
    return result;
}

}  // namespace llmtrigger::channels
