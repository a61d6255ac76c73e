#pragma once

#include <chrono>
#include <ctime>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "bus/message_bus.hpp"
#include "channels/channel_base.hpp"
#include "channels/channel_manager.hpp"
#include "config/config_schema.hpp"
#include "cron/trigger_executor.hpp"
#include "notify/notifier.hpp"
#include "providers/llm_provider.hpp"
#include "utils/logging.hpp"

namespace llmtrigger::testing {

// Local wall-clock instant; cron evaluation is in local time too.
inline std::chrono::system_clock::time_point LocalTime(int year, int month, int day, int hour, int minute,
                                                       int second = 0) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

class FakeProvider : public llmtrigger::providers::LLMProvider {
public:
    explicit FakeProvider(std::string reply_text = "generated text")
        : reply(std::move(reply_text)) {}

    llmtrigger::providers::LLMResponse Chat(
        const std::vector<llmtrigger::providers::Message>& messages,
        const std::string& model,
        int max_tokens,
        double temperature) override {
        if (on_chat) {
            on_chat();
        }
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls;
        last_messages = messages;
        last_model = model;
        last_max_tokens = max_tokens;
        last_temperature = temperature;
        if (!error.empty()) {
            throw llmtrigger::providers::ProviderError(error);
        }
        llmtrigger::providers::LLMResponse response{};
        response.content = reply;
        return response;
    }

    std::string GetDefaultModel() const override { return "fake-model"; }

    int Calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls;
    }

    // Runs before each reply, outside the provider's lock.
    std::function<void()> on_chat;
    int calls = 0;
    std::string reply;
    std::string error;
    std::vector<llmtrigger::providers::Message> last_messages;
    std::string last_model;
    int last_max_tokens = 0;
    double last_temperature = 0.0;

private:
    mutable std::mutex mutex_;
};

class RecordingChannel : public llmtrigger::channels::ChannelBase {
public:
    RecordingChannel(std::string name, llmtrigger::bus::MessageBus& bus)
        : ChannelBase(std::move(name), bus, {}) {}

    void Start() override { running_ = true; }
    void Stop() override { running_ = false; }

    void Send(const llmtrigger::bus::OutboundMessage& msg) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail) {
            throw llmtrigger::channels::DeliveryError("platform rejected message");
        }
        sent.push_back(msg);
    }

    std::vector<llmtrigger::bus::OutboundMessage> Sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent;
    }

    bool fail = false;
    std::vector<llmtrigger::bus::OutboundMessage> sent;

private:
    mutable std::mutex mutex_;
};

class RecordingRoute : public llmtrigger::notify::NotificationRoute {
public:
    struct Notice {
        std::string message;
        llmtrigger::notify::NotificationLevel level;
    };

    void Deliver(const std::string& message, llmtrigger::notify::NotificationLevel level) override {
        if (fail) {
            throw std::runtime_error("admin unreachable");
        }
        notices.push_back(Notice{message, level});
    }

    bool fail = false;
    std::vector<Notice> notices;
};

// Captures log output for the lifetime of the object.
class LogCapture {
public:
    LogCapture() {
        llmtrigger::utils::SetLogSink([this](const llmtrigger::utils::LogMessage& msg) {
            std::lock_guard<std::mutex> lock(mutex_);
            messages_.push_back(msg);
        });
    }

    ~LogCapture() {
        llmtrigger::utils::SetLogSink({});
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    bool Contains(llmtrigger::utils::LogLevel level, const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& msg : messages_) {
            if (msg.level == level && msg.message.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    std::size_t Count(llmtrigger::utils::LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t count = 0;
        for (const auto& msg : messages_) {
            if (msg.level == level) {
                ++count;
            }
        }
        return count;
    }

private:
    mutable std::mutex mutex_;
    std::vector<llmtrigger::utils::LogMessage> messages_;
};

// Executor wired to one recording channel "p1" and one fake provider "provA".
struct ExecutorHarness {
    explicit ExecutorHarness(llmtrigger::config::NotificationConfig notification = {})
        : channels(config, bus) {
        auto recording = std::make_unique<RecordingChannel>("p1", bus);
        channel = recording.get();
        channels.Register(std::move(recording));

        auto fake = std::make_unique<FakeProvider>();
        provider = fake.get();
        providers.Register("provA", std::move(fake));

        auto recording_route = std::make_unique<RecordingRoute>();
        route = recording_route.get();
        notifier = std::make_unique<llmtrigger::notify::Notifier>(notification, std::move(recording_route));
        executor = std::make_unique<llmtrigger::cron::TriggerExecutor>(
            providers, channels, *notifier, config.generation);
    }

    llmtrigger::config::Config config;
    llmtrigger::bus::MessageBus bus;
    llmtrigger::channels::ChannelManager channels;
    llmtrigger::providers::ProviderRegistry providers;
    RecordingChannel* channel = nullptr;
    FakeProvider* provider = nullptr;
    RecordingRoute* route = nullptr;
    std::unique_ptr<llmtrigger::notify::Notifier> notifier;
    std::unique_ptr<llmtrigger::cron::TriggerExecutor> executor;
};

}  // namespace llmtrigger::testing
