#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <signal.h>
#include <unistd.h>

#include "bus/message_bus.hpp"
#include "channels/channel_manager.hpp"
#include "commands/command_service.hpp"
#include "config/config_loader.hpp"
#include "cron/scheduler_service.hpp"
#include "cron/trigger_executor.hpp"
#include "cron/trigger_parser.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include "notify/notifier.hpp"
#include "providers/llm_provider.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;
std::vector<std::string> g_args;

struct CliOptions {
    std::string command;
    std::vector<std::string> positional;
    std::optional<std::filesystem::path> config_path;
};

CliOptions ParseArgs(int argc, char** argv) {
    CliOptions options{};
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
            continue;
        }
        if (options.command.empty()) {
            options.command = arg;
        } else {
            options.positional.push_back(arg);
        }
    }
    return options;
}

llmtrigger::config::Config LoadConfigFor(const CliOptions& options) {
    auto config = options.config_path ? llmtrigger::config::LoadConfig(*options.config_path)
                                      : llmtrigger::config::LoadConfig();
    llmtrigger::utils::LogConfig log_config{};
    log_config.min_level = llmtrigger::utils::ParseLogLevel(config.log_level);
    llmtrigger::utils::SetLogConfig(log_config);
    return config;
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetPidFilePath() {
    return GetHomePath() / ".llmtrigger" / "gateway.pid";
}

bool IsProcessRunning(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

std::optional<pid_t> ReadPidFile() {
    std::ifstream input(GetPidFilePath());
    if (!input.is_open()) {
        return std::nullopt;
    }
    pid_t pid = 0;
    input >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return pid;
}

bool WritePidFile(pid_t pid) {
    const auto path = GetPidFilePath();
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream output(path, std::ios::trunc);
    if (!output.is_open()) {
        return false;
    }
    output << pid;
    return true;
}

void RemovePidFile() {
    std::error_code ec;
    std::filesystem::remove(GetPidFilePath(), ec);
}

void HandleSignal(int signal) {
    g_signal = signal;
}

nlohmann::json OptionalTimeJson(const std::optional<std::chrono::system_clock::time_point>& tp) {
    return tp.has_value() ? nlohmann::json(llmtrigger::utils::ToEpochMs(*tp)) : nlohmann::json(nullptr);
}

nlohmann::json BuildTriggerJson(const llmtrigger::cron::TriggerState& state) {
    const auto& definition = state.definition;
    return {
        {"category", llmtrigger::cron::ToString(definition.category)},
        {"channel", definition.channel},
        {"destination_id", definition.destination_id},
        {"provider", definition.provider_name},
        {"cron", definition.cron_expression},
        {"prompt", definition.prompt},
        {"next_run_at_ms", llmtrigger::utils::ToEpochMs(state.next_run)},
        {"last_run_at_ms", OptionalTimeJson(state.last_run)}
    };
}

nlohmann::json BuildStatusJson(const llmtrigger::cron::SchedulerService::Status& status,
                               const std::unordered_map<std::string, bool>& channels) {
    nlohmann::json channel_json = nlohmann::json::object();
    for (const auto& [name, running] : channels) {
        channel_json[name] = running;
    }
    return {
        {"running", status.running},
        {"state", llmtrigger::cron::ToString(status.state)},
        {"triggers", status.triggers},
        {"interval_s", status.interval.count()},
        {"next_wake_at_ms", OptionalTimeJson(status.next_wake_at)},
        {"channels", channel_json}
    };
}

int RunGateway(const CliOptions& options) {
    auto config = LoadConfigFor(options);

    const auto existing_pid = ReadPidFile();
    if (existing_pid && IsProcessRunning(*existing_pid)) {
        std::cout << "llmtrigger gateway already running (pid=" << *existing_pid << ")" << std::endl;
        return 1;
    }
    RemovePidFile();
    if (!WritePidFile(::getpid())) {
        std::cout << "Failed to write gateway pid file." << std::endl;
        return 1;
    }

    llmtrigger::bus::MessageBus bus;
    llmtrigger::channels::ChannelManager channels(config, bus);
    auto providers = llmtrigger::providers::CreateProviderRegistry(config);
    llmtrigger::notify::Notifier notifier(
        config.notification,
        llmtrigger::notify::CreateNotificationRoute(config.notification, channels));
    llmtrigger::cron::TriggerExecutor executor(*providers, channels, notifier, config.generation);

    auto report = llmtrigger::cron::LoadTriggers(config, llmtrigger::utils::Now());
    llmtrigger::cron::SchedulerService scheduler(
        std::move(report.triggers),
        executor,
        std::chrono::seconds(config.scheduler.check_interval_s));
    llmtrigger::commands::CommandService commands(bus, scheduler, config.notification.admin_user_id);

    httplib::Server http_server;
    http_server.Get("/triggers", [&scheduler](const httplib::Request&, httplib::Response& res) {
        nlohmann::json json = nlohmann::json::array();
        for (const auto& state : scheduler.ListTriggers()) {
            json.push_back(BuildTriggerJson(state));
        }
        res.set_content(json.dump(2), "application/json");
    });
    http_server.Get("/status", [&scheduler, &channels](const httplib::Request&, httplib::Response& res) {
        res.set_content(BuildStatusJson(scheduler.GetStatus(), channels.Status()).dump(2), "application/json");
    });

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    sigaction(SIGHUP, &action, nullptr);

    std::thread command_thread([&commands]() { commands.Run(); });
    std::thread http_thread;
    if (config.http.enabled) {
        const std::string host = config.http.host;
        const int port = config.http.port;
        http_thread = std::thread([&http_server, host, port]() {
            if (!http_server.listen(host, port)) {
                llmtrigger::utils::LogError("http", "failed to listen on " + host + ":" + std::to_string(port));
            }
        });
    }
    channels.StartAll();
    scheduler.Start();

    std::cout << "llmtrigger gateway started. Press Ctrl+C to stop." << std::endl;
    while (g_signal == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    const bool restart_requested = g_signal == SIGHUP;
    if (!restart_requested) {
        // An in-flight provider call may hold a worker for its full timeout.
        std::thread([] {
            std::this_thread::sleep_for(std::chrono::seconds(5));
            RemovePidFile();
            std::_Exit(130);
        }).detach();
    }

    scheduler.Stop();
    if (config.http.enabled) {
        http_server.stop();
    }
    if (http_thread.joinable()) {
        http_thread.join();
    }
    commands.Stop();
    if (command_thread.joinable()) {
        command_thread.join();
    }
    channels.StopAll();
    RemovePidFile();

    if (restart_requested && !g_args.empty()) {
        llmtrigger::utils::LogInfo("gateway", "SIGHUP received, restarting");
        std::vector<char*> args;
        for (auto& arg : g_args) {
            args.push_back(arg.data());
        }
        args.push_back(nullptr);
        ::execv(args[0], args.data());
        std::cout << "Failed to restart gateway." << std::endl;
        return 1;
    }
    return 0;
}

int PrintStatus(const CliOptions& options) {
    const auto config = LoadConfigFor(options);
    const auto report = llmtrigger::cron::LoadTriggers(config, llmtrigger::utils::Now());

    std::cout << "Triggers: " << report.triggers.size() << std::endl;
    for (const auto& state : report.triggers) {
        const auto& definition = state.definition;
        std::cout << "- [" << llmtrigger::cron::ToString(definition.category) << "] "
                  << definition.Target() << " via " << definition.provider_name
                  << " (" << definition.cron_expression << ") -> "
                  << llmtrigger::utils::FormatLocalTime(state.next_run) << std::endl;
    }
    if (!report.rejected.empty()) {
        std::cout << "Rejected: " << report.rejected.size() << std::endl;
        for (const auto& entry : report.rejected) {
            std::cout << "- " << entry.raw << ": " << entry.message << std::endl;
        }
    }
    return 0;
}

int PrintNextRuns(const CliOptions& options) {
    if (options.positional.empty()) {
        std::cout << "Usage: llmtrigger next \"<cron expression>\" [count]" << std::endl;
        return 1;
    }
    int count = 5;
    if (options.positional.size() > 1) {
        try {
            count = std::stoi(options.positional[1]);
        } catch (const std::exception&) {
            std::cout << "count must be an integer" << std::endl;
            return 1;
        }
    }
    try {
        const auto expr = llmtrigger::cron::CronExpression::Parse(options.positional[0]);
        auto at = llmtrigger::utils::Now();
        for (int i = 0; i < count; ++i) {
            at = expr.Next(at);
            std::cout << llmtrigger::utils::FormatLocalTime(at) << std::endl;
        }
    } catch (const llmtrigger::cron::ParseError& ex) {
        std::cout << ex.what() << std::endl;
        return 1;
    } catch (const llmtrigger::cron::ScheduleError& ex) {
        std::cout << ex.what() << std::endl;
        return 1;
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    g_args.assign(argv, argv + argc);
    const auto options = ParseArgs(argc, argv);

    if (options.command == "gateway") {
        return RunGateway(options);
    }
    if (options.command == "status") {
        return PrintStatus(options);
    }
    if (options.command == "next") {
        return PrintNextRuns(options);
    }

    std::cout << "Usage: llmtrigger gateway | status | next \"<cron>\" [count] [--config path]" << std::endl;
    return 1;
}
