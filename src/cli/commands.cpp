#include <atomic>
#include <chrono>
#include <csignal>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_set>
#include <unistd.h>

#include "agent/agent_client.hpp"
#include "channels/telegram_channel.hpp"
#include "config/config_loader.hpp"
#include "git/repository_sync.hpp"
#include "maintenance/sweep_service.hpp"
#include "session/session_sweeper.hpp"
#include "store/task_store.hpp"
#include "utils/logging.hpp"
#include "worker/worker.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetPidFilePath() {
    return GetHomePath() / ".aide" / "gateway.pid";
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
    return static_cast<bool>(output);
}

void RemovePidFile() {
    std::error_code ec;
    std::filesystem::remove(GetPidFilePath(), ec);
}

bool WaitForExit(pid_t pid, std::chrono::seconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!IsProcessRunning(pid)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    return !IsProcessRunning(pid);
}

void HandleSignal(int signal) {
    g_signal = signal;
}

aide::utils::Logger MakeLogger(const aide::config::Config& config) {
    aide::utils::LogConfig log_config{};
    log_config.min_level = aide::utils::ParseLogLevel(config.log_level);
    return aide::utils::Logger("aide", log_config);
}

nlohmann::json CountsJson(const aide::store::TaskCounts& counts) {
    return {
        {"pending", counts.pending},
        {"running", counts.running},
        {"done", counts.done},
        {"failed", counts.failed}
    };
}

std::unordered_set<std::string> RetainSet(aide::store::TaskStore& store) {
    const auto ids = store.ListChatSessionIds();
    return {ids.begin(), ids.end()};
}

int RunGateway() {
    auto config = aide::config::LoadConfig();
    aide::config::ValidateGatewayConfig(config);
    const auto logger = MakeLogger(config);

    const auto existing_pid = ReadPidFile();
    if (existing_pid && IsProcessRunning(*existing_pid)) {
        std::cout << "aide gateway already running (pid=" << *existing_pid << ")" << std::endl;
        return 1;
    }
    logger.Info("working root: " + config.root);
    aide::store::TaskStore store(aide::config::StateDbPath(config), logger.WithTag("store"));

    RemovePidFile();
    if (!WritePidFile(::getpid())) {
        std::cout << "Failed to write gateway pid file." << std::endl;
        return 1;
    }
    aide::agent::AgentClient agent(config.agent, config.root, logger.WithTag("agent"));
    aide::git::RepositorySync sync(config.git, config.root, logger.WithTag("git"));
    aide::channels::TelegramChannel telegram(config, store, logger.WithTag("telegram"));
    aide::worker::Worker worker(config, store, telegram, agent, &sync, logger.WithTag("worker"));
    telegram.SetEnqueueListener([&worker](std::int64_t) { worker.Notify(); });

    aide::maintenance::SweepService sweeps(
        config.session_gc,
        config.agent.sessions_dir,
        [&store]() { return RetainSet(store); },
        logger.WithTag("session-gc"));

    httplib::Server http_server;
    http_server.Get("/status", [&store](const httplib::Request&, httplib::Response& res) {
        try {
            res.set_content(CountsJson(store.Counts()).dump(), "application/json");
        } catch (const aide::store::StoreError& ex) {
            res.status = 500;
            res.set_content(nlohmann::json{{"error", ex.what()}}.dump(), "application/json");
        }
    });

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::thread worker_thread([&worker]() { worker.Run(); });
    std::thread http_thread;
    if (config.status_http.enabled) {
        const auto host = config.status_http.host;
        const auto port = config.status_http.port;
        http_thread = std::thread([&http_server, &logger, host, port]() {
            if (!http_server.listen(host, port)) {
                logger.Error("status endpoint failed to listen on " + host + ":" + std::to_string(port));
            }
        });
    }
    sweeps.Start();
    telegram.Start();

    std::cout << "aide gateway started. Press Ctrl+C to stop." << std::endl;
    while (g_signal == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }
    logger.Info("shutdown signal received: " + std::to_string(static_cast<int>(g_signal)));

    telegram.Stop();
    worker.Stop();
    if (worker_thread.joinable()) {
        worker_thread.join();
    }
    sweeps.Stop();
    if (http_thread.joinable()) {
        http_server.stop();
        http_thread.join();
    }
    RemovePidFile();
    logger.Info("gateway stopped");
    return 0;
}

int StopGateway() {
    const auto pid = ReadPidFile();
    if (!pid || !IsProcessRunning(*pid)) {
        std::cout << "aide gateway not running." << std::endl;
        RemovePidFile();
        return 1;
    }
    ::kill(*pid, SIGTERM);
    if (!WaitForExit(*pid, std::chrono::seconds(60))) {
        std::cout << "aide gateway (pid=" << *pid << ") is still finishing its current task." << std::endl;
        return 1;
    }
    std::cout << "aide gateway stopped." << std::endl;
    return 0;
}

int PrintStatus() {
    const auto config = aide::config::LoadConfig();
    const auto logger = MakeLogger(config);
    aide::store::TaskStore store(aide::config::StateDbPath(config), logger.WithTag("store"));
    const auto counts = store.Counts();
    const auto pid = ReadPidFile();
    std::cout << "gateway: "
              << (pid && IsProcessRunning(*pid) ? "running (pid=" + std::to_string(*pid) + ")" : "stopped")
              << "\n"
              << "pending: " << counts.pending << "\n"
              << "running: " << counts.running << "\n"
              << "done: " << counts.done << "\n"
              << "failed: " << counts.failed << std::endl;
    return 0;
}

int CollectSessions(int argc, char** argv) {
    const auto config = aide::config::LoadConfig();
    const auto logger = MakeLogger(config);
    int days = config.session_gc.older_than_days;
    if (argc >= 3) {
        try {
            days = std::stoi(argv[2]);
        } catch (const std::logic_error&) {
            std::cout << "days must be a number: " << argv[2] << std::endl;
            return 1;
        }
    }
    aide::store::TaskStore store(aide::config::StateDbPath(config), logger.WithTag("store"));
    aide::session::SessionSweeper sweeper(logger.WithTag("session-gc"));
    const auto result = sweeper.Sweep(config.agent.sessions_dir, RetainSet(store), days);
    std::cout << "deleted=" << result.deleted
              << " kept=" << result.kept
              << " skipped=" << result.skipped
              << " errors=" << result.errors << std::endl;
    return result.errors == 0 ? 0 : 1;
}

int EnqueueFromShell(int argc, char** argv) {
    if (argc < 4) {
        std::cout << "Usage: aide enqueue <chat_id> <text>" << std::endl;
        return 1;
    }
    std::int64_t chat_id = 0;
    try {
        chat_id = std::stoll(argv[2]);
    } catch (const std::logic_error&) {
        std::cout << "chat_id must be a number: " << argv[2] << std::endl;
        return 1;
    }
    std::string text = argv[3];
    for (int i = 4; i < argc; ++i) {
        text += " ";
        text += argv[i];
    }
    const auto config = aide::config::LoadConfig();
    const auto logger = MakeLogger(config);
    aide::store::TaskStore store(aide::config::StateDbPath(config), logger.WithTag("store"));
    const auto task_id = store.Enqueue(chat_id, 0, "cli", text, {});
    std::cout << "Task #" << task_id << " queued." << std::endl;
    return 0;
}

void PrintUsage() {
    std::cout << "Usage: aide gateway | aide stop | aide status | aide gc-sessions [days] | "
                 "aide enqueue <chat_id> <text>"
              << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];
    try {
        if (command == "gateway") {
            return RunGateway();
        }
        if (command == "stop") {
            return StopGateway();
        }
        if (command == "status") {
            return PrintStatus();
        }
        if (command == "gc-sessions") {
            return CollectSessions(argc, argv);
        }
        if (command == "enqueue") {
            return EnqueueFromShell(argc, argv);
        }
    } catch (const aide::config::ConfigError& ex) {
        std::cerr << "configuration error: " << ex.what() << std::endl;
        return 1;
    } catch (const aide::store::StoreError& ex) {
        std::cerr << "task store error: " << ex.what() << std::endl;
        return 1;
    }
    PrintUsage();
    return 1;
}
