#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace aide::config {

struct TelegramConfig {
    std::string token;
    // User ids or usernames; empty means everyone.
    std::vector<std::string> allow_from;
    // Chat ids; empty means every chat.
    std::vector<std::int64_t> allow_chats;
    int poll_timeout_s = 25;
    std::string attachments_dir = "inbox_files";
};

struct AgentConfig {
    std::string bin = "codex";
    int timeout_s = 1800;
    std::string model;
    std::string extra_args;
    bool search = false;
    std::string instructions_file = "AGENTS.md";
    std::string sessions_dir = "~/.codex/sessions";
};

struct WorkerConfig {
    int idle_sleep_ms = 1000;
    int max_result_chars = 3500;
    std::uintmax_t max_send_file_bytes = 50ull * 1024 * 1024;
};

struct GitConfig {
    bool auto_commit = true;
    bool auto_push = true;
    int push_hour_utc = 3;
    std::string user_name = "Assistant Bot";
    std::string user_email = "assistant-bot@local";
    std::string commit_message = "bot: task #{task_id}";
};

struct SessionGcConfig {
    bool enabled = true;
    int older_than_days = 7;
    int interval_s = 6 * 60 * 60;
};

struct StatusHttpConfig {
    bool enabled = false;
    std::string host = "127.0.0.1";
    int port = 18790;
};

struct Config {
    std::string root = "~/personal-assistant";
    // Empty means <root>/system/tasks/bot_state.db.
    std::string state_db;
    std::string log_level = "info";
    TelegramConfig telegram;
    AgentConfig agent;
    WorkerConfig worker;
    GitConfig git;
    SessionGcConfig session_gc;
    StatusHttpConfig status_http;
};

}  // namespace aide::config
