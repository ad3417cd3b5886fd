#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "nlohmann/json.hpp"

namespace aide::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::string ExpandHome(const std::string& path) {
    if (path == "~") {
        return GetHomePath().string();
    }
    if (path.rfind("~/", 0) == 0) {
        return (GetHomePath() / path.substr(2)).string();
    }
    return path;
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
        return fallback;
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        const auto first = item.find_first_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        const auto last = item.find_last_not_of(" \t");
        items.push_back(item.substr(first, last - first + 1));
    }
    return items;
}

std::vector<std::int64_t> ParseIdList(const std::vector<std::string>& items) {
    std::vector<std::int64_t> ids;
    for (const auto& item : items) {
        try {
            ids.push_back(std::stoll(item));
        } catch (const std::exception&) {
            throw ConfigError("invalid chat id in allow list: " + item);
        }
    }
    return ids;
}

void ReadString(const nlohmann::json& node, const char* key, std::string& target) {
    if (node.contains(key) && node[key].is_string()) {
        target = node[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& node, const char* key, int& target) {
    if (node.contains(key) && node[key].is_number_integer()) {
        target = node[key].get<int>();
    }
}

void ReadBool(const nlohmann::json& node, const char* key, bool& target) {
    if (node.contains(key) && node[key].is_boolean()) {
        target = node[key].get<bool>();
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }
    ReadString(data, "root", config.root);
    ReadString(data, "stateDb", config.state_db);
    ReadString(data, "logLevel", config.log_level);

    if (data.contains("telegram") && data["telegram"].is_object()) {
        const auto& telegram = data["telegram"];
        ReadString(telegram, "token", config.telegram.token);
        ReadInt(telegram, "pollTimeoutS", config.telegram.poll_timeout_s);
        ReadString(telegram, "attachmentsDir", config.telegram.attachments_dir);
        if (telegram.contains("allowFrom") && telegram["allowFrom"].is_array()) {
            config.telegram.allow_from.clear();
            for (const auto& item : telegram["allowFrom"]) {
                if (item.is_string()) {
                    config.telegram.allow_from.push_back(item.get<std::string>());
                } else if (item.is_number_integer()) {
                    config.telegram.allow_from.push_back(std::to_string(item.get<std::int64_t>()));
                }
            }
        }
        if (telegram.contains("allowChats") && telegram["allowChats"].is_array()) {
            config.telegram.allow_chats.clear();
            for (const auto& item : telegram["allowChats"]) {
                if (item.is_number_integer()) {
                    config.telegram.allow_chats.push_back(item.get<std::int64_t>());
                }
            }
        }
    }

    if (data.contains("agent") && data["agent"].is_object()) {
        const auto& agent = data["agent"];
        ReadString(agent, "bin", config.agent.bin);
        ReadInt(agent, "timeoutS", config.agent.timeout_s);
        ReadString(agent, "model", config.agent.model);
        ReadString(agent, "extraArgs", config.agent.extra_args);
        ReadBool(agent, "search", config.agent.search);
        ReadString(agent, "instructionsFile", config.agent.instructions_file);
        ReadString(agent, "sessionsDir", config.agent.sessions_dir);
    }

    if (data.contains("worker") && data["worker"].is_object()) {
        const auto& worker = data["worker"];
        ReadInt(worker, "idleSleepMs", config.worker.idle_sleep_ms);
        ReadInt(worker, "maxResultChars", config.worker.max_result_chars);
        if (worker.contains("maxSendFileBytes") && worker["maxSendFileBytes"].is_number_unsigned()) {
            config.worker.max_send_file_bytes = worker["maxSendFileBytes"].get<std::uintmax_t>();
        }
    }

    if (data.contains("git") && data["git"].is_object()) {
        const auto& git = data["git"];
        ReadBool(git, "autoCommit", config.git.auto_commit);
        ReadBool(git, "autoPush", config.git.auto_push);
        ReadInt(git, "pushHourUtc", config.git.push_hour_utc);
        ReadString(git, "userName", config.git.user_name);
        ReadString(git, "userEmail", config.git.user_email);
        ReadString(git, "commitMessage", config.git.commit_message);
    }

    if (data.contains("sessionGc") && data["sessionGc"].is_object()) {
        const auto& gc = data["sessionGc"];
        ReadBool(gc, "enabled", config.session_gc.enabled);
        ReadInt(gc, "olderThanDays", config.session_gc.older_than_days);
        ReadInt(gc, "intervalS", config.session_gc.interval_s);
    }

    if (data.contains("statusHttp") && data["statusHttp"].is_object()) {
        const auto& http = data["statusHttp"];
        ReadBool(http, "enabled", config.status_http.enabled);
        ReadString(http, "host", config.status_http.host);
        ReadInt(http, "port", config.status_http.port);
    }
}

void ApplyEnvString(const char* name, std::string& target) {
    const auto value = GetEnv(name);
    if (!value.empty()) {
        target = value;
    }
}

void ApplyEnvInt(const char* name, int& target) {
    const auto value = GetEnv(name);
    if (!value.empty()) {
        target = ParseInt(value, target);
    }
}

void ApplyEnvBool(const char* name, bool& target) {
    const auto value = GetEnv(name);
    if (!value.empty()) {
        target = ParseBool(value);
    }
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    return GetHomePath() / ".aide" / "config.json";
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    if (std::filesystem::exists(config_path)) {
        std::ifstream input(config_path);
        if (!input.is_open()) {
            throw ConfigError("cannot read config file: " + config_path.string());
        }
        try {
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            throw ConfigError("malformed config file " + config_path.string() + ": " + ex.what());
        }
    }

    ApplyEnvString("AIDE_ROOT", config.root);
    ApplyEnvString("AIDE_STATE_DB", config.state_db);
    ApplyEnvString("AIDE_LOG_LEVEL", config.log_level);

    ApplyEnvString("AIDE_TELEGRAM_TOKEN", config.telegram.token);
    const auto allow_from = GetEnv("AIDE_TELEGRAM_ALLOW_FROM");
    if (!allow_from.empty()) {
        config.telegram.allow_from = SplitCsv(allow_from);
    }
    const auto allow_chats = GetEnv("AIDE_TELEGRAM_ALLOW_CHATS");
    if (!allow_chats.empty()) {
        config.telegram.allow_chats = ParseIdList(SplitCsv(allow_chats));
    }
    ApplyEnvInt("AIDE_TELEGRAM_POLL_TIMEOUT_S", config.telegram.poll_timeout_s);
    ApplyEnvString("AIDE_TELEGRAM_ATTACHMENTS_DIR", config.telegram.attachments_dir);

    ApplyEnvString("AIDE_AGENT_BIN", config.agent.bin);
    ApplyEnvInt("AIDE_AGENT_TIMEOUT_S", config.agent.timeout_s);
    ApplyEnvString("AIDE_AGENT_MODEL", config.agent.model);
    ApplyEnvString("AIDE_AGENT_EXTRA_ARGS", config.agent.extra_args);
    ApplyEnvBool("AIDE_AGENT_SEARCH", config.agent.search);
    ApplyEnvString("AIDE_AGENT_INSTRUCTIONS_FILE", config.agent.instructions_file);
    ApplyEnvString("AIDE_AGENT_SESSIONS_DIR", config.agent.sessions_dir);

    ApplyEnvInt("AIDE_WORKER_IDLE_SLEEP_MS", config.worker.idle_sleep_ms);
    ApplyEnvInt("AIDE_WORKER_MAX_RESULT_CHARS", config.worker.max_result_chars);
    const auto max_send_bytes = GetEnv("AIDE_WORKER_MAX_SEND_FILE_BYTES");
    if (!max_send_bytes.empty()) {
        try {
            config.worker.max_send_file_bytes = std::stoull(max_send_bytes);
        } catch (const std::exception&) {
            throw ConfigError("invalid AIDE_WORKER_MAX_SEND_FILE_BYTES: " + max_send_bytes);
        }
    }

    ApplyEnvBool("AIDE_GIT_AUTO_COMMIT", config.git.auto_commit);
    ApplyEnvBool("AIDE_GIT_AUTO_PUSH", config.git.auto_push);
    ApplyEnvInt("AIDE_GIT_PUSH_HOUR_UTC", config.git.push_hour_utc);
    ApplyEnvString("AIDE_GIT_USER_NAME", config.git.user_name);
    ApplyEnvString("AIDE_GIT_USER_EMAIL", config.git.user_email);
    ApplyEnvString("AIDE_GIT_COMMIT_MESSAGE", config.git.commit_message);

    ApplyEnvBool("AIDE_SESSION_GC_ENABLED", config.session_gc.enabled);
    ApplyEnvInt("AIDE_SESSION_GC_DAYS", config.session_gc.older_than_days);
    ApplyEnvInt("AIDE_SESSION_GC_INTERVAL_S", config.session_gc.interval_s);

    ApplyEnvBool("AIDE_STATUS_HTTP_ENABLED", config.status_http.enabled);
    ApplyEnvString("AIDE_STATUS_HTTP_HOST", config.status_http.host);
    ApplyEnvInt("AIDE_STATUS_HTTP_PORT", config.status_http.port);

    config.root = ExpandHome(config.root);
    config.state_db = ExpandHome(config.state_db);
    config.agent.sessions_dir = ExpandHome(config.agent.sessions_dir);
    return config;
}

Config LoadConfig() {
    return LoadConfig(DefaultConfigPath());
}

std::filesystem::path StateDbPath(const Config& config) {
    if (!config.state_db.empty()) {
        return std::filesystem::path(config.state_db);
    }
    return std::filesystem::path(config.root) / "system" / "tasks" / "bot_state.db";
}

void ValidateGatewayConfig(const Config& config) {
    if (config.telegram.token.empty()) {
        throw ConfigError("missing telegram token (telegram.token or AIDE_TELEGRAM_TOKEN)");
    }
    std::error_code ec;
    if (config.root.empty() || !std::filesystem::is_directory(config.root, ec)) {
        throw ConfigError("working root is not a directory: " + config.root);
    }
    if (config.worker.max_result_chars <= 200) {
        throw ConfigError("worker.maxResultChars must be greater than 200");
    }
}

}  // namespace aide::config
