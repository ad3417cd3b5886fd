#include <gtest/gtest.h>

#include <cstdlib>
#include <map>
#include <optional>

#include "config/config_loader.hpp"
#include "test_helpers.hpp"

namespace {

using aide::config::ConfigError;

// Sets environment variables for one test and restores the previous values afterwards.
class ScopedEnv {
public:
    ~ScopedEnv() {
        for (const auto& [name, previous] : saved_) {
            if (previous) {
                ::setenv(name.c_str(), previous->c_str(), 1);
            } else {
                ::unsetenv(name.c_str());
            }
        }
    }

    void Set(const std::string& name, const std::string& value) {
        Remember(name);
        ::setenv(name.c_str(), value.c_str(), 1);
    }

private:
    void Remember(const std::string& name) {
        if (saved_.count(name) > 0) {
            return;
        }
        const char* current = std::getenv(name.c_str());
        saved_[name] = current ? std::optional<std::string>(current) : std::nullopt;
    }

    std::map<std::string, std::optional<std::string>> saved_;
};

class ConfigLoaderTest : public ::testing::Test {
protected:
    std::filesystem::path ConfigFile(const std::string& json) {
        const auto path = dir_ / "config.json";
        aide::testing::WriteFile(path, json);
        return path;
    }

    aide::testing::TempDir dir_;
    ScopedEnv env_;
};

TEST_F(ConfigLoaderTest, DefaultsWithoutFile) {
    env_.Set("HOME", dir_.Path().string());
    const auto config = aide::config::LoadConfig(dir_ / "missing.json");

    EXPECT_EQ(config.root, (dir_ / "personal-assistant").string());
    EXPECT_EQ(config.agent.bin, "codex");
    EXPECT_EQ(config.agent.timeout_s, 1800);
    EXPECT_EQ(config.agent.sessions_dir, (dir_ / ".codex/sessions").string());
    EXPECT_EQ(config.worker.max_result_chars, 3500);
    EXPECT_TRUE(config.git.auto_commit);
    EXPECT_EQ(config.git.push_hour_utc, 3);
    EXPECT_EQ(config.session_gc.older_than_days, 7);
    EXPECT_FALSE(config.status_http.enabled);
    EXPECT_EQ(aide::config::StateDbPath(config),
              dir_ / "personal-assistant" / "system" / "tasks" / "bot_state.db");
}

TEST_F(ConfigLoaderTest, FileOverridesDefaults) {
    const auto path = ConfigFile(R"({
        "root": "/srv/notes",
        "stateDb": "/var/lib/aide/state.db",
        "telegram": {"token": "T", "allowFrom": ["alice", 42], "allowChats": [-100123]},
        "agent": {"bin": "/opt/codex", "model": "o4", "search": true, "timeoutS": 60},
        "worker": {"maxResultChars": 1000, "maxSendFileBytes": 1024},
        "git": {"autoPush": false, "commitMessage": "notes: {task_id}"},
        "sessionGc": {"olderThanDays": 14},
        "statusHttp": {"enabled": true, "port": 9000}
    })");
    const auto config = aide::config::LoadConfig(path);

    EXPECT_EQ(config.root, "/srv/notes");
    EXPECT_EQ(aide::config::StateDbPath(config), std::filesystem::path("/var/lib/aide/state.db"));
    EXPECT_EQ(config.telegram.token, "T");
    EXPECT_EQ(config.telegram.allow_from, (std::vector<std::string>{"alice", "42"}));
    EXPECT_EQ(config.telegram.allow_chats, (std::vector<std::int64_t>{-100123}));
    EXPECT_EQ(config.agent.bin, "/opt/codex");
    EXPECT_EQ(config.agent.model, "o4");
    EXPECT_TRUE(config.agent.search);
    EXPECT_EQ(config.agent.timeout_s, 60);
    EXPECT_EQ(config.worker.max_result_chars, 1000);
    EXPECT_EQ(config.worker.max_send_file_bytes, 1024u);
    EXPECT_FALSE(config.git.auto_push);
    EXPECT_TRUE(config.git.auto_commit);
    EXPECT_EQ(config.git.commit_message, "notes: {task_id}");
    EXPECT_EQ(config.session_gc.older_than_days, 14);
    EXPECT_TRUE(config.status_http.enabled);
    EXPECT_EQ(config.status_http.port, 9000);
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesFile) {
    const auto path = ConfigFile(R"({"root": "/srv/notes", "telegram": {"token": "file-token"}})");
    env_.Set("AIDE_ROOT", "/data/notes");
    env_.Set("AIDE_TELEGRAM_TOKEN", "env-token");
    env_.Set("AIDE_TELEGRAM_ALLOW_FROM", " alice , 7,,");
    env_.Set("AIDE_TELEGRAM_ALLOW_CHATS", "1, -2");
    env_.Set("AIDE_GIT_AUTO_COMMIT", "no");
    env_.Set("AIDE_AGENT_SEARCH", "YES");
    env_.Set("AIDE_WORKER_IDLE_SLEEP_MS", "not-a-number");

    const auto config = aide::config::LoadConfig(path);
    EXPECT_EQ(config.root, "/data/notes");
    EXPECT_EQ(config.telegram.token, "env-token");
    EXPECT_EQ(config.telegram.allow_from, (std::vector<std::string>{"alice", "7"}));
    EXPECT_EQ(config.telegram.allow_chats, (std::vector<std::int64_t>{1, -2}));
    EXPECT_FALSE(config.git.auto_commit);
    EXPECT_TRUE(config.agent.search);
    EXPECT_EQ(config.worker.idle_sleep_ms, 1000);
}

TEST_F(ConfigLoaderTest, InvalidChatIdIsRejected) {
    env_.Set("AIDE_TELEGRAM_ALLOW_CHATS", "12,general");
    EXPECT_THROW(aide::config::LoadConfig(dir_ / "missing.json"), ConfigError);
}

TEST_F(ConfigLoaderTest, MalformedFileIsRejected) {
    const auto path = ConfigFile("{\"root\": ");
    EXPECT_THROW(aide::config::LoadConfig(path), ConfigError);
}

TEST_F(ConfigLoaderTest, GatewayValidation) {
    aide::config::Config config{};
    config.root = dir_.Path().string();
    EXPECT_THROW(aide::config::ValidateGatewayConfig(config), ConfigError);

    config.telegram.token = "T";
    EXPECT_NO_THROW(aide::config::ValidateGatewayConfig(config));

    config.worker.max_result_chars = 200;
    EXPECT_THROW(aide::config::ValidateGatewayConfig(config), ConfigError);

    config.worker.max_result_chars = 3500;
    config.root = (dir_ / "absent").string();
    EXPECT_THROW(aide::config::ValidateGatewayConfig(config), ConfigError);
}

}  // namespace
