#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "exec/command_runner.hpp"
#include "store/task_store.hpp"
#include "utils/logging.hpp"

namespace aide::git {

enum class CommitStatus {
    kDisabled,
    kNoChanges,
    kCommitted,
    kFailed
};

struct CommitOutcome {
    CommitStatus status = CommitStatus::kDisabled;
    // Short hash when committed, otherwise the reason.
    std::string detail;
};

enum class PushStatus {
    kDisabled,
    kNotDue,
    kAlreadyAttempted,
    kNoRemote,
    kPushed,
    kFailed
};

struct PushOutcome {
    PushStatus status = PushStatus::kDisabled;
    std::string detail;
};

const char* ToString(CommitStatus status);
const char* ToString(PushStatus status);

// Commits the working tree after a task and pushes at most once per UTC day.
class RepositorySync {
public:
    // Receives git arguments without the leading "git -C <root>".
    using GitRunner = std::function<aide::exec::ExecResult(const std::vector<std::string>&)>;

    static constexpr const char* kLastPushAttemptKey = "last_push_attempt_utc";

    RepositorySync(aide::config::GitConfig config,
                   std::filesystem::path root,
                   aide::utils::Logger logger,
                   GitRunner runner = {});

    CommitOutcome CommitIfNeeded(std::int64_t task_id);
    PushOutcome PushIfDue(aide::store::TaskStore& store,
                          std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

private:
    aide::exec::ExecResult Git(const std::vector<std::string>& args) const;
    void EnsureIdentity();
    std::string CommitMessage(std::int64_t task_id) const;

    aide::config::GitConfig config_;
    std::filesystem::path root_;
    aide::utils::Logger logger_;
    GitRunner runner_;
};

}  // namespace aide::git
