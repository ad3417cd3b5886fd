#include "git/repository_sync.hpp"

#include <utility>

#include "utils/common.hpp"

namespace aide::git {
namespace {

constexpr std::chrono::seconds kGitTimeout{120};

std::string Reason(const aide::exec::ExecResult& result) {
    auto text = aide::utils::Trim(result.error);
    if (text.empty()) {
        text = aide::utils::Trim(result.output);
    }
    if (text.empty()) {
        text = "exit code " + std::to_string(result.exit_code);
    }
    return text;
}

bool Succeeded(const aide::exec::ExecResult& result) {
    return !result.not_found && !result.timed_out && result.exit_code == 0;
}

}  // namespace

const char* ToString(CommitStatus status) {
    switch (status) {
        case CommitStatus::kDisabled: return "disabled";
        case CommitStatus::kNoChanges: return "no-changes";
        case CommitStatus::kCommitted: return "committed";
        case CommitStatus::kFailed: return "failed";
    }
    return "unknown";
}

const char* ToString(PushStatus status) {
    switch (status) {
        case PushStatus::kDisabled: return "disabled";
        case PushStatus::kNotDue: return "not-due";
        case PushStatus::kAlreadyAttempted: return "already-attempted";
        case PushStatus::kNoRemote: return "no-remote";
        case PushStatus::kPushed: return "pushed";
        case PushStatus::kFailed: return "failed";
    }
    return "unknown";
}

RepositorySync::RepositorySync(aide::config::GitConfig config,
                               std::filesystem::path root,
                               aide::utils::Logger logger,
                               GitRunner runner)
    : config_(std::move(config))
    , root_(std::move(root))
    , logger_(std::move(logger))
    , runner_(std::move(runner)) {}

aide::exec::ExecResult RepositorySync::Git(const std::vector<std::string>& args) const {
    if (runner_) {
        return runner_(args);
    }
    std::vector<std::string> argv{"git", "-C", root_.string()};
    argv.insert(argv.end(), args.begin(), args.end());
    return aide::exec::CommandRunner::Run(argv, root_, kGitTimeout);
}

void RepositorySync::EnsureIdentity() {
    const auto name = Git({"config", "--get", "user.name"});
    if (aide::utils::Trim(name.output).empty()) {
        Git({"config", "user.name", config_.user_name});
    }
    const auto email = Git({"config", "--get", "user.email"});
    if (aide::utils::Trim(email.output).empty()) {
        Git({"config", "user.email", config_.user_email});
    }
}

std::string RepositorySync::CommitMessage(std::int64_t task_id) const {
    static const std::string kPlaceholder = "{task_id}";
    auto message = config_.commit_message;
    const auto id = std::to_string(task_id);
    std::size_t pos = 0;
    while ((pos = message.find(kPlaceholder, pos)) != std::string::npos) {
        message.replace(pos, kPlaceholder.size(), id);
        pos += id.size();
    }
    return message;
}

CommitOutcome RepositorySync::CommitIfNeeded(std::int64_t task_id) {
    if (!config_.auto_commit) {
        return {CommitStatus::kDisabled, "auto-commit disabled"};
    }
    const auto status = Git({"status", "--porcelain"});
    if (!Succeeded(status)) {
        return {CommitStatus::kFailed, "git status failed: " + Reason(status)};
    }
    if (aide::utils::Trim(status.output).empty()) {
        return {CommitStatus::kNoChanges, "no file changes"};
    }

    EnsureIdentity();
    const auto add = Git({"add", "-A"});
    if (!Succeeded(add)) {
        return {CommitStatus::kFailed, "git add failed: " + Reason(add)};
    }
    const auto commit = Git({"commit", "-m", CommitMessage(task_id)});
    if (!Succeeded(commit)) {
        return {CommitStatus::kFailed, "commit failed: " + Reason(commit)};
    }
    const auto head = Git({"rev-parse", "--short", "HEAD"});
    return {CommitStatus::kCommitted, aide::utils::Trim(head.output)};
}

PushOutcome RepositorySync::PushIfDue(aide::store::TaskStore& store,
                                      std::chrono::system_clock::time_point now) {
    if (!config_.auto_push) {
        return {PushStatus::kDisabled, "auto-push disabled"};
    }
    if (aide::utils::HourUtc(now) < config_.push_hour_utc) {
        return {PushStatus::kNotDue, "push not due yet"};
    }
    const auto today = aide::utils::FormatDateUtc(now);
    if (store.GetMeta(kLastPushAttemptKey, "") == today) {
        return {PushStatus::kAlreadyAttempted, "push already attempted today"};
    }

    const auto remotes = Git({"remote"});
    if (!Succeeded(remotes) || aide::utils::Trim(remotes.output).empty()) {
        store.SetMeta(kLastPushAttemptKey, today);
        return {PushStatus::kNoRemote, "push skipped: no git remote configured"};
    }

    const auto pushed = Git({"push"});
    store.SetMeta(kLastPushAttemptKey, today);
    if (!Succeeded(pushed)) {
        logger_.Warn("push failed: " + Reason(pushed));
        return {PushStatus::kFailed, "push failed: " + Reason(pushed)};
    }
    logger_.Info("push completed for " + today);
    return {PushStatus::kPushed, "push completed"};
}

}  // namespace aide::git
