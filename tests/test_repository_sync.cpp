#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "git/repository_sync.hpp"
#include "test_helpers.hpp"
#include "utils/common.hpp"

namespace {

using aide::exec::ExecResult;
using aide::git::CommitStatus;
using aide::git::PushStatus;
using aide::git::RepositorySync;

// Scripted git: answers by the joined argument list and records every call.
class FakeGit {
public:
    void On(const std::string& args, ExecResult result) { answers_[args] = std::move(result); }

    RepositorySync::GitRunner Runner() {
        return [this](const std::vector<std::string>& args) {
            const auto key = aide::utils::Join(args, " ");
            calls.push_back(key);
            const auto it = answers_.find(key);
            if (it != answers_.end()) {
                return it->second;
            }
            ExecResult ok{};
            ok.exit_code = 0;
            return ok;
        };
    }

    int Count(const std::string& args) const {
        int count = 0;
        for (const auto& call : calls) {
            count += call == args ? 1 : 0;
        }
        return count;
    }

    std::vector<std::string> calls;

private:
    std::map<std::string, ExecResult> answers_;
};

ExecResult Output(const std::string& text, int exit_code = 0) {
    ExecResult result{};
    result.exit_code = exit_code;
    result.output = text;
    return result;
}

ExecResult Failure(const std::string& error) {
    ExecResult result{};
    result.exit_code = 1;
    result.error = error;
    return result;
}

std::chrono::system_clock::time_point At(std::time_t unix_seconds) {
    return std::chrono::system_clock::from_time_t(unix_seconds);
}

// 2026-02-22 01:00:00Z and 05:00:00Z, then 2026-02-23 04:00:00Z.
const auto kBeforeHour = At(1771722000);
const auto kAfterHour = At(1771736400);
const auto kNextDay = At(1771819200);

class RepositorySyncTest : public ::testing::Test {
protected:
    RepositorySync MakeSync() {
        return RepositorySync(config_, dir_.Path(), aide::testing::QuietLogger(), git_.Runner());
    }

    aide::testing::TempDir dir_;
    aide::config::GitConfig config_{};
    FakeGit git_;
};

TEST_F(RepositorySyncTest, CommitDisabled) {
    config_.auto_commit = false;
    auto sync = MakeSync();
    EXPECT_EQ(sync.CommitIfNeeded(1).status, CommitStatus::kDisabled);
    EXPECT_TRUE(git_.calls.empty());
}

TEST_F(RepositorySyncTest, CleanTreeIsNoOp) {
    git_.On("status --porcelain", Output(""));
    auto sync = MakeSync();
    EXPECT_EQ(sync.CommitIfNeeded(1).status, CommitStatus::kNoChanges);
    EXPECT_EQ(git_.Count("add -A"), 0);
}

TEST_F(RepositorySyncTest, CommitsWithTemplateAndIdentity) {
    git_.On("status --porcelain", Output(" M notes.md\n"));
    git_.On("config --get user.name", Output("", 1));
    git_.On("config --get user.email", Output("me@example.com\n"));
    git_.On("rev-parse --short HEAD", Output("abc1234\n"));
    auto sync = MakeSync();

    const auto outcome = sync.CommitIfNeeded(17);
    EXPECT_EQ(outcome.status, CommitStatus::kCommitted);
    EXPECT_EQ(outcome.detail, "abc1234");
    EXPECT_EQ(git_.Count("config user.name Assistant Bot"), 1);
    EXPECT_EQ(git_.Count("config user.email assistant-bot@local"), 0);
    EXPECT_EQ(git_.Count("add -A"), 1);
    EXPECT_EQ(git_.Count("commit -m bot: task #17"), 1);
}

TEST_F(RepositorySyncTest, CommitFailureIsReported) {
    git_.On("status --porcelain", Output("?? new.md\n"));
    git_.On("config --get user.name", Output("me\n"));
    git_.On("config --get user.email", Output("me@example.com\n"));
    git_.On("commit -m bot: task #2", Failure("nothing added to commit"));
    auto sync = MakeSync();

    const auto outcome = sync.CommitIfNeeded(2);
    EXPECT_EQ(outcome.status, CommitStatus::kFailed);
    EXPECT_EQ(outcome.detail, "commit failed: nothing added to commit");
}

class PushTest : public RepositorySyncTest {
protected:
    aide::store::TaskStore& Store() {
        if (!store_) {
            store_ = std::make_unique<aide::store::TaskStore>(dir_ / "state.db", aide::testing::QuietLogger());
        }
        return *store_;
    }

    std::unique_ptr<aide::store::TaskStore> store_;
};

TEST_F(PushTest, Disabled) {
    config_.auto_push = false;
    auto sync = MakeSync();
    EXPECT_EQ(sync.PushIfDue(Store(), kAfterHour).status, PushStatus::kDisabled);
}

TEST_F(PushTest, NotBeforeConfiguredHour) {
    auto sync = MakeSync();
    EXPECT_EQ(sync.PushIfDue(Store(), kBeforeHour).status, PushStatus::kNotDue);
    EXPECT_EQ(git_.Count("push"), 0);
    EXPECT_EQ(Store().GetMeta(RepositorySync::kLastPushAttemptKey), "");
}

TEST_F(PushTest, PushesAtMostOncePerDay) {
    git_.On("remote", Output("origin\n"));
    auto sync = MakeSync();

    EXPECT_EQ(sync.PushIfDue(Store(), kAfterHour).status, PushStatus::kPushed);
    const auto second = sync.PushIfDue(Store(), kAfterHour + std::chrono::hours(1));
    EXPECT_EQ(second.status, PushStatus::kAlreadyAttempted);
    EXPECT_EQ(second.detail, "push already attempted today");
    EXPECT_EQ(git_.Count("push"), 1);
    EXPECT_EQ(Store().GetMeta(RepositorySync::kLastPushAttemptKey), "2026-02-22");

    EXPECT_EQ(sync.PushIfDue(Store(), kNextDay).status, PushStatus::kPushed);
    EXPECT_EQ(git_.Count("push"), 2);
}

TEST_F(PushTest, FailedPushStillCountsAsAttempt) {
    git_.On("remote", Output("origin\n"));
    git_.On("push", Failure("rejected"));
    auto sync = MakeSync();

    const auto first = sync.PushIfDue(Store(), kAfterHour);
    EXPECT_EQ(first.status, PushStatus::kFailed);
    EXPECT_EQ(first.detail, "push failed: rejected");
    EXPECT_EQ(sync.PushIfDue(Store(), kAfterHour).status, PushStatus::kAlreadyAttempted);
    EXPECT_EQ(git_.Count("push"), 1);
}

TEST_F(PushTest, NoRemoteRecordsAttempt) {
    git_.On("remote", Output(""));
    auto sync = MakeSync();
    EXPECT_EQ(sync.PushIfDue(Store(), kAfterHour).status, PushStatus::kNoRemote);
    EXPECT_EQ(sync.PushIfDue(Store(), kAfterHour).status, PushStatus::kAlreadyAttempted);
    EXPECT_EQ(git_.Count("push"), 0);
}

}  // namespace
