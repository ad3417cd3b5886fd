#include <gtest/gtest.h>

#include <chrono>

#include "session/session_sweeper.hpp"
#include "test_helpers.hpp"

namespace {

using aide::session::SessionSweeper;

constexpr const char* kRetained = "0199a213-81c0-7800-8aa1-bbab2a035a53";
constexpr const char* kOrphan = "0199a213-81c0-7800-8aa1-000000000001";

class SessionSweeperTest : public ::testing::Test {
protected:
    std::filesystem::path Transcript(const std::string& relative, std::chrono::hours age) {
        const auto path = dir_ / relative;
        aide::testing::WriteFile(path, "{}\n");
        std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now() - age);
        return path;
    }

    aide::testing::TempDir dir_;
    SessionSweeper sweeper_{aide::testing::QuietLogger()};
};

TEST(SessionIdTest, TakesLastUuidLowercased) {
    EXPECT_EQ(SessionSweeper::ExtractSessionId(
                  "rollout-2026-02-20T10-00-00-0199A213-81C0-7800-8AA1-BBAB2A035A53.jsonl"),
              kRetained);
    EXPECT_EQ(SessionSweeper::ExtractSessionId(
                  "rollout-11111111-2222-3333-4444-555555555555-" + std::string(kOrphan) + ".jsonl"),
              kOrphan);
    EXPECT_EQ(SessionSweeper::ExtractSessionId("rollout-2026-02-20.jsonl"), "");
}

TEST_F(SessionSweeperTest, AppliesRetentionRules) {
    const auto retained_old = Transcript(
        "2026/02/01/rollout-2026-02-01T10-00-00-" + std::string(kRetained) + ".jsonl", std::chrono::hours(240));
    const auto orphan_old = Transcript(
        "2026/02/01/rollout-2026-02-01T11-00-00-" + std::string(kOrphan) + ".jsonl", std::chrono::hours(240));
    const auto orphan_recent = Transcript(
        "2026/02/10/rollout-2026-02-10T11-00-00-0199a213-81c0-7800-8aa1-000000000002.jsonl",
        std::chrono::hours(1));

    const auto result = sweeper_.Sweep(dir_.Path(), {kRetained}, 7);
    EXPECT_EQ(result.deleted, 1);
    EXPECT_EQ(result.kept, 1);
    EXPECT_EQ(result.skipped, 1);
    EXPECT_EQ(result.errors, 0);
    EXPECT_TRUE(std::filesystem::exists(retained_old));
    EXPECT_FALSE(std::filesystem::exists(orphan_old));
    EXPECT_TRUE(std::filesystem::exists(orphan_recent));
}

TEST_F(SessionSweeperTest, RetainSetIsCaseInsensitive) {
    const auto path = Transcript("rollout-x-" + std::string(kRetained) + ".jsonl", std::chrono::hours(240));
    const auto result = sweeper_.Sweep(dir_.Path(), {"0199A213-81C0-7800-8AA1-BBAB2A035A53"}, 7);
    EXPECT_EQ(result.kept, 1);
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(SessionSweeperTest, OldFileWithoutIdIsDeleted) {
    const auto path = Transcript("rollout-unnamed.jsonl", std::chrono::hours(240));
    const auto result = sweeper_.Sweep(dir_.Path(), {}, 7);
    EXPECT_EQ(result.deleted, 1);
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(SessionSweeperTest, IgnoresOtherFiles) {
    aide::testing::WriteFile(dir_ / "history.jsonl", "{}");
    aide::testing::WriteFile(dir_ / ("rollout-" + std::string(kOrphan) + ".json"), "{}");
    std::filesystem::last_write_time(dir_ / "history.jsonl",
                                     std::filesystem::file_time_type::clock::now() - std::chrono::hours(240));
    const auto result = sweeper_.Sweep(dir_.Path(), {}, 7);
    EXPECT_EQ(result.deleted + result.kept + result.skipped, 0);
    EXPECT_TRUE(std::filesystem::exists(dir_ / "history.jsonl"));
}

TEST_F(SessionSweeperTest, RemovesEmptiedDirectories) {
    Transcript("2026/01/05/rollout-" + std::string(kOrphan) + ".jsonl", std::chrono::hours(24 * 30));
    Transcript("2026/02/20/rollout-" + std::string(kRetained) + ".jsonl", std::chrono::hours(24 * 30));
    sweeper_.Sweep(dir_.Path(), {kRetained}, 7);
    EXPECT_FALSE(std::filesystem::exists(dir_ / "2026/01/05"));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "2026/01"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "2026/02/20"));
    EXPECT_TRUE(std::filesystem::exists(dir_.Path()));
}

TEST_F(SessionSweeperTest, MissingDirectoryIsANoOp) {
    const auto result = sweeper_.Sweep(dir_ / "absent", {}, 7);
    EXPECT_EQ(result.deleted + result.kept + result.skipped + result.errors, 0);
}

}  // namespace
