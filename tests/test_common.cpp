#include <gtest/gtest.h>

#include <sstream>

#include "bus/events.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace {

using namespace aide::utils;

std::chrono::system_clock::time_point At(std::time_t unix_seconds) {
    return std::chrono::system_clock::from_time_t(unix_seconds);
}

TEST(TimeFormatTest, UtcRendering) {
    // 2026-02-22T03:15:00Z
    const auto when = At(1771730100);
    EXPECT_EQ(FormatIsoUtc(when), "2026-02-22T03:15:00Z");
    EXPECT_EQ(FormatDateUtc(when), "2026-02-22");
    EXPECT_EQ(HourUtc(when), 3);
}

TEST(SplitArgsTest, QuotesGroupWords) {
    EXPECT_EQ(SplitArgs("  -c 'a b'  --flag \"x \\\"y\\\"\" plain "),
              (std::vector<std::string>{"-c", "a b", "--flag", "x \"y\"", "plain"}));
    EXPECT_TRUE(SplitArgs("   ").empty());
    EXPECT_EQ(SplitArgs("''"), (std::vector<std::string>{""}));
}

TEST(SplitLinesTest, HandlesCrLfAndTrailingNewline) {
    EXPECT_EQ(SplitLines("a\r\nb\n\nc\n"), (std::vector<std::string>{"a", "b", "", "c"}));
}

TEST(Utf8Test, LengthAndPrefix) {
    const std::string text = "a\xD0\xB6" "b";
    EXPECT_EQ(Utf8Length(text), 3u);
    EXPECT_EQ(Utf8Prefix(text, 2), "a\xD0\xB6");
    EXPECT_EQ(Utf8Prefix(text, 10), text);
}

TEST(ChunkTextTest, ShortTextIsOneChunk) {
    EXPECT_EQ(ChunkText("hello", 4096), (std::vector<std::string>{"hello"}));
    EXPECT_TRUE(ChunkText("", 4096).empty());
}

TEST(ChunkTextTest, PrefersLineBreaks) {
    const std::string text = std::string(6, 'a') + "\n" + std::string(6, 'b');
    EXPECT_EQ(ChunkText(text, 10), (std::vector<std::string>{"aaaaaa", "bbbbbb"}));
}

TEST(ChunkTextTest, HardSplitWithoutBreaks) {
    EXPECT_EQ(ChunkText(std::string(25, 'x'), 10),
              (std::vector<std::string>{std::string(10, 'x'), std::string(10, 'x'), std::string(5, 'x')}));
}

TEST(LoggerTest, WritesLevelTagAndFields) {
    std::ostringstream sink;
    LogConfig config{};
    config.min_level = LogLevel::kInfo;
    config.sink = &sink;
    Logger logger("aide", config);
    const auto worker = logger.WithTag("worker");

    worker.Debug("hidden");
    worker.Log({LogLevel::kInfo, "task claimed", {{"task_id", "12"}, {"chat_id", "42"}}});

    const auto line = sink.str();
    EXPECT_EQ(line.find("hidden"), std::string::npos);
    EXPECT_NE(line.find(" INFO [worker] task claimed task_id=12 chat_id=42\n"), std::string::npos);
}

TEST(LoggerTest, ParsesLevels) {
    EXPECT_EQ(ParseLogLevel("DEBUG"), LogLevel::kDebug);
    EXPECT_EQ(ParseLogLevel("warning"), LogLevel::kWarn);
    EXPECT_EQ(ParseLogLevel("error"), LogLevel::kError);
    EXPECT_EQ(ParseLogLevel("loud", LogLevel::kWarn), LogLevel::kWarn);
}

TEST(InboundMessageTest, BodyPrefersTextOverCaption) {
    aide::bus::InboundMessage msg{};
    msg.caption = " caption ";
    EXPECT_EQ(msg.Body(), "caption");
    msg.text = "  text  ";
    EXPECT_EQ(msg.Body(), "text");
}

TEST(InboundMessageTest, DisplayNameFallbacks) {
    aide::bus::InboundMessage msg{};
    EXPECT_EQ(msg.DisplayName(), "unknown");
    msg.first_name = "Ada";
    msg.last_name = "Lovelace";
    EXPECT_EQ(msg.DisplayName(), "Ada Lovelace");
    msg.username = "ada";
    EXPECT_EQ(msg.DisplayName(), "ada");
}

}  // namespace
