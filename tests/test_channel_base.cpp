#include <gtest/gtest.h>

#include <memory>

#include "recording_channel.hpp"
#include "store/task_store.hpp"
#include "test_helpers.hpp"

namespace {

using aide::bus::InboundMessage;
using aide::testing::RecordingChannel;

InboundMessage Message(std::int64_t chat_id, std::int64_t user_id, const std::string& text) {
    InboundMessage msg{};
    msg.chat_id = chat_id;
    msg.user_id = user_id;
    msg.username = "alice";
    msg.text = text;
    return msg;
}

class ChannelBaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<aide::store::TaskStore>(dir_ / "state.db", aide::testing::QuietLogger());
    }

    RecordingChannel Channel(std::vector<std::string> allow_from = {},
                             std::vector<std::int64_t> allow_chats = {}) {
        return RecordingChannel(*store_, std::move(allow_from), std::move(allow_chats),
                                aide::testing::QuietLogger());
    }

    aide::testing::TempDir dir_;
    std::unique_ptr<aide::store::TaskStore> store_;
};

TEST_F(ChannelBaseTest, QueuesPlainMessageAndAcknowledges) {
    auto channel = Channel();
    std::int64_t notified = 0;
    channel.SetEnqueueListener([&notified](std::int64_t task_id) { notified = task_id; });

    auto msg = Message(42, 7, "  summarize the inbox  ");
    msg.attachments = {"inbox_files/a.pdf"};
    channel.HandleMessage(msg);

    ASSERT_EQ(channel.texts.size(), 1u);
    EXPECT_EQ(channel.texts[0].first, 42);
    EXPECT_EQ(channel.texts[0].second, "Task #1 queued.");
    EXPECT_EQ(notified, 1);

    const auto task = store_->GetTask(1);
    ASSERT_TRUE(task);
    EXPECT_EQ(task->text, "summarize the inbox");
    EXPECT_EQ(task->username, "alice");
    EXPECT_EQ(task->attachments, (std::vector<std::string>{"inbox_files/a.pdf"}));
}

TEST_F(ChannelBaseTest, CaptionIsUsedWhenTextIsMissing) {
    auto channel = Channel();
    InboundMessage msg{};
    msg.chat_id = 1;
    msg.user_id = 2;
    msg.caption = "photo notes";
    msg.attachments = {"inbox_files/p.jpg"};
    channel.HandleMessage(msg);
    const auto task = store_->GetTask(1);
    ASSERT_TRUE(task);
    EXPECT_EQ(task->text, "photo notes");
    EXPECT_EQ(task->username, "unknown");
}

TEST_F(ChannelBaseTest, EmptyMessageIsIgnored) {
    auto channel = Channel();
    channel.HandleMessage(Message(1, 2, "   "));
    EXPECT_TRUE(channel.texts.empty());
    EXPECT_EQ(store_->Counts().pending, 0);
}

TEST_F(ChannelBaseTest, AllowFromMatchesIdOrUsername) {
    auto by_id = Channel({"7"});
    by_id.HandleMessage(Message(1, 7, "ok"));
    by_id.HandleMessage(Message(1, 8, "blocked"));

    auto by_name = Channel({"alice"});
    by_name.HandleMessage(Message(1, 99, "ok too"));

    EXPECT_EQ(store_->Counts().pending, 2);
    EXPECT_EQ(by_id.texts.size(), 1u);
}

TEST_F(ChannelBaseTest, AllowChatsRestrictsChats) {
    auto channel = Channel({}, {42});
    EXPECT_TRUE(channel.IsAllowed(Message(42, 1, "x")));
    EXPECT_FALSE(channel.IsAllowed(Message(43, 1, "x")));
    channel.HandleMessage(Message(43, 1, "x"));
    EXPECT_TRUE(channel.texts.empty());
    EXPECT_EQ(store_->Counts().pending, 0);
}

TEST_F(ChannelBaseTest, HelpAndStatusAreAnsweredDirectly) {
    auto channel = Channel();
    store_->SetChatSessionId(42, "S1");
    store_->Enqueue(42, 1, "u", "waiting", {});

    channel.HandleMessage(Message(42, 1, "/start"));
    channel.HandleMessage(Message(42, 1, "/status@aide_bot"));

    ASSERT_EQ(channel.texts.size(), 2u);
    EXPECT_EQ(channel.texts[0].second, RecordingChannel::HelpText());
    EXPECT_NE(channel.texts[1].second.find("- pending: 1"), std::string::npos);
    EXPECT_NE(channel.texts[1].second.find("- session: S1"), std::string::npos);
    EXPECT_EQ(store_->Counts().pending, 1);
}

TEST_F(ChannelBaseTest, NewClearsSessionAndQueuesFollowingText) {
    auto channel = Channel();
    store_->SetChatSessionId(42, "S1");

    channel.HandleMessage(Message(42, 1, "/new"));
    EXPECT_EQ(store_->GetChatSessionId(42), "");
    EXPECT_EQ(store_->Counts().pending, 0);

    store_->SetChatSessionId(42, "S2");
    channel.HandleMessage(Message(42, 1, "/reset plan my week"));
    EXPECT_EQ(store_->GetChatSessionId(42), "");
    const auto task = store_->GetTask(1);
    ASSERT_TRUE(task);
    EXPECT_EQ(task->text, "plan my week");
    EXPECT_EQ(channel.texts.back().second, "Task #1 queued.");
}

TEST_F(ChannelBaseTest, ReplyFailureDoesNotLoseTask) {
    auto channel = Channel();
    channel.fail_text = true;
    channel.HandleMessage(Message(1, 1, "still queued"));
    EXPECT_EQ(store_->Counts().pending, 1);
}

}  // namespace
