#include "channels/channel_base.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include "utils/common.hpp"

namespace aide::channels {
namespace {

struct Command {
    std::string name;
    std::string rest;
};

// "/new@my_bot some text" -> {"/new", "some text"}.
Command ParseCommand(const std::string& body) {
    Command command{};
    if (body.empty() || body.front() != '/') {
        return command;
    }
    const auto space = body.find_first_of(" \t\n");
    command.name = body.substr(0, space);
    const auto at = command.name.find('@');
    if (at != std::string::npos) {
        command.name.erase(at);
    }
    if (space != std::string::npos) {
        command.rest = aide::utils::Trim(body.substr(space));
    }
    return command;
}

}  // namespace

ChannelBase::ChannelBase(std::string name,
                         aide::store::TaskStore& store,
                         std::vector<std::string> allow_from,
                         std::vector<std::int64_t> allow_chats,
                         aide::utils::Logger logger)
    : name_(std::move(name))
    , store_(store)
    , allow_from_(std::move(allow_from))
    , allow_chats_(std::move(allow_chats))
    , logger_(std::move(logger)) {}

std::string ChannelBase::HelpText() {
    return "Assistant is online.\n\n"
           "Send a message or a file and it is queued as a task for the agent.\n"
           "/status shows the queue.\n"
           "/new starts a fresh agent session for this chat "
           "(text after the command is queued in the new session).";
}

bool ChannelBase::IsAllowed(const aide::bus::InboundMessage& msg) const {
    if (!allow_from_.empty()) {
        const auto user_id = std::to_string(msg.user_id);
        const bool listed =
            std::find(allow_from_.begin(), allow_from_.end(), user_id) != allow_from_.end() ||
            (msg.username && !msg.username->empty() &&
             std::find(allow_from_.begin(), allow_from_.end(), *msg.username) != allow_from_.end());
        if (!listed) {
            return false;
        }
    }
    if (!allow_chats_.empty() &&
        std::find(allow_chats_.begin(), allow_chats_.end(), msg.chat_id) == allow_chats_.end()) {
        return false;
    }
    return true;
}

void ChannelBase::HandleMessage(const aide::bus::InboundMessage& msg) {
    if (!IsAllowed(msg)) {
        logger_.Log({aide::utils::LogLevel::kWarn, "message blocked by allow list",
                     {{"chat_id", std::to_string(msg.chat_id)},
                      {"user_id", std::to_string(msg.user_id)}}});
        return;
    }

    const auto body = msg.Body();
    const auto command = ParseCommand(body);
    if (command.name == "/start" || command.name == "/help") {
        Reply(msg.chat_id, HelpText());
        return;
    }
    if (command.name == "/status") {
        Reply(msg.chat_id, RenderStatus(msg.chat_id));
        return;
    }
    if (command.name == "/new" || command.name == "/reset") {
        store_.ClearChatSessionId(msg.chat_id);
        logger_.Info("session reset for chat " + std::to_string(msg.chat_id));
        Reply(msg.chat_id, "Started a new session.");
        if (!command.rest.empty() || !msg.attachments.empty()) {
            Enqueue(msg, command.rest);
        }
        return;
    }

    if (body.empty() && msg.attachments.empty()) {
        return;
    }
    Enqueue(msg, body);
}

void ChannelBase::Enqueue(const aide::bus::InboundMessage& msg, const std::string& text) {
    const auto task_id = store_.Enqueue(
        msg.chat_id, msg.user_id, msg.DisplayName(), text, msg.attachments);
    logger_.Log({aide::utils::LogLevel::kInfo, "task queued",
                 {{"task_id", std::to_string(task_id)},
                  {"chat_id", std::to_string(msg.chat_id)},
                  {"attachments", std::to_string(msg.attachments.size())}}});
    Reply(msg.chat_id, "Task #" + std::to_string(task_id) + " queued.");
    if (on_enqueued_) {
        on_enqueued_(task_id);
    }
}

std::string ChannelBase::RenderStatus(std::int64_t chat_id) {
    const auto counts = store_.Counts();
    const auto session = store_.GetChatSessionId(chat_id);
    std::ostringstream oss;
    oss << "Queue status:\n"
        << "- pending: " << counts.pending << "\n"
        << "- running: " << counts.running << "\n"
        << "- done: " << counts.done << "\n"
        << "- failed: " << counts.failed << "\n"
        << "- session: " << (session.empty() ? "none" : session);
    return oss.str();
}

void ChannelBase::Reply(std::int64_t chat_id, const std::string& text) {
    try {
        SendText(chat_id, text);
    } catch (const ChannelError& ex) {
        logger_.Warn("failed to reply to chat " + std::to_string(chat_id) + ": " + ex.what());
    }
}

}  // namespace aide::channels
