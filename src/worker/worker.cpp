#include "worker/worker.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include "agent/prompt_builder.hpp"
#include "agent/response_parser.hpp"
#include "utils/common.hpp"

namespace aide::worker {
namespace {

std::string Bullets(const std::vector<std::string>& items) {
    std::vector<std::string> lines;
    lines.reserve(items.size());
    for (const auto& item : items) {
        lines.push_back("- " + item);
    }
    return aide::utils::Join(lines, "\n");
}

}  // namespace

Worker::Worker(aide::config::Config config,
               aide::store::TaskStore& store,
               aide::channels::ChannelBase& channel,
               aide::agent::AgentRunner& agent,
               aide::git::RepositorySync* sync,
               aide::utils::Logger logger)
    : config_(std::move(config))
    , root_(config_.root)
    , store_(store)
    , channel_(channel)
    , agent_(agent)
    , sync_(sync)
    , logger_(std::move(logger)) {}

void Worker::Run() {
    logger_.Info("worker started");
    while (!stop_) {
        bool processed = false;
        try {
            processed = RunOnce();
        } catch (const aide::store::StoreError& ex) {
            logger_.Error(std::string("task store error: ") + ex.what());
        } catch (const std::exception& ex) {
            logger_.Error(std::string("task processing error: ") + ex.what());
        }
        if (!processed) {
            IdleWait();
        }
    }
    logger_.Info("worker stopped");
}

void Worker::Stop() {
    stop_ = true;
    Notify();
}

void Worker::Notify() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        pending_wake_ = true;
    }
    wake_.notify_all();
}

void Worker::IdleWait() {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wake_.wait_for(lock, std::chrono::milliseconds(config_.worker.idle_sleep_ms),
                   [this]() { return pending_wake_ || stop_; });
    pending_wake_ = false;
}

bool Worker::RunOnce() {
    auto task = store_.ClaimNext();
    if (!task) {
        return false;
    }
    try {
        ProcessTask(*task);
    } catch (const std::exception& ex) {
        logger_.Log({aide::utils::LogLevel::kError, "task processing aborted",
                     {{"task_id", std::to_string(task->id)}, {"error", ex.what()}}});
        FailIfStillRunning(*task, ex.what());
    }
    return true;
}

void Worker::FailIfStillRunning(const aide::store::Task& task, const std::string& reason) {
    const auto current = store_.GetTask(task.id);
    if (!current || current->status != aide::store::TaskStatus::kRunning) {
        return;
    }
    const auto error_text = aide::agent::TrimResult(
        "Task #" + std::to_string(task.id) + " failed.\n\n" + reason,
        static_cast<std::size_t>(config_.worker.max_result_chars));
    store_.Fail(task.id, error_text);
    SafeSend(task.chat_id, error_text);
}

void Worker::ProcessTask(const aide::store::Task& task) {
    logger_.Log({aide::utils::LogLevel::kInfo, "task claimed",
                 {{"task_id", std::to_string(task.id)},
                  {"chat_id", std::to_string(task.chat_id)}}});

    const auto stored_session = store_.GetChatSessionId(task.chat_id);
    const auto prompt = aide::agent::BuildPrompt(
        task.text, task.attachments, stored_session.empty(), config_.agent.instructions_file);

    try {
        channel_.SendChatAction(task.chat_id, "typing");
    } catch (const aide::channels::ChannelError& ex) {
        logger_.Debug(std::string("chat action failed: ") + ex.what());
    } catch (const std::exception& ex) {
        logger_.Warn(std::string("chat action error: ") + ex.what());
    }

    const auto result = agent_.Run(prompt, stored_session);
    if (!result.session_id.empty() && result.session_id != stored_session) {
        store_.SetChatSessionId(task.chat_id, result.session_id);
        logger_.Log({aide::utils::LogLevel::kInfo, "chat session updated",
                     {{"task_id", std::to_string(task.id)},
                      {"chat_id", std::to_string(task.chat_id)},
                      {"session", result.session_id}}});
    }

    const auto limit = static_cast<std::size_t>(config_.worker.max_result_chars);
    if (!result.success) {
        const auto error_text = aide::agent::TrimResult(
            "Task #" + std::to_string(task.id) + " failed.\n\n" + result.message, limit);
        store_.Fail(task.id, error_text);
        logger_.Log({aide::utils::LogLevel::kWarn, "task failed",
                     {{"task_id", std::to_string(task.id)}}});
        SafeSend(task.chat_id, error_text);
        return;
    }

    const auto parsed = aide::agent::ParseAgentResponse(result.message);
    const auto text = aide::agent::TrimResult(parsed.text, limit);
    if (!text.empty()) {
        SafeSend(task.chat_id, text);
    }
    const auto delivery = DeliverFiles(task.chat_id, parsed.file_paths);
    if (!delivery.errors.empty()) {
        SafeSend(task.chat_id, "Some files could not be sent:\n" + Bullets(delivery.errors));
    }

    store_.Complete(task.id, ComposeResult(text, delivery));
    logger_.Log({aide::utils::LogLevel::kInfo, "task done",
                 {{"task_id", std::to_string(task.id)},
                  {"files_sent", std::to_string(delivery.sent.size())},
                  {"file_errors", std::to_string(delivery.errors.size())}}});

    SyncRepository(task.id);
}

FileDelivery Worker::DeliverFiles(std::int64_t chat_id, const std::vector<std::string>& paths) {
    FileDelivery delivery{};
    for (const auto& raw : paths) {
        const auto check = aide::agent::ResolveFileForSend(
            root_, raw, config_.worker.max_send_file_bytes);
        if (!check.path) {
            delivery.errors.push_back(check.detail);
            continue;
        }
        try {
            channel_.SendFile(chat_id, *check.path, check.detail);
            delivery.sent.push_back(check.detail);
        } catch (const std::exception& ex) {
            delivery.errors.push_back("failed to send " + check.detail + ": " + ex.what());
        }
    }
    return delivery;
}

void Worker::SyncRepository(std::int64_t task_id) {
    if (!sync_) {
        return;
    }
    aide::git::CommitOutcome commit{};
    aide::git::PushOutcome push{};
    try {
        commit = sync_->CommitIfNeeded(task_id);
        push = sync_->PushIfDue(store_);
    } catch (const std::exception& ex) {
        logger_.Error("repository sync failed for task " + std::to_string(task_id) + ": " + ex.what());
        return;
    }
    logger_.Log({aide::utils::LogLevel::kInfo, "repository sync",
                 {{"task_id", std::to_string(task_id)},
                  {"commit", std::string(aide::git::ToString(commit.status)) + ": " + commit.detail},
                  {"push", std::string(aide::git::ToString(push.status)) + ": " + push.detail}}});
}

std::string Worker::ComposeResult(const std::string& text, const FileDelivery& delivery) {
    std::vector<std::string> sections;
    if (!text.empty()) {
        sections.push_back(text);
    }
    if (!delivery.sent.empty()) {
        sections.push_back("Sent files:\n" + Bullets(delivery.sent));
    }
    if (!delivery.errors.empty()) {
        sections.push_back("File send errors:\n" + Bullets(delivery.errors));
    }
    return aide::utils::Join(sections, "\n\n");
}

void Worker::SafeSend(std::int64_t chat_id, const std::string& text) {
    try {
        channel_.SendText(chat_id, text);
    } catch (const std::exception& ex) {
        logger_.Error("failed to send message to chat " + std::to_string(chat_id) + ": " + ex.what());
    }
}

}  // namespace aide::worker
