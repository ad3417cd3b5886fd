#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "agent/agent_client.hpp"
#include "channels/channel_base.hpp"
#include "config/config_schema.hpp"
#include "git/repository_sync.hpp"
#include "store/task_store.hpp"
#include "utils/logging.hpp"

namespace aide::worker {

struct FileDelivery {
    std::vector<std::string> sent;
    std::vector<std::string> errors;
};

// Takes tasks off the queue one at a time and drives the agent for each.
class Worker {
public:
    // `sync` may be null, which disables commits and pushes.
    Worker(aide::config::Config config,
           aide::store::TaskStore& store,
           aide::channels::ChannelBase& channel,
           aide::agent::AgentRunner& agent,
           aide::git::RepositorySync* sync,
           aide::utils::Logger logger);

    // Blocks until Stop(). Errors are logged and the loop keeps going.
    void Run();
    void Stop();
    // Cuts the current idle wait short.
    void Notify();

    // Claims and processes at most one task; false when the queue was empty.
    bool RunOnce();
    void ProcessTask(const aide::store::Task& task);

    static std::string ComposeResult(const std::string& text, const FileDelivery& delivery);

private:
    FileDelivery DeliverFiles(std::int64_t chat_id, const std::vector<std::string>& paths);
    // Commit and push outcomes are logged only.
    void SyncRepository(std::int64_t task_id);
    // Marks a task that processing abandoned as failed so it never stays running.
    void FailIfStillRunning(const aide::store::Task& task, const std::string& reason);
    void SafeSend(std::int64_t chat_id, const std::string& text);
    void IdleWait();

    aide::config::Config config_;
    std::filesystem::path root_;
    aide::store::TaskStore& store_;
    aide::channels::ChannelBase& channel_;
    aide::agent::AgentRunner& agent_;
    aide::git::RepositorySync* sync_;
    aide::utils::Logger logger_;
    std::atomic<bool> stop_{false};
    bool pending_wake_ = false;
    std::mutex wait_mutex_;
    std::condition_variable wake_;
};

}  // namespace aide::worker
