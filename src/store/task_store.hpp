#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "sqlite3.h"
#include "store/sqlite_helpers.hpp"
#include "store/task_types.hpp"
#include "utils/logging.hpp"

namespace aide::store {

// Durable FIFO task queue plus a string key/value table, backed by one SQLite file.
// Every instance owns its own connection; several instances (or processes) may share
// one file and ClaimNext still hands each pending row to exactly one caller.
class TaskStore {
public:
    TaskStore(std::filesystem::path db_path, aide::utils::Logger logger);
    ~TaskStore();

    TaskStore(const TaskStore&) = delete;
    TaskStore& operator=(const TaskStore&) = delete;

    std::int64_t Enqueue(std::int64_t chat_id,
                         std::int64_t user_id,
                         const std::string& username,
                         const std::string& text,
                         const std::vector<std::string>& attachments);
    std::optional<Task> ClaimNext();
    void Complete(std::int64_t task_id, const std::string& result_text);
    void Fail(std::int64_t task_id, const std::string& error_text);
    std::optional<Task> GetTask(std::int64_t task_id);

    std::string GetMeta(const std::string& key, const std::string& default_value = "");
    void SetMeta(const std::string& key, const std::string& value);
    void DeleteMeta(const std::string& key);

    std::string GetChatSessionId(std::int64_t chat_id);
    void SetChatSessionId(std::int64_t chat_id, const std::string& session_id);
    void ClearChatSessionId(std::int64_t chat_id);
    std::vector<std::string> ListChatSessionIds();

    TaskCounts Counts();

    const std::filesystem::path& Path() const { return db_path_; }

    static std::string ChatSessionKey(std::int64_t chat_id);

private:
    void Open();
    void Rollback();

    std::filesystem::path db_path_;
    aide::utils::Logger logger_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

}  // namespace aide::store
