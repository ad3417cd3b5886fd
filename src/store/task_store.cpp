#include "store/task_store.hpp"

#include <utility>

#include "nlohmann/json.hpp"
#include "store/schema_migration.hpp"
#include "utils/common.hpp"

namespace aide::store {
namespace {

constexpr const char* kChatSessionPrefix = "chat_session:";
constexpr int kBusyTimeoutMs = 10000;

constexpr const char* kTaskColumns =
    "id, chat_id, user_id, username, text, attachments_json, status, "
    "created_at, started_at, finished_at, result_text, error_text";

std::vector<std::string> ParseAttachments(const std::string& text,
                                          std::int64_t task_id,
                                          const aide::utils::Logger& logger) {
    std::vector<std::string> attachments;
    auto json = nlohmann::json::parse(text, nullptr, false);
    if (!json.is_array()) {
        logger.Warn("task #" + std::to_string(task_id) + " has malformed attachments_json");
        return attachments;
    }
    for (const auto& item : json) {
        if (item.is_string()) {
            attachments.push_back(item.get<std::string>());
        }
    }
    return attachments;
}

Task ReadTask(sqlite3_stmt* stmt, const aide::utils::Logger& logger) {
    Task task{};
    task.id = sqlite3_column_int64(stmt, 0);
    task.chat_id = sqlite3_column_int64(stmt, 1);
    task.user_id = sqlite3_column_int64(stmt, 2);
    task.username = ColumnText(stmt, 3);
    task.text = ColumnText(stmt, 4);
    task.attachments = ParseAttachments(ColumnText(stmt, 5), task.id, logger);
    task.status = TaskStatusFromString(ColumnText(stmt, 6)).value_or(TaskStatus::kPending);
    task.created_at = ColumnText(stmt, 7);
    task.started_at = ColumnText(stmt, 8);
    task.finished_at = ColumnText(stmt, 9);
    task.result_text = ColumnText(stmt, 10);
    task.error_text = ColumnText(stmt, 11);
    return task;
}

}  // namespace

TaskStore::TaskStore(std::filesystem::path db_path, aide::utils::Logger logger)
    : db_path_(std::move(db_path))
    , logger_(std::move(logger)) {
    Open();
}

TaskStore::~TaskStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void TaskStore::Open() {
    if (db_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path_.parent_path(), ec);
    }
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(db_path_.string().c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        const std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("failed to open sqlite db " + db_path_.string() + ": " + message);
    }
    sqlite3_busy_timeout(db_, kBusyTimeoutMs);
    try {
        Exec(db_, "PRAGMA journal_mode=WAL;");
        UpgradeSchema(db_, logger_);
    } catch (const StoreError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

void TaskStore::Rollback() {
    char* err = nullptr;
    if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
        logger_.Error(std::string("rollback failed: ") + (err ? err : sqlite3_errmsg(db_)));
    }
    sqlite3_free(err);
}

std::int64_t TaskStore::Enqueue(std::int64_t chat_id,
                                std::int64_t user_id,
                                const std::string& username,
                                const std::string& text,
                                const std::vector<std::string>& attachments) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = Prepare(
        db_,
        "INSERT INTO tasks(chat_id, user_id, username, text, attachments_json, status, created_at) "
        "VALUES(?, ?, ?, ?, ?, 'pending', ?);");
    const auto attachments_json = nlohmann::json(attachments).dump();
    sqlite3_bind_int64(stmt.get(), 1, chat_id);
    sqlite3_bind_int64(stmt.get(), 2, user_id);
    BindText(stmt.get(), 3, username);
    BindText(stmt.get(), 4, text);
    BindText(stmt.get(), 5, attachments_json);
    BindText(stmt.get(), 6, aide::utils::NowIsoUtc());
    StepDone(db_, stmt.get(), "enqueue task");
    return sqlite3_last_insert_rowid(db_);
}

std::optional<Task> TaskStore::ClaimNext() {
    std::lock_guard<std::mutex> lock(mutex_);
    // IMMEDIATE takes the write lock up front, so the select and the update
    // below cannot interleave with another connection's claim.
    Exec(db_, "BEGIN IMMEDIATE;");
    try {
        auto select = Prepare(
            db_,
            std::string("SELECT ") + kTaskColumns +
                " FROM tasks WHERE status = 'pending' ORDER BY id ASC LIMIT 1;");
        const auto rc = sqlite3_step(select.get());
        if (rc == SQLITE_DONE) {
            select.reset();
            Exec(db_, "COMMIT;");
            return std::nullopt;
        }
        if (rc != SQLITE_ROW) {
            throw StoreError(std::string("claim select failed: ") + sqlite3_errmsg(db_));
        }
        auto task = ReadTask(select.get(), logger_);
        select.reset();

        task.status = TaskStatus::kRunning;
        task.started_at = aide::utils::NowIsoUtc();
        auto update = Prepare(
            db_,
            "UPDATE tasks SET status = 'running', started_at = ? WHERE id = ? AND status = 'pending';");
        BindText(update.get(), 1, task.started_at);
        sqlite3_bind_int64(update.get(), 2, task.id);
        StepDone(db_, update.get(), "claim update");
        if (sqlite3_changes(db_) != 1) {
            throw StoreError("claim update touched no row for task #" + std::to_string(task.id));
        }
        update.reset();
        Exec(db_, "COMMIT;");
        return task;
    } catch (const StoreError&) {
        Rollback();
        throw;
    }
}

void TaskStore::Complete(std::int64_t task_id, const std::string& result_text) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = Prepare(
        db_,
        "UPDATE tasks SET status = 'done', finished_at = ?, result_text = ?, error_text = NULL "
        "WHERE id = ?;");
    BindText(stmt.get(), 1, aide::utils::NowIsoUtc());
    BindText(stmt.get(), 2, result_text);
    sqlite3_bind_int64(stmt.get(), 3, task_id);
    StepDone(db_, stmt.get(), "complete task");
}

void TaskStore::Fail(std::int64_t task_id, const std::string& error_text) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = Prepare(
        db_,
        "UPDATE tasks SET status = 'failed', finished_at = ?, error_text = ? WHERE id = ?;");
    BindText(stmt.get(), 1, aide::utils::NowIsoUtc());
    BindText(stmt.get(), 2, error_text);
    sqlite3_bind_int64(stmt.get(), 3, task_id);
    StepDone(db_, stmt.get(), "fail task");
}

std::optional<Task> TaskStore::GetTask(std::int64_t task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = Prepare(db_, std::string("SELECT ") + kTaskColumns + " FROM tasks WHERE id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, task_id);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return ReadTask(stmt.get(), logger_);
}

std::string TaskStore::GetMeta(const std::string& key, const std::string& default_value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = Prepare(db_, "SELECT value FROM meta WHERE key = ?;");
    BindText(stmt.get(), 1, key);
    const auto rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return ColumnText(stmt.get(), 0);
    }
    if (rc != SQLITE_DONE) {
        throw StoreError("read meta " + key + ": " + sqlite3_errmsg(db_));
    }
    return default_value;
}

void TaskStore::SetMeta(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = Prepare(
        db_,
        "INSERT INTO meta(key, value) VALUES(?, ?) "
        "ON CONFLICT(key) DO UPDATE SET value = excluded.value;");
    BindText(stmt.get(), 1, key);
    BindText(stmt.get(), 2, value);
    StepDone(db_, stmt.get(), "write meta");
}

void TaskStore::DeleteMeta(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = Prepare(db_, "DELETE FROM meta WHERE key = ?;");
    BindText(stmt.get(), 1, key);
    StepDone(db_, stmt.get(), "delete meta");
}

std::string TaskStore::ChatSessionKey(std::int64_t chat_id) {
    return kChatSessionPrefix + std::to_string(chat_id);
}

std::string TaskStore::GetChatSessionId(std::int64_t chat_id) {
    return GetMeta(ChatSessionKey(chat_id), "");
}

void TaskStore::SetChatSessionId(std::int64_t chat_id, const std::string& session_id) {
    SetMeta(ChatSessionKey(chat_id), session_id);
}

void TaskStore::ClearChatSessionId(std::int64_t chat_id) {
    DeleteMeta(ChatSessionKey(chat_id));
}

std::vector<std::string> TaskStore::ListChatSessionIds() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    auto stmt = Prepare(db_, "SELECT value FROM meta WHERE key GLOB 'chat_session:*' ORDER BY key;");
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        auto value = ColumnText(stmt.get(), 0);
        if (!value.empty()) {
            ids.push_back(std::move(value));
        }
    }
    if (rc != SQLITE_DONE) {
        throw StoreError(std::string("list chat sessions: ") + sqlite3_errmsg(db_));
    }
    return ids;
}

TaskCounts TaskStore::Counts() {
    std::lock_guard<std::mutex> lock(mutex_);
    TaskCounts counts{};
    auto stmt = Prepare(db_, "SELECT status, COUNT(*) FROM tasks GROUP BY status;");
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        const auto status = TaskStatusFromString(ColumnText(stmt.get(), 0));
        const auto count = sqlite3_column_int(stmt.get(), 1);
        if (!status.has_value()) {
            continue;
        }
        switch (*status) {
            case TaskStatus::kPending: counts.pending = count; break;
            case TaskStatus::kRunning: counts.running = count; break;
            case TaskStatus::kDone: counts.done = count; break;
            case TaskStatus::kFailed: counts.failed = count; break;
        }
    }
    return counts;
}

}  // namespace aide::store
