#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace aide::store {

enum class TaskStatus {
    kPending,
    kRunning,
    kDone,
    kFailed
};

inline const char* ToString(TaskStatus status) {
    switch (status) {
        case TaskStatus::kPending: return "pending";
        case TaskStatus::kRunning: return "running";
        case TaskStatus::kDone: return "done";
        case TaskStatus::kFailed: return "failed";
    }
    return "pending";
}

inline std::optional<TaskStatus> TaskStatusFromString(const std::string& value) {
    if (value == "pending") return TaskStatus::kPending;
    if (value == "running") return TaskStatus::kRunning;
    if (value == "done") return TaskStatus::kDone;
    if (value == "failed") return TaskStatus::kFailed;
    return std::nullopt;
}

struct Task {
    std::int64_t id = 0;
    std::int64_t chat_id = 0;
    std::int64_t user_id = 0;
    std::string username;
    std::string text;
    std::vector<std::string> attachments;
    TaskStatus status = TaskStatus::kPending;
    std::string created_at;
    std::string started_at;
    std::string finished_at;
    std::string result_text;
    std::string error_text;
};

struct TaskCounts {
    int pending = 0;
    int running = 0;
    int done = 0;
    int failed = 0;
};

}  // namespace aide::store
