#include "session/session_sweeper.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <utility>
#include <vector>

namespace aide::session {
namespace {

constexpr const char* kTranscriptPrefix = "rollout-";
constexpr const char* kTranscriptSuffix = ".jsonl";

bool IsTranscript(const std::filesystem::path& path) {
    const auto name = path.filename().string();
    const std::string prefix = kTranscriptPrefix;
    const std::string suffix = kTranscriptSuffix;
    return name.size() > prefix.size() + suffix.size() &&
           name.compare(0, prefix.size(), prefix) == 0 &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

}  // namespace

SessionSweeper::SessionSweeper(aide::utils::Logger logger)
    : logger_(std::move(logger)) {}

std::string SessionSweeper::ExtractSessionId(const std::string& file_name) {
    static const std::regex kUuid(
        "[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}");
    std::string last;
    for (auto it = std::sregex_iterator(file_name.begin(), file_name.end(), kUuid);
         it != std::sregex_iterator(); ++it) {
        last = it->str();
    }
    return ToLower(last);
}

SweepResult SessionSweeper::Sweep(const std::filesystem::path& sessions_dir,
                                  const std::unordered_set<std::string>& retain,
                                  int older_than_days) const {
    SweepResult result{};
    std::error_code ec;
    if (!std::filesystem::is_directory(sessions_dir, ec)) {
        logger_.Debug("sessions directory does not exist: " + sessions_dir.string());
        return result;
    }

    std::unordered_set<std::string> retained;
    for (const auto& id : retain) {
        retained.insert(ToLower(id));
    }
    const auto cutoff = std::filesystem::file_time_type::clock::now() -
                        std::chrono::hours(24) * std::max(older_than_days, 0);

    std::vector<std::filesystem::path> candidates;
    std::filesystem::recursive_directory_iterator it(
        sessions_dir, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        logger_.Warn("cannot scan " + sessions_dir.string() + ": " + ec.message());
        ++result.errors;
        return result;
    }
    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            ++result.errors;
            ec.clear();
            continue;
        }
        if (it->is_regular_file(ec) && IsTranscript(it->path())) {
            candidates.push_back(it->path());
        }
    }

    for (const auto& path : candidates) {
        const auto modified = std::filesystem::last_write_time(path, ec);
        if (ec) {
            ++result.errors;
            ec.clear();
            continue;
        }
        if (modified > cutoff) {
            ++result.skipped;
            continue;
        }
        const auto session_id = ExtractSessionId(path.filename().string());
        if (!session_id.empty() && retained.count(session_id) > 0) {
            ++result.kept;
            continue;
        }
        if (!std::filesystem::remove(path, ec) || ec) {
            logger_.Warn("failed to delete " + path.string() +
                         (ec ? ": " + ec.message() : std::string()));
            ++result.errors;
            ec.clear();
            continue;
        }
        ++result.deleted;
    }

    RemoveEmptyDirectories(sessions_dir);
    logger_.Log({aide::utils::LogLevel::kInfo, "session sweep finished",
                 {{"deleted", std::to_string(result.deleted)},
                  {"kept", std::to_string(result.kept)},
                  {"skipped", std::to_string(result.skipped)},
                  {"errors", std::to_string(result.errors)}}});
    return result;
}

void SessionSweeper::RemoveEmptyDirectories(const std::filesystem::path& sessions_dir) const {
    std::error_code ec;
    std::vector<std::filesystem::path> directories;
    std::filesystem::recursive_directory_iterator it(
        sessions_dir, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        return;
    }
    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            ec.clear();
            continue;
        }
        if (it->is_directory(ec)) {
            directories.push_back(it->path());
        }
    }
    // Deepest first so parents empty out after their children.
    std::sort(directories.begin(), directories.end(),
              [](const std::filesystem::path& a, const std::filesystem::path& b) {
                  return a.string().size() > b.string().size();
              });
    for (const auto& dir : directories) {
        if (std::filesystem::is_empty(dir, ec) && !ec) {
            std::filesystem::remove(dir, ec);
        }
        ec.clear();
    }
}

}  // namespace aide::session
