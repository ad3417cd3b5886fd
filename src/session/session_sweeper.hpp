#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <unordered_set>

#include "utils/logging.hpp"

namespace aide::session {

struct SweepResult {
    int deleted = 0;
    int kept = 0;
    int skipped = 0;
    int errors = 0;
};

// Deletes old agent transcripts (`rollout-*.jsonl`) whose session is no longer bound to a chat.
class SessionSweeper {
public:
    explicit SessionSweeper(aide::utils::Logger logger);

    // Files modified within `older_than_days` are skipped. Older files are kept when the
    // session id in their name is in `retain`, deleted otherwise.
    SweepResult Sweep(const std::filesystem::path& sessions_dir,
                      const std::unordered_set<std::string>& retain,
                      int older_than_days) const;

    // Last UUID in the file name, lowercased; empty if none.
    static std::string ExtractSessionId(const std::string& file_name);

private:
    void RemoveEmptyDirectories(const std::filesystem::path& sessions_dir) const;

    aide::utils::Logger logger_;
};

}  // namespace aide::session
