#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

#include "config/config_schema.hpp"
#include "session/session_sweeper.hpp"
#include "utils/logging.hpp"

namespace aide::maintenance {

// Runs the session sweeper on a fixed interval in a background thread.
class SweepService {
public:
    using RetainProvider = std::function<std::unordered_set<std::string>()>;

    SweepService(aide::config::SessionGcConfig config,
                 std::filesystem::path sessions_dir,
                 RetainProvider retain,
                 aide::utils::Logger logger);
    ~SweepService();

    void Start();
    void Stop();
    aide::session::SweepResult TriggerNow();

    bool IsRunning() const { return running_; }

private:
    void RunLoop();

    aide::config::SessionGcConfig config_;
    std::filesystem::path sessions_dir_;
    RetainProvider retain_;
    aide::utils::Logger logger_;
    aide::session::SessionSweeper sweeper_;
    std::atomic<bool> running_{false};
    std::mutex wait_mutex_;
    std::condition_variable wake_;
    std::thread worker_;
};

}  // namespace aide::maintenance
