#include "maintenance/sweep_service.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace aide::maintenance {

SweepService::SweepService(aide::config::SessionGcConfig config,
                           std::filesystem::path sessions_dir,
                           RetainProvider retain,
                           aide::utils::Logger logger)
    : config_(std::move(config))
    , sessions_dir_(std::move(sessions_dir))
    , retain_(std::move(retain))
    , logger_(std::move(logger))
    , sweeper_(logger_) {}

SweepService::~SweepService() {
    Stop();
}

void SweepService::Start() {
    if (!config_.enabled || running_.exchange(true)) {
        return;
    }
    logger_.Info("session sweep every " + std::to_string(config_.interval_s) + " s in " +
                 sessions_dir_.string());
    worker_ = std::thread([this]() { RunLoop(); });
}

void SweepService::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

aide::session::SweepResult SweepService::TriggerNow() {
    const auto retain = retain_ ? retain_() : std::unordered_set<std::string>{};
    return sweeper_.Sweep(sessions_dir_, retain, config_.older_than_days);
}

void SweepService::RunLoop() {
    const auto interval = std::chrono::seconds(std::max(config_.interval_s, 1));
    while (running_) {
        try {
            TriggerNow();
        } catch (const std::exception& ex) {
            logger_.Error(std::string("session sweep failed: ") + ex.what());
        }
        std::unique_lock<std::mutex> lock(wait_mutex_);
        wake_.wait_for(lock, interval, [this]() { return !running_; });
    }
}

}  // namespace aide::maintenance
