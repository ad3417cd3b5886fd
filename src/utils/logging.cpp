#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>

#include "utils/common.hpp"

namespace aide::utils {
namespace {

std::mutex& SinkMutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") return LogLevel::kDebug;
    if (lowered == "info") return LogLevel::kInfo;
    if (lowered == "warn" || lowered == "warning") return LogLevel::kWarn;
    if (lowered == "error") return LogLevel::kError;
    return fallback;
}

Logger::Logger(std::string tag, LogConfig config)
    : tag_(std::move(tag))
    , config_(config) {}

Logger Logger::WithTag(std::string tag) const {
    return Logger(std::move(tag), config_);
}

bool Logger::Enabled(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(config_.min_level);
}

void Logger::Log(const LogMessage& msg) const {
    if (!Enabled(msg.level)) {
        return;
    }
    std::ostringstream line;
    line << NowIsoUtc() << " " << ToString(msg.level) << " [" << tag_ << "] " << msg.message;
    for (const auto& [key, value] : msg.fields) {
        line << " " << key << "=" << value;
    }
    line << "\n";

    std::ostream& out = config_.sink ? *config_.sink : std::cerr;
    std::lock_guard<std::mutex> lock(SinkMutex());
    out << line.str();
    out.flush();
}

void Logger::Log(LogLevel level, const std::string& message) const {
    Log(LogMessage{level, message, {}});
}

}  // namespace aide::utils
