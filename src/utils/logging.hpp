#pragma once

#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace aide::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback = LogLevel::kInfo);

struct LogMessage {
    LogLevel level = LogLevel::kInfo;
    std::string message;
    std::vector<std::pair<std::string, std::string>> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
    // nullptr means std::cerr.
    std::ostream* sink = nullptr;
};

// Tagged logging handle. Cheap to copy; components keep their own copy.
class Logger {
public:
    explicit Logger(std::string tag = "aide", LogConfig config = {});

    Logger WithTag(std::string tag) const;

    bool Enabled(LogLevel level) const;
    void Log(const LogMessage& msg) const;
    void Log(LogLevel level, const std::string& message) const;

    void Debug(const std::string& message) const { Log(LogLevel::kDebug, message); }
    void Info(const std::string& message) const { Log(LogLevel::kInfo, message); }
    void Warn(const std::string& message) const { Log(LogLevel::kWarn, message); }
    void Error(const std::string& message) const { Log(LogLevel::kError, message); }

    const std::string& Tag() const { return tag_; }
    const LogConfig& Config() const { return config_; }

private:
    std::string tag_;
    LogConfig config_;
};

}  // namespace aide::utils
