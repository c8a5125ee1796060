#pragma once

#include <sstream>
#include <string>
#include <unordered_map>

namespace codebox::utils {

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

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback);

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    std::unordered_map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void ConfigureLogging(const LogConfig& config);
bool ShouldLog(LogLevel level);
void Write(const LogMessage& message);

// Usage: utils::Log(LogLevel::kInfo, "session") << "ready id=" << id;
// The line is emitted when the temporary goes out of scope.
class Log {
public:
    Log(LogLevel level, std::string tag);
    ~Log();

    Log(const Log&) = delete;
    Log& operator=(const Log&) = delete;

    template <typename T>
    Log& operator<<(const T& value) {
        if (enabled_) {
            stream_ << value;
        }
        return *this;
    }

    Log& Field(const std::string& key, const std::string& value);

private:
    LogLevel level_;
    std::string tag_;
    bool enabled_ = false;
    std::ostringstream stream_;
    std::unordered_map<std::string, std::string> fields_;
};

}  // namespace codebox::utils
