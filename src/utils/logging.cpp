#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <map>
#include <mutex>

namespace codebox::utils {
namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};
std::mutex g_write_mutex;

}  // namespace

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void ConfigureLogging(const LogConfig& config) {
    g_min_level.store(static_cast<int>(config.min_level));
}

bool ShouldLog(LogLevel level) {
    return static_cast<int>(level) >= g_min_level.load();
}

void Write(const LogMessage& message) {
    if (!ShouldLog(message.level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << "[" << message.tag << "] ";
    if (message.level != LogLevel::kInfo) {
        std::cerr << ToString(message.level) << " ";
    }
    std::cerr << message.message;
    // fields in key order
    const std::map<std::string, std::string> ordered(message.fields.begin(), message.fields.end());
    for (const auto& [key, value] : ordered) {
        std::cerr << " " << key << "=" << value;
    }
    std::cerr << std::endl;
}

Log::Log(LogLevel level, std::string tag)
    : level_(level)
    , tag_(std::move(tag))
    , enabled_(ShouldLog(level)) {}

Log::~Log() {
    if (!enabled_) {
        return;
    }
    Write(LogMessage{level_, tag_, stream_.str(), std::move(fields_)});
}

Log& Log::Field(const std::string& key, const std::string& value) {
    if (enabled_) {
        fields_[key] = value;
    }
    return *this;
}

}  // namespace codebox::utils
