#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>

namespace codebox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("CODEBOX_CONFIG");
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    return GetHomePath() / ".codebox" / "config.json";
}

long long ParseLong(const std::string& value, long long fallback) {
    try {
        return std::stoll(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

void ApplyStringMap(std::unordered_map<std::string, std::string>& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    for (const auto& item : source.items()) {
        if (item.value().is_string()) {
            target[item.key()] = item.value().get<std::string>();
        } else if (item.value().is_number() || item.value().is_boolean()) {
            target[item.key()] = item.value().dump();
        }
    }
}

void ApplyLimits(ResourceLimits& limits, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    if (source.contains("memoryMb") && source["memoryMb"].is_number_integer()) {
        limits.memory_mb = source["memoryMb"].get<long long>();
    }
    if (source.contains("cpuSeconds") && source["cpuSeconds"].is_number_integer()) {
        limits.cpu_seconds = source["cpuSeconds"].get<long long>();
    }
    if (source.contains("openFiles") && source["openFiles"].is_number_integer()) {
        limits.open_files = source["openFiles"].get<long long>();
    }
}

void ApplyTemplate(TemplateConfig& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    if (source.contains("command") && source["command"].is_array()) {
        target.command.clear();
        for (const auto& item : source["command"]) {
            if (item.is_string()) {
                target.command.push_back(item.get<std::string>());
            }
        }
    }
    if (source.contains("env")) {
        ApplyStringMap(target.env, source["env"]);
    }
    if (source.contains("limits")) {
        ApplyLimits(target.limits, source["limits"]);
    }
}

}  // namespace

SessionConfig ParseSessionConfig(const nlohmann::json& data, const SessionConfig& defaults) {
    SessionConfig config = defaults;
    if (!data.is_object()) {
        return config;
    }
    if (data.contains("template") && data["template"].is_string()) {
        config.template_name = data["template"].get<std::string>();
    }
    if (data.contains("timeoutMs") && data["timeoutMs"].is_number_integer()) {
        const auto value = data["timeoutMs"].get<long long>();
        if (value >= 0) {
            config.timeout_ms = value;
        }
    }
    if (data.contains("env")) {
        ApplyStringMap(config.env, data["env"]);
    }
    return config;
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("logLevel") && data["logLevel"].is_string()) {
        config.log_level = data["logLevel"].get<std::string>();
    }

    if (data.contains("defaults")) {
        config.defaults = ParseSessionConfig(data["defaults"], config.defaults);
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        if (sandbox.contains("scratchRoot") && sandbox["scratchRoot"].is_string()) {
            config.sandbox.scratch_root = sandbox["scratchRoot"].get<std::string>();
        }
        if (sandbox.contains("stopGraceMs") && sandbox["stopGraceMs"].is_number_integer()) {
            config.sandbox.stop_grace_ms = sandbox["stopGraceMs"].get<int>();
        }
        if (sandbox.contains("interruptGraceMs") && sandbox["interruptGraceMs"].is_number_integer()) {
            config.sandbox.interrupt_grace_ms = sandbox["interruptGraceMs"].get<int>();
        }
    }

    if (data.contains("templates") && data["templates"].is_object()) {
        for (const auto& item : data["templates"].items()) {
            ApplyTemplate(config.templates[item.key()], item.value());
        }
    }
}

void ApplyEnvironmentOverrides(Config& config) {
    const auto log_level = GetEnv("CODEBOX_LOG_LEVEL");
    if (!log_level.empty()) {
        config.log_level = log_level;
    }

    const auto default_template = GetEnv("CODEBOX_DEFAULT_TEMPLATE");
    if (!default_template.empty()) {
        config.defaults.template_name = default_template;
    }

    const auto timeout_ms = GetEnv("CODEBOX_TIMEOUT_MS");
    if (!timeout_ms.empty()) {
        config.defaults.timeout_ms = ParseLong(timeout_ms, config.defaults.timeout_ms);
    }

    const auto scratch_root = GetEnv("CODEBOX_SCRATCH_ROOT");
    if (!scratch_root.empty()) {
        config.sandbox.scratch_root = scratch_root;
    }
}

Config LoadConfigFromFile(const std::filesystem::path& path) {
    Config config{};
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::ifstream input(path);
        auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            codebox::utils::Log(codebox::utils::LogLevel::kWarn, "config")
                << "ignoring unparsable config file " << path.string();
        } else {
            ApplyConfigFromJson(config, data);
        }
    }
    return config;
}

Config LoadConfig() {
    auto config = LoadConfigFromFile(GetConfigPath());
    ApplyEnvironmentOverrides(config);
    return config;
}

codebox::utils::LogConfig ToLogConfig(const Config& config) {
    codebox::utils::LogConfig log_config{};
    log_config.min_level = codebox::utils::ParseLogLevel(config.log_level, log_config.min_level);
    return log_config;
}

}  // namespace codebox::config
