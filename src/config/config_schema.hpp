#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace codebox::config {

// POSIX limits applied to a kernel process before exec. Zero means unlimited.
struct ResourceLimits {
    long long memory_mb = 0;
    long long cpu_seconds = 0;
    long long open_files = 256;
};

// How to launch one kind of kernel.
struct TemplateConfig {
    std::vector<std::string> command;
    std::unordered_map<std::string, std::string> env;
    ResourceLimits limits;
};

// Options recognized when a session is created.
struct SessionConfig {
    std::string template_name = "python";
    // Bounds provisioning, every run and the idle time between runs. Zero
    // leaves runs and idle time unbounded.
    long long timeout_ms = 60 * 1000;
    std::unordered_map<std::string, std::string> env;
};

struct SandboxSettings {
    std::string scratch_root;
    int stop_grace_ms = 2000;
    int interrupt_grace_ms = 2000;
};

struct Config {
    std::string log_level = "info";
    SessionConfig defaults;
    SandboxSettings sandbox;
    std::unordered_map<std::string, TemplateConfig> templates;
};

}  // namespace codebox::config
