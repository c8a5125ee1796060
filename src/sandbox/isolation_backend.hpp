#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include "channel/execution_channel.hpp"
#include "config/config_schema.hpp"

namespace codebox::sandbox {

class SandboxError : public std::runtime_error {
public:
    explicit SandboxError(const std::string& message)
        : std::runtime_error(message) {}
};

enum class ProvisionFailure {
    kResourceExhausted,
    kImageNotFound,
    kTimeout,
    kStartupFailed
};

inline const char* ToString(ProvisionFailure reason) {
    switch (reason) {
        case ProvisionFailure::kResourceExhausted: return "ResourceExhausted";
        case ProvisionFailure::kImageNotFound: return "ImageNotFound";
        case ProvisionFailure::kTimeout: return "Timeout";
        case ProvisionFailure::kStartupFailed: return "StartupFailed";
    }
    return "Unknown";
}

class ProvisionError : public SandboxError {
public:
    ProvisionError(ProvisionFailure reason, const std::string& message)
        : SandboxError(std::string("provision failed (") + ToString(reason) + "): " + message)
        , reason_(reason) {}

    ProvisionFailure Reason() const { return reason_; }

private:
    ProvisionFailure reason_;
};

// Opaque reference to one provisioned environment. Only meaningful to the
// backend that issued it; invalid once stopped.
struct BackendHandle {
    std::string id;
    long long pid = -1;

    bool Valid() const { return !id.empty(); }
};

// Provisions and destroys isolated environments, each running exactly one
// kernel. Implementations must be safe to call from several threads.
class IsolationBackend {
public:
    virtual ~IsolationBackend() = default;

    // Throws ProvisionError.
    virtual BackendHandle Start(const codebox::config::SessionConfig& config) = 0;

    // Opens the channel to the kernel behind handle. Call once per handle.
    virtual std::unique_ptr<codebox::channel::ExecutionChannel> OpenChannel(const BackendHandle& handle) = 0;

    // Non-blocking liveness probe.
    virtual bool Healthcheck(const BackendHandle& handle) = 0;

    // Asks the kernel to abandon the running code unit.
    virtual void Interrupt(const BackendHandle& handle) = 0;

    // Forceful, bounded teardown. Safe to repeat and never throws.
    virtual void Stop(const BackendHandle& handle) noexcept = 0;
};

}  // namespace codebox::sandbox
