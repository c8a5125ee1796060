#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "sandbox/isolation_backend.hpp"
#include "sandbox/templates.hpp"

namespace codebox::sandbox {

struct ProcessBackendOptions {
    // Parent of the per-kernel scratch directories. Empty means
    // <temp>/codebox.
    std::filesystem::path scratch_root;
    std::chrono::milliseconds stop_grace{2000};
};

// Process-level isolation: each kernel runs in its own process group with a
// private scratch directory, a scrubbed environment, no inherited
// descriptors (everything above stderr is close-on-exec) and POSIX
// resource limits.
class ProcessBackend : public IsolationBackend {
public:
    explicit ProcessBackend(TemplateCatalog catalog, ProcessBackendOptions options = {});
    ~ProcessBackend() override;

    ProcessBackend(const ProcessBackend&) = delete;
    ProcessBackend& operator=(const ProcessBackend&) = delete;

    BackendHandle Start(const codebox::config::SessionConfig& config) override;
    std::unique_ptr<codebox::channel::ExecutionChannel> OpenChannel(const BackendHandle& handle) override;
    bool Healthcheck(const BackendHandle& handle) override;
    void Interrupt(const BackendHandle& handle) override;
    void Stop(const BackendHandle& handle) noexcept override;

    std::size_t ActiveCount() const;

private:
    struct Instance;

    std::shared_ptr<Instance> Find(const BackendHandle& handle) const;
    std::filesystem::path ScratchRoot() const;
    void Teardown(Instance& instance) noexcept;

    TemplateCatalog catalog_;
    ProcessBackendOptions options_;
    std::unordered_map<std::string, std::shared_ptr<Instance>> instances_;
    mutable std::mutex mutex_;
};

}  // namespace codebox::sandbox
