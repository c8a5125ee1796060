#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "channel/execution_channel.hpp"
#include "config/config_schema.hpp"
#include "execution/output_aggregator.hpp"
#include "sandbox/isolation_backend.hpp"
#include "session/session_errors.hpp"
#include "session/session_types.hpp"

namespace codebox::session {

// A stateful handle on one kernel. Code units run strictly one at a time
// against a single interpreter, so state set by one Run() is visible to the
// next. Destroying the session releases the kernel.
class Session {
public:
    // Provisions a kernel and waits until it is ready. Throws
    // sandbox::ProvisionError; nothing is left running on failure.
    static std::unique_ptr<Session> Create(std::shared_ptr<codebox::sandbox::IsolationBackend> backend,
                                           codebox::config::SessionConfig config,
                                           SessionOptions options = {});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Runs one code unit. Errors raised by the code are reported in the
    // returned Execution. Throws SessionBusy if another Run() is in flight,
    // SessionClosed once terminated or after sitting idle for longer than
    // timeout_ms, SessionLost (ExecutionTimeout when the deadline passed) if
    // the kernel had to be torn down.
    codebox::execution::Execution Run(const std::string& code,
                                      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Force-cancels the in-flight Run(), if any. The session terminates.
    void Cancel();

    // Releases the kernel. Idempotent.
    void Close() noexcept;

    const std::string& Id() const { return id_; }
    SessionState State() const;
    bool PreservesState() const { return State() != SessionState::kTerminated; }
    int ExecutionCount() const { return execution_count_.load(); }
    const codebox::config::SessionConfig& Config() const { return config_; }

private:
    Session(std::shared_ptr<codebox::sandbox::IsolationBackend> backend,
            codebox::config::SessionConfig config,
            SessionOptions options);

    void Provision();
    std::optional<std::chrono::milliseconds> RunLimit(std::optional<std::chrono::milliseconds> timeout) const;
    [[noreturn]] void ForceCancel(codebox::execution::OutputAggregator& aggregator,
                                  int execution_count,
                                  std::optional<std::chrono::milliseconds> timed_out_after);
    bool IdleExpired() const;
    bool Transition(SessionState from, SessionState to);
    void Terminate(const std::string& reason) noexcept;

    std::string id_;
    std::shared_ptr<codebox::sandbox::IsolationBackend> backend_;
    codebox::config::SessionConfig config_;
    SessionOptions options_;
    codebox::sandbox::BackendHandle handle_;
    std::unique_ptr<codebox::channel::ExecutionChannel> channel_;

    SessionState state_ = SessionState::kUninitialized;
    mutable std::mutex state_mutex_;
    std::mutex run_mutex_;
    std::atomic<bool> cancel_requested_{false};
    std::atomic<int> execution_count_{0};
    // Written only while run_mutex_ is held (or before Create returns).
    std::chrono::steady_clock::time_point last_activity_;
};

}  // namespace codebox::session
