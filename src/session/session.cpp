#include "session/session.hpp"

#include <algorithm>
#include <utility>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codebox::session {
namespace {

using codebox::channel::ReceiveStatus;
using codebox::execution::Execution;
using codebox::execution::OutputAggregator;
using codebox::execution::OutputEvent;
using codebox::sandbox::ProvisionError;
using codebox::sandbox::ProvisionFailure;
using codebox::utils::Log;
using codebox::utils::LogLevel;

// Upper bound on one blocking wait, so cancellation is noticed promptly.
constexpr std::chrono::milliseconds kPollSlice{50};

Execution Seal(OutputAggregator& aggregator, int execution_count) {
    auto execution = aggregator.Finish();
    execution.execution_count = execution_count;
    return execution;
}

}  // namespace

std::unique_ptr<Session> Session::Create(std::shared_ptr<codebox::sandbox::IsolationBackend> backend,
                                         codebox::config::SessionConfig config,
                                         SessionOptions options) {
    if (!backend) {
        throw ProvisionError(ProvisionFailure::kStartupFailed, "no isolation backend");
    }
    std::unique_ptr<Session> session(new Session(std::move(backend), std::move(config), options));
    session->Provision();
    return session;
}

Session::Session(std::shared_ptr<codebox::sandbox::IsolationBackend> backend,
                 codebox::config::SessionConfig config,
                 SessionOptions options)
    : id_("sbx-" + codebox::utils::RandomHex(12))
    , backend_(std::move(backend))
    , config_(std::move(config))
    , options_(options) {}

Session::~Session() {
    Close();
}

void Session::Provision() {
    Transition(SessionState::kUninitialized, SessionState::kProvisioning);
    const auto started = std::chrono::steady_clock::now();
    try {
        handle_ = backend_->Start(config_);
        channel_ = backend_->OpenChannel(handle_);
    } catch (const ProvisionError& ex) {
        Terminate(ex.what());
        throw;
    } catch (const codebox::sandbox::SandboxError& ex) {
        Terminate(ex.what());
        throw ProvisionError(ProvisionFailure::kStartupFailed, ex.what());
    }

    const auto ready_timeout = config_.timeout_ms > 0
        ? std::chrono::milliseconds(config_.timeout_ms)
        : options_.default_ready_timeout;
    const auto status = channel_->WaitReady(ready_timeout);
    if (status == ReceiveStatus::kTimeout) {
        const std::string reason = "kernel not ready after " + std::to_string(ready_timeout.count()) + "ms";
        Terminate(reason);
        throw ProvisionError(ProvisionFailure::kTimeout, reason);
    }
    if (status != ReceiveStatus::kEnd) {
        Log(LogLevel::kWarn, "session") << id_ << " readiness wait ended with " << ToString(status);
        const auto reason = "kernel exited during startup: " + channel_->FaultReason();
        Terminate(reason);
        throw ProvisionError(ProvisionFailure::kStartupFailed, reason);
    }
    last_activity_ = std::chrono::steady_clock::now();
    Transition(SessionState::kProvisioning, SessionState::kReady);
    Log(LogLevel::kInfo, "session") << id_ << " ready"
        << " template=" << config_.template_name
        << " kernel=" << handle_.id
        << " took=" << codebox::utils::ElapsedMs(started) << "ms";
}

Execution Session::Run(const std::string& code, std::optional<std::chrono::milliseconds> timeout) {
    std::unique_lock<std::mutex> run_lock(run_mutex_, std::try_to_lock);
    if (!run_lock.owns_lock()) {
        throw SessionBusy(id_);
    }
    cancel_requested_ = false;
    if (IdleExpired()) {
        Terminate("idle for more than " + std::to_string(config_.timeout_ms) + "ms");
        throw SessionClosed(id_);
    }
    if (!Transition(SessionState::kReady, SessionState::kExecuting)
        && !Transition(SessionState::kIdle, SessionState::kExecuting)) {
        throw SessionClosed(id_);
    }

    if (!backend_->Healthcheck(handle_)) {
        Terminate("kernel is no longer running");
        throw SessionLost(id_, "kernel is no longer running", Execution{});
    }

    const int execution_count = ++execution_count_;
    try {
        channel_->Send(execution_count, code);
    } catch (const codebox::channel::ChannelFault& ex) {
        Terminate(ex.what());
        throw SessionLost(id_, ex.what(), Execution{});
    }

    const auto limit = RunLimit(timeout);
    const auto started = std::chrono::steady_clock::now();
    OutputAggregator aggregator;
    while (true) {
        if (cancel_requested_) {
            ForceCancel(aggregator, execution_count, std::nullopt);
        }
        auto slice = kPollSlice;
        if (limit) {
            const auto remaining = *limit - std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            if (remaining <= std::chrono::milliseconds::zero()) {
                ForceCancel(aggregator, execution_count, limit);
            }
            slice = std::min(slice, remaining);
        }

        OutputEvent event;
        const auto status = channel_->Receive(event, slice);
        if (status == ReceiveStatus::kEvent) {
            aggregator.Add(event);
            continue;
        }
        if (status == ReceiveStatus::kEnd) {
            break;
        }
        if (status == ReceiveStatus::kFault) {
            const auto reason = channel_->FaultReason();
            auto partial = Seal(aggregator, execution_count);
            Terminate(reason);
            throw SessionLost(id_, reason, std::move(partial));
        }
    }

    auto execution = Seal(aggregator, execution_count);
    last_activity_ = std::chrono::steady_clock::now();
    Transition(SessionState::kExecuting, SessionState::kIdle);
    Log(LogLevel::kDebug, "session") << id_ << " run #" << execution_count
        << " events=" << execution.events.size()
        << " error=" << (execution.error ? execution.error->name : "none")
        << " took=" << codebox::utils::ElapsedMs(started) << "ms";
    return execution;
}

void Session::ForceCancel(OutputAggregator& aggregator,
                          int execution_count,
                          std::optional<std::chrono::milliseconds> timed_out_after) {
    Log(LogLevel::kWarn, "session") << id_ << " cancelling run #" << execution_count
        << (timed_out_after ? " (timeout)" : " (requested)");
    backend_->Interrupt(handle_);

    // Keep what the kernel flushes while unwinding; its state is not trusted
    // afterwards either way.
    const auto grace_deadline = std::chrono::steady_clock::now() + options_.interrupt_grace;
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            grace_deadline - std::chrono::steady_clock::now());
        if (remaining <= std::chrono::milliseconds::zero()) {
            break;
        }
        OutputEvent event;
        const auto status = channel_->Receive(event, remaining);
        if (status == ReceiveStatus::kTimeout) {
            continue;
        }
        if (status != ReceiveStatus::kEvent) {
            break;
        }
        aggregator.Add(event);
    }

    auto partial = Seal(aggregator, execution_count);
    if (timed_out_after) {
        Terminate("execution timed out");
        throw ExecutionTimeout(id_, *timed_out_after, std::move(partial));
    }
    Terminate("execution cancelled");
    throw SessionLost(id_, "execution cancelled", std::move(partial));
}

void Session::Cancel() {
    if (State() != SessionState::kExecuting) {
        return;
    }
    cancel_requested_ = true;
}

void Session::Close() noexcept {
    Terminate("closed");
}

SessionState Session::State() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::optional<std::chrono::milliseconds> Session::RunLimit(
    std::optional<std::chrono::milliseconds> timeout) const {
    if (timeout) {
        return timeout;
    }
    if (config_.timeout_ms > 0) {
        return std::chrono::milliseconds(config_.timeout_ms);
    }
    return std::nullopt;
}

bool Session::IdleExpired() const {
    if (config_.timeout_ms <= 0 || State() == SessionState::kTerminated) {
        return false;
    }
    return std::chrono::steady_clock::now() - last_activity_ > std::chrono::milliseconds(config_.timeout_ms);
}

bool Session::Transition(SessionState from, SessionState to) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != from) {
        return false;
    }
    state_ = to;
    Log(LogLevel::kDebug, "session") << id_ << " " << ToString(from) << " -> " << ToString(to);
    return true;
}

void Session::Terminate(const std::string& reason) noexcept {
    SessionState previous;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == SessionState::kTerminated) {
            return;
        }
        previous = state_;
        state_ = SessionState::kTerminated;
    }
    if (handle_.Valid()) {
        backend_->Stop(handle_);
    }
    if (channel_) {
        channel_->Close();
    }
    Log(LogLevel::kInfo, "session") << id_ << " terminated from " << ToString(previous) << ": " << reason;
}

}  // namespace codebox::session
