#pragma once

#include <chrono>
#include <string>

#include "execution/execution_types.hpp"
#include "sandbox/isolation_backend.hpp"

namespace codebox::session {

// A precondition on session state was violated.
class SessionError : public codebox::sandbox::SandboxError {
public:
    SessionError(std::string session_id, const std::string& message)
        : SandboxError(message)
        , session_id_(std::move(session_id)) {}

    const std::string& SessionId() const { return session_id_; }

private:
    std::string session_id_;
};

class SessionClosed : public SessionError {
public:
    explicit SessionClosed(const std::string& session_id)
        : SessionError(session_id, "session " + session_id + " is closed") {}
};

class SessionBusy : public SessionError {
public:
    explicit SessionBusy(const std::string& session_id)
        : SessionError(session_id, "session " + session_id + " is already executing") {}
};

// The kernel or the transport to it failed mid-flight. The session is
// terminated; whatever output arrived before the failure is in Partial().
class SessionLost : public SessionError {
public:
    SessionLost(const std::string& session_id,
                const std::string& reason,
                codebox::execution::Execution partial)
        : SessionError(session_id, "session " + session_id + " lost: " + reason)
        , partial_(std::move(partial)) {}

    const codebox::execution::Execution& Partial() const { return partial_; }

private:
    codebox::execution::Execution partial_;
};

class ExecutionTimeout : public SessionLost {
public:
    ExecutionTimeout(const std::string& session_id,
                     std::chrono::milliseconds timeout,
                     codebox::execution::Execution partial)
        : SessionLost(session_id,
                      "execution exceeded " + std::to_string(timeout.count()) + "ms",
                      std::move(partial))
        , timeout_(timeout) {}

    std::chrono::milliseconds Timeout() const { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
};

}  // namespace codebox::session
