#pragma once

#include <chrono>

namespace codebox::session {

enum class SessionState {
    kUninitialized,
    kProvisioning,
    kReady,
    kExecuting,
    kIdle,
    kTerminated
};

inline const char* ToString(SessionState state) {
    switch (state) {
        case SessionState::kUninitialized: return "uninitialized";
        case SessionState::kProvisioning: return "provisioning";
        case SessionState::kReady: return "ready";
        case SessionState::kExecuting: return "executing";
        case SessionState::kIdle: return "idle";
        case SessionState::kTerminated: return "terminated";
    }
    return "unknown";
}

struct SessionOptions {
    // How long an interrupted kernel may take to unwind before it is torn down.
    std::chrono::milliseconds interrupt_grace{2000};
    // Readiness bound used when the session config leaves timeout_ms at zero.
    std::chrono::milliseconds default_ready_timeout{30000};
};

}  // namespace codebox::session
