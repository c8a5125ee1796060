#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

#include "execution/execution_types.hpp"

namespace codebox::channel {

// Transport-level failure: write to a dead kernel, malformed stream,
// connection closed.
class ChannelFault : public std::runtime_error {
public:
    explicit ChannelFault(const std::string& message)
        : std::runtime_error(message) {}
};

enum class ReceiveStatus {
    kEvent,
    kEnd,
    kTimeout,
    kFault
};

inline const char* ToString(ReceiveStatus status) {
    switch (status) {
        case ReceiveStatus::kEvent: return "event";
        case ReceiveStatus::kEnd: return "end";
        case ReceiveStatus::kTimeout: return "timeout";
        case ReceiveStatus::kFault: return "fault";
    }
    return "unknown";
}

// One logical connection to one running kernel. A Send() is followed by
// Receive() calls until kEnd (the kernel's end-of-execution sentinel) or
// kFault. Several executions run back to back over the same connection.
class ExecutionChannel {
public:
    virtual ~ExecutionChannel() = default;

    // Blocks until the kernel announces readiness. kEnd means ready.
    virtual ReceiveStatus WaitReady(std::chrono::milliseconds timeout) = 0;

    // Throws ChannelFault when the unit cannot be delivered.
    virtual void Send(long long id, const std::string& code) = 0;

    virtual ReceiveStatus Receive(codebox::execution::OutputEvent& event,
                                  std::chrono::milliseconds timeout) = 0;

    virtual std::string FaultReason() const = 0;
    virtual void Close() = 0;
};

}  // namespace codebox::channel
