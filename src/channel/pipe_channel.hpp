#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "channel/execution_channel.hpp"
#include "channel/kernel_protocol.hpp"

namespace codebox::channel {

// ExecutionChannel over the stdin/stdout pipes of a kernel process.
// A reader thread parses protocol lines into a queue; a second one drains
// the kernel's raw stderr into the log. The descriptors are owned by
// `keepalive` and must stay open for the lifetime of the channel.
class PipeChannel : public ExecutionChannel {
public:
    PipeChannel(std::string label,
                int to_kernel,
                int from_kernel,
                int kernel_stderr,
                std::shared_ptr<void> keepalive);
    ~PipeChannel() override;

    PipeChannel(const PipeChannel&) = delete;
    PipeChannel& operator=(const PipeChannel&) = delete;

    ReceiveStatus WaitReady(std::chrono::milliseconds timeout) override;
    void Send(long long id, const std::string& code) override;
    ReceiveStatus Receive(codebox::execution::OutputEvent& event,
                          std::chrono::milliseconds timeout) override;
    std::string FaultReason() const override;
    void Close() override;

private:
    void ReadLoop();
    void DrainStderr();
    void Push(KernelMessage message);
    void PushFault(const std::string& reason);
    std::string FaultReasonLocked() const;

    std::string label_;
    int to_kernel_ = -1;
    int from_kernel_ = -1;
    int kernel_stderr_ = -1;
    std::shared_ptr<void> keepalive_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<KernelMessage> queue_;
    std::deque<std::string> stderr_tail_;
    bool faulted_ = false;
    std::string fault_reason_;
    long long in_flight_id_ = -1;

    std::mutex write_mutex_;
    std::atomic<bool> closed_{false};
    std::thread reader_;
    std::thread stderr_reader_;
};

}  // namespace codebox::channel
