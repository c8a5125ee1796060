#include "channel/pipe_channel.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codebox::channel {
namespace {

constexpr int kPollIntervalMs = 100;
constexpr std::size_t kStderrTailLines = 20;
constexpr std::size_t kMaxLoggedLine = 200;

std::string Truncate(const std::string& text) {
    if (text.size() <= kMaxLoggedLine) {
        return text;
    }
    return text.substr(0, kMaxLoggedLine) + "...";
}

// Reads whatever is available on fd into buffer. Returns false on EOF or
// error, with reason set for errors.
bool ReadAvailable(int fd, const std::atomic<bool>& closed, std::string& buffer, std::string& reason) {
    char chunk[4096];
    while (!closed) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        const int rc = ::poll(&pfd, 1, kPollIntervalMs);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            reason = std::string("poll failed: ") + std::strerror(errno);
            return false;
        }
        if (rc == 0) {
            continue;
        }
        const auto n = ::read(fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            reason = std::string("read failed: ") + std::strerror(errno);
            return false;
        }
        if (n == 0) {
            return false;
        }
        buffer.append(chunk, static_cast<std::size_t>(n));
        return true;
    }
    return false;
}

bool PopLine(std::string& buffer, std::string& line) {
    const auto pos = buffer.find('\n');
    if (pos == std::string::npos) {
        return false;
    }
    line = buffer.substr(0, pos);
    buffer.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

}  // namespace

PipeChannel::PipeChannel(std::string label,
                         int to_kernel,
                         int from_kernel,
                         int kernel_stderr,
                         std::shared_ptr<void> keepalive)
    : label_(std::move(label))
    , to_kernel_(to_kernel)
    , from_kernel_(from_kernel)
    , kernel_stderr_(kernel_stderr)
    , keepalive_(std::move(keepalive)) {
    reader_ = std::thread([this]() { ReadLoop(); });
    if (kernel_stderr_ >= 0) {
        stderr_reader_ = std::thread([this]() { DrainStderr(); });
    }
}

PipeChannel::~PipeChannel() {
    Close();
}

ReceiveStatus PipeChannel::WaitReady(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        while (!queue_.empty()) {
            const auto message = std::move(queue_.front());
            queue_.pop_front();
            if (message.type == KernelMessageType::kReady) {
                return ReceiveStatus::kEnd;
            }
            codebox::utils::Log(codebox::utils::LogLevel::kWarn, "channel")
                << label_ << " dropped message before ready";
        }
        if (faulted_) {
            return ReceiveStatus::kFault;
        }
        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout
            && queue_.empty() && !faulted_) {
            return ReceiveStatus::kTimeout;
        }
    }
}

void PipeChannel::Send(long long id, const std::string& code) {
    std::lock_guard<std::mutex> write_lock(write_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (faulted_) {
            throw ChannelFault(FaultReasonLocked());
        }
        in_flight_id_ = id;
    }
    const auto payload = EncodeExecuteRequest(id, code);
    std::size_t written = 0;
    while (written < payload.size()) {
        const auto n = ::write(to_kernel_, payload.data() + written, payload.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const std::string reason = std::string("write to kernel failed: ") + std::strerror(errno);
            PushFault(reason);
            throw ChannelFault(reason);
        }
        written += static_cast<std::size_t>(n);
    }
    codebox::utils::Log(codebox::utils::LogLevel::kDebug, "channel")
        << label_ << " sent id=" << id << " bytes=" << payload.size();
}

ReceiveStatus PipeChannel::Receive(codebox::execution::OutputEvent& event,
                                   std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        while (!queue_.empty()) {
            auto message = std::move(queue_.front());
            queue_.pop_front();
            if (message.type == KernelMessageType::kReady) {
                continue;
            }
            if (message.id != in_flight_id_) {
                codebox::utils::Log(codebox::utils::LogLevel::kDebug, "channel")
                    << label_ << " discarded stale message id=" << message.id;
                continue;
            }
            if (message.type == KernelMessageType::kDone) {
                in_flight_id_ = -1;
                return ReceiveStatus::kEnd;
            }
            if (message.event) {
                event = std::move(*message.event);
                return ReceiveStatus::kEvent;
            }
        }
        if (faulted_) {
            return ReceiveStatus::kFault;
        }
        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout
            && queue_.empty() && !faulted_) {
            return ReceiveStatus::kTimeout;
        }
    }
}

std::string PipeChannel::FaultReason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return FaultReasonLocked();
}

std::string PipeChannel::FaultReasonLocked() const {
    if (!faulted_) {
        return {};
    }
    if (stderr_tail_.empty()) {
        return fault_reason_;
    }
    std::vector<std::string> tail(stderr_tail_.begin(), stderr_tail_.end());
    return fault_reason_ + "; kernel stderr: " + codebox::utils::Join(tail, " | ");
}

void PipeChannel::Close() {
    if (closed_.exchange(true)) {
        return;
    }
    PushFault("channel closed");
    if (reader_.joinable()) {
        reader_.join();
    }
    if (stderr_reader_.joinable()) {
        stderr_reader_.join();
    }
}

void PipeChannel::ReadLoop() {
    std::string buffer;
    std::string reason;
    while (ReadAvailable(from_kernel_, closed_, buffer, reason)) {
        std::string line;
        while (PopLine(buffer, line)) {
            if (line.empty()) {
                continue;
            }
            auto message = ParseKernelMessage(line);
            if (!message) {
                PushFault("malformed kernel message: " + Truncate(line));
                return;
            }
            Push(std::move(*message));
        }
    }
    if (closed_) {
        return;
    }
    // Give the stderr reader a moment so the fault carries the kernel's last words.
    std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
    PushFault(reason.empty() ? "kernel closed the connection" : reason);
}

void PipeChannel::DrainStderr() {
    std::string buffer;
    std::string reason;
    while (ReadAvailable(kernel_stderr_, closed_, buffer, reason)) {
        std::string line;
        while (PopLine(buffer, line)) {
            codebox::utils::Log(codebox::utils::LogLevel::kDebug, "kernel") << label_ << " " << line;
            std::lock_guard<std::mutex> lock(mutex_);
            stderr_tail_.push_back(Truncate(line));
            if (stderr_tail_.size() > kStderrTailLines) {
                stderr_tail_.pop_front();
            }
        }
    }
}

void PipeChannel::Push(KernelMessage message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(message));
    }
    cv_.notify_all();
}

void PipeChannel::PushFault(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (faulted_) {
            return;
        }
        faulted_ = true;
        fault_reason_ = reason;
    }
    codebox::utils::Log(codebox::utils::LogLevel::kDebug, "channel") << label_ << " fault: " << reason;
    cv_.notify_all();
}

}  // namespace codebox::channel
