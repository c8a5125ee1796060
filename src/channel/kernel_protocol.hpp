#pragma once

#include <optional>
#include <string>

#include "execution/execution_types.hpp"

namespace codebox::channel {

// Newline-delimited JSON spoken between the host and a kernel process.
// Every message is one JSON object on one line with a "type" member.
enum class KernelMessageType {
    kReady,
    kStream,
    kResult,
    kError,
    kDone
};

struct KernelMessage {
    KernelMessageType type = KernelMessageType::kDone;
    long long id = 0;
    // Set for kStream, kResult and kError.
    std::optional<codebox::execution::OutputEvent> event;
};

std::string EncodeExecuteRequest(long long id, const std::string& code);

// Returns nullopt for anything that is not a well-formed kernel message.
std::optional<KernelMessage> ParseKernelMessage(const std::string& line);

}  // namespace codebox::channel
