#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "nlohmann/json.hpp"

namespace codebox::execution {

enum class StreamName {
    kStdout,
    kStderr
};

const char* ToString(StreamName name);

struct StreamEvent {
    StreamName name = StreamName::kStdout;
    std::string text;
};

// One rich output object. Keys are declared content types ("text/plain",
// "image/png", ...); values are the payloads exactly as the kernel sent them.
struct RichResult {
    std::map<std::string, std::string> data;
    bool is_main_result = false;

    std::optional<std::string> Get(const std::string& mime) const;
};

// A runtime error raised by the submitted code. Reported inside the
// Execution, the session stays usable.
struct ExecutionError {
    std::string name;
    std::string value;
    std::vector<std::string> traceback;
};

struct ErrorEvent {
    ExecutionError error;
};

using OutputEvent = std::variant<StreamEvent, RichResult, ErrorEvent>;

struct Logs {
    std::vector<std::string> stdout_lines;
    std::vector<std::string> stderr_lines;
};

struct Execution {
    std::vector<OutputEvent> events;
    std::string text;
    Logs logs;
    std::vector<RichResult> results;
    std::optional<ExecutionError> error;
    int execution_count = 0;

    bool HasError() const { return error.has_value(); }
};

nlohmann::json ToJson(const RichResult& result);
nlohmann::json ToJson(const ExecutionError& error);
nlohmann::json ToJson(const Execution& execution);

}  // namespace codebox::execution
