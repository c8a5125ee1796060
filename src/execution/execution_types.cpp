#include "execution/execution_types.hpp"

namespace codebox::execution {

const char* ToString(StreamName name) {
    switch (name) {
        case StreamName::kStdout: return "stdout";
        case StreamName::kStderr: return "stderr";
    }
    return "stdout";
}

std::optional<std::string> RichResult::Get(const std::string& mime) const {
    auto it = data.find(mime);
    if (it == data.end()) {
        return std::nullopt;
    }
    return it->second;
}

nlohmann::json ToJson(const RichResult& result) {
    nlohmann::json json = nlohmann::json::object();
    for (const auto& [mime, payload] : result.data) {
        json[mime] = payload;
    }
    json["is_main_result"] = result.is_main_result;
    return json;
}

nlohmann::json ToJson(const ExecutionError& error) {
    return {
        {"name", error.name},
        {"value", error.value},
        {"traceback", error.traceback}
    };
}

nlohmann::json ToJson(const Execution& execution) {
    nlohmann::json results = nlohmann::json::array();
    for (const auto& result : execution.results) {
        results.push_back(ToJson(result));
    }
    return {
        {"text", execution.text},
        {"logs", {
            {"stdout", execution.logs.stdout_lines},
            {"stderr", execution.logs.stderr_lines}
        }},
        {"results", std::move(results)},
        {"error", execution.error.has_value() ? ToJson(*execution.error) : nlohmann::json(nullptr)},
        {"execution_count", execution.execution_count}
    };
}

}  // namespace codebox::execution
