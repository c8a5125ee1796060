#include "channel/kernel_protocol.hpp"

#include "nlohmann/json.hpp"

namespace codebox::channel {
namespace {

using codebox::execution::ErrorEvent;
using codebox::execution::ExecutionError;
using codebox::execution::RichResult;
using codebox::execution::StreamEvent;
using codebox::execution::StreamName;

std::optional<StreamEvent> ParseStream(const nlohmann::json& json) {
    if (!json.contains("text") || !json["text"].is_string()) {
        return std::nullopt;
    }
    if (json.contains("name") && !json["name"].is_string()) {
        return std::nullopt;
    }
    StreamEvent event{};
    const auto name = json.value("name", "stdout");
    if (name == "stdout") {
        event.name = StreamName::kStdout;
    } else if (name == "stderr") {
        event.name = StreamName::kStderr;
    } else {
        return std::nullopt;
    }
    event.text = json["text"].get<std::string>();
    return event;
}

std::optional<RichResult> ParseResult(const nlohmann::json& json) {
    if (!json.contains("data") || !json["data"].is_object()) {
        return std::nullopt;
    }
    RichResult result{};
    for (const auto& item : json["data"].items()) {
        // Payloads stay opaque; structured ones are kept in their serialized form.
        if (item.value().is_string()) {
            result.data[item.key()] = item.value().get<std::string>();
        } else {
            result.data[item.key()] = item.value().dump();
        }
    }
    if (json.contains("main") && json["main"].is_boolean()) {
        result.is_main_result = json["main"].get<bool>();
    }
    return result;
}

std::optional<ErrorEvent> ParseError(const nlohmann::json& json) {
    for (const char* key : {"name", "value"}) {
        if (json.contains(key) && !json[key].is_string()) {
            return std::nullopt;
        }
    }
    ExecutionError error{};
    error.name = json.value("name", "Error");
    error.value = json.value("value", "");
    if (json.contains("traceback") && json["traceback"].is_array()) {
        for (const auto& line : json["traceback"]) {
            if (line.is_string()) {
                error.traceback.push_back(line.get<std::string>());
            }
        }
    } else if (json.contains("traceback") && json["traceback"].is_string()) {
        error.traceback.push_back(json["traceback"].get<std::string>());
    }
    return ErrorEvent{std::move(error)};
}

}  // namespace

std::string EncodeExecuteRequest(long long id, const std::string& code) {
    nlohmann::json json = {
        {"type", "execute"},
        {"id", id},
        {"code", code}
    };
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

std::optional<KernelMessage> ParseKernelMessage(const std::string& line) {
    auto json = nlohmann::json::parse(line, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }
    if (!json.contains("type") || !json["type"].is_string()) {
        return std::nullopt;
    }
    KernelMessage message{};
    if (json.contains("id")) {
        if (!json["id"].is_number_integer()) {
            return std::nullopt;
        }
        message.id = json["id"].get<long long>();
    }
    const auto type = json["type"].get<std::string>();
    if (type == "ready") {
        message.type = KernelMessageType::kReady;
        return message;
    }
    if (type == "done") {
        message.type = KernelMessageType::kDone;
        return message;
    }
    if (type == "stream") {
        auto event = ParseStream(json);
        if (!event) {
            return std::nullopt;
        }
        message.type = KernelMessageType::kStream;
        message.event = std::move(*event);
        return message;
    }
    if (type == "result") {
        auto event = ParseResult(json);
        if (!event) {
            return std::nullopt;
        }
        message.type = KernelMessageType::kResult;
        message.event = std::move(*event);
        return message;
    }
    if (type == "error") {
        auto event = ParseError(json);
        if (!event) {
            return std::nullopt;
        }
        message.type = KernelMessageType::kError;
        message.event = std::move(*event);
        return message;
    }
    return std::nullopt;
}

}  // namespace codebox::channel
