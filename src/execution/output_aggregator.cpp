#include "execution/output_aggregator.hpp"

#include <utility>

namespace codebox::execution {

void OutputAggregator::Add(const OutputEvent& event) {
    if (HasError()) {
        return;
    }
    if (const auto* stream = std::get_if<StreamEvent>(&event)) {
        if (stream->name == StreamName::kStdout) {
            execution_.logs.stdout_lines.push_back(stream->text);
        } else {
            execution_.logs.stderr_lines.push_back(stream->text);
        }
    } else if (const auto* result = std::get_if<RichResult>(&event)) {
        if (result->is_main_result) {
            if (auto text = result->Get("text/plain")) {
                execution_.text += *text;
            }
        }
        execution_.results.push_back(*result);
    } else if (const auto* error = std::get_if<ErrorEvent>(&event)) {
        execution_.error = error->error;
    }
    execution_.events.push_back(event);
}

Execution OutputAggregator::Finish() {
    return std::exchange(execution_, Execution{});
}

Execution Aggregate(const std::vector<OutputEvent>& events) {
    OutputAggregator aggregator;
    for (const auto& event : events) {
        if (aggregator.HasError()) {
            break;
        }
        aggregator.Add(event);
    }
    return aggregator.Finish();
}

}  // namespace codebox::execution
