#include <gtest/gtest.h>

#include "execution/execution_types.hpp"
#include "execution/output_aggregator.hpp"

namespace codebox::execution {
namespace {

OutputEvent Out(const std::string& text) {
    return StreamEvent{StreamName::kStdout, text};
}

OutputEvent Err(const std::string& text) {
    return StreamEvent{StreamName::kStderr, text};
}

OutputEvent Rich(const std::string& mime, const std::string& payload, bool main = false) {
    RichResult result{};
    result.data[mime] = payload;
    result.is_main_result = main;
    return result;
}

OutputEvent Failure(const std::string& name, const std::string& value) {
    return ErrorEvent{ExecutionError{name, value, {"line 1"}}};
}

TEST(OutputAggregatorTest, EmptySequenceGivesEmptyExecution) {
    const auto execution = Aggregate({});
    EXPECT_TRUE(execution.events.empty());
    EXPECT_TRUE(execution.logs.stdout_lines.empty());
    EXPECT_TRUE(execution.logs.stderr_lines.empty());
    EXPECT_TRUE(execution.results.empty());
    EXPECT_EQ(execution.text, "");
    EXPECT_FALSE(execution.HasError());
}

TEST(OutputAggregatorTest, SplitsStreamsAndKeepsFragmentOrderWithinEach) {
    const auto execution = Aggregate({Out("a"), Err("x"), Out("b"), Err("y"), Out("c")});
    EXPECT_EQ(execution.logs.stdout_lines, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(execution.logs.stderr_lines, (std::vector<std::string>{"x", "y"}));
    ASSERT_EQ(execution.events.size(), 5u);
    EXPECT_EQ(std::get<StreamEvent>(execution.events[1]).text, "x");
}

TEST(OutputAggregatorTest, RichResultsKeepArrivalOrderAndMainTextFeedsText) {
    const auto execution = Aggregate({
        Rich("image/png", "iVBORw0KGgo="),
        Rich("text/plain", "42", true),
        Rich("application/vnd.custom+json", "{\"k\":1}")
    });
    ASSERT_EQ(execution.results.size(), 3u);
    EXPECT_EQ(execution.results[0].Get("image/png").value(), "iVBORw0KGgo=");
    EXPECT_TRUE(execution.results[1].is_main_result);
    EXPECT_EQ(execution.results[2].Get("application/vnd.custom+json").value(), "{\"k\":1}");
    EXPECT_FALSE(execution.results[2].Get("text/plain").has_value());
    EXPECT_EQ(execution.text, "42");
}

TEST(OutputAggregatorTest, ErrorStopsAggregationButKeepsEarlierOutput) {
    const auto execution = Aggregate({
        Out("before\n"),
        Rich("text/plain", "1"),
        Failure("ZeroDivisionError", "division by zero"),
        Out("after\n"),
        Failure("Other", "ignored")
    });
    ASSERT_TRUE(execution.HasError());
    EXPECT_EQ(execution.error->name, "ZeroDivisionError");
    EXPECT_EQ(execution.error->value, "division by zero");
    EXPECT_EQ(execution.logs.stdout_lines, (std::vector<std::string>{"before\n"}));
    EXPECT_EQ(execution.results.size(), 1u);
    EXPECT_EQ(execution.events.size(), 3u);
}

TEST(OutputAggregatorTest, IncrementalSnapshotIsUsableAsPartialOutput) {
    OutputAggregator aggregator;
    aggregator.Add(Out("1\n"));
    aggregator.Add(Out("2\n"));
    const auto partial = aggregator.Current();
    EXPECT_EQ(partial.logs.stdout_lines.size(), 2u);
    aggregator.Add(Out("3\n"));
    EXPECT_EQ(aggregator.EventCount(), 3u);
    const auto finished = aggregator.Finish();
    EXPECT_EQ(finished.logs.stdout_lines.size(), 3u);
    EXPECT_EQ(aggregator.EventCount(), 0u);
}

TEST(ExecutionJsonTest, MatchesExternalResultShape) {
    auto execution = Aggregate({Out("2\n"), Err("warn\n"), Rich("text/plain", "3", true)});
    execution.execution_count = 4;
    const auto json = ToJson(execution);
    EXPECT_EQ(json["text"], "3");
    EXPECT_EQ(json["logs"]["stdout"], nlohmann::json::array({"2\n"}));
    EXPECT_EQ(json["logs"]["stderr"], nlohmann::json::array({"warn\n"}));
    ASSERT_EQ(json["results"].size(), 1u);
    EXPECT_EQ(json["results"][0]["text/plain"], "3");
    EXPECT_EQ(json["results"][0]["is_main_result"], true);
    EXPECT_TRUE(json["error"].is_null());
    EXPECT_EQ(json["execution_count"], 4);
}

TEST(ExecutionJsonTest, ErrorIsRenderedWithTraceback) {
    const auto execution = Aggregate({Failure("NameError", "name 'y' is not defined")});
    const auto json = ToJson(execution);
    ASSERT_TRUE(json["error"].is_object());
    EXPECT_EQ(json["error"]["name"], "NameError");
    EXPECT_EQ(json["error"]["value"], "name 'y' is not defined");
    EXPECT_EQ(json["error"]["traceback"], nlohmann::json::array({"line 1"}));
}

}  // namespace
}  // namespace codebox::execution
