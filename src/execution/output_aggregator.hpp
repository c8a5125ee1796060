#pragma once

#include <vector>

#include "execution/execution_types.hpp"

namespace codebox::execution {

// Folds the events of one code unit into an Execution. The first error
// event ends aggregation; anything after it is dropped, anything before
// it is kept.
class OutputAggregator {
public:
    void Add(const OutputEvent& event);
    bool HasError() const { return execution_.error.has_value(); }
    std::size_t EventCount() const { return execution_.events.size(); }

    // Snapshot of what has been collected so far, usable as partial output.
    Execution Current() const { return execution_; }
    Execution Finish();

private:
    Execution execution_;
};

Execution Aggregate(const std::vector<OutputEvent>& events);

}  // namespace codebox::execution
