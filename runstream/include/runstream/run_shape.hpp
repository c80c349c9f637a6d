#ifndef RUNSTREAM_RUN_SHAPE_HPP
#define RUNSTREAM_RUN_SHAPE_HPP

#include <runstream/value.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace runstream {

/**
 * Runs recorded in the older convention (retrievers, tools, LLMs):
 * `inputs` and `final_output` hold the payload directly.
 */
struct LegacyRun {
    std::string category;
};

/**
 * Runs recorded in the chain convention: `inputs` wraps the payload under
 * "input" and `final_output` wraps it under "output".
 */
struct ChainRun {
    std::string category;
};

using RunShape = std::variant<LegacyRun, ChainRun>;

RunShape classify_run(const std::string& type, const std::vector<std::string>& legacy_types);

const std::string& run_category(const RunShape& shape);

bool is_legacy(const RunShape& shape);

/**
 * Removes `key` from the run state and returns what it held.
 * Every payload surfaced in an event goes through here, so a second
 * consume of the same slot yields nullopt.
 */
std::optional<Value> consume_field(ValueObject& state, const std::string& key);

// `data` of a start event; inputs stay in place
ValueObject start_event_data(const RunShape& shape, const ValueObject& state);

// `data` of an end event; consumes final_output and inputs where surfaced
ValueObject end_event_data(const RunShape& shape, ValueObject& state);

// `data.output` of the closing root event
Value root_output(const RunShape& shape, const Value& final_output);

} // namespace runstream

#endif // RUNSTREAM_RUN_SHAPE_HPP
