// JSON config loading and results writer (Boost.JSON)
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "harness/actions.hpp"
#include "harness/config.hpp"
#include "harness/runner.hpp"

namespace json = boost::json;

namespace mev {
namespace harness {

// ============================================================================
// Configuration
// ============================================================================

// Overlay the keys present in `obj` onto `base`. Accepts a flat object or
// { "simulation": {...} }; unknown keys are ignored. Throws std::runtime_error
// on malformed values. Does not validate.
SimulationConfig config_from_json(const json::object& obj, SimulationConfig base = {});

// Parse a config file; throws std::runtime_error on I/O or JSON errors
SimulationConfig load_config(const std::string& path, SimulationConfig base = {});

json::object config_to_json(const SimulationConfig& cfg);

// ============================================================================
// Results
// ============================================================================

struct OutputMeta {
    std::string config_path;
    size_t threads{1};
    double exec_ms{0};
};

json::object action_to_json(const Action& action);
json::array actions_to_json(const std::vector<Action>& actions);

json::object summary_to_json(const SimulationSummary& s);
json::object run_to_json(const RunResult& r);
json::object build_output_json(const std::vector<RunResult>& runs, const OutputMeta& meta);

// Write results to JSON file; false if the file cannot be written
bool write_results_json(const std::string& output_path, const std::vector<RunResult>& runs,
                        const OutputMeta& meta);

} // namespace harness
} // namespace mev
