#pragma once

#include "shared/arg_parser.h"

#include <optional>
#include <string>
#include <vector>

namespace snowid::cli {

// Environment variable consulted when --node is absent.
constexpr const char* kNodeIdEnvVar = "SNOWID_NODE_ID";

// Upper bound on --count; keeps a typo from flooding stdout.
constexpr int kMaxCount = 1000000;

// GenerateConfig holds the raw flags of the generate subcommand.
// Values stay as strings until validate_generate_config accepts them.
struct GenerateConfig {
  std::optional<std::string> node_id;  // NOLINT(readability-identifier-naming)
  std::string count{"1"};              // NOLINT(readability-identifier-naming)
  bool pretty{false};                  // NOLINT(readability-identifier-naming)
  // Unknown flags and flags missing their value.
  std::vector<std::string> parse_errors;  // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::vector<apps::Option<GenerateConfig>> generate_options();

// parse_generate_args reads argv[2..]. env_node_id is the value of
// kNodeIdEnvVar, if set; an explicit --node always wins over it.
[[nodiscard]] GenerateConfig parse_generate_args(
    int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
    const std::optional<std::string>& env_node_id);

// parse_node_id accepts a base-10 integer in [0, 1023].
[[nodiscard]] std::optional<int> parse_node_id(const std::string& value);

// parse_count accepts a base-10 integer in [1, kMaxCount].
[[nodiscard]] std::optional<int> parse_count(const std::string& value);

// validate_generate_config checks the parsed flags. Any parse error is fatal,
// so a "--count" with no value never falls back to the default.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
[[nodiscard]] std::string validate_generate_config(const GenerateConfig& config);

}  // namespace snowid::cli
