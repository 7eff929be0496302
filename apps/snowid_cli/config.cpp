#include "config.h"

#include "snowid/core/id.h"

#include <charconv>
#include <system_error>
#include <utility>

namespace snowid::cli {

namespace {

std::optional<int> parse_int_in_range(const std::string& value, const int min, const int max) {
  if (value.empty()) {
    return std::nullopt;
  }

  int parsed = 0;
  const char* first = value.data();
  const char* last = first + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  if (parsed < min || parsed > max) {
    return std::nullopt;
  }
  return parsed;
}

}  // namespace

std::vector<apps::Option<GenerateConfig>> generate_options() {
  return {
      {"--node", true, "Node id in [0, 1023] (default: $SNOWID_NODE_ID)",
       [](GenerateConfig& c, const std::string& v) {
         c.node_id = v;
         return true;
       }},
      {"--count", true, "Number of ids to generate (default: 1)",
       [](GenerateConfig& c, const std::string& v) {
         c.count = v;
         return true;
       }},
      {"--pretty", false, "Indent JSON output",
       [](GenerateConfig& c, const std::string& /*v*/) {
         c.pretty = true;
         return true;
       }},
  };
}

GenerateConfig parse_generate_args(int argc, char* argv[],
                                   const std::optional<std::string>& env_node_id) {
  GenerateConfig defaults;
  defaults.node_id = env_node_id;
  std::vector<std::string> errors;
  auto config =
      apps::parse_options(argc, argv, generate_options(), 2, std::move(defaults), &errors);
  config.parse_errors = std::move(errors);
  return config;
}

std::optional<int> parse_node_id(const std::string& value) {
  return parse_int_in_range(value, 0, core::kMaxNodeId);
}

std::optional<int> parse_count(const std::string& value) {
  return parse_int_in_range(value, 1, kMaxCount);
}

std::string validate_generate_config(const GenerateConfig& config) {
  if (!config.parse_errors.empty()) {
    return "Error: " + config.parse_errors.front() + ".";
  }

  if (!config.node_id.has_value()) {
    return std::string("Error: a node id is required.\n"
                       "       Pass --node <0-1023> or set ") +
           kNodeIdEnvVar + ".";
  }

  if (!parse_node_id(config.node_id.value()).has_value()) {
    return "Error: node id '" + config.node_id.value() + "' is not an integer in [0, 1023].";
  }

  if (!parse_count(config.count).has_value()) {
    return "Error: --count '" + config.count + "' is not an integer in [1, " +
           std::to_string(kMaxCount) + "].";
  }

  return "";
}

}  // namespace snowid::cli
