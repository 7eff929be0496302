#include "generate.h"

#include "snowid/generator/snowflake_generator.h"

#include "config.h"
#include "generate_logic.h"
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

int cmd_generate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::optional<std::string> env_node_id;
  if (const char* env = std::getenv(snowid::cli::kNodeIdEnvVar); env != nullptr) {
    env_node_id = env;
  }

  const auto config = snowid::cli::parse_generate_args(argc, argv, env_node_id);

  const std::string config_error = snowid::cli::validate_generate_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  // Both values were accepted by validate_generate_config above.
  const int node_id = snowid::cli::parse_node_id(config.node_id.value()).value();
  const int count = snowid::cli::parse_count(config.count).value();

  snowid::generator::SnowflakeGenerator generator;
  return execute_generate(generator, node_id, count, config.pretty, std::cout);
}
