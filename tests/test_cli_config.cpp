#include <catch2/catch_test_macros.hpp>

#include "config.h"

#include <optional>
#include <string>
#include <vector>

using namespace snowid::cli;

namespace {

// Owns argv storage for parse_generate_args.
struct Argv {
  explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
    for (auto& s : storage) {
      pointers.push_back(s.data());
    }
  }
  int argc() const { return static_cast<int>(pointers.size()); }
  char** argv() { return pointers.data(); }

  std::vector<std::string> storage;
  std::vector<char*> pointers;
};

}  // namespace

// ── parse_generate_args ─────────────────────────────────────────────────────

TEST_CASE("parse_generate_args: reads --node, --count and --pretty", "[cli][config]") {
  Argv args({"snowid_cli", "generate", "--node", "5", "--count", "3", "--pretty"});
  const auto config = parse_generate_args(args.argc(), args.argv(), std::nullopt);

  REQUIRE(config.node_id.has_value());
  CHECK(config.node_id.value() == "5");
  CHECK(config.count == "3");
  CHECK(config.pretty);
}

TEST_CASE("parse_generate_args: defaults", "[cli][config]") {
  Argv args({"snowid_cli", "generate"});
  const auto config = parse_generate_args(args.argc(), args.argv(), std::nullopt);

  CHECK_FALSE(config.node_id.has_value());
  CHECK(config.count == "1");
  CHECK_FALSE(config.pretty);
}

TEST_CASE("parse_generate_args: environment supplies node id, flag wins", "[cli][config]") {
  Argv without_flag({"snowid_cli", "generate"});
  const auto from_env =
      parse_generate_args(without_flag.argc(), without_flag.argv(), std::string{"17"});
  CHECK(from_env.node_id == std::optional<std::string>{"17"});

  Argv with_flag({"snowid_cli", "generate", "--node", "3"});
  const auto from_flag = parse_generate_args(with_flag.argc(), with_flag.argv(), std::string{"17"});
  CHECK(from_flag.node_id == std::optional<std::string>{"3"});
}

// ── parse_node_id / parse_count ─────────────────────────────────────────────

TEST_CASE("parse_node_id: accepts [0, 1023] only", "[cli][config]") {
  CHECK(parse_node_id("0") == 0);
  CHECK(parse_node_id("1023") == 1023);
  CHECK_FALSE(parse_node_id("1024").has_value());
  CHECK_FALSE(parse_node_id("-1").has_value());
  CHECK_FALSE(parse_node_id("").has_value());
  CHECK_FALSE(parse_node_id("5x").has_value());
}

TEST_CASE("parse_count: accepts [1, kMaxCount] only", "[cli][config]") {
  CHECK(parse_count("1") == 1);
  CHECK(parse_count(std::to_string(kMaxCount)) == kMaxCount);
  CHECK_FALSE(parse_count("0").has_value());
  CHECK_FALSE(parse_count(std::to_string(kMaxCount + 1)).has_value());
  CHECK_FALSE(parse_count("ten").has_value());
}

// ── validate_generate_config ────────────────────────────────────────────────

TEST_CASE("validate_generate_config: valid configuration returns empty", "[cli][config]") {
  GenerateConfig config;
  config.node_id = "5";
  config.count = "10";
  CHECK(validate_generate_config(config).empty());
}

TEST_CASE("validate_generate_config: missing node id names the env var", "[cli][config]") {
  GenerateConfig config;
  const auto error = validate_generate_config(config);
  REQUIRE_FALSE(error.empty());
  CHECK(error.find(kNodeIdEnvVar) != std::string::npos);
}

TEST_CASE("validate_generate_config: out-of-range node id and bad count", "[cli][config]") {
  GenerateConfig bad_node;
  bad_node.node_id = "2048";
  CHECK_FALSE(validate_generate_config(bad_node).empty());

  GenerateConfig bad_count;
  bad_count.node_id = "1";
  bad_count.count = "0";
  CHECK_FALSE(validate_generate_config(bad_count).empty());
}

// ── malformed flags are fatal ───────────────────────────────────────────────

TEST_CASE("validate_generate_config: flag missing its value is an error", "[cli][config]") {
  Argv args({"snowid_cli", "generate", "--node", "5", "--count"});
  const auto config = parse_generate_args(args.argc(), args.argv(), std::nullopt);

  REQUIRE(config.parse_errors.size() == 1);
  const auto error = validate_generate_config(config);
  REQUIRE_FALSE(error.empty());
  CHECK(error.find("--count") != std::string::npos);
}

TEST_CASE("validate_generate_config: unknown flag is an error", "[cli][config]") {
  Argv args({"snowid_cli", "generate", "--node", "5", "--nodes", "6"});
  const auto config = parse_generate_args(args.argc(), args.argv(), std::nullopt);

  const auto error = validate_generate_config(config);
  REQUIRE_FALSE(error.empty());
  CHECK(error.find("--nodes") != std::string::npos);
}

TEST_CASE("parse_generate_args: well-formed flags record no errors", "[cli][config]") {
  Argv args({"snowid_cli", "generate", "--node", "5", "--count", "2", "--pretty"});
  const auto config = parse_generate_args(args.argc(), args.argv(), std::nullopt);
  CHECK(config.parse_errors.empty());
}
