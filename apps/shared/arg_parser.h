#pragma once

#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace snowid::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure (the parser
// continues processing remaining flags regardless of the return value).
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag
// to its handler, and returns the populated config.
// Non-flag tokens are skipped; callers read positional arguments from argv
// directly.
//
// Unknown flags, a flag missing its value, and handler rejections are appended
// to errors when it is given (the caller decides whether they are fatal), and
// otherwise reported to stderr.
template <typename Config>
Config parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                     const std::vector<Option<Config>>& options, int start = 1,
                     Config default_config = {}, std::vector<std::string>* errors = nullptr) {
  Config config = std::move(default_config);

  auto report = [errors](std::string message) {
    if (errors != nullptr) {
      errors->push_back(std::move(message));
    } else {
      std::cerr << message << "\n";
    }
  };

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it != option_map.end()) {
      const Option<Config>* opt = it->second;
      if (opt->requires_value) {
        if (i + 1 < argc) {
          const std::string value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
          if (!opt->handler(config, value)) {
            report("Invalid value for " + arg + ": '" + value + "'");
          }
        } else {
          report("Option " + arg + " requires a value");
        }
      } else if (!opt->handler(config, "")) {
        report("Option " + arg + " was rejected");
      }
    } else if (!arg.empty() && arg[0] == '-') {
      report("Unknown option: " + arg);
    }
  }

  return config;
}

// format_options renders one "  --name <value>  description" line per option.
template <typename Config>
std::string format_options(const std::vector<Option<Config>>& options) {
  std::ostringstream oss;
  for (const auto& opt : options) {
    oss << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n      "
        << opt.description << "\n";
  }
  return oss.str();
}

}  // namespace snowid::apps
