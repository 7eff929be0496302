#include "snowid/core/version.h"

#include "commands/codec.h"
#include "commands/generate.h"
#include "config.h"
#include <iostream>
#include <string>

namespace {

void print_usage(std::ostream& os) {
  os << "snowid_cli v" << snowid::core::kBuildVersion << "\n"
     << "Usage: snowid_cli <command> [options]\n"
     << "\n"
     << "Commands:\n"
     << "  generate [options]          Generate ids (one JSON object per line)\n"
     << "  encode <decimal-id>         Print the 13-character text form\n"
     << "  decode <encoded-id>         Print the decimal id\n"
     << "  inspect <id|encoded-id>     Print fields and generation time\n"
     << "\n"
     << "generate options:\n"
     << snowid::apps::format_options(snowid::cli::generate_options());
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(std::cerr);
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "generate") {
    return cmd_generate(argc, argv);
  }
  if (subcommand == "encode") {
    return cmd_encode(argc, argv);
  }
  if (subcommand == "decode") {
    return cmd_decode(argc, argv);
  }
  if (subcommand == "inspect") {
    return cmd_inspect(argc, argv);
  }
  if (subcommand == "--help" || subcommand == "-h") {
    print_usage(std::cout);
    return 0;
  }
  if (subcommand == "--version") {
    std::cout << "snowid_cli v" << snowid::core::kBuildVersion << "\n";
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage(std::cerr);
  return 1;
}
