#include "codec.h"

#include "codec_logic.h"
#include <iostream>
#include <string>

namespace {

// Positional argument at argv[2], or an error message and nullptr.
const char* require_argument(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                             const char* usage) {
  if (argc < 3) {
    std::cerr << "Usage: " << usage << "\n";
    return nullptr;
  }
  return argv[2];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
}

}  // namespace

int cmd_encode(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const char* arg = require_argument(argc, argv, "snowid_cli encode <decimal-id>");
  if (arg == nullptr) {
    return 1;
  }
  return execute_encode(arg, std::cout, std::cerr);
}

int cmd_decode(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const char* arg = require_argument(argc, argv, "snowid_cli decode <encoded-id>");
  if (arg == nullptr) {
    return 1;
  }
  return execute_decode(arg, std::cout, std::cerr);
}

int cmd_inspect(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const char* arg = require_argument(argc, argv, "snowid_cli inspect <decimal-id|encoded-id>");
  if (arg == nullptr) {
    return 1;
  }
  return execute_inspect(arg, std::cout, std::cerr);
}
