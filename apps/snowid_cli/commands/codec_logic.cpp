#include "codec_logic.h"

#include "snowid/codec/codec.h"
#include "snowid/codec/id_json.h"
#include "snowid/core/id.h"

#include <algorithm>
#include <optional>

namespace {

bool looks_encoded(const std::string& text) {
  return text.size() == snowid::codec::kEncodedLength &&
         std::all_of(text.begin(), text.end(),
                     [](const char c) { return snowid::codec::is_alphabet_symbol(c); });
}

}  // namespace

int execute_encode(const std::string& decimal_id, std::ostream& out, std::ostream& err) {
  const auto id = snowid::core::parse_id(decimal_id);
  if (!id.has_value()) {
    err << "Invalid id: '" << decimal_id << "' is not a signed 64-bit integer\n";
    return 1;
  }

  out << snowid::codec::encode_to_string(id.value()) << "\n";
  return 0;
}

int execute_decode(const std::string& text, std::ostream& out, std::ostream& err) {
  const auto result = snowid::codec::decode(text);
  if (!result.has_value()) {
    err << "Invalid encoded id '" << text << "': " << snowid::codec::describe(result.error())
        << "\n";
    return 1;
  }

  out << result.value().value << "\n";
  return 0;
}

int execute_inspect(const std::string& id_or_text, std::ostream& out, std::ostream& err) {
  // 13 alphabet symbols are read as an encoded id, even when every symbol is
  // also a decimal digit ("8999999999999" is INT64_MAX, not 8999999999999).
  // Anything else is read as a decimal id.
  std::optional<snowid::core::SnowflakeId> id;
  if (looks_encoded(id_or_text)) {
    const auto result = snowid::codec::decode(id_or_text);
    if (!result.has_value()) {
      err << "Invalid encoded id '" << id_or_text
          << "': " << snowid::codec::describe(result.error()) << "\n";
      return 1;
    }
    id = result.value();
  } else {
    id = snowid::core::parse_id(id_or_text);
    if (!id.has_value()) {
      err << "Invalid id: '" << id_or_text
          << "' is neither a decimal id nor a 13-character encoded id\n";
      return 1;
    }
  }

  out << snowid::codec::id_to_json(id.value()).dump(2) << "\n";
  return 0;
}
