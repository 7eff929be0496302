#pragma once

#include "snowid/core/id.h"
#include "snowid/core/result.h"

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace snowid::codec {

// Textual form of an ID: exactly 13 symbols, most-significant digit first,
// base 32 over a custom alphabet that leaves out visually ambiguous
// characters (0, l, v, 2). Short values are left-padded with the zero-digit
// symbol 'y', so every 64-bit value has exactly one encoding.
constexpr std::size_t kEncodedLength = 13;
constexpr std::string_view kAlphabet = "ybndrfg8ejkmcpqxot1uwisza345h769";

using EncodedId = std::array<char, kEncodedLength>;

// encode never fails.
[[nodiscard]] EncodedId encode(core::SnowflakeId id) noexcept;
[[nodiscard]] std::string encode_to_string(core::SnowflakeId id);

// decode is the inverse of encode.
// Errors: kInvalidLength unless text is 13 bytes, kInvalidSymbol on the first
// byte outside the alphabet, kOutOfRange when the leading symbol would need a
// 65th bit. No partial value is returned on error.
[[nodiscard]] core::Result<core::SnowflakeId, core::DecodeError> decode(std::string_view text);

[[nodiscard]] bool is_alphabet_symbol(char c) noexcept;

// describe returns a short diagnostic for a DecodeError.
[[nodiscard]] std::string_view describe(core::DecodeError error);

}  // namespace snowid::codec
