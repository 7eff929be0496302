#include "snowid/codec/codec.h"

#include <cstdint>

namespace snowid::codec {

namespace {

constexpr int kBitsPerSymbol = 5;
constexpr std::uint64_t kSymbolMask = (1u << kBitsPerSymbol) - 1;

// 64 = 12 * 5 + 4: the leading symbol carries only the top 4 bits.
constexpr std::uint8_t kMaxLeadingValue = (1u << (64 - (kEncodedLength - 1) * kBitsPerSymbol)) - 1;

constexpr std::uint8_t kNotASymbol = 0xFF;

// Inverse of kAlphabet: byte value -> digit, kNotASymbol elsewhere.
// Built during constant initialization, before any decode can run.
constexpr std::array<std::uint8_t, 256> kDecodeTable = [] {
  std::array<std::uint8_t, 256> table{};
  table.fill(kNotASymbol);
  for (std::size_t digit = 0; digit < kAlphabet.size(); ++digit) {
    table[static_cast<unsigned char>(kAlphabet[digit])] = static_cast<std::uint8_t>(digit);
  }
  return table;
}();

static_assert(kAlphabet.size() == 32);
static_assert(kDecodeTable[static_cast<unsigned char>('y')] == 0);
static_assert(kDecodeTable[static_cast<unsigned char>('9')] == 31);
static_assert(kDecodeTable[static_cast<unsigned char>('0')] == kNotASymbol);

}  // namespace

EncodedId encode(const core::SnowflakeId id) noexcept {
  EncodedId out;
  out.fill(kAlphabet[0]);

  // Digits come out least-significant first and are written right to left.
  auto bits = static_cast<std::uint64_t>(id.value);
  std::size_t pos = kEncodedLength;
  while (bits != 0) {
    out[--pos] = kAlphabet[bits & kSymbolMask];
    bits >>= kBitsPerSymbol;
  }
  return out;
}

std::string encode_to_string(const core::SnowflakeId id) {
  const EncodedId encoded = encode(id);
  return std::string(encoded.data(), encoded.size());
}

core::Result<core::SnowflakeId, core::DecodeError> decode(const std::string_view text) {
  using DecodeResult = core::Result<core::SnowflakeId, core::DecodeError>;

  if (text.size() != kEncodedLength) {
    return DecodeResult::err(core::DecodeError::kInvalidLength);
  }

  std::uint64_t bits = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const std::uint8_t digit = kDecodeTable[static_cast<unsigned char>(text[i])];
    if (digit == kNotASymbol) {
      return DecodeResult::err(core::DecodeError::kInvalidSymbol);
    }
    if (i == 0 && digit > kMaxLeadingValue) {
      return DecodeResult::err(core::DecodeError::kOutOfRange);
    }
    bits = (bits << kBitsPerSymbol) | digit;
  }

  return DecodeResult::ok(core::SnowflakeId{static_cast<std::int64_t>(bits)});
}

bool is_alphabet_symbol(const char c) noexcept {
  return kDecodeTable[static_cast<unsigned char>(c)] != kNotASymbol;
}

std::string_view describe(const core::DecodeError error) {
  switch (error) {
    case core::DecodeError::kInvalidLength:
      return "encoded id must be exactly 13 characters";
    case core::DecodeError::kInvalidSymbol:
      return "encoded id contains a character outside the alphabet";
    case core::DecodeError::kOutOfRange:
      return "encoded id does not fit in 64 bits";
  }
  return "unknown decode error";  // unreachable: all enumerators covered above
}

}  // namespace snowid::codec
