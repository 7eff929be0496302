#include "snowid/codec/codec.h"
#include "snowid/core/clock.h"
#include "snowid/generator/snowflake_generator.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <set>
#include <string>

using namespace snowid;
using snowid::core::DecodeError;
using snowid::core::SnowflakeId;

namespace {

std::int64_t decode_ok(const std::string& text) {
  const auto result = codec::decode(text);
  REQUIRE(result.has_value());
  return result.value().value;
}

}  // namespace

TEST_CASE("Alphabet has 32 distinct unambiguous symbols", "[codec]") {
  const std::set<char> symbols(codec::kAlphabet.begin(), codec::kAlphabet.end());
  CHECK(symbols.size() == 32);
  for (const char excluded : {'0', '2', 'l', 'v'}) {
    CHECK_FALSE(codec::is_alphabet_symbol(excluded));
  }
  for (const char c : codec::kAlphabet) {
    CHECK(codec::is_alphabet_symbol(c));
  }
}

// ── encode: pinned vectors ─────────────────────────────────────────────────

TEST_CASE("encode: small ids are left-padded with the zero symbol", "[codec][encode]") {
  CHECK(codec::encode_to_string(SnowflakeId{0}) == "yyyyyyyyyyyyy");
  CHECK(codec::encode_to_string(SnowflakeId{1}) == "yyyyyyyyyyyyb");
  CHECK(codec::encode_to_string(SnowflakeId{31}) == "yyyyyyyyyyyy9");
  CHECK(codec::encode_to_string(SnowflakeId{32}) == "yyyyyyyyyyyby");
  CHECK(codec::encode_to_string(SnowflakeId{1023}) == "yyyyyyyyyyy99");
}

TEST_CASE("encode: full-width values", "[codec][encode]") {
  CHECK(codec::encode_to_string(SnowflakeId{4194324487}) == "yyyyyyd7yywy8");
  CHECK(codec::encode_to_string(SnowflakeId{1234567890123456789}) == "bneoo6t66uyei");
  CHECK(codec::encode_to_string(SnowflakeId{std::numeric_limits<std::int64_t>::max()}) ==
        "8999999999999");
  CHECK(codec::encode_to_string(SnowflakeId{std::numeric_limits<std::int64_t>::min()}) ==
        "eyyyyyyyyyyyy");
  CHECK(codec::encode_to_string(SnowflakeId{-1}) == "x999999999999");
}

TEST_CASE("encode: output is always 13 alphabet symbols", "[codec][encode]") {
  for (const std::int64_t v : {std::int64_t{0}, std::int64_t{7}, std::int64_t{-42},
                               std::int64_t{1} << 40, std::int64_t{1} << 62}) {
    const auto encoded = codec::encode(SnowflakeId{v});
    CHECK(encoded.size() == codec::kEncodedLength);
    for (const char c : encoded) {
      CHECK(codec::is_alphabet_symbol(c));
    }
  }
}

// ── decode ─────────────────────────────────────────────────────────────────

TEST_CASE("decode: pinned vectors", "[codec][decode]") {
  CHECK(decode_ok("yyyyyyyyyyyyy") == 0);
  CHECK(decode_ok("yyyyyyyyyyyyb") == 1);
  CHECK(decode_ok("yyyyyyyyyyyy9") == 31);
  CHECK(decode_ok("yyyyyyd7yywy8") == 4194324487);
  CHECK(decode_ok("x999999999999") == -1);
  CHECK(decode_ok("8999999999999") == std::numeric_limits<std::int64_t>::max());
}

TEST_CASE("decode inverts encode, including ids below 32", "[codec][roundtrip]") {
  for (std::int64_t v = -40; v <= 40; ++v) {
    const auto result = codec::decode(codec::encode_to_string(SnowflakeId{v}));
    REQUIRE(result.has_value());
    CHECK(result.value().value == v);
  }
}

TEST_CASE("decode inverts encode for generated ids", "[codec][roundtrip]") {
  core::ManualClock clock(core::kEpochMillis + 86400000);
  generator::SnowflakeGenerator gen(clock);

  for (int i = 0; i < 100; ++i) {
    const auto id = gen.generate(i % (core::kMaxNodeId + 1));
    const auto result = codec::decode(codec::encode_to_string(id));
    REQUIRE(result.has_value());
    CHECK(result.value() == id);
    clock.advance(i);
  }
}

TEST_CASE("decode rejects symbols outside the alphabet", "[codec][decode]") {
  const std::string valid = "yyyyyyd7yywy8";
  for (std::size_t pos = 0; pos < valid.size(); ++pos) {
    for (const char bad : {'0', '2', 'l', 'v', 'Y', ' ', '\0', '-', '\xff'}) {
      std::string text = valid;
      text[pos] = bad;
      const auto result = codec::decode(text);
      REQUIRE_FALSE(result.has_value());
      CHECK(result.error() == DecodeError::kInvalidSymbol);
    }
  }
}

TEST_CASE("decode rejects wrong lengths", "[codec][decode]") {
  for (const std::string text : {"", "yyyyyyyyyyyy", "yyyyyyyyyyyyyy", "b"}) {
    const auto result = codec::decode(text);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == DecodeError::kInvalidLength);
  }
}

TEST_CASE("decode rejects values wider than 64 bits", "[codec][decode]") {
  // 'x' is digit 15, the largest leading digit that fits; 'o' is 16.
  CHECK(codec::decode("xyyyyyyyyyyyy").has_value());
  const auto result = codec::decode("oyyyyyyyyyyyy");
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error() == DecodeError::kOutOfRange);
  CHECK(codec::decode("9999999999999").error() == DecodeError::kOutOfRange);
}

TEST_CASE("describe covers every DecodeError", "[codec]") {
  CHECK_FALSE(codec::describe(DecodeError::kInvalidLength).empty());
  CHECK_FALSE(codec::describe(DecodeError::kInvalidSymbol).empty());
  CHECK_FALSE(codec::describe(DecodeError::kOutOfRange).empty());
}
