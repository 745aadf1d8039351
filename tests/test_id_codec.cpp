#include "flakeid/flake/id_codec.h"

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstdint>
#include <limits>

using namespace flakeid;
using flakeid::flake::Id;
using flakeid::flake::IdFormat;

namespace {

constexpr Id kSampleId{475370495148032ULL};
constexpr Id kMaxId{std::numeric_limits<std::uint64_t>::max()};

}  // namespace

// ── encodings: known values ─────────────────────────────────────────────────

TEST_CASE("to_padded_string: pads to 19 digits by default", "[codec]") {
  CHECK(flake::to_padded_string(kSampleId) == "0000475370495148032");
  CHECK(flake::to_padded_string(Id{0}) == "0000000000000000000");
  CHECK(flake::to_padded_string(Id{42}, 5) == "00042");
}

TEST_CASE("to_padded_string: never truncates", "[codec]") {
  CHECK(flake::to_padded_string(kMaxId) == "18446744073709551615");
  CHECK(flake::to_padded_string(Id{123456}, 3) == "123456");
}

TEST_CASE("to_base64: encodes the decimal text", "[codec]") {
  CHECK(flake::to_base64(kSampleId) == "NDc1MzcwNDk1MTQ4MDMy");
  CHECK(flake::to_base64(Id{0}) == "MA==");
  CHECK(flake::to_base64(Id{12}) == "MTI=");
}

TEST_CASE("to_hex: uppercase with at least two digits", "[codec]") {
  CHECK(flake::to_hex(Id{1}) == "01");
  CHECK(flake::to_hex(Id{255}) == "FF");
  CHECK(flake::to_hex(Id{0xABCDEF}) == "ABCDEF");
  CHECK(flake::to_hex(kMaxId) == "FFFFFFFFFFFFFFFF");
}

TEST_CASE("to_base2, to_base36, to_base32: small values", "[codec]") {
  CHECK(flake::to_base2(Id{0}) == "0");
  CHECK(flake::to_base2(Id{5}) == "101");
  CHECK(flake::to_base36(Id{35}) == "z");
  CHECK(flake::to_base36(Id{36}) == "10");
  CHECK(flake::to_base32(Id{0}) == "0");
  CHECK(flake::to_base32(Id{31}) == "Z");
  CHECK(flake::to_base32(Id{32}) == "10");
}

TEST_CASE("to_bytes: big-endian", "[codec]") {
  const std::array<std::uint8_t, 8> expected{1, 2, 3, 4, 5, 6, 7, 8};
  CHECK(flake::to_bytes(Id{0x0102030405060708ULL}) == expected);
  CHECK(flake::from_bytes(expected) == Id{0x0102030405060708ULL});
}

// ── round trip for every format ─────────────────────────────────────────────

TEST_CASE("format_id and parse_id round-trip in every format", "[codec]") {
  const IdFormat formats[] = {IdFormat::kDecimal, IdFormat::kPadded, IdFormat::kBase2,
                              IdFormat::kHex,     IdFormat::kBase32, IdFormat::kBase36,
                              IdFormat::kBase64};
  const Id ids[] = {Id{0}, Id{1}, kSampleId, Id{9223372036854775807ULL}, kMaxId};

  for (const auto format : formats) {
    for (const auto id : ids) {
      const auto text = flake::format_id(id, format);
      const auto parsed = flake::parse_id(text, format);
      INFO("text: " << text);
      REQUIRE(parsed.has_value());
      CHECK(parsed.value() == id);
    }
  }
}

TEST_CASE("from_bytes inverts to_bytes at the extremes", "[codec]") {
  CHECK(flake::from_bytes(flake::to_bytes(Id{0})) == Id{0});
  CHECK(flake::from_bytes(flake::to_bytes(kMaxId)) == kMaxId);
}

// ── parsing: lenient forms ──────────────────────────────────────────────────

TEST_CASE("parse_string: accepts zero-padded decimal", "[codec]") {
  const auto parsed = flake::parse_string("0000475370495148032");
  REQUIRE(parsed.has_value());
  CHECK(parsed.value() == kSampleId);
}

TEST_CASE("parse_hex: accepts lowercase", "[codec]") {
  const auto parsed = flake::parse_hex("abcdef");
  REQUIRE(parsed.has_value());
  CHECK(parsed.value() == Id{0xABCDEF});
}

TEST_CASE("parse_base32: case-insensitive with Crockford aliases", "[codec]") {
  REQUIRE(flake::parse_base32("z").has_value());
  CHECK(flake::parse_base32("z").value() == Id{31});
  CHECK(flake::parse_base32("O").value() == Id{0});
  CHECK(flake::parse_base32("I").value() == Id{1});
  CHECK(flake::parse_base32("l").value() == Id{1});
}

// ── parsing: rejections ─────────────────────────────────────────────────────

TEST_CASE("parse_string: rejects malformed input", "[codec]") {
  CHECK(flake::parse_string("").error() == core::ParseError::kInvalidFormat);
  CHECK(flake::parse_string("12a").error() == core::ParseError::kInvalidFormat);
  CHECK(flake::parse_string("-1").error() == core::ParseError::kInvalidFormat);
  CHECK(flake::parse_string(" 1").error() == core::ParseError::kInvalidFormat);
}

TEST_CASE("parsers: values above 64 bits are out of range", "[codec]") {
  CHECK(flake::parse_string("18446744073709551616").error() == core::ParseError::kOutOfRange);
  CHECK(flake::parse_hex("10000000000000000").error() == core::ParseError::kOutOfRange);
  CHECK(flake::parse_base32("ZZZZZZZZZZZZZZ").error() == core::ParseError::kOutOfRange);
}

TEST_CASE("parse_base32: rejects characters outside the alphabet", "[codec]") {
  CHECK(flake::parse_base32("").error() == core::ParseError::kInvalidFormat);
  CHECK(flake::parse_base32("U").error() == core::ParseError::kInvalidFormat);
  CHECK(flake::parse_base32("1-2").error() == core::ParseError::kInvalidFormat);
}

TEST_CASE("parse_base64: rejects malformed input", "[codec]") {
  CHECK_FALSE(flake::parse_base64("").has_value());
  CHECK_FALSE(flake::parse_base64("abc").has_value());
  CHECK_FALSE(flake::parse_base64("MA=A").has_value());
  CHECK_FALSE(flake::parse_base64("!!!!").has_value());
  // Non-zero bits under the padding; "MQ==" is the canonical spelling of "1".
  CHECK_FALSE(flake::parse_base64("MR==").has_value());
  CHECK_FALSE(flake::parse_base64("MTJ=").has_value());
  CHECK(flake::parse_base64("MQ==").has_value());
  CHECK(flake::parse_base64("MTI=").has_value());
  // Valid base64, but the payload "abc" is not a decimal number.
  CHECK_FALSE(flake::parse_base64("YWJj").has_value());
}

TEST_CASE("parse_id_format: known and unknown names", "[codec]") {
  CHECK(flake::parse_id_format("decimal") == IdFormat::kDecimal);
  CHECK(flake::parse_id_format("padded") == IdFormat::kPadded);
  CHECK(flake::parse_id_format("hex") == IdFormat::kHex);
  CHECK(flake::parse_id_format("base64") == IdFormat::kBase64);
  CHECK_FALSE(flake::parse_id_format("octal").has_value());
  CHECK_FALSE(flake::parse_id_format("").has_value());
}
