#pragma once

#include "flakeid/core/result.h"
#include "flakeid/flake/layout.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace flakeid::flake {

// Text and byte encodings of an Id for transport and display.
// Every encoding round-trips exactly for all 64-bit values; parsers reject empty input,
// characters outside the alphabet, and values that do not fit in 64 bits.

inline constexpr std::size_t kDefaultPaddedWidth = 19;

[[nodiscard]] std::string to_string(Id id);
// Decimal left-padded with zeros to `width`; never truncates.
[[nodiscard]] std::string to_padded_string(Id id, std::size_t width = kDefaultPaddedWidth);
[[nodiscard]] std::string to_base2(Id id);
[[nodiscard]] std::string to_hex(Id id);  // uppercase, at least two digits
[[nodiscard]] std::string to_base32(Id id);  // Crockford alphabet
[[nodiscard]] std::string to_base36(Id id);  // lowercase
// Standard base64 (with padding) of the decimal text.
[[nodiscard]] std::string to_base64(Id id);
// Big-endian.
[[nodiscard]] std::array<std::uint8_t, 8> to_bytes(Id id);

// parse_string also accepts zero-padded decimal.
[[nodiscard]] core::Result<Id, core::ParseError> parse_string(std::string_view text);
[[nodiscard]] core::Result<Id, core::ParseError> parse_base2(std::string_view text);
[[nodiscard]] core::Result<Id, core::ParseError> parse_hex(std::string_view text);
// Case-insensitive; also maps the Crockford aliases I/L -> 1 and O -> 0.
[[nodiscard]] core::Result<Id, core::ParseError> parse_base32(std::string_view text);
[[nodiscard]] core::Result<Id, core::ParseError> parse_base36(std::string_view text);
[[nodiscard]] core::Result<Id, core::ParseError> parse_base64(std::string_view text);
[[nodiscard]] Id from_bytes(const std::array<std::uint8_t, 8>& bytes);

enum class IdFormat {
  kDecimal,
  kPadded,
  kBase2,
  kHex,
  kBase32,
  kBase36,
  kBase64,
};

// parse_id_format maps "decimal", "padded", "base2", "hex", "base32", "base36", "base64".
[[nodiscard]] std::optional<IdFormat> parse_id_format(std::string_view name);
[[nodiscard]] std::string format_id(Id id, IdFormat format);
[[nodiscard]] core::Result<Id, core::ParseError> parse_id(std::string_view text, IdFormat format);

}  // namespace flakeid::flake
