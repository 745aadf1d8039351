#include "flakeid/flake/id_codec.h"

#include <charconv>
#include <system_error>

namespace flakeid::flake {

namespace {

using ParseResult = core::Result<Id, core::ParseError>;

constexpr std::string_view kBase32Alphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
constexpr std::string_view kBase64Alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string to_radix(const std::uint64_t value, const int base) {
  // 64 binary digits is the longest rendering.
  std::array<char, 64> buffer{};
  const auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value, base);
  (void)ec;  // cannot fail: the buffer fits any uint64 in base >= 2
  return std::string(buffer.data(), end);
}

// from_radix accepts only the full input; from_chars handles both letter cases.
ParseResult from_radix(const std::string_view text, const int base) {
  if (text.empty()) {
    return ParseResult::err(core::ParseError::kInvalidFormat);
  }
  std::uint64_t value = 0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value, base);
  if (ec == std::errc::result_out_of_range) {
    return ParseResult::err(core::ParseError::kOutOfRange);
  }
  if (ec != std::errc{} || ptr != last) {
    return ParseResult::err(core::ParseError::kInvalidFormat);
  }
  return ParseResult::ok(Id{value});
}

int base32_digit(char c) {
  if (c >= 'a' && c <= 'z') {
    c = static_cast<char>(c - ('a' - 'A'));
  }
  if (c == 'I' || c == 'L') {
    return 1;
  }
  if (c == 'O') {
    return 0;
  }
  const auto pos = kBase32Alphabet.find(c);
  return pos == std::string_view::npos ? -1 : static_cast<int>(pos);
}

int base64_digit(const char c) {
  const auto pos = kBase64Alphabet.find(c);
  return pos == std::string_view::npos ? -1 : static_cast<int>(pos);
}

std::string base64_encode(const std::string_view data) {
  std::string out;
  out.reserve((data.size() + 2) / 3 * 4);

  std::size_t i = 0;
  for (; i + 2 < data.size(); i += 3) {
    const std::uint32_t n = static_cast<std::uint8_t>(data[i]) << 16 |
                            static_cast<std::uint8_t>(data[i + 1]) << 8 |
                            static_cast<std::uint8_t>(data[i + 2]);
    out.push_back(kBase64Alphabet[(n >> 18) & 0x3F]);
    out.push_back(kBase64Alphabet[(n >> 12) & 0x3F]);
    out.push_back(kBase64Alphabet[(n >> 6) & 0x3F]);
    out.push_back(kBase64Alphabet[n & 0x3F]);
  }

  const std::size_t remaining = data.size() - i;
  if (remaining == 1) {
    const std::uint32_t n = static_cast<std::uint8_t>(data[i]) << 16;
    out.push_back(kBase64Alphabet[(n >> 18) & 0x3F]);
    out.push_back(kBase64Alphabet[(n >> 12) & 0x3F]);
    out.append("==");
  } else if (remaining == 2) {
    const std::uint32_t n =
        static_cast<std::uint8_t>(data[i]) << 16 | static_cast<std::uint8_t>(data[i + 1]) << 8;
    out.push_back(kBase64Alphabet[(n >> 18) & 0x3F]);
    out.push_back(kBase64Alphabet[(n >> 12) & 0x3F]);
    out.push_back(kBase64Alphabet[(n >> 6) & 0x3F]);
    out.push_back('=');
  }
  return out;
}

// base64_decode requires canonical padded input; returns nullopt otherwise.
std::optional<std::string> base64_decode(const std::string_view text) {
  if (text.empty() || text.size() % 4 != 0) {
    return std::nullopt;
  }

  std::string out;
  out.reserve(text.size() / 4 * 3);
  for (std::size_t i = 0; i < text.size(); i += 4) {
    const bool last_quad = i + 4 == text.size();
    std::size_t padding = 0;
    if (last_quad) {
      if (text[i + 3] == '=') {
        padding = text[i + 2] == '=' ? 2 : 1;
      }
    }

    std::uint32_t n = 0;
    for (std::size_t j = 0; j < 4; ++j) {
      if (j >= 4 - padding) {
        n <<= 6;
        continue;
      }
      const int digit = base64_digit(text[i + j]);
      if (digit < 0) {
        return std::nullopt;
      }
      n = n << 6 | static_cast<std::uint32_t>(digit);
    }

    // Bits below the last decoded byte must be zero in canonical input.
    if ((padding == 2 && (n & 0xFFFF) != 0) || (padding == 1 && (n & 0xFF) != 0)) {
      return std::nullopt;
    }

    out.push_back(static_cast<char>((n >> 16) & 0xFF));
    if (padding < 2) {
      out.push_back(static_cast<char>((n >> 8) & 0xFF));
    }
    if (padding < 1) {
      out.push_back(static_cast<char>(n & 0xFF));
    }
  }
  return out;
}

}  // namespace

std::string to_string(const Id id) {
  return std::to_string(id.value);
}

std::string to_padded_string(const Id id, const std::size_t width) {
  std::string digits = to_string(id);
  if (digits.size() >= width) {
    return digits;
  }
  return std::string(width - digits.size(), '0') + digits;
}

std::string to_base2(const Id id) {
  return to_radix(id.value, 2);
}

std::string to_hex(const Id id) {
  std::string hex = to_radix(id.value, 16);
  for (char& c : hex) {
    if (c >= 'a' && c <= 'f') {
      c = static_cast<char>(c - ('a' - 'A'));
    }
  }
  return hex.size() < 2 ? "0" + hex : hex;
}

std::string to_base32(const Id id) {
  if (id.value == 0) {
    return std::string(1, kBase32Alphabet[0]);
  }
  std::string out;
  std::uint64_t value = id.value;
  while (value > 0) {
    out.insert(out.begin(), kBase32Alphabet[value & 0x1F]);
    value >>= 5;
  }
  return out;
}

std::string to_base36(const Id id) {
  return to_radix(id.value, 36);
}

std::string to_base64(const Id id) {
  return base64_encode(to_string(id));
}

std::array<std::uint8_t, 8> to_bytes(const Id id) {
  std::array<std::uint8_t, 8> bytes{};
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    bytes[i] = static_cast<std::uint8_t>(id.value >> (56 - 8 * i));
  }
  return bytes;
}

core::Result<Id, core::ParseError> parse_string(const std::string_view text) {
  return from_radix(text, 10);
}

core::Result<Id, core::ParseError> parse_base2(const std::string_view text) {
  return from_radix(text, 2);
}

core::Result<Id, core::ParseError> parse_hex(const std::string_view text) {
  return from_radix(text, 16);
}

core::Result<Id, core::ParseError> parse_base32(const std::string_view text) {
  if (text.empty()) {
    return ParseResult::err(core::ParseError::kInvalidFormat);
  }
  std::uint64_t value = 0;
  for (const char c : text) {
    const int digit = base32_digit(c);
    if (digit < 0) {
      return ParseResult::err(core::ParseError::kInvalidFormat);
    }
    if (value > (UINT64_MAX >> 5)) {
      return ParseResult::err(core::ParseError::kOutOfRange);
    }
    value = value << 5 | static_cast<std::uint64_t>(digit);
  }
  return ParseResult::ok(Id{value});
}

core::Result<Id, core::ParseError> parse_base36(const std::string_view text) {
  return from_radix(text, 36);
}

core::Result<Id, core::ParseError> parse_base64(const std::string_view text) {
  const auto decoded = base64_decode(text);
  if (!decoded.has_value()) {
    return ParseResult::err(core::ParseError::kInvalidFormat);
  }
  return parse_string(decoded.value());
}

Id from_bytes(const std::array<std::uint8_t, 8>& bytes) {
  std::uint64_t value = 0;
  for (const std::uint8_t b : bytes) {
    value = value << 8 | b;
  }
  return Id{value};
}

std::optional<IdFormat> parse_id_format(const std::string_view name) {
  if (name == "decimal") {
    return IdFormat::kDecimal;
  }
  if (name == "padded") {
    return IdFormat::kPadded;
  }
  if (name == "base2") {
    return IdFormat::kBase2;
  }
  if (name == "hex") {
    return IdFormat::kHex;
  }
  if (name == "base32") {
    return IdFormat::kBase32;
  }
  if (name == "base36") {
    return IdFormat::kBase36;
  }
  if (name == "base64") {
    return IdFormat::kBase64;
  }
  return std::nullopt;
}

std::string format_id(const Id id, const IdFormat format) {
  switch (format) {
    case IdFormat::kDecimal:
      return to_string(id);
    case IdFormat::kPadded:
      return to_padded_string(id);
    case IdFormat::kBase2:
      return to_base2(id);
    case IdFormat::kHex:
      return to_hex(id);
    case IdFormat::kBase32:
      return to_base32(id);
    case IdFormat::kBase36:
      return to_base36(id);
    case IdFormat::kBase64:
      return to_base64(id);
  }
  return to_string(id);
}

core::Result<Id, core::ParseError> parse_id(const std::string_view text, const IdFormat format) {
  switch (format) {
    case IdFormat::kDecimal:
    case IdFormat::kPadded:
      return parse_string(text);
    case IdFormat::kBase2:
      return parse_base2(text);
    case IdFormat::kHex:
      return parse_hex(text);
    case IdFormat::kBase32:
      return parse_base32(text);
    case IdFormat::kBase36:
      return parse_base36(text);
    case IdFormat::kBase64:
      return parse_base64(text);
  }
  return ParseResult::err(core::ParseError::kInvalidFormat);
}

}  // namespace flakeid::flake
