#include <herald/common/critical.hpp>
#include <herald/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string_view>

namespace herald::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::string encode_hex(const bytes_view_t& bytes, const std::string_view table) {
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = table[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = table[bytes[i] & 0x0Fu];
  }
  return out;
}

}  // namespace

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

hash32_t make_hash32(const std::string_view& hex) {
  auto hash = try_make_hash32(hex);
  if (!hash) {
    herald::common::critical("make_hash32 expected 64 hex characters");
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy(decoded->begin(), decoded->end(), hash.begin());
  return hash;
}

std::string to_hex(const bytes_view_t& bytes) {
  return encode_hex(bytes, "0123456789abcdef");
}

std::string to_upper_hex(const bytes_view_t& bytes) {
  return encode_hex(bytes, "0123456789ABCDEF");
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded.has_value()) {
    herald::common::critical("invalid hex input");
  }
  return *decoded;
}

std::string to_base64(const bytes_view_t& bytes) {
  static constexpr auto kTable =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);

  auto index = size_t{0};
  while ((index + 3) <= bytes.size()) {
    auto value = (static_cast<uint32_t>(bytes[index]) << 16u) |
                 (static_cast<uint32_t>(bytes[index + 1]) << 8u) |
                 static_cast<uint32_t>(bytes[index + 2]);
    out.push_back(kTable[(value >> 18u) & 0x3Fu]);
    out.push_back(kTable[(value >> 12u) & 0x3Fu]);
    out.push_back(kTable[(value >> 6u) & 0x3Fu]);
    out.push_back(kTable[value & 0x3Fu]);
    index += 3;
  }

  if (index < bytes.size()) {
    auto value = static_cast<uint32_t>(bytes[index]) << 16u;
    out.push_back(kTable[(value >> 18u) & 0x3Fu]);
    if ((index + 1) < bytes.size()) {
      value |= static_cast<uint32_t>(bytes[index + 1]) << 8u;
      out.push_back(kTable[(value >> 12u) & 0x3Fu]);
      out.push_back(kTable[(value >> 6u) & 0x3Fu]);
      out.push_back('=');
    } else {
      out.push_back(kTable[(value >> 12u) & 0x3Fu]);
      out.push_back('=');
      out.push_back('=');
    }
  }

  return out;
}

std::optional<bytes_t> try_from_base64(const std::string_view encoded) {
  auto compact = std::string{};
  compact.reserve(encoded.size());
  for (const auto ch : encoded) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      continue;
    }
    compact.push_back(ch);
  }

  if ((compact.size() % 4) != 0) {
    return std::nullopt;
  }

  auto decode_char = [](const char ch) -> std::optional<uint8_t> {
    if (ch >= 'A' && ch <= 'Z') {
      return static_cast<uint8_t>(ch - 'A');
    }
    if (ch >= 'a' && ch <= 'z') {
      return static_cast<uint8_t>(ch - 'a' + 26);
    }
    if (ch >= '0' && ch <= '9') {
      return static_cast<uint8_t>(ch - '0' + 52);
    }
    if (ch == '+') {
      return uint8_t{62};
    }
    if (ch == '/') {
      return uint8_t{63};
    }
    return std::nullopt;
  };

  auto out = bytes_t{};
  out.reserve((compact.size() / 4) * 3);

  for (size_t i = 0; i < compact.size(); i += 4) {
    auto is_last_chunk = (i + 4) == compact.size();
    auto padding = size_t{0};
    auto value = uint32_t{};
    for (size_t j = 0; j < 4; ++j) {
      auto ch = compact[i + j];
      if (ch == '=') {
        // Padding is only valid in the final two positions of the last chunk.
        if (!is_last_chunk || j < 2) {
          return std::nullopt;
        }
        ++padding;
        value <<= 6u;
        continue;
      }
      if (padding != 0) {
        return std::nullopt;
      }
      auto decoded = decode_char(ch);
      if (!decoded) {
        return std::nullopt;
      }
      value = (value << 6u) | *decoded;
    }
    out.push_back(static_cast<uint8_t>((value >> 16u) & 0xFFu));
    if (padding < 2) {
      out.push_back(static_cast<uint8_t>((value >> 8u) & 0xFFu));
    }
    if (padding < 1) {
      out.push_back(static_cast<uint8_t>(value & 0xFFu));
    }
  }

  return out;
}

bytes_t from_base64(const std::string_view encoded) {
  auto decoded = try_from_base64(encoded);
  if (!decoded.has_value()) {
    herald::common::critical("invalid base64 input");
  }
  return *decoded;
}

}  // namespace herald::schema
