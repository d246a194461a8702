#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace herald::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using timestamp_milliseconds_t = uint64_t;
using epoch_t = uint64_t;

bytes_t make_bytes(const std::string_view& bytes);
bytes_view_t make_bytes_view(const bytes_t& bytes);

hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);

/// Lowercase hex, no prefix.
std::string to_hex(const bytes_view_t& bytes);
/// Uppercase hex, no prefix. Tx hashes are displayed this way by CometBFT.
std::string to_upper_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

std::string to_base64(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_base64(std::string_view encoded);
bytes_t from_base64(std::string_view encoded);

}  // namespace herald::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
