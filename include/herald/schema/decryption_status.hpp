#pragma once

#include <herald/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: decryption status.
// Ledger workflow: Outcome of decrypting a wrapped payload at the start of the
// block that executes it.
namespace herald::schema {

enum class decryption_status_t : uint8_t { decrypted = 0, undecryptable = 1 };

inline constexpr auto kDecryptionStatusMappings = std::array{
    std::pair<std::string_view, decryption_status_t>{
        "decrypted", decryption_status_t::decrypted},
    std::pair<std::string_view, decryption_status_t>{
        "undecryptable", decryption_status_t::undecryptable},
};

template <>
inline std::optional<decryption_status_t> try_from_string<decryption_status_t>(
    const std::string_view value) {
  return from_string(value, kDecryptionStatusMappings);
}

inline constexpr std::string_view to_string(const decryption_status_t value) {
  return to_string(value, kDecryptionStatusMappings).value_or("unknown");
}

}  // namespace herald::schema
