#pragma once

#include <herald/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: protocol transaction kind.
// Ledger workflow: Transactions injected by validators rather than users.
namespace herald::schema {

enum class protocol_transaction_kind_t : uint8_t {
  ethereum_events = 0,
  bridge_pool_root = 1,
  validator_set_update = 2,
};

inline constexpr auto kProtocolTransactionKindMappings = std::array{
    std::pair<std::string_view, protocol_transaction_kind_t>{
        "ethereum_events", protocol_transaction_kind_t::ethereum_events},
    std::pair<std::string_view, protocol_transaction_kind_t>{
        "bridge_pool_root", protocol_transaction_kind_t::bridge_pool_root},
    std::pair<std::string_view, protocol_transaction_kind_t>{
        "validator_set_update",
        protocol_transaction_kind_t::validator_set_update},
};

template <>
inline std::optional<protocol_transaction_kind_t>
try_from_string<protocol_transaction_kind_t>(const std::string_view value) {
  return from_string(value, kProtocolTransactionKindMappings);
}

inline constexpr std::string_view to_string(
    const protocol_transaction_kind_t value) {
  return to_string(value, kProtocolTransactionKindMappings).value_or("unknown");
}

}  // namespace herald::schema
