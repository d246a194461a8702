#pragma once

#include <herald/schema/primitives.hpp>
#include <herald/schema/protocol_transaction_kind.hpp>
#include <cstdint>

// Schema type: protocol header.
// Ledger workflow: Header of a validator-originated protocol transaction.
namespace herald::schema {

template <uint16_t Version>
struct protocol_header;

template <>
struct protocol_header<1> final {
  uint16_t version{1};
  bytes_t public_key;
  protocol_transaction_kind_t kind{};
};

using protocol_header_t = protocol_header<1>;

}  // namespace herald::schema
