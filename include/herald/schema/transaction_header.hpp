#pragma once

#include <herald/schema/decrypted_header.hpp>
#include <herald/schema/primitives.hpp>
#include <herald/schema/protocol_header.hpp>
#include <herald/schema/raw_header.hpp>
#include <herald/schema/wrapper_header.hpp>
#include <cstdint>
#include <variant>

// Schema type: transaction header.
// Ledger workflow: The part of a transaction that is hashed to identify it.
// Commits to the code and data sections through their hashes.
namespace herald::schema {

using transaction_type_t = std::variant<raw_header_t,
                                        wrapper_header_t,
                                        decrypted_header_t,
                                        protocol_header_t>;

template <uint16_t Version>
struct transaction_header;

template <>
struct transaction_header<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  timestamp_milliseconds_t timestamp{};
  hash32_t code_hash{};
  hash32_t data_hash{};
  transaction_type_t type{};
};

using transaction_header_t = transaction_header<1>;

}  // namespace herald::schema
