#pragma once

#include <herald/schema/primitives.hpp>
#include <cstdint>

// Schema type: wrapper header.
// Ledger workflow: Outer header under which an encrypted payload is accepted
// into a block. Pays the fee and commits to the hash of the payload's raw
// header so the decrypted payload can be matched back to it.
namespace herald::schema {

template <uint16_t Version>
struct wrapper_header;

template <>
struct wrapper_header<1> final {
  uint16_t version{1};
  uint64_t fee_amount{};
  hash32_t fee_token{};
  bytes_t public_key;
  epoch_t epoch{};
  uint64_t gas_limit{};
  hash32_t raw_header_hash{};
};

using wrapper_header_t = wrapper_header<1>;

}  // namespace herald::schema
