#pragma once

#include <herald/ledger/transaction.hpp>
#include <herald/schema/primitives.hpp>
#include <herald/schema/transaction.hpp>

#include <cstdint>
#include <string_view>

namespace herald::testing {

inline herald::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = herald::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline herald::schema::transaction_t make_raw_transaction(
    const uint8_t seed,
    const std::string_view data = "transfer") {
  return herald::ledger::make_transaction(
      make_hash(seed), 1'700'000'000'000 + seed,
      herald::schema::bytes_t{0x00, 0x61, 0x73, 0x6d, seed},
      herald::schema::make_bytes(data));
}

inline herald::schema::wrapper_header_t make_wrapper_header(
    const uint8_t seed) {
  return herald::schema::wrapper_header_t{
      .version = 1,
      .fee_amount = 100,
      .fee_token = make_hash(static_cast<uint8_t>(seed + 1)),
      .public_key = herald::schema::bytes_t(32, seed),
      .epoch = 7,
      .gas_limit = 50'000,
      .raw_header_hash = {}};
}

}  // namespace herald::testing
