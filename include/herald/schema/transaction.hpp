#pragma once

#include <herald/schema/primitives.hpp>
#include <herald/schema/transaction_header.hpp>
#include <cstdint>

namespace herald::schema {

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  transaction_header_t header;
  bytes_t code;
  bytes_t data;
};

using transaction_t = transaction<1>;

}  // namespace herald::schema
