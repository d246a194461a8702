#pragma once

#include <cstdint>

// Schema type: raw header.
// Ledger workflow: Header of a transaction as the user builds it, before it
// is wrapped for inclusion. Carries no type specific data.
namespace herald::schema {

template <uint16_t Version>
struct raw_header;

template <>
struct raw_header<1> final {
  uint16_t version{1};
};

using raw_header_t = raw_header<1>;

}  // namespace herald::schema
