#pragma once

#include <herald/schema/decryption_status.hpp>
#include <cstdint>

// Schema type: decrypted header.
// Ledger workflow: Header of a payload after decryption, when it is applied
// during block finalization.
namespace herald::schema {

template <uint16_t Version>
struct decrypted_header;

template <>
struct decrypted_header<1> final {
  uint16_t version{1};
  decryption_status_t status{decryption_status_t::decrypted};
};

using decrypted_header_t = decrypted_header<1>;

}  // namespace herald::schema
