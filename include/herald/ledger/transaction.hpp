#pragma once

#include <herald/schema/primitives.hpp>
#include <herald/schema/transaction.hpp>
#include <optional>
#include <string>

namespace herald::ledger {

/// Build a raw transaction whose header commits to `code` and `data`.
herald::schema::transaction_t make_transaction(
    const herald::schema::hash32_t& chain_id,
    herald::schema::timestamp_milliseconds_t timestamp,
    herald::schema::bytes_t code,
    herald::schema::bytes_t data);

/// BLAKE3 over the SCALE encoding of the header.
herald::schema::hash32_t header_hash(const herald::schema::transaction_t& tx);

/// Copy of `tx` with its header type replaced.
herald::schema::transaction_t update_header(
    herald::schema::transaction_t tx,
    herald::schema::transaction_type_t type);

/// Header hash of `tx` as if it carried an empty raw header, i.e. the hash
/// it had when it was submitted.
herald::schema::hash32_t raw_header_hash(
    const herald::schema::transaction_t& tx);

/// Wrap `tx` for inclusion. `wrapper.raw_header_hash` is overwritten with
/// the raw header hash of `tx`.
herald::schema::transaction_t wrap_transaction(
    herald::schema::transaction_t tx,
    herald::schema::wrapper_header_t wrapper);

/// Turn an included wrapper into the decrypted transaction that is applied.
///
/// Returns std::nullopt (with `error` set) when `wrapper` does not carry a
/// wrapper header. A payload whose raw header hash does not match the one
/// the wrapper committed to is marked undecryptable.
std::optional<herald::schema::transaction_t> decrypt_transaction(
    const herald::schema::transaction_t& wrapper,
    std::string& error);

}  // namespace herald::ledger
