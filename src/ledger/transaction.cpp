#include <spdlog/spdlog.h>
#include <herald/blake3/hash.hpp>
#include <herald/ledger/transaction.hpp>
#include <herald/schema/encoding/scale/encoder.hpp>
#include <utility>

using namespace herald::schema;

namespace {

using encoder_t =
    herald::schema::encoding::encoder<herald::schema::encoding::scale_encoder_tag>;

}  // namespace

namespace herald::ledger {

transaction_t make_transaction(const hash32_t& chain_id,
                               const timestamp_milliseconds_t timestamp,
                               bytes_t code,
                               bytes_t data) {
  auto tx = transaction_t{};
  tx.header.chain_id = chain_id;
  tx.header.timestamp = timestamp;
  tx.header.code_hash = herald::blake3::hash(make_bytes_view(code));
  tx.header.data_hash = herald::blake3::hash(make_bytes_view(data));
  tx.header.type = raw_header_t{};
  tx.code = std::move(code);
  tx.data = std::move(data);
  return tx;
}

hash32_t header_hash(const transaction_t& tx) {
  auto encoded = encoder_t{}.encode(tx.header);
  return herald::blake3::hash(make_bytes_view(encoded));
}

transaction_t update_header(transaction_t tx, transaction_type_t type) {
  tx.header.type = std::move(type);
  return tx;
}

hash32_t raw_header_hash(const transaction_t& tx) {
  return header_hash(update_header(tx, raw_header_t{}));
}

transaction_t wrap_transaction(transaction_t tx, wrapper_header_t wrapper) {
  wrapper.raw_header_hash = raw_header_hash(tx);
  return update_header(std::move(tx), std::move(wrapper));
}

std::optional<transaction_t> decrypt_transaction(const transaction_t& wrapper,
                                                 std::string& error) {
  const auto* header = std::get_if<wrapper_header_t>(&wrapper.header.type);
  if (header == nullptr) {
    error = "transaction is not a wrapper";
    return std::nullopt;
  }

  // Section hashes come from the payload itself, not the carried header.
  auto payload = wrapper;
  payload.header.code_hash = herald::blake3::hash(make_bytes_view(payload.code));
  payload.header.data_hash = herald::blake3::hash(make_bytes_view(payload.data));

  auto decrypted = decrypted_header_t{};
  auto payload_hash = raw_header_hash(payload);
  if (payload_hash != header->raw_header_hash) {
    spdlog::warn("Wrapper payload hash {} does not match committed hash {}",
                 to_upper_hex(payload_hash),
                 to_upper_hex(header->raw_header_hash));
    decrypted.status = decryption_status_t::undecryptable;
  }
  return update_header(std::move(payload), decrypted);
}

}  // namespace herald::ledger
