#pragma once

#include <herald/events/attribute_map.hpp>
#include <herald/events/event_kind.hpp>
#include <herald/events/event_level.hpp>
#include <herald/events/ibc_event.hpp>
#include <herald/events/proposal_event.hpp>
#include <herald/schema/transaction.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace herald::events {

/// An observable ledger effect, queryable by subscribers once handed to
/// CometBFT.
///
/// Kind and level are fixed at construction. Attributes are only written
/// while the event is being built; afterwards the event is moved into the
/// ABCI conversion.
class event final {
 public:
  event(event_kind_t kind, event_level level, attributes_t attributes = {});

  const event_kind_t& kind() const;
  event_level level() const;
  const attributes_t& attributes() const;

  /// Insert-or-get: inserts an empty value when `key` is absent and returns
  /// a reference the caller may overwrite.
  std::string& attribute(std::string_view key);

  void set(std::string_view key, std::string value);

  /// Fatal when `key` is absent. Use get/contains_key unless presence is
  /// guaranteed by construction.
  const std::string& get_required(std::string_view key) const;

  std::optional<std::string_view> get(std::string_view key) const;
  bool contains_key(std::string_view key) const;

  /// Move the payload out; the event is left without attributes.
  attributes_t release_attributes() &&;

  bool operator==(const event&) const = default;

 private:
  event_kind_t kind_;
  event_level level_;
  attributes_t attributes_;
};

/// Event for a transaction that reached a block.
///
/// Wrapper transactions yield `accepted` with their header hash. Decrypted
/// transactions yield `applied` with the hash recomputed over an empty raw
/// header, which is the hash the wrapper committed to when the transaction
/// was submitted. Protocol transactions yield `applied` with their header
/// hash. Raw transactions never reach a block; passing one is fatal.
///
/// Every event carries `hash`, `height` and an empty `log`.
event new_tx_event(const herald::schema::transaction_t& tx, uint64_t height);

event make_event(ibc_event&& effect);
event make_event(proposal_event&& effect);

}  // namespace herald::events
