#include <herald/common/critical.hpp>
#include <herald/events/event.hpp>
#include <herald/ledger/transaction.hpp>
#include <utility>

using namespace herald::schema;

namespace herald::events {

event::event(event_kind_t kind, const event_level level, attributes_t attributes)
    : kind_(std::move(kind)),
      level_(level),
      attributes_(std::move(attributes)) {}

const event_kind_t& event::kind() const {
  return kind_;
}

event_level event::level() const {
  return level_;
}

const attributes_t& event::attributes() const {
  return attributes_;
}

std::string& event::attribute(const std::string_view key) {
  auto it = attributes_.find(key);
  if (it == std::end(attributes_)) {
    it = attributes_.emplace(std::string{key}, std::string{}).first;
  }
  return it->second;
}

void event::set(const std::string_view key, std::string value) {
  attribute(key) = std::move(value);
}

const std::string& event::get_required(const std::string_view key) const {
  auto it = attributes_.find(key);
  if (it == std::end(attributes_)) {
    herald::common::critical("event '" + to_string(kind_) +
                             "' has no attribute '" + std::string{key} + "'");
  }
  return it->second;
}

std::optional<std::string_view> event::get(const std::string_view key) const {
  auto it = attributes_.find(key);
  if (it == std::end(attributes_)) {
    return std::nullopt;
  }
  return std::string_view{it->second};
}

bool event::contains_key(const std::string_view key) const {
  return attributes_.contains(key);
}

attributes_t event::release_attributes() && {
  return std::move(attributes_);
}

event new_tx_event(const transaction_t& tx, const uint64_t height) {
  auto result = std::visit(
      overloaded{
          [&](const wrapper_header_t&) {
            auto tx_event = events::event{accepted_kind{}, event_level::tx};
            tx_event.set("hash", to_upper_hex(herald::ledger::header_hash(tx)));
            return tx_event;
          },
          [&](const decrypted_header_t&) {
            auto tx_event = events::event{applied_kind{}, event_level::tx};
            tx_event.set("hash",
                      to_upper_hex(herald::ledger::raw_header_hash(tx)));
            return tx_event;
          },
          [&](const protocol_header_t&) {
            auto tx_event = events::event{applied_kind{}, event_level::tx};
            tx_event.set("hash", to_upper_hex(herald::ledger::header_hash(tx)));
            return tx_event;
          },
          [](const raw_header_t&) -> events::event {
            herald::common::critical(
                "raw transactions cannot produce a transaction event");
          },
      },
      tx.header.type);
  result.set("height", std::to_string(height));
  result.set("log", "");
  return result;
}

event make_event(ibc_event&& effect) {
  return event{ibc_kind{.type = std::move(effect.event_type)}, event_level::tx,
               std::move(effect.attributes)};
}

event make_event(proposal_event&& effect) {
  return event{proposal_kind{}, event_level::block,
               std::move(effect.attributes)};
}

}  // namespace herald::events
