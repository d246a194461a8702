#include <spdlog/spdlog.h>
#include <herald/abci/event_sink.hpp>
#include <utility>

namespace herald::abci {

tendermint::abci::Event to_abci_event(herald::events::event&& event) {
  auto out = tendermint::abci::Event{};
  out.set_type(herald::events::to_string(event.kind()));
  auto attributes = std::move(event).release_attributes();
  out.mutable_attributes()->Reserve(static_cast<int>(attributes.size()));
  for (auto& [key, value] : attributes) {
    auto* attribute = out.add_attributes();
    attribute->set_key(key);
    attribute->set_value(std::move(value));
    attribute->set_index(true);
  }
  return out;
}

void append_event(herald::events::event&& event,
                  tendermint::abci::ResponseFinalizeBlock* response) {
  auto converted = to_abci_event(std::move(event));
  spdlog::debug("Emitting block event '{}' with {} attribute(s)",
                converted.type(), converted.attributes_size());
  *response->add_events() = std::move(converted);
}

void append_event(herald::events::event&& event,
                  tendermint::abci::ExecTxResult* result) {
  auto converted = to_abci_event(std::move(event));
  spdlog::debug("Emitting tx event '{}' with {} attribute(s)",
                converted.type(), converted.attributes_size());
  *result->add_events() = std::move(converted);
}

}  // namespace herald::abci
