#include <herald/abci/event_json.hpp>

namespace herald::abci {

nlohmann::json to_json(const tendermint::abci::Event& event) {
  auto attributes = nlohmann::json::array();
  for (const auto& attribute : event.attributes()) {
    attributes.push_back({{"key", attribute.key()},
                          {"value", attribute.value()},
                          {"index", attribute.index()}});
  }
  return {{"type", event.type()}, {"attributes", std::move(attributes)}};
}

}  // namespace herald::abci
