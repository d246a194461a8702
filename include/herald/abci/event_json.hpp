#pragma once

#include <tendermint/abci/types.pb.h>
#include <nlohmann/json.hpp>

namespace herald::abci {

/// Render a wire event the way CometBFT delivers it to websocket
/// subscribers: {"type": ..., "attributes": [{"key", "value", "index"}]}.
nlohmann::json to_json(const tendermint::abci::Event& event);

}  // namespace herald::abci
