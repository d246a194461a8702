#pragma once

#include <tendermint/abci/types.pb.h>
#include <herald/events/event.hpp>

namespace herald::abci {

/// Convert to the ABCI wire event. Every attribute is marked for indexing so
/// subscribers can query on it; attributes appear in key order.
tendermint::abci::Event to_abci_event(herald::events::event&& event);

/// Hand an event to CometBFT as a block level event of FinalizeBlock.
void append_event(herald::events::event&& event,
                  tendermint::abci::ResponseFinalizeBlock* response);

/// Hand an event to CometBFT as part of one transaction's result.
void append_event(herald::events::event&& event,
                  tendermint::abci::ExecTxResult* result);

}  // namespace herald::abci
