#pragma once

#include <string>
#include <string_view>
#include <variant>

namespace herald::events {

/// The transaction was accepted for inclusion in a block.
struct accepted_kind final {
  bool operator==(const accepted_kind&) const = default;
};

/// The transaction was applied during block finalization.
struct applied_kind final {
  bool operator==(const applied_kind&) const = default;
};

/// An IBC effect; `type` is the IBC event's own type and is the rendering.
struct ibc_kind final {
  std::string type;
  bool operator==(const ibc_kind&) const = default;
};

/// A governance proposal was executed.
struct proposal_kind final {
  bool operator==(const proposal_kind&) const = default;
};

using event_kind_t =
    std::variant<accepted_kind, applied_kind, ibc_kind, proposal_kind>;

/// Canonical rendering, used verbatim as the ABCI event type.
std::string to_string(const event_kind_t& kind);

/// Inverse of to_string. Names other than the reserved ones are IBC types.
event_kind_t parse_event_kind(std::string_view type);

}  // namespace herald::events
