#pragma once

#include <herald/events/attribute_map.hpp>
#include <string>

namespace herald::events {

/// Effect record produced by the IBC module for one packet/channel/client
/// effect.
struct ibc_event final {
  std::string event_type;
  attributes_t attributes;
};

}  // namespace herald::events
