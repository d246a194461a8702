#pragma once

#include <herald/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace herald::events {

/// What an event is about: a whole finalized block or a single transaction.
enum class event_level : uint8_t { block = 0, tx = 1 };

inline constexpr auto kEventLevelMappings = std::array{
    std::pair<std::string_view, event_level>{"block", event_level::block},
    std::pair<std::string_view, event_level>{"tx", event_level::tx},
};

inline constexpr std::string_view to_string(const event_level value) {
  return herald::schema::to_string(value, kEventLevelMappings)
      .value_or("unknown");
}

}  // namespace herald::events

namespace herald::schema {

template <>
inline std::optional<herald::events::event_level>
try_from_string<herald::events::event_level>(const std::string_view value) {
  return from_string(value, herald::events::kEventLevelMappings);
}

}  // namespace herald::schema
