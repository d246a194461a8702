#pragma once

#include <herald/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace herald::events {

enum class tally_result : uint8_t { passed = 0, rejected = 1 };

inline constexpr auto kTallyResultMappings = std::array{
    std::pair<std::string_view, tally_result>{"passed", tally_result::passed},
    std::pair<std::string_view, tally_result>{"rejected",
                                              tally_result::rejected},
};

inline constexpr std::string_view to_string(const tally_result value) {
  return herald::schema::to_string(value, kTallyResultMappings)
      .value_or("unknown");
}

}  // namespace herald::events

namespace herald::schema {

template <>
inline std::optional<herald::events::tally_result>
try_from_string<herald::events::tally_result>(const std::string_view value) {
  return from_string(value, herald::events::kTallyResultMappings);
}

}  // namespace herald::schema
