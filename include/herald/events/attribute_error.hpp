#pragma once

#include <cstdint>
#include <string>

namespace herald::events {

enum class attribute_error_code : uint8_t {
  none = 0,
  missing_attributes = 1,
  missing_key = 2,
  missing_value = 3,
};

/// Why a subscription event could not be turned into attributes. `context`
/// holds the offending key/value record serialized as compact JSON.
struct attribute_error final {
  attribute_error_code code{attribute_error_code::none};
  std::string context;

  std::string message() const;
};

}  // namespace herald::events
