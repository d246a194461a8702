#pragma once

#include <herald/events/attribute_error.hpp>
#include <herald/events/attribute_map.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace herald::events {

/// Attributes of one event as received by a subscriber. Each value is
/// expected to be consumed once, hence `take`.
class attributes final {
 public:
  explicit attributes(attributes_t values);

  std::optional<std::string_view> get(std::string_view key) const;
  std::optional<std::string> take(std::string_view key);

  bool contains(std::string_view key) const;
  std::size_t size() const;
  const attributes_t& values() const;

 private:
  attributes_t values_;
};

/// Parse the `attributes` array of a subscription event,
/// `{"attributes": [{"key": ..., "value": ...}, ...]}`. Later duplicates of
/// a key replace earlier ones.
///
/// Returns std::nullopt and fills `error` on malformed input.
std::optional<attributes> try_parse_attributes(const nlohmann::json& json,
                                               attribute_error& error);

}  // namespace herald::events
