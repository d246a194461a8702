#include <spdlog/spdlog.h>
#include <herald/events/attributes.hpp>
#include <utility>

namespace herald::events {

namespace {

constexpr auto kAttributes = "attributes";
constexpr auto kKey = "key";
constexpr auto kValue = "value";

bool has_string(const nlohmann::json& record, const char* field) {
  if (!record.is_object()) {
    return false;
  }
  auto it = record.find(field);
  return it != record.end() && it->is_string();
}

}  // namespace

std::string attribute_error::message() const {
  switch (code) {
    case attribute_error_code::missing_attributes:
      return "Json missing `attributes` field";
    case attribute_error_code::missing_key:
      return "Attributes missing key: " + context;
    case attribute_error_code::missing_value:
      return "Attributes missing value: " + context;
    case attribute_error_code::none:
    default:
      return {};
  }
}

attributes::attributes(attributes_t values) : values_(std::move(values)) {}

std::optional<std::string_view> attributes::get(
    const std::string_view key) const {
  auto it = values_.find(key);
  if (it == std::end(values_)) {
    return std::nullopt;
  }
  return std::string_view{it->second};
}

std::optional<std::string> attributes::take(const std::string_view key) {
  auto it = values_.find(key);
  if (it == std::end(values_)) {
    return std::nullopt;
  }
  auto value = std::move(it->second);
  values_.erase(it);
  return value;
}

bool attributes::contains(const std::string_view key) const {
  return values_.contains(key);
}

std::size_t attributes::size() const {
  return values_.size();
}

const attributes_t& attributes::values() const {
  return values_;
}

std::optional<attributes> try_parse_attributes(const nlohmann::json& json,
                                               attribute_error& error) {
  if (!json.is_object() || !json.contains(kAttributes) ||
      !json[kAttributes].is_array()) {
    error = attribute_error{.code = attribute_error_code::missing_attributes,
                            .context = {}};
    return std::nullopt;
  }

  auto values = attributes_t{};
  for (const auto& record : json[kAttributes]) {
    if (!has_string(record, kKey)) {
      error = attribute_error{.code = attribute_error_code::missing_key,
                              .context = record.dump()};
      return std::nullopt;
    }
    if (!has_string(record, kValue)) {
      error = attribute_error{.code = attribute_error_code::missing_value,
                              .context = record.dump()};
      return std::nullopt;
    }
    values.insert_or_assign(record[kKey].get<std::string>(),
                            record[kValue].get<std::string>());
  }
  spdlog::debug("Parsed {} event attribute(s)", values.size());
  return attributes{std::move(values)};
}

}  // namespace herald::events
