#include <gtest/gtest.h>
#include <herald/events/attributes.hpp>

#include <string>

namespace {

nlohmann::json make_subscription_event() {
  return nlohmann::json::parse(R"({
    "type": "applied",
    "attributes": [
      {"key": "hash", "value": "5F3A", "index": true},
      {"key": "height", "value": "12", "index": true},
      {"key": "log", "value": "", "index": true}
    ]
  })");
}

}  // namespace

TEST(attributes, parses_subscription_event) {
  auto error = herald::events::attribute_error{};
  auto attributes =
      herald::events::try_parse_attributes(make_subscription_event(), error);
  ASSERT_TRUE(attributes.has_value()) << error.message();
  EXPECT_EQ(error.code, herald::events::attribute_error_code::none);
  EXPECT_EQ(attributes->size(), 3u);
  EXPECT_EQ(attributes->get("hash"), std::string_view{"5F3A"});
  EXPECT_EQ(attributes->get("log"), std::string_view{});
  EXPECT_FALSE(attributes->get("code").has_value());
}

TEST(attributes, take_removes_value) {
  auto error = herald::events::attribute_error{};
  auto attributes =
      herald::events::try_parse_attributes(make_subscription_event(), error);
  ASSERT_TRUE(attributes.has_value()) << error.message();

  EXPECT_EQ(attributes->take("height"), std::string{"12"});
  EXPECT_FALSE(attributes->contains("height"));
  EXPECT_FALSE(attributes->take("height").has_value());
  EXPECT_EQ(attributes->size(), 2u);
}

TEST(attributes, empty_attribute_list_is_valid) {
  auto error = herald::events::attribute_error{};
  auto attributes = herald::events::try_parse_attributes(
      nlohmann::json{{"type", "proposal"},
                     {"attributes", nlohmann::json::array()}},
      error);
  ASSERT_TRUE(attributes.has_value());
  EXPECT_EQ(attributes->size(), 0u);
}

TEST(attributes, later_duplicate_key_wins) {
  auto json = nlohmann::json::parse(R"({"attributes": [
      {"key": "hash", "value": "first"},
      {"key": "hash", "value": "second"}]})");
  auto error = herald::events::attribute_error{};
  auto attributes = herald::events::try_parse_attributes(json, error);
  ASSERT_TRUE(attributes.has_value());
  EXPECT_EQ(attributes->size(), 1u);
  EXPECT_EQ(attributes->get("hash"), std::string_view{"second"});
}

TEST(attributes, missing_attributes_field_is_reported) {
  auto error = herald::events::attribute_error{};
  auto attributes = herald::events::try_parse_attributes(
      nlohmann::json{{"type", "accepted"}}, error);
  EXPECT_FALSE(attributes.has_value());
  EXPECT_EQ(error.code, herald::events::attribute_error_code::missing_attributes);
  EXPECT_EQ(error.message(), "Json missing `attributes` field");
}

TEST(attributes, non_array_attributes_field_is_reported_missing) {
  auto error = herald::events::attribute_error{};
  auto attributes = herald::events::try_parse_attributes(
      nlohmann::json{{"attributes", "hash=5F3A"}}, error);
  EXPECT_FALSE(attributes.has_value());
  EXPECT_EQ(error.code, herald::events::attribute_error_code::missing_attributes);
}

TEST(attributes, missing_key_carries_offending_record) {
  auto record = nlohmann::json{{"value", "12"}, {"index", true}};
  auto json = nlohmann::json{
      {"attributes",
       nlohmann::json::array({nlohmann::json{{"key", "hash"}, {"value", "AA"}},
                              record})}};
  auto error = herald::events::attribute_error{};
  auto attributes = herald::events::try_parse_attributes(json, error);
  EXPECT_FALSE(attributes.has_value());
  EXPECT_EQ(error.code, herald::events::attribute_error_code::missing_key);
  EXPECT_EQ(error.context, record.dump());
  EXPECT_EQ(error.context, R"({"index":true,"value":"12"})");
  EXPECT_EQ(error.message(), "Attributes missing key: " + record.dump());
}

TEST(attributes, missing_value_carries_offending_record) {
  auto record = nlohmann::json{{"key", "height"}};
  auto json = nlohmann::json{{"attributes", nlohmann::json::array({record})}};
  auto error = herald::events::attribute_error{};
  auto attributes = herald::events::try_parse_attributes(json, error);
  EXPECT_FALSE(attributes.has_value());
  EXPECT_EQ(error.code, herald::events::attribute_error_code::missing_value);
  EXPECT_EQ(error.context, R"({"key":"height"})");
  EXPECT_EQ(error.message(), R"(Attributes missing value: {"key":"height"})");
}

TEST(attributes, non_string_key_is_reported_missing) {
  auto json = nlohmann::json::parse(
      R"({"attributes": [{"key": 7, "value": "seven"}]})");
  auto error = herald::events::attribute_error{};
  EXPECT_FALSE(herald::events::try_parse_attributes(json, error).has_value());
  EXPECT_EQ(error.code, herald::events::attribute_error_code::missing_key);
  EXPECT_EQ(error.context, R"({"key":7,"value":"seven"})");
}
