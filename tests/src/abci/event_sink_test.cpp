#include <gtest/gtest.h>
#include <herald/abci/event_json.hpp>
#include <herald/abci/event_sink.hpp>
#include <herald/events/attributes.hpp>
#include <herald/events/event.hpp>
#include <herald/ledger/transaction.hpp>
#include <herald/testing/common.hpp>

#include <string>
#include <utility>
#include <vector>

namespace {

herald::events::event make_ibc_event() {
  return herald::events::make_event(herald::events::ibc_event{
      .event_type = "recv_packet",
      .attributes = {{"packet_sequence", "4"},
                     {"packet_dst_channel", "channel-0"},
                     {"packet_ack", ""}}});
}

}  // namespace

TEST(abci_event_sink, converts_type_and_indexed_attributes) {
  auto wire = herald::abci::to_abci_event(make_ibc_event());

  EXPECT_EQ(wire.type(), "recv_packet");
  ASSERT_EQ(wire.attributes_size(), 3);
  auto keys = std::vector<std::string>{};
  for (const auto& attribute : wire.attributes()) {
    EXPECT_TRUE(attribute.index()) << attribute.key();
    keys.push_back(attribute.key());
  }
  EXPECT_EQ(keys, (std::vector<std::string>{"packet_ack", "packet_dst_channel",
                                            "packet_sequence"}));
  EXPECT_EQ(wire.attributes(2).value(), "4");
}

TEST(abci_event_sink, renders_reserved_kinds) {
  auto proposal = herald::abci::to_abci_event(herald::events::make_event(
      herald::events::make_proposal_event(
          "default_proposal", herald::events::tally_result::passed, 1, false,
          false)));
  EXPECT_EQ(proposal.type(), "proposal");

  auto accepted = herald::abci::to_abci_event(herald::events::new_tx_event(
      herald::ledger::wrap_transaction(
          herald::testing::make_raw_transaction(1),
          herald::testing::make_wrapper_header(1)),
      5));
  EXPECT_EQ(accepted.type(), "accepted");
  EXPECT_EQ(accepted.attributes_size(), 3);
}

TEST(abci_event_sink, empty_event_has_no_attributes) {
  auto wire = herald::abci::to_abci_event(herald::events::event{
      herald::events::proposal_kind{}, herald::events::event_level::block});
  EXPECT_EQ(wire.type(), "proposal");
  EXPECT_EQ(wire.attributes_size(), 0);
}

TEST(abci_event_sink, wire_round_trip_reproduces_attributes) {
  auto pairs = std::vector<std::pair<std::string, std::string>>{
      {"zeta", "last"}, {"alpha", "first"}, {"empty", ""},
      {"unicode", "\xce\xbb"}, {"spaced key", "spaced value"}};
  auto source = herald::events::event{herald::events::applied_kind{},
                                      herald::events::event_level::tx};
  for (const auto& [key, value] : pairs) {
    source.set(key, value);
  }
  auto expected = source.attributes();

  auto json = herald::abci::to_json(herald::abci::to_abci_event(std::move(source)));
  auto error = herald::events::attribute_error{};
  auto parsed = herald::events::try_parse_attributes(json, error);
  ASSERT_TRUE(parsed.has_value()) << error.message();
  EXPECT_EQ(parsed->values(), expected);
}

TEST(abci_event_sink, json_matches_subscription_shape) {
  auto json = herald::abci::to_json(herald::abci::to_abci_event(
      herald::events::event{herald::events::ibc_kind{.type = "timeout_packet"},
                            herald::events::event_level::tx,
                            {{"packet_sequence", "9"}}}));
  EXPECT_EQ(json.dump(),
            R"({"attributes":[{"index":true,"key":"packet_sequence","value":"9"}],)"
            R"("type":"timeout_packet"})");
}

TEST(abci_event_sink, appends_block_events_in_call_order) {
  auto response = tendermint::abci::ResponseFinalizeBlock{};
  herald::abci::append_event(make_ibc_event(), &response);
  herald::abci::append_event(
      herald::events::make_event(herald::events::make_proposal_event(
          "default_proposal", herald::events::tally_result::rejected, 2, true,
          true)),
      &response);

  ASSERT_EQ(response.events_size(), 2);
  EXPECT_EQ(response.events(0).type(), "recv_packet");
  EXPECT_EQ(response.events(1).type(), "proposal");
  EXPECT_EQ(response.tx_results_size(), 0);
}

TEST(abci_event_sink, appends_tx_events_to_result) {
  auto response = tendermint::abci::ResponseFinalizeBlock{};
  auto* result = response.add_tx_results();
  herald::abci::append_event(make_ibc_event(), result);

  ASSERT_EQ(result->events_size(), 1);
  EXPECT_EQ(result->events(0).type(), "recv_packet");
  EXPECT_EQ(response.events_size(), 0);
}
