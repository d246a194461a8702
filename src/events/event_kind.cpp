#include <herald/events/event_kind.hpp>
#include <herald/schema/primitives.hpp>

namespace herald::events {

namespace {

constexpr auto kAccepted = std::string_view{"accepted"};
constexpr auto kApplied = std::string_view{"applied"};
constexpr auto kProposal = std::string_view{"proposal"};

}  // namespace

std::string to_string(const event_kind_t& kind) {
  return std::visit(
      overloaded{
          [](const accepted_kind&) { return std::string{kAccepted}; },
          [](const applied_kind&) { return std::string{kApplied}; },
          [](const ibc_kind& ibc) { return ibc.type; },
          [](const proposal_kind&) { return std::string{kProposal}; },
      },
      kind);
}

event_kind_t parse_event_kind(const std::string_view type) {
  if (type == kAccepted) {
    return accepted_kind{};
  }
  if (type == kApplied) {
    return applied_kind{};
  }
  if (type == kProposal) {
    return proposal_kind{};
  }
  return ibc_kind{.type = std::string{type}};
}

}  // namespace herald::events
