#include <herald/events/proposal_event.hpp>
#include <utility>

namespace herald::events {

namespace {

std::string flag(const bool value) {
  return value ? "1" : "0";
}

}  // namespace

proposal_event make_proposal_event(std::string event_type,
                                   const tally_result tally,
                                   const uint64_t proposal_id,
                                   const bool has_proposal_code,
                                   const bool proposal_code_exit_status) {
  auto event = proposal_event{.event_type = std::move(event_type),
                              .attributes = {}};
  event.attributes.emplace("proposal_id", std::to_string(proposal_id));
  event.attributes.emplace("tally_result", std::string{to_string(tally)});
  event.attributes.emplace("has_proposal_code", flag(has_proposal_code));
  event.attributes.emplace("proposal_code_exit_status",
                           flag(proposal_code_exit_status));
  return event;
}

}  // namespace herald::events
