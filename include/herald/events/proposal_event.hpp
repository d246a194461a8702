#pragma once

#include <herald/events/attribute_map.hpp>
#include <herald/events/tally_result.hpp>
#include <cstdint>
#include <string>

namespace herald::events {

/// Effect record produced by the governance module when a proposal's voting
/// period ends and the proposal is tallied (and possibly executed).
struct proposal_event final {
  std::string event_type;
  attributes_t attributes;
};

/// Fill the standard proposal attributes: `proposal_id`, `tally_result`,
/// `has_proposal_code` and `proposal_code_exit_status` (flags as "1"/"0").
proposal_event make_proposal_event(std::string event_type,
                                   tally_result tally,
                                   uint64_t proposal_id,
                                   bool has_proposal_code,
                                   bool proposal_code_exit_status);

}  // namespace herald::events
