#pragma once

#include <string>
#include <vector>

#include "storyloom/core/sim_config.h"
#include "storyloom/core/world_state.h"

namespace storyloom {

// Checks an authored world before it is loaded: required identity fields,
// unique ids, resolvable references and value ranges.
//
// Returns human-readable problems in a stable order. Empty => valid.
std::vector<std::string> validate_world_config(const WorldConfig& cfg);

// Structural invariants every committed state must satisfy (bounded
// attributes and scores, war clamps, capped logs, non-negative time).
std::vector<std::string> validate_world_state(const WorldState& s, const SimConfig& cfg);

// validate_world_state on `after`, plus the requirement that time advanced
// by exactly one.
std::vector<std::string> validate_turn_transition(const WorldState& before, const WorldState& after,
                                                  const SimConfig& cfg);

} // namespace storyloom
