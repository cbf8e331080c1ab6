#pragma once

#include <optional>
#include <string>
#include <vector>

#include "storyloom/core/encounter.h"
#include "storyloom/core/sim_config.h"
#include "storyloom/core/stochastic.h"
#include "storyloom/core/world_state.h"

namespace storyloom {

// Trigger gating, turn-by-turn progression and outcome resolution for
// encounter instances. Definitions, live instances and history all live in
// WorldState.
class EncounterLifecycle {
 public:
  EncounterLifecycle(const SimConfig& cfg, StochasticResolver& resolver) : cfg_(cfg), resolver_(resolver) {}

  // Gates, in order: cooldown, node restriction, prerequisites, triggers.
  // Prerequisites are only checked when the context names a character, and
  // node restrictions only when it names a node. With no declared triggers
  // the encounter is eligible once the other gates pass. Probability
  // triggers draw from the resolver.
  bool can_trigger(const EncounterDef& def, const EncounterContext& ctx);

  // Starts a live instance of `encounter_id` at the current world time.
  // Throws std::invalid_argument for an unknown encounter.
  Id trigger_encounter(WorldState& world, const std::string& encounter_id, std::vector<std::string> participants);

  // Advances every active instance by one turn. Instances reaching their
  // duration are resolved and moved to history; returns their ids.
  std::vector<Id> process_turn(WorldState& world);

  // Weighted choice over outcomes whose condition holds for `subject`.
  // Conditional outcomes are skipped without a subject.
  std::optional<EncounterOutcome> resolve_outcome(const EncounterDef& def, const Character* subject);

  // Forced end. Returns false if no active instance has that id.
  bool end_encounter(WorldState& world, Id instance_id, const std::string& reason);

  static Interaction generate_base_interaction(const EncounterDef& def);

 private:
  bool prerequisite_met(const Prerequisite& p, const Character& ch) const;
  bool trigger_fires(const Trigger& t, const EncounterContext& ctx);
  EncounterTurn run_participants(WorldState& world, const EncounterDef& def, const EncounterInstance& inst);
  void complete(WorldState& world, EncounterInstance& inst, const EncounterDef& def);

  const SimConfig& cfg_;
  StochasticResolver& resolver_;
};

} // namespace storyloom
