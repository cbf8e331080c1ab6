#pragma once

#include <string>
#include <vector>

#include "storyloom/core/sim_config.h"
#include "storyloom/core/stochastic.h"
#include "storyloom/core/war.h"
#include "storyloom/core/world_state.h"

namespace storyloom {

// Drives wars through declared -> active -> resolution -> concluded and
// resolves individual battles. Wars live in WorldState, so the engine itself
// only carries configuration and the shared resolver.
class ConflictEngine {
 public:
  ConflictEngine(const SimConfig& cfg, StochasticResolver& resolver) : cfg_(cfg), resolver_(resolver) {}

  // Throws std::invalid_argument if either side is empty, the sides overlap,
  // or a faction is unknown. Records a war_declared event carrying
  // `consciousness_impact`.
  Id declare_war(WorldState& world, const std::vector<std::string>& attackers,
                 const std::vector<std::string>& defenders, const std::string& cause,
                 std::vector<WarGoal> goals = {}, double consciousness_impact = 0.0);

  // Runs the round loop, records battle_resolved, applies consciousness
  // shifts and folds casualties into the active war between the two
  // factions (if any).
  Battle resolve_battle(WorldState& world, const Force& attacking, const Force& defending,
                        const BattleLocation& location);

  // Per-turn exhaustion/momentum update. Promotes declared wars to active.
  void update_war(WorldState& world, War& war) const;

  bool should_end_war(const WorldState& world, const War& war) const;

  // Applies consequences and leaves the war concluded. Throws
  // std::logic_error if it already is.
  WarVictor end_war(WorldState& world, War& war) const;

  // update_war + should_end_war/end_war for every war; concluded wars move
  // to WorldState::concluded_wars.
  void advance_wars(WorldState& world) const;

  // --- battle components ---

  static double force_strength(const Force& f);
  LeadershipResult leadership_check(const Commander& c);
  static double morale(const Force& f);
  static double terrain_bonus(Terrain terrain, UnitType unit_type);
  double preparation_bonus(const Force& defender) const { return defender.preparation * 0.2; }

  static double tactics_multiplier(Tactics t);
  bool goal_satisfied(const WorldState& world, const War& war, const WarGoal& goal) const;

 private:
  void apply_battle_consequences(WorldState& world, Battle& battle) const;

  const SimConfig& cfg_;
  StochasticResolver& resolver_;
};

} // namespace storyloom
