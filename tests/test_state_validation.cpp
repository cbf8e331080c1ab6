#include <iostream>
#include <string>
#include <vector>

#include "storyloom/core/serialization.h"
#include "storyloom/core/state_validation.h"
#include "storyloom/core/world_state.h"

#define SL_ASSERT(expr)                                                                             \
  do {                                                                                              \
    if (!(expr)) {                                                                                  \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n";            \
      return 1;                                                                                     \
    }                                                                                               \
  } while (0)

namespace {

bool mentions(const std::vector<std::string>& errors, const std::string& a, const std::string& b) {
  for (const auto& e : errors) {
    if (e.find(a) != std::string::npos && e.find(b) != std::string::npos) return true;
  }
  return false;
}

} // namespace

int test_state_validation() {
  using namespace storyloom;

  const WorldConfig base = load_world_config_file("data/worlds/hollow_vale.json");

  // The bundled world is internally consistent.
  {
    const auto errors = validate_world_config(base);
    if (!errors.empty()) {
      std::cerr << "World config validation failed:\n";
      for (const auto& e : errors) std::cerr << "  - " << e << "\n";
      return 1;
    }
    const WorldState s = make_world_state(base);
    SL_ASSERT(validate_world_state(s, SimConfig{}).empty());
  }

  // Broken references and ranges are reported.
  {
    WorldConfig cfg = base;
    cfg.nodes.push_back(cfg.nodes.front());
    cfg.nodes.front().interaction_ids.push_back("juggling");
    cfg.characters[1].attributes.strength = 25.0;
    cfg.characters[2].faction_id = "sea_folk";
    cfg.encounters.front().duration = 0;
    cfg.encounters.front().node_restrictions.push_back("atlantis");

    const auto errors = validate_world_config(cfg);
    SL_ASSERT(mentions(errors, "Duplicate Node", "millbrook"));
    SL_ASSERT(mentions(errors, "unknown interaction", "juggling"));
    SL_ASSERT(mentions(errors, "strength", "out of range"));
    SL_ASSERT(mentions(errors, "unknown faction", "sea_folk"));
    SL_ASSERT(mentions(errors, "river_bandits", "duration"));
    SL_ASSERT(mentions(errors, "unknown node", "atlantis"));
  }

  // Characters need somewhere to act.
  {
    WorldConfig cfg = base;
    cfg.nodes.front().interaction_ids.clear();
    const auto errors = validate_world_config(cfg);
    SL_ASSERT(mentions(errors, "no interactions", "millbrook"));
  }

  // An empty world is rejected outright.
  {
    const auto errors = validate_world_config(WorldConfig{});
    SL_ASSERT(errors.size() >= 4);
  }

  // Committed-state invariants.
  {
    SimConfig cfg;
    cfg.max_historical_events = 1;

    WorldState s = make_world_state(base);
    s.time = 3;
    s.characters.front().mood = 101.0;
    s.interactions.front().last_used = 4;
    War war;
    war.id = 9;
    war.attackers.factions = {"ridge_clans"};
    war.defenders.factions = {"vale_league"};
    war.attackers.exhaustion = 120.0;
    s.wars.push_back(war);
    s.events.resize(2);

    const auto errors = validate_world_state(s, cfg);
    SL_ASSERT(mentions(errors, "mood", "out of range"));
    SL_ASSERT(mentions(errors, "last used", "future"));
    SL_ASSERT(mentions(errors, "War 9", "exhaustion"));
    SL_ASSERT(mentions(errors, "Event log", "cap"));
  }

  // Time moves by exactly one per turn.
  {
    const WorldState before = make_world_state(base);
    WorldState after = before;
    after.time = before.time + 2;
    SL_ASSERT(mentions(validate_turn_transition(before, after, SimConfig{}), "Time", "exactly one"));
    after.time = before.time + 1;
    SL_ASSERT(validate_turn_transition(before, after, SimConfig{}).empty());
  }

  return 0;
}
