#include "storyloom/core/state_validation.h"

#include <cmath>
#include <iterator>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace storyloom {
namespace {

template <typename... Parts>
std::string join(Parts&&... parts) {
  std::ostringstream ss;
  (ss << ... << std::forward<Parts>(parts));
  return ss.str();
}

bool in_range(double v, double lo, double hi) { return std::isfinite(v) && v >= lo && v <= hi; }

void check_character_ranges(const Character& c, std::vector<std::string>& errors) {
  const struct {
    const char* name;
    double value;
  } attrs[] = {
      {"strength", c.attributes.strength},       {"dexterity", c.attributes.dexterity},
      {"constitution", c.attributes.constitution}, {"intelligence", c.attributes.intelligence},
      {"wisdom", c.attributes.wisdom},           {"charisma", c.attributes.charisma},
  };
  for (const auto& a : attrs) {
    if (!in_range(a.value, kMinAttribute, kMaxAttribute)) {
      errors.push_back(join("Character ", c.id, " ", a.name, " out of range: ", a.value));
    }
  }
  if (!in_range(c.energy, kMinScore, kMaxScore)) errors.push_back(join("Character ", c.id, " energy out of range: ", c.energy));
  if (!in_range(c.health, kMinScore, kMaxScore)) errors.push_back(join("Character ", c.id, " health out of range: ", c.health));
  if (!in_range(c.mood, kMinScore, kMaxScore)) errors.push_back(join("Character ", c.id, " mood out of range: ", c.mood));
  if (!std::isfinite(c.frequency) || !std::isfinite(c.coherence)) {
    errors.push_back(join("Character ", c.id, " has non-finite frequency/coherence"));
  }
}

template <typename T>
void check_unique_ids(const std::vector<T>& items, const char* what, std::vector<std::string>& errors) {
  std::unordered_set<std::string> seen;
  for (const auto& x : items) {
    if (x.id.empty()) {
      errors.push_back(join(what, " with empty id"));
    } else if (!seen.insert(x.id).second) {
      errors.push_back(join("Duplicate ", what, " id: ", x.id));
    }
  }
}

} // namespace

std::vector<std::string> validate_world_config(const WorldConfig& cfg) {
  std::vector<std::string> errors;

  if (cfg.name.empty()) errors.push_back("World name is required");
  if (cfg.nodes.empty()) errors.push_back("World needs at least one node");
  if (cfg.characters.empty()) errors.push_back("World needs at least one character");
  if (cfg.interactions.empty()) errors.push_back("World needs at least one interaction");

  check_unique_ids(cfg.nodes, "Node", errors);
  check_unique_ids(cfg.characters, "Character", errors);
  check_unique_ids(cfg.interactions, "Interaction", errors);
  check_unique_ids(cfg.factions, "Faction", errors);
  check_unique_ids(cfg.encounters, "Encounter", errors);

  for (const auto& n : cfg.nodes) {
    if (n.name.empty()) errors.push_back(join("Node ", n.id, " has no name"));
    if (n.type.empty()) errors.push_back(join("Node ", n.id, " has no type"));
    for (const auto& iid : n.interaction_ids) {
      if (!find_by_id(cfg.interactions, iid)) errors.push_back(join("Node ", n.id, " offers unknown interaction ", iid));
    }
    if (!n.controller_faction.empty() && !find_by_id(cfg.factions, n.controller_faction)) {
      errors.push_back(join("Node ", n.id, " controlled by unknown faction ", n.controller_faction));
    }
    if (!std::isfinite(n.population) || n.population < 0.0) {
      errors.push_back(join("Node ", n.id, " has invalid population"));
    }
  }

  for (const auto& c : cfg.characters) {
    if (c.name.empty()) errors.push_back(join("Character ", c.id, " has no name"));
    const Node* home = find_by_id(cfg.nodes, c.node_id);
    if (!home) {
      errors.push_back(join("Character ", c.id, " is assigned to unknown node '", c.node_id, "'"));
    } else if (home->interaction_ids.empty()) {
      errors.push_back(join("Character ", c.id, " has no interactions available at node ", home->id));
    }
    if (!c.faction_id.empty() && !find_by_id(cfg.factions, c.faction_id)) {
      errors.push_back(join("Character ", c.id, " belongs to unknown faction ", c.faction_id));
    }
    check_character_ranges(c, errors);
  }

  for (const auto& it : cfg.interactions) {
    if (it.cooldown < 0) errors.push_back(join("Interaction ", it.id, " has negative cooldown"));
    for (const auto& b : it.branches) {
      if (!std::isfinite(b.weight) || b.weight < 0.0) {
        errors.push_back(join("Interaction ", it.id, " branch ", b.id, " has invalid weight"));
      }
    }
  }

  for (const auto& e : cfg.encounters) {
    if (e.duration < 1) errors.push_back(join("Encounter ", e.id, " duration must be at least 1"));
    if (e.cooldown < 0) errors.push_back(join("Encounter ", e.id, " has negative cooldown"));
    for (const auto& o : e.outcomes) {
      if (!std::isfinite(o.probability) || o.probability < 0.0) {
        errors.push_back(join("Encounter ", e.id, " outcome ", o.id, " has invalid probability"));
      }
    }
    for (const auto& nid : e.node_restrictions) {
      if (!find_by_id(cfg.nodes, nid)) errors.push_back(join("Encounter ", e.id, " restricted to unknown node ", nid));
    }
  }

  for (const auto& [name, qty] : cfg.resources) {
    if (!std::isfinite(qty)) errors.push_back(join("Resource ", name, " is not a finite number"));
  }

  return errors;
}

std::vector<std::string> validate_world_state(const WorldState& s, const SimConfig& cfg) {
  std::vector<std::string> errors;

  if (s.time < 0) errors.push_back(join("World time is negative: ", s.time));
  if (!std::isfinite(s.tick_delay_ms)) errors.push_back("Tick delay is not finite");

  for (const auto& c : s.characters) check_character_ranges(c, errors);

  for (const auto& [name, qty] : s.resources) {
    if (!std::isfinite(qty)) errors.push_back(join("Resource ", name, " is not a finite number"));
  }

  for (const auto& it : s.interactions) {
    if (it.last_used != kNever && it.last_used > s.time) {
      errors.push_back(join("Interaction ", it.id, " last used in the future (", it.last_used, ")"));
    }
  }

  for (const auto& w : s.wars) {
    if (!in_range(w.momentum, -100.0, 100.0)) errors.push_back(join("War ", w.id, " momentum out of range: ", w.momentum));
    if (!in_range(w.attackers.exhaustion, 0.0, 100.0) || !in_range(w.defenders.exhaustion, 0.0, 100.0)) {
      errors.push_back(join("War ", w.id, " exhaustion out of range"));
    }
    if (w.phase == WarPhase::Concluded) errors.push_back(join("Concluded war ", w.id, " still listed as ongoing"));
  }

  for (const auto& e : s.active_encounters) {
    if (e.status != EncounterStatus::Active) errors.push_back(join("Encounter instance ", e.id, " is not active"));
    if (e.elapsed_turns >= e.max_turns) {
      errors.push_back(join("Encounter instance ", e.id, " outlived its duration"));
    }
  }

  if (cfg.max_historical_events > 0 && s.events.size() > cfg.max_historical_events) {
    errors.push_back(join("Event log exceeds cap: ", s.events.size()));
  }
  if (cfg.max_interaction_log > 0 && s.interaction_log.size() > cfg.max_interaction_log) {
    errors.push_back(join("Interaction log exceeds cap: ", s.interaction_log.size()));
  }

  return errors;
}

std::vector<std::string> validate_turn_transition(const WorldState& before, const WorldState& after,
                                                  const SimConfig& cfg) {
  std::vector<std::string> errors;
  if (after.time != before.time + 1) {
    errors.push_back(join("Time must advance by exactly one (", before.time, " -> ", after.time, ")"));
  }
  auto rest = validate_world_state(after, cfg);
  errors.insert(errors.end(), std::make_move_iterator(rest.begin()), std::make_move_iterator(rest.end()));
  return errors;
}

} // namespace storyloom
