#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "storyloom/core/encounter.h"
#include "storyloom/core/entities.h"
#include "storyloom/core/ids.h"
#include "storyloom/core/war.h"

namespace storyloom {

// Authored world, as handed to TickScheduler::initialize.
struct WorldConfig {
  std::string name;
  std::vector<Node> nodes;
  std::vector<Character> characters;
  std::vector<Interaction> interactions;
  std::vector<EncounterDef> encounters;
  std::vector<Faction> factions;
  std::unordered_map<std::string, double> resources;
};

// Everything a turn may change. Copied at the start of each turn and either
// committed whole or thrown away.
struct WorldState {
  std::string name;

  // Advances by exactly one per committed turn.
  std::int64_t time{0};

  // Advisory pacing value (ms), recomputed each turn.
  double tick_delay_ms{1000.0};

  std::vector<Node> nodes;
  std::vector<Character> characters;
  std::vector<Interaction> interactions;
  std::vector<Faction> factions;
  std::unordered_map<std::string, double> resources;

  std::vector<EncounterDef> encounters;
  std::vector<EncounterInstance> active_encounters;
  std::vector<EncounterInstance> encounter_history;

  std::vector<War> wars;
  std::vector<War> concluded_wars;

  std::vector<HistoricalEvent> events;
  std::vector<InteractionLogEntry> interaction_log;

  // "<kind>:<subject>" -> turn the last complex event of that key ran.
  std::unordered_map<std::string, std::int64_t> event_cooldowns;

  Id next_id{1};
  std::uint64_t next_event_seq{1};
};

WorldState make_world_state(const WorldConfig& cfg);

template <typename T>
T* find_by_id(std::vector<T>& v, const std::string& id) {
  for (auto& x : v) {
    if (x.id == id) return &x;
  }
  return nullptr;
}

template <typename T>
const T* find_by_id(const std::vector<T>& v, const std::string& id) {
  for (const auto& x : v) {
    if (x.id == id) return &x;
  }
  return nullptr;
}

Id allocate_id(WorldState& w);

// Appends to the historical event stream, dropping the oldest entries once
// the log exceeds `max_events`. Returns the stored event.
const HistoricalEvent& record_event(WorldState& w, HistoricalEventType type, std::string subject,
                                    std::string message, double consciousness_impact, std::size_t max_events);

// Applies authored effects. Resource effects hit the world pool once;
// attribute, stat and relationship effects apply to each listed actor.
// Attributes stay within 3..20 and stats within 0..100.
void apply_effects(WorldState& w, const std::vector<std::string>& actor_ids, const std::vector<Effect>& effects);

// Mean character frequency; 7 (the neutral baseline) for an empty world.
double collective_consciousness(const WorldState& w);

} // namespace storyloom
