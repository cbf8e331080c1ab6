#include "storyloom/core/world_state.h"

#include <algorithm>
#include <utility>

#include "storyloom/core/enum_strings.h"

namespace storyloom {

WorldState make_world_state(const WorldConfig& cfg) {
  WorldState w;
  w.name = cfg.name;
  w.nodes = cfg.nodes;
  w.characters = cfg.characters;
  w.interactions = cfg.interactions;
  w.encounters = cfg.encounters;
  w.factions = cfg.factions;
  w.resources = cfg.resources;
  return w;
}

Id allocate_id(WorldState& w) { return w.next_id++; }

const HistoricalEvent& record_event(WorldState& w, HistoricalEventType type, std::string subject,
                                    std::string message, double consciousness_impact, std::size_t max_events) {
  HistoricalEvent ev;
  ev.seq = w.next_event_seq++;
  ev.time = w.time;
  ev.type = type;
  ev.consciousness_impact = consciousness_impact;
  ev.subject = std::move(subject);
  ev.message = std::move(message);
  w.events.push_back(std::move(ev));

  if (max_events > 0 && w.events.size() > max_events) {
    const auto excess = static_cast<std::ptrdiff_t>(w.events.size() - max_events);
    w.events.erase(w.events.begin(), w.events.begin() + excess);
  }
  return w.events.back();
}

void apply_effects(WorldState& w, const std::vector<std::string>& actor_ids, const std::vector<Effect>& effects) {
  for (const auto& e : effects) {
    if (e.kind == EffectKind::Resource) {
      double& pool = w.resources[e.target];
      pool = std::max(0.0, pool + e.value);
      continue;
    }
    for (const auto& id : actor_ids) {
      Character* c = find_by_id(w.characters, id);
      if (!c) continue;
      switch (e.kind) {
        case EffectKind::Attribute: {
          const Ability a = ability_from_string(e.target);
          c->attributes.set(a, std::clamp(c->attributes.get(a) + e.value, kMinAttribute, kMaxAttribute));
          break;
        }
        case EffectKind::Stat: {
          const Stat s = stat_from_string(e.target);
          c->set_stat(s, std::clamp(c->stat(s) + e.value, kMinScore, kMaxScore));
          break;
        }
        case EffectKind::Relationship: {
          Faction* f = find_by_id(w.factions, c->faction_id);
          if (!f || f->id == e.target) break;
          Relation& rel = f->relations[e.target];
          rel.opinion = std::clamp(rel.opinion + e.value, -100.0, 100.0);
          break;
        }
        case EffectKind::Resource:
          break;
      }
    }
  }
}

double collective_consciousness(const WorldState& w) {
  if (w.characters.empty()) return 7.0;
  double sum = 0.0;
  for (const auto& c : w.characters) sum += c.frequency;
  return sum / static_cast<double>(w.characters.size());
}

} // namespace storyloom
