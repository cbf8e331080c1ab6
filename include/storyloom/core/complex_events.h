#pragma once

#include <string>
#include <variant>
#include <vector>

#include "storyloom/core/war.h"

namespace storyloom {

// World-level events queued for the scheduler. Each carries a signed
// `impact` that is scaled by collective consciousness before it is applied.

struct WarDeclarationEvent {
  std::vector<std::string> attackers;
  std::vector<std::string> defenders;
  std::string cause;
  std::vector<WarGoal> goals;
  double impact{-1.0};
};

struct BattleEvent {
  Force attacking;
  Force defending;
  BattleLocation location;
  double impact{-1.0};
};

// A market swing on one resource of the world pool.
struct TradeEvent {
  std::string resource;
  double volume{0.0};
  double impact{0.0};
};

// Stability change for one faction. `impact` is the stability delta.
struct PoliticalEvent {
  std::string faction_id;
  std::string description;
  double impact{0.0};
};

// Opinion change between two factions (both directions). `impact` is the
// opinion delta; trust moves by half of it.
struct DiplomaticEvent {
  std::string faction_a;
  std::string faction_b;
  double impact{0.0};
};

struct EncounterEvent {
  std::string encounter_id;
  std::string node_id;
  // Empty means "every character at node_id".
  std::vector<std::string> participants;
  double impact{0.0};
};

using ComplexEvent =
    std::variant<WarDeclarationEvent, BattleEvent, TradeEvent, PoliticalEvent, DiplomaticEvent, EncounterEvent>;

// Higher runs first.
int event_priority(const ComplexEvent& e);

// Key used for per-subject event cooldowns, e.g. "trade:grain".
std::string event_cooldown_key(const ComplexEvent& e);

const char* event_kind_label(const ComplexEvent& e);

// High collective consciousness (> 10) dampens negative impacts, low (< 5)
// amplifies them. Positive impacts pass through unchanged.
double scale_impact(double impact, double collective);

} // namespace storyloom
