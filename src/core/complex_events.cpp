#include "storyloom/core/complex_events.h"

#include <algorithm>
#include <type_traits>

namespace storyloom {

int event_priority(const ComplexEvent& e) {
  return std::visit(
      [](const auto& ev) -> int {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, WarDeclarationEvent> || std::is_same_v<T, BattleEvent>) {
          return 100;
        } else if constexpr (std::is_same_v<T, PoliticalEvent>) {
          return 75;
        } else if constexpr (std::is_same_v<T, DiplomaticEvent>) {
          return 60;
        } else if constexpr (std::is_same_v<T, TradeEvent>) {
          return 50;
        } else {
          return 40;
        }
      },
      e);
}

std::string event_cooldown_key(const ComplexEvent& e) {
  return std::visit(
      [](const auto& ev) -> std::string {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, WarDeclarationEvent>) {
          const std::string a = ev.attackers.empty() ? std::string() : ev.attackers.front();
          const std::string d = ev.defenders.empty() ? std::string() : ev.defenders.front();
          return "war:" + a + ">" + d;
        } else if constexpr (std::is_same_v<T, BattleEvent>) {
          // Battles are never rate limited.
          return std::string();
        } else if constexpr (std::is_same_v<T, TradeEvent>) {
          return "trade:" + ev.resource;
        } else if constexpr (std::is_same_v<T, PoliticalEvent>) {
          return "political:" + ev.faction_id;
        } else if constexpr (std::is_same_v<T, DiplomaticEvent>) {
          return "diplomatic:" + std::min(ev.faction_a, ev.faction_b) + "|" + std::max(ev.faction_a, ev.faction_b);
        } else {
          return "encounter:" + ev.encounter_id;
        }
      },
      e);
}

const char* event_kind_label(const ComplexEvent& e) {
  return std::visit(
      [](const auto& ev) -> const char* {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, WarDeclarationEvent>) {
          return "war";
        } else if constexpr (std::is_same_v<T, BattleEvent>) {
          return "battle";
        } else if constexpr (std::is_same_v<T, TradeEvent>) {
          return "trade";
        } else if constexpr (std::is_same_v<T, PoliticalEvent>) {
          return "political";
        } else if constexpr (std::is_same_v<T, DiplomaticEvent>) {
          return "diplomatic";
        } else {
          return "encounter";
        }
      },
      e);
}

double scale_impact(double impact, double collective) {
  if (impact >= 0.0) return impact;
  if (collective > 10.0) return impact * std::max(0.0, 1.0 - (collective - 10.0) * 0.1);
  if (collective < 5.0) return impact * (1.0 + (5.0 - collective) * 0.1);
  return impact;
}

} // namespace storyloom
