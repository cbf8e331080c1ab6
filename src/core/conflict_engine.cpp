#include "storyloom/core/conflict_engine.h"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

#include "storyloom/core/enum_strings.h"
#include "storyloom/util/log.h"

namespace storyloom {
namespace {

bool contains(const std::vector<std::string>& v, const std::string& x) {
  return std::find(v.begin(), v.end(), x) != v.end();
}

double total_head_count(const Force& f) {
  if (f.total_strength > 0.0) return f.total_strength;
  double n = 0.0;
  for (const auto& u : f.units) n += std::max(0.0, u.quantity);
  return n;
}

double side_military_strength(const WorldState& world, const std::vector<std::string>& factions) {
  double s = 0.0;
  for (const auto& id : factions) {
    if (const Faction* f = find_by_id(world.factions, id)) s += std::max(0.0, f->military_strength);
  }
  return s;
}

void shift_faction_frequency(WorldState& world, const std::vector<std::string>& factions, double delta) {
  for (const auto& id : factions) {
    if (Faction* f = find_by_id(world.factions, id)) {
      f->collective_frequency = std::max(0.0, f->collective_frequency + delta);
    }
  }
}

std::string join_ids(const std::vector<std::string>& ids) {
  std::ostringstream ss;
  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (i) ss << ", ";
    ss << ids[i];
  }
  return ss.str();
}

} // namespace

bool War::involves(const std::string& faction_id) const {
  return contains(attackers.factions, faction_id) || contains(defenders.factions, faction_id);
}

Id ConflictEngine::declare_war(WorldState& world, const std::vector<std::string>& attackers,
                               const std::vector<std::string>& defenders, const std::string& cause,
                               std::vector<WarGoal> goals, double consciousness_impact) {
  if (attackers.empty() || defenders.empty()) {
    throw std::invalid_argument("declare_war: both sides need at least one faction");
  }
  for (const auto& a : attackers) {
    if (contains(defenders, a)) throw std::invalid_argument("declare_war: faction on both sides: " + a);
  }
  for (const auto* side : {&attackers, &defenders}) {
    for (const auto& id : *side) {
      if (!find_by_id(world.factions, id)) throw std::invalid_argument("declare_war: unknown faction: " + id);
    }
  }

  War war;
  war.id = allocate_id(world);
  war.cause = cause;
  war.goals = std::move(goals);
  war.attackers.factions = attackers;
  war.defenders.factions = defenders;
  war.phase = WarPhase::Declared;
  war.momentum = 0.0;
  war.declared_at = world.time;

  const Id id = war.id;
  std::string msg = "War declared: " + join_ids(attackers) + " vs " + join_ids(defenders);
  if (!cause.empty()) msg += " (" + cause + ")";
  world.wars.push_back(std::move(war));

  record_event(world, HistoricalEventType::WarDeclared, "war:" + std::to_string(id), msg, consciousness_impact,
               cfg_.max_historical_events);
  log::info(msg);
  return id;
}

double ConflictEngine::force_strength(const Force& f) {
  double total = 0.0;
  for (const auto& u : f.units) {
    const double consciousness_bonus = u.collective_frequency > 10.0 ? 0.2 : 0.0;
    total += u.quantity * u.quality * (1.0 + u.equipment * 0.2 + u.training * 0.3 + consciousness_bonus);
  }
  return total;
}

LeadershipResult ConflictEngine::leadership_check(const Commander& c) {
  const std::vector<int> mods = {
      ability_modifier(c.charisma),
      ability_modifier(c.wisdom),
      static_cast<int>(std::floor((c.frequency - 7.0) / 3.0)),
      c.war_skill,
  };

  LeadershipResult out;
  out.check = resolver_.skill_check(mods, 10);
  if (out.check.total >= 15) {
    out.tactics = Tactics::Brilliant;
  } else if (out.check.total >= 10) {
    out.tactics = Tactics::Competent;
  } else {
    out.tactics = Tactics::Poor;
  }
  out.inspirational_bonus = c.frequency > 12.0 ? 0.2 : 0.0;
  return out;
}

double ConflictEngine::morale(const Force& f) {
  const double m = f.training * 0.3 + f.equipment * 0.2 + f.supplies * 0.2 + f.collective_frequency / 20.0 +
                   f.veteran_ratio * 0.3;
  return std::min(1.0, m);
}

double ConflictEngine::terrain_bonus(Terrain terrain, UnitType unit_type) {
  // rows: terrain; columns: infantry, cavalry, archers
  static constexpr double kTable[4][3] = {
      {0.0, 0.2, -0.1},   // plains
      {0.2, -0.3, 0.2},   // forest
      {0.3, -0.2, 0.1},   // mountains
      {0.1, -0.1, 0.1},   // river
  };
  if (terrain == Terrain::Other || unit_type == UnitType::Other) return 0.0;
  return kTable[static_cast<int>(terrain)][static_cast<int>(unit_type)];
}

double ConflictEngine::tactics_multiplier(Tactics t) {
  switch (t) {
    case Tactics::Brilliant: return 1.5;
    case Tactics::Competent: return 1.0;
    case Tactics::Poor: return 0.7;
  }
  return 1.0;
}

Battle ConflictEngine::resolve_battle(WorldState& world, const Force& attacking, const Force& defending,
                                      const BattleLocation& location) {
  Battle b;
  b.id = allocate_id(world);
  b.time = world.time;
  b.location = location;
  b.attacker_faction = attacking.faction_id;
  b.defender_faction = defending.faction_id;

  b.attacker_strength = force_strength(attacking);
  b.defender_strength = force_strength(defending);
  b.attacker_leadership = leadership_check(attacking.commander);
  b.defender_leadership = leadership_check(defending.commander);
  b.attacker_morale = morale(attacking);
  b.defender_morale = morale(defending);
  b.terrain_bonus = terrain_bonus(location.terrain, defending.unit_type);
  b.preparation_bonus = preparation_bonus(defending);

  double attacker_hp = b.attacker_strength * 100.0;
  double defender_hp = b.defender_strength * 100.0 + b.terrain_bonus + b.preparation_bonus;

  const double atk_scale =
      (1.0 + b.attacker_leadership.inspirational_bonus) * tactics_multiplier(b.attacker_leadership.tactics);
  const double def_scale =
      (1.0 + b.defender_leadership.inspirational_bonus) * tactics_multiplier(b.defender_leadership.tactics);

  const int max_rounds = std::max(0, cfg_.max_battle_rounds);
  while (attacker_hp > 0.0 && defender_hp > 0.0 && static_cast<int>(b.rounds.size()) < max_rounds) {
    BattleRound r;
    r.number = static_cast<int>(b.rounds.size()) + 1;
    r.attacker_damage = 0.1 * defender_hp * atk_scale;
    r.defender_damage = 0.1 * attacker_hp * def_scale;

    if (b.attacker_morale < cfg_.morale_break_threshold && resolver_.chance(cfg_.morale_break_probability)) {
      r.attacker_damage *= 0.5;
      r.attacker_morale_break = true;
    }
    if (b.defender_morale < cfg_.morale_break_threshold && resolver_.chance(cfg_.morale_break_probability)) {
      r.defender_damage *= 0.5;
      r.defender_morale_break = true;
    }

    defender_hp = std::max(0.0, defender_hp - r.attacker_damage);
    attacker_hp = std::max(0.0, attacker_hp - r.defender_damage);
    r.attacker_hp = attacker_hp;
    r.defender_hp = defender_hp;
    b.rounds.push_back(r);

    if (cfg_.end_battle_on_morale_break && (r.attacker_morale_break || r.defender_morale_break)) break;
  }

  if (b.rounds.empty()) {
    // One side never had anything to fight with.
    b.outcome.victor = (defender_hp <= 0.0 && attacker_hp > 0.0) ? BattleSide::Attacker : BattleSide::Defender;
    b.outcome.margin = attacker_hp - defender_hp;
  } else {
    const BattleRound& last = b.rounds.back();
    b.outcome.margin = last.attacker_damage - last.defender_damage;
    // Ties go to the defender.
    b.outcome.victor = b.outcome.margin > 0.0 ? BattleSide::Attacker : BattleSide::Defender;
  }
  b.outcome.decisive = std::fabs(b.outcome.margin) > cfg_.decisive_margin;

  const bool attacker_won = b.outcome.victor == BattleSide::Attacker;
  const double atk_ratio = attacker_won ? cfg_.winner_casualty_ratio : cfg_.loser_casualty_ratio;
  const double def_ratio = attacker_won ? cfg_.loser_casualty_ratio : cfg_.winner_casualty_ratio;
  b.attacker_casualties.military = std::floor(total_head_count(attacking) * atk_ratio);
  b.defender_casualties.military = std::floor(total_head_count(defending) * def_ratio);
  if (location.population_center) {
    const double civilians = std::floor(std::max(0.0, location.population) * cfg_.civilian_casualty_ratio);
    b.attacker_casualties.civilian = civilians;
    b.defender_casualties.civilian = civilians;
  }

  const double total_casualties = b.attacker_casualties.military + b.defender_casualties.military +
                                  b.attacker_casualties.civilian + b.defender_casualties.civilian;
  b.victor_frequency_shift = 0.5;
  b.loser_frequency_shift = -1.0;
  b.location_impact = -std::min(2.0, total_casualties / 1000.0);

  apply_battle_consequences(world, b);
  return b;
}

void ConflictEngine::apply_battle_consequences(WorldState& world, Battle& b) const {
  const bool attacker_won = b.outcome.victor == BattleSide::Attacker;
  const std::string& winner = attacker_won ? b.attacker_faction : b.defender_faction;
  const std::string& loser = attacker_won ? b.defender_faction : b.attacker_faction;
  shift_faction_frequency(world, {winner}, b.victor_frequency_shift);
  shift_faction_frequency(world, {loser}, b.loser_frequency_shift);

  for (auto& c : world.characters) {
    if (!b.location.node_id.empty() && c.node_id == b.location.node_id) {
      c.frequency = std::max(0.0, c.frequency + b.location_impact);
    }
  }

  for (auto& war : world.wars) {
    if (war.phase == WarPhase::Concluded || !war.involves(b.attacker_faction)) continue;
    WarSide* atk_side = nullptr;
    WarSide* def_side = nullptr;
    if (contains(war.attackers.factions, b.attacker_faction) && contains(war.defenders.factions, b.defender_faction)) {
      atk_side = &war.attackers;
      def_side = &war.defenders;
    } else if (contains(war.defenders.factions, b.attacker_faction) &&
               contains(war.attackers.factions, b.defender_faction)) {
      atk_side = &war.defenders;
      def_side = &war.attackers;
    }
    if (!atk_side) continue;

    atk_side->casualties.military += b.attacker_casualties.military;
    atk_side->casualties.civilian += b.attacker_casualties.civilian;
    def_side->casualties.military += b.defender_casualties.military;
    def_side->casualties.civilian += b.defender_casualties.civilian;
    b.war_id = war.id;
    war.battles.push_back(b);
    break;
  }

  std::ostringstream msg;
  msg << "Battle at " << (b.location.node_id.empty() ? std::string("open ground") : b.location.node_id) << ": "
      << (attacker_won ? b.attacker_faction : b.defender_faction) << " prevailed"
      << (b.outcome.decisive ? " decisively" : "") << " after " << b.rounds.size() << " round(s)";
  record_event(world, HistoricalEventType::BattleResolved, "battle:" + std::to_string(b.id), msg.str(),
               b.location_impact, cfg_.max_historical_events);
}

void ConflictEngine::update_war(WorldState& world, War& war) const {
  if (war.phase == WarPhase::Declared) war.phase = WarPhase::Active;
  if (war.phase != WarPhase::Active) return;

  war.attackers.exhaustion += 0.1 + war.attackers.casualties.military * 0.01;
  war.defenders.exhaustion += 0.1 + war.defenders.casualties.military * 0.01;

  const double a = side_military_strength(world, war.attackers.factions);
  const double d = side_military_strength(world, war.defenders.factions);
  double momentum = 0.0;
  if (d > 0.0) {
    momentum = (a / d - 1.0) * 50.0;
  } else if (a > 0.0) {
    momentum = 100.0;
  }
  war.momentum = std::clamp(momentum, -100.0, 100.0);
}

bool ConflictEngine::goal_satisfied(const WorldState& world, const War& war, const WarGoal& goal) const {
  return std::visit(
      [&](const auto& g) -> bool {
        using T = std::decay_t<decltype(g)>;
        if constexpr (std::is_same_v<T, TerritoryGoal>) {
          const Node* n = find_by_id(world.nodes, g.node_id);
          return n && contains(war.attackers.factions, n->controller_faction);
        } else if constexpr (std::is_same_v<T, ResourceGoal>) {
          double held = 0.0;
          for (const auto& id : war.attackers.factions) {
            if (const Faction* f = find_by_id(world.factions, id)) {
              const auto it = f->stockpile.find(g.resource);
              if (it != f->stockpile.end()) held += it->second;
            }
          }
          return held >= g.amount;
        } else {
          const Faction* f = find_by_id(world.factions, g.faction_id);
          return f && f->stability <= g.max_stability;
        }
      },
      goal);
}

bool ConflictEngine::should_end_war(const WorldState& world, const War& war) const {
  if (war.attackers.exhaustion > 100.0 || war.defenders.exhaustion > 100.0) return true;
  if (std::fabs(war.momentum) > 80.0) return true;
  // Goal-less wars are not vacuously won; they end on exhaustion or momentum.
  if (war.goals.empty()) return false;
  for (const auto& g : war.goals) {
    if (!goal_satisfied(world, war, g)) return false;
  }
  return true;
}

WarVictor ConflictEngine::end_war(WorldState& world, War& war) const {
  if (war.phase == WarPhase::Concluded) throw std::logic_error("end_war: war already concluded");
  if (war.phase == WarPhase::Declared) war.phase = WarPhase::Active;

  war.phase = WarPhase::Resolution;
  war.ended_at = world.time;

  if (war.momentum > 50.0) {
    war.victor = WarVictor::Attackers;
  } else if (war.momentum < -50.0) {
    war.victor = WarVictor::Defenders;
  } else {
    war.victor = WarVictor::Stalemate;
  }

  // Economic damage scales with each side's exhaustion.
  for (const auto* side : {&war.attackers, &war.defenders}) {
    const double keep = 1.0 - std::clamp(side->exhaustion, 0.0, 100.0) * 0.01;
    for (const auto& id : side->factions) {
      if (Faction* f = find_by_id(world.factions, id)) f->economy = std::max(0.0, f->economy * keep);
    }
  }

  double impact = -1.0;
  if (war.victor == WarVictor::Stalemate) {
    shift_faction_frequency(world, war.attackers.factions, -1.0);
    shift_faction_frequency(world, war.defenders.factions, -1.0);
  } else {
    const bool attackers_won = war.victor == WarVictor::Attackers;
    const WarSide& winners = attackers_won ? war.attackers : war.defenders;
    const WarSide& losers = attackers_won ? war.defenders : war.attackers;

    for (const auto& g : war.goals) {
      const auto* t = std::get_if<TerritoryGoal>(&g);
      if (!t) continue;
      Node* n = find_by_id(world.nodes, t->node_id);
      if (n && !contains(winners.factions, n->controller_faction)) n->controller_faction = winners.factions.front();
    }

    for (const auto& w : winners.factions) {
      Faction* f = find_by_id(world.factions, w);
      if (!f) continue;
      for (const auto& l : losers.factions) {
        Relation& rel = f->relations[l];
        rel.opinion = std::clamp(rel.opinion + 20.0, -100.0, 100.0);
        rel.trust = std::clamp(rel.trust - 30.0, 0.0, 100.0);
      }
    }

    shift_faction_frequency(world, winners.factions, 0.5);
    shift_faction_frequency(world, losers.factions, -1.0);
    impact = -0.5;
  }

  war.phase = WarPhase::Concluded;

  const std::string msg = "War " + std::to_string(war.id) + " ended: " + war_victor_to_string(war.victor);
  record_event(world, HistoricalEventType::WarEnded, "war:" + std::to_string(war.id), msg, impact,
               cfg_.max_historical_events);
  log::info(msg);
  return war.victor;
}

void ConflictEngine::advance_wars(WorldState& world) const {
  for (auto& war : world.wars) {
    update_war(world, war);
    if (war.phase == WarPhase::Active && should_end_war(world, war)) end_war(world, war);
  }

  auto split = std::stable_partition(world.wars.begin(), world.wars.end(),
                                     [](const War& w) { return w.phase != WarPhase::Concluded; });
  std::move(split, world.wars.end(), std::back_inserter(world.concluded_wars));
  world.wars.erase(split, world.wars.end());
}

} // namespace storyloom
