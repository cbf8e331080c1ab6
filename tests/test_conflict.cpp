#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

#include "storyloom/core/conflict_engine.h"
#include "storyloom/util/hash_rng.h"
#include "storyloom/util/log.h"

#define SL_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

storyloom::WorldState make_two_faction_world() {
  using namespace storyloom;
  WorldState w;
  w.name = "conflict";

  Faction a;
  a.id = "north";
  a.name = "North";
  a.military_strength = 100.0;
  Faction b;
  b.id = "south";
  b.name = "South";
  b.military_strength = 100.0;
  w.factions = {a, b};

  Node ford;
  ford.id = "ford";
  ford.name = "Ford";
  ford.type = "crossing";
  ford.controller_faction = "south";
  ford.population_center = true;
  ford.population = 500.0;
  w.nodes = {ford};

  Character scout;
  scout.id = "scout";
  scout.name = "Scout";
  scout.node_id = "ford";
  w.characters = {scout};
  return w;
}

storyloom::Force make_force(const std::string& faction, double men) {
  storyloom::Force f;
  f.faction_id = faction;
  storyloom::Unit u;
  u.quantity = men;
  u.quality = 1.0;
  u.training = 0.5;
  f.units.push_back(u);
  f.training = 0.5;
  f.equipment = 0.5;
  f.supplies = 0.5;
  f.commander.name = "Captain";
  return f;
}

} // namespace

int test_conflict() {
  using namespace storyloom;
  log::ScopedLevel quiet(log::Level::Off);

  SimConfig cfg;
  util::HashRng rng(2024);
  StochasticResolver resolver(rng);
  ConflictEngine engine(cfg, resolver);

  // Component formulas.
  {
    Force f = make_force("north", 100.0);
    // 100 * 1 * (1 + 0 + 0.5 * 0.3)
    SL_ASSERT(std::fabs(ConflictEngine::force_strength(f) - 115.0) < 1e-9);

    f.units[0].collective_frequency = 12.0;
    SL_ASSERT(std::fabs(ConflictEngine::force_strength(f) - 135.0) < 1e-9);

    // 0.15 + 0.1 + 0.1 + 7/20
    SL_ASSERT(std::fabs(ConflictEngine::morale(f) - 0.7) < 1e-9);
    f.training = 5.0;
    SL_ASSERT(ConflictEngine::morale(f) == 1.0);

    SL_ASSERT(ConflictEngine::terrain_bonus(Terrain::Mountains, UnitType::Infantry) == 0.3);
    SL_ASSERT(ConflictEngine::terrain_bonus(Terrain::Forest, UnitType::Cavalry) == -0.3);
    SL_ASSERT(ConflictEngine::terrain_bonus(Terrain::Other, UnitType::Archers) == 0.0);

    SL_ASSERT(ConflictEngine::tactics_multiplier(Tactics::Brilliant) == 1.5);
    SL_ASSERT(ConflictEngine::tactics_multiplier(Tactics::Poor) == 0.7);

    Commander c;
    c.charisma = 20.0;
    c.wisdom = 20.0;
    c.frequency = 13.0;
    c.war_skill = 5;
    // Minimum total is 1 + 5 + 5 + 2 + 5.
    const LeadershipResult lr = engine.leadership_check(c);
    SL_ASSERT(lr.tactics == Tactics::Brilliant);
    SL_ASSERT(lr.inspirational_bonus == 0.2);
  }

  // Battles never exceed the round cap.
  for (int trial = 0; trial < 25; ++trial) {
    WorldState w = make_two_faction_world();
    BattleLocation loc;
    loc.node_id = "ford";
    loc.terrain = Terrain::River;
    loc.population_center = true;
    loc.population = 500.0;

    const Battle b = engine.resolve_battle(w, make_force("north", 100.0 + trial * 10), make_force("south", 120.0), loc);
    SL_ASSERT(!b.rounds.empty());
    SL_ASSERT(static_cast<int>(b.rounds.size()) <= cfg.max_battle_rounds);
    SL_ASSERT(b.defender_casualties.civilian == 50.0);
    SL_ASSERT(b.location_impact <= 0.0 && b.location_impact >= -2.0);
    SL_ASSERT(w.events.size() == 1);
    SL_ASSERT(w.events.back().type == HistoricalEventType::BattleResolved);
  }

  // Casualty ratios follow the outcome.
  {
    WorldState w = make_two_faction_world();
    BattleLocation loc;
    const Battle b = engine.resolve_battle(w, make_force("north", 1000.0), make_force("south", 1000.0), loc);
    const bool attacker_won = b.outcome.victor == BattleSide::Attacker;
    SL_ASSERT(b.attacker_casualties.military == (attacker_won ? 200.0 : 400.0));
    SL_ASSERT(b.defender_casualties.military == (attacker_won ? 400.0 : 200.0));
    SL_ASSERT(b.attacker_casualties.civilian == 0.0);
  }

  // A side with no units loses without a fight.
  {
    WorldState w = make_two_faction_world();
    Force empty;
    empty.faction_id = "north";
    const Battle b = engine.resolve_battle(w, empty, make_force("south", 50.0), BattleLocation{});
    SL_ASSERT(b.rounds.empty());
    SL_ASSERT(b.outcome.victor == BattleSide::Defender);
  }

  // Battle casualties feed the war between the two factions.
  {
    WorldState w = make_two_faction_world();
    const Id war_id = engine.declare_war(w, {"north"}, {"south"}, "river tolls");
    const Battle b = engine.resolve_battle(w, make_force("north", 100.0), make_force("south", 100.0), BattleLocation{});
    SL_ASSERT(b.war_id == war_id);
    SL_ASSERT(w.wars.front().battles.size() == 1);
    SL_ASSERT(w.wars.front().attackers.casualties.military == b.attacker_casualties.military);
  }

  // declare_war argument checks.
  {
    WorldState w = make_two_faction_world();
    int rejected = 0;
    try {
      engine.declare_war(w, {}, {"south"}, "none");
    } catch (const std::invalid_argument&) {
      ++rejected;
    }
    try {
      engine.declare_war(w, {"north"}, {"north"}, "self");
    } catch (const std::invalid_argument&) {
      ++rejected;
    }
    try {
      engine.declare_war(w, {"north"}, {"atlantis"}, "myth");
    } catch (const std::invalid_argument&) {
      ++rejected;
    }
    SL_ASSERT(rejected == 3);
    SL_ASSERT(w.wars.empty());
    SL_ASSERT(w.events.empty());
  }

  return 0;
}

int test_war_lifecycle() {
  using namespace storyloom;
  log::ScopedLevel quiet(log::Level::Off);

  SimConfig cfg;
  util::HashRng rng(1);
  StochasticResolver resolver(rng);
  ConflictEngine engine(cfg, resolver);

  // Declared wars become active on their first update; equal strength means
  // zero momentum and a war that keeps going.
  {
    WorldState w = make_two_faction_world();
    engine.declare_war(w, {"north"}, {"south"}, "succession");
    SL_ASSERT(w.wars.front().phase == WarPhase::Declared);
    engine.advance_wars(w);
    SL_ASSERT(w.wars.size() == 1);
    SL_ASSERT(w.wars.front().phase == WarPhase::Active);
    SL_ASSERT(w.wars.front().momentum == 0.0);
    SL_ASSERT(std::fabs(w.wars.front().attackers.exhaustion - 0.1) < 1e-9);
  }

  // Each end condition suffices on its own.
  {
    WorldState w = make_two_faction_world();
    engine.declare_war(w, {"north"}, {"south"}, "attrition");
    War& war = w.wars.front();
    war.phase = WarPhase::Active;
    // No goals declared: nothing to have achieved yet.
    SL_ASSERT(war.goals.empty());
    SL_ASSERT(!engine.should_end_war(w, war));

    war.attackers.exhaustion = 101.0;
    SL_ASSERT(engine.should_end_war(w, war));
    war.attackers.exhaustion = 0.0;
    war.defenders.exhaustion = 101.0;
    SL_ASSERT(engine.should_end_war(w, war));
    war.defenders.exhaustion = 100.0;
    SL_ASSERT(!engine.should_end_war(w, war));
    war.defenders.exhaustion = 0.0;

    war.momentum = 81.0;
    SL_ASSERT(engine.should_end_war(w, war));
    war.momentum = -81.0;
    SL_ASSERT(engine.should_end_war(w, war));
    war.momentum = 80.0;
    SL_ASSERT(!engine.should_end_war(w, war));
    war.momentum = 0.0;

    war.goals.push_back(TerritoryGoal{"ford"});
    SL_ASSERT(!engine.should_end_war(w, war));
    w.nodes.front().controller_faction = "north";
    SL_ASSERT(engine.should_end_war(w, war));

    war.goals.push_back(PoliticalGoal{"south", 20.0});
    SL_ASSERT(!engine.should_end_war(w, war));
    find_by_id(w.factions, std::string("south"))->stability = 15.0;
    SL_ASSERT(engine.should_end_war(w, war));

    war.goals.push_back(ResourceGoal{"grain", 50.0});
    SL_ASSERT(!engine.should_end_war(w, war));
    find_by_id(w.factions, std::string("north"))->stockpile["grain"] = 50.0;
    SL_ASSERT(engine.should_end_war(w, war));
  }

  // Overwhelming attackers: momentum ends the war in their favour and the
  // territory goal changes hands.
  {
    WorldState w = make_two_faction_world();
    find_by_id(w.factions, std::string("north"))->military_strength = 300.0;
    engine.declare_war(w, {"north"}, {"south"}, "conquest", {TerritoryGoal{"ford"}});
    engine.advance_wars(w);

    SL_ASSERT(w.wars.empty());
    SL_ASSERT(w.concluded_wars.size() == 1);
    const War& war = w.concluded_wars.front();
    SL_ASSERT(war.phase == WarPhase::Concluded);
    SL_ASSERT(war.victor == WarVictor::Attackers);
    SL_ASSERT(war.ended_at == w.time);
    SL_ASSERT(w.nodes.front().controller_faction == "north");

    const Faction* north = find_by_id(w.factions, std::string("north"));
    const Faction* south = find_by_id(w.factions, std::string("south"));
    SL_ASSERT(north->relations.at("south").opinion == 20.0);
    SL_ASSERT(north->relations.at("south").trust == 20.0);
    SL_ASSERT(north->collective_frequency == 7.5);
    SL_ASSERT(south->collective_frequency == 6.0);
    SL_ASSERT(north->economy < 100.0);
    SL_ASSERT(w.events.back().type == HistoricalEventType::WarEnded);
  }

  // Exhaustion past 100 with even momentum is a stalemate.
  {
    WorldState w = make_two_faction_world();
    engine.declare_war(w, {"north"}, {"south"}, "feud");
    w.wars.front().attackers.exhaustion = 100.0;
    engine.advance_wars(w);
    SL_ASSERT(w.concluded_wars.size() == 1);
    SL_ASSERT(w.concluded_wars.front().victor == WarVictor::Stalemate);
    SL_ASSERT(find_by_id(w.factions, std::string("north"))->collective_frequency == 6.0);
    SL_ASSERT(find_by_id(w.factions, std::string("south"))->collective_frequency == 6.0);
    SL_ASSERT(w.events.back().consciousness_impact == -1.0);
  }

  // Ending twice is an error.
  {
    WorldState w = make_two_faction_world();
    engine.declare_war(w, {"north"}, {"south"}, "grudge");
    War& war = w.wars.front();
    engine.end_war(w, war);
    bool threw = false;
    try {
      engine.end_war(w, war);
    } catch (const std::logic_error&) {
      threw = true;
    }
    SL_ASSERT(threw);
  }

  return 0;
}
