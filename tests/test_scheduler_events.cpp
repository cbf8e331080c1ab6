#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "scheduler_fixture.h"
#include "storyloom/core/scheduler.h"
#include "storyloom/util/log.h"

#define SL_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

const storyloom::Faction& faction(const storyloom::WorldState& w, const std::string& id) {
  return *storyloom::find_by_id(w.factions, id);
}

std::size_t count_events(const storyloom::WorldState& w, storyloom::HistoricalEventType type) {
  std::size_t n = 0;
  for (const auto& e : w.events) {
    if (e.type == type) ++n;
  }
  return n;
}

storyloom::Force militia(const std::string& faction_id) {
  storyloom::Force f;
  f.faction_id = faction_id;
  storyloom::Unit u;
  u.quantity = 50.0;
  f.units.push_back(u);
  return f;
}

} // namespace

int test_scheduler_events() {
  using namespace storyloom;
  log::ScopedLevel quiet(log::Level::Off);

  // Political shifts, per-subject cooldowns and event delivery.
  {
    TickScheduler sched(SimConfig{}, util::HashRng(10));
    sched.initialize(test::make_camp_world());
    sched.start();

    std::vector<HistoricalEventType> delivered;
    sched.set_on_event([&](const HistoricalEvent& e) { delivered.push_back(e.type); });

    sched.enqueue(PoliticalEvent{"f1", "Grain riots", -10.0});
    (void)sched.step();
    SL_ASSERT(faction(sched.world(), "f1").stability == 40.0);
    SL_ASSERT(count_events(sched.world(), HistoricalEventType::PoliticalShift) == 1);
    SL_ASSERT(sched.world().events.back().message == "Grain riots");
    SL_ASSERT(delivered.size() == 1);

    // Same faction again inside the cooldown window: skipped.
    sched.enqueue(PoliticalEvent{"f1", "More riots", -10.0});
    (void)sched.step();
    SL_ASSERT(faction(sched.world(), "f1").stability == 40.0);
    SL_ASSERT(count_events(sched.world(), HistoricalEventType::PoliticalShift) == 1);
    SL_ASSERT(delivered.size() == 1);

    // A different subject is not affected by that cooldown.
    sched.enqueue(PoliticalEvent{"f2", "", 5.0});
    (void)sched.step();
    SL_ASSERT(faction(sched.world(), "f2").stability == 55.0);
    SL_ASSERT(delivered.size() == 2);
  }

  // Diplomacy moves both directions.
  {
    TickScheduler sched(SimConfig{}, util::HashRng(11));
    sched.initialize(test::make_camp_world());
    sched.start();
    sched.enqueue(DiplomaticEvent{"f2", "f1", 10.0});
    (void)sched.step();
    const Relation& a = faction(sched.world(), "f1").relations.at("f2");
    const Relation& b = faction(sched.world(), "f2").relations.at("f1");
    SL_ASSERT(a.opinion == 10.0 && b.opinion == 10.0);
    SL_ASSERT(a.trust == 55.0 && b.trust == 55.0);
    SL_ASSERT(count_events(sched.world(), HistoricalEventType::DiplomaticShift) == 1);
  }

  // Higher-priority events run first within a batch; wars start declared
  // and become active on the following turn.
  {
    TickScheduler sched(SimConfig{}, util::HashRng(12));
    sched.initialize(test::make_camp_world());
    sched.start();

    sched.enqueue(TradeEvent{"grain", 10.0, 0.0});
    sched.enqueue(WarDeclarationEvent{{"f1"}, {"f2"}, "border raids", {}, -1.0});
    (void)sched.step();

    const WorldState& w = sched.world();
    SL_ASSERT(w.events.size() == 2);
    SL_ASSERT(w.events[0].type == HistoricalEventType::WarDeclared);
    SL_ASSERT(w.events[0].consciousness_impact == -1.0);
    SL_ASSERT(w.events[1].type == HistoricalEventType::TradeResolved ||
              w.events[1].type == HistoricalEventType::MarketCrash);

    // Forage adds 5 before events run; the trade then swings the pool.
    const double grain = w.resources.at("grain");
    SL_ASSERT(grain == 115.0 || grain == 95.0 || grain == 52.5);

    SL_ASSERT(w.wars.size() == 1);
    SL_ASSERT(w.wars.front().phase == WarPhase::Declared);
    SL_ASSERT(faction(w, "f1").stability == 49.0);
    SL_ASSERT(faction(w, "f2").stability == 49.0);

    (void)sched.step();
    SL_ASSERT(sched.world().wars.front().phase == WarPhase::Active);
  }

  // The batch size is capped; leftovers wait for the next turn.
  {
    SimConfig cfg;
    cfg.max_concurrent_events = 2;
    TickScheduler sched(cfg, util::HashRng(13));
    sched.initialize(test::make_camp_world());
    sched.start();
    sched.enqueue(PoliticalEvent{"f1", "", 1.0});
    sched.enqueue(PoliticalEvent{"f2", "", 1.0});
    sched.enqueue(DiplomaticEvent{"f1", "f2", 1.0});
    (void)sched.step();
    SL_ASSERT(sched.pending_events() == 1);
    (void)sched.step();
    SL_ASSERT(sched.pending_events() == 0);
    SL_ASSERT(count_events(sched.world(), HistoricalEventType::DiplomaticShift) == 1);
  }

  // Encounter events default to everyone at the node and then run their
  // course over the following turns.
  {
    TickScheduler sched(SimConfig{}, util::HashRng(14));
    sched.initialize(test::make_camp_world());
    sched.start();
    sched.enqueue(EncounterEvent{"wolves", "camp", {}, 0.0});
    (void)sched.step();
    SL_ASSERT(sched.world().active_encounters.size() == 1);
    SL_ASSERT(sched.world().active_encounters.front().participants == std::vector<std::string>{"rook"});

    // Rate limited by the encounter event cooldown.
    sched.enqueue(EncounterEvent{"wolves", "camp", {}, 0.0});
    (void)sched.step();
    SL_ASSERT(sched.world().active_encounters.size() == 1);

    (void)sched.step();
    SL_ASSERT(sched.world().active_encounters.empty());
    SL_ASSERT(sched.world().encounter_history.size() == 1);
    SL_ASSERT(sched.world().encounter_history.front().outcome_id == std::string("chased"));
  }

  // Battles resolve immediately and unsettle both factions.
  {
    TickScheduler sched(SimConfig{}, util::HashRng(15));
    sched.initialize(test::make_camp_world());
    sched.start();
    BattleLocation loc;
    loc.node_id = "camp";
    sched.enqueue(BattleEvent{militia("f1"), militia("f2"), loc, -1.0});
    (void)sched.step();
    SL_ASSERT(count_events(sched.world(), HistoricalEventType::BattleResolved) == 1);
    SL_ASSERT(faction(sched.world(), "f1").stability == 49.0);
    SL_ASSERT(faction(sched.world(), "f2").stability == 49.0);
  }

  // Low collective consciousness amplifies negative impacts.
  {
    WorldConfig world = test::make_camp_world();
    world.characters.front().frequency = 3.0;
    TickScheduler sched(SimConfig{}, util::HashRng(16));
    sched.initialize(world);
    sched.start();
    sched.enqueue(PoliticalEvent{"f1", "", -10.0});
    (void)sched.step();
    SL_ASSERT(std::fabs(faction(sched.world(), "f1").stability - 38.0) < 1e-9);
  }

  return 0;
}
