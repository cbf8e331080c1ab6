#include <iostream>
#include <stdexcept>
#include <string>

#include "storyloom/core/encounter_lifecycle.h"
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

storyloom::EncounterDef make_ambush() {
  using namespace storyloom;
  EncounterDef def;
  def.id = "ambush";
  def.name = "Ambush on the Road";
  def.difficulty = EncounterDifficulty::Hard;
  def.duration = 3;
  def.sequencing = Sequencing::Sequential;
  def.cooldown = 5;
  def.node_restrictions = {"road"};

  EncounterOutcome repelled;
  repelled.id = "repelled";
  repelled.description = "The ambushers flee.";
  repelled.probability = 1.0;
  repelled.effects.push_back(Effect{EffectKind::Stat, "mood", 10.0});
  def.outcomes.push_back(repelled);

  EncounterOutcome wounded;
  wounded.id = "wounded";
  wounded.probability = 1.0;
  wounded.condition = StatCondition{Stat::Health, 30.0};
  def.outcomes.push_back(wounded);
  return def;
}

storyloom::WorldState make_world() {
  using namespace storyloom;
  WorldState w;
  w.name = "encounters";

  Node road;
  road.id = "road";
  road.name = "Road";
  road.type = "path";
  Node town;
  town.id = "town";
  town.name = "Town";
  town.type = "town";
  w.nodes = {road, town};

  Character a;
  a.id = "a";
  a.name = "Aren";
  a.node_id = "road";
  a.level = 3;
  a.mood = 50.0;
  Character b;
  b.id = "b";
  b.name = "Bel";
  b.node_id = "road";
  b.mood = 50.0;
  w.characters = {a, b};

  w.encounters.push_back(make_ambush());
  return w;
}

} // namespace

int test_encounter() {
  using namespace storyloom;
  log::ScopedLevel quiet(log::Level::Off);

  SimConfig cfg;
  util::HashRng rng(77);
  StochasticResolver resolver(rng);
  EncounterLifecycle lifecycle(cfg, resolver);

  SL_ASSERT(difficulty_class(EncounterDifficulty::Trivial) == 5);
  SL_ASSERT(difficulty_class(EncounterDifficulty::Medium) == 13);
  SL_ASSERT(difficulty_class(EncounterDifficulty::Deadly) == 20);

  // Base interaction generated from the outcomes.
  {
    const Interaction base = EncounterLifecycle::generate_base_interaction(make_ambush());
    SL_ASSERT(base.id == "encounter_ambush_base");
    SL_ASSERT(base.type == InteractionType::Encounter);
    SL_ASSERT(base.repeatable);
    SL_ASSERT(base.branches.size() == 2);
    SL_ASSERT(base.branches[0].id == "outcome_0");
    SL_ASSERT(base.branches[0].difficulty == 16);
    SL_ASSERT(base.branches[1].condition.has_value());
  }

  // Trigger gates.
  {
    WorldState w = make_world();
    EncounterDef def = make_ambush();
    const Character& aren = w.characters[0];

    EncounterContext ctx;
    ctx.current_turn = 0;
    ctx.node_id = "road";
    ctx.character = &aren;
    // No triggers declared: eligible once the other gates pass.
    SL_ASSERT(lifecycle.can_trigger(def, ctx));

    ctx.node_id = "town";
    SL_ASSERT(!lifecycle.can_trigger(def, ctx));
    // No node in the context skips the restriction.
    ctx.node_id.clear();
    SL_ASSERT(lifecycle.can_trigger(def, ctx));
    ctx.node_id = "road";

    def.prerequisites.push_back(LevelPrerequisite{4});
    SL_ASSERT(!lifecycle.can_trigger(def, ctx));
    ctx.character = nullptr;
    SL_ASSERT(lifecycle.can_trigger(def, ctx));
    ctx.character = &aren;
    def.prerequisites.clear();

    def.last_triggered = 0;
    ctx.current_turn = 4;
    SL_ASSERT(!lifecycle.can_trigger(def, ctx));
    ctx.current_turn = 5;
    SL_ASSERT(lifecycle.can_trigger(def, ctx));

    def.triggers.push_back(TimeTrigger{10});
    SL_ASSERT(!lifecycle.can_trigger(def, ctx));
    def.triggers.push_back(LocationTrigger{"road"});
    SL_ASSERT(lifecycle.can_trigger(def, ctx));

    def.triggers = {ProbabilityTrigger{0.0}};
    SL_ASSERT(!lifecycle.can_trigger(def, ctx));
    def.triggers = {ProbabilityTrigger{1.0}};
    SL_ASSERT(lifecycle.can_trigger(def, ctx));

    def.triggers = {InteractionTrigger{"parley"}};
    SL_ASSERT(!lifecycle.can_trigger(def, ctx));
    ctx.last_interaction_id = "parley";
    SL_ASSERT(lifecycle.can_trigger(def, ctx));
  }

  // Full lifecycle: active for `duration` turns, then resolved.
  {
    WorldState w = make_world();
    const Id id = lifecycle.trigger_encounter(w, "ambush", {"a", "b"});
    SL_ASSERT(w.active_encounters.size() == 1);
    SL_ASSERT(w.encounters[0].times_triggered == 1);
    SL_ASSERT(w.encounters[0].last_triggered == 0);
    SL_ASSERT(w.events.back().type == HistoricalEventType::EncounterTriggered);

    SL_ASSERT(lifecycle.process_turn(w).empty());
    SL_ASSERT(lifecycle.process_turn(w).empty());
    SL_ASSERT(w.active_encounters.front().turns.size() == 2);
    SL_ASSERT(w.active_encounters.front().turns[0].actions.size() == 2);
    // Sequential: the first participant never gets an assist.
    SL_ASSERT(w.active_encounters.front().turns[0].actions[0].assist_bonus == 0);

    const auto done = lifecycle.process_turn(w);
    SL_ASSERT(done.size() == 1 && done.front() == id);
    SL_ASSERT(w.active_encounters.empty());
    SL_ASSERT(w.encounter_history.size() == 1);

    const EncounterInstance& inst = w.encounter_history.front();
    SL_ASSERT(inst.status == EncounterStatus::Completed);
    SL_ASSERT(inst.elapsed_turns == 3);
    // Health 100 keeps the conditional outcome out.
    SL_ASSERT(inst.outcome_id && *inst.outcome_id == "repelled");
    SL_ASSERT(w.characters[0].mood == 60.0);
    SL_ASSERT(w.characters[1].mood == 60.0);
    SL_ASSERT(w.events.back().type == HistoricalEventType::EncounterCompleted);
  }

  // Sequential participants build on earlier successes; simultaneous ones act
  // independently. Trivial DC 5 with every attribute at 20 cannot fail.
  for (const Sequencing mode : {Sequencing::Sequential, Sequencing::Simultaneous}) {
    WorldState w = make_world();
    EncounterDef& def = w.encounters.front();
    def.difficulty = EncounterDifficulty::Trivial;
    def.sequencing = mode;
    for (auto& c : w.characters) {
      for (Ability a : {Ability::Strength, Ability::Dexterity, Ability::Constitution, Ability::Intelligence,
                        Ability::Wisdom, Ability::Charisma}) {
        c.attributes.set(a, 20.0);
      }
    }

    (void)lifecycle.trigger_encounter(w, "ambush", {"a", "b"});
    SL_ASSERT(lifecycle.process_turn(w).empty());
    const auto& actions = w.active_encounters.front().turns.front().actions;
    SL_ASSERT(actions.size() == 2);
    SL_ASSERT(actions[0].check.success);
    SL_ASSERT(actions[0].assist_bonus == 0);
    SL_ASSERT(actions[1].assist_bonus == (mode == Sequencing::Sequential ? 1 : 0));
  }

  // Forced end.
  {
    WorldState w = make_world();
    const Id id = lifecycle.trigger_encounter(w, "ambush", {"a"});
    SL_ASSERT(!lifecycle.end_encounter(w, id + 1000, "nope"));
    SL_ASSERT(lifecycle.end_encounter(w, id, ""));
    SL_ASSERT(w.active_encounters.empty());
    SL_ASSERT(w.encounter_history.front().status == EncounterStatus::Ended);
    SL_ASSERT(w.encounter_history.front().end_reason == "forced");
    SL_ASSERT(w.events.back().type == HistoricalEventType::EncounterEnded);
  }

  // Outcome resolution without a subject skips conditional outcomes.
  {
    EncounterDef def = make_ambush();
    def.outcomes[0].condition = StatCondition{Stat::Energy, 10.0};
    SL_ASSERT(!lifecycle.resolve_outcome(def, nullptr).has_value());
  }

  // Unknown definitions are rejected.
  {
    WorldState w = make_world();
    bool threw = false;
    try {
      lifecycle.trigger_encounter(w, "dragon", {"a"});
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    SL_ASSERT(threw);
    SL_ASSERT(w.active_encounters.empty());
  }

  return 0;
}
