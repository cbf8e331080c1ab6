#include "storyloom/core/encounter_lifecycle.h"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

#include "storyloom/util/log.h"

namespace storyloom {
namespace {

void trim_history(std::vector<EncounterInstance>& history, std::size_t cap) {
  if (cap == 0 || history.size() <= cap) return;
  history.erase(history.begin(), history.begin() + static_cast<std::ptrdiff_t>(history.size() - cap));
}

} // namespace

int difficulty_class(EncounterDifficulty d) {
  switch (d) {
    case EncounterDifficulty::Trivial: return 5;
    case EncounterDifficulty::Easy: return 10;
    case EncounterDifficulty::Medium: return 13;
    case EncounterDifficulty::Hard: return 16;
    case EncounterDifficulty::Deadly: return 20;
  }
  return 13;
}

bool EncounterLifecycle::prerequisite_met(const Prerequisite& p, const Character& ch) const {
  return std::visit(
      [&](const auto& req) -> bool {
        using T = std::decay_t<decltype(req)>;
        if constexpr (std::is_same_v<T, AttributePrerequisite>) {
          return ch.attributes.get(req.ability) >= req.min_value;
        } else if constexpr (std::is_same_v<T, SkillPrerequisite>) {
          const auto it = ch.skills.find(req.skill);
          return it != ch.skills.end() && it->second >= req.min_value;
        } else if constexpr (std::is_same_v<T, LevelPrerequisite>) {
          return ch.level >= req.min_level;
        } else if constexpr (std::is_same_v<T, QuestPrerequisite>) {
          const auto it = ch.quests.find(req.quest_id);
          return it != ch.quests.end() && it->second == req.status;
        } else {
          return std::find(ch.items.begin(), ch.items.end(), req.item_id) != ch.items.end();
        }
      },
      p);
}

bool EncounterLifecycle::trigger_fires(const Trigger& t, const EncounterContext& ctx) {
  return std::visit(
      [&](const auto& trig) -> bool {
        using T = std::decay_t<decltype(trig)>;
        if constexpr (std::is_same_v<T, TimeTrigger>) {
          return ctx.current_turn >= trig.turn;
        } else if constexpr (std::is_same_v<T, LocationTrigger>) {
          return ctx.node_id == trig.node_id;
        } else if constexpr (std::is_same_v<T, InteractionTrigger>) {
          return !ctx.last_interaction_id.empty() && ctx.last_interaction_id == trig.interaction_id;
        } else if constexpr (std::is_same_v<T, ConditionTrigger>) {
          return ctx.character && condition_holds(trig.condition, *ctx.character);
        } else {
          return resolver_.chance(trig.probability);
        }
      },
      t);
}

bool EncounterLifecycle::can_trigger(const EncounterDef& def, const EncounterContext& ctx) {
  if (def.cooldown > 0 && def.last_triggered != kNever && ctx.current_turn - def.last_triggered < def.cooldown) {
    return false;
  }

  if (!def.node_restrictions.empty() && !ctx.node_id.empty() &&
      std::find(def.node_restrictions.begin(), def.node_restrictions.end(), ctx.node_id) ==
          def.node_restrictions.end()) {
    return false;
  }

  if (ctx.character) {
    for (const auto& p : def.prerequisites) {
      if (!prerequisite_met(p, *ctx.character)) return false;
    }
  }

  if (def.triggers.empty()) return true;
  for (const auto& t : def.triggers) {
    if (trigger_fires(t, ctx)) return true;
  }
  return false;
}

Interaction EncounterLifecycle::generate_base_interaction(const EncounterDef& def) {
  Interaction base;
  base.id = "encounter_" + def.id + "_base";
  base.name = def.name;
  base.type = InteractionType::Encounter;
  base.cooldown = def.cooldown;
  base.repeatable = def.cooldown > 0;
  for (std::size_t i = 0; i < def.outcomes.size(); ++i) {
    const EncounterOutcome& o = def.outcomes[i];
    Branch b;
    b.id = "outcome_" + std::to_string(i);
    b.text = o.description;
    b.weight = o.probability;
    b.condition = o.condition;
    b.effects = o.effects;
    b.difficulty = difficulty_class(def.difficulty);
    base.branches.push_back(std::move(b));
  }
  return base;
}

Id EncounterLifecycle::trigger_encounter(WorldState& world, const std::string& encounter_id,
                                         std::vector<std::string> participants) {
  EncounterDef* def = find_by_id(world.encounters, encounter_id);
  if (!def) throw std::invalid_argument("trigger_encounter: unknown encounter: " + encounter_id);

  def->last_triggered = world.time;
  def->times_triggered += 1;

  EncounterInstance inst;
  inst.id = allocate_id(world);
  inst.encounter_id = def->id;
  inst.status = EncounterStatus::Active;
  inst.started_at = world.time;
  inst.max_turns = std::max(1, def->duration);
  inst.participants = std::move(participants);
  inst.base_interaction = generate_base_interaction(*def);

  const Id id = inst.id;
  world.active_encounters.push_back(std::move(inst));
  record_event(world, HistoricalEventType::EncounterTriggered, "encounter:" + def->id,
               "Encounter started: " + (def->name.empty() ? def->id : def->name), 0.0, cfg_.max_historical_events);
  log::debug("encounter " + def->id + " triggered as instance " + std::to_string(id));
  return id;
}

std::optional<EncounterOutcome> EncounterLifecycle::resolve_outcome(const EncounterDef& def,
                                                                    const Character* subject) {
  std::vector<const EncounterOutcome*> eligible;
  for (const auto& o : def.outcomes) {
    if (o.condition && (!subject || !condition_holds(*o.condition, *subject))) continue;
    eligible.push_back(&o);
  }
  if (eligible.empty()) return std::nullopt;
  return *resolver_.weighted_select(eligible, [](const EncounterOutcome* o) { return o->probability; });
}

EncounterTurn EncounterLifecycle::run_participants(WorldState& world, const EncounterDef& def,
                                                   const EncounterInstance& inst) {
  EncounterTurn turn;
  turn.turn = inst.elapsed_turns;

  const bool sequential = def.sequencing == Sequencing::Sequential;
  const auto& branches = inst.base_interaction.branches;
  int successes = 0;

  for (const auto& pid : inst.participants) {
    const Character* ch = find_by_id(world.characters, pid);
    if (!ch) {
      log::debug("encounter " + def.id + ": participant " + pid + " no longer exists");
      continue;
    }

    ParticipantAction act;
    act.participant_id = pid;

    std::vector<const Branch*> open;
    for (const auto& b : branches) {
      if (!b.condition || condition_holds(*b.condition, *ch)) open.push_back(&b);
    }

    Ability ability = Ability::Charisma;
    int dc = difficulty_class(def.difficulty);
    if (!open.empty()) {
      const Branch* chosen = resolver_.weighted_select(open, [](const Branch* b) { return b->weight; });
      act.branch_id = chosen->id;
      ability = chosen->check_ability;
      dc = chosen->difficulty;
    }

    act.assist_bonus = sequential ? successes : 0;
    act.check = resolver_.skill_check({ability_modifier(ch->attributes.get(ability)), act.assist_bonus}, dc);
    if (act.check.success) ++successes;
    turn.actions.push_back(std::move(act));
  }
  return turn;
}

void EncounterLifecycle::complete(WorldState& world, EncounterInstance& inst, const EncounterDef& def) {
  const Character* subject = nullptr;
  for (const auto& pid : inst.participants) {
    subject = find_by_id(world.characters, pid);
    if (subject) break;
  }

  std::string msg = "Encounter resolved: " + (def.name.empty() ? def.id : def.name);
  if (auto outcome = resolve_outcome(def, subject)) {
    inst.outcome_id = outcome->id;
    apply_effects(world, inst.participants, outcome->effects);
    if (!outcome->description.empty()) msg += " (" + outcome->description + ")";
  }

  inst.status = EncounterStatus::Completed;
  inst.ended_at = world.time;
  record_event(world, HistoricalEventType::EncounterCompleted, "encounter:" + def.id, msg, 0.0,
               cfg_.max_historical_events);
}

std::vector<Id> EncounterLifecycle::process_turn(WorldState& world) {
  std::vector<Id> completed;

  // Index loop: completing an instance may record events but never touches
  // active_encounters itself.
  for (std::size_t i = 0; i < world.active_encounters.size(); ++i) {
    EncounterInstance& inst = world.active_encounters[i];
    if (inst.status != EncounterStatus::Active) continue;

    const EncounterDef* def = find_by_id(world.encounters, inst.encounter_id);
    if (!def) throw std::runtime_error("active encounter references unknown definition: " + inst.encounter_id);
    const EncounterDef def_copy = *def;

    inst.elapsed_turns += 1;
    if (inst.elapsed_turns >= inst.max_turns) {
      complete(world, inst, def_copy);
      completed.push_back(inst.id);
    } else {
      inst.turns.push_back(run_participants(world, def_copy, inst));
    }
  }

  auto done = std::stable_partition(world.active_encounters.begin(), world.active_encounters.end(),
                                    [](const EncounterInstance& e) { return e.status == EncounterStatus::Active; });
  std::move(done, world.active_encounters.end(), std::back_inserter(world.encounter_history));
  world.active_encounters.erase(done, world.active_encounters.end());
  trim_history(world.encounter_history, cfg_.max_encounter_history);
  return completed;
}

bool EncounterLifecycle::end_encounter(WorldState& world, Id instance_id, const std::string& reason) {
  auto it = std::find_if(world.active_encounters.begin(), world.active_encounters.end(),
                         [&](const EncounterInstance& e) { return e.id == instance_id; });
  if (it == world.active_encounters.end()) return false;

  EncounterInstance inst = std::move(*it);
  world.active_encounters.erase(it);
  inst.status = EncounterStatus::Ended;
  inst.ended_at = world.time;
  inst.end_reason = reason.empty() ? "forced" : reason;

  record_event(world, HistoricalEventType::EncounterEnded, "encounter:" + inst.encounter_id,
               "Encounter ended early: " + inst.end_reason, 0.0, cfg_.max_historical_events);
  world.encounter_history.push_back(std::move(inst));
  trim_history(world.encounter_history, cfg_.max_encounter_history);
  return true;
}

} // namespace storyloom
