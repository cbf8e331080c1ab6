#include "storyloom/core/serialization.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "storyloom/core/encounter_lifecycle.h"
#include "storyloom/core/enum_strings.h"
#include "storyloom/core/errors.h"
#include "storyloom/util/file_io.h"
#include "storyloom/util/log.h"

namespace storyloom {

namespace {

using json::Array;
using json::Object;
using json::Value;

template <typename Map>
std::vector<typename Map::key_type> sorted_keys(const Map& m) {
  std::vector<typename Map::key_type> keys;
  keys.reserve(m.size());
  for (const auto& kv : m) keys.push_back(kv.first);
  std::sort(keys.begin(), keys.end());
  return keys;
}

const Array& array_or_empty(const Object& o, const std::string& key) {
  static const Array kEmpty;
  const auto it = o.find(key);
  if (it == o.end()) return kEmpty;
  const Array* a = it->second.as_array();
  return a ? *a : kEmpty;
}

const Object& object_or_empty(const Object& o, const std::string& key) {
  static const Object kEmpty;
  const auto it = o.find(key);
  if (it == o.end()) return kEmpty;
  const Object* obj = it->second.as_object();
  return obj ? *obj : kEmpty;
}

const Object& as_object_or_empty(const Value& v) {
  static const Object kEmpty;
  const Object* o = v.as_object();
  return o ? *o : kEmpty;
}

Value map_to_json(const std::unordered_map<std::string, double>& m) {
  Object o;
  for (const auto& [k, v] : m) o[k] = v;
  return o;
}

std::unordered_map<std::string, double> map_from_json(const Object& o) {
  std::unordered_map<std::string, double> m;
  for (const auto& [k, v] : o) {
    if (v.is_number() && std::isfinite(v.number_value())) m[k] = v.number_value();
  }
  return m;
}

Value strings_to_json(const std::vector<std::string>& v) {
  Array a;
  a.reserve(v.size());
  for (const auto& s : v) a.push_back(s);
  return a;
}

std::vector<std::string> strings_from_json(const Array& a) {
  std::vector<std::string> out;
  for (const auto& x : a) {
    if (x.is_string()) out.push_back(x.string_value());
  }
  return out;
}

// --- entity codecs ---

Value attributes_to_json(const Attributes& a) {
  Object o;
  o["strength"] = a.strength;
  o["dexterity"] = a.dexterity;
  o["constitution"] = a.constitution;
  o["intelligence"] = a.intelligence;
  o["wisdom"] = a.wisdom;
  o["charisma"] = a.charisma;
  return o;
}

Attributes attributes_from_json(const Object& o) {
  Attributes a;
  a.strength = json::number_or(o, "strength", a.strength);
  a.dexterity = json::number_or(o, "dexterity", a.dexterity);
  a.constitution = json::number_or(o, "constitution", a.constitution);
  a.intelligence = json::number_or(o, "intelligence", a.intelligence);
  a.wisdom = json::number_or(o, "wisdom", a.wisdom);
  a.charisma = json::number_or(o, "charisma", a.charisma);
  return a;
}

Value condition_to_json(const StatCondition& c) {
  Object o;
  o["stat"] = stat_to_string(c.stat);
  o["max"] = c.max_value;
  return o;
}

std::optional<StatCondition> condition_from_json(const Object& parent) {
  const auto it = parent.find("condition");
  if (it == parent.end() || !it->second.is_object()) return std::nullopt;
  const Object& o = it->second.object();
  StatCondition c;
  c.stat = stat_from_string(json::string_or(o, "stat", "health"));
  c.max_value = json::number_or(o, "max", 0.0);
  return c;
}

Value effects_to_json(const std::vector<Effect>& effects) {
  Array a;
  for (const auto& e : effects) {
    Object o;
    o["kind"] = effect_kind_to_string(e.kind);
    o["target"] = e.target;
    o["value"] = e.value;
    a.push_back(o);
  }
  return a;
}

std::vector<Effect> effects_from_json(const Array& a) {
  std::vector<Effect> out;
  for (const auto& v : a) {
    const Object& o = as_object_or_empty(v);
    if (o.empty()) continue;
    Effect e;
    e.kind = effect_kind_from_string(json::string_or(o, "kind", "resource"));
    e.target = json::string_or(o, "target");
    e.value = json::number_or(o, "value", 0.0);
    out.push_back(std::move(e));
  }
  return out;
}

Value interaction_to_json(const Interaction& it) {
  Object o;
  o["id"] = it.id;
  o["name"] = it.name;
  o["type"] = interaction_type_to_string(it.type);
  o["cooldown"] = static_cast<double>(it.cooldown);
  o["repeatable"] = it.repeatable;
  if (it.last_used != kNever) o["last_used"] = static_cast<double>(it.last_used);

  Array reqs;
  for (const auto& r : it.requirements) {
    Object ro;
    ro["attribute"] = ability_to_string(r.ability);
    ro["min"] = r.min_value;
    reqs.push_back(ro);
  }
  o["requirements"] = reqs;

  Array branches;
  for (const auto& b : it.branches) {
    Object bo;
    bo["id"] = b.id;
    if (!b.text.empty()) bo["text"] = b.text;
    bo["weight"] = b.weight;
    if (b.condition) bo["condition"] = condition_to_json(*b.condition);
    bo["effects"] = effects_to_json(b.effects);
    bo["check"] = ability_to_string(b.check_ability);
    bo["difficulty"] = static_cast<double>(b.difficulty);
    branches.push_back(bo);
  }
  o["branches"] = branches;
  return o;
}

Interaction interaction_from_json(const Object& o) {
  Interaction it;
  it.id = json::string_or(o, "id");
  it.name = json::string_or(o, "name", it.id);
  it.type = interaction_type_from_string(json::string_or(o, "type", "dialogue"));
  it.cooldown = static_cast<int>(json::int_or(o, "cooldown", 0));
  it.repeatable = json::bool_or(o, "repeatable", false);
  it.last_used = json::int_or(o, "last_used", kNever);

  for (const auto& rv : array_or_empty(o, "requirements")) {
    const Object& ro = as_object_or_empty(rv);
    Requirement r;
    r.ability = ability_from_string(json::string_or(ro, "attribute", "strength"));
    r.min_value = json::number_or(ro, "min", 0.0);
    it.requirements.push_back(r);
  }

  for (const auto& bv : array_or_empty(o, "branches")) {
    const Object& bo = as_object_or_empty(bv);
    Branch b;
    b.id = json::string_or(bo, "id", "branch_" + std::to_string(it.branches.size()));
    b.text = json::string_or(bo, "text");
    b.weight = json::number_or(bo, "weight", 1.0);
    b.condition = condition_from_json(bo);
    b.effects = effects_from_json(array_or_empty(bo, "effects"));
    b.check_ability = ability_from_string(json::string_or(bo, "check", "charisma"));
    b.difficulty = static_cast<int>(json::int_or(bo, "difficulty", 10));
    it.branches.push_back(std::move(b));
  }
  return it;
}

Value character_to_json(const Character& c) {
  Object o;
  o["id"] = c.id;
  o["name"] = c.name;
  o["node"] = c.node_id;
  if (!c.faction_id.empty()) o["faction"] = c.faction_id;
  o["level"] = static_cast<double>(c.level);
  o["attributes"] = attributes_to_json(c.attributes);
  o["skills"] = map_to_json(c.skills);
  o["energy"] = c.energy;
  o["health"] = c.health;
  o["mood"] = c.mood;
  o["frequency"] = c.frequency;
  o["coherence"] = c.coherence;
  if (c.last_interaction_type) o["last_interaction_type"] = interaction_type_to_string(*c.last_interaction_type);
  if (!c.last_interaction_id.empty()) o["last_interaction_id"] = c.last_interaction_id;

  Object quests;
  for (const auto& q : sorted_keys(c.quests)) quests[q] = c.quests.at(q);
  o["quests"] = quests;
  o["items"] = strings_to_json(c.items);
  return o;
}

Character character_from_json(const Object& o) {
  Character c;
  c.id = json::string_or(o, "id");
  c.name = json::string_or(o, "name");
  c.node_id = json::string_or(o, "node");
  c.faction_id = json::string_or(o, "faction");
  c.level = static_cast<int>(json::int_or(o, "level", 1));
  c.attributes = attributes_from_json(object_or_empty(o, "attributes"));
  c.skills = map_from_json(object_or_empty(o, "skills"));
  c.energy = json::number_or(o, "energy", c.energy);
  c.health = json::number_or(o, "health", c.health);
  c.mood = json::number_or(o, "mood", c.mood);
  c.frequency = json::number_or(o, "frequency", c.frequency);
  c.coherence = json::number_or(o, "coherence", c.coherence);
  if (const auto it = o.find("last_interaction_type"); it != o.end() && it->second.is_string()) {
    c.last_interaction_type = interaction_type_from_string(it->second.string_value());
  }
  c.last_interaction_id = json::string_or(o, "last_interaction_id");
  for (const auto& [q, status] : object_or_empty(o, "quests")) c.quests[q] = status.string_value();
  c.items = strings_from_json(array_or_empty(o, "items"));
  return c;
}

Value node_to_json(const Node& n) {
  Object o;
  o["id"] = n.id;
  o["name"] = n.name;
  o["type"] = n.type;
  o["interactions"] = strings_to_json(n.interaction_ids);
  if (!n.terrain.empty()) o["terrain"] = n.terrain;
  if (!n.controller_faction.empty()) o["controller"] = n.controller_faction;
  o["population_center"] = n.population_center;
  o["population"] = n.population;
  return o;
}

Node node_from_json(const Object& o) {
  Node n;
  n.id = json::string_or(o, "id");
  n.name = json::string_or(o, "name");
  n.type = json::string_or(o, "type");
  n.interaction_ids = strings_from_json(array_or_empty(o, "interactions"));
  n.terrain = json::string_or(o, "terrain");
  n.controller_faction = json::string_or(o, "controller");
  n.population_center = json::bool_or(o, "population_center", false);
  n.population = json::number_or(o, "population", 0.0);
  return n;
}

Value faction_to_json(const Faction& f) {
  Object o;
  o["id"] = f.id;
  o["name"] = f.name;
  o["military_strength"] = f.military_strength;
  o["economy"] = f.economy;
  o["stability"] = f.stability;
  o["collective_frequency"] = f.collective_frequency;
  o["stockpile"] = map_to_json(f.stockpile);
  Object rel;
  for (const auto& [other, r] : f.relations) {
    Object ro;
    ro["opinion"] = r.opinion;
    ro["trust"] = r.trust;
    rel[other] = ro;
  }
  o["relations"] = rel;
  return o;
}

Faction faction_from_json(const Object& o) {
  Faction f;
  f.id = json::string_or(o, "id");
  f.name = json::string_or(o, "name", f.id);
  f.military_strength = json::number_or(o, "military_strength", f.military_strength);
  f.economy = json::number_or(o, "economy", f.economy);
  f.stability = json::number_or(o, "stability", f.stability);
  f.collective_frequency = json::number_or(o, "collective_frequency", f.collective_frequency);
  f.stockpile = map_from_json(object_or_empty(o, "stockpile"));
  for (const auto& [other, rv] : object_or_empty(o, "relations")) {
    const Object& ro = as_object_or_empty(rv);
    Relation r;
    r.opinion = json::number_or(ro, "opinion", r.opinion);
    r.trust = json::number_or(ro, "trust", r.trust);
    f.relations[other] = r;
  }
  return f;
}

// --- encounters ---

Value trigger_to_json(const Trigger& t) {
  return std::visit(
      [](const auto& trig) -> Value {
        using T = std::decay_t<decltype(trig)>;
        Object o;
        if constexpr (std::is_same_v<T, TimeTrigger>) {
          o["type"] = std::string("time");
          o["turn"] = static_cast<double>(trig.turn);
        } else if constexpr (std::is_same_v<T, LocationTrigger>) {
          o["type"] = std::string("location");
          o["node"] = trig.node_id;
        } else if constexpr (std::is_same_v<T, InteractionTrigger>) {
          o["type"] = std::string("interaction");
          o["interaction"] = trig.interaction_id;
        } else if constexpr (std::is_same_v<T, ConditionTrigger>) {
          o["type"] = std::string("condition");
          o["condition"] = condition_to_json(trig.condition);
        } else {
          o["type"] = std::string("probability");
          o["probability"] = trig.probability;
        }
        return o;
      },
      t);
}

std::optional<Trigger> trigger_from_json(const Object& o) {
  const std::string type = json::string_or(o, "type");
  if (type == "time") return TimeTrigger{json::int_or(o, "turn", 0)};
  if (type == "location") return LocationTrigger{json::string_or(o, "node")};
  if (type == "interaction") return InteractionTrigger{json::string_or(o, "interaction")};
  if (type == "condition") {
    if (auto c = condition_from_json(o)) return ConditionTrigger{*c};
    return std::nullopt;
  }
  if (type == "probability") return ProbabilityTrigger{json::number_or(o, "probability", 0.0)};
  return std::nullopt;
}

Value prerequisite_to_json(const Prerequisite& p) {
  return std::visit(
      [](const auto& req) -> Value {
        using T = std::decay_t<decltype(req)>;
        Object o;
        if constexpr (std::is_same_v<T, AttributePrerequisite>) {
          o["type"] = std::string("attribute");
          o["attribute"] = ability_to_string(req.ability);
          o["min"] = req.min_value;
        } else if constexpr (std::is_same_v<T, SkillPrerequisite>) {
          o["type"] = std::string("skill");
          o["skill"] = req.skill;
          o["min"] = req.min_value;
        } else if constexpr (std::is_same_v<T, LevelPrerequisite>) {
          o["type"] = std::string("level");
          o["min"] = static_cast<double>(req.min_level);
        } else if constexpr (std::is_same_v<T, QuestPrerequisite>) {
          o["type"] = std::string("quest");
          o["quest"] = req.quest_id;
          o["status"] = req.status;
        } else {
          o["type"] = std::string("item");
          o["item"] = req.item_id;
        }
        return o;
      },
      p);
}

std::optional<Prerequisite> prerequisite_from_json(const Object& o) {
  const std::string type = json::string_or(o, "type");
  if (type == "attribute") {
    return AttributePrerequisite{ability_from_string(json::string_or(o, "attribute")), json::number_or(o, "min", 0.0)};
  }
  if (type == "skill") return SkillPrerequisite{json::string_or(o, "skill"), json::number_or(o, "min", 0.0)};
  if (type == "level") return LevelPrerequisite{static_cast<int>(json::int_or(o, "min", 1))};
  if (type == "quest") return QuestPrerequisite{json::string_or(o, "quest"), json::string_or(o, "status")};
  if (type == "item") return ItemPrerequisite{json::string_or(o, "item")};
  return std::nullopt;
}

Value encounter_def_to_json(const EncounterDef& e) {
  Object o;
  o["id"] = e.id;
  o["name"] = e.name;
  o["difficulty"] = encounter_difficulty_to_string(e.difficulty);
  o["duration"] = static_cast<double>(e.duration);
  o["sequencing"] = sequencing_to_string(e.sequencing);
  o["cooldown"] = static_cast<double>(e.cooldown);
  if (e.last_triggered != kNever) o["last_triggered"] = static_cast<double>(e.last_triggered);
  o["times_triggered"] = static_cast<double>(e.times_triggered);
  o["node_restrictions"] = strings_to_json(e.node_restrictions);

  Array triggers;
  for (const auto& t : e.triggers) triggers.push_back(trigger_to_json(t));
  o["triggers"] = triggers;

  Array prereqs;
  for (const auto& p : e.prerequisites) prereqs.push_back(prerequisite_to_json(p));
  o["prerequisites"] = prereqs;

  Array outcomes;
  for (const auto& oc : e.outcomes) {
    Object oo;
    oo["id"] = oc.id;
    oo["description"] = oc.description;
    oo["probability"] = oc.probability;
    if (oc.condition) oo["condition"] = condition_to_json(*oc.condition);
    oo["effects"] = effects_to_json(oc.effects);
    outcomes.push_back(oo);
  }
  o["outcomes"] = outcomes;
  return o;
}

EncounterDef encounter_def_from_json(const Object& o) {
  EncounterDef e;
  e.id = json::string_or(o, "id");
  e.name = json::string_or(o, "name", e.id);
  e.difficulty = encounter_difficulty_from_string(json::string_or(o, "difficulty", "medium"));
  e.duration = static_cast<int>(json::int_or(o, "duration", 1));
  e.sequencing = sequencing_from_string(json::string_or(o, "sequencing", "simultaneous"));
  e.cooldown = static_cast<int>(json::int_or(o, "cooldown", 0));
  e.last_triggered = json::int_or(o, "last_triggered", kNever);
  e.times_triggered = static_cast<int>(json::int_or(o, "times_triggered", 0));
  e.node_restrictions = strings_from_json(array_or_empty(o, "node_restrictions"));

  for (const auto& tv : array_or_empty(o, "triggers")) {
    if (auto t = trigger_from_json(as_object_or_empty(tv))) {
      e.triggers.push_back(*t);
    } else {
      log::warn("Encounter " + e.id + ": ignoring unknown trigger");
    }
  }
  for (const auto& pv : array_or_empty(o, "prerequisites")) {
    if (auto p = prerequisite_from_json(as_object_or_empty(pv))) {
      e.prerequisites.push_back(*p);
    } else {
      log::warn("Encounter " + e.id + ": ignoring unknown prerequisite");
    }
  }
  for (const auto& ov : array_or_empty(o, "outcomes")) {
    const Object& oo = as_object_or_empty(ov);
    EncounterOutcome oc;
    oc.id = json::string_or(oo, "id", "outcome_" + std::to_string(e.outcomes.size()));
    oc.description = json::string_or(oo, "description");
    oc.probability = json::number_or(oo, "probability", 1.0);
    oc.condition = condition_from_json(oo);
    oc.effects = effects_from_json(array_or_empty(oo, "effects"));
    e.outcomes.push_back(std::move(oc));
  }
  return e;
}

Value encounter_instance_to_json(const EncounterInstance& inst) {
  Object o;
  o["id"] = static_cast<double>(inst.id);
  o["encounter"] = inst.encounter_id;
  o["status"] = encounter_status_to_string(inst.status);
  o["started_at"] = static_cast<double>(inst.started_at);
  if (inst.ended_at != kNever) o["ended_at"] = static_cast<double>(inst.ended_at);
  o["elapsed_turns"] = static_cast<double>(inst.elapsed_turns);
  o["max_turns"] = static_cast<double>(inst.max_turns);
  o["participants"] = strings_to_json(inst.participants);
  if (inst.outcome_id) o["outcome"] = *inst.outcome_id;
  if (!inst.end_reason.empty()) o["end_reason"] = inst.end_reason;
  return o;
}

EncounterInstance encounter_instance_from_json(const Object& o) {
  EncounterInstance inst;
  inst.id = static_cast<Id>(json::int_or(o, "id", 0));
  inst.encounter_id = json::string_or(o, "encounter");
  inst.status = encounter_status_from_string(json::string_or(o, "status", "ended"));
  inst.started_at = json::int_or(o, "started_at", 0);
  inst.ended_at = json::int_or(o, "ended_at", kNever);
  inst.elapsed_turns = static_cast<int>(json::int_or(o, "elapsed_turns", 0));
  inst.max_turns = std::max(1, static_cast<int>(json::int_or(o, "max_turns", 1)));
  inst.participants = strings_from_json(array_or_empty(o, "participants"));
  if (const auto it = o.find("outcome"); it != o.end() && it->second.is_string()) {
    inst.outcome_id = it->second.string_value();
  }
  inst.end_reason = json::string_or(o, "end_reason");
  return inst;
}

// --- wars ---

Value war_goal_to_json(const WarGoal& g) {
  return std::visit(
      [](const auto& goal) -> Value {
        using T = std::decay_t<decltype(goal)>;
        Object o;
        if constexpr (std::is_same_v<T, TerritoryGoal>) {
          o["type"] = std::string("territory");
          o["node"] = goal.node_id;
        } else if constexpr (std::is_same_v<T, ResourceGoal>) {
          o["type"] = std::string("resources");
          o["resource"] = goal.resource;
          o["amount"] = goal.amount;
        } else {
          o["type"] = std::string("political");
          o["faction"] = goal.faction_id;
          o["max_stability"] = goal.max_stability;
        }
        return o;
      },
      g);
}

std::optional<WarGoal> war_goal_from_json(const Object& o) {
  const std::string type = json::string_or(o, "type");
  if (type == "territory") return TerritoryGoal{json::string_or(o, "node")};
  if (type == "resources") return ResourceGoal{json::string_or(o, "resource"), json::number_or(o, "amount", 0.0)};
  if (type == "political") {
    return PoliticalGoal{json::string_or(o, "faction"), json::number_or(o, "max_stability", 0.0)};
  }
  return std::nullopt;
}

Value war_side_to_json(const WarSide& s) {
  Object o;
  o["factions"] = strings_to_json(s.factions);
  o["exhaustion"] = s.exhaustion;
  o["military_casualties"] = s.casualties.military;
  o["civilian_casualties"] = s.casualties.civilian;
  return o;
}

WarSide war_side_from_json(const Object& o) {
  WarSide s;
  s.factions = strings_from_json(array_or_empty(o, "factions"));
  s.exhaustion = std::max(0.0, json::number_or(o, "exhaustion", 0.0));
  s.casualties.military = json::number_or(o, "military_casualties", 0.0);
  s.casualties.civilian = json::number_or(o, "civilian_casualties", 0.0);
  return s;
}

// Battles are persisted as summaries; round-by-round detail is not kept.
Value battle_to_json(const Battle& b) {
  Object o;
  o["id"] = static_cast<double>(b.id);
  o["time"] = static_cast<double>(b.time);
  o["location"] = b.location.node_id;
  o["attacker"] = b.attacker_faction;
  o["defender"] = b.defender_faction;
  o["victor"] = b.outcome.victor == BattleSide::Attacker ? std::string("attacker") : std::string("defender");
  o["decisive"] = b.outcome.decisive;
  o["margin"] = b.outcome.margin;
  o["rounds"] = static_cast<double>(b.rounds.size());
  o["attacker_casualties"] = b.attacker_casualties.military;
  o["defender_casualties"] = b.defender_casualties.military;
  return o;
}

Battle battle_from_json(const Object& o) {
  Battle b;
  b.id = static_cast<Id>(json::int_or(o, "id", 0));
  b.time = json::int_or(o, "time", 0);
  b.location.node_id = json::string_or(o, "location");
  b.attacker_faction = json::string_or(o, "attacker");
  b.defender_faction = json::string_or(o, "defender");
  b.outcome.victor = json::string_or(o, "victor") == "attacker" ? BattleSide::Attacker : BattleSide::Defender;
  b.outcome.decisive = json::bool_or(o, "decisive", false);
  b.outcome.margin = json::number_or(o, "margin", 0.0);
  b.attacker_casualties.military = json::number_or(o, "attacker_casualties", 0.0);
  b.defender_casualties.military = json::number_or(o, "defender_casualties", 0.0);
  return b;
}

Value war_to_json(const War& w) {
  Object o;
  o["id"] = static_cast<double>(w.id);
  o["cause"] = w.cause;
  Array goals;
  for (const auto& g : w.goals) goals.push_back(war_goal_to_json(g));
  o["goals"] = goals;
  o["attackers"] = war_side_to_json(w.attackers);
  o["defenders"] = war_side_to_json(w.defenders);
  o["phase"] = war_phase_to_string(w.phase);
  o["momentum"] = w.momentum;
  o["declared_at"] = static_cast<double>(w.declared_at);
  if (w.ended_at != kNever) o["ended_at"] = static_cast<double>(w.ended_at);
  o["victor"] = war_victor_to_string(w.victor);
  Array battles;
  for (const auto& b : w.battles) battles.push_back(battle_to_json(b));
  o["battles"] = battles;
  return o;
}

War war_from_json(const Object& o) {
  War w;
  w.id = static_cast<Id>(json::int_or(o, "id", 0));
  w.cause = json::string_or(o, "cause");
  for (const auto& gv : array_or_empty(o, "goals")) {
    if (auto g = war_goal_from_json(as_object_or_empty(gv))) w.goals.push_back(*g);
  }
  w.attackers = war_side_from_json(object_or_empty(o, "attackers"));
  w.defenders = war_side_from_json(object_or_empty(o, "defenders"));
  w.phase = war_phase_from_string(json::string_or(o, "phase", "declared"));
  w.momentum = std::clamp(json::number_or(o, "momentum", 0.0), -100.0, 100.0);
  w.declared_at = json::int_or(o, "declared_at", 0);
  w.ended_at = json::int_or(o, "ended_at", kNever);
  w.victor = war_victor_from_string(json::string_or(o, "victor", "undecided"));
  for (const auto& bv : array_or_empty(o, "battles")) w.battles.push_back(battle_from_json(as_object_or_empty(bv)));
  return w;
}

Value event_to_json(const HistoricalEvent& e) {
  Object o;
  o["seq"] = static_cast<double>(e.seq);
  o["time"] = static_cast<double>(e.time);
  o["type"] = historical_event_type_to_string(e.type);
  o["impact"] = e.consciousness_impact;
  o["subject"] = e.subject;
  o["message"] = e.message;
  return o;
}

HistoricalEvent event_from_json(const Object& o) {
  HistoricalEvent e;
  e.seq = static_cast<std::uint64_t>(json::int_or(o, "seq", 0));
  e.time = json::int_or(o, "time", 0);
  e.type = historical_event_type_from_string(json::string_or(o, "type"));
  e.consciousness_impact = json::number_or(o, "impact", 0.0);
  e.subject = json::string_or(o, "subject");
  e.message = json::string_or(o, "message");
  return e;
}

Value log_entry_to_json(const InteractionLogEntry& e) {
  Object o;
  o["time"] = static_cast<double>(e.time);
  o["character"] = e.character_id;
  o["interaction"] = e.interaction_id;
  o["branch"] = e.branch_id;
  o["outcome"] = e.positive ? std::string("positive") : std::string("negative");
  o["roll"] = static_cast<double>(e.roll);
  o["total"] = static_cast<double>(e.total);
  o["difficulty"] = static_cast<double>(e.difficulty);
  return o;
}

InteractionLogEntry log_entry_from_json(const Object& o) {
  InteractionLogEntry e;
  e.time = json::int_or(o, "time", 0);
  e.character_id = json::string_or(o, "character");
  e.interaction_id = json::string_or(o, "interaction");
  e.branch_id = json::string_or(o, "branch");
  e.positive = json::string_or(o, "outcome") == "positive";
  e.roll = static_cast<int>(json::int_or(o, "roll", 0));
  e.total = static_cast<int>(json::int_or(o, "total", 0));
  e.difficulty = static_cast<int>(json::int_or(o, "difficulty", 0));
  return e;
}

template <typename T, typename Fn>
Value list_to_json(const std::vector<T>& items, Fn&& fn) {
  Array a;
  a.reserve(items.size());
  for (const auto& x : items) a.push_back(fn(x));
  return a;
}

void sanitize_character(Character& c) {
  for (Ability a : {Ability::Strength, Ability::Dexterity, Ability::Constitution, Ability::Intelligence,
                    Ability::Wisdom, Ability::Charisma}) {
    const double v = c.attributes.get(a);
    c.attributes.set(a, std::isfinite(v) ? std::clamp(v, kMinAttribute, kMaxAttribute) : 10.0);
  }
  for (Stat s : {Stat::Energy, Stat::Health, Stat::Mood}) {
    const double v = c.stat(s);
    c.set_stat(s, std::isfinite(v) ? std::clamp(v, kMinScore, kMaxScore) : 50.0);
  }
  if (!std::isfinite(c.frequency)) c.frequency = 7.0;
  if (!std::isfinite(c.coherence)) c.coherence = 0.0;
}

// Reads an array of entities, dropping entries without an id.
template <typename T, typename Fn>
std::vector<T> read_entities(const Object& root, const std::string& key, Fn&& from_json) {
  std::vector<T> out;
  for (const auto& v : array_or_empty(root, key)) {
    const Object* o = v.as_object();
    if (!o) {
      log::warn("Snapshot: skipping non-object entry in '" + key + "'");
      continue;
    }
    T item = from_json(*o);
    if (item.id.empty()) {
      log::warn("Snapshot: skipping entry without id in '" + key + "'");
      continue;
    }
    out.push_back(std::move(item));
  }
  return out;
}

} // namespace

json::Value serialize_world_to_json_value(const WorldState& s) {
  Object root;
  root["snapshot_version"] = static_cast<double>(kCurrentSnapshotVersion);
  root["name"] = s.name;
  root["time"] = static_cast<double>(s.time);
  root["tick_delay_ms"] = s.tick_delay_ms;
  root["next_id"] = static_cast<double>(s.next_id);
  root["next_event_seq"] = static_cast<double>(s.next_event_seq);

  root["nodes"] = list_to_json(s.nodes, node_to_json);
  root["characters"] = list_to_json(s.characters, character_to_json);
  root["interactions"] = list_to_json(s.interactions, interaction_to_json);
  root["factions"] = list_to_json(s.factions, faction_to_json);
  root["resources"] = map_to_json(s.resources);

  root["encounters"] = list_to_json(s.encounters, encounter_def_to_json);
  root["active_encounters"] = list_to_json(s.active_encounters, encounter_instance_to_json);
  root["encounter_history"] = list_to_json(s.encounter_history, encounter_instance_to_json);

  root["wars"] = list_to_json(s.wars, war_to_json);
  root["concluded_wars"] = list_to_json(s.concluded_wars, war_to_json);

  root["events"] = list_to_json(s.events, event_to_json);
  root["interaction_log"] = list_to_json(s.interaction_log, log_entry_to_json);

  Object cooldowns;
  for (const auto& [k, t] : s.event_cooldowns) cooldowns[k] = static_cast<double>(t);
  root["event_cooldowns"] = cooldowns;
  return root;
}

std::string serialize_world_to_json(const WorldState& state) {
  return json::stringify(serialize_world_to_json_value(state), 2);
}

std::optional<WorldState> deserialize_world_from_json(const std::string& json_text, std::string* error) {
  const auto reject = [&](const std::string& why) -> std::optional<WorldState> {
    if (error) *error = why;
    return std::nullopt;
  };

  Value doc;
  try {
    doc = json::parse(json_text);
  } catch (const std::exception& e) {
    return reject(e.what());
  }

  const Object* root_ptr = doc.as_object();
  if (!root_ptr) return reject("snapshot is not a JSON object");
  const Object& root = *root_ptr;

  const Value* time = doc.find("time");
  if (!time || !time->is_number()) return reject("snapshot 'time' is missing or not a number");
  const double t = time->number_value();
  if (!std::isfinite(t) || t < 0.0) return reject("snapshot 'time' must be a finite non-negative number");
  if (t != std::floor(t)) return reject("snapshot 'time' must be a whole number of turns");
  // Leaves room for at least one more turn.
  if (t >= static_cast<double>(std::numeric_limits<std::int64_t>::max() - 1)) {
    return reject("snapshot 'time' is out of range");
  }

  for (const char* key : {"nodes", "characters", "interactions"}) {
    const Value* v = doc.find(key);
    if (!v || !v->is_array()) return reject(std::string("snapshot '") + key + "' must be an array");
  }
  const Value* resources = doc.find("resources");
  if (!resources || !resources->is_object()) return reject("snapshot 'resources' must be an object");

  WorldState s;
  s.name = json::string_or(root, "name");
  s.time = static_cast<std::int64_t>(t);
  s.tick_delay_ms = json::number_or(root, "tick_delay_ms", s.tick_delay_ms);
  if (!std::isfinite(s.tick_delay_ms)) s.tick_delay_ms = 1000.0;

  s.nodes = read_entities<Node>(root, "nodes", node_from_json);
  s.characters = read_entities<Character>(root, "characters", character_from_json);
  s.interactions = read_entities<Interaction>(root, "interactions", interaction_from_json);
  s.factions = read_entities<Faction>(root, "factions", faction_from_json);
  s.resources = map_from_json(resources->object());
  s.encounters = read_entities<EncounterDef>(root, "encounters", encounter_def_from_json);

  for (auto& c : s.characters) {
    sanitize_character(c);
    if (!s.nodes.empty() && !find_by_id(s.nodes, c.node_id)) {
      log::warn("Snapshot: character " + c.id + " moved from missing node '" + c.node_id + "' to " +
                s.nodes.front().id);
      c.node_id = s.nodes.front().id;
    }
  }
  for (auto& it : s.interactions) {
    if (it.last_used > s.time) it.last_used = s.time;
  }

  for (const auto& v : array_or_empty(root, "active_encounters")) {
    EncounterInstance inst = encounter_instance_from_json(as_object_or_empty(v));
    const EncounterDef* def = find_by_id(s.encounters, inst.encounter_id);
    if (!def || inst.id == kInvalidId || inst.status != EncounterStatus::Active ||
        inst.elapsed_turns >= inst.max_turns) {
      log::warn("Snapshot: dropping invalid active encounter '" + inst.encounter_id + "'");
      continue;
    }
    inst.base_interaction = EncounterLifecycle::generate_base_interaction(*def);
    s.active_encounters.push_back(std::move(inst));
  }
  for (const auto& v : array_or_empty(root, "encounter_history")) {
    s.encounter_history.push_back(encounter_instance_from_json(as_object_or_empty(v)));
  }

  for (const auto& v : array_or_empty(root, "wars")) {
    War w = war_from_json(as_object_or_empty(v));
    if (w.id == kInvalidId || w.attackers.factions.empty() || w.defenders.factions.empty() ||
        w.phase == WarPhase::Concluded) {
      log::warn("Snapshot: dropping invalid war entry");
      continue;
    }
    w.attackers.exhaustion = std::min(w.attackers.exhaustion, 100.0);
    w.defenders.exhaustion = std::min(w.defenders.exhaustion, 100.0);
    s.wars.push_back(std::move(w));
  }
  for (const auto& v : array_or_empty(root, "concluded_wars")) {
    s.concluded_wars.push_back(war_from_json(as_object_or_empty(v)));
  }

  for (const auto& v : array_or_empty(root, "events")) s.events.push_back(event_from_json(as_object_or_empty(v)));
  for (const auto& v : array_or_empty(root, "interaction_log")) {
    s.interaction_log.push_back(log_entry_from_json(as_object_or_empty(v)));
  }
  for (const auto& [k, v] : object_or_empty(root, "event_cooldowns")) s.event_cooldowns[k] = v.int_value(0);

  // Never hand out an id or sequence number that is already taken.
  Id max_id = 0;
  for (const auto& w : s.wars) max_id = std::max(max_id, w.id);
  for (const auto& w : s.concluded_wars) max_id = std::max(max_id, w.id);
  for (const auto& e : s.active_encounters) max_id = std::max(max_id, e.id);
  for (const auto& e : s.encounter_history) max_id = std::max(max_id, e.id);
  s.next_id = std::max<Id>(static_cast<Id>(json::int_or(root, "next_id", 1)), max_id + 1);

  std::uint64_t max_seq = 0;
  for (const auto& e : s.events) max_seq = std::max(max_seq, e.seq);
  s.next_event_seq =
      std::max<std::uint64_t>(static_cast<std::uint64_t>(json::int_or(root, "next_event_seq", 1)), max_seq + 1);

  return s;
}

WorldConfig world_config_from_json(const std::string& json_text) {
  Value doc;
  try {
    doc = json::parse(json_text);
  } catch (const std::exception& e) {
    throw ConfigurationError({e.what()});
  }
  const Object* root = doc.as_object();
  if (!root) throw ConfigurationError({"world configuration must be a JSON object"});

  const auto read_all = [&](const std::string& key, auto&& from_json) {
    using T = std::decay_t<decltype(from_json(std::declval<const Object&>()))>;
    std::vector<T> out;
    for (const auto& v : array_or_empty(*root, key)) out.push_back(from_json(as_object_or_empty(v)));
    return out;
  };

  WorldConfig cfg;
  cfg.name = json::string_or(*root, "name");
  cfg.nodes = read_all("nodes", node_from_json);
  cfg.characters = read_all("characters", character_from_json);
  cfg.interactions = read_all("interactions", interaction_from_json);
  cfg.encounters = read_all("encounters", encounter_def_from_json);
  cfg.factions = read_all("factions", faction_from_json);
  cfg.resources = map_from_json(object_or_empty(*root, "resources"));
  return cfg;
}

WorldConfig load_world_config_file(const std::string& path) {
  std::string text;
  try {
    text = util::read_text_file(path);
  } catch (const std::exception& e) {
    throw ConfigurationError({e.what()});
  }
  return world_config_from_json(text);
}

SimConfig sim_config_from_json(const std::string& json_text) {
  const Value doc = json::parse(json_text);
  const Object& o = doc.object();
  SimConfig c;

  const auto size_or = [&](const char* key, std::size_t def) {
    const std::int64_t v = json::int_or(o, key, static_cast<std::int64_t>(def));
    return v < 0 ? def : static_cast<std::size_t>(v);
  };

  c.max_turn_history = size_or("max_turn_history", c.max_turn_history);
  c.max_concurrent_events = size_or("max_concurrent_events", c.max_concurrent_events);
  c.max_historical_events = size_or("max_historical_events", c.max_historical_events);
  c.max_encounter_history = size_or("max_encounter_history", c.max_encounter_history);
  c.max_interaction_log = size_or("max_interaction_log", c.max_interaction_log);

  c.energy_decay_per_turn = json::number_or(o, "energy_decay_per_turn", c.energy_decay_per_turn);
  c.health_decay_per_turn = json::number_or(o, "health_decay_per_turn", c.health_decay_per_turn);
  c.mood_decay_per_turn = json::number_or(o, "mood_decay_per_turn", c.mood_decay_per_turn);
  c.passive_evolution_rate = json::number_or(o, "passive_evolution_rate", c.passive_evolution_rate);
  c.interaction_learning_rate = json::number_or(o, "interaction_learning_rate", c.interaction_learning_rate);

  c.tick_delay_base_ms = json::number_or(o, "tick_delay_base_ms", c.tick_delay_base_ms);
  c.tick_delay_per_coherence_ms = json::number_or(o, "tick_delay_per_coherence_ms", c.tick_delay_per_coherence_ms);
  c.tick_delay_min_ms = json::number_or(o, "tick_delay_min_ms", c.tick_delay_min_ms);
  c.tick_delay_max_ms = json::number_or(o, "tick_delay_max_ms", c.tick_delay_max_ms);

  c.decisive_margin = json::number_or(o, "decisive_margin", c.decisive_margin);
  c.morale_break_probability = json::number_or(o, "morale_break_probability", c.morale_break_probability);
  c.morale_break_threshold = json::number_or(o, "morale_break_threshold", c.morale_break_threshold);
  c.max_battle_rounds = static_cast<int>(json::int_or(o, "max_battle_rounds", c.max_battle_rounds));
  c.end_battle_on_morale_break = json::bool_or(o, "end_battle_on_morale_break", c.end_battle_on_morale_break);
  c.loser_casualty_ratio = json::number_or(o, "loser_casualty_ratio", c.loser_casualty_ratio);
  c.winner_casualty_ratio = json::number_or(o, "winner_casualty_ratio", c.winner_casualty_ratio);
  c.civilian_casualty_ratio = json::number_or(o, "civilian_casualty_ratio", c.civilian_casualty_ratio);

  c.war_event_cooldown = static_cast<int>(json::int_or(o, "war_event_cooldown", c.war_event_cooldown));
  c.trade_event_cooldown = static_cast<int>(json::int_or(o, "trade_event_cooldown", c.trade_event_cooldown));
  c.political_event_cooldown =
      static_cast<int>(json::int_or(o, "political_event_cooldown", c.political_event_cooldown));
  c.diplomatic_event_cooldown =
      static_cast<int>(json::int_or(o, "diplomatic_event_cooldown", c.diplomatic_event_cooldown));
  c.encounter_event_cooldown =
      static_cast<int>(json::int_or(o, "encounter_event_cooldown", c.encounter_event_cooldown));
  return c;
}

std::string sim_config_to_json(const SimConfig& c) {
  Object o;
  o["max_turn_history"] = static_cast<double>(c.max_turn_history);
  o["max_concurrent_events"] = static_cast<double>(c.max_concurrent_events);
  o["max_historical_events"] = static_cast<double>(c.max_historical_events);
  o["max_encounter_history"] = static_cast<double>(c.max_encounter_history);
  o["max_interaction_log"] = static_cast<double>(c.max_interaction_log);
  o["energy_decay_per_turn"] = c.energy_decay_per_turn;
  o["health_decay_per_turn"] = c.health_decay_per_turn;
  o["mood_decay_per_turn"] = c.mood_decay_per_turn;
  o["passive_evolution_rate"] = c.passive_evolution_rate;
  o["interaction_learning_rate"] = c.interaction_learning_rate;
  o["tick_delay_base_ms"] = c.tick_delay_base_ms;
  o["tick_delay_per_coherence_ms"] = c.tick_delay_per_coherence_ms;
  o["tick_delay_min_ms"] = c.tick_delay_min_ms;
  o["tick_delay_max_ms"] = c.tick_delay_max_ms;
  o["decisive_margin"] = c.decisive_margin;
  o["morale_break_probability"] = c.morale_break_probability;
  o["morale_break_threshold"] = c.morale_break_threshold;
  o["max_battle_rounds"] = static_cast<double>(c.max_battle_rounds);
  o["end_battle_on_morale_break"] = c.end_battle_on_morale_break;
  o["loser_casualty_ratio"] = c.loser_casualty_ratio;
  o["winner_casualty_ratio"] = c.winner_casualty_ratio;
  o["civilian_casualty_ratio"] = c.civilian_casualty_ratio;
  o["war_event_cooldown"] = static_cast<double>(c.war_event_cooldown);
  o["trade_event_cooldown"] = static_cast<double>(c.trade_event_cooldown);
  o["political_event_cooldown"] = static_cast<double>(c.political_event_cooldown);
  o["diplomatic_event_cooldown"] = static_cast<double>(c.diplomatic_event_cooldown);
  o["encounter_event_cooldown"] = static_cast<double>(c.encounter_event_cooldown);
  return json::stringify(o, 2);
}

} // namespace storyloom
