#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "storyloom/core/ids.h"

namespace storyloom {

constexpr double kMinAttribute = 3.0;
constexpr double kMaxAttribute = 20.0;
constexpr double kMinScore = 0.0;
constexpr double kMaxScore = 100.0;

enum class Ability { Strength, Dexterity, Constitution, Intelligence, Wisdom, Charisma };

struct Attributes {
  double strength{10.0};
  double dexterity{10.0};
  double constitution{10.0};
  double intelligence{10.0};
  double wisdom{10.0};
  double charisma{10.0};

  double get(Ability a) const;
  void set(Ability a, double v);
};

// d20-style modifier: floor((score - 10) / 2).
int ability_modifier(double score);

enum class InteractionType { Dialogue, Action, Trade, Combat, Encounter, Event };

// Stats that conditions and effects can address.
enum class Stat { Energy, Health, Mood };

// Holds when the character's stat is at or below `max_value`.
struct StatCondition {
  Stat stat{Stat::Health};
  double max_value{0.0};
};

enum class EffectKind {
  Attribute,    // target = ability name, applied to the acting character(s)
  Stat,         // target = stat name, applied to the acting character(s)
  Resource,     // target = resource name in the world pool
  Relationship, // target = faction id, opinion change toward it
};

struct Effect {
  EffectKind kind{EffectKind::Resource};
  std::string target;
  double value{0.0};
};

struct Requirement {
  Ability ability{Ability::Strength};
  double min_value{0.0};
};

struct Branch {
  std::string id;
  std::string text;
  double weight{1.0};
  std::optional<StatCondition> condition;
  std::vector<Effect> effects;

  // Skill check made when the branch is taken.
  Ability check_ability{Ability::Charisma};
  int difficulty{10};
};

struct Interaction {
  std::string id;
  std::string name;
  InteractionType type{InteractionType::Dialogue};
  std::vector<Requirement> requirements;
  std::vector<Branch> branches;

  int cooldown{0};
  bool repeatable{false};

  // Turn of the last successful use, kNever if never used. The only field
  // the turn engine mutates.
  std::int64_t last_used{kNever};
};

struct Character {
  std::string id;
  std::string name;
  std::string node_id;
  std::string faction_id;

  int level{1};
  Attributes attributes;
  std::unordered_map<std::string, double> skills;

  double energy{100.0};
  double health{100.0};
  double mood{50.0};

  // Numeric modifiers for pacing and resolution weight.
  double frequency{7.0};
  double coherence{0.0};

  std::optional<InteractionType> last_interaction_type;
  std::string last_interaction_id;

  // quest id -> status ("active", "completed", ...)
  std::unordered_map<std::string, std::string> quests;
  std::vector<std::string> items;

  double stat(Stat s) const;
  void set_stat(Stat s, double v);
};

bool condition_holds(const StatCondition& c, const Character& ch);

// Mean of the INT and WIS modifiers plus 10.
double energy_proxy(const Character& ch);

struct Node {
  std::string id;
  std::string name;
  std::string type;
  std::vector<std::string> interaction_ids;

  std::string terrain;
  std::string controller_faction;
  bool population_center{false};
  double population{0.0};
};

struct Relation {
  double opinion{0.0};
  double trust{50.0};
};

struct Faction {
  std::string id;
  std::string name;

  double military_strength{0.0};
  double economy{100.0};
  double stability{50.0};
  double collective_frequency{7.0};

  std::unordered_map<std::string, double> stockpile;
  std::unordered_map<std::string, Relation> relations;
};

// --- historical event stream ---

enum class HistoricalEventType {
  WarDeclared,
  BattleResolved,
  WarEnded,
  EncounterTriggered,
  EncounterCompleted,
  EncounterEnded,
  TradeResolved,
  MarketCrash,
  PoliticalShift,
  DiplomaticShift,
};

struct HistoricalEvent {
  // Monotonic sequence number, assigned when recorded.
  std::uint64_t seq{0};

  // World time (turn) at which the event happened.
  std::int64_t time{0};

  HistoricalEventType type{HistoricalEventType::TradeResolved};

  // Signed effect on collective consciousness, after scaling.
  double consciousness_impact{0.0};

  std::string subject;
  std::string message;
};

// One resolved character interaction.
struct InteractionLogEntry {
  std::int64_t time{0};
  std::string character_id;
  std::string interaction_id;
  std::string branch_id;
  bool positive{false};
  int roll{0};
  int total{0};
  int difficulty{0};
};

} // namespace storyloom
