#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "storyloom/core/entities.h"
#include "storyloom/core/ids.h"
#include "storyloom/core/stochastic.h"

namespace storyloom {

// --- triggers (any one satisfied is enough) ---

struct TimeTrigger {
  std::int64_t turn{0};  // fires at or after this turn
};

struct LocationTrigger {
  std::string node_id;
};

struct InteractionTrigger {
  std::string interaction_id;  // matched against the character's last interaction
};

struct ConditionTrigger {
  StatCondition condition;
};

struct ProbabilityTrigger {
  double probability{0.0};
};

using Trigger = std::variant<TimeTrigger, LocationTrigger, InteractionTrigger, ConditionTrigger, ProbabilityTrigger>;

// --- prerequisites (all must hold) ---

struct AttributePrerequisite {
  Ability ability{Ability::Strength};
  double min_value{0.0};
};

struct SkillPrerequisite {
  std::string skill;
  double min_value{0.0};
};

struct LevelPrerequisite {
  int min_level{1};
};

struct QuestPrerequisite {
  std::string quest_id;
  std::string status;
};

struct ItemPrerequisite {
  std::string item_id;
};

using Prerequisite =
    std::variant<AttributePrerequisite, SkillPrerequisite, LevelPrerequisite, QuestPrerequisite, ItemPrerequisite>;

enum class Sequencing { Sequential, Simultaneous };

enum class EncounterDifficulty { Trivial, Easy, Medium, Hard, Deadly };

int difficulty_class(EncounterDifficulty d);

struct EncounterOutcome {
  std::string id;
  std::string description;
  double probability{1.0};
  std::optional<StatCondition> condition;
  std::vector<Effect> effects;
};

struct EncounterDef {
  std::string id;
  std::string name;
  EncounterDifficulty difficulty{EncounterDifficulty::Medium};

  // Turns an instance stays active before its outcome is resolved.
  int duration{1};
  Sequencing sequencing{Sequencing::Simultaneous};

  std::vector<Trigger> triggers;
  std::vector<Prerequisite> prerequisites;
  std::vector<std::string> node_restrictions;
  std::vector<EncounterOutcome> outcomes;

  int cooldown{0};
  std::int64_t last_triggered{kNever};
  int times_triggered{0};
};

enum class EncounterStatus { Active, Completed, Ended };

struct ParticipantAction {
  std::string participant_id;
  std::string branch_id;
  SkillCheckResult check;
  // Bonus from participants who already succeeded earlier this turn
  // (sequential mode only).
  int assist_bonus{0};
};

struct EncounterTurn {
  int turn{0};
  std::vector<ParticipantAction> actions;
};

struct EncounterInstance {
  Id id{kInvalidId};
  std::string encounter_id;
  EncounterStatus status{EncounterStatus::Active};

  std::int64_t started_at{0};
  std::int64_t ended_at{kNever};
  int elapsed_turns{0};
  int max_turns{1};

  std::vector<std::string> participants;
  std::vector<EncounterTurn> turns;

  // Generated from the definition when triggered.
  Interaction base_interaction;

  std::optional<std::string> outcome_id;
  std::string end_reason;
};

// What the trigger gates look at.
struct EncounterContext {
  std::int64_t current_turn{0};
  std::string node_id;
  const Character* character{nullptr};
  std::string last_interaction_id;
};

} // namespace storyloom
