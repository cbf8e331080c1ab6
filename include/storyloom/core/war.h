#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "storyloom/core/ids.h"
#include "storyloom/core/stochastic.h"

namespace storyloom {

// declared -> active -> resolution -> concluded, never skipping a phase.
enum class WarPhase { Declared, Active, Resolution, Concluded };

enum class WarVictor { Undecided, Attackers, Defenders, Stalemate };

enum class BattleSide { Attacker, Defender };

enum class Tactics { Brilliant, Competent, Poor };

enum class UnitType { Infantry, Cavalry, Archers, Other };

enum class Terrain { Plains, Forest, Mountains, River, Other };

// --- war goals ---

// The node must be controlled by an attacking faction.
struct TerritoryGoal {
  std::string node_id;
};

// Attacking factions must jointly stockpile at least `amount`.
struct ResourceGoal {
  std::string resource;
  double amount{0.0};
};

// The target faction's stability must fall to `max_stability` or lower.
struct PoliticalGoal {
  std::string faction_id;
  double max_stability{0.0};
};

using WarGoal = std::variant<TerritoryGoal, ResourceGoal, PoliticalGoal>;

// --- forces ---

struct Unit {
  double quantity{0.0};
  double quality{1.0};
  double equipment{0.0};
  double training{0.0};
  double collective_frequency{7.0};
};

struct Commander {
  std::string name;
  double charisma{10.0};
  double wisdom{10.0};
  double frequency{7.0};
  int war_skill{0};
};

struct Force {
  std::string faction_id;
  UnitType unit_type{UnitType::Infantry};
  std::vector<Unit> units;
  Commander commander;

  // Morale inputs, each roughly 0..1 except collective_frequency.
  double training{0.0};
  double equipment{0.0};
  double supplies{0.0};
  double collective_frequency{7.0};
  double veteran_ratio{0.0};

  // Defender preparation level; ignored for the attacker.
  double preparation{0.0};

  // Head count used for casualties. Zero means "sum of unit quantities".
  double total_strength{0.0};
};

struct BattleLocation {
  std::string node_id;
  Terrain terrain{Terrain::Plains};
  bool population_center{false};
  double population{0.0};
};

// --- battle record ---

struct LeadershipResult {
  SkillCheckResult check;
  Tactics tactics{Tactics::Competent};
  double inspirational_bonus{0.0};
};

struct BattleRound {
  int number{0};
  // Damage dealt by each side this round.
  double attacker_damage{0.0};
  double defender_damage{0.0};
  // Remaining hit points after the round.
  double attacker_hp{0.0};
  double defender_hp{0.0};
  bool attacker_morale_break{false};
  bool defender_morale_break{false};
};

struct Casualties {
  double military{0.0};
  double civilian{0.0};
};

struct BattleOutcome {
  BattleSide victor{BattleSide::Defender};
  bool decisive{false};
  double margin{0.0};
};

struct Battle {
  Id id{kInvalidId};
  Id war_id{kInvalidId};
  std::int64_t time{0};

  BattleLocation location;
  std::string attacker_faction;
  std::string defender_faction;

  double attacker_strength{0.0};
  double defender_strength{0.0};
  LeadershipResult attacker_leadership;
  LeadershipResult defender_leadership;
  double attacker_morale{0.0};
  double defender_morale{0.0};
  double terrain_bonus{0.0};
  double preparation_bonus{0.0};

  std::vector<BattleRound> rounds;
  BattleOutcome outcome;

  Casualties attacker_casualties;
  Casualties defender_casualties;

  // Consciousness consequences.
  double victor_frequency_shift{0.0};
  double loser_frequency_shift{0.0};
  double location_impact{0.0};
};

// --- war ---

struct WarSide {
  std::vector<std::string> factions;
  double exhaustion{0.0};
  Casualties casualties;
};

struct War {
  Id id{kInvalidId};
  std::string cause;
  std::vector<WarGoal> goals;

  WarSide attackers;
  WarSide defenders;

  WarPhase phase{WarPhase::Declared};

  // Positive favours the attackers. Clamped to [-100, 100].
  double momentum{0.0};

  std::int64_t declared_at{0};
  std::int64_t ended_at{kNever};
  WarVictor victor{WarVictor::Undecided};

  std::vector<Battle> battles;

  bool involves(const std::string& faction_id) const;
};

} // namespace storyloom
