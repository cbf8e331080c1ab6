#include "storyloom/core/enum_strings.h"

namespace storyloom {

std::string ability_to_string(Ability v) {
  switch (v) {
    case Ability::Strength: return "strength";
    case Ability::Dexterity: return "dexterity";
    case Ability::Constitution: return "constitution";
    case Ability::Intelligence: return "intelligence";
    case Ability::Wisdom: return "wisdom";
    case Ability::Charisma: return "charisma";
  }
  return "charisma";
}

Ability ability_from_string(const std::string& s) {
  if (s == "strength") return Ability::Strength;
  if (s == "dexterity") return Ability::Dexterity;
  if (s == "constitution") return Ability::Constitution;
  if (s == "intelligence") return Ability::Intelligence;
  if (s == "wisdom") return Ability::Wisdom;
  if (s == "charisma") return Ability::Charisma;
  return Ability::Charisma;
}

std::string interaction_type_to_string(InteractionType v) {
  switch (v) {
    case InteractionType::Dialogue: return "dialogue";
    case InteractionType::Action: return "action";
    case InteractionType::Trade: return "trade";
    case InteractionType::Combat: return "combat";
    case InteractionType::Encounter: return "encounter";
    case InteractionType::Event: return "event";
  }
  return "event";
}

InteractionType interaction_type_from_string(const std::string& s) {
  if (s == "dialogue") return InteractionType::Dialogue;
  if (s == "action") return InteractionType::Action;
  if (s == "trade") return InteractionType::Trade;
  if (s == "combat") return InteractionType::Combat;
  if (s == "encounter") return InteractionType::Encounter;
  if (s == "event") return InteractionType::Event;
  return InteractionType::Event;
}

std::string stat_to_string(Stat v) {
  switch (v) {
    case Stat::Energy: return "energy";
    case Stat::Health: return "health";
    case Stat::Mood: return "mood";
  }
  return "health";
}

Stat stat_from_string(const std::string& s) {
  if (s == "energy") return Stat::Energy;
  if (s == "health") return Stat::Health;
  if (s == "mood") return Stat::Mood;
  return Stat::Health;
}

std::string effect_kind_to_string(EffectKind v) {
  switch (v) {
    case EffectKind::Attribute: return "attribute";
    case EffectKind::Stat: return "stat";
    case EffectKind::Resource: return "resource";
    case EffectKind::Relationship: return "relationship";
  }
  return "resource";
}

EffectKind effect_kind_from_string(const std::string& s) {
  if (s == "attribute") return EffectKind::Attribute;
  if (s == "stat") return EffectKind::Stat;
  if (s == "resource") return EffectKind::Resource;
  if (s == "relationship") return EffectKind::Relationship;
  return EffectKind::Resource;
}

std::string historical_event_type_to_string(HistoricalEventType v) {
  switch (v) {
    case HistoricalEventType::WarDeclared: return "war_declared";
    case HistoricalEventType::BattleResolved: return "battle_resolved";
    case HistoricalEventType::WarEnded: return "war_ended";
    case HistoricalEventType::EncounterTriggered: return "encounter_triggered";
    case HistoricalEventType::EncounterCompleted: return "encounter_completed";
    case HistoricalEventType::EncounterEnded: return "encounter_ended";
    case HistoricalEventType::TradeResolved: return "trade_resolved";
    case HistoricalEventType::MarketCrash: return "market_crash";
    case HistoricalEventType::PoliticalShift: return "political_shift";
    case HistoricalEventType::DiplomaticShift: return "diplomatic_shift";
  }
  return "trade_resolved";
}

HistoricalEventType historical_event_type_from_string(const std::string& s) {
  if (s == "war_declared") return HistoricalEventType::WarDeclared;
  if (s == "battle_resolved") return HistoricalEventType::BattleResolved;
  if (s == "war_ended") return HistoricalEventType::WarEnded;
  if (s == "encounter_triggered") return HistoricalEventType::EncounterTriggered;
  if (s == "encounter_completed") return HistoricalEventType::EncounterCompleted;
  if (s == "encounter_ended") return HistoricalEventType::EncounterEnded;
  if (s == "trade_resolved") return HistoricalEventType::TradeResolved;
  if (s == "market_crash") return HistoricalEventType::MarketCrash;
  if (s == "political_shift") return HistoricalEventType::PoliticalShift;
  if (s == "diplomatic_shift") return HistoricalEventType::DiplomaticShift;
  return HistoricalEventType::TradeResolved;
}

std::string war_phase_to_string(WarPhase v) {
  switch (v) {
    case WarPhase::Declared: return "declared";
    case WarPhase::Active: return "active";
    case WarPhase::Resolution: return "resolution";
    case WarPhase::Concluded: return "concluded";
  }
  return "declared";
}

WarPhase war_phase_from_string(const std::string& s) {
  if (s == "declared") return WarPhase::Declared;
  if (s == "active") return WarPhase::Active;
  if (s == "resolution") return WarPhase::Resolution;
  if (s == "concluded") return WarPhase::Concluded;
  return WarPhase::Declared;
}

std::string war_victor_to_string(WarVictor v) {
  switch (v) {
    case WarVictor::Undecided: return "undecided";
    case WarVictor::Attackers: return "attackers";
    case WarVictor::Defenders: return "defenders";
    case WarVictor::Stalemate: return "stalemate";
  }
  return "undecided";
}

WarVictor war_victor_from_string(const std::string& s) {
  if (s == "undecided") return WarVictor::Undecided;
  if (s == "attackers") return WarVictor::Attackers;
  if (s == "defenders") return WarVictor::Defenders;
  if (s == "stalemate") return WarVictor::Stalemate;
  return WarVictor::Undecided;
}

std::string tactics_to_string(Tactics v) {
  switch (v) {
    case Tactics::Brilliant: return "brilliant";
    case Tactics::Competent: return "competent";
    case Tactics::Poor: return "poor";
  }
  return "poor";
}

std::string unit_type_to_string(UnitType v) {
  switch (v) {
    case UnitType::Infantry: return "infantry";
    case UnitType::Cavalry: return "cavalry";
    case UnitType::Archers: return "archers";
    case UnitType::Other: return "other";
  }
  return "other";
}

UnitType unit_type_from_string(const std::string& s) {
  if (s == "infantry") return UnitType::Infantry;
  if (s == "cavalry") return UnitType::Cavalry;
  if (s == "archers") return UnitType::Archers;
  if (s == "other") return UnitType::Other;
  return UnitType::Other;
}

std::string terrain_to_string(Terrain v) {
  switch (v) {
    case Terrain::Plains: return "plains";
    case Terrain::Forest: return "forest";
    case Terrain::Mountains: return "mountains";
    case Terrain::River: return "river";
    case Terrain::Other: return "other";
  }
  return "other";
}

Terrain terrain_from_string(const std::string& s) {
  if (s == "plains") return Terrain::Plains;
  if (s == "forest") return Terrain::Forest;
  if (s == "mountains") return Terrain::Mountains;
  if (s == "river") return Terrain::River;
  if (s == "other") return Terrain::Other;
  return Terrain::Other;
}

std::string sequencing_to_string(Sequencing v) {
  switch (v) {
    case Sequencing::Sequential: return "sequential";
    case Sequencing::Simultaneous: return "simultaneous";
  }
  return "simultaneous";
}

Sequencing sequencing_from_string(const std::string& s) {
  if (s == "sequential") return Sequencing::Sequential;
  if (s == "simultaneous") return Sequencing::Simultaneous;
  return Sequencing::Simultaneous;
}

std::string encounter_difficulty_to_string(EncounterDifficulty v) {
  switch (v) {
    case EncounterDifficulty::Trivial: return "trivial";
    case EncounterDifficulty::Easy: return "easy";
    case EncounterDifficulty::Medium: return "medium";
    case EncounterDifficulty::Hard: return "hard";
    case EncounterDifficulty::Deadly: return "deadly";
  }
  return "medium";
}

EncounterDifficulty encounter_difficulty_from_string(const std::string& s) {
  if (s == "trivial") return EncounterDifficulty::Trivial;
  if (s == "easy") return EncounterDifficulty::Easy;
  if (s == "medium") return EncounterDifficulty::Medium;
  if (s == "hard") return EncounterDifficulty::Hard;
  if (s == "deadly") return EncounterDifficulty::Deadly;
  return EncounterDifficulty::Medium;
}

std::string encounter_status_to_string(EncounterStatus v) {
  switch (v) {
    case EncounterStatus::Active: return "active";
    case EncounterStatus::Completed: return "completed";
    case EncounterStatus::Ended: return "ended";
  }
  return "ended";
}

EncounterStatus encounter_status_from_string(const std::string& s) {
  if (s == "active") return EncounterStatus::Active;
  if (s == "completed") return EncounterStatus::Completed;
  if (s == "ended") return EncounterStatus::Ended;
  return EncounterStatus::Ended;
}

} // namespace storyloom
