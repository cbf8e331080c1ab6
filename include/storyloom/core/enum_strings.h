#pragma once

#include <string>

#include "storyloom/core/encounter.h"
#include "storyloom/core/entities.h"
#include "storyloom/core/war.h"

namespace storyloom {

// String forms shared by saves, config files and log messages. The
// *_from_string functions fall back to a documented default on unknown input.

std::string ability_to_string(Ability a);
Ability ability_from_string(const std::string& s);  // default: Charisma

std::string interaction_type_to_string(InteractionType t);
InteractionType interaction_type_from_string(const std::string& s);  // default: Event

std::string stat_to_string(Stat s);
Stat stat_from_string(const std::string& s);  // default: Health

std::string effect_kind_to_string(EffectKind k);
EffectKind effect_kind_from_string(const std::string& s);  // default: Resource

std::string historical_event_type_to_string(HistoricalEventType t);
HistoricalEventType historical_event_type_from_string(const std::string& s);  // default: TradeResolved

std::string war_phase_to_string(WarPhase p);
WarPhase war_phase_from_string(const std::string& s);  // default: Declared

std::string war_victor_to_string(WarVictor v);
WarVictor war_victor_from_string(const std::string& s);  // default: Undecided

std::string tactics_to_string(Tactics t);

std::string unit_type_to_string(UnitType t);
UnitType unit_type_from_string(const std::string& s);  // default: Other

std::string terrain_to_string(Terrain t);
Terrain terrain_from_string(const std::string& s);  // default: Other

std::string sequencing_to_string(Sequencing s);
Sequencing sequencing_from_string(const std::string& s);  // default: Simultaneous

std::string encounter_difficulty_to_string(EncounterDifficulty d);
EncounterDifficulty encounter_difficulty_from_string(const std::string& s);  // default: Medium

std::string encounter_status_to_string(EncounterStatus s);
EncounterStatus encounter_status_from_string(const std::string& s);  // default: Ended

} // namespace storyloom
