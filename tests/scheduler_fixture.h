#pragma once

#include "storyloom/core/world_state.h"

namespace storyloom::test {

// One camp, one character, two factions. "forage" always succeeds
// (difficulty 1) and adds 5 grain; it then cools down for 5 turns.
inline WorldConfig make_camp_world() {
  WorldConfig cfg;
  cfg.name = "Camp";

  Interaction forage;
  forage.id = "forage";
  forage.name = "Forage";
  forage.type = InteractionType::Action;
  forage.cooldown = 5;
  forage.repeatable = false;
  Branch gather;
  gather.id = "gather";
  gather.weight = 1.0;
  gather.check_ability = Ability::Charisma;
  gather.difficulty = 1;
  gather.effects.push_back(Effect{EffectKind::Resource, "grain", 5.0});
  forage.branches.push_back(gather);
  cfg.interactions.push_back(forage);

  Node camp;
  camp.id = "camp";
  camp.name = "Camp";
  camp.type = "camp";
  camp.interaction_ids = {"forage"};
  cfg.nodes.push_back(camp);

  Faction f1;
  f1.id = "f1";
  f1.name = "Wardens";
  f1.military_strength = 100.0;
  Faction f2;
  f2.id = "f2";
  f2.name = "Reavers";
  f2.military_strength = 100.0;
  cfg.factions = {f1, f2};

  Character rook;
  rook.id = "rook";
  rook.name = "Rook";
  rook.node_id = "camp";
  rook.faction_id = "f1";
  cfg.characters.push_back(rook);

  EncounterDef wolves;
  wolves.id = "wolves";
  wolves.name = "Wolves at Night";
  wolves.duration = 2;
  EncounterOutcome chased;
  chased.id = "chased";
  chased.description = "The pack is chased off.";
  wolves.outcomes.push_back(chased);
  cfg.encounters.push_back(wolves);

  cfg.resources["grain"] = 100.0;
  return cfg;
}

} // namespace storyloom::test
