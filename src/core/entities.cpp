#include "storyloom/core/entities.h"

#include <cmath>

namespace storyloom {

double Attributes::get(Ability a) const {
  switch (a) {
    case Ability::Strength: return strength;
    case Ability::Dexterity: return dexterity;
    case Ability::Constitution: return constitution;
    case Ability::Intelligence: return intelligence;
    case Ability::Wisdom: return wisdom;
    case Ability::Charisma: return charisma;
  }
  return 0.0;
}

void Attributes::set(Ability a, double v) {
  switch (a) {
    case Ability::Strength: strength = v; break;
    case Ability::Dexterity: dexterity = v; break;
    case Ability::Constitution: constitution = v; break;
    case Ability::Intelligence: intelligence = v; break;
    case Ability::Wisdom: wisdom = v; break;
    case Ability::Charisma: charisma = v; break;
  }
}

int ability_modifier(double score) { return static_cast<int>(std::floor((score - 10.0) / 2.0)); }

double Character::stat(Stat s) const {
  switch (s) {
    case Stat::Energy: return energy;
    case Stat::Health: return health;
    case Stat::Mood: return mood;
  }
  return 0.0;
}

void Character::set_stat(Stat s, double v) {
  switch (s) {
    case Stat::Energy: energy = v; break;
    case Stat::Health: health = v; break;
    case Stat::Mood: mood = v; break;
  }
}

bool condition_holds(const StatCondition& c, const Character& ch) { return ch.stat(c.stat) <= c.max_value; }

double energy_proxy(const Character& ch) {
  const double intel = ability_modifier(ch.attributes.intelligence);
  const double wis = ability_modifier(ch.attributes.wisdom);
  return (intel + wis) / 2.0 + 10.0;
}

} // namespace storyloom
