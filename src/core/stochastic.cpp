#include "storyloom/core/stochastic.h"

#include <numeric>

namespace storyloom {

SkillCheckResult evaluate_skill_check(int roll, const std::vector<int>& modifiers, int difficulty) {
  SkillCheckResult r;
  r.roll = roll;
  r.total = std::accumulate(modifiers.begin(), modifiers.end(), roll);
  r.success = r.total >= difficulty;
  r.critical = roll == 20;
  r.margin = r.total - difficulty;
  return r;
}

std::size_t weighted_pick(const std::vector<double>& weights, double u01) {
  if (weights.empty()) throw std::invalid_argument("weighted selection over an empty candidate list");

  double total = 0.0;
  for (double w : weights) {
    if (w > 0.0) total += w;
  }

  double remainder = u01 * total;
  for (std::size_t i = 0; i < weights.size(); ++i) {
    if (!(weights[i] > 0.0)) continue;
    remainder -= weights[i];
    if (remainder <= 0.0) return i;
  }
  return weights.size() - 1;
}

bool is_interaction_available(const Interaction& interaction, std::int64_t current_turn) {
  if (interaction.repeatable || interaction.last_used == kNever) return true;
  return current_turn - interaction.last_used >= interaction.cooldown;
}

bool meets_requirements(const Interaction& interaction, const Character& ch) {
  for (const auto& req : interaction.requirements) {
    if (ch.attributes.get(req.ability) < req.min_value) return false;
  }
  return true;
}

} // namespace storyloom
