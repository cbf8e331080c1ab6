#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

#include "storyloom/core/entities.h"
#include "storyloom/util/hash_rng.h"

namespace storyloom {

struct SkillCheckResult {
  int roll{0};
  int total{0};
  bool success{false};
  // A natural 20. Independent of success.
  bool critical{false};
  int margin{0};
};

SkillCheckResult evaluate_skill_check(int roll, const std::vector<int>& modifiers, int difficulty);

// Index chosen for the uniform draw `u01` in [0,1).
//
// Walks the candidates in order subtracting weights from u01 * total and
// returns the first index at which the remainder drops to <= 0. Non-positive
// weights are never chosen by the walk; if nothing triggers (float drift, or
// every weight is zero) the last index is returned. Throws on empty input.
std::size_t weighted_pick(const std::vector<double>& weights, double u01);

// Shared probabilistic primitive for combat, trade and dialogue branches.
// Holds no state of its own; every draw comes from the injected generator.
class StochasticResolver {
 public:
  explicit StochasticResolver(util::HashRng& rng) : rng_(rng) {}

  template <typename T, typename WeightFn>
  std::size_t weighted_index(const std::vector<T>& candidates, WeightFn&& weight) {
    if (candidates.empty()) throw std::invalid_argument("weighted selection over an empty candidate list");
    std::vector<double> weights;
    weights.reserve(candidates.size());
    for (const auto& c : candidates) weights.push_back(static_cast<double>(weight(c)));
    return weighted_pick(weights, rng_.next_u01());
  }

  template <typename T, typename WeightFn>
  const T& weighted_select(const std::vector<T>& candidates, WeightFn&& weight) {
    return candidates[weighted_index(candidates, std::forward<WeightFn>(weight))];
  }

  int roll_d20() { return rng_.range_int(1, 20); }

  SkillCheckResult skill_check(const std::vector<int>& modifiers, int difficulty) {
    return evaluate_skill_check(roll_d20(), modifiers, difficulty);
  }

  // True with probability p.
  bool chance(double p) { return rng_.next_u01() < p; }

  double uniform() { return rng_.next_u01(); }

  util::HashRng& rng() { return rng_; }

 private:
  util::HashRng& rng_;
};

// Usable when repeatable, never used, or the cooldown has elapsed.
bool is_interaction_available(const Interaction& interaction, std::int64_t current_turn);

bool meets_requirements(const Interaction& interaction, const Character& ch);

} // namespace storyloom
