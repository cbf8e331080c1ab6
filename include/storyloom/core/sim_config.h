#pragma once

#include <cstddef>

namespace storyloom {

struct SimConfig {
  // Turn summaries kept in memory; oldest evicted first.
  std::size_t max_turn_history{100};

  // Complex events drained from the queue per turn.
  std::size_t max_concurrent_events{10};

  // Historical events retained in the world state.
  std::size_t max_historical_events{1000};

  // Finished encounter instances retained in the world state.
  std::size_t max_encounter_history{200};

  // Interaction log entries retained in the world state.
  std::size_t max_interaction_log{500};

  // Per-turn decay of character scores (subtracted, then clamped to 0..100).
  double energy_decay_per_turn{1.0};
  double health_decay_per_turn{0.0};
  double mood_decay_per_turn{0.0};

  // Passive attribute drift per tick, multiplied by coherence.
  double passive_evolution_rate{0.01};

  // Attribute gain on a successful interaction, scaled by (1 + coherence / 2).
  double interaction_learning_rate{0.1};

  // tickDelay = clamp(base + mean_coherence * per_coherence, min, max), in ms.
  double tick_delay_base_ms{100.0};
  double tick_delay_per_coherence_ms{900.0};
  double tick_delay_min_ms{100.0};
  double tick_delay_max_ms{1000.0};

  // --- conflict ---

  // A battle is decisive when the final-round damage margin exceeds this.
  double decisive_margin{50.0};

  // Chance that a side below the morale threshold breaks in a round.
  double morale_break_probability{0.2};
  double morale_break_threshold{0.3};

  int max_battle_rounds{10};

  // Stop the round loop on the first morale break instead of fighting on.
  bool end_battle_on_morale_break{false};

  double loser_casualty_ratio{0.4};
  double winner_casualty_ratio{0.2};
  double civilian_casualty_ratio{0.1};

  // --- complex events ---

  // Minimum turns between two events of the same kind and subject.
  int war_event_cooldown{100};
  int trade_event_cooldown{10};
  int political_event_cooldown{50};
  int diplomatic_event_cooldown{30};
  int encounter_event_cooldown{20};
};

} // namespace storyloom
