#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "storyloom/core/complex_events.h"
#include "storyloom/core/conflict_engine.h"
#include "storyloom/core/encounter_lifecycle.h"
#include "storyloom/core/persistence.h"
#include "storyloom/core/sim_config.h"
#include "storyloom/core/stochastic.h"
#include "storyloom/core/world_state.h"
#include "storyloom/util/hash_rng.h"

namespace storyloom {

// idle -> initialized -> running -> (stop) initialized, (reset) idle.
enum class SchedulerState { Idle, Initialized, Running };

// Manual: the caller drives turns with step(). Automatic: an external
// periodic timer calls on_timer(). Exactly one mode is active while running.
enum class RunMode { Manual, Automatic };

struct CharacterAction {
  std::string character_id;
  std::string character_name;
  std::string interaction_id;
  std::optional<InteractionType> interaction_type;
};

struct ResourceDelta {
  std::string resource;
  double before{0.0};
  double after{0.0};
  double delta{0.0};
};

struct TurnSummary {
  // World time after the turn committed.
  std::int64_t turn{0};
  std::int64_t timestamp_ms{0};
  std::int64_t processing_ms{0};
  std::vector<CharacterAction> character_actions;
  std::vector<ResourceDelta> resource_changes;
  std::string digest;
};

// Milliseconds since an arbitrary epoch.
using Clock = std::function<std::int64_t()>;

// Turn engine for one world. Each turn runs on a copy of the committed
// WorldState; the copy replaces it only if it passes validation, so a failed
// turn leaves no trace besides the log.
//
// Single threaded. Callbacks run after the commit; exceptions they throw are
// logged and do not affect the turn.
class TickScheduler {
 public:
  using TurnCallback = std::function<void(const WorldState&)>;
  using SummaryCallback = std::function<void(const TurnSummary&)>;
  using EventCallback = std::function<void(const HistoricalEvent&)>;

  // A null persistence port keeps everything in memory. An empty clock uses
  // the system clock.
  TickScheduler(SimConfig cfg, util::HashRng rng, std::shared_ptr<PersistencePort> persistence = nullptr,
                Clock clock = {});

  TickScheduler(const TickScheduler&) = delete;
  TickScheduler& operator=(const TickScheduler&) = delete;

  // Loads an authored world. Throws ConfigurationError if it does not
  // validate, std::logic_error while running. On error nothing changes.
  void initialize(const WorldConfig& world);

  // Loads the persisted snapshot, if any. Returns false when there is no
  // usable saved state (missing, malformed or failing validation).
  bool restore();

  // Throws std::logic_error when already running or no world is loaded.
  void start(RunMode mode = RunMode::Manual);

  // Prevents further turns. A turn in progress always completes.
  void stop();

  // Drops the world, queue and history and returns to idle.
  void reset();

  // Runs one turn in manual mode. Throws std::logic_error when not running
  // in manual mode, and StepError when the turn is rejected.
  const WorldState& step();

  // Timer entry point for automatic mode. Returns true if a turn committed.
  // A no-op when not running automatically or when a turn is in flight.
  bool on_timer();

  // Queues a complex event for a later turn.
  void enqueue(ComplexEvent event);

  void set_on_turn(TurnCallback cb) { on_turn_ = std::move(cb); }
  void set_on_summary(SummaryCallback cb) { on_summary_ = std::move(cb); }
  void set_on_event(EventCallback cb) { on_event_ = std::move(cb); }

  SchedulerState state() const { return state_; }
  RunMode mode() const { return mode_; }
  bool is_running() const { return state_ == SchedulerState::Running; }
  bool turn_in_flight() const { return in_flight_; }

  const SimConfig& cfg() const { return cfg_; }
  const WorldState& world() const { return world_; }
  const std::deque<TurnSummary>& turn_history() const { return history_; }
  std::size_t pending_events() const { return pending_.size(); }

  // Engines, for callers that drive wars or encounters directly between turns.
  ConflictEngine& conflict() { return conflict_; }
  EncounterLifecycle& encounters() { return encounters_; }

 private:
  void run_turn();
  // `failed_event` is set to the batch index of an event whose dispatch threw.
  void advance(WorldState& w, const std::vector<ComplexEvent>& batch, std::optional<std::size_t>& failed_event);
  // Puts a rejected turn's events back at the head of the queue, minus the
  // one that failed.
  void requeue(std::vector<ComplexEvent> batch, std::optional<std::size_t> failed);
  void update_character(WorldState& w, Character& c);
  void dispatch(WorldState& w, const ComplexEvent& e);
  std::vector<ComplexEvent> take_batch();
  int cooldown_for(const ComplexEvent& e) const;
  double tick_delay(const WorldState& w) const;

  TurnSummary summarize(const WorldState& before, const WorldState& after, std::int64_t started_ms) const;
  void persist();
  void notify(const TurnSummary& summary);
  std::int64_t now_ms() const;

  SimConfig cfg_;
  util::HashRng rng_;
  StochasticResolver resolver_;
  ConflictEngine conflict_;
  EncounterLifecycle encounters_;
  std::shared_ptr<PersistencePort> persistence_;
  Clock clock_;

  SchedulerState state_{SchedulerState::Idle};
  RunMode mode_{RunMode::Manual};
  bool in_flight_{false};

  WorldState world_;
  std::deque<ComplexEvent> pending_;
  std::deque<TurnSummary> history_;
  std::uint64_t last_notified_seq_{0};

  TurnCallback on_turn_;
  SummaryCallback on_summary_;
  EventCallback on_event_;
};

// 100 + mean coherence * 900 ms, clamped to [100, 1000] with the default
// configuration.
double compute_tick_delay(const SimConfig& cfg, const std::vector<Character>& characters);

// Selection weight of an interaction for a character.
double interaction_weight(const Character& c);

// "N character(s) took action, M resource(s) changed" or
// "No significant changes occurred".
std::string turn_digest(std::size_t actions, std::size_t resource_changes);

} // namespace storyloom
