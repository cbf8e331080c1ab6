#include "storyloom/core/scheduler.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <initializer_list>
#include <set>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

#include "storyloom/core/enum_strings.h"
#include "storyloom/core/errors.h"
#include "storyloom/core/state_validation.h"
#include "storyloom/util/log.h"

namespace storyloom {
namespace {

double clamp_score(double v) { return std::clamp(v, kMinScore, kMaxScore); }
double clamp_attribute(double v) { return std::clamp(v, kMinAttribute, kMaxAttribute); }

// Ability that drifts passively, chosen by the last interaction type.
Ability evolving_ability(const Character& c) {
  if (!c.last_interaction_type) return Ability::Wisdom;
  switch (*c.last_interaction_type) {
    case InteractionType::Dialogue: return Ability::Charisma;
    case InteractionType::Action: return Ability::Strength;
    case InteractionType::Trade: return Ability::Intelligence;
    default: return Ability::Wisdom;
  }
}

struct InFlightGuard {
  explicit InFlightGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~InFlightGuard() { flag_ = false; }
  InFlightGuard(const InFlightGuard&) = delete;
  InFlightGuard& operator=(const InFlightGuard&) = delete;

  bool& flag_;
};

enum class TradeSwing { Profit, Loss, Crash };

struct TradeOption {
  TradeSwing swing;
  double weight;
};

const std::vector<TradeOption>& trade_options() {
  static const std::vector<TradeOption> kOptions = {
      {TradeSwing::Profit, 0.475},
      {TradeSwing::Loss, 0.475},
      {TradeSwing::Crash, 0.05},
  };
  return kOptions;
}

Faction& require_faction(WorldState& w, const std::string& id) {
  Faction* f = find_by_id(w.factions, id);
  if (!f) throw std::invalid_argument("unknown faction: " + id);
  return *f;
}

void shift_stability(WorldState& w, const std::vector<std::string>& factions, double delta) {
  for (const auto& id : factions) {
    if (Faction* f = find_by_id(w.factions, id)) f->stability = clamp_score(f->stability + delta);
  }
}

std::string fmt(double v) {
  std::ostringstream ss;
  ss << v;
  return ss.str();
}

bool changed(double a, double b) { return std::fabs(a - b) > 5.0; }

} // namespace

double compute_tick_delay(const SimConfig& cfg, const std::vector<Character>& characters) {
  double mean = 0.0;
  if (!characters.empty()) {
    for (const auto& c : characters) mean += c.coherence;
    mean /= static_cast<double>(characters.size());
  }
  const double d = cfg.tick_delay_base_ms + mean * cfg.tick_delay_per_coherence_ms;
  return std::clamp(d, cfg.tick_delay_min_ms, cfg.tick_delay_max_ms);
}

double interaction_weight(const Character& c) {
  double resonance = 0.0;
  if (c.frequency > 0.0) {
    const double diff = energy_proxy(c) - c.frequency;
    resonance = std::exp(-(diff * diff) / (2.0 * c.frequency));
  }
  return resonance + c.coherence * 1.5;
}

std::string turn_digest(std::size_t actions, std::size_t resource_changes) {
  std::vector<std::string> parts;
  if (actions > 0) parts.push_back(std::to_string(actions) + " character(s) took action");
  if (resource_changes > 0) parts.push_back(std::to_string(resource_changes) + " resource(s) changed");
  if (parts.empty()) return "No significant changes occurred";

  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i) out += ", ";
    out += parts[i];
  }
  return out;
}

TickScheduler::TickScheduler(SimConfig cfg, util::HashRng rng, std::shared_ptr<PersistencePort> persistence,
                             Clock clock)
    : cfg_(std::move(cfg)),
      rng_(rng),
      resolver_(rng_),
      conflict_(cfg_, resolver_),
      encounters_(cfg_, resolver_),
      persistence_(std::move(persistence)),
      clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] {
      using namespace std::chrono;
      return static_cast<std::int64_t>(
          duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    };
  }
}

void TickScheduler::initialize(const WorldConfig& world) {
  if (state_ == SchedulerState::Running) throw std::logic_error("cannot initialize while running");

  auto problems = validate_world_config(world);
  if (!problems.empty()) {
    for (const auto& p : problems) log::error("World config: " + p);
    throw ConfigurationError(std::move(problems));
  }

  world_ = make_world_state(world);
  world_.tick_delay_ms = compute_tick_delay(cfg_, world_.characters);
  pending_.clear();
  history_.clear();
  last_notified_seq_ = world_.next_event_seq - 1;
  state_ = SchedulerState::Initialized;
  log::info("World '" + world_.name + "' initialized with " + std::to_string(world_.characters.size()) +
            " character(s) across " + std::to_string(world_.nodes.size()) + " node(s)");
}

bool TickScheduler::restore() {
  if (state_ == SchedulerState::Running) throw std::logic_error("cannot restore while running");
  if (!persistence_) return false;

  std::optional<WorldState> loaded = persistence_->load();
  if (!loaded) return false;

  const auto problems = validate_world_state(*loaded, cfg_);
  if (!problems.empty()) {
    log::warn("Saved state rejected (" + std::to_string(problems.size()) + " problem(s)), first: " +
              problems.front());
    return false;
  }

  world_ = std::move(*loaded);
  pending_.clear();
  history_.clear();
  last_notified_seq_ = world_.next_event_seq - 1;
  state_ = SchedulerState::Initialized;
  log::info("Restored world '" + world_.name + "' at turn " + std::to_string(world_.time));
  return true;
}

void TickScheduler::start(RunMode mode) {
  if (state_ == SchedulerState::Running) throw std::logic_error("scheduler is already running");
  if (state_ == SchedulerState::Idle) throw std::logic_error("no world loaded");
  mode_ = mode;
  state_ = SchedulerState::Running;
  log::info(std::string("Scheduler started (") + (mode == RunMode::Manual ? "manual" : "automatic") + ")");
}

void TickScheduler::stop() {
  if (state_ != SchedulerState::Running) return;
  state_ = SchedulerState::Initialized;
  log::info("Scheduler stopped at turn " + std::to_string(world_.time));
}

void TickScheduler::reset() {
  if (in_flight_) throw std::logic_error("cannot reset while a turn is in flight");
  state_ = SchedulerState::Idle;
  mode_ = RunMode::Manual;
  world_ = WorldState{};
  pending_.clear();
  history_.clear();
  last_notified_seq_ = 0;
}

const WorldState& TickScheduler::step() {
  if (state_ != SchedulerState::Running) throw std::logic_error("scheduler is not running");
  if (mode_ != RunMode::Manual) throw std::logic_error("step() requires manual mode");
  if (in_flight_) throw std::logic_error("a turn is already in flight");

  try {
    run_turn();
  } catch (const TurnExecutionError& e) {
    log::error(std::string("Turn rejected: ") + e.what());
    throw StepError(e);
  }
  return world_;
}

bool TickScheduler::on_timer() {
  if (state_ != SchedulerState::Running || mode_ != RunMode::Automatic) return false;
  if (in_flight_) {
    log::debug("Timer fired while a turn is in flight; skipped");
    return false;
  }

  try {
    run_turn();
  } catch (const TurnExecutionError& e) {
    log::error(std::string("Turn rejected: ") + e.what());
    return false;
  }
  return true;
}

void TickScheduler::enqueue(ComplexEvent event) { pending_.push_back(std::move(event)); }

std::vector<ComplexEvent> TickScheduler::take_batch() {
  std::vector<ComplexEvent> batch;
  while (!pending_.empty() && batch.size() < cfg_.max_concurrent_events) {
    batch.push_back(std::move(pending_.front()));
    pending_.pop_front();
  }
  std::stable_sort(batch.begin(), batch.end(), [](const ComplexEvent& a, const ComplexEvent& b) {
    return event_priority(a) > event_priority(b);
  });
  return batch;
}

void TickScheduler::run_turn() {
  InFlightGuard guard(in_flight_);
  const std::int64_t started = now_ms();
  const std::int64_t turn = world_.time + 1;

  WorldState next = world_;
  std::vector<ComplexEvent> batch = take_batch();
  std::optional<std::size_t> failed_event;

  try {
    advance(next, batch, failed_event);
  } catch (const std::exception& e) {
    requeue(std::move(batch), failed_event);
    throw TurnExecutionError(turn, e.what());
  }

  const auto problems = validate_turn_transition(world_, next, cfg_);
  if (!problems.empty()) {
    for (const auto& p : problems) log::error("Turn " + std::to_string(turn) + ": " + p);
    requeue(std::move(batch), std::nullopt);
    throw TurnExecutionError(turn, problems.front());
  }

  TurnSummary summary = summarize(world_, next, started);
  world_ = std::move(next);
  persist();

  history_.push_back(summary);
  while (history_.size() > cfg_.max_turn_history) history_.pop_front();

  log::debug("Turn " + std::to_string(world_.time) + ": " + summary.digest);
  notify(summary);
}

double TickScheduler::tick_delay(const WorldState& w) const { return compute_tick_delay(cfg_, w.characters); }

void TickScheduler::requeue(std::vector<ComplexEvent> batch, std::optional<std::size_t> failed) {
  if (failed && *failed < batch.size()) {
    log::warn(std::string("Dropping ") + event_kind_label(batch[*failed]) + " event that failed its turn");
    batch.erase(batch.begin() + static_cast<std::ptrdiff_t>(*failed));
  }
  if (batch.empty()) return;

  // Back to the front, keeping their order ahead of anything queued since.
  for (auto it = batch.rbegin(); it != batch.rend(); ++it) pending_.push_front(std::move(*it));
  log::info("Requeued " + std::to_string(batch.size()) + " event(s) of rejected turn");
}

void TickScheduler::advance(WorldState& w, const std::vector<ComplexEvent>& batch,
                            std::optional<std::size_t>& failed_event) {
  w.tick_delay_ms = tick_delay(w);

  for (auto& c : w.characters) update_character(w, c);

  encounters_.process_turn(w);
  conflict_.advance_wars(w);

  for (std::size_t i = 0; i < batch.size(); ++i) {
    try {
      dispatch(w, batch[i]);
    } catch (const std::exception&) {
      failed_event = i;
      throw;
    }
  }

  w.time += 1;
}

void TickScheduler::update_character(WorldState& w, Character& c) {
  c.energy = clamp_score(c.energy - cfg_.energy_decay_per_turn);
  c.health = clamp_score(c.health - cfg_.health_decay_per_turn);
  c.mood = clamp_score(c.mood - cfg_.mood_decay_per_turn);

  const Ability drift = evolving_ability(c);
  c.attributes.set(drift, clamp_attribute(c.attributes.get(drift) + cfg_.passive_evolution_rate * c.coherence));

  const Node* node = find_by_id(w.nodes, c.node_id);
  if (!node) return;

  struct Candidate {
    Interaction* interaction;
    std::vector<const Branch*> branches;
    double weight;
  };

  const double base_weight = interaction_weight(c);
  std::vector<Candidate> candidates;
  for (const auto& iid : node->interaction_ids) {
    Interaction* it = find_by_id(w.interactions, iid);
    if (!it || !is_interaction_available(*it, w.time) || !meets_requirements(*it, c)) continue;

    Candidate cand{it, {}, 0.0};
    double branch_weight = 0.0;
    for (const auto& b : it->branches) {
      if (b.condition && !condition_holds(*b.condition, c)) continue;
      cand.branches.push_back(&b);
      branch_weight += std::max(0.0, b.weight);
    }
    if (cand.branches.empty()) continue;
    cand.weight = base_weight * branch_weight;
    candidates.push_back(std::move(cand));
  }
  if (candidates.empty()) return;

  const Candidate& chosen = resolver_.weighted_select(candidates, [](const Candidate& x) { return x.weight; });
  const Branch& branch = *resolver_.weighted_select(chosen.branches, [](const Branch* b) { return b->weight; });

  const int mod = ability_modifier(c.attributes.get(branch.check_ability));
  const SkillCheckResult check = resolver_.skill_check({mod}, branch.difficulty);

  Interaction& interaction = *chosen.interaction;
  if (check.success) {
    interaction.last_used = w.time;
    apply_effects(w, {c.id}, branch.effects);
    const double gain = cfg_.interaction_learning_rate * (1.0 + c.coherence / 2.0);
    c.attributes.set(branch.check_ability, clamp_attribute(c.attributes.get(branch.check_ability) + gain));
  }

  c.last_interaction_type = interaction.type;
  c.last_interaction_id = interaction.id;

  InteractionLogEntry entry;
  entry.time = w.time;
  entry.character_id = c.id;
  entry.interaction_id = interaction.id;
  entry.branch_id = branch.id;
  entry.positive = check.success;
  entry.roll = check.roll;
  entry.total = check.total;
  entry.difficulty = branch.difficulty;
  w.interaction_log.push_back(std::move(entry));

  if (cfg_.max_interaction_log > 0 && w.interaction_log.size() > cfg_.max_interaction_log) {
    const auto excess = static_cast<std::ptrdiff_t>(w.interaction_log.size() - cfg_.max_interaction_log);
    w.interaction_log.erase(w.interaction_log.begin(), w.interaction_log.begin() + excess);
  }
}

int TickScheduler::cooldown_for(const ComplexEvent& e) const {
  return std::visit(
      [&](const auto& ev) -> int {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, WarDeclarationEvent>) {
          return cfg_.war_event_cooldown;
        } else if constexpr (std::is_same_v<T, TradeEvent>) {
          return cfg_.trade_event_cooldown;
        } else if constexpr (std::is_same_v<T, PoliticalEvent>) {
          return cfg_.political_event_cooldown;
        } else if constexpr (std::is_same_v<T, DiplomaticEvent>) {
          return cfg_.diplomatic_event_cooldown;
        } else if constexpr (std::is_same_v<T, EncounterEvent>) {
          return cfg_.encounter_event_cooldown;
        } else {
          return 0;
        }
      },
      e);
}

void TickScheduler::dispatch(WorldState& w, const ComplexEvent& e) {
  const std::string key = event_cooldown_key(e);
  if (!key.empty()) {
    auto it = w.event_cooldowns.find(key);
    if (it != w.event_cooldowns.end() && w.time - it->second < cooldown_for(e)) {
      log::debug("Skipping " + std::string(event_kind_label(e)) + " event '" + key + "' (cooling down)");
      return;
    }
  }

  const double collective = collective_consciousness(w);
  bool fired = true;

  std::visit(
      [&](const auto& ev) {
        using T = std::decay_t<decltype(ev)>;
        const double impact = scale_impact(ev.impact, collective);

        if constexpr (std::is_same_v<T, WarDeclarationEvent>) {
          conflict_.declare_war(w, ev.attackers, ev.defenders, ev.cause, ev.goals, impact);
          shift_stability(w, ev.attackers, impact);
          shift_stability(w, ev.defenders, impact);
        } else if constexpr (std::is_same_v<T, BattleEvent>) {
          conflict_.resolve_battle(w, ev.attacking, ev.defending, ev.location);
          shift_stability(w, {ev.attacking.faction_id, ev.defending.faction_id}, impact);
        } else if constexpr (std::is_same_v<T, TradeEvent>) {
          auto pool = w.resources.find(ev.resource);
          if (pool == w.resources.end()) throw std::invalid_argument("unknown resource: " + ev.resource);

          const double before = pool->second;
          const TradeSwing swing =
              resolver_.weighted_select(trade_options(), [](const TradeOption& o) { return o.weight; }).swing;
          switch (swing) {
            case TradeSwing::Profit: pool->second = before + std::max(0.0, ev.volume); break;
            case TradeSwing::Loss: pool->second = std::max(0.0, before - std::max(0.0, ev.volume)); break;
            case TradeSwing::Crash: pool->second = before * 0.5; break;
          }

          const std::string msg = ev.resource + " " + fmt(before) + " -> " + fmt(pool->second);
          if (swing == TradeSwing::Crash) {
            record_event(w, HistoricalEventType::MarketCrash, "trade:" + ev.resource, "Market crash: " + msg,
                         std::min(impact, scale_impact(-1.0, collective)), cfg_.max_historical_events);
            log::warn("Market crash on " + ev.resource);
          } else {
            record_event(w, HistoricalEventType::TradeResolved, "trade:" + ev.resource,
                         std::string(swing == TradeSwing::Profit ? "Profit: " : "Loss: ") + msg, impact,
                         cfg_.max_historical_events);
          }
        } else if constexpr (std::is_same_v<T, PoliticalEvent>) {
          Faction& f = require_faction(w, ev.faction_id);
          f.stability = clamp_score(f.stability + impact);
          record_event(w, HistoricalEventType::PoliticalShift, "faction:" + f.id,
                       ev.description.empty() ? f.name + " stability " + fmt(f.stability) : ev.description, impact,
                       cfg_.max_historical_events);
        } else if constexpr (std::is_same_v<T, DiplomaticEvent>) {
          if (ev.faction_a == ev.faction_b) throw std::invalid_argument("diplomatic event within one faction");
          Faction& a = require_faction(w, ev.faction_a);
          Faction& b = require_faction(w, ev.faction_b);
          for (auto [from, to] : {std::make_pair(&a, &b), std::make_pair(&b, &a)}) {
            Relation& r = from->relations[to->id];
            r.opinion = std::clamp(r.opinion + impact, -100.0, 100.0);
            r.trust = clamp_score(r.trust + impact / 2.0);
          }
          record_event(w, HistoricalEventType::DiplomaticShift, "diplomacy:" + a.id + "|" + b.id,
                       "Relations between " + a.name + " and " + b.name + " shifted by " + fmt(impact), impact,
                       cfg_.max_historical_events);
        } else if constexpr (std::is_same_v<T, EncounterEvent>) {
          const EncounterDef* def = find_by_id(w.encounters, ev.encounter_id);
          if (!def) throw std::invalid_argument("unknown encounter: " + ev.encounter_id);

          std::vector<std::string> participants = ev.participants;
          if (participants.empty()) {
            for (const auto& c : w.characters) {
              if (ev.node_id.empty() || c.node_id == ev.node_id) participants.push_back(c.id);
            }
          }

          EncounterContext ctx;
          ctx.current_turn = w.time;
          ctx.node_id = ev.node_id;
          if (!participants.empty()) {
            ctx.character = find_by_id(w.characters, participants.front());
            if (ctx.character) ctx.last_interaction_id = ctx.character->last_interaction_id;
          }

          if (!encounters_.can_trigger(*def, ctx)) {
            log::debug("Encounter '" + ev.encounter_id + "' not eligible this turn");
            fired = false;
            return;
          }
          encounters_.trigger_encounter(w, ev.encounter_id, std::move(participants));
        }
      },
      e);

  if (fired && !key.empty()) w.event_cooldowns[key] = w.time;
}

TurnSummary TickScheduler::summarize(const WorldState& before, const WorldState& after,
                                     std::int64_t started_ms) const {
  TurnSummary s;
  s.turn = after.time;

  for (const auto& c : after.characters) {
    const Character* prev = find_by_id(before.characters, c.id);
    bool acted = false;
    if (!prev) {
      acted = true;
    } else {
      acted = prev->last_interaction_id != c.last_interaction_id ||
              prev->last_interaction_type != c.last_interaction_type || changed(prev->energy, c.energy) ||
              changed(prev->health, c.health) || changed(prev->mood, c.mood);
    }
    if (!acted) continue;

    CharacterAction a;
    a.character_id = c.id;
    a.character_name = c.name;
    a.interaction_id = c.last_interaction_id;
    a.interaction_type = c.last_interaction_type;
    s.character_actions.push_back(std::move(a));
  }

  std::set<std::string> names;
  for (const auto& [k, v] : before.resources) names.insert(k);
  for (const auto& [k, v] : after.resources) names.insert(k);
  for (const auto& name : names) {
    auto b = before.resources.find(name);
    auto a = after.resources.find(name);
    const double bv = b == before.resources.end() ? 0.0 : b->second;
    const double av = a == after.resources.end() ? 0.0 : a->second;
    if (std::fabs(av - bv) <= 1e-9) continue;
    s.resource_changes.push_back(ResourceDelta{name, bv, av, av - bv});
  }

  s.digest = turn_digest(s.character_actions.size(), s.resource_changes.size());
  s.timestamp_ms = now_ms();
  s.processing_ms = std::max<std::int64_t>(0, s.timestamp_ms - started_ms);
  return s;
}

void TickScheduler::persist() {
  if (!persistence_) return;
  try {
    if (!persistence_->save(world_)) log::warn("Turn " + std::to_string(world_.time) + " was not persisted");
  } catch (const std::exception& e) {
    log::warn(std::string("Persistence failed: ") + e.what());
  }
}

void TickScheduler::notify(const TurnSummary& summary) {
  if (on_turn_) {
    try {
      on_turn_(world_);
    } catch (const std::exception& e) {
      log::warn(std::string("Turn listener threw: ") + e.what());
    }
  }
  if (on_summary_) {
    try {
      on_summary_(summary);
    } catch (const std::exception& e) {
      log::warn(std::string("Summary listener threw: ") + e.what());
    }
  }

  std::uint64_t newest = last_notified_seq_;
  for (const auto& ev : world_.events) {
    if (ev.seq <= last_notified_seq_) continue;
    newest = std::max(newest, ev.seq);
    if (!on_event_) continue;
    try {
      on_event_(ev);
    } catch (const std::exception& e) {
      log::warn(std::string("Event listener threw: ") + e.what());
    }
  }
  last_notified_seq_ = newest;
}

std::int64_t TickScheduler::now_ms() const { return clock_(); }

} // namespace storyloom
