#include "kinetiq/kinetiq.hpp"

#include <utility>

namespace kinetiq {

const char* event_name(EventType t) {
  switch (t) {
    case EventType::Recommend:      return "Recommend";
    case EventType::TooHard:        return "TooHard";
    case EventType::TooEasy:        return "TooEasy";
    case EventType::InTarget:       return "InTarget";
    case EventType::WeightCapped:   return "WeightCapped";
    case EventType::ConfigRejected: return "ConfigRejected";
    case EventType::InputRejected:  return "InputRejected";
  }
  return "Unknown";
}

// --- shared core ---
static PolicyInput make_input(const ObservedSet& set, const ExerciseConfig& ex,
                              const EffectiveParams& params) {
  PolicyInput in{};
  in.set = set;
  in.rep_range = ex.rep_range;
  in.rpe_range = ex.target_rpe_range;
  in.reps_step = ex.reps_step;
  in.params = params;
  return in;
}

static Recommendation make_recommendation(const PolicyInput& in, const PolicyOutput& out,
                                          Unit unit) {
  Recommendation r{};
  r.action = out.action;
  r.next_set = out.next;
  r.unit = unit;
  r.band = out.band;
  r.params = in.params;
  r.explanation = explain(in, out);
  return r;
}

static EventType band_event(EffortBand b) {
  switch (b) {
    case EffortBand::TooHard: return EventType::TooHard;
    case EffortBand::TooEasy: return EventType::TooEasy;
    case EffortBand::InTarget: break;
  }
  return EventType::InTarget;
}

static Event observed_event(EventType type, const ObservedSet& set, const char* note) {
  Event e{};
  e.type = type;
  e.weight = set.weight;
  e.reps = set.reps;
  e.rpe = set.rpe;
  e.note = note;
  return e;
}

// --- Engine ---
Engine::Engine(EngineConfig cfg)
: cfg_(cfg) {
  tracer_.enable(cfg_.enable_tracing);
}

void Engine::set_event_hook(EventHook hook) {
  hook_ = std::move(hook);
}

void Engine::emit(const Event& e) const {
  if (!cfg_.enable_event_hooks) return;
  if (hook_) hook_(e);
}

Recommendation Engine::recommend(const ObservedSet& last_set,
                                 const ExerciseConfig& exercise,
                                 const Settings& settings) {
  std::string why;

  // Config first: a broken config is reported even when the set is fine.
  EffectiveParams params{};
  if (!resolve_params(exercise, settings, &params, &why)) {
    emit(observed_event(EventType::ConfigRejected, last_set, "config rejected"));
    throw ConfigError(why);
  }
  if (!validate_observed(last_set, &why)) {
    emit(observed_event(EventType::InputRejected, last_set, "observed set rejected"));
    throw InputError(why);
  }

  const PolicyInput in = make_input(last_set, exercise, params);
  const PolicyOutput out = decide(in);

  emit(observed_event(band_event(out.band), last_set, out.note));

  Event ev = observed_event(EventType::Recommend, last_set, out.note);
  ev.action = out.action;
  ev.next_weight = out.next.weight;
  ev.next_reps = out.next.reps;

  if (out.weight_capped) {
    Event cap = ev;
    cap.type = EventType::WeightCapped;
    cap.note = "weight step limited by max jump";
    emit(cap);
  }
  emit(ev);

  const std::uint64_t seq = seq_.fetch_add(1, std::memory_order_relaxed);
  if (tracer_.enabled()) {
    TraceEntry t{};
    t.seq = seq;
    t.exercise = exercise.name;
    t.unit = settings.unit;
    t.observed = last_set;
    t.band = out.band;
    t.action = out.action;
    t.next = out.next;
    t.increment = params.increment;
    t.max_jump = params.max_jump;
    t.note = out.note;
    tracer_.record(t);
  }

  return make_recommendation(in, out, settings.unit);
}

Recommendation Engine::recommend(const Request& req) {
  return recommend(req.last_set, req.exercise, req.settings);
}

// --- pure API ---
Recommendation recommend(const ObservedSet& last_set,
                         const ExerciseConfig& exercise,
                         const Settings& settings) {
  const EffectiveParams params = resolve_or_throw(exercise, settings);
  check_observed_or_throw(last_set);

  const PolicyInput in = make_input(last_set, exercise, params);
  return make_recommendation(in, decide(in), settings.unit);
}

Recommendation recommend(const Request& req) {
  return recommend(req.last_set, req.exercise, req.settings);
}

} // namespace kinetiq
