#pragma once
#include "config.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "policy.hpp"
#include "presets.hpp"
#include "safety.hpp"
#include "tracer.hpp"
#include "types.hpp"
#include "units.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace kinetiq {

// Flat request as it arrives from a collaborator.
struct Request {
  ExerciseConfig exercise{};
  Settings settings{};
  ObservedSet last_set{};
};

struct Recommendation {
  Action action = Action::Stay;
  NextSet next_set{};

  Unit unit = Unit::LB;
  EffortBand band = EffortBand::InTarget;
  EffectiveParams params{};

  std::string explanation;
};

// Recommendation engine with optional observability sinks.
// recommend() keeps no decision state between calls and is safe to call from
// several threads once the hook is installed.
class Engine {
public:
  explicit Engine(EngineConfig cfg = EngineConfig{});

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  void set_event_hook(EventHook hook);

  // Throws ConfigError / InputError; never returns a partial result.
  Recommendation recommend(const ObservedSet& last_set,
                           const ExerciseConfig& exercise,
                           const Settings& settings);
  Recommendation recommend(const Request& req);

  // tracing access
  Tracer& tracer() { return tracer_; }
  const Tracer& tracer() const { return tracer_; }

  std::uint64_t decisions() const { return seq_.load(std::memory_order_relaxed); }

private:
  void emit(const Event& e) const;

  EngineConfig cfg_;
  EventHook hook_{};

  Tracer tracer_;
  std::atomic<std::uint64_t> seq_{0};
};

// Pure form: no hooks, no tracing.
Recommendation recommend(const ObservedSet& last_set,
                         const ExerciseConfig& exercise,
                         const Settings& settings);
Recommendation recommend(const Request& req);

} // namespace kinetiq
