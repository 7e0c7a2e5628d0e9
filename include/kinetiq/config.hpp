#pragma once
#include <optional>
#include <string>

#include "units.hpp"

namespace kinetiq {

// inclusive [min, max]
struct RepRange {
  int min = 5;
  int max = 8;
};

// inclusive [min, max], both in [1, 10]
struct RpeRange {
  double min = 7.0;
  double max = 9.0;

  double midpoint() const { return (min + max) / 2.0; }
};

struct ExerciseConfig {
  std::string name; // opaque, not used by the decision

  RepRange rep_range{};
  RpeRange target_rpe_range{};

  // expressed in the settings unit; fall back to Settings when absent
  std::optional<double> weight_increment_override;
  std::optional<double> max_jump_override;

  int reps_step = 1;
};

struct Settings {
  Unit unit = Unit::LB;

  // total-weight increments (not per side)
  double lb_increment = 2.5;
  double kg_increment = 1.25;

  // safety cap on a single weight change
  double max_jump_lb = 10.0;
  double max_jump_kg = 5.0;

  double default_increment() const { return unit == Unit::LB ? lb_increment : kg_increment; }
  double default_max_jump() const { return unit == Unit::LB ? max_jump_lb : max_jump_kg; }
};

struct EngineConfig {
  // hooks / debugging
  bool enable_event_hooks = true;

  // tracing
  bool enable_tracing = false;
};

} // namespace kinetiq
