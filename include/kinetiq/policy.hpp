#pragma once
#include "config.hpp"
#include "safety.hpp"
#include "types.hpp"

#include <string>

namespace kinetiq {

struct PolicyInput {
  ObservedSet set{};

  RepRange rep_range{};
  RpeRange rpe_range{};
  int reps_step = 1;

  // resolved increment / max jump / midpoint
  EffectiveParams params{};
};

struct PolicyOutput {
  EffortBand band = EffortBand::InTarget;
  Action action = Action::Stay;

  NextSet next{};

  // weight step was limited by max_jump rather than the increment
  bool weight_capped = false;

  const char* note = nullptr;
};

EffortBand classify(double rpe, const RpeRange& target);

// One transition step. Inputs are assumed validated (see safety.hpp).
PolicyOutput decide(const PolicyInput& in);

// One-line human readable reason for the decision.
std::string explain(const PolicyInput& in, const PolicyOutput& out);

} // namespace kinetiq
