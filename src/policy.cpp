#include "kinetiq/policy.hpp"

#include <algorithm>
#include <cstdio>

namespace kinetiq {

EffortBand classify(double rpe, const RpeRange& target) {
  if (rpe > target.max) return EffortBand::TooHard;
  if (rpe < target.min) return EffortBand::TooEasy;
  return EffortBand::InTarget;
}

// Weight-change actions share one step size and pin reps to the floor.
static void change_weight(const PolicyInput& in, PolicyOutput& out, double sign) {
  const double step = std::min(in.params.increment, in.params.max_jump);
  out.weight_capped = in.params.max_jump < in.params.increment;

  out.next.weight = in.set.weight + sign * step;
  if (out.next.weight < 0.0) out.next.weight = 0.0;
  out.next.reps = in.rep_range.min;
}

// min(rep_max, reps + step) without overflowing for large steps.
// reps < rep_max here, and rep_max - step cannot overflow (rep_max >= 0, step > 0).
static int add_reps_capped(const PolicyInput& in) {
  if (in.set.reps >= in.rep_range.max - in.reps_step) return in.rep_range.max;
  return in.set.reps + in.reps_step;
}

static void too_hard(const PolicyInput& in, PolicyOutput& out) {
  if (in.set.reps <= in.rep_range.min) {
    // already at the rep floor: only load can come down
    out.action = Action::LowerWeight;
    change_weight(in, out, -1.0);
    out.note = "Too hard at rep floor => lower weight";
    return;
  }

  out.action = Action::LowerReps;
  out.next.reps = std::max(in.rep_range.min, in.set.reps - in.reps_step);
  out.note = "Too hard above rep floor => lower reps";
}

static void too_easy(const PolicyInput& in, PolicyOutput& out) {
  if (in.set.reps >= in.rep_range.max) {
    out.action = Action::AddWeight;
    change_weight(in, out, +1.0);
    out.note = "Too easy at rep cap => add weight, reset reps";
    return;
  }

  out.action = Action::AddReps;
  out.next.reps = add_reps_capped(in);
  out.note = "Too easy below rep cap => add reps";
}

static void in_target(const PolicyInput& in, PolicyOutput& out) {
  if (in.set.reps < in.rep_range.max) {
    out.action = Action::AddReps;
    out.next.reps = add_reps_capped(in);
    out.note = "In target below rep cap => add reps";
    return;
  }

  // At the cap: manageable effort (<= midpoint, inclusive) earns more load.
  if (in.set.rpe <= in.params.midpoint) {
    out.action = Action::AddWeight;
    change_weight(in, out, +1.0);
    out.note = "In target at rep cap, manageable => add weight, reset reps";
    return;
  }

  out.action = Action::Stay;
  out.note = "In target at rep cap, hard side => repeat";
}

PolicyOutput decide(const PolicyInput& in) {
  PolicyOutput out{};
  out.band = classify(in.set.rpe, in.rpe_range);

  // default: repeat the observed set
  out.next.weight = in.set.weight;
  out.next.reps = in.set.reps;

  switch (out.band) {
    case EffortBand::TooHard:  too_hard(in, out);  break;
    case EffortBand::TooEasy:  too_easy(in, out);  break;
    case EffortBand::InTarget: in_target(in, out); break;
  }
  return out;
}

std::string explain(const PolicyInput& in, const PolicyOutput& out) {
  const double rpe = in.set.rpe;
  const int rep_min = in.rep_range.min;
  char buf[160] = "";

  switch (out.action) {
    case Action::LowerWeight:
      std::snprintf(buf, sizeof(buf), "RPE %.1f > %.1f at low reps; reduce weight.",
                    rpe, in.rpe_range.max);
      break;
    case Action::LowerReps:
      std::snprintf(buf, sizeof(buf), "RPE %.1f > %.1f; reduce reps slightly.",
                    rpe, in.rpe_range.max);
      break;
    case Action::AddWeight:
      if (out.band == EffortBand::TooEasy) {
        std::snprintf(buf, sizeof(buf),
                      "RPE %.1f < %.1f and reps capped; add weight and reset reps to %d.",
                      rpe, in.rpe_range.min, rep_min);
      } else {
        std::snprintf(buf, sizeof(buf),
                      "At rep cap with manageable RPE (%.1f); add weight and reset reps to %d.",
                      rpe, rep_min);
      }
      break;
    case Action::AddReps:
      if (out.band == EffortBand::TooEasy) {
        std::snprintf(buf, sizeof(buf), "RPE %.1f < %.1f; add reps.", rpe, in.rpe_range.min);
      } else {
        std::snprintf(buf, sizeof(buf), "RPE %.1f in target; add reps toward %d.",
                      rpe, in.rep_range.max);
      }
      break;
    case Action::Stay:
      std::snprintf(buf, sizeof(buf),
                    "At rep cap but RPE (%.1f) is on the hard side; repeat to solidify.", rpe);
      break;
  }
  return std::string(buf);
}

} // namespace kinetiq
