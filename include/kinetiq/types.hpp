#pragma once
#include <cstdint>
#include <string>

namespace kinetiq {

enum class Action : std::uint8_t {
  AddWeight,
  AddReps,
  Stay,
  LowerWeight,
  LowerReps
};

// Relation of observed effort to the target RPE band.
enum class EffortBand : std::uint8_t {
  TooHard,  // rpe > rpe_max
  TooEasy,  // rpe < rpe_min
  InTarget  // rpe_min <= rpe <= rpe_max
};

// What the lifter actually did. weight is in the settings unit.
struct ObservedSet {
  double weight = 0.0;
  int reps = 0;
  double rpe = 0.0; // 1-10
};

struct NextSet {
  double weight = 0.0;
  int reps = 0;
};

// canonical wire names: "add_weight", "add_reps", "stay", "lower_weight", "lower_reps"
const char* action_name(Action a);
bool parse_action(const std::string& s, Action* out);

const char* band_name(EffortBand b);

} // namespace kinetiq
