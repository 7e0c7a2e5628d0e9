#include "kinetiq/types.hpp"

namespace kinetiq {

const char* action_name(Action a) {
  switch (a) {
    case Action::AddWeight:   return "add_weight";
    case Action::AddReps:     return "add_reps";
    case Action::Stay:        return "stay";
    case Action::LowerWeight: return "lower_weight";
    case Action::LowerReps:   return "lower_reps";
  }
  return "stay";
}

bool parse_action(const std::string& s, Action* out) {
  static const Action all[] = {
    Action::AddWeight, Action::AddReps, Action::Stay,
    Action::LowerWeight, Action::LowerReps
  };
  for (Action a : all) {
    if (s == action_name(a)) {
      if (out) *out = a;
      return true;
    }
  }
  return false;
}

const char* band_name(EffortBand b) {
  switch (b) {
    case EffortBand::TooHard:  return "too_hard";
    case EffortBand::TooEasy:  return "too_easy";
    case EffortBand::InTarget: return "in_target";
  }
  return "in_target";
}

} // namespace kinetiq
