#include "kinetiq/presets.hpp"

#include <algorithm>
#include <cctype>

namespace kinetiq {

static bool is_lower_body_heavy(const std::string& name) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  // "dead" also covers "deadlift" and "dead lift"
  return s.find("dead") != std::string::npos || s.find("squat") != std::string::npos;
}

double default_increment_for_exercise(const Settings& settings, const std::string& name) {
  const bool heavy = is_lower_body_heavy(name);
  if (settings.unit == Unit::LB) return heavy ? 5.0 : 2.5;
  return heavy ? 2.5 : 1.25;
}

double default_max_jump_for_exercise(const Settings& settings, const std::string& name) {
  const bool heavy = is_lower_body_heavy(name);
  if (settings.unit == Unit::LB) return heavy ? 15.0 : 10.0;
  return heavy ? 7.5 : 5.0;
}

ExerciseConfig make_exercise(const std::string& name, RepRange rep_range,
                             RpeRange target_rpe_range, const Settings& settings) {
  ExerciseConfig ex{};
  ex.name = name;
  ex.rep_range = rep_range;
  ex.target_rpe_range = target_rpe_range;
  ex.weight_increment_override = default_increment_for_exercise(settings, name);
  ex.max_jump_override = default_max_jump_for_exercise(settings, name);
  ex.reps_step = 1;
  return ex;
}

std::map<std::string, ExerciseConfig> common_presets(const Settings& settings) {
  std::map<std::string, ExerciseConfig> out;
  out["bench_press"]    = make_exercise("bench_press",    {5, 8},  RpeRange{}, settings);
  out["overhead_press"] = make_exercise("overhead_press", {5, 8},  RpeRange{}, settings);
  out["barbell_row"]    = make_exercise("barbell_row",    {6, 10}, RpeRange{}, settings);
  out["squat"]          = make_exercise("squat",          {5, 8},  RpeRange{}, settings);
  out["deadlift"]       = make_exercise("deadlift",       {3, 6},  RpeRange{}, settings);
  return out;
}

} // namespace kinetiq
