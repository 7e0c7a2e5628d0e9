#pragma once
#include "config.hpp"

#include <map>
#include <string>

namespace kinetiq {

// Squat / deadlift move in bigger steps:
//   lb: 5 increment, 15 max jump   kg: 2.5 / 7.5
// everything else:
//   lb: 2.5 / 10                   kg: 1.25 / 5
double default_increment_for_exercise(const Settings& settings, const std::string& name);
double default_max_jump_for_exercise(const Settings& settings, const std::string& name);

// ExerciseConfig with increment and max jump overrides filled in (settings unit).
ExerciseConfig make_exercise(const std::string& name, RepRange rep_range,
                             RpeRange target_rpe_range = RpeRange{},
                             const Settings& settings = Settings{});

// bench_press, overhead_press, barbell_row, squat, deadlift
std::map<std::string, ExerciseConfig> common_presets(const Settings& settings = Settings{});

} // namespace kinetiq
