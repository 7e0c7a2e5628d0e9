#pragma once
#include "config.hpp"
#include "types.hpp"

#include <string>

namespace kinetiq {

// Parameters after override/default resolution, all in the settings unit.
struct EffectiveParams {
  double increment = 0.0;
  double max_jump = 0.0;
  double midpoint = 0.0;
};

// Each returns false and fills *why (if given) on the first violation.
bool validate_exercise(const ExerciseConfig& cfg, std::string* why);
bool validate_observed(const ObservedSet& set, std::string* why);
bool resolve_params(const ExerciseConfig& cfg, const Settings& settings,
                    EffectiveParams* out, std::string* why);

// Throwing forms: ConfigError / InputError.
EffectiveParams resolve_or_throw(const ExerciseConfig& cfg, const Settings& settings);
void check_observed_or_throw(const ObservedSet& set);

} // namespace kinetiq
