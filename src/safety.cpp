#include "kinetiq/safety.hpp"
#include "kinetiq/errors.hpp"

#include <cmath>
#include <sstream>

namespace kinetiq {

static bool fail(std::string* why, const std::string& msg) {
  if (why) *why = msg;
  return false;
}

static bool in_rpe_scale(double x) { return x >= 1.0 && x <= 10.0; }

bool validate_exercise(const ExerciseConfig& cfg, std::string* why) {
  const auto& r = cfg.rep_range;
  const auto& t = cfg.target_rpe_range;

  if (r.min < 0) {
    std::ostringstream oss;
    oss << "rep_range min must be >= 0, got " << r.min;
    return fail(why, oss.str());
  }
  if (r.min > r.max) {
    std::ostringstream oss;
    oss << "invalid rep_range (" << r.min << ", " << r.max << "): min > max";
    return fail(why, oss.str());
  }

  // NaN fails both comparisons, so it is rejected here too
  if (!in_rpe_scale(t.min) || !in_rpe_scale(t.max)) {
    std::ostringstream oss;
    oss << "target_rpe_range (" << t.min << ", " << t.max << ") must lie in [1, 10]";
    return fail(why, oss.str());
  }
  if (t.min > t.max) {
    std::ostringstream oss;
    oss << "invalid target_rpe_range (" << t.min << ", " << t.max << "): min > max";
    return fail(why, oss.str());
  }

  if (cfg.reps_step <= 0) {
    std::ostringstream oss;
    oss << "reps_step must be > 0, got " << cfg.reps_step;
    return fail(why, oss.str());
  }

  if (why) *why = "ok";
  return true;
}

bool validate_observed(const ObservedSet& set, std::string* why) {
  if (set.reps < 0) {
    std::ostringstream oss;
    oss << "reps must be >= 0, got " << set.reps;
    return fail(why, oss.str());
  }
  if (!in_rpe_scale(set.rpe)) {
    std::ostringstream oss;
    oss << "RPE must be between 1 and 10, got " << set.rpe;
    return fail(why, oss.str());
  }
  if (!std::isfinite(set.weight) || set.weight <= 0.0) {
    std::ostringstream oss;
    oss << "weight must be > 0, got " << set.weight;
    return fail(why, oss.str());
  }

  if (why) *why = "ok";
  return true;
}

bool resolve_params(const ExerciseConfig& cfg, const Settings& settings,
                    EffectiveParams* out, std::string* why) {
  if (!validate_exercise(cfg, why)) return false;

  EffectiveParams p{};
  p.increment = cfg.weight_increment_override ? *cfg.weight_increment_override
                                              : settings.default_increment();
  p.max_jump  = cfg.max_jump_override ? *cfg.max_jump_override
                                      : settings.default_max_jump();
  p.midpoint  = cfg.target_rpe_range.midpoint();

  if (!std::isfinite(p.increment) || p.increment <= 0.0) {
    std::ostringstream oss;
    oss << "weight increment must be > 0 " << unit_name(settings.unit)
        << ", got " << p.increment;
    return fail(why, oss.str());
  }
  if (!std::isfinite(p.max_jump) || p.max_jump <= 0.0) {
    std::ostringstream oss;
    oss << "max jump must be > 0 " << unit_name(settings.unit)
        << ", got " << p.max_jump;
    return fail(why, oss.str());
  }

  if (out) *out = p;
  if (why) *why = "ok";
  return true;
}

EffectiveParams resolve_or_throw(const ExerciseConfig& cfg, const Settings& settings) {
  EffectiveParams p{};
  std::string why;
  if (!resolve_params(cfg, settings, &p, &why)) throw ConfigError(why);
  return p;
}

void check_observed_or_throw(const ObservedSet& set) {
  std::string why;
  if (!validate_observed(set, &why)) throw InputError(why);
}

} // namespace kinetiq
