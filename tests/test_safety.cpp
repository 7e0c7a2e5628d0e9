// tests/test_safety.cpp
#include "kinetiq/kinetiq.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>

#define REQUIRE(cond) do { \
  if (!(cond)) { \
    std::fprintf(stderr, "[FAIL] %s:%d: %s\n", __FILE__, __LINE__, #cond); \
    std::exit(1); \
  } \
} while (0)

using namespace kinetiq;

static ExerciseConfig good_exercise() {
  ExerciseConfig ex{};
  ex.name = "row";
  ex.rep_range = {6, 10};
  ex.target_rpe_range = {7.0, 9.0};
  return ex;
}

static const ObservedSet kGoodSet{135.0, 8, 8.0};

template <class E>
static bool throws_as(const ObservedSet& set, const ExerciseConfig& ex, const Settings& s) {
  try {
    (void)recommend(set, ex, s);
  } catch (const E& e) {
    std::fprintf(stderr, "  (rejected) %s\n", e.what());
    return true;
  } catch (const Error& e) {
    std::fprintf(stderr, "  (wrong error type) %s\n", e.what());
    return false;
  }
  return false;
}

static bool config_error(const ExerciseConfig& ex, const Settings& s = Settings{}) {
  return throws_as<ConfigError>(kGoodSet, ex, s);
}

static bool input_error(const ObservedSet& set) {
  return throws_as<InputError>(set, good_exercise(), Settings{});
}

static void test_config_errors() {
  std::fprintf(stderr, "[TEST] config errors...\n");

  ExerciseConfig ex = good_exercise();
  ex.rep_range = {10, 6};
  REQUIRE(config_error(ex));

  ex = good_exercise();
  ex.rep_range = {-1, 6};
  REQUIRE(config_error(ex));

  ex = good_exercise();
  ex.target_rpe_range = {9.0, 7.0};
  REQUIRE(config_error(ex));

  ex = good_exercise();
  ex.target_rpe_range = {0.5, 9.0};
  REQUIRE(config_error(ex));

  ex = good_exercise();
  ex.reps_step = 0;
  REQUIRE(config_error(ex));

  ex = good_exercise();
  ex.reps_step = -2;
  REQUIRE(config_error(ex));

  ex = good_exercise();
  ex.weight_increment_override = 0.0;
  REQUIRE(config_error(ex));

  ex = good_exercise();
  ex.max_jump_override = -5.0;
  REQUIRE(config_error(ex));

  // defaults from settings are checked after resolution
  Settings s{};
  s.lb_increment = 0.0;
  REQUIRE(config_error(good_exercise(), s));

  s = Settings{};
  s.unit = Unit::KG;
  s.max_jump_kg = 0.0;
  REQUIRE(config_error(good_exercise(), s));

  // the other unit's broken default is never consulted
  s = Settings{};
  s.unit = Unit::LB;
  s.max_jump_kg = 0.0;
  (void)recommend(kGoodSet, good_exercise(), s);
}

static void test_override_beats_broken_default() {
  std::fprintf(stderr, "[TEST] override bypasses settings default...\n");
  Settings s{};
  s.lb_increment = -1.0;
  ExerciseConfig ex = good_exercise();
  ex.weight_increment_override = 5.0;
  auto r = recommend(kGoodSet, ex, s);
  REQUIRE(std::fabs(r.params.increment - 5.0) < 1e-9);
}

static void test_input_errors() {
  std::fprintf(stderr, "[TEST] input errors...\n");
  REQUIRE(input_error(ObservedSet{135.0, -1, 8.0}));
  REQUIRE(input_error(ObservedSet{135.0, 8, 0.5}));
  REQUIRE(input_error(ObservedSet{135.0, 8, 10.5}));
  REQUIRE(input_error(ObservedSet{135.0, 8, std::numeric_limits<double>::quiet_NaN()}));
  REQUIRE(input_error(ObservedSet{0.0, 8, 8.0}));
  REQUIRE(input_error(ObservedSet{-20.0, 8, 8.0}));
  REQUIRE(input_error(ObservedSet{std::numeric_limits<double>::infinity(), 8, 8.0}));

  // scale edges are valid
  (void)recommend(ObservedSet{135.0, 8, 1.0}, good_exercise(), Settings{});
  (void)recommend(ObservedSet{135.0, 8, 10.0}, good_exercise(), Settings{});
}

static void test_config_checked_before_input() {
  std::fprintf(stderr, "[TEST] config error wins over input error...\n");
  ExerciseConfig ex = good_exercise();
  ex.rep_range = {10, 6};
  REQUIRE(throws_as<ConfigError>(ObservedSet{-1.0, -1, 42.0}, ex, Settings{}));
}

static void test_validate_without_throw() {
  std::fprintf(stderr, "[TEST] bool validators report why...\n");
  std::string why;

  REQUIRE(validate_exercise(good_exercise(), &why));
  REQUIRE(why == "ok");

  ExerciseConfig ex = good_exercise();
  ex.reps_step = 0;
  REQUIRE(!validate_exercise(ex, &why));
  REQUIRE(why.find("reps_step") != std::string::npos);

  REQUIRE(!validate_observed(ObservedSet{135.0, 8, 11.0}, &why));
  REQUIRE(why.find("RPE") != std::string::npos);

  EffectiveParams p{};
  REQUIRE(resolve_params(good_exercise(), Settings{}, &p, nullptr));
  REQUIRE(std::fabs(p.increment - 2.5) < 1e-9);
  REQUIRE(std::fabs(p.max_jump - 10.0) < 1e-9);
  REQUIRE(std::fabs(p.midpoint - 8.0) < 1e-9);
}

static void test_errors_share_base() {
  std::fprintf(stderr, "[TEST] errors derive from std::runtime_error...\n");
  bool caught = false;
  try {
    check_observed_or_throw(ObservedSet{0.0, 1, 5.0});
  } catch (const std::runtime_error& e) {
    caught = std::string(e.what()).find("weight") != std::string::npos;
  }
  REQUIRE(caught);
}

int main() {
  std::fprintf(stderr, "=== kinetiq safety tests ===\n");

  test_config_errors();
  test_override_beats_broken_default();
  test_input_errors();
  test_config_checked_before_input();
  test_validate_without_throw();
  test_errors_share_base();

  std::fprintf(stderr, "[OK] all safety tests passed\n");
  return 0;
}
