#include "kinetiq/kinetiq.hpp"
#include <iostream>
#include <map>
#include <string>

using namespace kinetiq;

static bool smoke_every_preset() {
  Settings s{};
  for (const auto& kv : common_presets(s)) {
    const ExerciseConfig& ex = kv.second;
    ObservedSet set{100.0, ex.rep_range.max, 7.5};
    auto r = recommend(set, ex, s);
    if (r.action != Action::AddWeight) return false;
    if (r.next_set.reps != ex.rep_range.min) return false;
  }
  return true;
}

static bool smoke_feedback_loop() {
  // feed each prescription back in with a fixed in-band effort
  ExerciseConfig ex = make_exercise("bench_press", {5, 8});
  ObservedSet set{135.0, 5, 7.5};
  int weight_bumps = 0;
  for (int i = 0; i < 12; ++i) {
    auto r = recommend(set, ex, Settings{});
    if (r.action == Action::AddWeight) ++weight_bumps;
    set.weight = r.next_set.weight;
    set.reps = r.next_set.reps;
  }
  // 5->8 takes three sets, the fourth adds load: 12 sets => 3 bumps
  return weight_bumps == 3 && set.weight == 142.5;
}

static bool smoke_rejects_bad_input() {
  try {
    (void)recommend(ObservedSet{-5.0, 5, 7.5}, make_exercise("curl", {8, 12}), Settings{});
  } catch (const InputError&) {
    return true;
  }
  return false;
}

int main() {
  bool ok = true;
  ok = ok && smoke_every_preset();
  ok = ok && smoke_feedback_loop();
  ok = ok && smoke_rejects_bad_input();

  if (!ok) {
    std::cerr << "SMOKE FAILED\n";
    return 1;
  }
  std::cout << "SMOKE OK\n";
  return 0;
}
