// Simulated training block: a noisy lifter follows the engine for 16 weeks,
// then the decision trace is written as CSV.
#include "kinetiq/kinetiq.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <random>
#include <vector>

using namespace kinetiq;

struct SimLifter {
  double base_strength = 185.0;
  double sensitivity_weight = 1.0 / 25.0;
  double sensitivity_reps = 1.0 / 2.5;

  double fatigue_per_set = 0.20;
  double readiness_noise = 0.60;
  double rpe_noise = 0.25;

  double adapt_good = 0.55;
  double adapt_bad = 0.10;

  std::mt19937_64 rng{7};

  double uniform(double lo, double hi) {
    return std::uniform_real_distribution<double>(lo, hi)(rng);
  }

  double day_readiness() { return uniform(-readiness_noise, readiness_noise); }

  double rpe_for_set(double weight, int reps, int rep_min, int set_idx, double readiness) {
    double rpe = 7.0;
    rpe += (weight - base_strength) * sensitivity_weight;
    rpe += (reps - rep_min) * sensitivity_reps;
    rpe += set_idx * fatigue_per_set;
    rpe -= readiness;
    rpe += uniform(-rpe_noise, rpe_noise);
    return std::max(1.0, std::min(10.0, rpe));
  }

  // in-zone rate >= 60% counts as a productive session
  void adapt(const std::vector<double>& rpes, const RpeRange& target) {
    if (rpes.empty()) return;
    int in_zone = 0;
    for (double r : rpes) in_zone += (r >= target.min && r <= target.max) ? 1 : 0;
    const double rate = static_cast<double>(in_zone) / rpes.size();
    base_strength += (rate >= 0.60) ? adapt_good : adapt_bad;
  }
};

int main(int argc, char** argv) {
  const char* out = (argc >= 2) ? argv[1] : "kinetiq_trace.csv";

  const int weeks = 16;
  const int sessions_per_week = 2;
  const int sets_per_session = 4;

  EngineConfig cfg{};
  cfg.enable_event_hooks = false;
  cfg.enable_tracing = true;
  Engine eng(cfg);

  Settings settings{};
  ExerciseConfig ex{};
  ex.name = "bench_press";
  ex.rep_range = {5, 8};
  ex.target_rpe_range = {7.0, 9.0};

  SimLifter lifter;
  ObservedSet current{185.0, 5, lifter.rpe_for_set(185.0, 5, 5, 0, lifter.day_readiness())};

  int total = 0, in_zone = 0;
  try {
    for (int week = 1; week <= weeks; ++week) {
      for (int sess = 0; sess < sessions_per_week; ++sess) {
        const double readiness = lifter.day_readiness();
        std::vector<double> rpes;

        // top set follows the engine's prescription
        Recommendation r = eng.recommend(current, ex, settings);
        double w = r.next_set.weight;
        int reps = r.next_set.reps;

        for (int set_idx = 0; set_idx < sets_per_session; ++set_idx) {
          double rpe = lifter.rpe_for_set(w, reps, ex.rep_range.min, set_idx, readiness);

          // back-off sets: shed a rep when it gets too hard
          if (set_idx > 0 && rpe > ex.target_rpe_range.max && reps > ex.rep_range.min) {
            --reps;
            rpe = lifter.rpe_for_set(w, reps, ex.rep_range.min, set_idx, readiness);
          }

          current = ObservedSet{w, reps, rpe};
          rpes.push_back(rpe);
          ++total;
          if (classify(rpe, ex.target_rpe_range) == EffortBand::InTarget) ++in_zone;
        }

        lifter.adapt(rpes, ex.target_rpe_range);
        std::printf("week %02d session %d: %.1f x %d  (%s)\n",
                    week, sess + 1, w, r.next_set.reps, action_name(r.action));
      }
    }
  } catch (const Error& e) {
    std::cerr << "simulation stopped: " << e.what() << "\n";
    return 1;
  }

  std::ofstream ofs(out, std::ios::binary);
  if (!ofs) {
    std::cerr << "failed to open " << out << "\n";
    return 2;
  }
  ofs << eng.tracer().to_csv();
  ofs.close();

  std::printf("sets=%d target-zone hit rate=%.0f%%\n", total,
              total ? 100.0 * in_zone / total : 0.0);
  std::cout << "wrote trace to: " << out << "\n";
  return 0;
}
