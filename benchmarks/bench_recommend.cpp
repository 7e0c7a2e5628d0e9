#include "kinetiq/kinetiq.hpp"
#include <chrono>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace kinetiq;

static double secs_since(const std::chrono::high_resolution_clock::time_point& t0) {
  using namespace std::chrono;
  return duration_cast<duration<double>>(high_resolution_clock::now() - t0).count();
}

int main(int argc, char** argv) {
  std::size_t ops = (argc >= 2) ? std::stoull(argv[1]) : 1000000;

  Settings settings{};
  const auto presets = common_presets(settings);
  std::vector<ExerciseConfig> exercises;
  for (const auto& kv : presets) exercises.push_back(kv.second);

  // pre-generate inputs so the timed loop is only the decision
  std::mt19937_64 rng(123);
  std::uniform_int_distribution<int> reps_d(0, 12);
  std::uniform_real_distribution<double> rpe_d(1.0, 10.0);
  std::uniform_real_distribution<double> w_d(45.0, 500.0);

  std::vector<ObservedSet> sets(4096);
  for (auto& s : sets) s = ObservedSet{w_d(rng), reps_d(rng), rpe_d(rng)};

  int counts[5] = {0, 0, 0, 0, 0};
  double checksum = 0.0;

  auto t0 = std::chrono::high_resolution_clock::now();
  for (std::size_t i = 0; i < ops; ++i) {
    const auto& ex = exercises[i % exercises.size()];
    const auto r = recommend(sets[i % sets.size()], ex, settings);
    counts[static_cast<int>(r.action)]++;
    checksum += r.next_set.weight;
  }
  const double dt = secs_since(t0);

  std::cout << "ops=" << ops << " time=" << dt << "s"
            << " rate=" << (dt > 0 ? ops / dt : 0.0) << " ops/s\n";
  std::cout << "add_weight=" << counts[0] << " add_reps=" << counts[1]
            << " stay=" << counts[2] << " lower_weight=" << counts[3]
            << " lower_reps=" << counts[4] << " checksum=" << checksum << "\n";
  return 0;
}
