// tests/test_multithread.cpp
#include "kinetiq/kinetiq.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <string>
#include <thread>
#include <vector>

#define REQUIRE(cond) do { \
  if (!(cond)) { \
    std::fprintf(stderr, "[FAIL] %s:%d: %s\n", __FILE__, __LINE__, #cond); \
    std::exit(1); \
  } \
} while (0)

using namespace kinetiq;

static std::atomic<int> g_mismatch{0};

static void worker(kinetiq::Engine* eng, int tid, int iters) {
  std::mt19937_64 rng(12345 + tid);
  std::uniform_int_distribution<int> reps_d(0, 12);
  std::uniform_real_distribution<double> rpe_d(1.0, 10.0);
  std::uniform_real_distribution<double> w_d(20.0, 300.0);

  ExerciseConfig ex{};
  ex.name = "worker_" + std::to_string(tid);
  ex.rep_range = {6, 10};
  ex.target_rpe_range = {7.0, 9.0};
  ex.reps_step = 1 + (tid % 2);

  Settings s{};
  s.unit = (tid % 2) ? Unit::KG : Unit::LB;

  for (int i = 0; i < iters; ++i) {
    ObservedSet set{w_d(rng), reps_d(rng), rpe_d(rng)};

    // shared engine and pure function must agree
    auto a = eng->recommend(set, ex, s);
    auto b = recommend(set, ex, s);
    if (a.action != b.action || a.next_set.reps != b.next_set.reps ||
        a.next_set.weight != b.next_set.weight) {
      g_mismatch.fetch_add(1, std::memory_order_relaxed);
    }
  }
}

int main() {
  EngineConfig cfg{};
  cfg.enable_tracing = true;
  Engine eng(cfg);

  std::atomic<int> recommends{0};
  eng.set_event_hook([&](const Event& e) {
    if (e.type == EventType::Recommend) recommends.fetch_add(1, std::memory_order_relaxed);
  });

  const int T = 8;
  const int I = 5000;
  std::vector<std::thread> ts;
  for (int t = 0; t < T; ++t) ts.emplace_back(worker, &eng, t, I);
  for (auto& th : ts) th.join();

  REQUIRE(g_mismatch.load() == 0);
  REQUIRE(recommends.load() == T * I);
  REQUIRE(eng.decisions() == static_cast<std::uint64_t>(T * I));
  REQUIRE(eng.tracer().snapshot().size() == static_cast<std::size_t>(T * I));

  std::puts("[OK] test_multithread");
  return 0;
}
