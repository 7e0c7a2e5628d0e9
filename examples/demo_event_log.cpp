#include "kinetiq/kinetiq.hpp"
#include <cstdio>

int main() {
  kinetiq::Engine eng;

  // Hook: print events
  eng.set_event_hook([](const kinetiq::Event& e) {
    std::printf("[event] %-14s w=%.1f reps=%d rpe=%.1f -> %s %.1fx%d note=%s\n",
      kinetiq::event_name(e.type),
      e.weight,
      e.reps,
      e.rpe,
      kinetiq::action_name(e.action),
      e.next_weight,
      e.next_reps,
      e.note ? e.note : ""
    );
  });

  kinetiq::Settings s{};
  kinetiq::ExerciseConfig ex{};
  ex.name = "bench_press";
  ex.rep_range = {5, 8};
  ex.target_rpe_range = {7.0, 9.0};

  // one set per band / boundary
  const kinetiq::ObservedSet sets[] = {
    {185.0, 8, 7.5}, // in target, cap, manageable
    {185.0, 6, 7.5}, // in target, below cap
    {185.0, 8, 9.5}, // too hard, above floor
    {185.0, 5, 9.5}, // too hard, at floor
    {185.0, 8, 6.0}, // too easy, cap
    {185.0, 8, 8.5}, // in target, cap, hard side
  };
  for (const auto& set : sets) (void)eng.recommend(set, ex, s);

  // large increment gets capped
  ex.weight_increment_override = 20.0;
  ex.max_jump_override = 10.0;
  (void)eng.recommend(kinetiq::ObservedSet{185.0, 8, 6.0}, ex, s);

  // rejected input
  try {
    (void)eng.recommend(kinetiq::ObservedSet{185.0, 8, 11.0}, ex, s);
  } catch (const kinetiq::InputError& e) {
    std::printf("rejected: %s\n", e.what());
  }

  std::printf("decisions=%llu\n", static_cast<unsigned long long>(eng.decisions()));
  return 0;
}
