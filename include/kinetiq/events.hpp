#pragma once
#include "types.hpp"

#include <cstdint>
#include <functional>

namespace kinetiq {

enum class EventType : std::uint8_t {
  Recommend,      // a recommendation was produced

  // classification
  TooHard,
  TooEasy,
  InTarget,

  WeightCapped,   // weight step limited by max_jump instead of the increment
  ConfigRejected, // ConfigError about to be thrown
  InputRejected   // InputError about to be thrown
};

struct Event {
  EventType type{};
  Action action = Action::Stay;

  // observed set
  double weight = 0.0;
  int reps = 0;
  double rpe = 0.0;

  // prescription (Recommend / WeightCapped only)
  double next_weight = 0.0;
  int next_reps = 0;

  const char* note = nullptr;
};

using EventHook = std::function<void(const Event&)>;

const char* event_name(EventType t);

} // namespace kinetiq
