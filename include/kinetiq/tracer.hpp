#pragma once
#include "types.hpp"
#include "units.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace kinetiq {

struct TraceEntry {
  std::uint64_t seq = 0;

  std::string exercise;
  Unit unit = Unit::LB;

  ObservedSet observed{};
  EffortBand band = EffortBand::InTarget;
  Action action = Action::Stay;
  NextSet next{};

  double increment = 0.0;
  double max_jump = 0.0;
  const char* note = nullptr;
};

class Tracer {
public:
  void enable(bool on) { enabled_ = on; }
  bool enabled() const { return enabled_; }

  void record(const TraceEntry& e);
  void clear();
  std::vector<TraceEntry> snapshot() const;
  std::string to_csv() const;

private:
  bool enabled_ = true;
  mutable std::mutex mtx_;
  std::vector<TraceEntry> entries_;
};

} // namespace kinetiq
