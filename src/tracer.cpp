#include "kinetiq/tracer.hpp"
#include <sstream>

namespace kinetiq {

// RFC 4180 style: always quoted, embedded quotes doubled
static std::string csv_quote(const char* s) {
  std::string out = "\"";
  for (const char* p = s; p && *p; ++p) {
    if (*p == '"') out += '"';
    out += *p;
  }
  out += '"';
  return out;
}

void Tracer::record(const TraceEntry& e) {
  if (!enabled_) return;
  std::lock_guard<std::mutex> lock(mtx_);
  entries_.push_back(e);
}

void Tracer::clear() {
  std::lock_guard<std::mutex> lock(mtx_);
  entries_.clear();
}

std::vector<TraceEntry> Tracer::snapshot() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return entries_;
}

std::string Tracer::to_csv() const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::ostringstream oss;
  oss << "seq,exercise,unit,weight,reps,rpe,band,action,next_weight,next_reps,increment,max_jump,note\n";
  for (const auto& e : entries_) {
    oss << e.seq << ","
        << csv_quote(e.exercise.c_str()) << ","
        << unit_name(e.unit) << ","
        << e.observed.weight << ","
        << e.observed.reps << ","
        << e.observed.rpe << ","
        << band_name(e.band) << ","
        << action_name(e.action) << ","
        << e.next.weight << ","
        << e.next.reps << ","
        << e.increment << ","
        << e.max_jump << ","
        << csv_quote(e.note)
        << "\n";
  }
  return oss.str();
}

} // namespace kinetiq
