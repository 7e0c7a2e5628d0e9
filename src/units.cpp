#include "kinetiq/units.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace kinetiq {

const char* unit_name(Unit u) {
  switch (u) {
    case Unit::LB: return "lb";
    case Unit::KG: return "kg";
  }
  return "lb";
}

bool parse_unit(const std::string& s, Unit* out) {
  std::string t;
  t.reserve(s.size());
  for (char c : s) {
    if (c == ' ' || c == '\t' || c == '\r' || c == '\n') continue;
    t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  Unit u{};
  if (t == "lb" || t == "lbs") u = Unit::LB;
  else if (t == "kg" || t == "kgs") u = Unit::KG;
  else return false;

  if (out) *out = u;
  return true;
}

double to_kg(double weight, Unit unit) {
  return (unit == Unit::LB) ? weight / LB_PER_KG : weight;
}

double from_kg(double weight_kg, Unit unit) {
  return (unit == Unit::LB) ? weight_kg * LB_PER_KG : weight_kg;
}

double convert(double weight, Unit from, Unit to) {
  if (from == to) return weight;
  return from_kg(to_kg(weight, from), to);
}

double round_to_increment(double x, double inc) {
  inc = std::max(1e-9, inc);
  return std::round(x / inc) * inc;
}

int clamp_int(int x, int lo, int hi) {
  return std::max(lo, std::min(hi, x));
}

double normalize_display_weight(double weight, Unit unit) {
  if (unit == Unit::LB) return std::round(weight * 2.0) / 2.0;
  return std::round(weight * 4.0) / 4.0;
}

} // namespace kinetiq
