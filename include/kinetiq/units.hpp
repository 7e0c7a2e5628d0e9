#pragma once
#include <cstdint>
#include <string>

namespace kinetiq {

enum class Unit : std::uint8_t { LB, KG };

constexpr double LB_PER_KG = 2.2046226218;

const char* unit_name(Unit u);

// accepts "lb", "lbs", "kg", "kgs" (case-insensitive); false if unknown
bool parse_unit(const std::string& s, Unit* out);

double to_kg(double weight, Unit unit);
double from_kg(double weight_kg, Unit unit);
double convert(double weight, Unit from, Unit to);

// nearest multiple of inc (inc floored at 1e-9)
double round_to_increment(double x, double inc);

int clamp_int(int x, int lo, int hi);

// Display rounding only: nearest 0.5 lb or 0.25 kg.
double normalize_display_weight(double weight, Unit unit);

} // namespace kinetiq
