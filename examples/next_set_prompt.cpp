// Interactive next-set prompt: log a set, get the next prescription.
#include "kinetiq/kinetiq.hpp"

#include <iostream>
#include <string>

using namespace kinetiq;

static std::string ask(const std::string& prompt) {
  std::cout << prompt << std::flush;
  std::string s;
  if (!std::getline(std::cin, s)) return {};
  return s;
}

static bool ask_double(const std::string& prompt, double* out) {
  const std::string s = ask(prompt);
  try {
    std::size_t used = 0;
    double v = std::stod(s, &used);
    if (used == 0) return false;
    *out = v;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

static bool ask_int(const std::string& prompt, int* out) {
  const std::string s = ask(prompt);
  try {
    *out = std::stoi(s);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

int main() {
  std::cout << "\nKinetiq - next set recommendation\n"
               "RPE-based autoregulation, target RPE 7-9. Empty line or EOF quits.\n\n";

  Settings settings{};
  std::string u = ask("Units (lb/kg) [lb]: ");
  if (!u.empty() && !parse_unit(u, &settings.unit)) {
    std::cerr << "unknown unit '" << u << "', using lb\n";
  }

  std::string name = ask("Exercise name (e.g. bench_press): ");
  if (name.empty()) name = "bench_press";

  int rep_min = 0, rep_max = 0;
  if (!ask_int("Rep range MIN: ", &rep_min) || !ask_int("Rep range MAX: ", &rep_max)) {
    std::cerr << "rep range must be integers\n";
    return 1;
  }

  const ExerciseConfig ex = make_exercise(name, {rep_min, rep_max}, RpeRange{7.0, 9.0}, settings);

  Engine engine;
  engine.set_event_hook([](const Event& e) {
    if (e.type == EventType::WeightCapped) {
      std::cout << "  (note) " << e.note << "\n";
    }
  });

  for (;;) {
    std::cout << "\n--- Log your set ---\n";
    ObservedSet set{};
    if (!ask_double(std::string("Weight used (") + unit_name(settings.unit) + "): ", &set.weight)) break;
    if (!ask_int("Reps performed: ", &set.reps)) break;
    if (!ask_double("How hard was it? RPE (1-10): ", &set.rpe)) break;

    try {
      const Recommendation r = engine.recommend(set, ex, settings);
      std::cout << "\n-> Action: " << action_name(r.action) << "\n"
                << "-> Next set: " << normalize_display_weight(r.next_set.weight, r.unit)
                << " " << unit_name(r.unit) << " x " << r.next_set.reps << "\n"
                << "-> Why: " << r.explanation << "\n";
    } catch (const ConfigError& e) {
      std::cerr << "config error: " << e.what() << "\n";
      return 1;
    } catch (const InputError& e) {
      std::cerr << "input error: " << e.what() << "\n";
    }
  }

  std::cout << "\nBye.\n";
  return 0;
}
