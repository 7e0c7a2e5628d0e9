#pragma once
#include <stdexcept>
#include <string>

namespace kinetiq {

class Error : public std::runtime_error {
public:
  explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Bad exercise config or settings. Must be fixed upstream.
class ConfigError : public Error {
public:
  explicit ConfigError(const std::string& what) : Error(what) {}
};

// Malformed observation (reps < 0, rpe outside [1,10], weight <= 0).
class InputError : public Error {
public:
  explicit InputError(const std::string& what) : Error(what) {}
};

} // namespace kinetiq
