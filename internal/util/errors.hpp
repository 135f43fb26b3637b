#pragma once

#include <stdexcept>
#include <string>

namespace elevator::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Raised inside the movement engine when a unit's persisted state and its stop
  queue disagree, or a move would leave the building. Never reaches a caller:
  the engine heals the unit to idle and logs.
*/
class SimulationInconsistency : public std::runtime_error {
 public:
  explicit SimulationInconsistency(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace elevator::util
