#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace storyloom {

// Malformed or incomplete world configuration, raised by initialize().
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(std::vector<std::string> problems);

  const std::vector<std::string>& problems() const { return problems_; }

 private:
  std::vector<std::string> problems_;
};

// A candidate turn could not be computed or failed validation. The
// previously committed state is kept.
class TurnExecutionError : public std::runtime_error {
 public:
  TurnExecutionError(std::int64_t turn, const std::string& what)
      : std::runtime_error("turn " + std::to_string(turn) + ": " + what), turn_(turn) {}

  std::int64_t turn() const { return turn_; }

 private:
  std::int64_t turn_;
};

// Manual-mode wrapper of TurnExecutionError, rethrown to the caller of step().
class StepError : public std::runtime_error {
 public:
  explicit StepError(const TurnExecutionError& cause)
      : std::runtime_error(std::string("step failed: ") + cause.what()), turn_(cause.turn()) {}

  std::int64_t turn() const { return turn_; }

 private:
  std::int64_t turn_;
};

// Saving or loading a snapshot failed. Never fatal to the simulation.
class PersistenceError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

} // namespace storyloom
