#pragma once

#include <string>

namespace storyloom::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void set_level(Level lvl);
Level level();

// Lower the threshold for the lifetime of the guard, restoring the previous
// level on destruction. Tests use it to keep expected failures quiet.
class ScopedLevel {
 public:
  explicit ScopedLevel(Level lvl) : prev_(level()) { set_level(lvl); }
  ~ScopedLevel() { set_level(prev_); }

  ScopedLevel(const ScopedLevel&) = delete;
  ScopedLevel& operator=(const ScopedLevel&) = delete;

 private:
  Level prev_;
};

void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

} // namespace storyloom::log
