#include "storyloom/util/log.h"

#include <atomic>
#include <iostream>
#include <mutex>

namespace storyloom::log {
namespace {

std::mutex g_mu;
std::atomic<Level> g_level{Level::Info};

const char* tag(Level l) {
  switch (l) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    case Level::Off: break;
  }
  return "";
}

void write_line(Level l, const std::string& msg) {
  const Level threshold = g_level.load();
  if (threshold == Level::Off || l < threshold) return;
  std::lock_guard<std::mutex> lock(g_mu);
  std::cerr << "[" << tag(l) << "] " << msg << "\n";
}

} // namespace

void set_level(Level lvl) { g_level.store(lvl); }
Level level() { return g_level.load(); }

void debug(const std::string& msg) { write_line(Level::Debug, msg); }
void info(const std::string& msg) { write_line(Level::Info, msg); }
void warn(const std::string& msg) { write_line(Level::Warn, msg); }
void error(const std::string& msg) { write_line(Level::Error, msg); }

} // namespace storyloom::log
