#include "typed_csv/log.hpp"
#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace tc {

namespace {

LogLevel level_from_env() {
  const char* v = std::getenv("TC_LOG");
  if (!v || !*v) return LogLevel::Off;
  const std::string s(v);
  if (s == "debug") return LogLevel::Debug;
  if (s == "error") return LogLevel::Error;
  return LogLevel::Off;
}

std::atomic<int>& level_slot() {
  static std::atomic<int> lvl{static_cast<int>(level_from_env())};
  return lvl;
}

std::mutex& sink_mu() {
  static std::mutex mu;
  return mu;
}

}

LogLevel log_level() noexcept { return static_cast<LogLevel>(level_slot().load()); }

void set_log_level(LogLevel lvl) noexcept { level_slot().store(static_cast<int>(lvl)); }

bool log_enabled(LogLevel lvl) noexcept {
  return lvl != LogLevel::Off && static_cast<int>(lvl) <= level_slot().load();
}

void log(LogLevel lvl, std::string_view tag, std::string_view message) {
  if (!log_enabled(lvl)) return;
  std::lock_guard<std::mutex> lk(sink_mu());
  std::cerr << "[" << tag << "] " << message << "\n";
}

}
