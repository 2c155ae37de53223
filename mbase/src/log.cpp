// TU header --------------------------------------------
#include "mbase/log.h"

// c++ headers ------------------------------------------
#include <cstdio>

#include <atomic>
#include <print>
#include <string>

// project headers --------------------------------------
#include "mbase/platform.h"

// conditional external headers -------------------------
#if MBASE_PLATFORM_WEB
# include <emscripten/console.h>
#endif

namespace mbase {

namespace {

std::atomic<LogLevel> s_log_level = LogLevel::kInfo;

char const* GetLevelTag(LogLevel level) {
  switch (level) {
  case LogLevel::kInfo:  return "info";
  case LogLevel::kWarn:  return "warn";
  case LogLevel::kError: return "error";
  case LogLevel::kNone:  break;
  }
  return "???";
}

} // namespace

void SetLogLevel(LogLevel level) {
  s_log_level.store(level, std::memory_order_relaxed);
}

LogLevel GetLogLevel() {
  return s_log_level.load(std::memory_order_relaxed);
}

void LogMessage(LogLevel level, std::string_view message) {
  if (level < GetLogLevel() || level == LogLevel::kNone) {
    return;
  }
#if MBASE_PLATFORM_WEB
  std::string const line = std::format("[{}] {}", GetLevelTag(level), message);
  if (level == LogLevel::kError) {
    emscripten_console_error(line.c_str());
  }
  else {
    emscripten_console_log(line.c_str());
  }
#else
  std::println(stderr, "[{}] {}", GetLevelTag(level), message);
#endif
}

} // namespace mbase
