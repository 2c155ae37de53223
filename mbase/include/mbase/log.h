#pragma once

// c++ headers ------------------------------------------
#include <cstdint>

#include <format>
#include <string_view>
#include <utility>

namespace mbase {

enum class LogLevel : uint8_t {
  kInfo,
  kWarn,
  kError,
  kNone,
};

/// Messages below `level` are discarded. Defaults to `LogLevel::kInfo`.
void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();

void LogMessage(LogLevel level, std::string_view message);

template<class ... Args>
void Log(LogLevel level, std::format_string<Args...> fmt, Args&& ... args) {
  if (level < GetLogLevel()) {
    return;
  }
  LogMessage(level, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace mbase

#define MBASE_LOG_INFO(...)  ::mbase::Log(::mbase::LogLevel::kInfo, __VA_ARGS__)
#define MBASE_LOG_WARN(...)  ::mbase::Log(::mbase::LogLevel::kWarn, __VA_ARGS__)
#define MBASE_LOG_ERROR(...) ::mbase::Log(::mbase::LogLevel::kError, __VA_ARGS__)
