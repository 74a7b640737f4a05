#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace txforge::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelName(LogLevel level);
// Throws std::runtime_error for an unknown level name.
LogLevel ParseLogLevelString(const std::string& value);

// Append-only debug log with size-based rotation (log -> log.1 -> log.2 ...).
class DebugLogger {
 public:
  void Enable(const std::string& path);
  void Configure(LogLevel level, std::uintmax_t max_bytes, std::size_t max_files);
  void Log(LogLevel level, const std::string& message);
  bool Enabled() const;

 private:
  void RotateLocked();

  mutable std::mutex mutex_;
  std::ofstream stream_;
  std::string path_;
  LogLevel level_threshold_{LogLevel::kDebug};
  std::uintmax_t max_bytes_{0};
  std::size_t max_files_{0};
  std::uintmax_t current_size_{0};
};

DebugLogger& GetDebugLogger();

// Writes "[category] message" to the debug log when enabled. Warnings and
// errors are echoed to stderr as "[category] warn: message" so they remain
// visible when no log file is configured.
void LogPrint(LogLevel level, std::string_view category, const std::string& message);

}  // namespace txforge::util
