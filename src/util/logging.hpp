#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace refundledger::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelName(LogLevel level);

// Throws std::runtime_error for unknown names.
LogLevel ParseLogLevel(std::string_view value);

// Start appending to `path`. Throws std::runtime_error when the file cannot
// be opened.
void EnableFileLogging(const std::string& path);
void DisableFileLogging();
bool FileLoggingEnabled();

// max_bytes == 0 disables rotation.
void ConfigureLogging(LogLevel threshold, std::uintmax_t max_bytes, std::size_t max_files);

// Writes to the log file when enabled. Without a log file, warnings and
// errors still reach stderr as "[tag] warn: message".
void Log(LogLevel level, std::string_view tag, const std::string& message);

inline void LogDebug(std::string_view tag, const std::string& message) {
  Log(LogLevel::kDebug, tag, message);
}
inline void LogInfo(std::string_view tag, const std::string& message) {
  Log(LogLevel::kInfo, tag, message);
}
inline void LogWarn(std::string_view tag, const std::string& message) {
  Log(LogLevel::kWarn, tag, message);
}
inline void LogError(std::string_view tag, const std::string& message) {
  Log(LogLevel::kError, tag, message);
}

}  // namespace refundledger::util
