// Repository: NarroVault
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by workers, writer thread and CLI.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_UTIL_LOGGER_HPP_
#define NARROVAULT_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace narrovault::util {

enum class LogLevel { kDebug = 0, kInfo, kWarn, kError };

const char* LogLevelToString(LogLevel level);

// One static mutex; every line is written whole and flushed, so generation
// workers, the vault writer thread and the pipeline never interleave.
//
// Debug/Info → stdout (Debug only when NARROVAULT_DEBUG is set)
// Warn/Error → stderr
//
// Lines are "[Component] EVENT key=value ...".
class Logger {
 public:
  using Sink = std::function<void(LogLevel, const std::string&)>;

  static void Info(const std::string& line) { Emit(LogLevel::kInfo, line); }
  static void Debug(const std::string& line) { Emit(LogLevel::kDebug, line); }
  static void Warn(const std::string& line) { Emit(LogLevel::kWarn, line); }
  static void Error(const std::string& line) { Emit(LogLevel::kError, line); }

  static void Emit(LogLevel level, const std::string& line);

  // Test-only. Receives every emitted line at or above min_level, in addition
  // to the stream. Pass nullptr to clear.
  static void SetSink(Sink sink, LogLevel min_level = LogLevel::kInfo);

 private:
  static bool DebugEnabled();

  static std::mutex mutex_;
  static Sink sink_;
  static LogLevel sink_min_level_;
};

// Installs a sink for the lifetime of the object.
class ScopedLogCapture {
 public:
  explicit ScopedLogCapture(Logger::Sink sink, LogLevel min_level = LogLevel::kInfo) {
    Logger::SetSink(std::move(sink), min_level);
  }
  ~ScopedLogCapture() { Logger::SetSink(nullptr); }

  ScopedLogCapture(const ScopedLogCapture&) = delete;
  ScopedLogCapture& operator=(const ScopedLogCapture&) = delete;
};

}  // namespace narrovault::util

#endif  // NARROVAULT_UTIL_LOGGER_HPP_
