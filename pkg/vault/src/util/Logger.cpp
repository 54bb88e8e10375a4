// Repository: NarroVault
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by workers, writer thread and CLI.
// Copyright (c) 2026 NarroVault

#include "narrovault/util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace narrovault::util {

std::mutex Logger::mutex_;
Logger::Sink Logger::sink_;
LogLevel Logger::sink_min_level_ = LogLevel::kInfo;

const char* LogLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug: return "DEBUG";
    case LogLevel::kInfo: return "INFO";
    case LogLevel::kWarn: return "WARN";
    case LogLevel::kError: return "ERROR";
  }
  return "UNKNOWN";
}

bool Logger::DebugEnabled() {
  static const bool enabled = std::getenv("NARROVAULT_DEBUG") != nullptr;
  return enabled;
}

void Logger::SetSink(Sink sink, LogLevel min_level) {
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ = std::move(sink);
  sink_min_level_ = min_level;
}

void Logger::Emit(LogLevel level, const std::string& line) {
  if (level == LogLevel::kDebug && !DebugEnabled()) return;

  std::lock_guard<std::mutex> lock(mutex_);
  if (sink_ && level >= sink_min_level_) {
    sink_(level, line);
  }
  std::ostream& out = level >= LogLevel::kWarn ? std::cerr : std::cout;
  out << line << '\n';
  out.flush();
}

}  // namespace narrovault::util
