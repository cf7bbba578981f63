//===- Logging.cpp - Cycle-level hardware logging -------------------------===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//

#include "latch/Support/Logging.h"
#include "llvm/ADT/StringSwitch.h"
#include <optional>

namespace latch {

llvm::StringRef getLogLevelName(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARNING";
  case LogLevel::Error:
    return "ERROR";
  }
  return "UNKNOWN";
}

std::optional<LogLevel> parseLogLevel(llvm::StringRef name) {
  return llvm::StringSwitch<std::optional<LogLevel>>(name.lower())
      .Case("debug", LogLevel::Debug)
      .Case("info", LogLevel::Info)
      .Case("warning", LogLevel::Warning)
      .Case("error", LogLevel::Error)
      .Default(std::nullopt);
}

LogSink &LogSink::get() {
  static LogSink instance;
  return instance;
}

void LogSink::emit(LogLevel level, llvm::StringRef logger,
                   llvm::StringRef message) {
  if (level == LogLevel::Error)
    ++errorCount;
  if (level < threshold)
    return;
  *stream << getLogLevelName(level) << ":" << logger << ":cycle " << cycle
          << "] " << message << "\n";
  stream->flush();
}

} // namespace latch
