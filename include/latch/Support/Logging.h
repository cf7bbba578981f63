//===- Logging.h - Cycle-level hardware logging -----------------*- C++ -*-===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//
//
// Named loggers used from method bodies and combinational logic. A message is
// emitted only when its trigger condition holds in the cycle it is evaluated.
// Error messages and failed assertions are recorded so that the driving
// simulation can report failure once the cycle completes.
//
// Usage:
//   static latch::Logger log("bank");
//   log.warning(addr == 42, "write to watched address {0:x}", addr);
//   log.assertion(count <= capacity, "overflow");
//
//===----------------------------------------------------------------------===//

#ifndef LATCH_SUPPORT_LOGGING_H
#define LATCH_SUPPORT_LOGGING_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/raw_ostream.h"
#include <cstdint>
#include <optional>
#include <string>

namespace latch {

enum class LogLevel { Debug = 0, Info = 1, Warning = 2, Error = 3 };

llvm::StringRef getLogLevelName(LogLevel level);

/// Parse a level name ("debug", "info", "warning", "error").
std::optional<LogLevel> parseLogLevel(llvm::StringRef name);

/// Process-wide sink shared by all loggers.
class LogSink {
public:
  static LogSink &get();

  void setStream(llvm::raw_ostream &os) { stream = &os; }
  void resetStream() { stream = &llvm::errs(); }
  llvm::raw_ostream &getStream() { return *stream; }

  void setLevel(LogLevel level) { threshold = level; }
  LogLevel getLevel() const { return threshold; }

  /// The simulator publishes the cycle being evaluated.
  void setCycle(uint64_t c) { cycle = c; }
  uint64_t getCycle() const { return cycle; }

  unsigned getErrorCount() const { return errorCount; }
  void clearErrors() { errorCount = 0; }

  void emit(LogLevel level, llvm::StringRef logger, llvm::StringRef message);

private:
  LogSink() = default;

  llvm::raw_ostream *stream = &llvm::errs();
  LogLevel threshold = LogLevel::Warning;
  uint64_t cycle = 0;
  unsigned errorCount = 0;
};

class Logger {
public:
  explicit Logger(llvm::StringRef name) : name(name.str()) {}

  const std::string &getName() const { return name; }

  template <typename... Ts>
  void log(LogLevel level, bool trigger, const char *fmt, Ts &&...args) const {
    if (!trigger)
      return;
    // Errors are always counted, even when the message is filtered out.
    if (level < LogSink::get().getLevel() && level != LogLevel::Error)
      return;
    LogSink::get().emit(level, name,
                        llvm::formatv(fmt, std::forward<Ts>(args)...).str());
  }

  template <typename... Ts>
  void debug(bool trigger, const char *fmt, Ts &&...args) const {
    log(LogLevel::Debug, trigger, fmt, std::forward<Ts>(args)...);
  }

  template <typename... Ts>
  void info(bool trigger, const char *fmt, Ts &&...args) const {
    log(LogLevel::Info, trigger, fmt, std::forward<Ts>(args)...);
  }

  template <typename... Ts>
  void warning(bool trigger, const char *fmt, Ts &&...args) const {
    log(LogLevel::Warning, trigger, fmt, std::forward<Ts>(args)...);
  }

  template <typename... Ts>
  void error(bool trigger, const char *fmt, Ts &&...args) const {
    log(LogLevel::Error, trigger, fmt, std::forward<Ts>(args)...);
  }

  /// Log an error when `value` does not hold.
  void assertion(bool value, llvm::StringRef message) const {
    if (!value)
      LogSink::get().emit(LogLevel::Error, name, message);
  }

private:
  std::string name;
};

} // namespace latch

#endif // LATCH_SUPPORT_LOGGING_H
