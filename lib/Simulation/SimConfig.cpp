//===- SimConfig.cpp - Simulation configuration ---------------------------===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//

#include "latch/Simulation/SimConfig.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/Process.h"
#include <optional>

namespace latch {

static const Logger configLog("config");

SimConfig SimConfig::fromEnvironment() { return fromEnvironment(SimConfig()); }

SimConfig SimConfig::fromEnvironment(const SimConfig &defaults) {
  SimConfig config = defaults;

  if (auto value = llvm::sys::Process::GetEnv("LATCH_MAX_CYCLES")) {
    uint64_t cycles;
    if (llvm::StringRef(*value).trim().getAsInteger(10, cycles) || !cycles)
      configLog.warning(true, "ignoring LATCH_MAX_CYCLES='{0}'", *value);
    else
      config.maxCycles = cycles;
  }

  if (auto value = llvm::sys::Process::GetEnv("LATCH_VERBOSE")) {
    std::optional<bool> verbose =
        llvm::StringSwitch<std::optional<bool>>(
            llvm::StringRef(*value).trim().lower())
            .Cases("1", "true", "on", "yes", true)
            .Cases("0", "false", "off", "no", "", false)
            .Default(std::nullopt);
    if (verbose)
      config.verbose = *verbose;
    else
      configLog.warning(true, "ignoring LATCH_VERBOSE='{0}'", *value);
  }

  if (auto value = llvm::sys::Process::GetEnv("LATCH_LOG_LEVEL")) {
    if (auto level = parseLogLevel(llvm::StringRef(*value).trim()))
      config.logLevel = *level;
    else
      configLog.warning(true, "ignoring LATCH_LOG_LEVEL='{0}'", *value);
  }

  return config;
}

} // namespace latch
