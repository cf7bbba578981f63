//===- SimConfig.h - Simulation configuration -------------------*- C++ -*-===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//
//
// This file defines the configuration of a cycle-level simulation.
//
//===----------------------------------------------------------------------===//

#ifndef LATCH_SIMULATION_SIMCONFIG_H
#define LATCH_SIMULATION_SIMCONFIG_H

#include "latch/Support/Logging.h"
#include <cstdint>

namespace latch {

/// Basic simulation configuration
struct SimConfig {
  /// Maximum number of cycles a run may take
  uint64_t maxCycles = 1000000;

  /// Print a line per cycle to stdout
  bool verbose = false;

  /// Collect per-action scheduling counters
  bool trackPerformance = true;

  /// Random seed for testbenches that generate stimuli
  uint64_t seed = 42;

  /// Threshold of the hardware logger
  LogLevel logLevel = LogLevel::Warning;

  /// Overlay LATCH_MAX_CYCLES, LATCH_VERBOSE and LATCH_LOG_LEVEL from the
  /// environment onto `defaults`. Malformed values are reported and ignored.
  static SimConfig fromEnvironment(const SimConfig &defaults);
  static SimConfig fromEnvironment();
};

} // namespace latch

#endif // LATCH_SIMULATION_SIMCONFIG_H
