//===- Simulator.h - Cycle-level simulation driver --------------*- C++ -*-===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//
//
// The Simulator clocks a TransactionManager: every step schedules, executes
// and commits one cycle, then notifies the observers.
//
//===----------------------------------------------------------------------===//

#ifndef LATCH_SIMULATION_SIMULATOR_H
#define LATCH_SIMULATION_SIMULATOR_H

#include "latch/Simulation/Metrics.h"
#include "latch/Simulation/SimConfig.h"
#include <cstdint>
#include <functional>
#include <memory>

namespace latch {

class TransactionManager;

class Simulator {
public:
  explicit Simulator(TransactionManager &manager, SimConfig config = {});

  /// Evaluate one clock cycle. Elaborates the manager on first use; a
  /// configuration error is fatal.
  void step();

  /// Run `cycles` cycles, stopping early at the cycle limit. Returns false
  /// if the cycle limit was hit or an error was logged.
  bool run(uint64_t cycles);

  /// Step until `done` returns true. Returns false if the cycle limit was
  /// reached first or an error was logged.
  bool runUntil(const std::function<bool()> &done);

  /// Restore every component and clear the counters.
  void reset();

  uint64_t getCycle() const;

  /// Whether an error was logged or an assertion failed during a step.
  bool hasFailed() const { return failed; }

  /// Register an observer. The simulator does not take ownership.
  void addObserver(ScheduleObserver &observer);

  /// Counters per action plus "_global" entries.
  Statistics getStatistics() const;

  const ActionMetrics *getMetrics() const { return metrics.get(); }
  const SimConfig &getConfig() const { return config; }
  TransactionManager &getManager() const { return manager; }

private:
  void ensureElaborated();
  void debugPrint(llvm::StringRef message);

  TransactionManager &manager;
  SimConfig config;
  std::unique_ptr<ActionMetrics> metrics;
  llvm::SmallVector<ScheduleObserver *, 2> observers;
  uint64_t cyclesRun = 0;
  bool failed = false;
};

} // namespace latch

#endif // LATCH_SIMULATION_SIMULATOR_H
