//===- Simulator.cpp - Cycle-level simulation driver ----------------------===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//

#include "latch/Simulation/Simulator.h"
#include "latch/Core/TransactionManager.h"
#include "latch/Support/Logging.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

#define DEBUG_TYPE "latch-simulator"

namespace latch {

Simulator::Simulator(TransactionManager &manager, SimConfig config)
    : manager(manager), config(config) {
  if (config.trackPerformance) {
    metrics = std::make_unique<ActionMetrics>();
    observers.push_back(metrics.get());
  }
  LogSink::get().setLevel(config.logLevel);
}

void Simulator::ensureElaborated() {
  if (manager.isElaborated())
    return;
  if (llvm::Error err = manager.elaborate())
    llvm::report_fatal_error(std::move(err));
}

void Simulator::step() {
  ensureElaborated();

  uint64_t cycle = manager.getCycle();
  LogSink &sink = LogSink::get();
  sink.setCycle(cycle);
  unsigned errorsBefore = sink.getErrorCount();

  Schedule schedule = manager.schedule();
  manager.execute(schedule);
  for (ScheduleObserver *observer : observers)
    observer->onCycle(cycle, schedule, manager);
  manager.commitStateUpdates();
  ++cyclesRun;

  if (config.verbose) {
    std::string line;
    llvm::raw_string_ostream os(line);
    os << "granted:";
    for (Transaction *txn : manager.getPriorityOrder())
      if (schedule.isGranted(*txn))
        os << " " << txn->getName();
    llvm::outs() << "[SIM @ " << cycle << "] " << os.str() << "\n";
  } else {
    LLVM_DEBUG(llvm::dbgs() << "Stepped cycle " << cycle << "\n");
  }

  if (sink.getErrorCount() != errorsBefore) {
    failed = true;
    debugPrint("Simulation failed: error logged");
  }
}

bool Simulator::run(uint64_t cycles) {
  for (uint64_t i = 0; i < cycles; ++i) {
    if (cyclesRun >= config.maxCycles) {
      debugPrint("Simulation stopped: maximum cycles reached");
      return false;
    }
    step();
    if (failed)
      return false;
  }
  return true;
}

bool Simulator::runUntil(const std::function<bool()> &done) {
  while (!done()) {
    if (cyclesRun >= config.maxCycles) {
      debugPrint("Simulation stopped: maximum cycles reached");
      return false;
    }
    step();
    if (failed)
      return false;
  }
  return true;
}

void Simulator::reset() {
  manager.reset();
  if (metrics)
    metrics->clear();
  cyclesRun = 0;
  failed = false;
}

uint64_t Simulator::getCycle() const { return manager.getCycle(); }

void Simulator::addObserver(ScheduleObserver &observer) {
  observers.push_back(&observer);
}

Statistics Simulator::getStatistics() const {
  Statistics stats;
  if (metrics)
    metrics->collect(stats);
  stats["_global"]["cycles"] = cyclesRun;
  stats["_global"]["failed"] = failed;
  return stats;
}

void Simulator::debugPrint(llvm::StringRef message) {
  if (config.verbose)
    llvm::outs() << "[SIM @ " << manager.getCycle() << "] " << message << "\n";
  LLVM_DEBUG(llvm::dbgs() << message << "\n");
}

} // namespace latch
