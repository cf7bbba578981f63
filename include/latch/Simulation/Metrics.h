//===- Metrics.h - Scheduling observers and counters ------------*- C++ -*-===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//
//
// Observers are notified after every executed cycle with the schedule that
// ran. They read the schedule only and never influence arbitration.
//
//===----------------------------------------------------------------------===//

#ifndef LATCH_SIMULATION_METRICS_H
#define LATCH_SIMULATION_METRICS_H

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace latch {

struct Schedule;
class TransactionManager;

using Statistics = std::map<std::string, std::map<std::string, uint64_t>>;

class ScheduleObserver {
public:
  virtual ~ScheduleObserver();

  virtual void onCycle(uint64_t cycle, const Schedule &schedule,
                       const TransactionManager &manager) = 0;
};

/// Histogram with power-of-two buckets. Bucket 0 holds 0 and 1, bucket `i`
/// holds values in [2^i, 2^(i+1)).
class ExpHistogram {
public:
  void add(uint64_t value);

  uint64_t getCount() const { return count; }
  uint64_t getSum() const { return sum; }
  uint64_t getMin() const { return count ? min : 0; }
  uint64_t getMax() const { return max; }
  llvm::ArrayRef<uint64_t> getBuckets() const { return buckets; }

  void print(llvm::raw_ostream &os) const;

private:
  llvm::SmallVector<uint64_t, 8> buckets;
  uint64_t count = 0;
  uint64_t sum = 0;
  uint64_t min = ~uint64_t(0);
  uint64_t max = 0;
};

/// Per-action scheduling counters.
class ActionMetrics : public ScheduleObserver {
public:
  struct Counters {
    uint64_t requested = 0;
    uint64_t runnable = 0;
    uint64_t granted = 0;
    /// Runnable but lost arbitration.
    uint64_t stalled = 0;
    uint64_t currentStall = 0;
    /// Lengths of finished runs of consecutive stalled cycles.
    ExpHistogram stallRuns;
  };

  void onCycle(uint64_t cycle, const Schedule &schedule,
               const TransactionManager &manager) override;

  /// Counters of the action named `name`, or null if it never was observed.
  const Counters *lookup(llvm::StringRef name) const;

  uint64_t getCycles() const { return cycles; }

  /// Append the counters to `stats`, one entry per action.
  void collect(Statistics &stats) const;

  void clear();

private:
  std::vector<std::string> names;
  std::vector<Counters> counters;
  uint64_t cycles = 0;
};

} // namespace latch

#endif // LATCH_SIMULATION_METRICS_H
