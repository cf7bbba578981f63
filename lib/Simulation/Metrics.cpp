//===- Metrics.cpp - Scheduling observers and counters --------------------===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//

#include "latch/Simulation/Metrics.h"
#include "latch/Core/TransactionManager.h"
#include "llvm/Support/MathExtras.h"
#include <algorithm>

namespace latch {

ScheduleObserver::~ScheduleObserver() = default;

//===----------------------------------------------------------------------===//
// ExpHistogram
//===----------------------------------------------------------------------===//

void ExpHistogram::add(uint64_t value) {
  unsigned bucket = value <= 1 ? 0 : llvm::Log2_64(value);
  if (buckets.size() <= bucket)
    buckets.resize(bucket + 1, 0);
  ++buckets[bucket];
  ++count;
  sum += value;
  min = std::min(min, value);
  max = std::max(max, value);
}

void ExpHistogram::print(llvm::raw_ostream &os) const {
  os << "count=" << count << " sum=" << sum << " min=" << getMin()
     << " max=" << max << "\n";
  for (unsigned i = 0, e = buckets.size(); i < e; ++i) {
    uint64_t low = i == 0 ? 0 : uint64_t(1) << i;
    uint64_t high = (uint64_t(1) << (i + 1)) - 1;
    os << "  [" << low << ", " << high << "]: " << buckets[i] << "\n";
  }
}

//===----------------------------------------------------------------------===//
// ActionMetrics
//===----------------------------------------------------------------------===//

void ActionMetrics::onCycle(uint64_t cycle, const Schedule &schedule,
                            const TransactionManager &manager) {
  (void)cycle;
  llvm::ArrayRef<Action *> actions = manager.getActions();
  if (counters.size() < actions.size()) {
    counters.resize(actions.size());
    names.resize(actions.size());
    for (Action *action : actions)
      names[action->getID()] = action->getName();
  }

  ++cycles;
  for (Action *action : actions) {
    Counters &c = counters[action->getID()];
    bool runnable = schedule.isRunnable(*action);
    bool granted = schedule.isGranted(*action);
    c.requested += schedule.isRequested(*action);
    c.runnable += runnable;
    c.granted += granted;

    if (runnable && !granted) {
      ++c.stalled;
      ++c.currentStall;
    } else if (c.currentStall) {
      c.stallRuns.add(c.currentStall);
      c.currentStall = 0;
    }
  }
}

const ActionMetrics::Counters *
ActionMetrics::lookup(llvm::StringRef name) const {
  auto it = std::find(names.begin(), names.end(), name);
  if (it == names.end())
    return nullptr;
  return &counters[it - names.begin()];
}

void ActionMetrics::collect(Statistics &stats) const {
  for (unsigned i = 0, e = counters.size(); i < e; ++i) {
    const Counters &c = counters[i];
    auto &entry = stats[names[i]];
    entry["requested"] = c.requested;
    entry["runnable"] = c.runnable;
    entry["granted"] = c.granted;
    entry["stalled"] = c.stalled;
    entry["max_stall_run"] = std::max(c.stallRuns.getMax(), c.currentStall);
  }
}

void ActionMetrics::clear() {
  names.clear();
  counters.clear();
  cycles = 0;
}

} // namespace latch
