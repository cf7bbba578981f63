//===- TransactionManager.h - Conflict-resolution scheduler -----*- C++ -*-===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//
//
// The TransactionManager owns every method and transaction, derives the
// static conflict relation from the call graph, and computes once per cycle
// the conflict-free, priority-respecting set of actions that fire.
//
// A cycle is evaluated in two phases:
//   1. schedule(): requests, call conditions, early arguments and readiness
//      are evaluated against committed state, then arbitration picks the
//      winners inside every conflict component and grants are propagated
//      down the call graph.
//   2. execute(): granted transaction bodies run in priority order and call
//      their methods; afterwards every component's combinational logic runs.
// commitStateUpdates() then applies all scheduled writes (the clock edge).
//
//===----------------------------------------------------------------------===//

#ifndef LATCH_CORE_TRANSACTIONMANAGER_H
#define LATCH_CORE_TRANSACTIONMANAGER_H

#include "latch/Core/Action.h"
#include "latch/Core/Layout.h"
#include "llvm/ADT/BitVector.h"
#include "llvm/ADT/DenseMap.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/Support/Error.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace latch {

class Component;

/// The scheduling decision for one cycle. Bit vectors are indexed by action
/// id or call site id.
struct Schedule {
  uint64_t cycle = 0;

  /// Transactions: request predicate holds. Methods: called through an
  /// active call site of a requesting caller.
  llvm::BitVector requested;
  /// Transactions: requesting and all active callees ready. Methods: own
  /// readiness and all active callees ready.
  llvm::BitVector runnable;
  llvm::BitVector granted;

  llvm::BitVector activeCallSites;
  llvm::BitVector grantedCallSites;
  /// Per action id: the call site whose arguments drive the method body, or
  /// -1 when the method does not fire.
  llvm::SmallVector<int, 16> selectedCaller;
  /// Per call site id: arguments supplied before arbitration.
  std::vector<std::optional<Record>> earlyArguments;

  bool isRequested(const Action &action) const;
  bool isRunnable(const Action &action) const;
  bool isGranted(const Action &action) const;

  bool operator==(const Schedule &other) const;
  bool operator!=(const Schedule &other) const { return !(*this == other); }
};

class TransactionManager {
public:
  TransactionManager();
  ~TransactionManager();

  TransactionManager(const TransactionManager &) = delete;
  TransactionManager &operator=(const TransactionManager &) = delete;

  //===--------------------------------------------------------------------===//
  // Registration
  //===--------------------------------------------------------------------===//

  Method &createMethod(llvm::StringRef name, Layout input = Layout(),
                       Layout output = Layout(), Component *owner = nullptr);
  Transaction &createTransaction(llvm::StringRef name, int priority = 0,
                                 Component *owner = nullptr);

  /// Declare that `a` and `b` share a resource and may not fire in the same
  /// cycle. The conflict is lifted to every pair of transactions reaching
  /// them through the call graph.
  void addConflict(Action &a, Action &b);

  /// Validate and flatten the call graph. Must succeed before the first
  /// cycle; afterwards the call graph is immutable.
  llvm::Error elaborate();
  bool isElaborated() const { return elaborated; }

  //===--------------------------------------------------------------------===//
  // Cycle evaluation
  //===--------------------------------------------------------------------===//

  /// Compute the schedule of the current cycle. Has no effect on state.
  Schedule schedule();

  /// Run the bodies of the granted actions and the combinational logic.
  void execute(const Schedule &schedule);

  /// Clock edge: commit every component's state and advance the cycle.
  void commitStateUpdates();

  /// Restore all components and the cycle counter.
  void reset();

  uint64_t getCycle() const { return cycle; }

  //===--------------------------------------------------------------------===//
  // Queries
  //===--------------------------------------------------------------------===//

  /// Static conflict relation between two transactions.
  bool conflicts(const Transaction &a, const Transaction &b) const;

  /// Whether `action` is granted in the schedule being executed, or in the
  /// last executed one.
  bool isGranted(const Action &action) const;

  const Schedule &getLastSchedule() const { return lastSchedule; }

  Action *lookup(llvm::StringRef name) const;

  llvm::ArrayRef<Action *> getActions() const { return actions; }
  llvm::ArrayRef<Method *> getMethods() const { return methods; }
  llvm::ArrayRef<Transaction *> getTransactions() const { return transactions; }
  llvm::ArrayRef<CallSite *> getCallSites() const { return callSites; }
  llvm::ArrayRef<Component *> getComponents() const { return components; }

  /// Transactions ordered from highest to lowest static priority.
  llvm::ArrayRef<Transaction *> getPriorityOrder() const {
    return priorityOrder;
  }

  /// Number of connected components of the conflict graph.
  unsigned getNumConflictComponents() const { return conflictComponents.size(); }

  /// Early arguments of the active call sites of `method` whose caller
  /// requests in the cycle being evaluated. Readiness predicates may use this
  /// to refuse calls that coincide with specific requests.
  llvm::SmallVector<Record, 2> pendingArguments(const Method &method) const;

private:
  friend class Action;
  friend class CallContext;
  friend class Component;

  struct ConflictComponent {
    /// Members in priority order.
    llvm::SmallVector<Transaction *, 4> members;
    /// Conflict neighbours of every member, indexed by member position.
    llvm::SmallVector<llvm::BitVector, 4> neighbours;
  };

  void addComponent(Component *component);
  void removeComponent(Component *component);
  void registerCallSite(CallSite *site);
  void checkMutable(llvm::StringRef what) const;
  Action &registerAction(std::unique_ptr<Action> action);

  llvm::Error verifyDefinitions() const;
  llvm::Error verifyCallGraph() const;
  llvm::Error computeClosures();
  llvm::Error computeConflicts();
  void computeConflictComponents();
  void computeCallerOrder();
  bool isAlwaysReady(const Transaction &txn) const;

  bool evaluateBodyReady(const Method &method, const Schedule &s,
                         llvm::SmallVectorImpl<signed char> &memo) const;
  bool evaluateCallSiteReady(const CallSite &site, const Schedule &s,
                             llvm::SmallVectorImpl<signed char> &memo) const;

  Record performCall(Action &caller, Method &callee, const Record *args);

  std::vector<std::unique_ptr<Action>> ownedActions;
  std::vector<Action *> actions;
  std::vector<Method *> methods;
  std::vector<Transaction *> transactions;
  std::vector<CallSite *> callSites;
  std::vector<Component *> components;
  llvm::StringMap<Action *> byName;
  llvm::SmallVector<std::string, 2> duplicateNames;
  llvm::SmallVector<std::pair<Action *, Action *>, 4> explicitConflicts;

  bool elaborated = false;

  /// Per transaction id: every action reachable from it, itself included.
  llvm::DenseMap<unsigned, llvm::BitVector> closures;
  /// Per transaction id: conflicting transactions (by action id).
  llvm::DenseMap<unsigned, llvm::BitVector> conflictMatrix;
  std::vector<Transaction *> priorityOrder;
  llvm::DenseMap<unsigned, unsigned> rank;
  std::vector<ConflictComponent> conflictComponents;
  /// Per method id: call sites targeting it in static priority order.
  llvm::DenseMap<unsigned, llvm::SmallVector<CallSite *, 4>> callerOrder;

  uint64_t cycle = 0;
  Schedule lastSchedule;
  bool hasSchedule = false;
  const Schedule *evaluating = nullptr;
  bool executing = false;
  llvm::BitVector invokedCallSites;
  std::vector<std::optional<Record>> results;
};

} // namespace latch

#endif // LATCH_CORE_TRANSACTIONMANAGER_H
