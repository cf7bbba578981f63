//===- TransactionManager.cpp - Conflict-resolution scheduler -------------===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//

#include "latch/Core/TransactionManager.h"
#include "latch/Core/Component.h"
#include "latch/Core/ElaborationError.h"
#include "latch/Support/PriorityEncoder.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"
#include <algorithm>
#include <deque>
#include <optional>

#define DEBUG_TYPE "latch-scheduler"

namespace latch {

//===----------------------------------------------------------------------===//
// Schedule
//===----------------------------------------------------------------------===//

static bool testBit(const llvm::BitVector &bits, unsigned index) {
  return index < bits.size() && bits.test(index);
}

bool Schedule::isRequested(const Action &action) const {
  return testBit(requested, action.getID());
}

bool Schedule::isRunnable(const Action &action) const {
  return testBit(runnable, action.getID());
}

bool Schedule::isGranted(const Action &action) const {
  return testBit(granted, action.getID());
}

bool Schedule::operator==(const Schedule &other) const {
  return cycle == other.cycle && requested == other.requested &&
         runnable == other.runnable && granted == other.granted &&
         activeCallSites == other.activeCallSites &&
         grantedCallSites == other.grantedCallSites &&
         selectedCaller == other.selectedCaller &&
         earlyArguments == other.earlyArguments;
}

//===----------------------------------------------------------------------===//
// Registration
//===----------------------------------------------------------------------===//

TransactionManager::TransactionManager() = default;

TransactionManager::~TransactionManager() = default;

void TransactionManager::checkMutable(llvm::StringRef what) const {
  if (elaborated)
    llvm::report_fatal_error(llvm::Twine("Cannot ") + what +
                             " after elaboration");
}

Action &TransactionManager::registerAction(std::unique_ptr<Action> action) {
  Action *raw = action.get();
  if (!byName.try_emplace(raw->getName(), raw).second)
    duplicateNames.push_back(raw->getName());

  actions.push_back(raw);
  if (auto *method = llvm::dyn_cast<Method>(raw))
    methods.push_back(method);
  else
    transactions.push_back(llvm::cast<Transaction>(raw));
  ownedActions.push_back(std::move(action));
  return *raw;
}

Method &TransactionManager::createMethod(llvm::StringRef name, Layout input,
                                         Layout output, Component *owner) {
  checkMutable("create method '" + name.str() + "'");
  auto method = std::make_unique<Method>(*this, name, actions.size(),
                                         std::move(input), std::move(output),
                                         owner);
  LLVM_DEBUG(llvm::dbgs() << "Created method " << name << "\n");
  return llvm::cast<Method>(registerAction(std::move(method)));
}

Transaction &TransactionManager::createTransaction(llvm::StringRef name,
                                                   int priority,
                                                   Component *owner) {
  checkMutable("create transaction '" + name.str() + "'");
  auto txn = std::make_unique<Transaction>(*this, name, actions.size(),
                                           priority, owner);
  LLVM_DEBUG(llvm::dbgs() << "Created transaction " << name << " (priority "
                          << priority << ")\n");
  return llvm::cast<Transaction>(registerAction(std::move(txn)));
}

void TransactionManager::addConflict(Action &a, Action &b) {
  checkMutable("add conflict");
  if (&a.getManager() != this || &b.getManager() != this)
    llvm::report_fatal_error(llvm::Twine("Conflict between '") + a.getName() +
                             "' and '" + b.getName() +
                             "' spans different managers");
  explicitConflicts.emplace_back(&a, &b);
}

void TransactionManager::registerCallSite(CallSite *site) {
  callSites.push_back(site);
}

void TransactionManager::addComponent(Component *component) {
  checkMutable("add component '" + component->getName() + "'");
  components.push_back(component);
}

void TransactionManager::removeComponent(Component *component) {
  components.erase(
      std::remove(components.begin(), components.end(), component),
      components.end());
}

//===----------------------------------------------------------------------===//
// Elaboration
//===----------------------------------------------------------------------===//

llvm::Error TransactionManager::elaborate() {
  if (elaborated)
    return ElaborationError("scheduler")
        .setCategory(ErrorCategory::AlreadyElaborated)
        .setDetails("elaborate() called twice")
        .setSolution("elaborate once before the first cycle")
        .build();

  if (!duplicateNames.empty())
    return ElaborationError(duplicateNames.front())
        .setCategory(ErrorCategory::DuplicateName)
        .setDetails("name '" + duplicateNames.front() +
                    "' is used by more than one action")
        .setSolution("give every method and transaction a unique name")
        .build();

  if (llvm::Error err = verifyDefinitions())
    return err;
  if (llvm::Error err = verifyCallGraph())
    return err;
  if (llvm::Error err = computeClosures())
    return err;

  priorityOrder = transactions;
  std::stable_sort(priorityOrder.begin(), priorityOrder.end(),
                   [](const Transaction *a, const Transaction *b) {
                     if (a->getPriority() != b->getPriority())
                       return a->getPriority() > b->getPriority();
                     return a->getName() < b->getName();
                   });
  rank.clear();
  for (unsigned i = 0, e = priorityOrder.size(); i < e; ++i)
    rank[priorityOrder[i]->getID()] = i;

  if (llvm::Error err = computeConflicts())
    return err;

  computeConflictComponents();
  computeCallerOrder();

  elaborated = true;
  LLVM_DEBUG(llvm::dbgs() << "Elaborated " << methods.size() << " methods, "
                          << transactions.size() << " transactions, "
                          << callSites.size() << " call sites, "
                          << conflictComponents.size()
                          << " conflict components\n");
  return llvm::Error::success();
}

llvm::Error TransactionManager::verifyDefinitions() const {
  for (Action *action : actions) {
    if (action->hasBody())
      continue;
    return ElaborationError(action->getName())
        .setCategory(ErrorCategory::MissingDefinition)
        .setDetails(llvm::isa<Method>(action) ? "method has no body"
                                              : "transaction has no body")
        .setSolution("call setBody() before elaboration")
        .build();
  }
  return llvm::Error::success();
}

llvm::Error TransactionManager::verifyCallGraph() const {
  for (CallSite *site : callSites) {
    Action &caller = site->getCaller();
    Method &callee = site->getCallee();

    if (&callee.getManager() != this)
      return ElaborationError(caller.getName())
          .setCategory(ErrorCategory::InvalidCallSite)
          .setDetails("calls '" + callee.getName() +
                      "' owned by a different manager")
          .build();

    for (const auto &other : caller.getCallSites()) {
      if (other.get() == site)
        break;
      if (&other->getCallee() == &callee)
        return ElaborationError(caller.getName())
            .setCategory(ErrorCategory::MultipleCalls)
            .setDetails("declares more than one call to '" +
                        callee.getName() + "'")
            .setReason("a method runs at most once per cycle")
            .setSolution("merge the calls into a single call site")
            .build();
    }

    if (callee.needsEarlyArguments() && !site->hasEarlyArguments())
      return ElaborationError(caller.getName())
          .setCategory(ErrorCategory::InvalidCallSite)
          .setDetails("call to '" + callee.getName() +
                      "' does not supply early arguments")
          .setReason("the callee inspects its arguments before arbitration")
          .setSolution("use withArguments() on the call site")
          .build();
  }

  // Depth-first search for cycles; on a back edge the path from the stack is
  // reported.
  enum : char { Unvisited, OnStack, Done };
  std::vector<char> state(actions.size(), Unvisited);
  llvm::SmallVector<Action *, 8> stack;

  std::function<llvm::Error(Action *)> visit =
      [&](Action *action) -> llvm::Error {
    state[action->getID()] = OnStack;
    stack.push_back(action);
    for (const auto &site : action->getCallSites()) {
      Method &callee = site->getCallee();
      char calleeState = state[callee.getID()];
      if (calleeState == Done)
        continue;
      if (calleeState == OnStack) {
        std::string path;
        llvm::raw_string_ostream os(path);
        auto start = llvm::find(stack, &callee);
        for (auto it = start; it != stack.end(); ++it)
          os << (*it)->getName() << " -> ";
        os << callee.getName();
        return ElaborationError(callee.getName())
            .setCategory(ErrorCategory::CyclicCallGraph)
            .setDetails(os.str())
            .setReason("a method may not reach itself through calls")
            .setSolution("break the cycle")
            .build();
      }
      if (llvm::Error err = visit(&callee))
        return err;
    }
    stack.pop_back();
    state[action->getID()] = Done;
    return llvm::Error::success();
  };

  for (Action *action : actions)
    if (state[action->getID()] == Unvisited)
      if (llvm::Error err = visit(action))
        return err;
  return llvm::Error::success();
}

llvm::Error TransactionManager::computeClosures() {
  closures.clear();
  for (Transaction *txn : transactions) {
    llvm::BitVector reached(actions.size());
    reached.set(txn->getID());

    llvm::SmallVector<Action *, 8> worklist{txn};
    while (!worklist.empty()) {
      Action *action = worklist.pop_back_val();
      for (const auto &site : action->getCallSites()) {
        Method &callee = site->getCallee();
        if (reached.test(callee.getID()))
          return ElaborationError(txn->getName())
              .setCategory(ErrorCategory::MultipleCalls)
              .setDetails("reaches '" + callee.getName() +
                          "' through more than one path")
              .setReason("a method runs at most once per transaction")
              .setSolution("call the method from a single place")
              .build();
        reached.set(callee.getID());
        worklist.push_back(&callee);
      }
    }
    closures[txn->getID()] = std::move(reached);
  }
  return llvm::Error::success();
}

bool TransactionManager::isAlwaysReady(const Transaction &txn) const {
  if (txn.hasRequest())
    return false;
  const llvm::BitVector &closure = closures.find(txn.getID())->second;
  for (unsigned id : closure.set_bits()) {
    Action *action = actions[id];
    if (auto *method = llvm::dyn_cast<Method>(action))
      if (method->hasReady() || method->hasValidator())
        return false;
    for (const auto &site : action->getCallSites())
      if (site->isConditional())
        return false;
  }
  return true;
}

llvm::Error TransactionManager::computeConflicts() {
  llvm::BitVector exclusive(actions.size());
  for (Method *method : methods)
    if (!method->isNonexclusive())
      exclusive.set(method->getID());

  conflictMatrix.clear();
  for (Transaction *txn : transactions)
    conflictMatrix[txn->getID()] = llvm::BitVector(actions.size());

  // A transaction reaching both ends of a declared conflict would fire them
  // together whenever it is granted.
  for (Transaction *txn : transactions) {
    const llvm::BitVector &closure = closures[txn->getID()];
    for (const auto &pair : explicitConflicts) {
      Action *x = pair.first, *y = pair.second;
      if (x == y || !closure.test(x->getID()) || !closure.test(y->getID()))
        continue;
      return ElaborationError(txn->getName())
          .setCategory(ErrorCategory::ConflictingCalls)
          .setDetails("reaches both '" + x->getName() + "' and '" +
                      y->getName() + "', which are declared conflicting")
          .setReason("conflicting actions may not fire in the same cycle")
          .setSolution("split the calls across separate transactions")
          .build();
    }
  }

  auto markConflict = [&](Transaction *a, Transaction *b) {
    conflictMatrix[a->getID()].set(b->getID());
    conflictMatrix[b->getID()].set(a->getID());
  };

  for (unsigned i = 0, e = transactions.size(); i < e; ++i) {
    Transaction *a = transactions[i];
    const llvm::BitVector &closureA = closures[a->getID()];
    for (unsigned j = i + 1; j < e; ++j) {
      Transaction *b = transactions[j];
      const llvm::BitVector &closureB = closures[b->getID()];

      llvm::BitVector shared = closureA;
      shared &= closureB;
      shared &= exclusive;
      if (shared.any()) {
        markConflict(a, b);
        continue;
      }

      for (const auto &pair : explicitConflicts) {
        unsigned x = pair.first->getID(), y = pair.second->getID();
        if ((closureA.test(x) && closureB.test(y)) ||
            (closureA.test(y) && closureB.test(x))) {
          markConflict(a, b);
          break;
        }
      }
    }
  }

  for (unsigned i = 0, e = priorityOrder.size(); i + 1 < e; ++i) {
    Transaction *a = priorityOrder[i];
    for (unsigned j = i + 1; j < e; ++j) {
      Transaction *b = priorityOrder[j];
      if (a->getPriority() != b->getPriority())
        break;
      if (!conflictMatrix[a->getID()].test(b->getID()))
        continue;
      if (isAlwaysReady(*a) && isAlwaysReady(*b))
        return ElaborationError(a->getName())
            .setCategory(ErrorCategory::AmbiguousPriority)
            .setDetails("conflicts with '" + b->getName() +
                        "' at equal priority " +
                        std::to_string(a->getPriority()))
            .setReason("both are always ready, so one would starve")
            .setSolution("assign distinct priorities")
            .build();
    }
  }
  return llvm::Error::success();
}

void TransactionManager::computeConflictComponents() {
  conflictComponents.clear();
  llvm::BitVector assigned(actions.size());

  for (Transaction *root : priorityOrder) {
    if (assigned.test(root->getID()))
      continue;

    ConflictComponent component;
    std::deque<Transaction *> queue{root};
    assigned.set(root->getID());
    while (!queue.empty()) {
      Transaction *txn = queue.front();
      queue.pop_front();
      component.members.push_back(txn);
      for (unsigned id : conflictMatrix[txn->getID()].set_bits()) {
        if (assigned.test(id))
          continue;
        assigned.set(id);
        queue.push_back(llvm::cast<Transaction>(actions[id]));
      }
    }

    llvm::sort(component.members, [&](Transaction *a, Transaction *b) {
      return rank[a->getID()] < rank[b->getID()];
    });

    unsigned size = component.members.size();
    for (unsigned i = 0; i < size; ++i) {
      llvm::BitVector neighbours(size);
      const llvm::BitVector &row = conflictMatrix[component.members[i]->getID()];
      for (unsigned j = 0; j < size; ++j)
        if (row.test(component.members[j]->getID()))
          neighbours.set(j);
      component.neighbours.push_back(std::move(neighbours));
    }
    conflictComponents.push_back(std::move(component));
  }
}

void TransactionManager::computeCallerOrder() {
  // A call site ranks like the highest-priority transaction reaching its
  // caller; ties are broken by declaration order.
  llvm::DenseMap<unsigned, unsigned> siteRank;
  for (CallSite *site : callSites) {
    unsigned best = ~0u;
    for (Transaction *txn : priorityOrder) {
      if (closures[txn->getID()].test(site->getCaller().getID())) {
        best = rank[txn->getID()];
        break;
      }
    }
    siteRank[site->getID()] = best;
  }

  callerOrder.clear();
  for (Method *method : methods) {
    llvm::SmallVector<CallSite *, 4> order(method->getCallers().begin(),
                                           method->getCallers().end());
    std::stable_sort(order.begin(), order.end(),
                     [&](CallSite *a, CallSite *b) {
                       unsigned ra = siteRank[a->getID()];
                       unsigned rb = siteRank[b->getID()];
                       if (ra != rb)
                         return ra < rb;
                       return a->getID() < b->getID();
                     });
    callerOrder[method->getID()] = std::move(order);
  }
}

//===----------------------------------------------------------------------===//
// Scheduling
//===----------------------------------------------------------------------===//

bool TransactionManager::evaluateCallSiteReady(
    const CallSite &site, const Schedule &s,
    llvm::SmallVectorImpl<signed char> &memo) const {
  const Method &callee = site.getCallee();
  if (!evaluateBodyReady(callee, s, memo))
    return false;
  if (!callee.hasValidator())
    return true;
  const std::optional<Record> &args = s.earlyArguments[site.getID()];
  return args && callee.validate(*args);
}

bool TransactionManager::evaluateBodyReady(
    const Method &method, const Schedule &s,
    llvm::SmallVectorImpl<signed char> &memo) const {
  if (memo[method.getID()] >= 0)
    return memo[method.getID()];

  bool ready = method.evaluateReady();
  if (ready) {
    for (const auto &site : method.getCallSites()) {
      if (!s.activeCallSites.test(site->getID()))
        continue;
      if (!evaluateCallSiteReady(*site, s, memo)) {
        ready = false;
        break;
      }
    }
  }
  memo[method.getID()] = ready;
  return ready;
}

Schedule TransactionManager::schedule() {
  if (!elaborated)
    llvm::report_fatal_error("Cannot schedule before elaboration");
  if (executing)
    llvm::report_fatal_error("Cannot schedule while a cycle is executing");

  unsigned numActions = actions.size();
  unsigned numSites = callSites.size();

  Schedule s;
  s.cycle = cycle;
  s.requested.resize(numActions);
  s.runnable.resize(numActions);
  s.granted.resize(numActions);
  s.activeCallSites.resize(numSites);
  s.grantedCallSites.resize(numSites);
  s.selectedCaller.assign(numActions, -1);
  s.earlyArguments.resize(numSites);

  evaluating = &s;

  // Requests, call conditions and early arguments. Every call site is
  // evaluated at most once.
  llvm::BitVector expanded(numActions);
  std::function<void(Action &)> activate = [&](Action &action) {
    if (expanded.test(action.getID()))
      return;
    expanded.set(action.getID());
    for (const auto &site : action.getCallSites()) {
      if (!site->evaluateCondition())
        continue;
      s.activeCallSites.set(site->getID());
      Method &callee = site->getCallee();
      if (site->hasEarlyArguments()) {
        Record args = site->evaluateArguments();
        if (!(args.getLayout() == callee.getInputLayout()))
          llvm::report_fatal_error(
              llvm::Twine("Early arguments of call from '") +
              action.getName() + "' do not match the input layout of '" +
              callee.getName() + "'");
        s.earlyArguments[site->getID()] = std::move(args);
      }
      s.requested.set(callee.getID());
      activate(callee);
    }
  };
  for (Transaction *txn : priorityOrder) {
    if (!txn->evaluateRequest())
      continue;
    s.requested.set(txn->getID());
    activate(*txn);
  }

  // Readiness against committed state. Early arguments of this cycle are
  // visible through pendingArguments().
  llvm::SmallVector<signed char, 32> memo(numActions, -1);
  for (Method *method : methods)
    if (s.requested.test(method->getID()) &&
        evaluateBodyReady(*method, s, memo))
      s.runnable.set(method->getID());
  for (Transaction *txn : transactions) {
    if (!s.requested.test(txn->getID()))
      continue;
    bool ready = llvm::all_of(txn->getCallSites(), [&](const auto &site) {
      return !s.activeCallSites.test(site->getID()) ||
             evaluateCallSiteReady(*site, s, memo);
    });
    if (ready)
      s.runnable.set(txn->getID());
  }

  // Arbitration: inside every conflict component the highest-priority
  // runnable transaction wins and masks its neighbours.
  for (const ConflictComponent &component : conflictComponents) {
    unsigned size = component.members.size();
    llvm::BitVector candidates(size);
    for (unsigned i = 0; i < size; ++i)
      if (s.runnable.test(component.members[i]->getID()))
        candidates.set(i);

    while (true) {
      EncoderOutput winner = MultiPriorityEncoder::createSimple(candidates);
      if (!winner.valid)
        break;
      Transaction *txn = component.members[winner.index];
      s.granted.set(txn->getID());
      candidates.reset(winner.index);
      candidates.reset(component.neighbours[winner.index]);
    }
  }

  // Grants flow down the active call sites.
  std::function<void(Action &)> grant = [&](Action &action) {
    for (const auto &site : action.getCallSites()) {
      if (!s.activeCallSites.test(site->getID()))
        continue;
      s.grantedCallSites.set(site->getID());
      Method &callee = site->getCallee();
      if (s.granted.test(callee.getID()))
        continue;
      s.granted.set(callee.getID());
      grant(callee);
    }
  };
  for (Transaction *txn : priorityOrder)
    if (s.granted.test(txn->getID()))
      grant(*txn);

  // The driving caller is the first granted call site in caller order.
  for (Method *method : methods) {
    if (!s.granted.test(method->getID()))
      continue;
    const auto &order = callerOrder[method->getID()];
    llvm::BitVector callers(order.size());
    for (unsigned i = 0, e = order.size(); i < e; ++i)
      if (s.grantedCallSites.test(order[i]->getID()))
        callers.set(i);
    EncoderOutput first = MultiPriorityEncoder::createSimple(callers);
    if (first.valid)
      s.selectedCaller[method->getID()] = order[first.index]->getID();
  }

  evaluating = nullptr;

  LLVM_DEBUG({
    llvm::dbgs() << "Cycle " << cycle << " granted:";
    for (Transaction *txn : priorityOrder)
      if (s.granted.test(txn->getID()))
        llvm::dbgs() << " " << txn->getName();
    llvm::dbgs() << "\n";
  });
  return s;
}

//===----------------------------------------------------------------------===//
// Execution
//===----------------------------------------------------------------------===//

void TransactionManager::execute(const Schedule &schedule) {
  if (!elaborated)
    llvm::report_fatal_error("Cannot execute before elaboration");
  if (schedule.cycle != cycle)
    llvm::report_fatal_error(llvm::Twine("Schedule of cycle ") +
                             llvm::Twine(schedule.cycle) +
                             " executed in cycle " + llvm::Twine(cycle));

  lastSchedule = schedule;
  hasSchedule = true;

  for (Method *method : methods) {
    if (method->isNonexclusive() || !lastSchedule.granted.test(method->getID()))
      continue;
    unsigned grantedCallers = llvm::count_if(
        method->getCallers(), [&](CallSite *site) {
          return lastSchedule.grantedCallSites.test(site->getID());
        });
    if (grantedCallers > 1)
      llvm::report_fatal_error(llvm::Twine("Exclusive method '") +
                               method->getName() + "' granted to " +
                               llvm::Twine(grantedCallers) + " callers");
  }

  executing = true;
  invokedCallSites.clear();
  invokedCallSites.resize(callSites.size());
  results.assign(actions.size(), std::nullopt);

  for (Transaction *txn : priorityOrder) {
    if (!lastSchedule.granted.test(txn->getID()))
      continue;
    LLVM_DEBUG(llvm::dbgs() << "Executing " << txn->getName() << "\n");
    CallContext context(*this, *txn);
    txn->invoke(context);
  }

  for (CallSite *site : callSites)
    if (lastSchedule.grantedCallSites.test(site->getID()) &&
        !invokedCallSites.test(site->getID()))
      llvm::report_fatal_error(llvm::Twine("Granted call from '") +
                               site->getCaller().getName() + "' to '" +
                               site->getCallee().getName() +
                               "' was never performed");

  for (Component *component : components)
    component->combinational();

  executing = false;
}

Record TransactionManager::performCall(Action &caller, Method &callee,
                                       const Record *args) {
  if (!executing)
    llvm::report_fatal_error(llvm::Twine("Call to '") + callee.getName() +
                             "' outside of execution");

  CallSite *site = caller.findCallSite(callee);
  if (!site)
    llvm::report_fatal_error(llvm::Twine("'") + caller.getName() +
                             "' calls '" + callee.getName() +
                             "' without a declared call site");
  unsigned siteID = site->getID();
  if (!lastSchedule.grantedCallSites.test(siteID))
    llvm::report_fatal_error(llvm::Twine("Call from '") + caller.getName() +
                             "' to '" + callee.getName() +
                             "' was not granted this cycle");
  if (invokedCallSites.test(siteID))
    llvm::report_fatal_error(llvm::Twine("Call from '") + caller.getName() +
                             "' to '" + callee.getName() +
                             "' performed twice");
  invokedCallSites.set(siteID);

  Record actual;
  if (site->hasEarlyArguments()) {
    if (args)
      llvm::report_fatal_error(llvm::Twine("Call from '") + caller.getName() +
                               "' to '" + callee.getName() +
                               "' passes arguments twice");
    actual = *lastSchedule.earlyArguments[siteID];
  } else if (args) {
    if (!(args->getLayout() == callee.getInputLayout()))
      llvm::report_fatal_error(llvm::Twine("Arguments of call from '") +
                               caller.getName() +
                               "' do not match the input layout of '" +
                               callee.getName() + "'");
    actual = *args;
  } else {
    if (!callee.getInputLayout().empty())
      llvm::report_fatal_error(llvm::Twine("Call from '") + caller.getName() +
                               "' to '" + callee.getName() +
                               "' is missing arguments");
    actual = Record(callee.getInputLayout());
  }

  unsigned methodID = callee.getID();
  if (results[methodID]) {
    if (!callee.isNonexclusive())
      llvm::report_fatal_error(llvm::Twine("Exclusive method '") +
                               callee.getName() + "' executed twice");
    return *results[methodID];
  }

  // A nonexclusive method runs with the arguments of the selected caller,
  // whichever caller reaches it first.
  int selected = lastSchedule.selectedCaller[methodID];
  if (selected >= 0 && static_cast<unsigned>(selected) != siteID &&
      !callee.getInputLayout().empty())
    actual = *lastSchedule.earlyArguments[selected];

  if (!callee.evaluateReady())
    llvm::report_fatal_error(llvm::Twine("Method '") + callee.getName() +
                             "' executed while not ready");
  if (!callee.validate(actual))
    llvm::report_fatal_error(llvm::Twine("Method '") + callee.getName() +
                             "' rejected its arguments after being granted");

  LLVM_DEBUG(llvm::dbgs() << "  " << caller.getName() << " -> "
                          << callee.getName() << "\n");
  CallContext context(*this, callee);
  Record result = callee.invoke(context, actual);
  if (!(result.getLayout() == callee.getOutputLayout()))
    llvm::report_fatal_error(llvm::Twine("Result of '") + callee.getName() +
                             "' does not match its output layout");
  results[methodID] = result;
  return result;
}

void TransactionManager::commitStateUpdates() {
  if (executing)
    llvm::report_fatal_error("Cannot commit while a cycle is executing");
  for (Component *component : components)
    component->commitStateUpdates();
  LLVM_DEBUG(llvm::dbgs() << "Committed cycle " << cycle << "\n");
  ++cycle;
}

void TransactionManager::reset() {
  for (Component *component : components)
    component->reset();
  cycle = 0;
  lastSchedule = Schedule();
  hasSchedule = false;
}

//===----------------------------------------------------------------------===//
// Queries
//===----------------------------------------------------------------------===//

bool TransactionManager::conflicts(const Transaction &a,
                                   const Transaction &b) const {
  auto it = conflictMatrix.find(a.getID());
  if (it == conflictMatrix.end())
    return false;
  return it->second.test(b.getID());
}

bool TransactionManager::isGranted(const Action &action) const {
  return hasSchedule && lastSchedule.isGranted(action);
}

Action *TransactionManager::lookup(llvm::StringRef name) const {
  auto it = byName.find(name);
  return it == byName.end() ? nullptr : it->second;
}

llvm::SmallVector<Record, 2>
TransactionManager::pendingArguments(const Method &method) const {
  llvm::SmallVector<Record, 2> pending;
  const Schedule *s = evaluating ? evaluating
                                 : (hasSchedule ? &lastSchedule : nullptr);
  if (!s)
    return pending;
  for (CallSite *site : method.getCallers()) {
    unsigned id = site->getID();
    if (testBit(s->activeCallSites, id) && s->earlyArguments[id])
      pending.push_back(*s->earlyArguments[id]);
  }
  return pending;
}

} // namespace latch
