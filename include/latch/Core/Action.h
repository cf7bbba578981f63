//===- Action.h - Methods, transactions and call sites ----------*- C++ -*-===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//
//
// This file declares the guarded atomic actions handled by the scheduler.
//
// A Method is an action other actions may call. It has a readiness predicate,
// an input and output layout, and a body which runs at most once per cycle
// with the arguments of the single caller selected by the scheduler.
//
// A Transaction is a top-level action with a request predicate and a static
// priority. Its body runs iff the scheduler grants it.
//
// Every call is declared up front through a CallSite so that the call graph
// is known before the first cycle.
//
//===----------------------------------------------------------------------===//

#ifndef LATCH_CORE_ACTION_H
#define LATCH_CORE_ACTION_H

#include "latch/Core/Layout.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Casting.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace latch {

class Action;
class CallContext;
class Component;
class Method;
class TransactionManager;

using PredicateFn = std::function<bool()>;
using ValidatorFn = std::function<bool(const Record &)>;
using ArgumentsFn = std::function<Record()>;
using MethodBodyFn = std::function<Record(CallContext &, const Record &)>;
using TransactionBodyFn = std::function<void(CallContext &)>;

/// A statically declared call from one action to a method.
class CallSite {
  friend class Action;

  /// Only actions declare call sites.
  class Key {
    friend class Action;
    Key() = default;
  };

public:
  CallSite(Key, Action &caller, Method &callee, unsigned id)
      : caller(caller), callee(callee), id(id) {}

  Action &getCaller() const { return caller; }
  Method &getCallee() const { return callee; }
  unsigned getID() const { return id; }

  /// Make the call conditional. The condition is evaluated before
  /// arbitration; when it is false the callee's readiness is not required and
  /// the caller must not perform the call.
  CallSite &when(PredicateFn condition);

  /// Provide the arguments before arbitration. Required for callees that
  /// validate their arguments or otherwise need them early.
  CallSite &withArguments(ArgumentsFn arguments);

  bool isConditional() const { return static_cast<bool>(condition); }
  bool hasEarlyArguments() const { return static_cast<bool>(arguments); }

  bool evaluateCondition() const { return !condition || condition(); }
  Record evaluateArguments() const { return arguments(); }

private:
  Action &caller;
  Method &callee;
  unsigned id;
  PredicateFn condition;
  ArgumentsFn arguments;
};

/// Common part of methods and transactions.
class Action {
public:
  enum class Kind { Method, Transaction };

  virtual ~Action();

  Action(const Action &) = delete;
  Action &operator=(const Action &) = delete;

  Kind getKind() const { return kind; }
  const std::string &getName() const { return name; }
  unsigned getID() const { return id; }
  int getPriority() const { return priority; }
  TransactionManager &getManager() const { return manager; }
  Component *getOwner() const { return owner; }

  /// Declare a call from this action to `callee`.
  CallSite &calls(Method &callee);

  llvm::ArrayRef<std::unique_ptr<CallSite>> getCallSites() const {
    return callSites;
  }

  /// The call site of this action targeting `callee`, or null.
  CallSite *findCallSite(const Method &callee) const;

  /// Whether the scheduler granted this action in the current cycle.
  bool isGranted() const;

  virtual bool hasBody() const = 0;

protected:
  Action(Kind kind, TransactionManager &manager, llvm::StringRef name,
         unsigned id, int priority, Component *owner);

  /// Fail if the call graph is already frozen.
  void checkMutable(llvm::StringRef what) const;

private:
  Kind kind;
  TransactionManager &manager;
  std::string name;
  unsigned id;
  int priority;
  Component *owner;
  std::vector<std::unique_ptr<CallSite>> callSites;
};

class Method : public Action {
public:
  Method(TransactionManager &manager, llvm::StringRef name, unsigned id,
         Layout input, Layout output, Component *owner);

  static bool classof(const Action *action) {
    return action->getKind() == Kind::Method;
  }

  const Layout &getInputLayout() const { return input; }
  const Layout &getOutputLayout() const { return output; }

  Method &setReady(PredicateFn ready);
  Method &setBody(MethodBodyFn body);
  Method &setValidator(ValidatorFn validator);

  /// Allow several callers in one cycle. The body still runs once, with the
  /// arguments of the highest-priority caller.
  Method &setNonexclusive();

  /// Require every caller to supply its arguments before arbitration.
  Method &requireEarlyArguments();

  bool hasReady() const { return static_cast<bool>(ready); }
  bool hasValidator() const { return static_cast<bool>(validator); }
  bool hasBody() const override { return static_cast<bool>(body); }
  bool isNonexclusive() const { return nonexclusive; }
  bool needsEarlyArguments() const;

  /// The method's own readiness, ignoring its callees.
  bool evaluateReady() const { return !ready || ready(); }
  bool validate(const Record &args) const {
    return !validator || validator(args);
  }

  Record invoke(CallContext &context, const Record &args) const {
    return body(context, args);
  }

  /// Call sites targeting this method.
  llvm::ArrayRef<CallSite *> getCallers() const { return callers; }

private:
  friend class Action;

  Layout input;
  Layout output;
  PredicateFn ready;
  MethodBodyFn body;
  ValidatorFn validator;
  bool nonexclusive = false;
  bool earlyArguments = false;
  llvm::SmallVector<CallSite *, 4> callers;
};

class Transaction : public Action {
public:
  Transaction(TransactionManager &manager, llvm::StringRef name, unsigned id,
              int priority, Component *owner);

  static bool classof(const Action *action) {
    return action->getKind() == Kind::Transaction;
  }

  Transaction &setRequest(PredicateFn request);
  Transaction &setBody(TransactionBodyFn body);

  bool hasRequest() const { return static_cast<bool>(request); }
  bool hasBody() const override { return static_cast<bool>(body); }

  bool evaluateRequest() const { return !request || request(); }

  void invoke(CallContext &context) const { body(context); }

private:
  PredicateFn request;
  TransactionBodyFn body;
};

/// Handle given to a body while it executes. All method calls go through it.
class CallContext {
public:
  Action &getAction() const { return action; }
  uint64_t getCycle() const;

  /// Call `callee` with explicit arguments.
  Record call(Method &callee, const Record &args);

  /// Call `callee` with the call site's early arguments, or with no
  /// arguments when the callee takes none.
  Record call(Method &callee);

private:
  friend class TransactionManager;
  CallContext(TransactionManager &manager, Action &action)
      : manager(manager), action(action) {}

  TransactionManager &manager;
  Action &action;
};

} // namespace latch

#endif // LATCH_CORE_ACTION_H
