//===- Adapter.h - Testbench access to methods ------------------*- C++ -*-===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//
//
// An Adapter lets a testbench drive a method as if it were a transaction.
// It owns one transaction calling the target with arguments provided by the
// test, and records the outputs of the last granted call.
//
//===----------------------------------------------------------------------===//

#ifndef LATCH_CORE_ADAPTER_H
#define LATCH_CORE_ADAPTER_H

#include "latch/Core/Component.h"
#include "latch/Core/Layout.h"

namespace latch {

class Adapter : public Component {
public:
  Adapter(TransactionManager &manager, llvm::StringRef name, Method &target,
          int priority = 0);

  /// Request a single call with `args` in the next evaluated cycle. The
  /// request stays armed until the scheduler grants it.
  void call(const Record &args);
  void call() { call(Record(target.getInputLayout())); }

  /// Request a call every cycle until disabled.
  void enable(const Record &args);
  void enable() { enable(Record(target.getInputLayout())); }
  void disable();

  /// Whether the call was granted in the last executed cycle.
  bool done() const;

  /// Outputs of the last granted call.
  const Record &getOutputs() const { return outputs; }

  Transaction &getTransaction() const { return transaction; }
  Method &getTarget() const { return target; }

private:
  void checkArguments(const Record &args) const;

  Method &target;
  Transaction &transaction;
  Record arguments;
  Record outputs;
  bool armed = false;
  bool enabled = false;
};

} // namespace latch

#endif // LATCH_CORE_ADAPTER_H
