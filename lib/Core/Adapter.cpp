//===- Adapter.cpp - Testbench access to methods --------------------------===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//

#include "latch/Core/Adapter.h"
#include "latch/Core/TransactionManager.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/ErrorHandling.h"

namespace latch {

Adapter::Adapter(TransactionManager &manager, llvm::StringRef name,
                 Method &target, int priority)
    : Component(manager, name), target(target),
      transaction(defineTransaction("call", priority)),
      arguments(target.getInputLayout()), outputs(target.getOutputLayout()) {
  transaction.setRequest([this] { return armed || enabled; });
  transaction.calls(target).withArguments([this] { return arguments; });
  transaction.setBody([this](CallContext &ctx) {
    outputs = ctx.call(this->target);
    armed = false;
  });
}

void Adapter::checkArguments(const Record &args) const {
  if (!(args.getLayout() == target.getInputLayout()))
    llvm::report_fatal_error(llvm::Twine("Adapter '") + getName() +
                             "' given arguments not matching '" +
                             target.getName() + "'");
}

void Adapter::call(const Record &args) {
  checkArguments(args);
  arguments = args;
  armed = true;
}

void Adapter::enable(const Record &args) {
  checkArguments(args);
  arguments = args;
  enabled = true;
}

void Adapter::disable() {
  enabled = false;
  armed = false;
}

bool Adapter::done() const { return transaction.isGranted(); }

} // namespace latch
