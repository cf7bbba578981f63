//===- Component.h - Hardware components ------------------------*- C++ -*-===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//
//
// A Component groups the methods, internal transactions and state elements
// of one hardware block. Its state is only ever mutated from inside its own
// method and transaction bodies, and from its combinational hook.
//
//===----------------------------------------------------------------------===//

#ifndef LATCH_CORE_COMPONENT_H
#define LATCH_CORE_COMPONENT_H

#include "latch/Core/Action.h"
#include "latch/Core/Layout.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include <string>

namespace latch {

class StateElement;
class TransactionManager;

class Component {
public:
  Component(TransactionManager &manager, llvm::StringRef name);
  virtual ~Component();

  Component(const Component &) = delete;
  Component &operator=(const Component &) = delete;

  const std::string &getName() const { return name; }
  TransactionManager &getManager() const { return manager; }

  /// Logic evaluated after all granted bodies of the cycle ran and before the
  /// clock edge. Wires driven by bodies are visible here.
  virtual void combinational() {}

  /// Apply scheduled writes of every state element.
  void commitStateUpdates();

  /// Restore all state elements to their initial values.
  virtual void reset();

  llvm::ArrayRef<StateElement *> getStateElements() const { return state; }

protected:
  /// Define a method named "<component>.<name>".
  Method &defineMethod(llvm::StringRef name, Layout input = Layout(),
                       Layout output = Layout());

  /// Define an internal transaction named "<component>.<name>".
  Transaction &defineTransaction(llvm::StringRef name, int priority = 0);

private:
  friend class StateElement;
  void addStateElement(StateElement *element);
  void removeStateElement(StateElement *element);

  TransactionManager &manager;
  std::string name;
  llvm::SmallVector<StateElement *, 8> state;
};

} // namespace latch

#endif // LATCH_CORE_COMPONENT_H
