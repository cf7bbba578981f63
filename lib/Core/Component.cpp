//===- Component.cpp - Hardware components --------------------------------===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//

#include "latch/Core/Component.h"
#include "latch/Core/State.h"
#include "latch/Core/TransactionManager.h"
#include "llvm/ADT/Twine.h"
#include <algorithm>

namespace latch {

Component::Component(TransactionManager &manager, llvm::StringRef name)
    : manager(manager), name(name.str()) {
  manager.addComponent(this);
}

Component::~Component() { manager.removeComponent(this); }

void Component::commitStateUpdates() {
  for (auto *element : state)
    element->commit();
}

void Component::reset() {
  for (auto *element : state)
    element->reset();
}

Method &Component::defineMethod(llvm::StringRef methodName, Layout input,
                                Layout output) {
  return manager.createMethod((llvm::Twine(name) + "." + methodName).str(),
                              std::move(input), std::move(output), this);
}

Transaction &Component::defineTransaction(llvm::StringRef txnName,
                                          int priority) {
  return manager.createTransaction((llvm::Twine(name) + "." + txnName).str(),
                                   priority, this);
}

void Component::addStateElement(StateElement *element) {
  state.push_back(element);
}

void Component::removeStateElement(StateElement *element) {
  state.erase(std::remove(state.begin(), state.end(), element), state.end());
}

} // namespace latch
