//===- Action.cpp - Methods, transactions and call sites ------------------===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//

#include "latch/Core/Action.h"
#include "latch/Core/TransactionManager.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/ErrorHandling.h"

namespace latch {

//===----------------------------------------------------------------------===//
// CallSite
//===----------------------------------------------------------------------===//

CallSite &CallSite::when(PredicateFn condition) {
  if (caller.getManager().isElaborated())
    llvm::report_fatal_error(llvm::Twine("Cannot make call from '") +
                             caller.getName() +
                             "' conditional after elaboration");
  this->condition = std::move(condition);
  return *this;
}

CallSite &CallSite::withArguments(ArgumentsFn arguments) {
  if (caller.getManager().isElaborated())
    llvm::report_fatal_error(llvm::Twine("Cannot set arguments of call from '") +
                             caller.getName() + "' after elaboration");
  this->arguments = std::move(arguments);
  return *this;
}

//===----------------------------------------------------------------------===//
// Action
//===----------------------------------------------------------------------===//

Action::Action(Kind kind, TransactionManager &manager, llvm::StringRef name,
               unsigned id, int priority, Component *owner)
    : kind(kind), manager(manager), name(name.str()), id(id),
      priority(priority), owner(owner) {}

Action::~Action() = default;

void Action::checkMutable(llvm::StringRef what) const {
  if (manager.isElaborated())
    llvm::report_fatal_error(llvm::Twine("Cannot ") + what + " of '" + name +
                             "' after elaboration");
}

CallSite &Action::calls(Method &callee) {
  checkMutable("add a call");
  unsigned siteID = manager.callSites.size();
  auto site =
      std::make_unique<CallSite>(CallSite::Key(), *this, callee, siteID);
  manager.registerCallSite(site.get());
  callee.callers.push_back(site.get());
  callSites.push_back(std::move(site));
  return *callSites.back();
}

CallSite *Action::findCallSite(const Method &callee) const {
  for (const auto &site : callSites)
    if (&site->getCallee() == &callee)
      return site.get();
  return nullptr;
}

bool Action::isGranted() const { return manager.isGranted(*this); }

//===----------------------------------------------------------------------===//
// Method
//===----------------------------------------------------------------------===//

Method::Method(TransactionManager &manager, llvm::StringRef name, unsigned id,
               Layout input, Layout output, Component *owner)
    : Action(Kind::Method, manager, name, id, /*priority=*/0, owner),
      input(std::move(input)), output(std::move(output)) {}

Method &Method::setReady(PredicateFn ready) {
  checkMutable("set readiness");
  this->ready = std::move(ready);
  return *this;
}

Method &Method::setBody(MethodBodyFn body) {
  checkMutable("set body");
  this->body = std::move(body);
  return *this;
}

Method &Method::setValidator(ValidatorFn validator) {
  checkMutable("set argument validator");
  this->validator = std::move(validator);
  return *this;
}

Method &Method::setNonexclusive() {
  checkMutable("make nonexclusive");
  nonexclusive = true;
  return *this;
}

Method &Method::requireEarlyArguments() {
  checkMutable("require early arguments");
  earlyArguments = true;
  return *this;
}

bool Method::needsEarlyArguments() const {
  return earlyArguments || validator || (nonexclusive && !input.empty());
}

//===----------------------------------------------------------------------===//
// Transaction
//===----------------------------------------------------------------------===//

Transaction::Transaction(TransactionManager &manager, llvm::StringRef name,
                         unsigned id, int priority, Component *owner)
    : Action(Kind::Transaction, manager, name, id, priority, owner) {}

Transaction &Transaction::setRequest(PredicateFn request) {
  checkMutable("set request");
  this->request = std::move(request);
  return *this;
}

Transaction &Transaction::setBody(TransactionBodyFn body) {
  checkMutable("set body");
  this->body = std::move(body);
  return *this;
}

//===----------------------------------------------------------------------===//
// CallContext
//===----------------------------------------------------------------------===//

uint64_t CallContext::getCycle() const { return manager.getCycle(); }

Record CallContext::call(Method &callee, const Record &args) {
  return manager.performCall(action, callee, &args);
}

Record CallContext::call(Method &callee) {
  return manager.performCall(action, callee, nullptr);
}

} // namespace latch
