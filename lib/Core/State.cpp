//===- State.cpp - Registered and combinational state ---------------------===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//

#include "latch/Core/State.h"
#include "latch/Core/Component.h"

namespace latch {

StateElement::StateElement(Component &owner, llvm::StringRef name)
    : owner(owner), name(name.str()) {
  owner.addStateElement(this);
}

StateElement::~StateElement() { owner.removeStateElement(this); }

void StateElement::reportDoubleWrite(llvm::StringRef what) const {
  llvm::report_fatal_error(llvm::Twine("Second write to ") + what + " '" +
                           owner.getName() + "." + name +
                           "' in one cycle");
}

} // namespace latch
