//===- ContentAddressableMemory.h - Associative store -----------*- C++ -*-===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//
//
// Key/value storage searched by content. Each slot holds a valid bit, a key
// and a data word.
//
//   push(addr, data)        ready iff a slot is free; fills the lowest free
//                           slot at the next edge.
//   pop(addr) -> data,      always ready; returns the data of the lowest
//                not_found  valid slot holding `addr` and frees it. A miss
//                           sets not_found and returns zero data.
//
// Keys and data are passed packed; use getKeyLayout() and getDataLayout() to
// pack and unpack them.
//
//===----------------------------------------------------------------------===//

#ifndef LATCH_PRIMITIVES_CONTENTADDRESSABLEMEMORY_H
#define LATCH_PRIMITIVES_CONTENTADDRESSABLEMEMORY_H

#include "latch/Core/Component.h"
#include "latch/Core/State.h"
#include "latch/Support/PriorityEncoder.h"
#include "llvm/ADT/APInt.h"

namespace latch {

class ContentAddressableMemory : public Component {
public:
  ContentAddressableMemory(TransactionManager &manager, llvm::StringRef name,
                           Layout keyLayout, Layout dataLayout,
                           unsigned entries);

  Method &getPush() const { return push; }
  Method &getPop() const { return pop; }

  const Layout &getKeyLayout() const { return keyLayout; }
  const Layout &getDataLayout() const { return dataLayout; }

  /// Number of slots.
  unsigned size() const { return entries; }

  /// Number of valid slots in the committed state.
  unsigned getEntriesNumber() const;

private:
  llvm::BitVector getValidMask() const;

  Layout keyLayout;
  Layout dataLayout;
  unsigned entries;

  MultiPriorityEncoder freeEncoder;
  MultiPriorityEncoder matchEncoder;

  RegArray<bool> valid;
  RegArray<llvm::APInt> keys;
  RegArray<llvm::APInt> data;

  Method &push;
  Method &pop;
};

} // namespace latch

#endif // LATCH_PRIMITIVES_CONTENTADDRESSABLEMEMORY_H
