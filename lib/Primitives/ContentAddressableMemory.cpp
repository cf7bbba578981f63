//===- ContentAddressableMemory.cpp - Associative store -------------------===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//

#include "latch/Primitives/ContentAddressableMemory.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/ErrorHandling.h"

#define DEBUG_TYPE "latch-cam"

namespace latch {

ContentAddressableMemory::ContentAddressableMemory(TransactionManager &manager,
                                                   llvm::StringRef name,
                                                   Layout keyLayout,
                                                   Layout dataLayout,
                                                   unsigned entries)
    : Component(manager, name), keyLayout(keyLayout), dataLayout(dataLayout),
      entries(entries), freeEncoder(entries, 1), matchEncoder(entries, 1),
      valid(*this, "valid", entries, false),
      keys(*this, "keys", entries, llvm::APInt(keyLayout.getWidth(), 0)),
      data(*this, "data", entries, llvm::APInt(dataLayout.getWidth(), 0)),
      push(defineMethod("push",
                        {{"addr", keyLayout.getWidth()},
                         {"data", dataLayout.getWidth()}})),
      pop(defineMethod("pop", {{"addr", keyLayout.getWidth()}},
                       {{"data", dataLayout.getWidth()}, {"not_found", 1}})) {
  push.setReady([this] { return !getValidMask().all(); });
  push.setBody([this](CallContext &, const Record &args) {
    EncoderOutput slot = freeEncoder.encode(getValidMask().flip())[0];
    if (!slot.valid)
      llvm::report_fatal_error("push granted with no free slot");
    LLVM_DEBUG(llvm::dbgs() << getName() << ": push into slot " << slot.index
                            << "\n");
    keys.write(slot.index, args.get("addr"));
    data.write(slot.index, args.get("data"));
    valid.write(slot.index, true);
    return Record();
  });

  pop.setBody([this](CallContext &, const Record &args) {
    const llvm::APInt &key = args.get("addr");
    llvm::BitVector matches(this->entries);
    for (unsigned i = 0; i < this->entries; ++i)
      if (valid.read(i) && keys.read(i) == key)
        matches.set(i);

    Record result(pop.getOutputLayout());
    EncoderOutput hit = matchEncoder.encode(matches)[0];
    if (!hit.valid) {
      result.set("not_found", 1);
      return result;
    }
    LLVM_DEBUG(llvm::dbgs() << getName() << ": pop from slot " << hit.index
                            << "\n");
    result.set("data", data.read(hit.index));
    valid.write(hit.index, false);
    return result;
  });
}

llvm::BitVector ContentAddressableMemory::getValidMask() const {
  llvm::BitVector mask(entries);
  for (unsigned i = 0; i < entries; ++i)
    if (valid.read(i))
      mask.set(i);
  return mask;
}

unsigned ContentAddressableMemory::getEntriesNumber() const {
  return getValidMask().count();
}

} // namespace latch
