//===- MemoryBank.h - Banked store ------------------------------*- C++ -*-===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//
//
// A synchronous memory with one read and one write port.
//
//   read_req(addr)            captures the address; the data is latched at
//                             the next edge.
//   read_resp() -> data       returns the latched data, once per request.
//   write(addr, data[, mask]) writes at the next edge. With a granularity
//                             `g` the mask carries one bit per g-bit chunk.
//
// With safe writes a write to the address read in the same cycle is deferred
// by one cycle, so the read observes the old contents. Without them the read
// observes the write.
//
//===----------------------------------------------------------------------===//

#ifndef LATCH_PRIMITIVES_MEMORYBANK_H
#define LATCH_PRIMITIVES_MEMORYBANK_H

#include "latch/Core/Component.h"
#include "latch/Core/State.h"
#include "llvm/ADT/APInt.h"
#include <optional>

namespace latch {

struct MemoryBankConfig {
  /// Shape of one element.
  Layout dataLayout;
  /// Number of elements.
  unsigned elemCount = 0;
  /// Write granularity in bits; must divide the element width.
  std::optional<unsigned> granularity;
  /// Defer writes that collide with a same-cycle read.
  bool safeWrites = true;
};

class MemoryBank : public Component {
public:
  MemoryBank(TransactionManager &manager, llvm::StringRef name,
             MemoryBankConfig config);

  Method &getReadReq() const { return readReq; }
  Method &getReadResp() const { return readResp; }
  Method &getWrite() const { return write; }

  const MemoryBankConfig &getConfig() const { return config; }
  unsigned getWidth() const { return width; }
  unsigned getAddrWidth() const { return addrWidth; }

  /// Committed contents of element `addr`.
  const llvm::APInt &peek(unsigned addr) const { return memory.read(addr); }

  /// Whether a deferred write waits for the flush.
  bool isWritePending() const { return writePending.read(); }

  void combinational() override;

private:
  void applyWrite(const Record &args);

  MemoryBankConfig config;
  unsigned width;
  unsigned addrWidth;

  RegArray<llvm::APInt> memory;
  Reg<bool> readValid;
  Reg<llvm::APInt> readData;
  Reg<bool> writePending;
  Reg<Record> deferredWrite;

  Wire<std::optional<unsigned>> readAddr;
  Wire<bool> readConsumed;
  Wire<std::optional<Record>> writeRequest;

  Method &readReq;
  Method &readResp;
  Method &write;
  Transaction &flush;
};

} // namespace latch

#endif // LATCH_PRIMITIVES_MEMORYBANK_H
