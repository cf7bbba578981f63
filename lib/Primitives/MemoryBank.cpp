//===- MemoryBank.cpp - Banked store --------------------------------------===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//

#include "latch/Primitives/MemoryBank.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/MathExtras.h"
#include <algorithm>
#include <optional>

#define DEBUG_TYPE "latch-memory-bank"

namespace latch {

static unsigned checkedWidth(llvm::StringRef name,
                             const MemoryBankConfig &config) {
  if (config.elemCount == 0)
    llvm::report_fatal_error(llvm::Twine("Memory bank '") + name +
                             "' needs at least one element");
  unsigned width = config.dataLayout.getWidth();
  if (width == 0)
    llvm::report_fatal_error(llvm::Twine("Memory bank '") + name +
                             "' has an empty data layout");
  if (config.granularity &&
      (*config.granularity == 0 || width % *config.granularity != 0))
    llvm::report_fatal_error(llvm::Twine("Memory bank '") + name +
                             "': granularity must divide the width " +
                             llvm::Twine(width));
  return width;
}

static Layout makeWriteLayout(unsigned addrWidth, unsigned width,
                              const MemoryBankConfig &config) {
  std::vector<Field> fields = {{"addr", addrWidth}, {"data", width}};
  if (config.granularity)
    fields.push_back({"mask", width / *config.granularity});
  return Layout(std::move(fields));
}

MemoryBank::MemoryBank(TransactionManager &manager, llvm::StringRef name,
                       MemoryBankConfig config)
    : Component(manager, name), config(std::move(config)),
      width(checkedWidth(name, this->config)),
      addrWidth(std::max(1u, llvm::Log2_32_Ceil(this->config.elemCount))),
      memory(*this, "memory", this->config.elemCount, llvm::APInt(width, 0)),
      readValid(*this, "read_valid", false),
      readData(*this, "read_data", llvm::APInt(width, 0)),
      writePending(*this, "write_pending", false),
      deferredWrite(*this, "deferred_write"), readAddr(*this, "read_addr"),
      readConsumed(*this, "read_consumed", false),
      writeRequest(*this, "write_request"),
      readReq(defineMethod("read_req", {{"addr", addrWidth}})),
      readResp(defineMethod("read_resp", Layout(), {{"data", width}})),
      write(defineMethod("write", makeWriteLayout(addrWidth, width,
                                                  this->config))),
      flush(defineTransaction("flush")) {
  auto checkAddress = [this](const Record &args) {
    uint64_t addr = args.getZExt("addr");
    if (addr >= this->config.elemCount)
      llvm::report_fatal_error(llvm::Twine("Address ") + llvm::Twine(addr) +
                               " out of range for '" + getName() + "'");
    return static_cast<unsigned>(addr);
  };

  readReq.setReady([this] { return !writePending.read(); });
  readReq.setBody([this, checkAddress](CallContext &, const Record &args) {
    readAddr.set(checkAddress(args));
    return Record();
  });

  readResp.setReady([this] { return readValid.read(); });
  readResp.setBody([this](CallContext &, const Record &) {
    readConsumed.set(true);
    Record result(readResp.getOutputLayout());
    result.set("data", readData.read());
    return result;
  });

  write.setReady([this] { return !writePending.read(); });
  write.setBody([this, checkAddress](CallContext &, const Record &args) {
    checkAddress(args);
    writeRequest.set(args);
    return Record();
  });

  flush.setRequest([this] { return writePending.read(); });
  flush.setBody([this](CallContext &) {
    LLVM_DEBUG(llvm::dbgs() << getName() << ": flushing deferred write\n");
    applyWrite(deferredWrite.read());
    writePending.write(false);
  });
}

void MemoryBank::applyWrite(const Record &args) {
  unsigned addr = args.getZExt("addr");
  const llvm::APInt &value = args.get("data");
  if (!config.granularity) {
    memory.write(addr, value);
    return;
  }

  unsigned chunk = *config.granularity;
  const llvm::APInt &mask = args.get("mask");
  llvm::APInt merged = memory.read(addr);
  for (unsigned i = 0, e = width / chunk; i < e; ++i)
    if (mask[i])
      merged.insertBits(value.extractBits(chunk, i * chunk), i * chunk);
  memory.write(addr, merged);
}

void MemoryBank::combinational() {
  const std::optional<unsigned> &readAt = readAddr.get();

  if (const std::optional<Record> &request = writeRequest.get()) {
    bool collides = readAt && *readAt == request->getZExt("addr");
    if (config.safeWrites && collides) {
      LLVM_DEBUG(llvm::dbgs() << getName() << ": deferring write to "
                              << *readAt << "\n");
      writePending.write(true);
      deferredWrite.write(*request);
    } else {
      applyWrite(*request);
    }
  }

  // Reads see the element as it will be after this edge.
  if (readAt) {
    readData.write(memory.peekNext(*readAt));
    readValid.write(true);
  } else if (readConsumed.get()) {
    readValid.write(false);
  }
}

} // namespace latch
