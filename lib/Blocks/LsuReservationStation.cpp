//===- LsuReservationStation.cpp - Load/store reservation station ---------===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//

#include "latch/Blocks/LsuReservationStation.h"
#include "latch/Core/TransactionManager.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/MathExtras.h"
#include <algorithm>

#define DEBUG_TYPE "latch-lsu-rs"

namespace latch {

RobIndicesProvider::~RobIndicesProvider() = default;

static LsuRsConfig checkConfig(llvm::StringRef name, LsuRsConfig config) {
  auto fail = [&](const char *what) {
    llvm::report_fatal_error(llvm::Twine("Reservation station '") + name +
                             "': " + what);
  };
  if (config.entries == 0)
    fail("needs at least one entry");
  if (config.robIdBits == 0 || config.robIdBits >= 64)
    fail("ROB id width must be in [1, 63]");
  if (config.regIdBits == 0 || config.regIdBits >= 64)
    fail("register id width must be in [1, 63]");
  if (config.dataBits == 0)
    fail("data width must be positive");
  if (config.alignmentBits >= config.dataBits)
    fail("alignment must be narrower than the data width");
  return config;
}

LsuReservationStation::LsuReservationStation(TransactionManager &manager,
                                             llvm::StringRef name,
                                             LsuRsConfig config,
                                             RobIndicesProvider &rob)
    : Component(manager, name), config(checkConfig(name, config)), rob(rob),
      idBits(std::max(1u, llvm::Log2_32_Ceil(this->config.entries))),
      freeEncoder(this->config.entries, 1),
      slots(*this, "slots", this->config.entries, makeEmptyEntry()),
      select(defineMethod("select", Layout(), {{"rs_entry_id", idBits}})),
      insert(defineMethod("insert",
                          {{"rs_entry_id", idBits},
                           {"op", 2},
                           {"rp_s1", config.regIdBits},
                           {"rp_s2", config.regIdBits},
                           {"s1_val", config.dataBits},
                           {"s2_val", config.dataBits},
                           {"imm", config.dataBits},
                           {"rob_id", config.robIdBits},
                           {"rp_dst", config.regIdBits}})),
      update(defineMethod("update", {{"reg_id", config.regIdBits},
                                     {"reg_val", config.dataBits}})),
      readyList(defineMethod("get_ready_list", Layout(),
                             {{"ready_list", config.entries}})),
      take(defineMethod("take", {{"rs_entry_id", idBits}},
                        {{"op", 2},
                         {"s1_val", config.dataBits},
                         {"s2_val", config.dataBits},
                         {"imm", config.dataBits},
                         {"rob_id", config.robIdBits},
                         {"rp_dst", config.regIdBits}})) {
  unsigned numEntries = this->config.entries;

  // A fence being inserted this cycle already holds allocation.
  select.setReady([this] {
    if (isFencePending())
      return false;
    for (const Record &args : getManager().pendingArguments(insert))
      if (isFence(static_cast<OpType>(args.getZExt("op"))))
        return false;
    for (unsigned i = 0, e = slots.size(); i < e; ++i)
      if (!slots.read(i).reserved)
        return true;
    return false;
  });
  select.setBody([this, numEntries](CallContext &, const Record &) {
    llvm::BitVector free(numEntries);
    for (unsigned i = 0; i < numEntries; ++i)
      if (!slots.read(i).reserved)
        free.set(i);
    EncoderOutput slot = freeEncoder.encode(free)[0];
    if (!slot.valid)
      llvm::report_fatal_error("select granted with every slot reserved");

    Entry entry = slots.read(slot.index);
    entry.reserved = true;
    slots.write(slot.index, entry);
    LLVM_DEBUG(llvm::dbgs() << getName() << ": reserved " << slot.index
                            << "\n");

    Record result(select.getOutputLayout());
    result.set("rs_entry_id", slot.index);
    return result;
  });

  insert.setValidator([this, numEntries](const Record &args) {
    uint64_t id = args.getZExt("rs_entry_id");
    if (id >= numEntries)
      return false;
    const Entry &entry = slots.read(id);
    return entry.reserved && !entry.full;
  });
  insert.setBody([this, numEntries](CallContext &, const Record &args) {
    unsigned id = args.getZExt("rs_entry_id");
    Entry entry = makeEmptyEntry();
    entry.reserved = true;
    entry.full = true;
    entry.op = static_cast<OpType>(args.getZExt("op"));
    entry.rpS1 = args.getZExt("rp_s1");
    entry.rpS2 = args.getZExt("rp_s2");
    entry.s1Val = args.get("s1_val");
    entry.s2Val = args.get("s2_val");
    entry.imm = args.get("imm");
    entry.robId = args.getZExt("rob_id");
    entry.rpDst = args.getZExt("rp_dst");

    for (unsigned i = 0; i < numEntries; ++i) {
      if (i == id)
        continue;
      const Entry &other = slots.read(i);
      if (other.full && isOlder(other.robId, entry.robId) &&
          mayAlias(other, entry))
        entry.depends.set(i);
    }
    LLVM_DEBUG(llvm::dbgs() << getName() << ": insert rob " << entry.robId
                            << " into " << id << ", "
                            << entry.depends.count() << " dependencies\n");

    slots.write(id, std::move(entry));
    return Record();
  });

  update.setBody([this, numEntries](CallContext &, const Record &args) {
    uint64_t tag = args.getZExt("reg_id");
    if (tag == 0)
      return Record();
    const llvm::APInt &value = args.get("reg_val");
    for (unsigned i = 0; i < numEntries; ++i) {
      const Entry &current = slots.read(i);
      if (!current.full || (current.rpS1 != tag && current.rpS2 != tag))
        continue;
      Entry entry = current;
      if (entry.rpS1 == tag) {
        entry.rpS1 = 0;
        entry.s1Val = value;
      }
      if (entry.rpS2 == tag) {
        entry.rpS2 = 0;
        entry.s2Val = value;
      }
      slots.write(i, std::move(entry));
    }
    return Record();
  });

  readyList.setNonexclusive();
  readyList.setBody([this, numEntries](CallContext &, const Record &) {
    llvm::BitVector ready = computeReadyList();
    llvm::APInt bits(numEntries, 0);
    for (unsigned i : ready.set_bits())
      bits.setBit(i);
    Record result(readyList.getOutputLayout());
    result.set("ready_list", bits);
    return result;
  });

  take.setValidator([this, numEntries](const Record &args) {
    uint64_t id = args.getZExt("rs_entry_id");
    return id < numEntries && computeReadyList().test(id);
  });
  take.setBody([this](CallContext &, const Record &args) {
    unsigned id = args.getZExt("rs_entry_id");
    const Entry &entry = slots.read(id);
    Record result(take.getOutputLayout());
    result.set("op", static_cast<uint64_t>(entry.op));
    result.set("s1_val", entry.s1Val);
    result.set("s2_val", entry.s2Val);
    result.set("imm", entry.imm);
    result.set("rob_id", entry.robId);
    result.set("rp_dst", entry.rpDst);

    LLVM_DEBUG(llvm::dbgs() << getName() << ": take " << id << "\n");
    slots.write(id, makeEmptyEntry());
    return result;
  });
}

LsuReservationStation::Entry LsuReservationStation::makeEmptyEntry() const {
  Entry entry;
  entry.s1Val = llvm::APInt(config.dataBits, 0);
  entry.s2Val = llvm::APInt(config.dataBits, 0);
  entry.imm = llvm::APInt(config.dataBits, 0);
  entry.depends.resize(config.entries);
  return entry;
}

bool LsuReservationStation::isOlder(uint64_t first, uint64_t second) const {
  uint64_t mask = (uint64_t(1) << config.robIdBits) - 1;
  uint64_t start = rob.getRobStart();
  return ((first - start) & mask) < ((second - start) & mask);
}

llvm::APInt LsuReservationStation::getAddress(const Entry &entry) const {
  return entry.s1Val + entry.imm;
}

bool LsuReservationStation::mayAlias(const Entry &a, const Entry &b) const {
  if (!hasAddress(a) || !hasAddress(b))
    return true;
  return getAddress(a).lshr(config.alignmentBits) ==
         getAddress(b).lshr(config.alignmentBits);
}

llvm::BitVector LsuReservationStation::computeReadyList() const {
  unsigned numEntries = config.entries;
  llvm::BitVector ready(numEntries);
  for (unsigned i = 0; i < numEntries; ++i) {
    const Entry &entry = slots.read(i);
    if (!entry.full || entry.rpS1 != 0 || entry.rpS2 != 0)
      continue;
    bool blocked = false;
    for (unsigned j : entry.depends.set_bits()) {
      const Entry &older = slots.read(j);
      if (older.full && isOlder(older.robId, entry.robId)) {
        blocked = true;
        break;
      }
    }
    if (!blocked)
      ready.set(i);
  }
  return ready;
}

bool LsuReservationStation::isFencePending() const {
  for (unsigned i = 0, e = slots.size(); i < e; ++i) {
    const Entry &entry = slots.read(i);
    if (entry.full && isFence(entry.op))
      return true;
  }
  return false;
}

} // namespace latch
