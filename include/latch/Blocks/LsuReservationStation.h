//===- LsuReservationStation.h - Load/store reservation station -*- C++ -*-===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//
//
// Reservation station of the load/store unit. Besides the usual operand
// wake-up it tracks memory dependencies: an entry may only issue once every
// older entry that might access the same address has left the station.
// Addresses are compared ignoring the low `alignmentBits` bits; an address
// is unknown while its base register operand is outstanding.
//
// Fence-class operations block the allocation of new entries from the cycle
// they are inserted until every resident fence has been taken.
//
// Methods:
//   select() -> rs_entry_id
//   insert(rs_entry_id, op, rp_s1, rp_s2, s1_val, s2_val, imm, rob_id, rp_dst)
//   update(reg_id, reg_val)
//   get_ready_list() -> ready_list                  (nonexclusive)
//   take(rs_entry_id) -> op, s1_val, s2_val, imm, rob_id, rp_dst
//
//===----------------------------------------------------------------------===//

#ifndef LATCH_BLOCKS_LSURESERVATIONSTATION_H
#define LATCH_BLOCKS_LSURESERVATIONSTATION_H

#include "latch/Core/Component.h"
#include "latch/Core/State.h"
#include "latch/Support/PriorityEncoder.h"
#include "llvm/ADT/APInt.h"
#include "llvm/ADT/BitVector.h"
#include <cstdint>

namespace latch {

enum class OpType : unsigned { Load = 0, Store = 1, Fence = 2, FenceI = 3 };

inline bool isFence(OpType op) {
  return op == OpType::Fence || op == OpType::FenceI;
}

/// Supplies the index of the oldest instruction in the reorder buffer.
class RobIndicesProvider {
public:
  virtual ~RobIndicesProvider();
  virtual uint64_t getRobStart() const = 0;
};

struct LsuRsConfig {
  unsigned entries = 4;
  unsigned robIdBits = 5;
  unsigned regIdBits = 6;
  unsigned dataBits = 32;
  /// Low address bits ignored by the aliasing check. 0 compares exact bytes.
  unsigned alignmentBits = 2;
};

class LsuReservationStation : public Component {
public:
  LsuReservationStation(TransactionManager &manager, llvm::StringRef name,
                        LsuRsConfig config, RobIndicesProvider &rob);

  Method &getSelect() const { return select; }
  Method &getInsert() const { return insert; }
  Method &getUpdate() const { return update; }
  Method &getReadyList() const { return readyList; }
  Method &getTake() const { return take; }

  const LsuRsConfig &getConfig() const { return config; }

  /// Committed dependency vector of entry `index`.
  const llvm::BitVector &getDependencies(unsigned index) const {
    return slots.read(index).depends;
  }
  bool isFull(unsigned index) const { return slots.read(index).full; }
  bool isReserved(unsigned index) const { return slots.read(index).reserved; }
  /// Whether a fence occupies any entry.
  bool isFencePending() const;

  /// Entries that may issue, computed from committed state.
  llvm::BitVector computeReadyList() const;

private:
  struct Entry {
    bool reserved = false;
    bool full = false;
    OpType op = OpType::Load;
    uint64_t rpS1 = 0;
    uint64_t rpS2 = 0;
    llvm::APInt s1Val;
    llvm::APInt s2Val;
    llvm::APInt imm;
    uint64_t robId = 0;
    uint64_t rpDst = 0;
    llvm::BitVector depends;
  };

  Entry makeEmptyEntry() const;

  /// Whether `first` entered the reorder buffer before `second`.
  bool isOlder(uint64_t first, uint64_t second) const;
  bool hasAddress(const Entry &entry) const { return entry.rpS1 == 0; }
  llvm::APInt getAddress(const Entry &entry) const;
  bool mayAlias(const Entry &a, const Entry &b) const;

  LsuRsConfig config;
  RobIndicesProvider &rob;
  unsigned idBits;
  MultiPriorityEncoder freeEncoder;

  RegArray<Entry> slots;

  Method &select;
  Method &insert;
  Method &update;
  Method &readyList;
  Method &take;
};

} // namespace latch

#endif // LATCH_BLOCKS_LSURESERVATIONSTATION_H
