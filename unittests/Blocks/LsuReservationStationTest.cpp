//===- LsuReservationStationTest.cpp - LSU reservation station tests ------===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//

#include "latch/Blocks/LsuReservationStation.h"
#include "latch/Core/Adapter.h"
#include "latch/Core/TransactionManager.h"
#include "latch/Simulation/Simulator.h"
#include "gtest/gtest.h"

using namespace latch;

namespace {

class FixedRob : public RobIndicesProvider {
public:
  uint64_t getRobStart() const override { return start; }
  uint64_t start = 0;
};

struct Operation {
  OpType op = OpType::Load;
  uint64_t rpS1 = 0;
  uint64_t rpS2 = 0;
  uint64_t s1Val = 0;
  uint64_t s2Val = 0;
  uint64_t imm = 0;
  uint64_t robId = 0;
  uint64_t rpDst = 1;
};

class LsuReservationStationTest : public ::testing::Test {
protected:
  LsuReservationStationTest()
      : rs(manager, "lsu_rs", LsuRsConfig(), rob),
        selectTb(manager, "select_tb", rs.getSelect(), 5),
        insertTb(manager, "insert_tb", rs.getInsert(), 4),
        updateTb(manager, "update_tb", rs.getUpdate(), 3),
        readyTb(manager, "ready_tb", rs.getReadyList(), 2),
        takeTb(manager, "take_tb", rs.getTake(), 1), sim(manager) {}

  /// Reserve a slot and return its index.
  unsigned selectSlot() {
    selectTb.call();
    sim.step();
    EXPECT_TRUE(selectTb.done());
    return selectTb.getOutputs().getZExt("rs_entry_id");
  }

  Record insertArgs(unsigned slot, const Operation &op) {
    Record args(rs.getInsert().getInputLayout());
    args.set("rs_entry_id", slot)
        .set("op", static_cast<uint64_t>(op.op))
        .set("rp_s1", op.rpS1)
        .set("rp_s2", op.rpS2)
        .set("s1_val", op.s1Val)
        .set("s2_val", op.s2Val)
        .set("imm", op.imm)
        .set("rob_id", op.robId)
        .set("rp_dst", op.rpDst);
    return args;
  }

  /// Reserve a slot, fill it with `op` and return its index.
  unsigned allocate(const Operation &op) {
    unsigned slot = selectSlot();
    insertTb.call(insertArgs(slot, op));
    sim.step();
    EXPECT_TRUE(insertTb.done());
    return slot;
  }

  void wakeUp(uint64_t reg, uint64_t value) {
    updateTb.call(Record(rs.getUpdate().getInputLayout(), {reg, value}));
    sim.step();
    ASSERT_TRUE(updateTb.done());
  }

  llvm::APInt readyList() {
    readyTb.call();
    sim.step();
    EXPECT_TRUE(readyTb.done());
    return readyTb.getOutputs().get("ready_list");
  }

  /// Take `slot`; returns false when the take was refused.
  bool takeSlot(unsigned slot) {
    takeTb.call(Record(rs.getTake().getInputLayout(), {slot}));
    sim.step();
    if (takeTb.done())
      return true;
    takeTb.disable();
    return false;
  }

  TransactionManager manager;
  FixedRob rob;
  LsuReservationStation rs;
  Adapter selectTb;
  Adapter insertTb;
  Adapter updateTb;
  Adapter readyTb;
  Adapter takeTb;
  Simulator sim;
};

TEST_F(LsuReservationStationTest, SelectReservesEverySlotOnce) {
  for (unsigned i = 0; i < 4; ++i) {
    EXPECT_EQ(selectSlot(), i);
    EXPECT_TRUE(rs.isReserved(i));
    EXPECT_FALSE(rs.isFull(i));
  }

  selectTb.call();
  sim.step();
  EXPECT_FALSE(selectTb.done());
  selectTb.disable();
}

TEST_F(LsuReservationStationTest, InsertRequiresReservedSlot) {
  Operation load;
  load.robId = 3;
  insertTb.call(insertArgs(2, load));
  sim.step();
  EXPECT_FALSE(insertTb.done());
  EXPECT_FALSE(rs.isFull(2));
  insertTb.disable();

  unsigned slot = allocate(load);
  insertTb.call(insertArgs(slot, load));
  sim.step();
  EXPECT_FALSE(insertTb.done());
  insertTb.disable();
}

TEST_F(LsuReservationStationTest, TakeReturnsOperandsAndFreesSlot) {
  Operation store;
  store.op = OpType::Store;
  store.s1Val = 0x1000;
  store.s2Val = 0xBEEF;
  store.imm = 8;
  store.robId = 4;
  store.rpDst = 9;
  unsigned slot = allocate(store);
  EXPECT_TRUE(readyList()[slot]);

  ASSERT_TRUE(takeSlot(slot));
  const Record &out = takeTb.getOutputs();
  EXPECT_EQ(out.getZExt("op"), static_cast<uint64_t>(OpType::Store));
  EXPECT_EQ(out.getZExt("s1_val"), 0x1000u);
  EXPECT_EQ(out.getZExt("s2_val"), 0xBEEFu);
  EXPECT_EQ(out.getZExt("imm"), 8u);
  EXPECT_EQ(out.getZExt("rob_id"), 4u);
  EXPECT_EQ(out.getZExt("rp_dst"), 9u);

  EXPECT_FALSE(rs.isReserved(slot));
  EXPECT_FALSE(rs.isFull(slot));
  EXPECT_TRUE(readyList().isZero());
  EXPECT_EQ(selectSlot(), slot);
}

TEST_F(LsuReservationStationTest, TakeRefusesWaitingEntry) {
  Operation load;
  load.rpS1 = 12;
  load.robId = 1;
  unsigned slot = allocate(load);
  EXPECT_FALSE(takeSlot(slot));
  EXPECT_FALSE(takeSlot(3));
  EXPECT_TRUE(rs.isFull(slot));
}

TEST_F(LsuReservationStationTest, UpdateWakesWaitingOperands) {
  Operation store;
  store.op = OpType::Store;
  store.rpS1 = 7;
  store.rpS2 = 8;
  store.robId = 2;
  unsigned slot = allocate(store);
  EXPECT_FALSE(readyList()[slot]);

  // Register zero never names a pending producer.
  wakeUp(0, 0x99);
  EXPECT_FALSE(readyList()[slot]);

  wakeUp(7, 0x2000);
  EXPECT_FALSE(readyList()[slot]);
  wakeUp(8, 0x55);
  EXPECT_TRUE(readyList()[slot]);

  ASSERT_TRUE(takeSlot(slot));
  EXPECT_EQ(takeTb.getOutputs().getZExt("s1_val"), 0x2000u);
  EXPECT_EQ(takeTb.getOutputs().getZExt("s2_val"), 0x55u);
}

TEST_F(LsuReservationStationTest, UnknownAddressDependsOnOlderEntries) {
  Operation store;
  store.op = OpType::Store;
  store.s1Val = 0x100;
  store.robId = 1;
  unsigned a = allocate(store);

  Operation pending;
  pending.rpS1 = 5;
  pending.robId = 2;
  unsigned b = allocate(pending);

  Operation load;
  load.s1Val = 0x200;
  load.robId = 3;
  unsigned c = allocate(load);

  EXPECT_TRUE(rs.getDependencies(a).none());
  EXPECT_TRUE(rs.getDependencies(b).test(a));
  EXPECT_EQ(rs.getDependencies(b).count(), 1u);
  EXPECT_FALSE(rs.getDependencies(c).test(a));
  EXPECT_TRUE(rs.getDependencies(c).test(b));

  llvm::APInt ready = readyList();
  EXPECT_TRUE(ready[a]);
  EXPECT_FALSE(ready[b]);
  EXPECT_FALSE(ready[c]);

  // Resolving the address is not enough while the older store is present.
  wakeUp(5, 0x300);
  ready = readyList();
  EXPECT_FALSE(ready[b]);
  EXPECT_FALSE(ready[c]);

  ASSERT_TRUE(takeSlot(a));
  ready = readyList();
  EXPECT_TRUE(ready[b]);
  EXPECT_FALSE(ready[c]);

  ASSERT_TRUE(takeSlot(b));
  EXPECT_TRUE(readyList()[c]);
}

TEST_F(LsuReservationStationTest, AliasingIgnoresLowAddressBits) {
  Operation store;
  store.op = OpType::Store;
  store.s1Val = 0x100;
  store.imm = 1;
  store.robId = 1;
  unsigned a = allocate(store);

  Operation sameWord;
  sameWord.s1Val = 0x103;
  sameWord.robId = 2;
  unsigned b = allocate(sameWord);

  Operation nextWord;
  nextWord.s1Val = 0x100;
  nextWord.imm = 4;
  nextWord.robId = 3;
  unsigned c = allocate(nextWord);

  EXPECT_TRUE(rs.getDependencies(b).test(a));
  EXPECT_TRUE(rs.getDependencies(c).none());

  llvm::APInt ready = readyList();
  EXPECT_TRUE(ready[a]);
  EXPECT_FALSE(ready[b]);
  EXPECT_TRUE(ready[c]);

  ASSERT_TRUE(takeSlot(a));
  EXPECT_TRUE(readyList()[b]);
}

TEST_F(LsuReservationStationTest, AgeIsRelativeToRobStart) {
  rob.start = 30;
  Operation store;
  store.op = OpType::Store;
  store.s1Val = 0x40;
  store.robId = 31;
  unsigned a = allocate(store);

  // ROB id 1 follows 31 once the ring wraps.
  Operation load;
  load.s1Val = 0x40;
  load.robId = 1;
  unsigned b = allocate(load);
  EXPECT_TRUE(rs.getDependencies(b).test(a));
  EXPECT_FALSE(readyList()[b]);
}

TEST_F(LsuReservationStationTest, YoungerEntriesAreNotDependencies) {
  Operation store;
  store.op = OpType::Store;
  store.s1Val = 0x40;
  store.robId = 31;
  unsigned a = allocate(store);

  Operation load;
  load.s1Val = 0x40;
  load.robId = 1;
  unsigned b = allocate(load);
  EXPECT_TRUE(rs.getDependencies(b).none());

  llvm::APInt ready = readyList();
  EXPECT_TRUE(ready[a]);
  EXPECT_TRUE(ready[b]);
}

TEST_F(LsuReservationStationTest, FenceBlocksSelectionUntilTaken) {
  Operation fence;
  fence.op = OpType::Fence;
  fence.robId = 1;
  unsigned slot = allocate(fence);
  EXPECT_TRUE(rs.isFencePending());

  selectTb.call();
  sim.step();
  EXPECT_FALSE(selectTb.done());

  // The take releases allocation from the following cycle.
  takeTb.call(Record(rs.getTake().getInputLayout(), {slot}));
  sim.step();
  EXPECT_TRUE(takeTb.done());
  EXPECT_FALSE(selectTb.done());
  EXPECT_FALSE(rs.isFencePending());

  sim.step();
  EXPECT_TRUE(selectTb.done());
}

TEST_F(LsuReservationStationTest, SecondFenceKeepsSelectionBlocked) {
  unsigned first = selectSlot();
  unsigned second = selectSlot();

  Operation fence;
  fence.op = OpType::Fence;
  fence.robId = 1;
  insertTb.call(insertArgs(first, fence));
  sim.step();
  ASSERT_TRUE(insertTb.done());
  fence.op = OpType::FenceI;
  fence.robId = 2;
  insertTb.call(insertArgs(second, fence));
  sim.step();
  ASSERT_TRUE(insertTb.done());

  ASSERT_TRUE(takeSlot(first));
  EXPECT_TRUE(rs.isFencePending());
  selectTb.call();
  sim.step();
  EXPECT_FALSE(selectTb.done());

  ASSERT_TRUE(takeSlot(second));
  EXPECT_FALSE(selectTb.done());
  EXPECT_FALSE(rs.isFencePending());
  sim.step();
  EXPECT_TRUE(selectTb.done());
}

TEST_F(LsuReservationStationTest, FenceInsertHoldsSameCycleSelection) {
  unsigned first = selectSlot();
  Operation fence;
  fence.op = OpType::FenceI;
  fence.robId = 1;
  insertTb.call(insertArgs(first, fence));
  selectTb.call();
  sim.step();
  EXPECT_TRUE(insertTb.done());
  EXPECT_FALSE(selectTb.done());
  selectTb.disable();
  EXPECT_TRUE(rs.isFencePending());
}

TEST_F(LsuReservationStationTest, OrdinaryInsertAllowsSameCycleSelection) {
  unsigned first = selectSlot();
  Operation load;
  load.robId = 1;
  insertTb.call(insertArgs(first, load));
  selectTb.call();
  sim.step();
  EXPECT_TRUE(insertTb.done());
  EXPECT_TRUE(selectTb.done());
  EXPECT_NE(selectTb.getOutputs().getZExt("rs_entry_id"), first);
  EXPECT_FALSE(rs.isFencePending());
}

TEST_F(LsuReservationStationTest, ReadyListIsShared) {
  Adapter secondReader(manager, "ready_tb_2", rs.getReadyList(), 0);
  Operation load;
  load.robId = 1;
  unsigned slot = allocate(load);

  readyTb.call();
  secondReader.call();
  sim.step();
  ASSERT_TRUE(readyTb.done());
  ASSERT_TRUE(secondReader.done());
  EXPECT_EQ(readyTb.getOutputs(), secondReader.getOutputs());
  EXPECT_TRUE(secondReader.getOutputs().get("ready_list")[slot]);
}

TEST(LsuReservationStationDeathTest, RejectsEmptyStation) {
  TransactionManager manager;
  FixedRob rob;
  LsuRsConfig config;
  config.entries = 0;
  EXPECT_DEATH(LsuReservationStation(manager, "rs", config, rob),
               "needs at least one entry");
}

} // namespace
