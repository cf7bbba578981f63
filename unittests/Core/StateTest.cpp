//===- StateTest.cpp - Registered state tests -----------------------------===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//

#include "latch/Core/Component.h"
#include "latch/Core/State.h"
#include "latch/Core/TransactionManager.h"
#include "gtest/gtest.h"

using namespace latch;

namespace {

class Holder : public Component {
public:
  explicit Holder(TransactionManager &manager)
      : Component(manager, "holder"), count(*this, "count", 5),
        table(*this, "table", 4, 0), flags(*this, "flags", 4, false),
        strobe(*this, "strobe", -1) {}

  Reg<int> count;
  RegArray<int> table;
  RegArray<bool> flags;
  Wire<int> strobe;
};

TEST(StateTest, RegisterWritesAppearAtTheEdge) {
  TransactionManager manager;
  Holder holder(manager);

  holder.count.write(9);
  EXPECT_EQ(holder.count.read(), 5);
  EXPECT_EQ(holder.count.peekNext(), 9);
  EXPECT_TRUE(holder.count.isWritten());

  holder.commitStateUpdates();
  EXPECT_EQ(holder.count.read(), 9);
  EXPECT_FALSE(holder.count.isWritten());

  holder.reset();
  EXPECT_EQ(holder.count.read(), 5);
}

TEST(StateTest, ArrayElementsAreIndependent) {
  TransactionManager manager;
  Holder holder(manager);

  holder.table.write(1, 10);
  holder.table.write(3, 30);
  EXPECT_EQ(holder.table.read(1), 0);
  holder.commitStateUpdates();
  EXPECT_EQ(holder.table.read(0), 0);
  EXPECT_EQ(holder.table.read(1), 10);
  EXPECT_EQ(holder.table.read(3), 30);

  holder.table.write(1, 11);
  holder.commitStateUpdates();
  EXPECT_EQ(holder.table.read(1), 11);
}

TEST(StateTest, BoolArrayReadsReferToStoredElements) {
  TransactionManager manager;
  Holder holder(manager);

  holder.flags.write(2, true);
  EXPECT_FALSE(holder.flags.read(2));
  EXPECT_TRUE(holder.flags.peekNext(2));
  holder.commitStateUpdates();

  const bool &flag = holder.flags.read(2);
  EXPECT_TRUE(flag);
  EXPECT_FALSE(holder.flags.read(1));

  holder.flags.write(2, false);
  EXPECT_TRUE(flag);
  EXPECT_FALSE(holder.flags.peekNext(2));
  holder.commitStateUpdates();
  EXPECT_FALSE(flag);
}

TEST(StateTest, WiresLastOneCycle) {
  TransactionManager manager;
  Holder holder(manager);

  EXPECT_FALSE(holder.strobe.isDriven());
  holder.strobe.set(3);
  EXPECT_EQ(holder.strobe.get(), 3);
  holder.commitStateUpdates();
  EXPECT_FALSE(holder.strobe.isDriven());
  EXPECT_EQ(holder.strobe.get(), -1);
}

TEST(StateTest, ManagerCommitsEveryComponent) {
  TransactionManager manager;
  Holder holder(manager);
  holder.count.write(1);
  manager.commitStateUpdates();
  EXPECT_EQ(holder.count.read(), 1);
  EXPECT_EQ(manager.getCycle(), 1u);
}

TEST(StateDeathTest, SecondWriteInOneCycle) {
  TransactionManager manager;
  Holder holder(manager);
  holder.count.write(1);
  EXPECT_DEATH(holder.count.write(2), "Second write to register");
  holder.table.write(2, 1);
  EXPECT_DEATH(holder.table.write(2, 2), "register array element 2");
  holder.strobe.set(1);
  EXPECT_DEATH(holder.strobe.set(2), "Second write to wire");
}

TEST(StateDeathTest, IndexOutOfRange) {
  TransactionManager manager;
  Holder holder(manager);
  EXPECT_DEATH(holder.table.read(4), "out of range");
}

} // namespace
