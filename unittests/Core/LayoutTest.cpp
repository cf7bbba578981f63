//===- LayoutTest.cpp - Layout and record tests ---------------------------===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//

#include "latch/Core/Layout.h"
#include "gtest/gtest.h"

using namespace latch;

namespace {

TEST(LayoutTest, WidthAndLookup) {
  Layout layout = {{"addr", 10}, {"data", 32}, {"mask", 4}};
  EXPECT_EQ(layout.size(), 3u);
  EXPECT_EQ(layout.getWidth(), 46u);
  EXPECT_EQ(*layout.lookup("data"), 1u);
  EXPECT_FALSE(layout.lookup("tag").has_value());
}

TEST(LayoutTest, StructuralEquality) {
  Layout a = {{"x", 3}, {"y", 5}};
  Layout b = {{"x", 3}, {"y", 5}};
  Layout c = {{"x", 3}, {"y", 6}};
  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
  EXPECT_EQ(Layout(), Layout());
}

TEST(RecordTest, PackPutsFirstFieldLow) {
  Layout layout = {{"lo", 4}, {"hi", 4}};
  Record record(layout, {0x3, 0xA});
  EXPECT_EQ(record.pack().getZExtValue(), 0xA3u);

  Record unpacked = layout.unpack(llvm::APInt(8, 0x5C));
  EXPECT_EQ(unpacked.getZExt("lo"), 0xCu);
  EXPECT_EQ(unpacked.getZExt("hi"), 0x5u);
}

TEST(RecordTest, SetTruncatesToFieldWidth) {
  Record record(Layout{{"v", 4}});
  record.set("v", 0x1F);
  EXPECT_EQ(record.getZExt("v"), 0xFu);
  record.set("v", llvm::APInt(16, 0x0102));
  EXPECT_EQ(record.getZExt("v"), 0x2u);
  EXPECT_EQ(record.get("v").getBitWidth(), 4u);
}

TEST(RecordTest, WideFields) {
  Layout layout = {{"wide", 100}, {"flag", 1}};
  Record record(layout);
  llvm::APInt big = llvm::APInt::getOneBitSet(100, 99);
  record.set("wide", big);
  record.set("flag", 1);
  llvm::APInt packed = record.pack();
  EXPECT_EQ(packed.getBitWidth(), 101u);
  EXPECT_TRUE(packed[99]);
  EXPECT_TRUE(packed[100]);
  EXPECT_EQ(layout.unpack(packed), record);
}

TEST(RecordDeathTest, MissingField) {
  Record record(Layout{{"a", 1}});
  EXPECT_DEATH(record.get("b"), "no field 'b'");
}

TEST(LayoutDeathTest, RejectsZeroWidthAndDuplicates) {
  EXPECT_DEATH(Layout({{"a", 0}}), "zero width");
  EXPECT_DEATH(Layout({{"a", 1}, {"a", 2}}), "declared twice");
}

} // namespace
