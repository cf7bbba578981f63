//===- ElaborationTest.cpp - Call graph validation tests ------------------===//
//
// Part of the Latch Project
//
//===----------------------------------------------------------------------===//

#include "latch/Core/ElaborationError.h"
#include "latch/Core/TransactionManager.h"
#include "gtest/gtest.h"

using namespace latch;

namespace {

Record noResult(CallContext &, const Record &) { return Record(); }

/// Elaborate and return the error message, or an empty string on success.
std::string elaborate(TransactionManager &manager) {
  if (llvm::Error err = manager.elaborate())
    return llvm::toString(std::move(err));
  return "";
}

TEST(ElaborationErrorTest, Format) {
  std::string message = ElaborationError("cam.push")
                            .setCategory(ErrorCategory::CyclicCallGraph)
                            .setDetails("a -> b -> a")
                            .setReason("no recursion")
                            .setSolution("break it")
                            .str();
  EXPECT_EQ(message, "[cam.push] Elaboration failed - cyclic call graph: "
                     "a -> b -> a. Reason: no recursion. Solution: break it");

  llvm::Error err = ElaborationError("x").setCategory("custom check").build();
  EXPECT_EQ(llvm::toString(std::move(err)),
            "[x] Elaboration failed - custom check");
}

TEST(ElaborationTest, AcceptsWellFormedGraph) {
  TransactionManager manager;
  Method &leaf = manager.createMethod("leaf");
  leaf.setBody(noResult);
  Method &mid = manager.createMethod("mid");
  mid.calls(leaf);
  mid.setBody([&](CallContext &ctx, const Record &) {
    ctx.call(leaf);
    return Record();
  });
  Transaction &txn = manager.createTransaction("top");
  txn.calls(mid);
  txn.setBody([&](CallContext &ctx) { ctx.call(mid); });

  EXPECT_EQ(elaborate(manager), "");
  EXPECT_TRUE(manager.isElaborated());
  EXPECT_EQ(manager.lookup("mid"), &mid);
  EXPECT_EQ(manager.lookup("nothing"), nullptr);
  EXPECT_EQ(manager.getNumConflictComponents(), 1u);
}

TEST(ElaborationTest, DuplicateName) {
  TransactionManager manager;
  manager.createMethod("m").setBody(noResult);
  manager.createMethod("m").setBody(noResult);
  EXPECT_NE(elaborate(manager).find("duplicate name"), std::string::npos);
}

TEST(ElaborationTest, MissingBody) {
  TransactionManager manager;
  manager.createMethod("lonely");
  std::string message = elaborate(manager);
  EXPECT_NE(message.find("[lonely]"), std::string::npos);
  EXPECT_NE(message.find("missing definition"), std::string::npos);
}

TEST(ElaborationTest, CyclicCallGraphReportsPath) {
  TransactionManager manager;
  Method &a = manager.createMethod("a");
  Method &b = manager.createMethod("b");
  a.calls(b);
  b.calls(a);
  a.setBody(noResult);
  b.setBody(noResult);
  Transaction &txn = manager.createTransaction("t");
  txn.calls(a);
  txn.setBody([&](CallContext &ctx) { ctx.call(a); });

  std::string message = elaborate(manager);
  EXPECT_NE(message.find("cyclic call graph"), std::string::npos);
  EXPECT_NE(message.find("a -> b -> a"), std::string::npos);
  EXPECT_FALSE(manager.isElaborated());
}

TEST(ElaborationTest, MethodReachedTwiceFromOneTransaction) {
  TransactionManager manager;
  Method &shared = manager.createMethod("shared");
  shared.setBody(noResult);
  Method &left = manager.createMethod("left");
  Method &right = manager.createMethod("right");
  left.calls(shared);
  right.calls(shared);
  left.setBody(noResult);
  right.setBody(noResult);
  Transaction &txn = manager.createTransaction("t");
  txn.calls(left);
  txn.calls(right);
  txn.setBody([](CallContext &) {});

  std::string message = elaborate(manager);
  EXPECT_NE(message.find("multiple calls"), std::string::npos);
  EXPECT_NE(message.find("'shared'"), std::string::npos);
}

TEST(ElaborationTest, TransactionReachingDeclaredConflict) {
  TransactionManager manager;
  Method &a = manager.createMethod("a");
  Method &b = manager.createMethod("b");
  a.setBody(noResult);
  b.setBody(noResult);
  manager.addConflict(a, b);
  Transaction &txn = manager.createTransaction("t");
  txn.calls(a);
  txn.calls(b);
  txn.setBody([&](CallContext &ctx) {
    ctx.call(a);
    ctx.call(b);
  });

  std::string message = elaborate(manager);
  EXPECT_NE(message.find("conflicting calls"), std::string::npos);
  EXPECT_NE(message.find("[t]"), std::string::npos);
  EXPECT_FALSE(manager.isElaborated());
}

TEST(ElaborationTest, NestedCallReachingDeclaredConflict) {
  TransactionManager manager;
  Method &a = manager.createMethod("a");
  Method &b = manager.createMethod("b");
  Method &wrapper = manager.createMethod("wrapper");
  a.setBody(noResult);
  b.setBody(noResult);
  wrapper.calls(b);
  wrapper.setBody([&](CallContext &ctx, const Record &) {
    ctx.call(b);
    return Record();
  });
  manager.addConflict(b, a);
  Transaction &txn = manager.createTransaction("t");
  txn.calls(a);
  txn.calls(wrapper);
  txn.setBody([&](CallContext &ctx) {
    ctx.call(a);
    ctx.call(wrapper);
  });
  EXPECT_NE(elaborate(manager).find("declared conflicting"), std::string::npos);
}

TEST(ElaborationTest, DuplicateCallSite) {
  TransactionManager manager;
  Method &m = manager.createMethod("m");
  m.setBody(noResult);
  Transaction &txn = manager.createTransaction("t");
  txn.calls(m);
  txn.calls(m);
  txn.setBody([](CallContext &) {});
  EXPECT_NE(elaborate(manager).find("more than one call"), std::string::npos);
}

TEST(ElaborationTest, ValidatedCalleeNeedsEarlyArguments) {
  TransactionManager manager;
  Method &m = manager.createMethod("m", Layout{{"x", 4}});
  m.setBody(noResult);
  m.setValidator([](const Record &args) { return args.getZExt("x") != 0; });
  Transaction &txn = manager.createTransaction("t");
  txn.calls(m);
  txn.setBody([](CallContext &) {});

  std::string message = elaborate(manager);
  EXPECT_NE(message.find("invalid call site"), std::string::npos);
  EXPECT_NE(message.find("early arguments"), std::string::npos);
}

TEST(ElaborationTest, AmbiguousPriorityBetweenAlwaysReadyRivals) {
  TransactionManager manager;
  Method &m = manager.createMethod("m");
  m.setBody(noResult);
  for (const char *name : {"t1", "t2"}) {
    Transaction &txn = manager.createTransaction(name, /*priority=*/1);
    txn.calls(m);
    txn.setBody([&m](CallContext &ctx) { ctx.call(m); });
  }
  EXPECT_NE(elaborate(manager).find("ambiguous priority"), std::string::npos);
}

TEST(ElaborationTest, EqualPriorityIsFineWhenOneMayIdle) {
  TransactionManager manager;
  Method &m = manager.createMethod("m");
  m.setBody(noResult);
  bool request = false;
  for (const char *name : {"t1", "t2"}) {
    Transaction &txn = manager.createTransaction(name, /*priority=*/1);
    txn.calls(m);
    txn.setBody([&m](CallContext &ctx) { ctx.call(m); });
    if (request)
      txn.setRequest([] { return true; });
    request = true;
  }
  EXPECT_EQ(elaborate(manager), "");
}

TEST(ElaborationTest, SecondElaborationFails) {
  TransactionManager manager;
  EXPECT_EQ(elaborate(manager), "");
  EXPECT_NE(elaborate(manager).find("already elaborated"), std::string::npos);
}

TEST(ElaborationDeathTest, RegistrationAfterElaboration) {
  TransactionManager manager;
  Method &m = manager.createMethod("m");
  m.setBody(noResult);
  ASSERT_EQ(elaborate(manager), "");
  EXPECT_DEATH(manager.createMethod("late"), "after elaboration");
  EXPECT_DEATH(m.setReady([] { return true; }), "after elaboration");
}

} // namespace
