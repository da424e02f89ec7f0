#include "talon_cancel_scope.h"

#include <chrono>
#include <thread>

#include "gtest/gtest.h"

namespace talon {

using std::chrono::milliseconds;

TEST(CancelScopeTest, BackgroundNeverEnds) {
  CancelScopePtr scope = CancelScope::Background();
  EXPECT_FALSE(scope->Done());
  EXPECT_TRUE(scope->Err().success);
  EXPECT_FALSE(scope->HasDeadline());
  EXPECT_TRUE(scope->SleepFor(milliseconds(1)));
}

TEST(CancelScopeTest, CancelPropagatesToChildrenOnly) {
  CancelScopePtr root = CancelScope::Background();
  CancelScopePtr parent = CancelScope::WithCancel(root);
  CancelScopePtr child = CancelScope::WithCancel(parent);
  CancelScopePtr sibling = CancelScope::WithCancel(root);

  parent->Cancel();

  EXPECT_TRUE(parent->Done());
  EXPECT_TRUE(child->Done());
  EXPECT_EQ(ActionStatus::CANCELED, child->Err().status);
  EXPECT_EQ("context canceled", child->Err().message);
  EXPECT_FALSE(root->Done());
  EXPECT_FALSE(sibling->Done());
}

TEST(CancelScopeTest, ChildCancelLeavesParentRunning) {
  CancelScopePtr parent = CancelScope::Background();
  CancelScopePtr child = CancelScope::WithCancel(parent);
  child->Cancel();
  EXPECT_TRUE(child->Done());
  EXPECT_FALSE(parent->Done());
}

TEST(CancelScopeTest, DeadlineExpiresAsTimeout) {
  CancelScopePtr scope = CancelScope::WithTimeout(CancelScope::Background(), milliseconds(5));
  EXPECT_TRUE(scope->HasDeadline());
  EXPECT_FALSE(scope->SleepFor(milliseconds(500)));

  EXPECT_TRUE(scope->Done());
  ActionResult err = scope->Err();
  EXPECT_EQ(ActionStatus::TIMEOUT, err.status);
  EXPECT_EQ("context deadline exceeded", err.message);
}

TEST(CancelScopeTest, ChildInheritsTighterDeadline) {
  CancelScopePtr parent = CancelScope::WithTimeout(CancelScope::Background(), milliseconds(50));
  CancelScopePtr loose = CancelScope::WithTimeout(parent, milliseconds(60000));
  CancelScopePtr tight = CancelScope::WithTimeout(parent, milliseconds(1));

  EXPECT_EQ(parent->Deadline(), loose->Deadline());
  EXPECT_LT(tight->Deadline(), parent->Deadline());

  CancelScopePtr child = CancelScope::WithCancel(parent);
  EXPECT_TRUE(child->HasDeadline());
  EXPECT_EQ(parent->Deadline(), child->Deadline());
}

TEST(CancelScopeTest, CancellationWinsOverExpiredDeadline) {
  CancelScopePtr scope = CancelScope::WithDeadline(CancelScope::Background(),
                                                   CancelScope::Clock::now() - milliseconds(1));
  EXPECT_EQ(ActionStatus::TIMEOUT, scope->Err().status);

  scope->Cancel();
  EXPECT_EQ(ActionStatus::CANCELED, scope->Err().status);
}

TEST(CancelScopeTest, SleepWakesOnCancel) {
  CancelScopePtr scope = CancelScope::WithCancel(CancelScope::Background());

  std::thread canceller([scope] {
    std::this_thread::sleep_for(milliseconds(20));
    scope->Cancel();
  });

  auto start = CancelScope::Clock::now();
  EXPECT_FALSE(scope->SleepFor(milliseconds(10000)));
  auto elapsed = CancelScope::Clock::now() - start;
  canceller.join();

  EXPECT_LT(elapsed, milliseconds(5000));
}

TEST(CancelScopeTest, SleepWakesOnParentCancel) {
  CancelScopePtr parent = CancelScope::WithCancel(CancelScope::Background());
  CancelScopePtr child = CancelScope::WithCancel(parent);

  std::thread canceller([parent] {
    std::this_thread::sleep_for(milliseconds(20));
    parent->Cancel();
  });

  auto start = CancelScope::Clock::now();
  EXPECT_FALSE(child->SleepFor(milliseconds(10000)));
  auto elapsed = CancelScope::Clock::now() - start;
  canceller.join();

  EXPECT_LT(elapsed, milliseconds(5000));
  EXPECT_EQ(ActionStatus::CANCELED, child->Err().status);
}

}  // namespace talon
