#include "talon_wait_engine.h"

#include <algorithm>
#include <chrono>
#include <thread>
#include <vector>

#include "fake_browser.h"
#include "gtest/gtest.h"
#include "talon_element.h"
#include "talon_page.h"

namespace talon {

namespace {

TalonConfig FastConfig() {
  TalonConfig config;
  config.sleeper_initial_ms = 1;
  config.sleeper_max_ms = 2;
  config.wait_stable_interval_ms = 1;
  return config;
}

json QuadsOf(const std::vector<Quad>& quads) {
  json out = json::array();
  for (const auto& quad : quads) {
    json points = json::array();
    for (double p : quad.points) {
      points.push_back(p);
    }
    out.push_back(points);
  }
  return out;
}

json BoolValue(bool value) {
  return {{"type", "boolean"}, {"value", value}};
}

}  // namespace

class WaitEngineTest : public ::testing::Test {
 protected:
  WaitEngineTest()
      : scope_(CancelScope::Background()), page_(&browser_, "session-1", FastConfig()) {
    box_ = browser_.AddNode(test::FakeBrowser::kMainFrame, "div");
    browser_.SetRect(box_, 0, 0, 50, 50);
  }

  Element Box() { return page_.ElementFromObject(scope_, browser_.ObjectFor(box_)); }

  // Serve DOM.getContentQuads from |frames|, repeating the last one
  void ServeQuads(const std::vector<Quad>& frames, int* served) {
    browser_.On("DOM.getContentQuads", [frames, served](const json&, json& result) {
      size_t i = std::min(static_cast<size_t>(*served), frames.size() - 1);
      (*served)++;
      result["quads"] = QuadsOf({frames[i]});
      return ActionResult::Success();
    });
  }

  test::FakeBrowser browser_;
  CancelScopePtr scope_;
  Page page_;
  int64_t box_;
};

TEST_F(WaitEngineTest, WaitVisiblePollsUntilTruthy) {
  int polls = 0;
  browser_.OnScript("helpers.visible", [&polls](const test::FakeNode*, const json&, json& result) {
    result["result"] = BoolValue(++polls >= 3);
    return ActionResult::Success();
  });

  Element box = Box();
  ASSERT_TRUE(box.WaitVisible().success);
  EXPECT_EQ(3, polls);
}

TEST_F(WaitEngineTest, CustomPredicateSeesElementAsThis) {
  int polls = 0;
  browser_.OnScript("this.dataset.ready", [&](const test::FakeNode* self, const json&, json& result) {
    EXPECT_EQ(box_, self ? self->node_id : 0);
    result["result"] = {{"type", "string"}, {"value", ++polls > 1 ? "yes" : ""}};
    return ActionResult::Success();
  });

  Element box = Box();
  ASSERT_TRUE(box.Wait("this.dataset.ready").success);
  EXPECT_EQ(2, polls);
}

TEST_F(WaitEngineTest, EvalErrorEndsTheWaitAtOnce) {
  int polls = 0;
  browser_.OnScript("helpers.visible", [&polls](const test::FakeNode*, const json&, json& result) {
    polls++;
    result["result"] = {{"type", "object"}, {"subtype", "error"}};
    result["exceptionDetails"] = {
      {"text", "Uncaught"},
      {"exception", {{"description", "TypeError: boom"}}}
    };
    return ActionResult::Success();
  });

  Element box = Box();
  ActionResult result = box.WaitVisible();
  EXPECT_EQ(ActionStatus::EVAL_ERROR, result.status);
  EXPECT_NE(std::string::npos, result.message.find("TypeError: boom"));
  EXPECT_EQ(1, polls);
}

TEST_F(WaitEngineTest, ExhaustedSleeperTimesOut) {
  browser_.Node(box_).visible = false;
  Element box = Box().WithSleeper(MakeBackoffSleeperFactory(
      std::chrono::milliseconds(1), std::chrono::milliseconds(1), 1.0, 3));

  ActionResult result = box.WaitVisible();
  EXPECT_EQ(ActionStatus::TIMEOUT, result.status);
  EXPECT_NE(std::string::npos, result.message.find("max sleep count 3"));

  int polls = 0;
  for (const json& params : browser_.ParamsOf("Runtime.callFunctionOn")) {
    if (JsonString(params, "functionDeclaration").find("helpers.visible") != std::string::npos) {
      polls++;
    }
  }
  EXPECT_EQ(4, polls);
}

TEST_F(WaitEngineTest, EachWaitGetsAFreshSleeper) {
  int polls = 0;
  browser_.OnScript("helpers.visible", [&polls](const test::FakeNode*, const json&, json& result) {
    polls++;
    result["result"] = BoolValue(false);
    return ActionResult::Success();
  });
  Element box = Box().WithSleeper(MakeBackoffSleeperFactory(
      std::chrono::milliseconds(1), std::chrono::milliseconds(1), 1.0, 1));

  EXPECT_EQ(ActionStatus::TIMEOUT, box.WaitVisible().status);
  EXPECT_EQ(2, polls);
  EXPECT_EQ(ActionStatus::TIMEOUT, box.WaitVisible().status);
  EXPECT_EQ(4, polls);
}

TEST_F(WaitEngineTest, DeadlineEndsTheWait) {
  browser_.Node(box_).visible = false;
  Element box = Box().WithTimeout(std::chrono::milliseconds(30));

  ActionResult result = box.WaitVisible();
  EXPECT_EQ(ActionStatus::TIMEOUT, result.status);
  EXPECT_EQ("context deadline exceeded", result.message);
}

TEST_F(WaitEngineTest, CancelFromAnotherThread) {
  browser_.Node(box_).visible = false;
  CancelScopePtr scope = CancelScope::WithCancel(scope_);
  Element box = Box().WithScope(scope);

  std::thread canceller([scope] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    scope->Cancel();
  });
  ActionResult result = box.WaitVisible();
  canceller.join();

  EXPECT_EQ(ActionStatus::CANCELED, result.status);
  EXPECT_FALSE(scope_->Done());
}

TEST_F(WaitEngineTest, WaitInvisible) {
  browser_.Node(box_).visible = false;
  Element box = Box();
  ASSERT_TRUE(box.WaitInvisible().success);
}

TEST_F(WaitEngineTest, StableAfterTwoEqualSamples) {
  int served = 0;
  ServeQuads({test::FakeBrowser::Rect(0, 0, 10, 10), test::FakeBrowser::Rect(0, 5, 10, 10),
              test::FakeBrowser::Rect(0, 9, 10, 10), test::FakeBrowser::Rect(0, 9, 10, 10)},
             &served);

  Element box = Box();
  ASSERT_TRUE(box.WaitStable(std::chrono::milliseconds(1)).success);
  EXPECT_EQ(4, served);
}

TEST_F(WaitEngineTest, StaticElementNeedsTwoSamples) {
  Element box = Box();
  ASSERT_TRUE(box.WaitStable().success);
  EXPECT_EQ(2, browser_.Count("DOM.getContentQuads"));
}

TEST_F(WaitEngineTest, StableWaitsForVisibilityFirst) {
  browser_.Node(box_).visible = false;
  Element box = Box().WithSleeper(MakeBackoffSleeperFactory(
      std::chrono::milliseconds(1), std::chrono::milliseconds(1), 1.0, 2));

  EXPECT_EQ(ActionStatus::TIMEOUT, box.WaitStable().status);
  EXPECT_EQ(0, browser_.Count("DOM.getContentQuads"));
}

TEST_F(WaitEngineTest, MovingElementStopsOnCancel) {
  CancelScopePtr scope = CancelScope::WithCancel(scope_);
  int served = 0;
  browser_.On("DOM.getContentQuads", [scope, &served](const json&, json& result) {
    if (++served == 3) {
      scope->Cancel();
    }
    result["quads"] = QuadsOf({test::FakeBrowser::Rect(served * 10, 0, 10, 10)});
    return ActionResult::Success();
  });

  Element box = Box().WithScope(scope);
  ActionResult result = box.WaitStable(std::chrono::milliseconds(1));
  EXPECT_EQ(ActionStatus::CANCELED, result.status);
  EXPECT_EQ(3, served);
}

TEST_F(WaitEngineTest, ShapeFailureIsReturned) {
  browser_.Fail("DOM.getContentQuads", -32000, "Could not compute content quads.");
  Element box = Box();

  ActionResult result = box.WaitStable();
  EXPECT_EQ(ActionStatus::PROTOCOL_ERROR, result.status);
  EXPECT_EQ("DOM.getContentQuads", result.method);
}

}  // namespace talon
