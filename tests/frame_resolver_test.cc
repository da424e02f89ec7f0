#include "talon_frame_resolver.h"

#include <string>
#include <vector>

#include "fake_browser.h"
#include "gtest/gtest.h"
#include "talon_element.h"
#include "talon_page.h"

namespace talon {

// main
//  +- iframe -> a
//  |            +- iframe -> a1
//  |                         +- iframe -> a2
//  +- iframe -> b
class FrameResolverTest : public ::testing::Test {
 protected:
  FrameResolverTest()
      : scope_(CancelScope::Background()), page_(&browser_, "session-1") {
    browser_.AddFrame(test::FakeBrowser::kMainFrame, "a");
    browser_.AddFrame("a", "a1");
    browser_.AddFrame("a1", "a2");
    browser_.AddFrame(test::FakeBrowser::kMainFrame, "b");
  }

  // Windows HasObject checked, in call order
  std::vector<std::string> CheckedWindows() const {
    std::vector<std::string> windows;
    for (const json& params : browser_.ParamsOf("Runtime.callFunctionOn")) {
      if (JsonString(params, "functionDeclaration") == "function(obj) { return true }") {
        windows.push_back(JsonString(params, "objectId"));
      }
    }
    return windows;
  }

  test::FakeBrowser browser_;
  CancelScopePtr scope_;
  Page page_;
};

TEST_F(FrameResolverTest, RelocatesIntoNestedFrame) {
  int64_t target = browser_.AddNode("a2", "button");
  std::string stale = browser_.ObjectFor(target);
  Element element = page_.ElementFromObject(scope_, stale);

  ASSERT_TRUE(element.EnsureOwningPage(target, stale).success);

  Page* owner = element.GetPage();
  ASSERT_NE(&page_, owner);
  EXPECT_TRUE(owner->IsFrame());
  EXPECT_EQ(&page_, owner->Root());
  std::string frame_id;
  ASSERT_TRUE(owner->FrameId(*scope_, frame_id).success);
  EXPECT_EQ("a2", frame_id);
  EXPECT_NE(stale, element.ObjectId());

  std::vector<std::string> expected = {"window-main", "window-a", "window-a1", "window-a2"};
  EXPECT_EQ(expected, CheckedWindows());
  EXPECT_EQ(3u, page_.FrameCount());

  // The relocated handle works in its own context
  std::string html;
  ASSERT_TRUE(element.HTML(html).success);
  EXPECT_EQ("<button></button>", html);
}

TEST_F(FrameResolverTest, SearchIsDepthFirstInDocumentOrder) {
  int64_t target = browser_.AddNode("b", "input");
  std::string stale = browser_.ObjectFor(target);
  Element element = page_.ElementFromObject(scope_, stale);

  ASSERT_TRUE(element.EnsureOwningPage(target, stale).success);

  std::vector<std::string> expected = {"window-main", "window-a", "window-a1", "window-a2",
                                       "window-b"};
  EXPECT_EQ(expected, CheckedWindows());
  std::string frame_id;
  ASSERT_TRUE(element.GetPage()->FrameId(*scope_, frame_id).success);
  EXPECT_EQ("b", frame_id);
  EXPECT_EQ(4u, page_.FrameCount());
}

TEST_F(FrameResolverTest, UnknownNodeLeavesHandleUnchanged) {
  int64_t node = browser_.AddNode("a2", "button");
  std::string stale = browser_.ObjectFor(node);
  Element element = page_.ElementFromObject(scope_, stale);

  ASSERT_TRUE(element.EnsureOwningPage(987654, stale).success);
  EXPECT_EQ(&page_, element.GetPage());
  EXPECT_EQ(stale, element.ObjectId());
}

TEST_F(FrameResolverTest, OwnedObjectSkipsTheSearch) {
  int64_t node = browser_.AddNode(test::FakeBrowser::kMainFrame, "button");
  std::string id = browser_.ObjectFor(node);
  Element element = page_.ElementFromObject(scope_, id);

  ASSERT_TRUE(element.EnsureOwningPage(node, id).success);
  EXPECT_EQ(&page_, element.GetPage());
  EXPECT_EQ(id, element.ObjectId());
  EXPECT_EQ(0, browser_.Count("Runtime.getProperties"));
  EXPECT_EQ(0u, page_.FrameCount());
}

TEST_F(FrameResolverTest, ProtocolErrorAbortsTheSearch) {
  int64_t target = browser_.AddNode("a2", "button");
  std::string stale = browser_.ObjectFor(target);
  Element element = page_.ElementFromObject(scope_, stale);
  browser_.Fail("DOM.describeNode", -32000, "Target closed");

  ActionResult result = element.EnsureOwningPage(target, stale);
  EXPECT_EQ(ActionStatus::PROTOCOL_ERROR, result.status);
  EXPECT_EQ("DOM.describeNode", result.method);
  EXPECT_EQ(&page_, element.GetPage());
  EXPECT_EQ(stale, element.ObjectId());
}

TEST_F(FrameResolverTest, FramePagesAreReusedAcrossSearches) {
  int64_t first = browser_.AddNode("a1", "p");
  int64_t second = browser_.AddNode("a1", "span");

  std::string stale = browser_.ObjectFor(first);
  Element one = page_.ElementFromObject(scope_, stale);
  ASSERT_TRUE(one.EnsureOwningPage(first, stale).success);

  stale = browser_.ObjectFor(second);
  Element two = page_.ElementFromObject(scope_, stale);
  ASSERT_TRUE(two.EnsureOwningPage(second, stale).success);

  EXPECT_EQ(one.GetPage(), two.GetPage());
  EXPECT_EQ(2u, page_.FrameCount());
}

TEST_F(FrameResolverTest, RelocatesIntoFrameAfterItNavigates) {
  int64_t before = browser_.AddNode("a", "p");
  std::string stale = browser_.ObjectFor(before);
  Element warm = page_.ElementFromObject(scope_, stale);
  ASSERT_TRUE(warm.EnsureOwningPage(before, stale).success);
  Page* frame_a = warm.GetPage();

  // Same frame id, fresh execution context
  browser_.Navigate("a");
  int64_t after = browser_.AddNode("a", "button");
  stale = browser_.ObjectFor(after);
  Element element = page_.ElementFromObject(scope_, stale);

  ASSERT_TRUE(element.EnsureOwningPage(after, stale).success);
  EXPECT_EQ(frame_a, element.GetPage());
  EXPECT_NE(stale, element.ObjectId());
  EXPECT_EQ(1u, page_.FrameCount());

  std::string html;
  ASSERT_TRUE(element.HTML(html).success);
  EXPECT_EQ("<button></button>", html);
}

TEST_F(FrameResolverTest, FrameEvaluatesAfterNavigation) {
  std::vector<std::string> iframes;
  ASSERT_TRUE(page_.Elements(*scope_, "iframe", iframes).success);
  ASSERT_EQ(2u, iframes.size());

  Page* frame = nullptr;
  ASSERT_TRUE(page_.ElementFromObject(scope_, iframes[0]).Frame(frame).success);
  RemoteObject out;
  ASSERT_TRUE(frame->Evaluate(*scope_, EvalOptions("function() { return 1 }", {}), out).success);

  browser_.Navigate("a");

  Page* again = nullptr;
  ASSERT_TRUE(page_.Elements(*scope_, "iframe", iframes).success);
  ASSERT_TRUE(page_.ElementFromObject(scope_, iframes[0]).Frame(again).success);
  EXPECT_EQ(frame, again);

  ActionResult result = again->Evaluate(*scope_, EvalOptions("function() { return 1 }", {}), out);
  EXPECT_TRUE(result.success) << result.ToString();
  EXPECT_FALSE(browser_.IsReleased("window-a"));
}

TEST_F(FrameResolverTest, SearchReportsNotFoundWithoutRebinding) {
  Element element = page_.ElementFromObject(scope_, "obj-gone");
  FrameSearchResult found = FrameResolver::Search(element, &page_, 987654);
  EXPECT_EQ(FrameSearchResult::NOT_FOUND, found.kind);
  EXPECT_EQ(nullptr, found.page);
}

}  // namespace talon
