#include "ag/transcript/scroll_controller.hpp"

#include <gtest/gtest.h>

using ag::transcript::ScrollController;
using ag::transcript::ScrollRegime;

namespace {
void settle(ScrollController &scroll, std::size_t content, std::size_t viewport,
            int frames = 60) {
  for (int i = 0; i < frames; ++i)
    scroll.update(content, viewport);
}
} // namespace

TEST(ScrollControllerTests, SmoothScrollConvergesTowardTarget) {
  ScrollController scroll;
  scroll.state().auto_scroll = false;
  scroll.state().target = 100;

  EXPECT_EQ(scroll.update(1000, 20), ScrollRegime::Scroll);
  EXPECT_NEAR(scroll.state().position, 30.0f, 0.01f);
  EXPECT_EQ(scroll.state().offset, 30u);

  for (int i = 1; i < 15; ++i)
    scroll.update(1000, 20);
  EXPECT_NEAR(scroll.state().position, 100.0f, 1.0f);
  EXPECT_TRUE(scroll.animating());

  settle(scroll, 1000, 20);
  EXPECT_FLOAT_EQ(scroll.state().position, 100.0f);
  EXPECT_FALSE(scroll.animating());
  EXPECT_FALSE(scroll.state().auto_scroll);
}

TEST(ScrollControllerTests, ShortContentDisablesScrolling) {
  ScrollController scroll;
  scroll.state().auto_scroll = false;
  scroll.state().target = 40;
  scroll.state().position = 12.0f;

  EXPECT_EQ(scroll.update(10, 20), ScrollRegime::Fit);
  EXPECT_EQ(scroll.state().target, 0u);
  EXPECT_EQ(scroll.state().offset, 0u);
  EXPECT_FLOAT_EQ(scroll.state().position, 0.0f);
  EXPECT_TRUE(scroll.state().auto_scroll);
  EXPECT_EQ(scroll.update(20, 20), ScrollRegime::Fit);
}

TEST(ScrollControllerTests, AutoScrollTracksNewContent) {
  ScrollController scroll;
  settle(scroll, 100, 20);
  EXPECT_EQ(scroll.state().offset, 80u);
  EXPECT_EQ(scroll.max_scroll(), 80u);

  settle(scroll, 150, 20);
  EXPECT_EQ(scroll.state().target, 130u);
  EXPECT_EQ(scroll.state().offset, 130u);
  EXPECT_TRUE(scroll.state().auto_scroll);
}

TEST(ScrollControllerTests, ScrollingUpDetachesAndBottomReattaches) {
  ScrollController scroll;
  settle(scroll, 100, 20);

  scroll.scroll_by(-10);
  EXPECT_FALSE(scroll.state().auto_scroll);
  EXPECT_EQ(scroll.state().target, 70u);
  settle(scroll, 100, 20);
  EXPECT_EQ(scroll.state().offset, 70u);

  // New content does not move a detached view.
  settle(scroll, 120, 20);
  EXPECT_EQ(scroll.state().offset, 70u);
  EXPECT_FALSE(scroll.state().auto_scroll);

  scroll.scroll_by(30);
  settle(scroll, 120, 20);
  EXPECT_EQ(scroll.state().offset, 100u);
  EXPECT_TRUE(scroll.state().auto_scroll);
}

TEST(ScrollControllerTests, TargetIsClampedOnResize) {
  ScrollController scroll;
  scroll.state().auto_scroll = false;
  scroll.state().target = 500;
  scroll.update(100, 20);
  EXPECT_EQ(scroll.state().target, 80u);

  scroll.scroll_by(-1000);
  EXPECT_EQ(scroll.state().target, 0u);
}

TEST(ScrollControllerTests, JumpsToTopAndBottom) {
  ScrollController scroll;
  settle(scroll, 300, 20);

  scroll.jump_to_top();
  settle(scroll, 300, 20);
  EXPECT_EQ(scroll.state().offset, 0u);
  EXPECT_FALSE(scroll.state().auto_scroll);

  scroll.jump_to_bottom();
  settle(scroll, 300, 20);
  EXPECT_EQ(scroll.state().offset, 280u);
  EXPECT_TRUE(scroll.state().auto_scroll);
}

TEST(ScrollControllerTests, SmoothingOfOneJumpsImmediately) {
  ScrollController scroll(1.0f);
  scroll.update(500, 20);
  EXPECT_EQ(scroll.state().offset, 480u);
}
