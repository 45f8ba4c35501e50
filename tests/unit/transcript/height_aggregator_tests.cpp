#include "ag/transcript/height_aggregator.hpp"
#include "ag/transcript/tool_call_view.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace ag::transcript;

namespace {
class CountingRenderer : public PlainTextRenderer {
public:
  std::vector<StyledLine> render(std::string_view content,
                                 TextRenderState &state, std::uint16_t width,
                                 StyleMask background) override {
    ++calls;
    return PlainTextRenderer::render(content, state, width, background);
  }

  int calls = 0;
};

Message text_message(Role role, std::string text) {
  Message message(role);
  message.blocks.emplace_back(TextBlock(std::move(text)));
  return message;
}

ToolCallBlock tool_call(std::string id, ToolCallStatus status,
                        std::string content = {}) {
  ToolCallBlock call;
  call.id = std::move(id);
  call.title = "Run " + call.id;
  call.status = status;
  call.content = std::move(content);
  return call;
}

std::vector<Message> conversation(std::size_t count) {
  std::vector<Message> messages;
  for (std::size_t i = 0; i < count; ++i)
    messages.push_back(text_message(i % 2 == 0 ? Role::User : Role::Assistant,
                                    "message " + std::to_string(i)));
  return messages;
}

class HeightAggregatorTest : public ::testing::Test {
protected:
  CountingRenderer renderer;
  LayoutContext context{renderer, kDefaultTerminalTailLines};
  SpinnerState idle;
};
} // namespace

TEST(SpacingTests, InsertsRowOnlyBetweenDifferentKinds) {
  using K = BlockKind;
  EXPECT_EQ(block_spacing(std::vector<K>{}), 0u);
  EXPECT_EQ(block_spacing(std::vector<K>{K::ToolCall}), 0u);
  EXPECT_EQ(block_spacing(std::vector<K>{K::Text, K::Text}), 0u);
  EXPECT_EQ(block_spacing(std::vector<K>{K::ToolCall, K::ToolCall}), 0u);
  EXPECT_EQ(block_spacing(std::vector<K>{K::Text, K::ToolCall, K::ToolCall,
                                         K::Text}),
            2u);
  EXPECT_EQ(spacing_before(std::nullopt, K::ToolCall), 0u);
}

TEST_F(HeightAggregatorTest, UserMessageIsLabelTextAndSeparator) {
  auto message = text_message(Role::User, "hello");
  EXPECT_EQ(compute_message_height(message, context, idle, 40), 3u);

  auto wrapped = text_message(Role::User, "aaaa bbbb cccc");
  EXPECT_EQ(compute_message_height(wrapped, context, idle, 4), 5u);
}

TEST_F(HeightAggregatorTest, AddsSpacingAtTextToolTransitions) {
  Message message(Role::Assistant);
  message.blocks.emplace_back(TextBlock("a"));
  message.blocks.emplace_back(tool_call("t1", ToolCallStatus::Completed));
  message.blocks.emplace_back(tool_call("t2", ToolCallStatus::Completed));
  message.blocks.emplace_back(TextBlock("b"));
  // label, a, blank, t1, t2, blank, b, separator
  EXPECT_EQ(compute_message_height(message, context, idle, 40), 8u);
}

TEST_F(HeightAggregatorTest, NoSpacingBeforeFirstBlock) {
  Message message(Role::Assistant);
  message.blocks.emplace_back(tool_call("t1", ToolCallStatus::Completed));
  message.blocks.emplace_back(TextBlock("after"));
  EXPECT_EQ(compute_message_height(message, context, idle, 40), 5u);
}

TEST_F(HeightAggregatorTest, HiddenToolCallsTakeNoRowsOrSpacing) {
  Message message(Role::Assistant);
  message.blocks.emplace_back(TextBlock("a"));
  auto hidden = tool_call("t1", ToolCallStatus::Completed, "body");
  hidden.hidden = true;
  message.blocks.emplace_back(std::move(hidden));
  message.blocks.emplace_back(TextBlock("b"));
  EXPECT_EQ(compute_message_height(message, context, idle, 40), 4u);
}

TEST_F(HeightAggregatorTest, CollapsedToolCallShowsTitleOnly) {
  Message message(Role::Assistant);
  auto call = tool_call("t1", ToolCallStatus::Completed, "one\ntwo\nthree");
  call.collapsed = true;
  message.blocks.emplace_back(std::move(call));
  EXPECT_EQ(compute_message_height(message, context, idle, 40), 3u);
}

TEST_F(HeightAggregatorTest, InProgressToolCallCachesBodyOnly) {
  Message message(Role::Assistant);
  message.blocks.emplace_back(
      tool_call("t1", ToolCallStatus::InProgress, "line1\nline2"));
  EXPECT_EQ(compute_message_height(message, context, idle, 40), 5u);

  auto &call = std::get<ToolCallBlock>(message.blocks[0]);
  ASSERT_TRUE(call.cache.height_at(40).has_value());
  EXPECT_EQ(*call.cache.height_at(40), 2u);
  EXPECT_EQ(tool_call_height_cached(call, 40, kDefaultTerminalTailLines), 3u);
}

TEST_F(HeightAggregatorTest, TerminalOutputShowsOnlyTheTail) {
  auto call = tool_call("t1", ToolCallStatus::InProgress);
  std::string output;
  for (int i = 0; i < 20; ++i)
    output += "line " + std::to_string(i) + "\n";
  call.terminal_output = output;

  auto body = render_tool_call_body(call, 40, 5);
  ASSERT_EQ(body.size(), 6u);
  EXPECT_NE(body[0].text.find("15 earlier lines"), std::string::npos);
  EXPECT_EQ(body[1].text, "  line 15");
  EXPECT_EQ(body[5].text, "  line 19");
}

TEST_F(HeightAggregatorTest, EmptyThinkingAssistantHasFixedHeight) {
  Message message(Role::Assistant);
  SpinnerState spinner;
  spinner.is_active = true;
  spinner.is_last_message = true;
  EXPECT_EQ(compute_message_height(message, context, spinner, 40), 3u);

  std::vector<StyledLine> out;
  render_message(message, context, spinner, 40, out);
  EXPECT_EQ(out.size(), 3u);

  spinner.is_last_message = false;
  EXPECT_EQ(compute_message_height(message, context, spinner, 40), 2u);
}

TEST_F(HeightAggregatorTest, MidTurnThinkingAddsTwoRows) {
  auto message = text_message(Role::Assistant, "partial");
  auto spinner = message_spinner(SpinnerState{0, true, false, false}, 4, 5,
                                 true, message);
  EXPECT_TRUE(spinner.is_thinking_mid_turn);
  EXPECT_EQ(compute_message_height(message, context, spinner, 40), 5u);

  auto older = message_spinner(SpinnerState{0, true, false, false}, 3, 5,
                               true, message);
  EXPECT_FALSE(older.is_thinking_mid_turn);
}

TEST_F(HeightAggregatorTest, RenderedRowsMatchComputedHeight) {
  Message message(Role::Assistant);
  message.blocks.emplace_back(TextBlock("intro text that wraps around"));
  message.blocks.emplace_back(
      tool_call("t1", ToolCallStatus::InProgress, "running things"));
  auto hidden = tool_call("t2", ToolCallStatus::Completed);
  hidden.hidden = true;
  message.blocks.emplace_back(std::move(hidden));
  message.blocks.emplace_back(TextBlock("outro\n\nwith blank"));
  auto spinner = message_spinner(SpinnerState{3, true, false, false}, 0, 1,
                                 true, message);

  for (std::uint16_t width : {8, 20, 80}) {
    std::vector<StyledLine> out;
    render_message(message, context, spinner, width, out);
    EXPECT_EQ(out.size(),
              compute_message_height(message, context, spinner, width))
        << "width " << width;
  }
}

TEST_F(HeightAggregatorTest, SecondComputationHitsTheCache) {
  auto message = text_message(Role::Assistant, "cached content");
  auto first = compute_message_height(message, context, idle, 30);
  EXPECT_EQ(renderer.calls, 1);

  auto second = compute_message_height(message, context, idle, 30);
  EXPECT_EQ(first, second);
  EXPECT_EQ(renderer.calls, 1);

  std::get<TextBlock>(message.blocks[0]).append(" more");
  compute_message_height(message, context, idle, 30);
  EXPECT_EQ(renderer.calls, 2);
}

TEST_F(HeightAggregatorTest, StreamingUpdateTouchesOnlyTheNewestMessage) {
  auto messages = conversation(50);
  messages.push_back(text_message(Role::Assistant, "streaming"));

  EXPECT_EQ(update_visual_heights(messages, context, idle, false, true, 40,
                                  std::nullopt),
            51u);

  std::get<TextBlock>(messages.back().blocks[0]).append(" more text");
  int renders = renderer.calls;
  EXPECT_EQ(update_visual_heights(messages, context, idle, false, true, 40,
                                  std::nullopt),
            1u);
  EXPECT_EQ(renderer.calls, renders + 1);
}

TEST_F(HeightAggregatorTest, ScanStopsImmediatelyWhenIdle) {
  auto messages = conversation(10);
  update_visual_heights(messages, context, idle, false, false, 40,
                        std::nullopt);
  EXPECT_EQ(update_visual_heights(messages, context, idle, false, false, 40,
                                  std::nullopt),
            0u);
}

TEST_F(HeightAggregatorTest, DirtyHintReachesOlderMessages) {
  auto messages = conversation(20);
  update_visual_heights(messages, context, idle, false, true, 40,
                        std::nullopt);

  messages[7].layout.invalidate();
  EXPECT_EQ(update_visual_heights(messages, context, idle, false, true, 40, 7),
            2u);
  EXPECT_TRUE(messages[7].layout.valid_at(40));
}

TEST_F(HeightAggregatorTest, WidthChangeRecomputesEverything) {
  auto messages = conversation(12);
  update_visual_heights(messages, context, idle, false, false, 40,
                        std::nullopt);
  EXPECT_EQ(update_visual_heights(messages, context, idle, false, false, 20,
                                  std::nullopt),
            12u);
}
