#include "ag/transcript/chat_renderer.hpp"
#include "ag/transcript/transcript.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace ag::transcript;

namespace {
ToolCallStarted started(std::string id,
                        ToolCallStatus status = ToolCallStatus::InProgress) {
  ToolCallStarted event;
  event.id = std::move(id);
  event.title = "Read file";
  event.kind = "read";
  event.status = status;
  return event;
}

ToolCallUpdated status_update(std::string id, ToolCallStatus status) {
  ToolCallUpdated event;
  event.id = std::move(id);
  event.status = status;
  return event;
}

const std::string &text_of(const Block &block) {
  return std::get<TextBlock>(block).content;
}
} // namespace

TEST(TranscriptEventTests, FullTurnLifecycleTextOnly) {
  Transcript transcript;
  transcript.apply_event(UserMessage{"hi"});
  EXPECT_EQ(transcript.status(), AgentStatus::Thinking);

  transcript.apply_event(MessageChunk{"Hello"});
  transcript.apply_event(MessageChunk{", world"});
  EXPECT_EQ(transcript.status(), AgentStatus::Running);

  transcript.apply_event(TurnComplete{});
  EXPECT_EQ(transcript.status(), AgentStatus::Ready);

  const auto &messages = transcript.messages();
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[0].role, Role::User);
  EXPECT_EQ(messages[1].role, Role::Assistant);
  ASSERT_EQ(messages[1].blocks.size(), 1u);
  EXPECT_EQ(text_of(messages[1].blocks[0]), "Hello, world");
}

TEST(TranscriptEventTests, UserMessageOpensAReplyShowingThinking) {
  Transcript transcript;
  transcript.apply_event(UserMessage{"hi"});
  transcript.apply_event(ThoughtChunk{"pondering"});

  ASSERT_EQ(transcript.messages().size(), 2u);
  EXPECT_EQ(transcript.messages()[1].role, Role::Assistant);
  EXPECT_TRUE(transcript.messages()[1].blocks.empty());

  EngineSettings settings;
  settings.show_welcome = false;
  ChatRenderer renderer(settings);
  auto rows = visible_window(renderer.render(transcript, 40, 20), 20);
  ASSERT_EQ(rows.size(), 20u);
  EXPECT_EQ(rows[14], "User");
  EXPECT_EQ(rows[15], "hi");
  EXPECT_EQ(rows[17], "Assistant");
  EXPECT_NE(rows[18].find("Thinking..."), std::string::npos);

  transcript.apply_event(MessageChunk{"Hello"});
  ASSERT_EQ(transcript.messages().size(), 2u);
  ASSERT_EQ(transcript.messages()[1].blocks.size(), 1u);
  EXPECT_EQ(text_of(transcript.messages()[1].blocks[0]), "Hello");
}

TEST(TranscriptEventTests, ReplyWithoutContentIsDroppedWhenTheTurnEnds) {
  Transcript transcript;
  transcript.apply_event(UserMessage{"first"});
  transcript.apply_event(TurnComplete{});
  ASSERT_EQ(transcript.messages().size(), 1u);
  EXPECT_EQ(transcript.messages()[0].role, Role::User);

  transcript.apply_event(UserMessage{"second"});
  transcript.apply_event(TurnError{"cancelled"});
  const auto &messages = transcript.messages();
  ASSERT_EQ(messages.size(), 3u);
  EXPECT_EQ(messages[1].role, Role::User);
  EXPECT_EQ(messages[2].role, Role::System);
  EXPECT_EQ(transcript.dirty_from(), 0u);
}

TEST(TranscriptEventTests, ThoughtChunkOnlyChangesStatus) {
  Transcript transcript;
  transcript.apply_event(ThoughtChunk{"pondering"});
  EXPECT_EQ(transcript.status(), AgentStatus::Thinking);
  EXPECT_TRUE(transcript.messages().empty());
}

TEST(TranscriptEventTests, TextBetweenToolCallsCreatesSeparateBlocks) {
  Transcript transcript;
  transcript.apply_event(MessageChunk{"before"});
  transcript.apply_event(started("tc-1"));
  transcript.apply_event(MessageChunk{"between"});
  transcript.apply_event(started("tc-2"));
  transcript.apply_event(MessageChunk{"after"});

  ASSERT_EQ(transcript.messages().size(), 1u);
  const auto &blocks = transcript.messages()[0].blocks;
  ASSERT_EQ(blocks.size(), 5u);
  EXPECT_EQ(text_of(blocks[0]), "before");
  EXPECT_EQ(kind_of(blocks[1]), BlockKind::ToolCall);
  EXPECT_EQ(text_of(blocks[2]), "between");
  EXPECT_EQ(kind_of(blocks[3]), BlockKind::ToolCall);
  EXPECT_EQ(text_of(blocks[4]), "after");

  auto location = transcript.tool_call_location("tc-2");
  ASSERT_TRUE(location.has_value());
  EXPECT_EQ(location->message, 0u);
  EXPECT_EQ(location->block, 3u);
}

TEST(TranscriptEventTests, AllToolsFinishedReturnsToThinking) {
  Transcript transcript;
  transcript.apply_event(started("tc-a"));
  transcript.apply_event(started("tc-b"));
  EXPECT_EQ(transcript.status(), AgentStatus::Running);

  transcript.apply_event(status_update("tc-a", ToolCallStatus::Completed));
  EXPECT_EQ(transcript.status(), AgentStatus::Running);

  transcript.apply_event(status_update("tc-b", ToolCallStatus::Failed));
  EXPECT_EQ(transcript.status(), AgentStatus::Thinking);
}

TEST(TranscriptEventTests, ToolCallUpdateEditsFieldsInPlace) {
  Transcript transcript;
  transcript.apply_event(started("tc-1"));

  ToolCallUpdated update;
  update.id = "tc-1";
  update.title = "Read src/lib.rs";
  update.content = "fn main() {}";
  EXPECT_TRUE(transcript.apply_event(update));

  const ToolCallBlock *call = transcript.find_tool_call("tc-1");
  ASSERT_NE(call, nullptr);
  EXPECT_EQ(call->title, "Read src/lib.rs");
  EXPECT_EQ(call->content, "fn main() {}");
  EXPECT_EQ(call->status, ToolCallStatus::InProgress);
}

TEST(TranscriptEventTests, UnknownToolCallUpdateIsRejected) {
  Transcript transcript;
  EXPECT_FALSE(
      transcript.apply_event(status_update("nope", ToolCallStatus::Completed)));
}

TEST(TranscriptEventTests, TurnErrorFailsRunningToolsAndAddsNotice) {
  Transcript transcript;
  transcript.apply_event(MessageChunk{"working"});
  transcript.apply_event(started("tc-err"));
  transcript.apply_event(started("tc-done"));
  transcript.apply_event(status_update("tc-done", ToolCallStatus::Completed));
  transcript.take_dirty_from();

  transcript.apply_event(TurnError{"crashed"});
  EXPECT_EQ(transcript.status(), AgentStatus::Error);
  EXPECT_EQ(transcript.tool_call_count(), 2u);

  const auto &messages = transcript.messages();
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[0].blocks.size(), 3u);
  EXPECT_EQ(transcript.find_tool_call("tc-err")->status, ToolCallStatus::Failed);
  EXPECT_EQ(transcript.find_tool_call("tc-done")->status,
            ToolCallStatus::Completed);

  EXPECT_EQ(messages[1].role, Role::System);
  EXPECT_EQ(text_of(messages[1].blocks[0]), "Turn failed: crashed");
  EXPECT_EQ(transcript.dirty_from(), 0u);
}

TEST(TranscriptEventTests, ErrorThenNewChunkRecovers) {
  Transcript transcript;
  transcript.apply_event(TurnError{"timeout"});
  EXPECT_EQ(transcript.status(), AgentStatus::Error);

  transcript.apply_event(MessageChunk{"Retry answer"});
  EXPECT_EQ(transcript.status(), AgentStatus::Running);
  EXPECT_EQ(transcript.messages().back().role, Role::Assistant);
}

TEST(TranscriptEventTests, ChunksAcrossTurnsMergeIntoLastAssistantMessage) {
  Transcript transcript;
  transcript.apply_event(MessageChunk{"Turn 1"});
  transcript.apply_event(TurnComplete{});
  transcript.apply_event(MessageChunk{" Turn 2"});

  ASSERT_EQ(transcript.messages().size(), 1u);
  EXPECT_EQ(text_of(transcript.messages()[0].blocks.back()), "Turn 1 Turn 2");
}

TEST(TranscriptEventTests, NewToolCallsInheritCollapsedState) {
  Transcript transcript;
  transcript.set_tools_collapsed(true);
  transcript.apply_event(started("tc-col"));
  EXPECT_TRUE(transcript.find_tool_call("tc-col")->collapsed);

  transcript.set_tools_collapsed(false);
  EXPECT_FALSE(transcript.find_tool_call("tc-col")->collapsed);
}

TEST(TranscriptEventTests, MarkDirtyTracksEarliestIndex) {
  Transcript transcript;
  for (int i = 0; i < 5; ++i)
    transcript.push_message(Message(Role::User));
  transcript.take_dirty_from();

  transcript.mark_message_layout_dirty(3);
  transcript.mark_message_layout_dirty(1);
  transcript.mark_message_layout_dirty(4);
  transcript.mark_message_layout_dirty(99);
  EXPECT_EQ(transcript.dirty_from(), 1u);
  EXPECT_EQ(transcript.take_dirty_from(), 1u);
  EXPECT_FALSE(transcript.dirty_from().has_value());
}

TEST(TranscriptEventTests, TerminalOutputFlowsIntoToolCall) {
  Transcript transcript;
  EXPECT_FALSE(transcript.update_terminal_outputs());

  transcript.apply_event(UserMessage{"!ls"});
  auto event = started("tc-term");
  event.terminal_id = "term-1";
  transcript.apply_event(event);

  auto buffer = OutputBuffer::create();
  buffer->append("file.txt\n");
  transcript.attach_terminal("term-1", buffer);
  transcript.take_dirty_from();

  EXPECT_TRUE(transcript.update_terminal_outputs());
  EXPECT_EQ(transcript.find_tool_call("tc-term")->terminal_output, "file.txt\n");
  EXPECT_EQ(transcript.dirty_from(), 1u);
  EXPECT_EQ(transcript.sync_stats().replace_cycles, 1u);

  EXPECT_FALSE(transcript.update_terminal_outputs());

  buffer->append("other.txt\n");
  EXPECT_TRUE(transcript.update_terminal_outputs());
  EXPECT_EQ(transcript.find_tool_call("tc-term")->terminal_output,
            "file.txt\nother.txt\n");
  EXPECT_EQ(transcript.sync_stats().append_cycles, 1u);

  transcript.detach_terminal("term-1");
  buffer->append("ignored");
  EXPECT_FALSE(transcript.update_terminal_outputs());
}

TEST(TranscriptEventTests, WelcomeLinesAreWrappedPerWidth) {
  Transcript transcript;
  transcript.set_welcome({"Welcome to the agent chat", "", "Tips here"});
  EXPECT_EQ(transcript.welcome_height(80), 3u);
  EXPECT_EQ(transcript.welcome_height(10), 5u);
  EXPECT_EQ(transcript.welcome_lines(10).front().text, "Welcome to");
}

TEST(TranscriptEventTests, TurnEndShowsTruncatedTerminalTail) {
  Transcript transcript;
  transcript.apply_event(UserMessage{"!printf"});
  auto event = started("tc-utf");
  event.terminal_id = "term-utf";
  transcript.apply_event(event);
  auto buffer = OutputBuffer::create();
  buffer->append("abc");
  transcript.attach_terminal("term-utf", buffer);
  ASSERT_TRUE(transcript.update_terminal_outputs());

  buffer->append("\xE2");
  EXPECT_FALSE(transcript.update_terminal_outputs());
  EXPECT_EQ(transcript.find_tool_call("tc-utf")->terminal_output, "abc");

  transcript.apply_event(status_update("tc-utf", ToolCallStatus::Completed));
  transcript.apply_event(TurnComplete{});
  transcript.take_dirty_from();
  EXPECT_TRUE(transcript.update_terminal_outputs());
  EXPECT_EQ(transcript.find_tool_call("tc-utf")->terminal_output,
            "abc\xEF\xBF\xBD");
  EXPECT_EQ(transcript.dirty_from(), 1u);
}

TEST(TranscriptEventTests, DetachFlushesPendingUtf8Carry) {
  Transcript transcript;
  auto event = started("tc-cut");
  event.terminal_id = "term-cut";
  transcript.apply_event(event);
  auto buffer = OutputBuffer::create();
  transcript.attach_terminal("term-cut", buffer);
  transcript.update_terminal_outputs();
  buffer->append("ok\xF0\x9F\x98");
  transcript.update_terminal_outputs();
  EXPECT_EQ(transcript.find_tool_call("tc-cut")->terminal_output, "ok");
  transcript.take_dirty_from();

  transcript.detach_terminal("term-cut");
  EXPECT_EQ(transcript.find_tool_call("tc-cut")->terminal_output,
            "ok\xEF\xBF\xBD");
  EXPECT_EQ(transcript.dirty_from(), 0u);
}
