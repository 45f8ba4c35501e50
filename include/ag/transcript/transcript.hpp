#pragma once

#include "ag/transcript/block_cache.hpp"
#include "ag/transcript/message.hpp"
#include "ag/transcript/output_buffer.hpp"
#include "ag/transcript/prefix_sum_index.hpp"
#include "ag/transcript/scroll_controller.hpp"
#include "ag/transcript/terminal_sync.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace ag::transcript {

enum class AgentStatus { Ready, Thinking, Running, Error };

struct UserMessage {
  std::string text;
};

// Agent reasoning; switches the status to Thinking but is not displayed.
struct ThoughtChunk {
  std::string text;
};

struct MessageChunk {
  std::string text;
};

struct ToolCallStarted {
  std::string id;
  std::string title;
  std::string kind;
  ToolCallStatus status = ToolCallStatus::Pending;
  std::optional<std::string> terminal_id;
  std::string content;
};

struct ToolCallUpdated {
  std::string id;
  std::optional<ToolCallStatus> status;
  std::optional<std::string> title;
  std::optional<std::string> content;
};

struct TurnComplete {};

struct TurnError {
  std::string message;
};

using TranscriptEvent =
    std::variant<UserMessage, ThoughtChunk, MessageChunk, ToolCallStarted,
                 ToolCallUpdated, TurnComplete, TurnError>;

struct ToolCallLocation {
  std::size_t message = 0;
  std::size_t block = 0;
};

/**
 * @brief Conversation state plus every cache derived from it.
 *
 * Owns the messages, the scroll controller, the prefix index and the live
 * terminal registry. Only the newest message changes while a turn streams;
 * any edit to an older message goes through mark_message_layout_dirty().
 */
class Transcript {
public:
  Transcript() = default;

  // Returns false when the event refers to an unknown tool call.
  bool apply_event(const TranscriptEvent &event);

  void push_message(Message message);

  // Registers a live buffer for `terminal_id`. Tool calls showing that
  // terminal take a full snapshot on the next sync.
  void attach_terminal(const std::string &terminal_id, OutputHandle buffer);
  // Stops tracking the buffer. A pending incomplete UTF-8 tail is shown as
  // U+FFFD.
  void detach_terminal(const std::string &terminal_id);

  // Invalidates the layout of message `index` and records it as the
  // earliest dirty message of the frame. Out of range indices are ignored.
  void mark_message_layout_dirty(std::size_t index);

  // Drops every cached layout, e.g. after a change in tool call display.
  void invalidate_all_layouts();

  // One synchronizer pass over all tracked terminals. Returns whether any
  // displayed output changed.
  bool update_terminal_outputs();

  std::optional<std::size_t> dirty_from() const noexcept { return dirty_from_; }
  std::optional<std::size_t> take_dirty_from() noexcept;

  AgentStatus status() const noexcept { return status_; }
  void set_status(AgentStatus status);
  bool is_streaming() const noexcept {
    return status_ == AgentStatus::Thinking || status_ == AgentStatus::Running;
  }
  bool is_thinking() const noexcept { return status_ == AgentStatus::Thinking; }

  std::vector<Message> &messages() noexcept { return messages_; }
  const std::vector<Message> &messages() const noexcept { return messages_; }

  ToolCallBlock *find_tool_call(const std::string &id);
  std::optional<ToolCallLocation> tool_call_location(const std::string &id) const;
  std::size_t tool_call_count() const noexcept { return tool_call_index_.size(); }

  // New tool calls inherit this; changing it applies to every tool call.
  void set_tools_collapsed(bool collapsed);
  bool tools_collapsed() const noexcept { return tools_collapsed_; }

  void set_welcome(std::vector<std::string> lines);
  const std::vector<StyledLine> &welcome_lines(std::uint16_t width);
  std::size_t welcome_height(std::uint16_t width);

  std::size_t spinner_frame() const noexcept { return spinner_frame_; }
  void advance_spinner() noexcept { ++spinner_frame_; }

  ScrollController &scroll() noexcept { return scroll_; }
  const ScrollController &scroll() const noexcept { return scroll_; }
  PrefixSumIndex &prefix_index() noexcept { return prefix_; }
  const PrefixSumIndex &prefix_index() const noexcept { return prefix_; }

  const SyncStats &sync_stats() const noexcept { return synchronizer_.stats(); }

private:
  struct TerminalToolCall {
    std::string terminal_id;
    ToolCallLocation location;
  };

  Message &current_assistant_message();
  void append_text(std::string_view text);
  void start_tool_call(const ToolCallStarted &event);
  bool update_tool_call(const ToolCallUpdated &event);
  void fail_turn(const std::string &message);
  void begin_turn();
  // Forces a final snapshot of the turn's terminals and drops a reply that
  // never received content.
  void end_turn();

  std::vector<Message> messages_;
  AgentStatus status_ = AgentStatus::Ready;
  std::optional<std::size_t> dirty_from_;

  std::unordered_map<std::string, ToolCallLocation> tool_call_index_;
  std::vector<std::string> turn_tool_calls_;
  std::unordered_map<std::string, OutputHandle> terminals_;
  std::vector<TerminalToolCall> terminal_tool_calls_;
  std::vector<TrackedTerminal> tracked_scratch_;
  TerminalOutputSynchronizer synchronizer_;
  bool tools_collapsed_ = false;

  std::vector<std::string> welcome_source_;
  BlockCache welcome_cache_;

  std::size_t spinner_frame_ = 0;
  ScrollController scroll_;
  PrefixSumIndex prefix_;
};

} // namespace ag::transcript
