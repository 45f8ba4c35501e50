#include "ag/transcript/transcript.hpp"

#include "ag/transcript/text_layout.hpp"

#include <algorithm>
#include <utility>

namespace ag::transcript {

namespace {
template <class... Ts> struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

bool finished(ToolCallStatus status) noexcept {
  return status == ToolCallStatus::Completed ||
         status == ToolCallStatus::Failed;
}
} // namespace

bool Transcript::apply_event(const TranscriptEvent &event) {
  return std::visit(
      Overloaded{
          [this](const UserMessage &e) {
            begin_turn();
            Message message(Role::User);
            message.blocks.emplace_back(TextBlock(e.text));
            push_message(std::move(message));
            // Empty reply shows the thinking indicator until content arrives.
            push_message(Message(Role::Assistant));
            return true;
          },
          [this](const ThoughtChunk &) {
            set_status(AgentStatus::Thinking);
            return true;
          },
          [this](const MessageChunk &e) {
            set_status(AgentStatus::Running);
            append_text(e.text);
            return true;
          },
          [this](const ToolCallStarted &e) {
            start_tool_call(e);
            return true;
          },
          [this](const ToolCallUpdated &e) { return update_tool_call(e); },
          [this](const TurnComplete &) {
            set_status(AgentStatus::Ready);
            end_turn();
            return true;
          },
          [this](const TurnError &e) {
            fail_turn(e.message);
            return true;
          },
      },
      event);
}

void Transcript::push_message(Message message) {
  // The previous newest message loses its spinner rows.
  if (!messages_.empty())
    mark_message_layout_dirty(messages_.size() - 1);
  messages_.push_back(std::move(message));
}

void Transcript::attach_terminal(const std::string &terminal_id,
                                 OutputHandle buffer) {
  terminals_[terminal_id] = std::move(buffer);
  for (const auto &entry : terminal_tool_calls_) {
    if (entry.terminal_id != terminal_id)
      continue;
    auto &block = messages_[entry.location.message].blocks[entry.location.block];
    if (auto *call = std::get_if<ToolCallBlock>(&block))
      call->terminal.mode = SnapshotMode::ReplaceSnapshot;
  }
}

void Transcript::detach_terminal(const std::string &terminal_id) {
  terminals_.erase(terminal_id);
  for (const auto &entry : terminal_tool_calls_) {
    if (entry.terminal_id != terminal_id)
      continue;
    auto &block = messages_[entry.location.message].blocks[entry.location.block];
    auto *call = std::get_if<ToolCallBlock>(&block);
    if (call && TerminalOutputSynchronizer::flush_utf8_carry(*call)) {
      call->mark_layout_dirty();
      mark_message_layout_dirty(entry.location.message);
    }
  }
}

void Transcript::mark_message_layout_dirty(std::size_t index) {
  if (index >= messages_.size())
    return;
  messages_[index].layout.invalidate();
  dirty_from_ = dirty_from_ ? std::min(*dirty_from_, index) : index;
}

void Transcript::invalidate_all_layouts() {
  for (auto &message : messages_) {
    for (auto &block : message.blocks) {
      std::visit([](auto &b) { b.cache.invalidate(); }, block);
    }
    message.layout.invalidate();
  }
  if (!messages_.empty())
    dirty_from_ = 0;
}

bool Transcript::update_terminal_outputs() {
  if (terminals_.empty())
    return false;

  tracked_scratch_.clear();
  for (const auto &entry : terminal_tool_calls_) {
    auto it = terminals_.find(entry.terminal_id);
    if (it == terminals_.end())
      continue;
    tracked_scratch_.push_back(TrackedTerminal{
        entry.location.message, entry.location.block, it->second});
  }

  auto changed_from = synchronizer_.sync(messages_, tracked_scratch_);
  if (!changed_from)
    return false;
  mark_message_layout_dirty(*changed_from);
  return true;
}

std::optional<std::size_t> Transcript::take_dirty_from() noexcept {
  auto result = dirty_from_;
  dirty_from_.reset();
  return result;
}

void Transcript::set_status(AgentStatus status) {
  if (status == status_)
    return;
  status_ = status;
  // Indicator rows of the newest message depend on the status.
  if (!messages_.empty())
    mark_message_layout_dirty(messages_.size() - 1);
}

ToolCallBlock *Transcript::find_tool_call(const std::string &id) {
  auto it = tool_call_index_.find(id);
  if (it == tool_call_index_.end())
    return nullptr;
  auto &block = messages_[it->second.message].blocks[it->second.block];
  return std::get_if<ToolCallBlock>(&block);
}

std::optional<ToolCallLocation>
Transcript::tool_call_location(const std::string &id) const {
  auto it = tool_call_index_.find(id);
  if (it == tool_call_index_.end())
    return std::nullopt;
  return it->second;
}

void Transcript::set_tools_collapsed(bool collapsed) {
  if (collapsed == tools_collapsed_)
    return;
  tools_collapsed_ = collapsed;
  for (const auto &[id, location] : tool_call_index_) {
    (void)id;
    auto &block = messages_[location.message].blocks[location.block];
    if (auto *call = std::get_if<ToolCallBlock>(&block)) {
      call->collapsed = collapsed;
      mark_message_layout_dirty(location.message);
    }
  }
}

void Transcript::set_welcome(std::vector<std::string> lines) {
  welcome_source_ = std::move(lines);
  welcome_cache_.invalidate();
}

const std::vector<StyledLine> &Transcript::welcome_lines(std::uint16_t width) {
  if (const auto *cached = welcome_cache_.lines_at(width))
    return *cached;
  std::vector<StyledLine> lines;
  for (const auto &source : welcome_source_) {
    for (auto &line :
         wrap_line(sanitize_for_display(source), width, kStyleWelcome))
      lines.push_back(std::move(line));
  }
  welcome_cache_.store_with_height(width, std::move(lines));
  return *welcome_cache_.lines_at(width);
}

std::size_t Transcript::welcome_height(std::uint16_t width) {
  if (auto height = welcome_cache_.height_at(width))
    return *height;
  return welcome_lines(width).size();
}

Message &Transcript::current_assistant_message() {
  if (messages_.empty() || messages_.back().role != Role::Assistant)
    push_message(Message(Role::Assistant));
  return messages_.back();
}

void Transcript::append_text(std::string_view text) {
  Message &message = current_assistant_message();
  if (!message.blocks.empty()) {
    if (auto *last = std::get_if<TextBlock>(&message.blocks.back())) {
      last->append(text);
      mark_message_layout_dirty(messages_.size() - 1);
      return;
    }
  }
  message.blocks.emplace_back(TextBlock(std::string(text)));
  mark_message_layout_dirty(messages_.size() - 1);
}

void Transcript::start_tool_call(const ToolCallStarted &event) {
  if (tool_call_index_.count(event.id) != 0) {
    ToolCallUpdated update;
    update.id = event.id;
    update.status = event.status;
    update.title = event.title;
    if (!event.content.empty())
      update.content = event.content;
    update_tool_call(update);
    return;
  }

  set_status(AgentStatus::Running);
  Message &message = current_assistant_message();
  ToolCallBlock call;
  call.id = event.id;
  call.title = event.title;
  call.kind = event.kind;
  call.status = event.status;
  call.content = event.content;
  call.terminal_id = event.terminal_id;
  call.collapsed = tools_collapsed_;
  if (event.terminal_id)
    call.terminal.mode = SnapshotMode::ReplaceSnapshot;
  message.blocks.emplace_back(std::move(call));

  ToolCallLocation location{messages_.size() - 1, message.blocks.size() - 1};
  tool_call_index_[event.id] = location;
  turn_tool_calls_.push_back(event.id);
  if (event.terminal_id)
    terminal_tool_calls_.push_back(TerminalToolCall{*event.terminal_id, location});
  mark_message_layout_dirty(location.message);
}

bool Transcript::update_tool_call(const ToolCallUpdated &event) {
  auto location = tool_call_location(event.id);
  if (!location)
    return false;
  ToolCallBlock *call = find_tool_call(event.id);
  if (!call)
    return false;

  if (event.status)
    call->status = *event.status;
  if (event.title)
    call->title = *event.title;
  if (event.content)
    call->content = *event.content;
  call->mark_layout_dirty();
  mark_message_layout_dirty(location->message);

  if (event.status && finished(*event.status) &&
      status_ == AgentStatus::Running) {
    bool all_done = std::all_of(
        turn_tool_calls_.begin(), turn_tool_calls_.end(),
        [this](const std::string &id) {
          const ToolCallBlock *other = find_tool_call(id);
          return !other || finished(other->status);
        });
    if (all_done)
      set_status(AgentStatus::Thinking);
  }
  return true;
}

void Transcript::fail_turn(const std::string &message) {
  set_status(AgentStatus::Error);
  for (const auto &[id, location] : tool_call_index_) {
    (void)id;
    auto &block = messages_[location.message].blocks[location.block];
    auto *call = std::get_if<ToolCallBlock>(&block);
    if (!call || !call->in_progress())
      continue;
    call->status = ToolCallStatus::Failed;
    call->mark_layout_dirty();
    mark_message_layout_dirty(location.message);
  }
  end_turn();

  Message notice(Role::System);
  notice.blocks.emplace_back(TextBlock("Turn failed: " + message));
  push_message(std::move(notice));
}

void Transcript::begin_turn() {
  turn_tool_calls_.clear();
  set_status(AgentStatus::Thinking);
}

void Transcript::end_turn() {
  // No more bytes follow for this turn's terminals; the next sync re-decodes
  // each whole buffer so a truncated tail shows as U+FFFD.
  for (const auto &id : turn_tool_calls_) {
    ToolCallBlock *call = find_tool_call(id);
    if (call && call->terminal_id && terminals_.count(*call->terminal_id) != 0)
      call->terminal.mode = SnapshotMode::ReplaceSnapshot;
  }
  turn_tool_calls_.clear();

  if (messages_.empty() || messages_.back().role != Role::Assistant ||
      !messages_.back().blocks.empty())
    return;
  messages_.pop_back();
  if (dirty_from_ && *dirty_from_ >= messages_.size())
    dirty_from_.reset();
  if (!messages_.empty())
    mark_message_layout_dirty(messages_.size() - 1);
}

} // namespace ag::transcript
