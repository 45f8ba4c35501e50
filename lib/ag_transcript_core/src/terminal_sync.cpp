#include "ag/transcript/terminal_sync.hpp"

#include "ag/debug_log.hpp"
#include "ag/transcript/text_layout.hpp"

#include <algorithm>

namespace ag::transcript {

bool TerminalOutputSynchronizer::apply_payload(ToolCallBlock &call,
                                               SyncPayload payload) {
  TerminalRuntimeState &state = call.terminal;
  if (auto *append = std::get_if<AppendPayload>(&payload)) {
    if (append->bytes.empty())
      return false;
    std::string delta = decode_utf8_lossy(append->bytes, state.utf8_carry);
    state.bytes_seen = append->current_len;
    state.output_len = append->current_len;
    state.mode = SnapshotMode::AppendOnly;
    if (delta.empty())
      return false;
    if (!call.terminal_output)
      call.terminal_output.emplace();
    call.terminal_output->append(delta);
    return true;
  }

  auto &replace = std::get<ReplacePayload>(payload);
  state.utf8_carry.clear();
  std::string snapshot = decode_utf8_lossy(replace.bytes);
  bool changed = !call.terminal_output || *call.terminal_output != snapshot;
  if (changed)
    call.terminal_output = std::move(snapshot);
  state.bytes_seen = replace.current_len;
  state.output_len = replace.current_len;
  state.mode = SnapshotMode::AppendOnly;
  return changed;
}

bool TerminalOutputSynchronizer::flush_utf8_carry(ToolCallBlock &call) {
  std::string &carry = call.terminal.utf8_carry;
  if (carry.empty())
    return false;
  std::string tail = decode_utf8_lossy(carry);
  carry.clear();
  if (!call.terminal_output)
    call.terminal_output.emplace();
  call.terminal_output->append(tail);
  return true;
}

std::optional<SyncPayload>
TerminalOutputSynchronizer::read_payload(const TrackedTerminal &terminal,
                                         const ToolCallBlock &call) {
  auto guard = terminal.buffer->lock();
  if (!guard) {
    ++stats_.skipped_locks;
    if (log::enabled())
      log::debug("terminal", "output buffer for " + call.id +
                                 " unavailable, skipping this frame");
    return std::nullopt;
  }

  const TerminalRuntimeState &state = call.terminal;
  const std::size_t current_len = guard->size();
  const bool force_replace = state.mode == SnapshotMode::ReplaceSnapshot;
  if (!force_replace && current_len == state.bytes_seen)
    return std::nullopt;
  if (!force_replace && current_len > state.bytes_seen)
    return AppendPayload{guard->copy(state.bytes_seen), current_len};

  ReplacePayload replace{guard->copy(), current_len};
  guard.reset();

  if (!force_replace) {
    ++stats_.shrink_fallbacks;
    if (log::enabled())
      log::debug("terminal", "output of " + call.id + " shrank from " +
                                 std::to_string(state.bytes_seen) + " to " +
                                 std::to_string(current_len) +
                                 " bytes, replacing");
  }
  return replace;
}

std::optional<std::size_t>
TerminalOutputSynchronizer::sync(std::vector<Message> &messages,
                                 std::span<const TrackedTerminal> tracked) {
  std::optional<std::size_t> dirty_from;
  for (const auto &terminal : tracked) {
    if (!terminal.buffer || terminal.message >= messages.size())
      continue;
    Message &message = messages[terminal.message];
    if (terminal.block >= message.blocks.size())
      continue;
    auto *call = std::get_if<ToolCallBlock>(&message.blocks[terminal.block]);
    if (!call)
      continue;

    auto payload = read_payload(terminal, *call);
    if (!payload)
      continue;
    if (std::holds_alternative<AppendPayload>(*payload)) {
      ++stats_.append_cycles;
      stats_.delta_bytes += std::get<AppendPayload>(*payload).bytes.size();
    } else {
      ++stats_.replace_cycles;
    }

    if (apply_payload(*call, std::move(*payload))) {
      call->mark_layout_dirty();
      message.layout.invalidate();
      dirty_from = dirty_from ? std::min(*dirty_from, terminal.message)
                              : terminal.message;
    }
  }
  return dirty_from;
}

} // namespace ag::transcript
