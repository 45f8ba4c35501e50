#include "ag/transcript/height_aggregator.hpp"

#include "ag/transcript/tool_call_view.hpp"

#include <string>

namespace ag::transcript {

namespace {
StyleMask text_style(Role role) noexcept {
  switch (role) {
  case Role::User:
    return kStyleUserBackground;
  case Role::System:
    return kStyleDim;
  case Role::Assistant:
    break;
  }
  return kStyleNone;
}

StyledLine thinking_line(std::size_t frame) {
  StyledLine line(spinner_glyph(frame), kStyleSpinner);
  line.append(" Thinking...", kStyleDim);
  return line;
}

bool empty_thinking(const Message &message, const SpinnerState &spinner) {
  return message.role == Role::Assistant && message.blocks.empty() &&
         spinner.is_active && spinner.is_last_message;
}
} // namespace

const char *role_label(Role role) noexcept {
  switch (role) {
  case Role::User:
    return "User";
  case Role::Assistant:
    return "Assistant";
  case Role::System:
    return "System";
  }
  return "";
}

SpinnerState message_spinner(SpinnerState base, std::size_t index,
                             std::size_t message_count, bool is_thinking,
                             const Message &message) noexcept {
  bool is_last = index + 1 == message_count;
  base.is_last_message = is_last;
  base.is_thinking_mid_turn = is_last && is_thinking &&
                              message.role == Role::Assistant &&
                              !message.blocks.empty();
  return base;
}

std::size_t spacing_before(std::optional<BlockKind> previous,
                           BlockKind current) noexcept {
  return previous && *previous != current ? 1 : 0;
}

std::size_t block_spacing(std::span<const BlockKind> kinds) noexcept {
  std::size_t total = 0;
  std::optional<BlockKind> previous;
  for (BlockKind kind : kinds) {
    total += spacing_before(previous, kind);
    previous = kind;
  }
  return total;
}

std::size_t compute_message_height(Message &message, LayoutContext &context,
                                   const SpinnerState &spinner,
                                   std::uint16_t width) {
  std::size_t total = 1;
  if (empty_thinking(message, spinner))
    return total + 2;

  StyleMask style = text_style(message.role);
  std::optional<BlockKind> previous;
  for (auto &block : message.blocks) {
    if (auto *text = std::get_if<TextBlock>(&block)) {
      total += spacing_before(previous, BlockKind::Text);
      if (auto height = text->cache.height_at(width))
        total += *height;
      else
        total += render_text_cached(context.renderer, *text, width, style).size();
      previous = BlockKind::Text;
      continue;
    }
    auto &call = std::get<ToolCallBlock>(block);
    // User turns carry text only.
    if (call.hidden || message.role == Role::User)
      continue;
    total += spacing_before(previous, BlockKind::ToolCall);
    total += tool_call_height_cached(call, width, context.terminal_tail_lines);
    previous = BlockKind::ToolCall;
  }

  if (spinner.is_thinking_mid_turn)
    total += 2;
  return total + 1;
}

void render_message(Message &message, LayoutContext &context,
                    const SpinnerState &spinner, std::uint16_t width,
                    std::vector<StyledLine> &out) {
  out.emplace_back(role_label(message.role), kStyleRoleLabel | kStyleBold);
  if (empty_thinking(message, spinner)) {
    out.push_back(thinking_line(spinner.frame));
    out.emplace_back();
    return;
  }

  StyleMask style = text_style(message.role);
  std::optional<BlockKind> previous;
  for (auto &block : message.blocks) {
    if (auto *text = std::get_if<TextBlock>(&block)) {
      if (spacing_before(previous, BlockKind::Text))
        out.emplace_back();
      const auto &lines =
          render_text_cached(context.renderer, *text, width, style);
      out.insert(out.end(), lines.begin(), lines.end());
      previous = BlockKind::Text;
      continue;
    }
    auto &call = std::get<ToolCallBlock>(block);
    if (call.hidden || message.role == Role::User)
      continue;
    if (spacing_before(previous, BlockKind::ToolCall))
      out.emplace_back();
    render_tool_call_cached(call, width, spinner.frame,
                            context.terminal_tail_lines, out);
    previous = BlockKind::ToolCall;
  }

  if (spinner.is_thinking_mid_turn) {
    out.emplace_back();
    out.push_back(thinking_line(spinner.frame));
  }
  out.emplace_back();
}

std::size_t update_visual_heights(std::vector<Message> &messages,
                                  LayoutContext &context, SpinnerState base,
                                  bool is_thinking, bool is_streaming,
                                  std::uint16_t width,
                                  std::optional<std::size_t> dirty_from) {
  std::size_t recomputed = 0;
  const std::size_t count = messages.size();
  for (std::size_t i = count; i-- > 0;) {
    Message &message = messages[i];
    bool is_last = i + 1 == count;
    if (message.layout.valid_at(width) && !(is_last && is_streaming)) {
      if (!dirty_from || i < *dirty_from)
        break;
      continue;
    }
    SpinnerState spinner =
        message_spinner(base, i, count, is_thinking, message);
    message.layout.store(
        width, compute_message_height(message, context, spinner, width));
    ++recomputed;
  }
  return recomputed;
}

} // namespace ag::transcript
