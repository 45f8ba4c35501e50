#include "ag/transcript/tool_call_view.hpp"

#include "ag/transcript/text_layout.hpp"

#include <algorithm>
#include <array>
#include <string>

namespace ag::transcript {

namespace {
constexpr std::array<std::string_view, 10> kSpinnerFrames = {
    "⠋", "⠙", "⠹", "⠸", "⠼",
    "⠴", "⠦", "⠧", "⠇", "⠏"};

constexpr std::string_view kIndent = "  ";

std::vector<std::string_view> split_lines(std::string_view text) {
  std::vector<std::string_view> lines;
  if (!text.empty() && text.back() == '\n')
    text.remove_suffix(1);
  if (text.empty())
    return lines;
  std::size_t pos = 0;
  while (true) {
    std::size_t newline = text.find('\n', pos);
    if (newline == std::string_view::npos) {
      lines.push_back(text.substr(pos));
      break;
    }
    lines.push_back(text.substr(pos, newline - pos));
    pos = newline + 1;
  }
  return lines;
}

void append_indented(std::vector<StyledLine> &out, std::string_view raw,
                     int width, StyleMask style) {
  std::string clean = sanitize_for_display(raw);
  int inner = std::max(1, width - static_cast<int>(kIndent.size()));
  for (auto &row : wrap_line(clean, inner, style)) {
    StyledLine line(kIndent, kStyleNone);
    line.append(row.text, style);
    out.push_back(std::move(line));
  }
}
} // namespace

std::string_view spinner_glyph(std::size_t frame) noexcept {
  return kSpinnerFrames[frame % kSpinnerFrames.size()];
}

StyledLine tool_call_title(const ToolCallBlock &call,
                           std::size_t spinner_frame) {
  StyledLine line;
  switch (call.status) {
  case ToolCallStatus::Pending:
  case ToolCallStatus::InProgress:
    line.append(spinner_glyph(spinner_frame), kStyleSpinner);
    break;
  case ToolCallStatus::Completed:
    line.append("✓", kStyleSuccess);
    break;
  case ToolCallStatus::Failed:
    line.append("✗", kStyleError);
    break;
  }
  line.append(" ", kStyleNone);
  line.append(sanitize_for_display(call.title), kStyleToolTitle | kStyleBold);
  return line;
}

std::vector<StyledLine> render_tool_call_body(const ToolCallBlock &call,
                                              std::uint16_t width,
                                              std::size_t tail_lines) {
  std::vector<StyledLine> body;
  for (std::string_view line : split_lines(call.content))
    append_indented(body, line, width, kStyleNone);

  if (call.terminal_output) {
    auto lines = split_lines(*call.terminal_output);
    std::size_t skip = lines.size() > tail_lines ? lines.size() - tail_lines : 0;
    if (skip > 0)
      append_indented(body, "... " + std::to_string(skip) + " earlier lines",
                      width, kStyleDim);
    for (std::size_t i = skip; i < lines.size(); ++i)
      append_indented(body, lines[i], width, kStyleToolOutput);
  }
  return body;
}

std::size_t tool_call_height_cached(ToolCallBlock &call, std::uint16_t width,
                                    std::size_t tail_lines) {
  if (call.hidden)
    return 0;
  if (call.collapsed)
    return 1;
  if (auto height = call.cache.height_at(width))
    return *height + 1;
  call.cache.store_with_height(width,
                               render_tool_call_body(call, width, tail_lines));
  return call.cache.height_at(width).value_or(0) + 1;
}

void render_tool_call_cached(ToolCallBlock &call, std::uint16_t width,
                             std::size_t spinner_frame, std::size_t tail_lines,
                             std::vector<StyledLine> &out) {
  if (call.hidden)
    return;
  out.push_back(tool_call_title(call, spinner_frame));
  if (call.collapsed)
    return;
  const auto *body = call.cache.lines_at(width);
  if (!body) {
    call.cache.store_with_height(
        width, render_tool_call_body(call, width, tail_lines));
    body = call.cache.lines_at(width);
  }
  out.insert(out.end(), body->begin(), body->end());
}

} // namespace ag::transcript
