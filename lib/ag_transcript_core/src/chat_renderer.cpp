#include "ag/transcript/chat_renderer.hpp"

#include "ag/transcript/text_layout.hpp"

#include <algorithm>

namespace ag::transcript {

namespace {
void apply_scroll_input(ScrollController &scroll, const ScrollInput &input) {
  if (input.jump_to_top)
    scroll.jump_to_top();
  if (input.delta != 0)
    scroll.scroll_by(input.delta);
  if (input.jump_to_bottom)
    scroll.jump_to_bottom();
}

std::string trim_right(std::string text) {
  while (!text.empty() && text.back() == ' ')
    text.pop_back();
  return text;
}

// Byte range of display columns [from, to) in `text`.
std::string slice_columns(const std::string &text, std::size_t from,
                          std::size_t to) {
  std::string result;
  std::size_t column = 0;
  std::size_t index = 0;
  while (index < text.size() && column < to) {
    std::size_t start = index;
    int width = codepoint_width(next_codepoint(text, index));
    if (column >= from)
      result.append(text, start, index - start);
    column += static_cast<std::size_t>(width);
  }
  return result;
}
} // namespace

ChatRenderer::ChatRenderer(EngineSettings settings,
                           std::unique_ptr<TextRenderer> renderer)
    : settings_(std::move(settings)), renderer_(std::move(renderer)),
      culler_(settings_.culling_margin, settings_.culling_slack_lines) {
  if (!renderer_)
    renderer_ = std::make_unique<PlainTextRenderer>();
}

void ChatRenderer::apply_settings(const EngineSettings &settings,
                                  Transcript &transcript) {
  bool tail_changed =
      settings.terminal_tail_lines != settings_.terminal_tail_lines;
  settings_ = settings;
  culler_.configure(settings_.culling_margin, settings_.culling_slack_lines);
  if (tail_changed)
    transcript.invalidate_all_layouts();
}

RenderOutput ChatRenderer::render(Transcript &transcript, std::uint16_t width,
                                  std::size_t height, const ScrollInput &input) {
  RenderOutput output;
  last_frame_ = FrameStats{};
  width = std::max<std::uint16_t>(width, 1);

  ScrollController &scroll = transcript.scroll();
  scroll.set_smoothing(settings_.scroll_smoothing);
  apply_scroll_input(scroll, input);

  std::vector<Message> &messages = transcript.messages();
  LayoutContext context{*renderer_, settings_.terminal_tail_lines};
  SpinnerState base;
  base.frame = transcript.spinner_frame();
  base.is_active = transcript.is_streaming();
  const bool is_thinking = transcript.is_thinking();

  auto dirty_from = transcript.take_dirty_from();
  last_frame_.recomputed_messages =
      update_visual_heights(messages, context, base, is_thinking,
                            transcript.is_streaming(), width, dirty_from);
  PrefixSumIndex &index = transcript.prefix_index();
  last_frame_.prefix_rebuild_start = index.rebuild(messages, width, dirty_from);

  static const std::vector<StyledLine> kNoWelcome;
  const std::vector<StyledLine> &welcome =
      settings_.show_welcome ? transcript.welcome_lines(width) : kNoWelcome;
  const std::size_t welcome_height = welcome.size();
  const std::size_t content_height = welcome_height + index.total_height();

  auto render_one = [&](std::size_t i, std::vector<StyledLine> &out) {
    SpinnerState spinner =
        message_spinner(base, i, messages.size(), is_thinking, messages[i]);
    render_message(messages[i], context, spinner, width, out);
  };

  output.regime = scroll.update(content_height, height);
  if (output.regime == ScrollRegime::Fit) {
    output.lines.reserve(content_height);
    output.lines.insert(output.lines.end(), welcome.begin(), welcome.end());
    for (std::size_t i = 0; i < messages.size(); ++i)
      render_one(i, output.lines);
    output.top_padding =
        height > output.lines.size() ? height - output.lines.size() : 0;
    last_frame_.rendered_messages = messages.size();
    return output;
  }

  CullPlan plan =
      culler_.plan(index, welcome_height, scroll.state().offset, height);
  CullResult culled = culler_.render(plan, scroll.state().offset,
                                     messages.size(), welcome, render_one,
                                     output.lines);
  output.local_scroll = culled.local_scroll;
  last_frame_.rendered_messages = culled.render_end - culled.render_start;
  return output;
}

const RenderOutput &FrameCache::frame(ChatRenderer &renderer,
                                      Transcript &transcript,
                                      std::uint16_t width, std::size_t height,
                                      ScrollInput &input) {
  if (!stale_ && width == width_ && height == height_)
    return output_;
  output_ = renderer.render(transcript, width, height, input);
  input = {};
  rows_ = visible_window(output_, height);
  width_ = width;
  height_ = height;
  stale_ = false;
  return output_;
}

std::pair<CellPosition, CellPosition>
SelectionState::normalized() const noexcept {
  bool ordered = start.row < end.row ||
                 (start.row == end.row && start.col <= end.col);
  return ordered ? std::make_pair(start, end) : std::make_pair(end, start);
}

bool SelectionState::contains(std::size_t row, std::size_t col) const noexcept {
  auto [from, to] = normalized();
  if (row < from.row || row > to.row)
    return false;
  if (row == from.row && col < from.col)
    return false;
  if (row == to.row && col >= to.col)
    return false;
  return true;
}

std::vector<std::string> visible_window(const RenderOutput &output,
                                        std::size_t height) {
  std::vector<std::string> rows;
  rows.reserve(height);
  if (output.regime == ScrollRegime::Fit) {
    for (std::size_t i = 0; i < output.top_padding && rows.size() < height; ++i)
      rows.emplace_back();
    for (const auto &line : output.lines) {
      if (rows.size() >= height)
        break;
      rows.push_back(trim_right(line.text));
    }
  } else {
    for (std::size_t i = output.local_scroll;
         i < output.lines.size() && rows.size() < height; ++i)
      rows.push_back(trim_right(output.lines[i].text));
  }
  rows.resize(height);
  return rows;
}

std::string selected_text(std::span<const std::string> rows,
                          const SelectionState &selection) {
  auto [from, to] = selection.normalized();
  if (from == to)
    return {};

  std::string text;
  for (std::size_t row = from.row; row <= to.row && row < rows.size(); ++row) {
    std::size_t first = row == from.row ? from.col : 0;
    std::size_t last = row == to.row ? to.col : rows[row].size() * 2 + 1;
    if (row != from.row)
      text.push_back('\n');
    text.append(trim_right(slice_columns(rows[row], first, last)));
  }
  return text;
}

} // namespace ag::transcript
