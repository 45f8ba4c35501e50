#include "ag/transcript/text_renderer.hpp"

#include "ag/transcript/message.hpp"
#include "ag/transcript/text_layout.hpp"

#include <utility>

namespace ag::transcript {

namespace {
void append_wrapped(std::vector<StyledLine> &out, std::string_view raw,
                    int width, StyleMask style) {
  std::string clean = sanitize_for_display(raw);
  auto wrapped = wrap_line(clean, width, style);
  for (auto &line : wrapped)
    out.push_back(std::move(line));
}
} // namespace

std::vector<StyledLine> PlainTextRenderer::render(std::string_view content,
                                                  TextRenderState &state,
                                                  std::uint16_t width,
                                                  StyleMask background) {
  if (state.width != width || state.style != background ||
      content.size() < state.consumed)
    state.reset(width, background);

  std::size_t last_newline = content.rfind('\n');
  std::size_t complete_end =
      last_newline == std::string_view::npos ? 0 : last_newline + 1;

  std::size_t pos = state.consumed;
  while (pos < complete_end) {
    std::size_t newline = content.find('\n', pos);
    append_wrapped(state.completed, content.substr(pos, newline - pos), width,
                   background);
    pos = newline + 1;
  }
  if (complete_end > state.consumed)
    state.consumed = complete_end;

  std::vector<StyledLine> lines = state.completed;
  std::string_view tail = content.substr(state.consumed);
  if (!tail.empty())
    append_wrapped(lines, tail, width, background);
  return lines;
}

const std::vector<StyledLine> &render_text_cached(TextRenderer &renderer,
                                                  TextBlock &block,
                                                  std::uint16_t width,
                                                  StyleMask background) {
  if (const auto *cached = block.cache.lines_at(width))
    return *cached;
  block.cache.store_with_height(
      width, renderer.render(block.content, block.parse, width, background));
  return *block.cache.lines_at(width);
}

} // namespace ag::transcript
