#pragma once

#include "ag/transcript/styled_line.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace ag::transcript {

// Incremental wrap state for one text block. Lines up to the last newline
// seen are kept wrapped so a streaming append only re-wraps the open tail.
struct TextRenderState {
  std::size_t consumed = 0;
  std::uint16_t width = 0;
  StyleMask style = kStyleNone;
  std::vector<StyledLine> completed;

  void reset(std::uint16_t new_width, StyleMask new_style) {
    consumed = 0;
    width = new_width;
    style = new_style;
    completed.clear();
  }
};

/**
 * @brief Turns raw block content into pre-wrapped rows.
 *
 * Implementations must be pure with respect to (content, width, style): the
 * same inputs always yield the same lines. The block caches rely on it.
 */
class TextRenderer {
public:
  virtual ~TextRenderer() = default;

  virtual std::vector<StyledLine> render(std::string_view content,
                                         TextRenderState &state,
                                         std::uint16_t width,
                                         StyleMask background) = 0;
};

// Word-wrapping renderer for plain UTF-8 text. Blank lines are kept, a
// trailing newline does not produce an extra row, empty content yields none.
class PlainTextRenderer : public TextRenderer {
public:
  std::vector<StyledLine> render(std::string_view content,
                                 TextRenderState &state, std::uint16_t width,
                                 StyleMask background) override;
};

struct TextBlock;

// Returns the block's rows at `width`, rendering through `renderer` only on a
// cache miss.
const std::vector<StyledLine> &render_text_cached(TextRenderer &renderer,
                                                  TextBlock &block,
                                                  std::uint16_t width,
                                                  StyleMask background);

} // namespace ag::transcript
