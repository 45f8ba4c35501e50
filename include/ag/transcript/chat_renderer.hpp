#pragma once

#include "ag/transcript/engine_settings.hpp"
#include "ag/transcript/height_aggregator.hpp"
#include "ag/transcript/text_renderer.hpp"
#include "ag/transcript/transcript.hpp"
#include "ag/transcript/viewport_culler.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace ag::transcript {

struct ScrollInput {
  long delta = 0;
  bool jump_to_top = false;
  bool jump_to_bottom = false;
};

struct RenderOutput {
  std::vector<StyledLine> lines;
  // Rows of `lines` above the viewport.
  std::size_t local_scroll = 0;
  // Blank rows above `lines` when the content is shorter than the viewport.
  std::size_t top_padding = 0;
  ScrollRegime regime = ScrollRegime::Fit;
};

struct FrameStats {
  std::size_t recomputed_messages = 0;
  std::optional<std::size_t> prefix_rebuild_start;
  std::size_t rendered_messages = 0;
};

/**
 * @brief Per-frame composition of the layout engine.
 *
 * Applies scroll input, refreshes message heights, updates the prefix index,
 * advances the scroll controller and lays out only the culled message range.
 */
class ChatRenderer {
public:
  explicit ChatRenderer(EngineSettings settings = {},
                        std::unique_ptr<TextRenderer> renderer = nullptr);

  // Tool call tail length feeds cached bodies, so a change drops the
  // transcript's layouts.
  void apply_settings(const EngineSettings &settings, Transcript &transcript);
  const EngineSettings &settings() const noexcept { return settings_; }

  RenderOutput render(Transcript &transcript, std::uint16_t width,
                      std::size_t height, const ScrollInput &input = {});

  const FrameStats &last_frame() const noexcept { return last_frame_; }
  TextRenderer &text_renderer() noexcept { return *renderer_; }

private:
  EngineSettings settings_;
  std::unique_ptr<TextRenderer> renderer_;
  ViewportCuller culler_;
  FrameStats last_frame_;
};

// Last frame of a view. Repaints reuse it; only invalidate() or a new size
// renders again, so scroll smoothing advances once per requested frame.
class FrameCache {
public:
  void invalidate() noexcept { stale_ = true; }
  bool stale() const noexcept { return stale_; }

  // Renders when stale or resized, consuming `input`; otherwise returns the
  // cached frame and leaves `input` queued.
  const RenderOutput &frame(ChatRenderer &renderer, Transcript &transcript,
                            std::uint16_t width, std::size_t height,
                            ScrollInput &input);

  const RenderOutput &output() const noexcept { return output_; }
  const std::vector<std::string> &rows() const noexcept { return rows_; }

private:
  RenderOutput output_;
  std::vector<std::string> rows_;
  std::uint16_t width_ = 0;
  std::size_t height_ = 0;
  bool stale_ = true;
};

struct CellPosition {
  std::size_t row = 0;
  std::size_t col = 0;

  bool operator==(const CellPosition &other) const = default;
};

// Selection in viewport cells. `end` is exclusive on its row.
struct SelectionState {
  CellPosition start;
  CellPosition end;
  bool dragging = false;

  std::pair<CellPosition, CellPosition> normalized() const noexcept;
  bool contains(std::size_t row, std::size_t col) const noexcept;
};

// Exactly the `height` rows drawn for `output`, trailing spaces trimmed.
std::vector<std::string> visible_window(const RenderOutput &output,
                                        std::size_t height);

// Text under `selection`, rows joined with '\n'.
std::string selected_text(std::span<const std::string> rows,
                          const SelectionState &selection);

} // namespace ag::transcript
