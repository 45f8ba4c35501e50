#pragma once

#include "ag/transcript/prefix_sum_index.hpp"
#include "ag/transcript/styled_line.hpp"

#include <cstddef>
#include <functional>
#include <span>
#include <vector>

namespace ag::transcript {

constexpr std::size_t kDefaultCullingMargin = 2;
constexpr std::size_t kDefaultCullingSlackLines = 100;

struct CullPlan {
  std::size_t first_visible = 0;
  std::size_t render_start = 0;
  // Absolute row of the first emitted line; 0 when the welcome is included.
  std::size_t height_before_start = 0;
  bool include_welcome = false;
  std::size_t lines_needed = 0;
};

struct CullResult {
  std::size_t local_scroll = 0;
  std::size_t render_start = 0;
  std::size_t render_end = 0;
};

/**
 * @brief Picks the message range to lay out for a scroll offset.
 *
 * Rendering starts `margin` messages before the first visible one and stops
 * once `scroll - height_before_start + viewport + slack` rows are produced.
 */
class ViewportCuller {
public:
  using RenderFn =
      std::function<void(std::size_t index, std::vector<StyledLine> &out)>;

  explicit ViewportCuller(std::size_t margin = kDefaultCullingMargin,
                          std::size_t slack_lines = kDefaultCullingSlackLines)
      : margin_(margin), slack_lines_(slack_lines) {}

  void configure(std::size_t margin, std::size_t slack_lines) noexcept {
    margin_ = margin;
    slack_lines_ = slack_lines;
  }

  CullPlan plan(const PrefixSumIndex &index, std::size_t welcome_height,
                std::size_t scroll, std::size_t viewport_height) const noexcept;

  CullResult render(const CullPlan &plan, std::size_t scroll,
                    std::size_t message_count,
                    std::span<const StyledLine> welcome,
                    const RenderFn &render_message,
                    std::vector<StyledLine> &out) const;

private:
  std::size_t margin_;
  std::size_t slack_lines_;
};

} // namespace ag::transcript
