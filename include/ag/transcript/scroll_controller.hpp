#pragma once

#include <cstddef>

namespace ag::transcript {

struct ScrollState {
  std::size_t target = 0;
  float position = 0.0f;
  std::size_t offset = 0;
  bool auto_scroll = true;
};

enum class ScrollRegime {
  // Content fits: no scrolling, bottom aligned.
  Fit,
  // Content taller than the viewport: smoothed scrolling with culling.
  Scroll
};

constexpr float kDefaultScrollSmoothing = 0.3f;

/**
 * @brief Smoothed scroll position with bottom pinning.
 *
 * update() runs once per frame. `position` moves a fixed fraction of the
 * remaining distance toward `target` and snaps when closer than 0.01.
 * Reaching the bottom re-enables auto-scroll.
 */
class ScrollController {
public:
  explicit ScrollController(float smoothing = kDefaultScrollSmoothing);

  ScrollRegime update(std::size_t content_height, std::size_t viewport_height);

  // Negative deltas scroll up and detach from the bottom.
  void scroll_by(long delta) noexcept;
  void jump_to_top() noexcept;
  void jump_to_bottom() noexcept;

  bool animating() const noexcept;
  std::size_t max_scroll() const noexcept { return max_scroll_; }

  const ScrollState &state() const noexcept { return state_; }
  ScrollState &state() noexcept { return state_; }

  void set_smoothing(float smoothing) noexcept;
  float smoothing() const noexcept { return smoothing_; }

private:
  ScrollState state_;
  std::size_t max_scroll_ = 0;
  float smoothing_;
};

} // namespace ag::transcript
