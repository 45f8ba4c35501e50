#include "ag/transcript/scroll_controller.hpp"

#include <algorithm>
#include <cmath>

namespace ag::transcript {

namespace {
constexpr float kSnapEpsilon = 0.01f;
}

ScrollController::ScrollController(float smoothing) : smoothing_(0.3f) {
  set_smoothing(smoothing);
}

ScrollRegime ScrollController::update(std::size_t content_height,
                                      std::size_t viewport_height) {
  if (content_height <= viewport_height) {
    state_.target = 0;
    state_.position = 0.0f;
    state_.offset = 0;
    state_.auto_scroll = true;
    max_scroll_ = 0;
    return ScrollRegime::Fit;
  }

  max_scroll_ = content_height - viewport_height;
  if (state_.auto_scroll)
    state_.target = max_scroll_;
  state_.target = std::min(state_.target, max_scroll_);

  float target = static_cast<float>(state_.target);
  float delta = target - state_.position;
  if (std::fabs(delta) < kSnapEpsilon)
    state_.position = target;
  else
    state_.position += delta * smoothing_;

  state_.offset =
      static_cast<std::size_t>(std::max(0.0f, std::round(state_.position)));
  if (state_.offset >= max_scroll_)
    state_.auto_scroll = true;
  return ScrollRegime::Scroll;
}

void ScrollController::scroll_by(long delta) noexcept {
  if (delta < 0) {
    std::size_t up = static_cast<std::size_t>(-delta);
    state_.target = state_.target > up ? state_.target - up : 0;
    state_.auto_scroll = false;
  } else {
    state_.target += static_cast<std::size_t>(delta);
  }
}

void ScrollController::jump_to_top() noexcept {
  state_.target = 0;
  state_.auto_scroll = false;
}

void ScrollController::jump_to_bottom() noexcept { state_.auto_scroll = true; }

bool ScrollController::animating() const noexcept {
  return state_.position != static_cast<float>(state_.target);
}

void ScrollController::set_smoothing(float smoothing) noexcept {
  smoothing_ = std::clamp(smoothing, 0.01f, 1.0f);
}

} // namespace ag::transcript
