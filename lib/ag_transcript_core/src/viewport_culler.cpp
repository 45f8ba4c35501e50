#include "ag/transcript/viewport_culler.hpp"

namespace ag::transcript {

namespace {
std::size_t saturating_sub(std::size_t a, std::size_t b) noexcept {
  return a > b ? a - b : 0;
}
} // namespace

CullPlan ViewportCuller::plan(const PrefixSumIndex &index,
                              std::size_t welcome_height, std::size_t scroll,
                              std::size_t viewport_height) const noexcept {
  CullPlan result;
  result.first_visible =
      index.first_visible_at(saturating_sub(scroll, welcome_height));
  result.render_start = saturating_sub(result.first_visible, margin_);
  result.height_before_start =
      welcome_height + index.cumulative_before(result.render_start);
  if (result.render_start == 0) {
    result.include_welcome = true;
    result.height_before_start = 0;
  }
  result.lines_needed = saturating_sub(scroll, result.height_before_start) +
                        viewport_height + slack_lines_;
  return result;
}

CullResult ViewportCuller::render(const CullPlan &plan, std::size_t scroll,
                                  std::size_t message_count,
                                  std::span<const StyledLine> welcome,
                                  const RenderFn &render_message,
                                  std::vector<StyledLine> &out) const {
  CullResult result;
  result.render_start = plan.render_start;
  result.render_end = plan.render_start;
  if (plan.include_welcome)
    out.insert(out.end(), welcome.begin(), welcome.end());

  for (std::size_t i = plan.render_start; i < message_count; ++i) {
    render_message(i, out);
    result.render_end = i + 1;
    if (out.size() > plan.lines_needed)
      break;
  }
  result.local_scroll = saturating_sub(scroll, plan.height_before_start);
  return result;
}

} // namespace ag::transcript
