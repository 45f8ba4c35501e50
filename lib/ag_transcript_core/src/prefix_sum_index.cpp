#include "ag/transcript/prefix_sum_index.hpp"

#include "ag/debug_log.hpp"

#include <algorithm>
#include <string>

namespace ag::transcript {

std::size_t PrefixSumIndex::cumulative_before(std::size_t index) const noexcept {
  if (index == 0 || prefix_.empty())
    return 0;
  return prefix_[std::min(index, prefix_.size()) - 1];
}

std::size_t PrefixSumIndex::height_of(std::size_t index) const noexcept {
  return index < heights_.size() ? heights_[index] : 0;
}

std::size_t PrefixSumIndex::first_visible_at(std::size_t offset) const noexcept {
  auto it = std::upper_bound(prefix_.begin(), prefix_.end(), offset);
  return static_cast<std::size_t>(it - prefix_.begin());
}

std::optional<std::size_t>
PrefixSumIndex::rebuild(const std::vector<Message> &messages,
                        std::uint16_t width,
                        std::optional<std::size_t> dirty_from) {
  const std::size_t count = messages.size();
  const std::size_t known = heights_.size();
  std::size_t start = count;

  if (width != width_ || count < known) {
    if (count > 0 && log::enabled())
      log::debug("prefix", "full rebuild of " + std::to_string(count) +
                               " entries at width " + std::to_string(width));
    start = 0;
  } else {
    if (count > known)
      start = known;
    for (std::size_t i = known; i-- > 0;) {
      if (messages[i].layout.height() != heights_[i])
        start = i;
      else if (!dirty_from || i < *dirty_from)
        break;
    }
  }

  width_ = width;
  if (start >= count && count == known)
    return std::nullopt;

  heights_.resize(count);
  prefix_.resize(count);
  for (std::size_t i = start; i < count; ++i) {
    heights_[i] = messages[i].layout.height();
    prefix_[i] = (i == 0 ? 0 : prefix_[i - 1]) + heights_[i];
  }
  return start;
}

void PrefixSumIndex::clear() noexcept {
  heights_.clear();
  prefix_.clear();
  width_ = 0;
}

} // namespace ag::transcript
