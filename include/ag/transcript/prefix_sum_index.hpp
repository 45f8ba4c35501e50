#pragma once

#include "ag/transcript/message.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace ag::transcript {

/**
 * @brief Cumulative message heights for scroll math.
 *
 * Entry i holds the summed height of messages [0, i]. Derived entirely from
 * the messages' layout caches and rebuilt only from the first entry whose
 * height changed.
 */
class PrefixSumIndex {
public:
  std::size_t size() const noexcept { return prefix_.size(); }
  std::size_t total_height() const noexcept {
    return prefix_.empty() ? 0 : prefix_.back();
  }

  // Summed height of messages [0, index). Indices past the end clamp.
  std::size_t cumulative_before(std::size_t index) const noexcept;

  std::size_t height_of(std::size_t index) const noexcept;

  // First index whose cumulative height strictly exceeds `offset`; size()
  // when the offset lies past the end.
  std::size_t first_visible_at(std::size_t offset) const noexcept;

  /**
   * Re-derives the index from `messages` at `width`. A width change or a
   * shrunk transcript rebuilds everything. Otherwise the scan walks back from
   * the newest entry and stops at the first unchanged entry below
   * `dirty_from`. Returns the first rebuilt index, or nullopt when nothing
   * changed.
   */
  std::optional<std::size_t> rebuild(const std::vector<Message> &messages,
                                     std::uint16_t width,
                                     std::optional<std::size_t> dirty_from);

  void clear() noexcept;

private:
  std::vector<std::size_t> heights_;
  std::vector<std::size_t> prefix_;
  std::uint16_t width_ = 0;
};

} // namespace ag::transcript
