#pragma once

#include "ag/transcript/styled_line.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace ag::transcript {

/**
 * @brief Render memo for a single content block, keyed by render width.
 *
 * An entry is only valid for the exact width it was stored at. Any content
 * mutation must call invalidate(), which drops every width at once.
 */
class BlockCache {
public:
  static constexpr std::size_t kMaxWidths = 4;

  std::optional<std::size_t> height_at(std::uint16_t width) const noexcept;
  const std::vector<StyledLine> *lines_at(std::uint16_t width) const noexcept;

  void store_with_height(std::uint16_t width, std::vector<StyledLine> lines);
  void store_height(std::uint16_t width, std::size_t height);

  void invalidate() noexcept;
  bool empty() const noexcept { return entries_.empty(); }

  // Incremented on every invalidate(); lets owners detect content churn.
  std::uint64_t generation() const noexcept { return generation_; }

private:
  struct Entry {
    std::uint16_t width = 0;
    std::size_t height = 0;
    std::optional<std::vector<StyledLine>> lines;
  };

  Entry &slot_for(std::uint16_t width);

  std::vector<Entry> entries_;
  std::uint64_t generation_ = 0;
};

} // namespace ag::transcript
