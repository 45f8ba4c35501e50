#include "ag/transcript/block_cache.hpp"

#include <algorithm>
#include <utility>

namespace ag::transcript {

std::optional<std::size_t>
BlockCache::height_at(std::uint16_t width) const noexcept {
  for (const auto &entry : entries_) {
    if (entry.width == width)
      return entry.height;
  }
  return std::nullopt;
}

const std::vector<StyledLine> *
BlockCache::lines_at(std::uint16_t width) const noexcept {
  for (const auto &entry : entries_) {
    if (entry.width == width && entry.lines)
      return &*entry.lines;
  }
  return nullptr;
}

void BlockCache::store_with_height(std::uint16_t width,
                                   std::vector<StyledLine> lines) {
  Entry &entry = slot_for(width);
  entry.height = lines.size();
  entry.lines = std::move(lines);
}

void BlockCache::store_height(std::uint16_t width, std::size_t height) {
  Entry &entry = slot_for(width);
  entry.height = height;
  entry.lines.reset();
}

void BlockCache::invalidate() noexcept {
  entries_.clear();
  ++generation_;
}

BlockCache::Entry &BlockCache::slot_for(std::uint16_t width) {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [width](const Entry &e) { return e.width == width; });
  if (it != entries_.end())
    return *it;
  // Oldest width goes first; a resize rarely bounces between more than two.
  if (entries_.size() >= kMaxWidths)
    entries_.erase(entries_.begin());
  entries_.push_back(Entry{width, 0, std::nullopt});
  return entries_.back();
}

} // namespace ag::transcript
