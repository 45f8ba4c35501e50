#pragma once

#include "ag/transcript/message.hpp"
#include "ag/transcript/text_renderer.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace ag::transcript {

struct SpinnerState {
  std::size_t frame = 0;
  // Agent is thinking or running.
  bool is_active = false;
  bool is_last_message = false;
  // Newest assistant message already has blocks but the agent is thinking.
  bool is_thinking_mid_turn = false;
};

SpinnerState message_spinner(SpinnerState base, std::size_t index,
                             std::size_t message_count, bool is_thinking,
                             const Message &message) noexcept;

struct LayoutContext {
  TextRenderer &renderer;
  std::size_t terminal_tail_lines;
};

// Blank row inserted between two visible blocks of different kind.
std::size_t spacing_before(std::optional<BlockKind> previous,
                           BlockKind current) noexcept;

// Total spacing rows for a sequence of visible block kinds.
std::size_t block_spacing(std::span<const BlockKind> kinds) noexcept;

// Sums label, block heights, spacing and indicator rows. Block heights come
// from their caches; only stale blocks are rendered.
std::size_t compute_message_height(Message &message, LayoutContext &context,
                                   const SpinnerState &spinner,
                                   std::uint16_t width);

// Emits exactly compute_message_height() rows.
void render_message(Message &message, LayoutContext &context,
                    const SpinnerState &spinner, std::uint16_t width,
                    std::vector<StyledLine> &out);

/**
 * @brief Refreshes cached message heights, newest to oldest.
 *
 * Stops at the first message whose cache is valid at `width`, unless it is
 * the newest message while streaming. Messages at or above `dirty_from` are
 * skipped over instead, so an explicitly invalidated older message is still
 * reached. Returns the number of messages recomputed.
 */
std::size_t update_visual_heights(std::vector<Message> &messages,
                                  LayoutContext &context, SpinnerState base,
                                  bool is_thinking, bool is_streaming,
                                  std::uint16_t width,
                                  std::optional<std::size_t> dirty_from);

} // namespace ag::transcript
