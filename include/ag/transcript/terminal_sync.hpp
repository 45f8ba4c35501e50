#pragma once

#include "ag/transcript/message.hpp"
#include "ag/transcript/output_buffer.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace ag::transcript {

// Bytes past the watermark; the buffer grew since the last frame.
struct AppendPayload {
  std::string bytes;
  std::size_t current_len = 0;
};

// Whole buffer; taken when it shrank or a replace was forced.
struct ReplacePayload {
  std::string bytes;
  std::size_t current_len = 0;
};

using SyncPayload = std::variant<AppendPayload, ReplacePayload>;

struct SyncStats {
  std::uint64_t append_cycles = 0;
  std::uint64_t replace_cycles = 0;
  std::uint64_t shrink_fallbacks = 0;
  std::uint64_t skipped_locks = 0;
  std::uint64_t delta_bytes = 0;
};

// A live buffer and the tool call that displays it.
struct TrackedTerminal {
  std::size_t message = 0;
  std::size_t block = 0;
  OutputHandle buffer;
};

/**
 * @brief Mirrors live output buffers into tool call text once per frame.
 *
 * The buffer lock is held only to read the length and copy bytes; decoding
 * and cache invalidation happen after it is released.
 */
class TerminalOutputSynchronizer {
public:
  // Decodes and applies one payload. Returns whether the displayed text
  // changed. Both paths advance the watermark and return to AppendOnly.
  static bool apply_payload(ToolCallBlock &call, SyncPayload payload);

  // Replaces a pending incomplete UTF-8 tail with U+FFFD once no more bytes
  // will follow it. Returns whether the displayed text changed.
  static bool flush_utf8_carry(ToolCallBlock &call);

  /**
   * Runs one pass over `tracked`. Each changed tool call has its block cache
   * and its message layout invalidated. Returns the smallest message index
   * that changed, or nullopt when nothing did.
   */
  std::optional<std::size_t> sync(std::vector<Message> &messages,
                                  std::span<const TrackedTerminal> tracked);

  const SyncStats &stats() const noexcept { return stats_; }

private:
  std::optional<SyncPayload> read_payload(const TrackedTerminal &terminal,
                                          const ToolCallBlock &call);

  SyncStats stats_;
};

} // namespace ag::transcript
