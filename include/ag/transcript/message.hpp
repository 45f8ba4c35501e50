#pragma once

#include "ag/transcript/block_cache.hpp"
#include "ag/transcript/text_renderer.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ag::transcript {

enum class Role { User, Assistant, System };

enum class ToolCallStatus { Pending, InProgress, Completed, Failed };

enum class SnapshotMode { AppendOnly, ReplaceSnapshot };

// Per tool call mirror state for a live output buffer.
struct TerminalRuntimeState {
  std::size_t bytes_seen = 0;
  std::size_t output_len = 0;
  SnapshotMode mode = SnapshotMode::AppendOnly;
  // Incomplete UTF-8 tail of the last delta, completed by the next one.
  std::string utf8_carry;
};

struct TextBlock {
  std::string content;
  TextRenderState parse;
  BlockCache cache;

  TextBlock() = default;
  explicit TextBlock(std::string text) : content(std::move(text)) {}

  void append(std::string_view text) {
    content.append(text);
    cache.invalidate();
  }

  void assign(std::string text) {
    content = std::move(text);
    parse = TextRenderState{};
    cache.invalidate();
  }
};

struct ToolCallBlock {
  std::string id;
  std::string title;
  std::string kind;
  ToolCallStatus status = ToolCallStatus::Pending;
  std::string content;
  std::optional<std::string> terminal_id;
  std::optional<std::string> terminal_output;
  TerminalRuntimeState terminal;
  bool hidden = false;
  bool collapsed = false;
  // Holds the body rows only; the title row is drawn fresh every frame.
  BlockCache cache;

  bool in_progress() const noexcept {
    return status == ToolCallStatus::Pending ||
           status == ToolCallStatus::InProgress;
  }

  void mark_layout_dirty() noexcept { cache.invalidate(); }
};

using Block = std::variant<TextBlock, ToolCallBlock>;

enum class BlockKind { Text, ToolCall };

inline BlockKind kind_of(const Block &block) noexcept {
  return std::holds_alternative<TextBlock>(block) ? BlockKind::Text
                                                  : BlockKind::ToolCall;
}

// Cached total height of a message, tagged with the width it was computed at.
class LayoutCache {
public:
  bool valid_at(std::uint16_t width) const noexcept {
    return valid_ && width_ == width;
  }
  std::size_t height() const noexcept { return height_; }
  std::uint16_t width() const noexcept { return width_; }

  void store(std::uint16_t width, std::size_t height) noexcept {
    width_ = width;
    height_ = height;
    valid_ = true;
  }

  // Keeps the last height so the prefix index can still compare against it.
  void invalidate() noexcept { valid_ = false; }

private:
  std::size_t height_ = 0;
  std::uint16_t width_ = 0;
  bool valid_ = false;
};

struct Message {
  Role role = Role::Assistant;
  std::vector<Block> blocks;
  LayoutCache layout;

  Message() = default;
  explicit Message(Role r) : role(r) {}
};

const char *role_label(Role role) noexcept;

} // namespace ag::transcript
