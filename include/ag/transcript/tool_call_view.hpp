#pragma once

#include "ag/transcript/message.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace ag::transcript {

constexpr std::size_t kDefaultTerminalTailLines = 12;

std::string_view spinner_glyph(std::size_t frame) noexcept;

// Status glyph plus title. Pending and in-progress calls show the spinner.
StyledLine tool_call_title(const ToolCallBlock &call, std::size_t spinner_frame);

// Wrapped content followed by the last `tail_lines` lines of terminal output,
// indented under the title.
std::vector<StyledLine> render_tool_call_body(const ToolCallBlock &call,
                                              std::uint16_t width,
                                              std::size_t tail_lines);

// Rows the call occupies at `width`: 0 when hidden, 1 when collapsed,
// otherwise the cached body plus the title row.
std::size_t tool_call_height_cached(ToolCallBlock &call, std::uint16_t width,
                                    std::size_t tail_lines);

void render_tool_call_cached(ToolCallBlock &call, std::uint16_t width,
                             std::size_t spinner_frame, std::size_t tail_lines,
                             std::vector<StyledLine> &out);

} // namespace ag::transcript
