#pragma once

#include "ag/transcript/styled_line.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ag::transcript {

// Decodes one UTF-8 sequence at `index`. Invalid or truncated sequences
// consume a single byte and yield U+FFFD.
std::uint32_t next_codepoint(std::string_view text, std::size_t &index);

int codepoint_width(std::uint32_t codepoint);
int display_width(std::string_view text);

// Lossy UTF-8 decode. Invalid bytes become U+FFFD. A trailing sequence that is
// a valid but incomplete prefix is moved into `carry` instead of being
// replaced, so split writes decode the same as one write. Bytes already in
// `carry` are prepended to `bytes`.
std::string decode_utf8_lossy(std::string_view bytes, std::string &carry);
// Decodes a complete byte stream; a truncated trailing sequence is replaced.
std::string decode_utf8_lossy(std::string_view bytes);

// Drops carriage returns and ANSI CSI/OSC escape sequences, expands tabs to
// four spaces and turns other C0 controls into spaces. Newlines are kept.
std::string sanitize_for_display(std::string_view text);

// Wraps one logical line (no '\n') to `width` columns: breaks at the last
// space that fits, hard-breaks words longer than the width. Always yields at
// least one line.
std::vector<StyledLine> wrap_line(std::string_view line, int width,
                                  StyleMask style);

} // namespace ag::transcript
