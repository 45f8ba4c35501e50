#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ag::transcript {

using StyleMask = std::uint32_t;

constexpr StyleMask kStyleNone = 0;
constexpr StyleMask kStyleBold = 1u << 0;
constexpr StyleMask kStyleDim = 1u << 1;
constexpr StyleMask kStyleRoleLabel = 1u << 2;
constexpr StyleMask kStyleUserBackground = 1u << 3;
constexpr StyleMask kStyleToolTitle = 1u << 4;
constexpr StyleMask kStyleToolOutput = 1u << 5;
constexpr StyleMask kStyleError = 1u << 6;
constexpr StyleMask kStyleSuccess = 1u << 7;
constexpr StyleMask kStyleSpinner = 1u << 8;
constexpr StyleMask kStyleWelcome = 1u << 9;

// One pre-wrapped output row. `styles` holds one mask per byte of `text`.
struct StyledLine {
  std::string text;
  std::vector<StyleMask> styles;

  StyledLine() = default;
  StyledLine(std::string_view content, StyleMask style)
      : text(content), styles(content.size(), style) {}

  void append(std::string_view content, StyleMask style) {
    text.append(content);
    styles.insert(styles.end(), content.size(), style);
  }

  bool empty() const noexcept { return text.empty(); }
  bool operator==(const StyledLine &other) const = default;
};

} // namespace ag::transcript
