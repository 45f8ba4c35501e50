#include "ag/transcript/text_layout.hpp"

#include <iterator>

namespace ag::transcript {

namespace {
constexpr std::string_view kReplacement = "\xEF\xBF\xBD";
constexpr std::uint32_t kReplacementCodepoint = 0xFFFD;

struct Interval {
  std::uint32_t first;
  std::uint32_t last;
};

bool bisearch(std::uint32_t codepoint, const Interval *table, int length) {
  int low = 0;
  int high = length - 1;
  if (codepoint < table[0].first || codepoint > table[high].last)
    return false;
  while (low <= high) {
    int mid = (low + high) / 2;
    if (codepoint > table[mid].last)
      low = mid + 1;
    else if (codepoint < table[mid].first)
      high = mid - 1;
    else
      return true;
  }
  return false;
}

// Zero-width: combining marks, joiners, variation selectors.
const Interval kCombiningIntervals[] = {
    {0x0300, 0x036F},   {0x0483, 0x0489},   {0x0591, 0x05BD},
    {0x05BF, 0x05BF},   {0x05C1, 0x05C2},   {0x05C4, 0x05C5},
    {0x05C7, 0x05C7},   {0x0610, 0x061A},   {0x064B, 0x065F},
    {0x0670, 0x0670},   {0x06D6, 0x06DC},   {0x06DF, 0x06E4},
    {0x06E7, 0x06E8},   {0x06EA, 0x06ED},   {0x0900, 0x0903},
    {0x093A, 0x093C},   {0x093E, 0x094F},   {0x0951, 0x0957},
    {0x0962, 0x0963},   {0x0E31, 0x0E31},   {0x0E34, 0x0E3A},
    {0x0E47, 0x0E4E},   {0x1AB0, 0x1AFF},   {0x1DC0, 0x1DFF},
    {0x200B, 0x200F},   {0x202A, 0x202E},   {0x2060, 0x2064},
    {0x20D0, 0x20FF},   {0x302A, 0x302F},   {0x3099, 0x309A},
    {0xFE00, 0xFE0F},   {0xFE20, 0xFE2F},   {0xFEFF, 0xFEFF},
    {0x1F3FB, 0x1F3FF}, {0xE0100, 0xE01EF}};

const Interval kDoubleWidthIntervals[] = {
    {0x1100, 0x115F},   {0x231A, 0x231B},   {0x2329, 0x232A},
    {0x23E9, 0x23EC},   {0x23F0, 0x23F0},   {0x23F3, 0x23F3},
    {0x25FD, 0x25FE},   {0x2614, 0x2615},   {0x2648, 0x2653},
    {0x267F, 0x267F},   {0x2693, 0x2693},   {0x26A1, 0x26A1},
    {0x26AA, 0x26AB},   {0x26BD, 0x26BE},   {0x26C4, 0x26C5},
    {0x26CE, 0x26CE},   {0x26D4, 0x26D4},   {0x26EA, 0x26EA},
    {0x26F2, 0x26F3},   {0x26F5, 0x26F5},   {0x26FA, 0x26FA},
    {0x26FD, 0x26FD},   {0x2705, 0x2705},   {0x270A, 0x270B},
    {0x2728, 0x2728},   {0x274C, 0x274C},   {0x274E, 0x274E},
    {0x2753, 0x2755},   {0x2757, 0x2757},   {0x2795, 0x2797},
    {0x27B0, 0x27B0},   {0x27BF, 0x27BF},   {0x2B1B, 0x2B1C},
    {0x2B50, 0x2B50},   {0x2B55, 0x2B55},   {0x2E80, 0x303E},
    {0x3040, 0x3247},   {0x3250, 0x4DBF},   {0x4E00, 0xA4C6},
    {0xA960, 0xA97C},   {0xAC00, 0xD7A3},   {0xF900, 0xFAFF},
    {0xFE10, 0xFE19},   {0xFE30, 0xFE6B},   {0xFF01, 0xFF60},
    {0xFFE0, 0xFFE6},   {0x1F004, 0x1F004}, {0x1F0CF, 0x1F0CF},
    {0x1F18E, 0x1F18E}, {0x1F191, 0x1F19A}, {0x1F200, 0x1F251},
    {0x1F300, 0x1F64F}, {0x1F680, 0x1F6FF}, {0x1F900, 0x1F9FF},
    {0x1FA70, 0x1FAFF}, {0x20000, 0x2FFFD}, {0x30000, 0x3FFFD}};

bool is_continuation(unsigned char byte) { return (byte & 0xC0) == 0x80; }

// Expected length of a sequence starting with `lead`, 0 if `lead` cannot
// start one.
std::size_t sequence_length(unsigned char lead) {
  if (lead < 0x80)
    return 1;
  if (lead >= 0xC2 && lead <= 0xDF)
    return 2;
  if (lead >= 0xE0 && lead <= 0xEF)
    return 3;
  if (lead >= 0xF0 && lead <= 0xF4)
    return 4;
  return 0;
}

// Second-byte constraints that rule out overlongs, surrogates and values
// above U+10FFFF.
bool valid_second_byte(unsigned char lead, unsigned char second) {
  if (!is_continuation(second))
    return false;
  switch (lead) {
  case 0xE0:
    return second >= 0xA0;
  case 0xED:
    return second < 0xA0;
  case 0xF0:
    return second >= 0x90;
  case 0xF4:
    return second < 0x90;
  default:
    return true;
  }
}

enum class SequenceCheck { Valid, Invalid, Incomplete };

SequenceCheck check_sequence(std::string_view text, std::size_t index,
                             std::size_t length) {
  unsigned char lead = static_cast<unsigned char>(text[index]);
  for (std::size_t j = 1; j < length; ++j) {
    if (index + j >= text.size())
      return SequenceCheck::Incomplete;
    unsigned char byte = static_cast<unsigned char>(text[index + j]);
    bool ok = (j == 1) ? valid_second_byte(lead, byte) : is_continuation(byte);
    if (!ok)
      return SequenceCheck::Invalid;
  }
  return SequenceCheck::Valid;
}
} // namespace

std::uint32_t next_codepoint(std::string_view text, std::size_t &index) {
  if (index >= text.size())
    return 0;
  unsigned char lead = static_cast<unsigned char>(text[index]);
  std::size_t length = sequence_length(lead);
  if (length == 1) {
    ++index;
    return lead;
  }
  if (length == 0 ||
      check_sequence(text, index, length) != SequenceCheck::Valid) {
    ++index;
    return kReplacementCodepoint;
  }

  std::uint32_t cp = 0;
  if (length == 2)
    cp = lead & 0x1F;
  else if (length == 3)
    cp = lead & 0x0F;
  else
    cp = lead & 0x07;
  for (std::size_t j = 1; j < length; ++j)
    cp = (cp << 6) | (static_cast<unsigned char>(text[index + j]) & 0x3F);
  index += length;
  return cp;
}

int codepoint_width(std::uint32_t codepoint) {
  if (codepoint < 0x20 || (codepoint >= 0x7F && codepoint < 0xA0))
    return 0;
  if (bisearch(codepoint, kCombiningIntervals,
               static_cast<int>(std::size(kCombiningIntervals))))
    return 0;
  if (bisearch(codepoint, kDoubleWidthIntervals,
               static_cast<int>(std::size(kDoubleWidthIntervals))))
    return 2;
  return 1;
}

int display_width(std::string_view text) {
  int width = 0;
  std::size_t index = 0;
  while (index < text.size())
    width += codepoint_width(next_codepoint(text, index));
  return width;
}

namespace {
// With `carry` null an incomplete trailing sequence becomes one U+FFFD.
std::string decode_view(std::string_view view, std::string *carry) {
  std::string output;
  output.reserve(view.size());
  std::size_t i = 0;
  while (i < view.size()) {
    unsigned char lead = static_cast<unsigned char>(view[i]);
    std::size_t length = sequence_length(lead);
    if (length == 1) {
      output.push_back(static_cast<char>(lead));
      ++i;
      continue;
    }
    if (length == 0) {
      output.append(kReplacement);
      ++i;
      continue;
    }
    switch (check_sequence(view, i, length)) {
    case SequenceCheck::Valid:
      output.append(view.substr(i, length));
      i += length;
      break;
    case SequenceCheck::Incomplete:
      if (carry)
        carry->assign(view.substr(i));
      else
        output.append(kReplacement);
      return output;
    case SequenceCheck::Invalid:
      output.append(kReplacement);
      ++i;
      break;
    }
  }
  return output;
}
} // namespace

std::string decode_utf8_lossy(std::string_view bytes, std::string &carry) {
  std::string input;
  input.reserve(carry.size() + bytes.size());
  input.append(carry);
  input.append(bytes);
  carry.clear();
  return decode_view(input, &carry);
}

std::string decode_utf8_lossy(std::string_view bytes) {
  return decode_view(bytes, nullptr);
}

std::string sanitize_for_display(std::string_view text) {
  std::string output;
  output.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    char ch = text[i];
    if (ch == '\x1B') {
      // ESC [ params final  |  ESC ] ... BEL or ESC \  |  ESC x
      if (i + 1 < text.size() && text[i + 1] == '[') {
        i += 2;
        while (i < text.size() &&
               !(text[i] >= '\x40' && text[i] <= '\x7E'))
          ++i;
        if (i < text.size())
          ++i;
      } else if (i + 1 < text.size() && text[i + 1] == ']') {
        i += 2;
        while (i < text.size()) {
          if (text[i] == '\x07') {
            ++i;
            break;
          }
          if (text[i] == '\x1B' && i + 1 < text.size() && text[i + 1] == '\\') {
            i += 2;
            break;
          }
          ++i;
        }
      } else {
        i += (i + 1 < text.size()) ? 2 : 1;
      }
      continue;
    }
    if (ch == '\r') {
      ++i;
      continue;
    }
    if (ch == '\t')
      output.append("    ");
    else if (ch == '\n' || static_cast<unsigned char>(ch) >= 0x20)
      output.push_back(ch);
    else
      output.push_back(' ');
    ++i;
  }
  return output;
}

std::vector<StyledLine> wrap_line(std::string_view line, int width,
                                  StyleMask style) {
  std::vector<StyledLine> lines;
  if (width < 1)
    width = 1;

  std::size_t pos = 0;
  while (pos < line.size()) {
    int column = 0;
    std::size_t index = pos;
    std::size_t fitEnd = pos;
    std::size_t lastSpaceEnd = std::string_view::npos;
    while (index < line.size()) {
      std::size_t glyphStart = index;
      std::uint32_t cp = next_codepoint(line, index);
      int w = codepoint_width(cp);
      if (column + w > width) {
        index = glyphStart;
        break;
      }
      column += w;
      fitEnd = index;
      if (cp == ' ')
        lastSpaceEnd = fitEnd;
    }

    if (fitEnd >= line.size()) {
      lines.emplace_back(line.substr(pos), style);
      break;
    }

    std::size_t breakAt = fitEnd;
    if (line[fitEnd] != ' ' && lastSpaceEnd != std::string_view::npos &&
        lastSpaceEnd > pos)
      breakAt = lastSpaceEnd;
    if (breakAt == pos) {
      // A single glyph wider than the row still has to go somewhere.
      next_codepoint(line, breakAt);
    }

    std::string_view piece = line.substr(pos, breakAt - pos);
    while (piece.size() > 1 && piece.back() == ' ')
      piece.remove_suffix(1);
    lines.emplace_back(piece, style);

    pos = breakAt;
    while (pos < line.size() && line[pos] == ' ')
      ++pos;
  }

  if (lines.empty())
    lines.emplace_back(std::string_view(), style);
  return lines;
}

} // namespace ag::transcript
