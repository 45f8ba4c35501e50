#include "transcript_view.hpp"

#include "ag/transcript/text_layout.hpp"

#include <algorithm>
#include <string_view>

namespace
{
    using ag::transcript::StyleMask;

    constexpr long kWheelStep = 3;

    // Same slots as TScroller: normal text, selected text.
    const char kTranscriptPalette[] = "\x06\x07";
}

TranscriptView::TranscriptView(const TRect &bounds, ag::transcript::Transcript &transcript,
                               ag::transcript::ChatRenderer &renderer)
    : TView(bounds), transcript_(transcript), renderer_(renderer)
{
    options |= ofSelectable | ofFirstClick;
    growMode = gfGrowHiX | gfGrowHiY;
    eventMask |= evMouseMove | evMouseAuto | evMouseWheel;
}

TPalette &TranscriptView::getPalette() const
{
    static TPalette palette(kTranscriptPalette, sizeof(kTranscriptPalette) - 1);
    return palette;
}

TColorAttr TranscriptView::attributeFor(TColorAttr base, StyleMask mask)
{
    TColorAttr attr = base;
    auto setFg = [&](int code)
    { setFore(attr, TColorDesired(TColorBIOS(code))); };
    auto setBg = [&](int code)
    { setBack(attr, TColorDesired(TColorBIOS(code))); };

    if (mask & ag::transcript::kStyleUserBackground)
    {
        setBg(0x01);
        setFg(0x0F);
    }
    if (mask & ag::transcript::kStyleWelcome)
        setFg(0x03);
    if (mask & ag::transcript::kStyleToolTitle)
        setFg(0x0E);
    if (mask & ag::transcript::kStyleToolOutput)
        setFg(0x07);
    if (mask & ag::transcript::kStyleSpinner)
        setFg(0x0B);
    if (mask & ag::transcript::kStyleSuccess)
        setFg(0x0A);
    if (mask & ag::transcript::kStyleError)
        setFg(0x0C);
    if (mask & ag::transcript::kStyleDim)
        setFg(0x08);
    if (mask & (ag::transcript::kStyleBold | ag::transcript::kStyleRoleLabel))
        setStyle(attr, static_cast<ushort>(getStyle(attr) | slBold));
    return attr;
}

const ag::transcript::StyledLine *TranscriptView::lineAtRow(int y) const
{
    const auto &output = frame_.output();
    std::size_t row = static_cast<std::size_t>(y);
    if (row < output.top_padding)
        return nullptr;
    std::size_t index = output.local_scroll + (row - output.top_padding);
    if (index >= output.lines.size())
        return nullptr;
    return &output.lines[index];
}

void TranscriptView::drawRow(TDrawBuffer &buffer, int y, TColorAttr baseAttr) const
{
    const auto *line = lineAtRow(y);
    if (!line)
        return;

    std::string_view text(line->text);
    std::size_t index = 0;
    int column = 0;
    while (index < text.size() && column < size.x)
    {
        // A run shares one style mask and one selection state.
        std::size_t runStart = index;
        StyleMask mask = line->styles[index];
        bool selected = hasSelection_ && selection_.contains(static_cast<std::size_t>(y),
                                                              static_cast<std::size_t>(column));
        int runColumns = 0;
        while (index < text.size())
        {
            std::size_t glyphEnd = index;
            int width = ag::transcript::codepoint_width(ag::transcript::next_codepoint(text, glyphEnd));
            if (index > runStart)
            {
                bool glyphSelected = hasSelection_ &&
                                     selection_.contains(static_cast<std::size_t>(y),
                                                         static_cast<std::size_t>(column + runColumns));
                if (line->styles[index] != mask || glyphSelected != selected)
                    break;
            }
            if (column + runColumns + width > size.x)
                break;
            runColumns += width;
            index = glyphEnd;
        }
        if (index == runStart)
            break;

        TColorAttr attr = attributeFor(baseAttr, mask);
        if (selected)
            attr = reverseAttribute(attr);
        buffer.moveStr(static_cast<ushort>(column), TStringView(text.data() + runStart, index - runStart), attr,
                       static_cast<ushort>(std::max(runColumns, 1)));
        column += runColumns;
    }
}

void TranscriptView::refresh()
{
    frame_.invalidate();
    drawView();
}

void TranscriptView::draw()
{
    if (size.x <= 0 || size.y <= 0)
        return;

    // Exposures and selection redraws reuse the last frame.
    frame_.frame(renderer_, transcript_, static_cast<std::uint16_t>(size.x),
                 static_cast<std::size_t>(size.y), pendingInput_);

    TColorAttr baseAttr = getColor(1)[0];
    TDrawBuffer buffer;
    for (int y = 0; y < size.y; ++y)
    {
        buffer.moveChar(0, ' ', baseAttr, size.x);
        drawRow(buffer, y, baseAttr);
        writeLine(0, y, size.x, 1, buffer);
    }
}

ag::transcript::CellPosition TranscriptView::cellAt(TPoint local) const
{
    int x = std::clamp(static_cast<int>(local.x), 0, std::max(0, size.x - 1));
    int y = std::clamp(static_cast<int>(local.y), 0, std::max(0, size.y - 1));
    return {static_cast<std::size_t>(y), static_cast<std::size_t>(x)};
}

void TranscriptView::trackSelection(TEvent &event)
{
    selection_.start = cellAt(makeLocal(event.mouse.where));
    selection_.end = selection_.start;
    selection_.dragging = true;
    hasSelection_ = false;
    drawView();

    while (mouseEvent(event, evMouseMove | evMouseAuto))
    {
        auto cell = cellAt(makeLocal(event.mouse.where));
        // End is exclusive; extend it past the glyph under the pointer.
        ++cell.col;
        selection_.end = cell;
        hasSelection_ = !(selection_.start == selection_.end);
        drawView();
    }
    selection_.dragging = false;
}

void TranscriptView::handleEvent(TEvent &event)
{
    TView::handleEvent(event);

    switch (event.what)
    {
    case evMouseDown:
        if (event.mouse.buttons & mbLeftButton)
        {
            trackSelection(event);
            clearEvent(event);
        }
        break;
    case evMouseWheel:
        if (event.mouse.wheel == mwUp)
            scrollBy(-kWheelStep);
        else if (event.mouse.wheel == mwDown)
            scrollBy(kWheelStep);
        clearEvent(event);
        break;
    case evKeyDown:
        switch (event.keyDown.keyCode)
        {
        case kbUp:
            scrollBy(-1);
            break;
        case kbDown:
            scrollBy(1);
            break;
        case kbPgUp:
            scrollBy(-std::max(1, size.y - 1));
            break;
        case kbPgDn:
            scrollBy(std::max(1, size.y - 1));
            break;
        case kbHome:
        case kbCtrlHome:
            scrollToTop();
            break;
        case kbEnd:
        case kbCtrlEnd:
            scrollToBottom();
            break;
        default:
            return;
        }
        clearEvent(event);
        break;
    default:
        break;
    }
}

void TranscriptView::scrollBy(long lines)
{
    pendingInput_.delta += lines;
    clearSelection();
    refresh();
}

void TranscriptView::scrollToTop()
{
    pendingInput_.jump_to_top = true;
    pendingInput_.jump_to_bottom = false;
    clearSelection();
    refresh();
}

void TranscriptView::scrollToBottom()
{
    pendingInput_.jump_to_bottom = true;
    pendingInput_.jump_to_top = false;
    clearSelection();
    refresh();
}

bool TranscriptView::animating() const
{
    return transcript_.scroll().animating();
}

std::string TranscriptView::selectionText() const
{
    if (!hasSelection_)
        return std::string();
    return ag::transcript::selected_text(frame_.rows(), selection_);
}

void TranscriptView::clearSelection()
{
    hasSelection_ = false;
    selection_ = {};
}
