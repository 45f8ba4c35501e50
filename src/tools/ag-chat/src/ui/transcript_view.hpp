#pragma once

#include "ag/transcript/chat_renderer.hpp"
#include "ag/transcript/transcript.hpp"

#include "../tvision_include.hpp"

#include <string>

// Draws the culled transcript produced by ChatRenderer and owns the pointer
// driven text selection over the visible rows.
class TranscriptView : public TView
{
public:
    TranscriptView(const TRect &bounds, ag::transcript::Transcript &transcript,
                   ag::transcript::ChatRenderer &renderer);

    virtual void draw() override;
    virtual void handleEvent(TEvent &event) override;
    virtual TPalette &getPalette() const override;

    // Renders a new frame on the next draw; drawView() alone repaints the
    // last one.
    void refresh();
    void scrollBy(long lines);
    void scrollToTop();
    void scrollToBottom();
    bool animating() const;

    bool hasSelection() const noexcept { return hasSelection_; }
    std::string selectionText() const;
    void clearSelection();

private:
    ag::transcript::Transcript &transcript_;
    ag::transcript::ChatRenderer &renderer_;
    ag::transcript::ScrollInput pendingInput_;
    ag::transcript::FrameCache frame_;
    ag::transcript::SelectionState selection_;
    bool hasSelection_ = false;

    const ag::transcript::StyledLine *lineAtRow(int y) const;
    void drawRow(TDrawBuffer &buffer, int y, TColorAttr baseAttr) const;
    ag::transcript::CellPosition cellAt(TPoint local) const;
    void trackSelection(TEvent &event);
    static TColorAttr attributeFor(TColorAttr base, ag::transcript::StyleMask mask);
};
