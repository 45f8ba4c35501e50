#include "prompt_input_view.hpp"

#include "../commands.hpp"

#include <vector>

PromptInputView::PromptInputView(const TRect &bounds, TScrollBar *hScroll, TScrollBar *vScroll)
    : TMemo(bounds, hScroll, vScroll, nullptr, kBufferSize)
{
    options |= ofFirstClick;
    growMode = gfGrowLoY | gfGrowHiX | gfGrowHiY;
}

void PromptInputView::handleEvent(TEvent &event)
{
    if (event.what == evKeyDown && event.keyDown.keyCode == kbEnter)
    {
        message(owner, evCommand, cmSendPrompt, this);
        clearEvent(event);
        return;
    }
    if (event.what == evKeyDown && event.keyDown.keyCode == kbCtrlEnter)
    {
        // TEditor inserts a line break for a plain Enter.
        event.keyDown.keyCode = kbEnter;
        event.keyDown.controlKeyState = 0;
    }
    TMemo::handleEvent(event);
}

TPalette &PromptInputView::getPalette() const
{
    return TEditor::getPalette();
}

std::string PromptInputView::text() const
{
    auto *self = const_cast<PromptInputView *>(this);
    std::string result;
    result.reserve(self->bufLen);
    for (unsigned i = 0; i < self->bufLen; ++i)
    {
        char ch = self->bufChar(i);
        if (ch == '\r')
        {
            if (i + 1 < self->bufLen && self->bufChar(i + 1) == '\n')
                ++i;
            result.push_back('\n');
        }
        else
        {
            result.push_back(ch);
        }
    }
    return result;
}

void PromptInputView::clearText()
{
    std::vector<char> raw(sizeof(TMemoData), 0);
    auto *memo = reinterpret_cast<TMemoData *>(raw.data());
    memo->length = 0;
    TMemo::setData(memo);
    trackCursor(true);
}
