#pragma once

#include "../tvision_include.hpp"

#include <string>

// Multi-line prompt editor. Enter submits through cmSendPrompt, Ctrl-Enter
// inserts a line break.
class PromptInputView : public TMemo
{
public:
    static constexpr ushort kBufferSize = 8192;

    PromptInputView(const TRect &bounds, TScrollBar *hScroll, TScrollBar *vScroll);

    virtual void handleEvent(TEvent &event) override;
    virtual TPalette &getPalette() const override;

    std::string text() const;
    void clearText();
};
