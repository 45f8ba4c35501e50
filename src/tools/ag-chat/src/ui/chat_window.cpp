#include "chat_window.hpp"
#include "chat_app.hpp"
#include "prompt_input_view.hpp"
#include "transcript_view.hpp"
#include "../clipboard.hpp"
#include "../commands.hpp"

#include "ag/debug_log.hpp"

#include <algorithm>
#include <utility>
#include <variant>
#include <vector>

namespace
{
    constexpr int kPromptLines = 4;
    constexpr int kButtonWidth = 10;

    const std::vector<std::string> &welcomeText()
    {
        static const std::vector<std::string> lines{
            "ag-chat: a terminal agent transcript.",
            "Type a prompt and press Enter. Prefix it with ! to run a shell command.",
            ""};
        return lines;
    }

    const char *statusLabel(ag::transcript::AgentStatus status)
    {
        switch (status)
        {
        case ag::transcript::AgentStatus::Ready:
            return "Ready";
        case ag::transcript::AgentStatus::Thinking:
            return "Thinking";
        case ag::transcript::AgentStatus::Running:
            return "Running";
        case ag::transcript::AgentStatus::Error:
            return "Error";
        }
        return "";
    }
} // namespace

ChatWindow::ChatWindow(ChatApp &owner, const TRect &bounds, int number)
    : TWindowInit(&ChatWindow::initFrame),
      TWindow(bounds, "Chat", number),
      app(owner),
      renderer_(owner.engineSettings())
{
    options |= ofTileable;

    TRect extent = getExtent();
    extent.grow(-1, -1);

    short promptTop = static_cast<short>(extent.b.y - kPromptLines);
    if (promptTop <= extent.a.y + 2)
        promptTop = static_cast<short>(extent.a.y + 3);

    TRect transcriptRect(extent.a.x, extent.a.y, extent.b.x, promptTop - 1);
    transcriptView = new TranscriptView(transcriptRect, transcript_, renderer_);
    insert(transcriptView);

    TRect buttonRect(extent.b.x - kButtonWidth, promptTop, extent.b.x, promptTop + 2);
    sendButton = new TButton(buttonRect, "~S~end", cmSendPrompt, bfDefault);
    sendButton->growMode = gfGrowLoX | gfGrowHiX | gfGrowLoY | gfGrowHiY;
    insert(sendButton);

    short inputRight = static_cast<short>(extent.b.x - kButtonWidth - 1);
    TRect scrollRect(inputRight, promptTop, inputRight + 1, extent.b.y);
    promptScrollBar = new TScrollBar(scrollRect);
    promptScrollBar->growMode = gfGrowLoX | gfGrowHiX | gfGrowLoY | gfGrowHiY;
    insert(promptScrollBar);

    TRect inputRect(extent.a.x, promptTop, inputRight, extent.b.y);
    promptInput = new PromptInputView(inputRect, nullptr, promptScrollBar);
    insert(promptInput);

    configureTranscript();
    setChunkDelay(owner.chunkDelay());
    app.registerWindow(this);
    promptInput->select();
}

void ChatWindow::configureTranscript()
{
    if (app.engineSettings().show_welcome)
        transcript_.set_welcome(welcomeText());
    else
        transcript_.set_welcome({});
    transcript_.set_tools_collapsed(app.toolsCollapsed());
}

void ChatWindow::handleEvent(TEvent &event)
{
    if (event.what == evKeyDown && event.keyDown.keyCode == kbCtrlIns && transcriptView &&
        transcriptView->hasSelection())
    {
        copySelection();
        clearEvent(event);
        return;
    }

    TWindow::handleEvent(event);

    if (event.what != evCommand)
        return;

    switch (event.message.command)
    {
    case cmSendPrompt:
        sendPrompt();
        break;
    case cmCancelTurn:
        cancelTurn();
        break;
    case cmCopySelection:
        copySelection();
        break;
    case cmScrollTop:
        transcriptView->scrollToTop();
        break;
    case cmScrollBottom:
        transcriptView->scrollToBottom();
        break;
    case cmClearChat:
        newConversation();
        break;
    default:
        return;
    }
    clearEvent(event);
}

void ChatWindow::sizeLimits(TPoint &min, TPoint &max)
{
    TWindow::sizeLimits(min, max);
    constexpr short minWidth = 40;
    constexpr short minHeight = 12;
    if (min.x < minWidth)
        min.x = minWidth;
    if (min.y < minHeight)
        min.y = minHeight;
}

void ChatWindow::shutDown()
{
    session_.cancelTurn();
    app.unregisterWindow(this);
    transcriptView = nullptr;
    promptInput = nullptr;
    TWindow::shutDown();
}

bool ChatWindow::applySessionUpdates()
{
    auto updates = session_.takeUpdates();
    if (updates.empty())
        return false;

    for (auto &update : updates)
    {
        if (auto *attached = std::get_if<ag::chat::TerminalAttached>(&update))
        {
            transcript_.attach_terminal(attached->terminalId, std::move(attached->buffer));
            continue;
        }
        const auto &event = std::get<ag::transcript::TranscriptEvent>(update);
        if (!transcript_.apply_event(event))
            ag::log::debug("chat", "event for an unknown tool call dropped");
    }
    return true;
}

bool ChatWindow::processPendingUpdates(bool spinnerTick)
{
    if (!transcriptView)
        return false;

    bool changed = applySessionUpdates();
    if (transcript_.update_terminal_outputs())
        changed = true;
    if (spinnerTick && transcript_.is_streaming())
    {
        // Spinner glyphs are drawn per frame; heights stay valid.
        transcript_.advance_spinner();
        changed = true;
    }

    if (!changed && !transcriptView->animating())
        return false;

    transcriptView->refresh();
    refreshWindowTitle();
    return true;
}

void ChatWindow::setToolsCollapsed(bool collapsed)
{
    transcript_.set_tools_collapsed(collapsed);
    if (transcriptView)
        transcriptView->refresh();
}

void ChatWindow::setChunkDelay(std::chrono::milliseconds delay)
{
    session_.setChunkDelay(delay);
}

void ChatWindow::refreshWindowTitle()
{
    std::string title = std::string("Chat - ") + statusLabel(transcript_.status());
    if (title == lastWindowTitle_)
        return;
    lastWindowTitle_ = title;
    delete[] const_cast<char *>(this->title);
    this->title = newStr(title.c_str());
    if (frame)
        frame->drawView();
}

void ChatWindow::newConversation()
{
    session_.cancelTurn();
    // Drop whatever the cancelled turn queued.
    (void)session_.takeUpdates();
    transcript_ = ag::transcript::Transcript();
    configureTranscript();
    if (transcriptView)
    {
        transcriptView->clearSelection();
        transcriptView->refresh();
    }
    refreshWindowTitle();
}

void ChatWindow::sendPrompt()
{
    if (!promptInput || !transcriptView)
        return;

    std::string prompt = promptInput->text();
    while (!prompt.empty() && (prompt.back() == '\n' || prompt.back() == ' '))
        prompt.pop_back();
    if (prompt.empty())
        return;

    session_.startTurn(prompt);
    promptInput->clearText();
    applySessionUpdates();
    transcriptView->scrollToBottom();
    refreshWindowTitle();
}

void ChatWindow::cancelTurn()
{
    if (!session_.turnInProgress())
        return;
    session_.cancelTurn();
    applySessionUpdates();
    if (transcriptView)
        transcriptView->refresh();
    refreshWindowTitle();
}

void ChatWindow::copySelection()
{
    if (!transcriptView || !transcriptView->hasSelection())
        return;
    clipboard::copyToClipboard(transcriptView->selectionText());
    app.showStatus(clipboard::statusMessage());
}
