#pragma once

#include "../agent_session.hpp"
#include "../tvision_include.hpp"

#include "ag/transcript/chat_renderer.hpp"
#include "ag/transcript/transcript.hpp"

#include <chrono>
#include <string>

class ChatApp;
class PromptInputView;
class TranscriptView;

class ChatWindow : public TWindow
{
public:
    ChatWindow(ChatApp &owner, const TRect &bounds, int number);

    virtual void handleEvent(TEvent &event) override;
    virtual void sizeLimits(TPoint &min, TPoint &max) override;
    virtual void shutDown() override;

    // Drains agent updates and syncs live terminals. Returns whether the
    // transcript was redrawn.
    bool processPendingUpdates(bool spinnerTick);

    void setToolsCollapsed(bool collapsed);
    void setChunkDelay(std::chrono::milliseconds delay);
    void refreshWindowTitle();

private:
    ChatApp &app;
    ag::transcript::Transcript transcript_;
    ag::transcript::ChatRenderer renderer_;
    ag::chat::AgentSession session_;
    TranscriptView *transcriptView = nullptr;
    PromptInputView *promptInput = nullptr;
    TScrollBar *promptScrollBar = nullptr;
    TButton *sendButton = nullptr;
    std::string lastWindowTitle_;

    void newConversation();
    void sendPrompt();
    void cancelTurn();
    void copySelection();
    void configureTranscript();
    bool applySessionUpdates();
};
