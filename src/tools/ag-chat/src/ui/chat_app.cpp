#include "chat_app.hpp"
#include "../commands.hpp"
#include "chat_options.hpp"
#include "chat_window.hpp"

#include "ag/debug_log.hpp"

#include <algorithm>
#include <string>

namespace
{
  constexpr auto kSpinnerInterval = std::chrono::milliseconds(100);
} // namespace

ChatApp::ChatApp(int argc, char **argv)
    : TProgInit(&ChatApp::initStatusLine, nullptr, &TApplication::initDeskTop)
{
  (void)argc;
  (void)argv;

  optionRegistry_ = std::make_shared<ag::config::OptionRegistry>("ag-chat");
  ag::chat::registerChatOptions(*optionRegistry_);
  optionRegistry_->loadDefaults();

  engineSettings_ = ag::transcript::engine_settings_from(*optionRegistry_);
  toolsCollapsed_ =
      optionRegistry_->getBool(ag::chat::kOptionToolsCollapsed, false);
  chunkDelay_ = std::chrono::milliseconds(
      optionRegistry_->getInteger(ag::chat::kOptionReplyDelayMs, 30));

  // The environment variable wins over the stored path.
  if (!engineSettings_.debug_log_path.empty() && !ag::log::enabled())
    ag::log::set_path(engineSettings_.debug_log_path);

  rebuildMenuBar();
  openChatWindow();
}

void ChatApp::registerWindow(ChatWindow *window)
{
  if (!window)
    return;
  windows.push_back(window);
}

void ChatApp::unregisterWindow(ChatWindow *window)
{
  windows.erase(std::remove(windows.begin(), windows.end(), window),
                windows.end());
}

void ChatApp::openChatWindow()
{
  if (!deskTop)
    return;

  TRect bounds = deskTop->getExtent();
  bounds.grow(-2, -1);
  if (bounds.b.x <= bounds.a.x + 10 || bounds.b.y <= bounds.a.y + 5)
    bounds = TRect(0, 0, 70, 20);

  auto *window = new ChatWindow(*this, bounds, nextWindowNumber++);
  deskTop->insert(window);
  window->refreshWindowTitle();
  window->select();
}

void ChatApp::handleEvent(TEvent &event)
{
  TApplication::handleEvent(event);
  if (event.what != evCommand)
    return;

  switch (event.message.command)
  {
  case cmNewChat:
    openChatWindow();
    clearEvent(event);
    break;
  case cmCollapseTools:
    setToolsCollapsed(true);
    clearEvent(event);
    break;
  case cmExpandTools:
    setToolsCollapsed(false);
    clearEvent(event);
    break;
  case cmAbout:
    showAboutDialog();
    clearEvent(event);
    break;
  default:
    break;
  }
}

void ChatApp::idle()
{
  TApplication::idle();

  auto now = std::chrono::steady_clock::now();
  bool spinnerTick = now - lastSpinnerTick_ >= kSpinnerInterval;
  if (spinnerTick)
    lastSpinnerTick_ = now;

  for (auto *window : windows)
  {
    if (window)
      window->processPendingUpdates(spinnerTick);
  }
}

TMenuBar *ChatApp::initMenuBar(TRect r)
{
  r.b.y = r.a.y + 1;

  TSubMenu &fileMenu =
      *new TSubMenu("~F~ile", hcNoContext) +
      *new TMenuItem("~N~ew Chat", cmNewChat, kbCtrlN, hcNoContext, "Ctrl-N") +
      *new TMenuItem("C~l~ear Chat", cmClearChat, kbNoKey, hcNoContext) +
      *new TMenuItem("~C~lose Window", cmClose, kbAltF3, hcNoContext, "Alt-F3") +
      newLine() +
      *new TMenuItem("E~x~it", cmQuit, kbAltX, hcNoContext, "Alt-X");

  TSubMenu &editMenu =
      *new TSubMenu("~E~dit", hcNoContext) +
      *new TMenuItem("~C~opy Selection", cmCopySelection, kbNoKey, hcNoContext,
                     "Ctrl-Ins");

  TSubMenu &agentMenu =
      *new TSubMenu("~A~gent", hcNoContext) +
      *new TMenuItem("~S~end Prompt", cmSendPrompt, kbNoKey, hcNoContext,
                     "Enter") +
      *new TMenuItem("~C~ancel Turn", cmCancelTurn, kbCtrlK, hcNoContext,
                     "Ctrl-K");

  TSubMenu &viewMenu = *new TSubMenu("~V~iew", hcNoContext);
  if (toolsCollapsed_)
    viewMenu + *new TMenuItem("~E~xpand Tool Calls", cmExpandTools, kbNoKey,
                              hcNoContext);
  else
    viewMenu + *new TMenuItem("C~o~llapse Tool Calls", cmCollapseTools,
                              kbNoKey, hcNoContext);
  viewMenu + newLine() +
      *new TMenuItem("Scroll to ~T~op", cmScrollTop, kbNoKey, hcNoContext,
                     "Home") +
      *new TMenuItem("Scroll to ~B~ottom", cmScrollBottom, kbNoKey,
                     hcNoContext, "End");

  TSubMenu &windowMenu =
      *new TSubMenu("~W~indow", hcNoContext) +
      *new TMenuItem("~Z~oom", cmZoom, kbF5, hcNoContext, "F5") +
      *new TMenuItem("~N~ext", cmNext, kbF6, hcNoContext, "F6") +
      *new TMenuItem("~T~ile", cmTile, kbNoKey, hcNoContext) +
      *new TMenuItem("C~a~scade", cmCascade, kbNoKey, hcNoContext);

  TMenuItem &menuChain =
      fileMenu + editMenu + agentMenu + viewMenu + windowMenu +
      *new TSubMenu("~H~elp", hcNoContext) +
      *new TMenuItem("~A~bout", cmAbout, kbNoKey, hcNoContext);

  return new TMenuBar(r, static_cast<TSubMenu &>(menuChain));
}

TStatusLine *ChatApp::initStatusLine(TRect r)
{
  r.a.y = r.b.y - 1;
  return new TStatusLine(
      r, *new TStatusDef(0, 0xFFFF) +
             *new TStatusItem("~Ctrl-N~ New Chat", kbCtrlN, cmNewChat) +
             *new TStatusItem("~Ctrl-K~ Cancel", kbCtrlK, cmCancelTurn) +
             *new TStatusItem("~Alt-F3~ Close", kbAltF3, cmClose) +
             *new TStatusItem("~Alt-X~ Quit", kbAltX, cmQuit));
}

void ChatApp::rebuildMenuBar()
{
  if (!deskTop)
    return;

  TRect bounds;
  if (TProgram::menuBar)
    bounds = TProgram::menuBar->getBounds();
  else
  {
    bounds = getExtent();
    bounds.b.y = bounds.a.y + 1;
  }

  if (TProgram::menuBar)
  {
    TMenuBar *oldBar = TProgram::menuBar;
    remove(oldBar);
    TObject::destroy(oldBar);
  }

  TMenuBar *newBar = initMenuBar(bounds);
  if (newBar)
  {
    insert(newBar);
    TProgram::menuBar = newBar;
    newBar->drawView();
  }
}

void ChatApp::showAboutDialog()
{
#ifdef AG_CHAT_VERSION
  std::string version = AG_CHAT_VERSION;
#else
  std::string version = "dev";
#endif
  std::string text = "\003ag-chat " + version +
                     "\n\n\003Terminal transcript for an AI coding agent.";
  messageBox(text.c_str(), mfInformation | mfOKButton);
}

void ChatApp::showStatus(const std::string &text)
{
  messageBox(text.c_str(), mfInformation | mfOKButton);
}

void ChatApp::setToolsCollapsed(bool collapsed)
{
  if (toolsCollapsed_ == collapsed)
    return;
  toolsCollapsed_ = collapsed;
  persistBoolOption(ag::chat::kOptionToolsCollapsed, toolsCollapsed_);
  for (auto *window : windows)
  {
    if (window)
      window->setToolsCollapsed(collapsed);
  }
  rebuildMenuBar();
}

void ChatApp::persistBoolOption(const std::string &key, bool value)
{
  if (!optionRegistry_)
    return;
  ag::config::OptionValue desired(value);
  if (optionRegistry_->get(key) == desired)
    return;
  optionRegistry_->set(key, desired);
  if (!optionRegistry_->saveDefaults())
    ag::log::debug("options", "cannot save " +
                                  optionRegistry_->defaultOptionsPath().string());
}
