#pragma once

#include "ag/options.hpp"
#include "ag/transcript/engine_settings.hpp"

#include "../tvision_include.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

class ChatWindow;

class ChatApp : public TApplication
{
public:
  ChatApp(int argc, char **argv);

  virtual void handleEvent(TEvent &event) override;
  virtual void idle() override;

  TMenuBar *initMenuBar(TRect r);
  static TStatusLine *initStatusLine(TRect r);

  void registerWindow(ChatWindow *window);
  void unregisterWindow(ChatWindow *window);

  const ag::transcript::EngineSettings &engineSettings() const noexcept
  {
    return engineSettings_;
  }
  bool toolsCollapsed() const noexcept { return toolsCollapsed_; }
  std::chrono::milliseconds chunkDelay() const noexcept { return chunkDelay_; }

  void showStatus(const std::string &text);

private:
  void openChatWindow();
  void showAboutDialog();
  void rebuildMenuBar();
  void setToolsCollapsed(bool collapsed);
  void persistBoolOption(const std::string &key, bool value);

  std::vector<ChatWindow *> windows;
  int nextWindowNumber = 1;
  std::shared_ptr<ag::config::OptionRegistry> optionRegistry_;
  ag::transcript::EngineSettings engineSettings_;
  bool toolsCollapsed_ = false;
  std::chrono::milliseconds chunkDelay_{30};
  std::chrono::steady_clock::time_point lastSpinnerTick_{};
};
