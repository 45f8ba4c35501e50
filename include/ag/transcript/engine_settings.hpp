#pragma once

#include "ag/options.hpp"
#include "ag/transcript/scroll_controller.hpp"
#include "ag/transcript/tool_call_view.hpp"
#include "ag/transcript/viewport_culler.hpp"

#include <cstddef>
#include <string>

namespace ag::transcript {

inline constexpr char kOptionScrollSmoothingPercent[] = "scrollSmoothingPercent";
inline constexpr char kOptionCullingMargin[] = "cullingMargin";
inline constexpr char kOptionCullingSlackLines[] = "cullingSlackLines";
inline constexpr char kOptionTerminalTailLines[] = "terminalTailLines";
inline constexpr char kOptionShowWelcome[] = "showWelcome";
inline constexpr char kOptionDebugLogPath[] = "debugLogPath";

struct EngineSettings {
  float scroll_smoothing = kDefaultScrollSmoothing;
  std::size_t culling_margin = kDefaultCullingMargin;
  std::size_t culling_slack_lines = kDefaultCullingSlackLines;
  std::size_t terminal_tail_lines = kDefaultTerminalTailLines;
  bool show_welcome = true;
  std::string debug_log_path;
};

void register_engine_options(config::OptionRegistry &registry);

EngineSettings engine_settings_from(const config::OptionRegistry &registry);

} // namespace ag::transcript
