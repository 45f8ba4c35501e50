#include "ag/transcript/engine_settings.hpp"

#include <cstdint>

namespace ag::transcript {

namespace {
config::OptionDefinition integer_option(const char *key, std::int64_t value,
                                        std::int64_t minimum,
                                        std::int64_t maximum,
                                        const char *display_name,
                                        const char *description) {
  config::OptionDefinition definition{key, config::OptionKind::Integer,
                                      config::OptionValue(value), display_name,
                                      description};
  definition.minimum = minimum;
  definition.maximum = maximum;
  return definition;
}
} // namespace

void register_engine_options(config::OptionRegistry &registry) {
  registry.registerOption(integer_option(
      kOptionScrollSmoothingPercent, 30, 1, 100, "Scroll Smoothing",
      "Percent of the remaining distance the view scrolls per frame."));
  registry.registerOption(integer_option(
      kOptionCullingMargin, static_cast<std::int64_t>(kDefaultCullingMargin), 0,
      64, "Culling Margin",
      "Messages rendered above the first visible one."));
  registry.registerOption(integer_option(
      kOptionCullingSlackLines,
      static_cast<std::int64_t>(kDefaultCullingSlackLines), 0, 10000,
      "Culling Slack", "Extra rows rendered below the viewport."));
  registry.registerOption(integer_option(
      kOptionTerminalTailLines,
      static_cast<std::int64_t>(kDefaultTerminalTailLines), 1, 1000,
      "Terminal Tail", "Lines of command output shown per tool call."));
  registry.registerOption({kOptionShowWelcome, config::OptionKind::Boolean,
                           config::OptionValue(true), "Show Welcome",
                           "Display the welcome banner above the transcript."});
  registry.registerOption({kOptionDebugLogPath, config::OptionKind::String,
                           config::OptionValue(std::string()), "Debug Log",
                           "File receiving engine debug output."});
}

EngineSettings engine_settings_from(const config::OptionRegistry &registry) {
  EngineSettings settings;
  settings.scroll_smoothing =
      static_cast<float>(registry.getInteger(kOptionScrollSmoothingPercent, 30)) /
      100.0f;
  settings.culling_margin = static_cast<std::size_t>(registry.getInteger(
      kOptionCullingMargin, static_cast<std::int64_t>(kDefaultCullingMargin)));
  settings.culling_slack_lines = static_cast<std::size_t>(
      registry.getInteger(kOptionCullingSlackLines,
                          static_cast<std::int64_t>(kDefaultCullingSlackLines)));
  settings.terminal_tail_lines = static_cast<std::size_t>(
      registry.getInteger(kOptionTerminalTailLines,
                          static_cast<std::int64_t>(kDefaultTerminalTailLines)));
  settings.show_welcome = registry.getBool(kOptionShowWelcome, true);
  settings.debug_log_path = registry.getString(kOptionDebugLogPath);
  return settings;
}

} // namespace ag::transcript
