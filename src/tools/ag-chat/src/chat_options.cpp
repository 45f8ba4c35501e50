#include "chat_options.hpp"

#include "ag/transcript/engine_settings.hpp"

#include <cstdint>

namespace ag::chat
{

void registerChatOptions(config::OptionRegistry &registry)
{
  transcript::register_engine_options(registry);

  registry.registerOption({kOptionToolsCollapsed, config::OptionKind::Boolean,
                           config::OptionValue(false), "Collapse Tool Calls",
                           "Show tool calls as a single title row."});

  config::OptionDefinition delay{kOptionReplyDelayMs, config::OptionKind::Integer,
                                 config::OptionValue(std::int64_t{30}), "Reply Delay",
                                 "Milliseconds between streamed chunks of the built-in agent."};
  delay.minimum = 0;
  delay.maximum = 2000;
  registry.registerOption(delay);
}

} // namespace ag::chat
