#pragma once

#include "ag/options.hpp"

namespace ag::chat
{

inline constexpr char kOptionToolsCollapsed[] = "toolsCollapsed";
inline constexpr char kOptionReplyDelayMs[] = "replyDelayMs";

// Registers the engine options plus the options owned by the chat front end.
void registerChatOptions(config::OptionRegistry &registry);

} // namespace ag::chat
