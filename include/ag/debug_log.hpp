#pragma once

#include <filesystem>
#include <string_view>

namespace ag::log
{

// Debug log sink. Disabled unless AG_CHAT_DEBUG_LOG names a file or a path is
// set explicitly. Safe to call from any thread.
bool enabled() noexcept;

// An empty path disables logging. Reopens the sink in append mode.
void set_path(const std::filesystem::path &path);

void debug(std::string_view category, std::string_view message);

} // namespace ag::log
