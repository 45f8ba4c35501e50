#include "ag/debug_log.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace ag::log
{
namespace
{
struct Sink
{
    std::mutex mutex;
    std::ofstream stream;
    std::atomic<bool> active{false};
    bool initialized = false;
};

Sink &sink()
{
    static Sink instance;
    return instance;
}

void open_locked(Sink &s, const std::filesystem::path &path)
{
    if (s.stream.is_open())
        s.stream.close();
    s.active.store(false, std::memory_order_release);
    if (path.empty())
        return;
    s.stream.open(path, std::ios::app);
    if (!s.stream)
    {
        std::cerr << "[ag-chat] failed to open debug log at '" << path.string() << "'\n";
        return;
    }
    s.active.store(true, std::memory_order_release);
}

void ensure_initialized()
{
    auto &s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.initialized)
        return;
    s.initialized = true;
    const char *path = std::getenv("AG_CHAT_DEBUG_LOG");
    if (path && *path)
        open_locked(s, path);
}
} // namespace

bool enabled() noexcept
{
    auto &s = sink();
    if (!s.active.load(std::memory_order_acquire))
    {
        // First call picks up the environment.
        static std::once_flag once;
        std::call_once(once, ensure_initialized);
    }
    return s.active.load(std::memory_order_acquire);
}

void set_path(const std::filesystem::path &path)
{
    auto &s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.initialized = true;
    open_locked(s, path);
}

void debug(std::string_view category, std::string_view message)
{
    if (!enabled())
        return;
    auto &s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (!s.stream.is_open())
        return;
    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now().time_since_epoch())
                   .count();
    s.stream << '[' << std::setw(10) << now << "] [" << category << "] " << message;
    if (message.empty() || message.back() != '\n')
        s.stream << '\n';
    s.stream.flush();
}

} // namespace ag::log
