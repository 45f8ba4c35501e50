#include "agent_session.hpp"
#include "chat_options.hpp"

#include "ag/debug_log.hpp"
#include "ag/options.hpp"
#include "ag/transcript/chat_renderer.hpp"
#include "ag/transcript/engine_settings.hpp"

#include "ui/chat_app.hpp"

#include <charconv>
#include <chrono>
#include <csignal>
#include <exception>
#include <execinfo.h>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <variant>

namespace
{
    void crash_handler(int sig, siginfo_t *, void *)
    {
        void *frames[64];
        int count = backtrace(frames, 64);
        backtrace_symbols_fd(frames, count, STDERR_FILENO);
        _exit(128 + sig);
    }

    void install_crash_handlers()
    {
        struct sigaction action {};
        sigemptyset(&action.sa_mask);
        action.sa_flags = SA_SIGINFO | SA_RESETHAND;
        action.sa_sigaction = crash_handler;
        sigaction(SIGSEGV, &action, nullptr);
        sigaction(SIGABRT, &action, nullptr);
    }

    bool is_help_flag(std::string_view arg)
    {
        return arg == "--help" || arg == "-h";
    }

    std::optional<int> parse_dimension(std::string_view text)
    {
        int value = 0;
        auto rc = std::from_chars(text.data(), text.data() + text.size(), value);
        if (rc.ec != std::errc() || rc.ptr != text.data() + text.size() || value < 1 || value > 4096)
            return std::nullopt;
        return value;
    }

    struct CliOptions
    {
        bool showHelp = false;
        bool invalid = false;
        std::optional<std::string> prompt;
        int width = 80;
        int height = 24;
    };

    CliOptions parse_cli(int argc, char **argv)
    {
        CliOptions options;
        for (int i = 1; i < argc; ++i)
        {
            std::string_view arg(argv[i]);
            if (is_help_flag(arg))
            {
                options.showHelp = true;
                continue;
            }
            if (arg == "--prompt" && i + 1 < argc)
            {
                options.prompt = std::string(argv[++i]);
                continue;
            }
            if ((arg == "--width" || arg == "--height") && i + 1 < argc)
            {
                auto value = parse_dimension(argv[++i]);
                if (!value)
                    options.invalid = true;
                else if (arg == "--width")
                    options.width = *value;
                else
                    options.height = *value;
                continue;
            }
            options.invalid = true;
        }
        return options;
    }

    void print_usage(const char *executable)
    {
        std::cout << "Usage: " << executable << " [--prompt <TEXT> [--width N] [--height N]]\n";
        std::cout << "Without --prompt the Turbo Vision interface starts.\n";
        std::cout << "With --prompt one turn runs headless and its final frame is printed.\n";
        std::cout << "Prefix the prompt with ! to run it as a shell command.\n";
        std::cout << "Set AG_CHAT_DEBUG_LOG to a file path to enable the debug log." << std::endl;
    }

    int run_cli(const CliOptions &options)
    {
        ag::config::OptionRegistry registry("ag-chat");
        ag::chat::registerChatOptions(registry);
        registry.loadDefaults();
        auto settings = ag::transcript::engine_settings_from(registry);
        if (!settings.debug_log_path.empty() && !ag::log::enabled())
            ag::log::set_path(settings.debug_log_path);

        ag::transcript::Transcript transcript;
        transcript.set_tools_collapsed(registry.getBool(ag::chat::kOptionToolsCollapsed, false));
        ag::transcript::ChatRenderer renderer(settings);
        ag::chat::AgentSession session;
        session.setChunkDelay(std::chrono::milliseconds(0));
        session.startTurn(*options.prompt);

        while (true)
        {
            bool running = session.turnInProgress();
            for (auto &update : session.takeUpdates())
            {
                if (auto *attached = std::get_if<ag::chat::TerminalAttached>(&update))
                    transcript.attach_terminal(attached->terminalId, std::move(attached->buffer));
                else if (!transcript.apply_event(std::get<ag::transcript::TranscriptEvent>(update)))
                    ag::log::debug("chat", "event for an unknown tool call dropped");
            }
            transcript.update_terminal_outputs();
            if (!running)
                break;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        auto height = static_cast<std::size_t>(options.height);
        auto output = renderer.render(transcript, static_cast<std::uint16_t>(options.width), height);
        // Let the smoothed scroll settle on the bottom before printing.
        for (int frame = 0; frame < 1000 && transcript.scroll().animating(); ++frame)
            output = renderer.render(transcript, static_cast<std::uint16_t>(options.width), height);

        for (const auto &row : ag::transcript::visible_window(output, height))
            std::cout << row << '\n';
        std::cout.flush();
        return transcript.status() == ag::transcript::AgentStatus::Error ? 1 : 0;
    }

} // namespace

int main(int argc, char **argv)
{
    install_crash_handlers();

    CliOptions options = parse_cli(argc, argv);
    if (options.showHelp || options.invalid)
    {
        print_usage(argc > 0 ? argv[0] : "ag-chat");
        return options.invalid ? 2 : 0;
    }

    try
    {
        if (options.prompt)
            return run_cli(options);

        ChatApp app(argc, argv);
        app.run();
        app.shutDown();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ag-chat: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
