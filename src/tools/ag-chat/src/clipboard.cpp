#include "clipboard.hpp"

#include <cstdlib>
#include <string>

#define Uses_TClipboard
#include <tvision/tv.h>

namespace clipboard
{
    namespace
    {
        bool osc52Likely()
        {
            const char *noOsc52 = std::getenv("NO_OSC52");
            if (noOsc52 && *noOsc52)
                return false;

            const char *term = std::getenv("TERM");
            if (!term)
                return false;

            std::string termStr(term);
            if (termStr == "dumb" || termStr == "linux")
                return false;

            for (const char *known : {"xterm", "tmux", "screen", "rxvt", "alacritty", "foot", "kitty", "wezterm"})
            {
                if (termStr.find(known) != std::string::npos)
                    return true;
            }
            return false;
        }
    } // namespace

    std::string statusMessage()
    {
        if (osc52Likely())
            return "Selection copied to clipboard.";
        if (std::getenv("TMUX"))
            return "Clipboard not supported - tmux needs OSC 52 configuration";
        return "Clipboard not supported by this terminal";
    }

    void copyToClipboard(const std::string &text)
    {
        TClipboard::setText(text.c_str());
    }
} // namespace clipboard
