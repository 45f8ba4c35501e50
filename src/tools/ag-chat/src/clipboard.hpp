#pragma once

#include <string>

namespace clipboard
{
    // Human readable result of the last copy, depends on terminal support.
    std::string statusMessage();
    void copyToClipboard(const std::string &text);
} // namespace clipboard
