#include "ag/debug_log.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <gtest/gtest.h>

namespace
{
std::filesystem::path temp_log_path()
{
    return std::filesystem::temp_directory_path() /
           ("ag-debug-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".log");
}

std::string read_file(const std::filesystem::path &path)
{
    std::ifstream in(path);
    std::ostringstream contents;
    contents << in.rdbuf();
    return contents.str();
}
} // namespace

TEST(DebugLogTests, WritesCategorizedLinesWhenEnabled)
{
    auto path = temp_log_path();
    ag::log::set_path(path);
    ASSERT_TRUE(ag::log::enabled());

    ag::log::debug("terminal", "output shrank");
    ag::log::debug("prefix", "full rebuild\n");
    ag::log::set_path({});

    auto contents = read_file(path);
    EXPECT_NE(contents.find("[terminal] output shrank\n"), std::string::npos);
    EXPECT_NE(contents.find("[prefix] full rebuild\n"), std::string::npos);
    EXPECT_EQ(contents.find("\n\n"), std::string::npos);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST(DebugLogTests, EmptyPathDisablesLogging)
{
    auto path = temp_log_path();
    ag::log::set_path(path);
    ag::log::set_path({});
    EXPECT_FALSE(ag::log::enabled());

    ag::log::debug("terminal", "dropped");
    EXPECT_EQ(read_file(path).find("dropped"), std::string::npos);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}
