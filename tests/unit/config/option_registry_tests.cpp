#include <gtest/gtest.h>

#include "ag/options.hpp"
#include "ag/transcript/engine_settings.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace
{

std::filesystem::path makeTempFilePath()
{
    auto base = std::filesystem::temp_directory_path();
    std::random_device rd;
    std::mt19937_64 rng(rd());
    std::uniform_int_distribution<std::uint64_t> dist;
    for (int attempt = 0; attempt < 8; ++attempt)
    {
        auto candidate = base / ("ag_options_test_" + std::to_string(dist(rng)) + ".json");
        if (!std::filesystem::exists(candidate))
            return candidate;
    }
    return base / "ag_options_test.json";
}

ag::config::OptionDefinition rangedOption(const char *key, std::int64_t value, std::int64_t minimum,
                                          std::int64_t maximum)
{
    ag::config::OptionDefinition def{key, ag::config::OptionKind::Integer, ag::config::OptionValue(value), key,
                                     "Ranged integer"};
    def.minimum = minimum;
    def.maximum = maximum;
    return def;
}

} // namespace

TEST(OptionRegistry, RegistersAndReadsDefaults)
{
    ag::config::OptionRegistry registry("test-app");
    ag::config::OptionDefinition def{"featureEnabled", ag::config::OptionKind::Boolean, ag::config::OptionValue(true),
                                     "Feature Enabled", "Enables a feature for testing."};
    registry.registerOption(def);

    EXPECT_TRUE(registry.hasOption("featureEnabled"));
    EXPECT_TRUE(registry.getBool("featureEnabled"));

    registry.set("featureEnabled", ag::config::OptionValue(false));
    EXPECT_FALSE(registry.getBool("featureEnabled"));

    registry.reset("featureEnabled");
    EXPECT_TRUE(registry.getBool("featureEnabled"));
}

TEST(OptionRegistry, NormalizesValuesToDefinitionTypes)
{
    ag::config::OptionRegistry registry("test-app");
    registry.registerOption({"threshold", ag::config::OptionKind::Integer, ag::config::OptionValue(std::int64_t{10}),
                             "Threshold", "Integer threshold"});
    registry.registerOption({"ignored", ag::config::OptionKind::Boolean, ag::config::OptionValue(false),
                             "Ignored", "Boolean flag"});

    registry.set("threshold", ag::config::OptionValue(std::string("42")));
    registry.set("ignored", ag::config::OptionValue(std::string("yes")));

    EXPECT_EQ(registry.getInteger("threshold"), 42);
    EXPECT_TRUE(registry.getBool("ignored"));

    registry.set("threshold", ag::config::OptionValue(std::string("not a number")));
    EXPECT_EQ(registry.getInteger("threshold"), 10);
}

TEST(OptionRegistry, IgnoresUnknownKeys)
{
    ag::config::OptionRegistry registry("test-app");
    registry.set("missing", ag::config::OptionValue(true));
    EXPECT_FALSE(registry.hasOption("missing"));
    EXPECT_TRUE(registry.get("missing").isNull());
}

TEST(OptionRegistry, ClampsIntegersIntoRange)
{
    ag::config::OptionRegistry registry("test-app");
    registry.registerOption(rangedOption("margin", 2, 0, 64));

    registry.set("margin", ag::config::OptionValue(std::int64_t{500}));
    EXPECT_EQ(registry.getInteger("margin"), 64);

    registry.set("margin", ag::config::OptionValue(std::int64_t{-3}));
    EXPECT_EQ(registry.getInteger("margin"), 0);
}

TEST(OptionRegistry, PersistsValuesToDisk)
{
    ag::config::OptionRegistry registry("test-app");
    registry.registerOption({"logPath", ag::config::OptionKind::String, ag::config::OptionValue(std::string()),
                             "Log Path", "Where to log"});
    registry.registerOption(rangedOption("tail", 12, 1, 1000));

    registry.set("logPath", ag::config::OptionValue("/tmp/ag.log"));
    registry.set("tail", ag::config::OptionValue(std::int64_t{40}));

    const auto filePath = makeTempFilePath();
    ASSERT_TRUE(registry.saveToFile(filePath));

    ag::config::OptionRegistry loaded("test-app");
    loaded.registerOption({"logPath", ag::config::OptionKind::String, ag::config::OptionValue(std::string()),
                           "Log Path", "Where to log"});
    loaded.registerOption(rangedOption("tail", 12, 1, 1000));
    ASSERT_TRUE(loaded.loadFromFile(filePath));

    EXPECT_EQ(loaded.getString("logPath"), "/tmp/ag.log");
    EXPECT_EQ(loaded.getInteger("tail"), 40);

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
}

TEST(OptionRegistry, RejectsMalformedFiles)
{
    ag::config::OptionRegistry registry("test-app");
    registry.registerOption(rangedOption("tail", 12, 1, 1000));

    const auto filePath = makeTempFilePath();
    {
        std::ofstream out(filePath);
        out << "{ \"tail\": 30, ";
    }
    EXPECT_FALSE(registry.loadFromFile(filePath));
    EXPECT_EQ(registry.getInteger("tail"), 12);

    {
        std::ofstream out(filePath);
        out << "[1, 2, 3]";
    }
    EXPECT_FALSE(registry.loadFromFile(filePath));
    EXPECT_FALSE(registry.loadFromFile(filePath.string() + ".missing"));

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
}

TEST(OptionRegistry, LoadedValuesAreClamped)
{
    ag::config::OptionRegistry registry("test-app");
    registry.registerOption(rangedOption("tail", 12, 1, 1000));

    const auto filePath = makeTempFilePath();
    {
        std::ofstream out(filePath);
        out << "{ \"tail\": 99999, \"unknown\": true }";
    }
    ASSERT_TRUE(registry.loadFromFile(filePath));
    EXPECT_EQ(registry.getInteger("tail"), 1000);
    EXPECT_FALSE(registry.hasOption("unknown"));

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
}

TEST(OptionRegistry, EngineOptionsConvertToSettings)
{
    ag::config::OptionRegistry registry("ag-chat");
    ag::transcript::register_engine_options(registry);

    auto defaults = ag::transcript::engine_settings_from(registry);
    EXPECT_FLOAT_EQ(defaults.scroll_smoothing, 0.3f);
    EXPECT_EQ(defaults.culling_margin, 2u);
    EXPECT_EQ(defaults.culling_slack_lines, 100u);
    EXPECT_EQ(defaults.terminal_tail_lines, 12u);
    EXPECT_TRUE(defaults.show_welcome);
    EXPECT_TRUE(defaults.debug_log_path.empty());

    registry.set(ag::transcript::kOptionScrollSmoothingPercent, ag::config::OptionValue(std::int64_t{0}));
    registry.set(ag::transcript::kOptionTerminalTailLines, ag::config::OptionValue(std::string("5")));
    registry.set(ag::transcript::kOptionShowWelcome, ag::config::OptionValue("off"));

    auto changed = ag::transcript::engine_settings_from(registry);
    EXPECT_FLOAT_EQ(changed.scroll_smoothing, 0.01f);
    EXPECT_EQ(changed.terminal_tail_lines, 5u);
    EXPECT_FALSE(changed.show_welcome);
}
