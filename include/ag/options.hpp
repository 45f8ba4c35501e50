#pragma once

#include <cstdint>
#include <filesystem>
#include <limits>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace ag::config
{

enum class OptionKind
{
    Boolean,
    Integer,
    String
};

enum class OptionValueType
{
    None,
    Boolean,
    Integer,
    String
};

class OptionValue
{
public:
    OptionValue() = default;
    OptionValue(bool value);
    OptionValue(std::int64_t value);
    OptionValue(std::string value);
    OptionValue(const char *value);

    OptionValueType type() const noexcept;

    bool isNull() const noexcept;
    bool toBool(bool fallback = false) const noexcept;
    std::int64_t toInteger(std::int64_t fallback = 0) const noexcept;
    std::string toString(const std::string &fallback = std::string()) const;

    bool operator==(const OptionValue &other) const noexcept;
    bool operator!=(const OptionValue &other) const noexcept { return !(*this == other); }

private:
    using Storage = std::variant<std::monostate, bool, std::int64_t, std::string>;
    static OptionValueType storageType(const Storage &storage) noexcept;
    Storage value;
};

struct OptionDefinition
{
    std::string key;
    OptionKind kind = OptionKind::String;
    OptionValue defaultValue;
    std::string displayName;
    std::string description;
    // Inclusive range, Integer options only.
    std::int64_t minimum = std::numeric_limits<std::int64_t>::min();
    std::int64_t maximum = std::numeric_limits<std::int64_t>::max();
};

class OptionRegistry
{
public:
    explicit OptionRegistry(std::string appId);

    const std::string &appId() const noexcept { return id; }

    void registerOption(const OptionDefinition &definition);
    bool hasOption(const std::string &key) const noexcept;

    void set(const std::string &key, const OptionValue &value);
    void reset(const std::string &key);

    OptionValue get(const std::string &key) const;
    bool getBool(const std::string &key, bool fallback = false) const;
    std::int64_t getInteger(const std::string &key, std::int64_t fallback = 0) const;
    std::string getString(const std::string &key, const std::string &fallback = std::string()) const;

    void resetToDefaults() noexcept;

    bool loadFromFile(const std::filesystem::path &filePath);
    bool saveToFile(const std::filesystem::path &filePath) const;

    bool loadDefaults();
    bool saveDefaults() const;
    std::filesystem::path defaultOptionsPath() const;

    std::vector<OptionDefinition> listRegisteredOptions() const;
    const OptionDefinition *definition(const std::string &key) const;

    static std::filesystem::path configRoot();

private:
    const OptionDefinition *findDefinition(const std::string &key) const;
    OptionValue normalizeValue(const OptionDefinition &definition, const OptionValue &value) const;

    std::string id;
    std::unordered_map<std::string, OptionDefinition> definitions;
    std::unordered_map<std::string, OptionValue> overrides;
};

} // namespace ag::config
