#include "ag/options.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

namespace ag::config
{
namespace
{
bool parseBool(const std::string &value, bool fallback)
{
    std::string lower;
    lower.reserve(value.size());
    for (char ch : value)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on")
        return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off")
        return false;
    return fallback;
}

std::int64_t parseInteger(const std::string &value, std::int64_t fallback)
{
    std::int64_t parsed = 0;
    const char *begin = value.data();
    const char *end = value.data() + value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(*begin)))
        ++begin;
    auto rc = std::from_chars(begin, end, parsed);
    if (rc.ec == std::errc() && rc.ptr == end)
        return parsed;
    return fallback;
}

nlohmann::json toJson(const OptionValue &value)
{
    switch (value.type())
    {
    case OptionValueType::Boolean:
        return value.toBool();
    case OptionValueType::Integer:
        return value.toInteger();
    case OptionValueType::String:
        return value.toString();
    case OptionValueType::None:
    default:
        return nlohmann::json();
    }
}

OptionValue fromJson(const OptionDefinition &definition, const nlohmann::json &jsonValue)
{
    switch (definition.kind)
    {
    case OptionKind::Boolean:
        if (jsonValue.is_boolean())
            return OptionValue(jsonValue.get<bool>());
        if (jsonValue.is_number_integer())
            return OptionValue(jsonValue.get<std::int64_t>() != 0);
        if (jsonValue.is_string())
            return OptionValue(parseBool(jsonValue.get<std::string>(), definition.defaultValue.toBool()));
        break;
    case OptionKind::Integer:
        if (jsonValue.is_number_integer())
            return OptionValue(jsonValue.get<std::int64_t>());
        if (jsonValue.is_number_float())
            return OptionValue(static_cast<std::int64_t>(jsonValue.get<double>()));
        if (jsonValue.is_string())
            return OptionValue(parseInteger(jsonValue.get<std::string>(), definition.defaultValue.toInteger()));
        break;
    case OptionKind::String:
        if (jsonValue.is_string())
            return OptionValue(jsonValue.get<std::string>());
        if (jsonValue.is_boolean())
            return OptionValue(jsonValue.get<bool>() ? std::string("true") : std::string("false"));
        if (jsonValue.is_number_integer())
            return OptionValue(std::to_string(jsonValue.get<std::int64_t>()));
        break;
    }
    return definition.defaultValue;
}

std::filesystem::path detectConfigRoot()
{
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME"))
    {
        std::filesystem::path path(xdg);
        if (!path.empty())
            return path / "ag-tools";
    }
    if (const char *home = std::getenv("HOME"))
    {
        std::filesystem::path path(home);
        if (!path.empty())
            return path / ".config" / "ag-tools";
    }
    return std::filesystem::path(".config") / "ag-tools";
}

} // namespace

OptionValue::OptionValue(bool value)
    : value(value)
{
}

OptionValue::OptionValue(std::int64_t value)
    : value(value)
{
}

OptionValue::OptionValue(std::string value)
    : value(std::move(value))
{
}

OptionValue::OptionValue(const char *value)
    : value(std::string(value ? value : ""))
{
}

OptionValueType OptionValue::type() const noexcept
{
    return storageType(value);
}

bool OptionValue::isNull() const noexcept
{
    return std::holds_alternative<std::monostate>(value);
}

bool OptionValue::toBool(bool fallback) const noexcept
{
    if (auto *ptr = std::get_if<bool>(&value))
        return *ptr;
    if (auto *iptr = std::get_if<std::int64_t>(&value))
        return *iptr != 0;
    if (auto *sptr = std::get_if<std::string>(&value))
        return parseBool(*sptr, fallback);
    return fallback;
}

std::int64_t OptionValue::toInteger(std::int64_t fallback) const noexcept
{
    if (auto *iptr = std::get_if<std::int64_t>(&value))
        return *iptr;
    if (auto *bptr = std::get_if<bool>(&value))
        return *bptr ? 1 : 0;
    if (auto *sptr = std::get_if<std::string>(&value))
        return parseInteger(*sptr, fallback);
    return fallback;
}

std::string OptionValue::toString(const std::string &fallback) const
{
    if (auto *sptr = std::get_if<std::string>(&value))
        return *sptr;
    if (auto *bptr = std::get_if<bool>(&value))
        return *bptr ? "true" : "false";
    if (auto *iptr = std::get_if<std::int64_t>(&value))
        return std::to_string(*iptr);
    return fallback;
}

bool OptionValue::operator==(const OptionValue &other) const noexcept
{
    return value == other.value;
}

OptionValueType OptionValue::storageType(const OptionValue::Storage &storage) noexcept
{
    switch (storage.index())
    {
    case 1:
        return OptionValueType::Boolean;
    case 2:
        return OptionValueType::Integer;
    case 3:
        return OptionValueType::String;
    default:
        return OptionValueType::None;
    }
}

OptionRegistry::OptionRegistry(std::string appId)
    : id(std::move(appId))
{
}

void OptionRegistry::registerOption(const OptionDefinition &definition)
{
    definitions[definition.key] = definition;
    auto it = overrides.find(definition.key);
    if (it != overrides.end())
        it->second = normalizeValue(definition, it->second);
}

bool OptionRegistry::hasOption(const std::string &key) const noexcept
{
    return definitions.find(key) != definitions.end();
}

void OptionRegistry::set(const std::string &key, const OptionValue &value)
{
    const OptionDefinition *definition = findDefinition(key);
    if (!definition)
        return;
    overrides[key] = normalizeValue(*definition, value);
}

void OptionRegistry::reset(const std::string &key)
{
    overrides.erase(key);
}

OptionValue OptionRegistry::get(const std::string &key) const
{
    auto overrideIt = overrides.find(key);
    if (overrideIt != overrides.end())
        return overrideIt->second;
    const OptionDefinition *definition = findDefinition(key);
    if (definition)
        return definition->defaultValue;
    return OptionValue();
}

bool OptionRegistry::getBool(const std::string &key, bool fallback) const
{
    return get(key).toBool(fallback);
}

std::int64_t OptionRegistry::getInteger(const std::string &key, std::int64_t fallback) const
{
    return get(key).toInteger(fallback);
}

std::string OptionRegistry::getString(const std::string &key, const std::string &fallback) const
{
    return get(key).toString(fallback);
}

void OptionRegistry::resetToDefaults() noexcept
{
    overrides.clear();
}

bool OptionRegistry::loadFromFile(const std::filesystem::path &filePath)
{
    std::ifstream in(filePath);
    if (!in)
        return false;

    nlohmann::json data = nlohmann::json::parse(in, nullptr, false);
    if (data.is_discarded() || !data.is_object())
        return false;

    for (auto it = data.begin(); it != data.end(); ++it)
    {
        const OptionDefinition *definition = findDefinition(it.key());
        if (!definition || it.value().is_null())
            continue;
        overrides[it.key()] = normalizeValue(*definition, fromJson(*definition, it.value()));
    }

    return true;
}

bool OptionRegistry::saveToFile(const std::filesystem::path &filePath) const
{
    nlohmann::json data = nlohmann::json::object();
    for (const auto &[key, definition] : definitions)
    {
        (void)definition;
        data[key] = toJson(get(key));
    }

    std::error_code ec;
    if (filePath.has_parent_path())
        std::filesystem::create_directories(filePath.parent_path(), ec);

    std::ofstream out(filePath);
    if (!out)
        return false;
    out << data.dump(2) << std::endl;
    return static_cast<bool>(out);
}

bool OptionRegistry::loadDefaults()
{
    std::filesystem::path path = defaultOptionsPath();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return false;
    return loadFromFile(path);
}

bool OptionRegistry::saveDefaults() const
{
    return saveToFile(defaultOptionsPath());
}

std::filesystem::path OptionRegistry::defaultOptionsPath() const
{
    return configRoot() / id / "defaults.json";
}

std::vector<OptionDefinition> OptionRegistry::listRegisteredOptions() const
{
    std::vector<OptionDefinition> result;
    result.reserve(definitions.size());
    for (const auto &[key, definition] : definitions)
    {
        (void)key;
        result.push_back(definition);
    }
    std::sort(result.begin(), result.end(), [](const OptionDefinition &a, const OptionDefinition &b)
              { return a.key < b.key; });
    return result;
}

const OptionDefinition *OptionRegistry::definition(const std::string &key) const
{
    return findDefinition(key);
}

std::filesystem::path OptionRegistry::configRoot()
{
    return detectConfigRoot();
}

const OptionDefinition *OptionRegistry::findDefinition(const std::string &key) const
{
    auto it = definitions.find(key);
    if (it == definitions.end())
        return nullptr;
    return &it->second;
}

OptionValue OptionRegistry::normalizeValue(const OptionDefinition &definition, const OptionValue &value) const
{
    switch (definition.kind)
    {
    case OptionKind::Boolean:
        return OptionValue(value.toBool(definition.defaultValue.toBool()));
    case OptionKind::Integer:
    {
        std::int64_t parsed = value.toInteger(definition.defaultValue.toInteger());
        return OptionValue(std::clamp(parsed, definition.minimum, definition.maximum));
    }
    case OptionKind::String:
        return OptionValue(value.toString(definition.defaultValue.toString()));
    }
    return definition.defaultValue;
}

} // namespace ag::config
