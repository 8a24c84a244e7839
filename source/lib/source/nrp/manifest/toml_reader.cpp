#include <nrp/manifest/toml_reader.hpp>

#include <algorithm>
#include <limits>

#include <fmt/format.h>

#include <nrp/errors.hpp>

TomlTableReader::TomlTableReader(const toml::table& table,
                                 std::string context,
                                 std::initializer_list<std::string_view> allowed_keys)
    : m_Table{ table }
    , m_Context{ std::move(context) }
{
    for (auto&& [key, value] : m_Table)
    {
        if (!std::ranges::contains(allowed_keys, key.str()))
        {
            throw LoadError{ fmt::format("{}: unknown field `{}`", m_Context, key.str()) };
        }
    }
}

bool TomlTableReader::Has(std::string_view key) const
{
    return m_Table.contains(key);
}

std::string TomlTableReader::RequireString(std::string_view key) const
{
    if (!Has(key))
    {
        Fail(key, "is missing");
    }
    return OptionalString(key).value();
}

std::optional<std::string> TomlTableReader::OptionalString(std::string_view key) const
{
    const toml::node* node{ m_Table.get(key) };
    if (node == nullptr)
    {
        return std::nullopt;
    }
    if (!node->is_string())
    {
        Fail(key, "must be a string");
    }
    return node->value<std::string>();
}

std::string TomlTableReader::RequireId(std::string_view key) const
{
    const toml::node* node{ m_Table.get(key) };
    if (node == nullptr)
    {
        Fail(key, "is missing");
    }
    if (node->is_integer())
    {
        return fmt::format("{}", node->value<int64_t>().value());
    }
    if (!node->is_string())
    {
        Fail(key, "must be a string");
    }

    std::string id{ node->value<std::string>().value() };
    if (id.empty())
    {
        Fail(key, "must not be empty");
    }
    return id;
}

uint32_t TomlTableReader::RequireUnsigned(std::string_view key) const
{
    if (!Has(key))
    {
        Fail(key, "is missing");
    }
    return OptionalUnsigned(key).value();
}

std::optional<uint32_t> TomlTableReader::OptionalUnsigned(std::string_view key) const
{
    const toml::node* node{ m_Table.get(key) };
    if (node == nullptr)
    {
        return std::nullopt;
    }
    if (!node->is_integer())
    {
        Fail(key, "must be an integer");
    }

    const int64_t value{ node->value<int64_t>().value() };
    if (value < 0 || value > std::numeric_limits<uint32_t>::max())
    {
        Fail(key, "is out of range");
    }
    return static_cast<uint32_t>(value);
}

std::optional<bool> TomlTableReader::OptionalBool(std::string_view key) const
{
    const toml::node* node{ m_Table.get(key) };
    if (node == nullptr)
    {
        return std::nullopt;
    }
    if (!node->is_boolean())
    {
        Fail(key, "must be a boolean");
    }
    return node->value<bool>();
}

std::optional<std::vector<std::string>> TomlTableReader::OptionalStringArray(std::string_view key) const
{
    const toml::node* node{ m_Table.get(key) };
    if (node == nullptr)
    {
        return std::nullopt;
    }

    const toml::array* array{ node->as_array() };
    if (array == nullptr)
    {
        Fail(key, "must be an array of strings");
    }

    std::vector<std::string> strings;
    strings.reserve(array->size());
    for (const toml::node& element : *array)
    {
        if (!element.is_string())
        {
            Fail(key, "must be an array of strings");
        }
        strings.push_back(element.value<std::string>().value());
    }
    return strings;
}

std::vector<const toml::table*> TomlTableReader::TableArray(std::string_view key) const
{
    const toml::node* node{ m_Table.get(key) };
    if (node == nullptr)
    {
        return {};
    }

    const toml::array* array{ node->as_array() };
    if (array == nullptr)
    {
        Fail(key, "must be an array of tables");
    }

    std::vector<const toml::table*> tables;
    tables.reserve(array->size());
    for (const toml::node& element : *array)
    {
        const toml::table* table{ element.as_table() };
        if (table == nullptr)
        {
            Fail(key, "must be an array of tables");
        }
        tables.push_back(table);
    }
    return tables;
}

const toml::table* TomlTableReader::OptionalTable(std::string_view key) const
{
    const toml::node* node{ m_Table.get(key) };
    if (node == nullptr)
    {
        return nullptr;
    }

    const toml::table* table{ node->as_table() };
    if (table == nullptr)
    {
        Fail(key, "must be a table");
    }
    return table;
}

void TomlTableReader::Fail(std::string_view key, std::string_view problem) const
{
    throw LoadError{ fmt::format("{}: field `{}` {}", m_Context, key, problem) };
}

toml::table ParseTomlFile(const fs::path& path)
{
    if (!fs::exists(path))
    {
        throw LoadError{ fmt::format("Could not find {}", path.string()) };
    }

    try
    {
        return toml::parse_file(path.string());
    }
    catch (const toml::parse_error& e)
    {
        throw LoadError{
            fmt::format("Could not parse {} at line {}, column {}: {}",
                        path.string(),
                        e.source().begin.line,
                        e.source().begin.column,
                        e.description()),
        };
    }
}

toml::table ParseTomlString(std::string_view text, std::string_view source_name)
{
    try
    {
        return toml::parse(text, source_name);
    }
    catch (const toml::parse_error& e)
    {
        throw LoadError{
            fmt::format("Could not parse {} at line {}, column {}: {}",
                        source_name,
                        e.source().begin.line,
                        e.source().begin.column,
                        e.description()),
        };
    }
}
