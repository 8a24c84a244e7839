#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <toml++/toml.hpp>

#include <nrp/util.hpp>

/*
        Typed access to a single toml table, every failure is a LoadError naming `context`
        Keys outside of `allowed_keys` are rejected on construction
*/
class TomlTableReader
{
  public:
    TomlTableReader(const toml::table& table,
                    std::string context,
                    std::initializer_list<std::string_view> allowed_keys);

    const std::string& Context() const
    {
        return m_Context;
    }

    bool Has(std::string_view key) const;

    std::string RequireString(std::string_view key) const;
    std::optional<std::string> OptionalString(std::string_view key) const;

    // Accepts both strings and integers, used for ids that look numeric
    std::string RequireId(std::string_view key) const;

    uint32_t RequireUnsigned(std::string_view key) const;
    std::optional<uint32_t> OptionalUnsigned(std::string_view key) const;

    std::optional<bool> OptionalBool(std::string_view key) const;

    std::optional<std::vector<std::string>> OptionalStringArray(std::string_view key) const;

    // Missing key yields an empty list, an array holding anything but tables is an error
    std::vector<const toml::table*> TableArray(std::string_view key) const;

    const toml::table* OptionalTable(std::string_view key) const;

  private:
    [[noreturn]] void Fail(std::string_view key, std::string_view problem) const;

    const toml::table& m_Table;
    std::string m_Context;
};

toml::table ParseTomlFile(const fs::path& path);
toml::table ParseTomlString(std::string_view text, std::string_view source_name);
