#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include <nlohmann/json.hpp>

#include <nrp/errors.hpp>
#include <nrp/util.hpp>

/*
        Parses a whole json file, failures are reported as LoadError naming the file
*/
nlohmann::json ReadJsonFile(const fs::path& path);

/*
        Field access for dataset records, `context` names the record in error messages
*/
template<class T>
T GetJsonField(const nlohmann::json& object, std::string_view key, std::string_view context)
{
    if (!object.is_object())
    {
        throw LoadError{ fmt::format("{}: expected an object", context) };
    }

    const std::string key_str{ key };
    const auto it{ object.find(key_str) };
    if (it == object.end() || it->is_null())
    {
        throw LoadError{ fmt::format("{}: missing required field `{}`", context, key) };
    }

    try
    {
        return it->template get<T>();
    }
    catch (const nlohmann::json::type_error& e)
    {
        throw LoadError{ fmt::format("{}: field `{}` has the wrong type ({})", context, key, e.what()) };
    }
}

template<class T>
std::optional<T> GetOptionalJsonField(const nlohmann::json& object, std::string_view key, std::string_view context)
{
    if (!object.is_object() || !object.contains(std::string{ key }) || object.at(std::string{ key }).is_null())
    {
        return std::nullopt;
    }
    return GetJsonField<T>(object, key, context);
}
