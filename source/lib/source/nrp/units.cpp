#include <nrp/units.hpp>

#include <algorithm>
#include <charconv>
#include <ranges>
#include <vector>

#include <fmt/format.h>

namespace
{
std::vector<std::string> SplitWords(std::string_view str)
{
    return str |
           std::views::split(' ') |
           std::views::transform([](auto part)
                                 { return std::string(part.begin(), part.end()); }) |
           std::views::filter([](const std::string& part)
                              { return !part.empty(); }) |
           std::ranges::to<std::vector>();
}

std::optional<float> ParseFloat(std::string str)
{
    std::ranges::replace(str, ',', '.');

    float value{};
#ifdef __clang__
    // Clang and AppleClang do not support std::from_chars overloads with floating points
    try
    {
        std::size_t consumed{};
        value = std::stof(str, &consumed);
        if (consumed != str.size())
        {
            return std::nullopt;
        }
    }
    catch (const std::exception&)
    {
        return std::nullopt;
    }
#else
    const auto [ptr, ec]{ std::from_chars(str.data(), str.data() + str.size(), value) };
    if (ec != std::errc{} || ptr != str.data() + str.size())
    {
        return std::nullopt;
    }
#endif
    return value;
}
} // namespace

std::optional<Length> ParseLength(std::string_view str)
{
    const auto parts{ SplitWords(str) };
    if (parts.size() != 2)
    {
        return std::nullopt;
    }

    const auto unit{ UnitFromName(parts[1]) };
    const auto value{ ParseFloat(parts[0]) };
    if (!unit.has_value() || !value.has_value())
    {
        return std::nullopt;
    }

    return value.value() * UnitValue(unit.value());
}

std::optional<Size> ParseSize(std::string_view str)
{
    const auto parts{ SplitWords(str) };
    if (parts.size() != 4 || parts[1] != "x")
    {
        return std::nullopt;
    }

    const auto unit{ UnitFromName(parts[3]) };
    const auto width{ ParseFloat(parts[0]) };
    const auto height{ ParseFloat(parts[2]) };
    if (!unit.has_value() || !width.has_value() || !height.has_value())
    {
        return std::nullopt;
    }

    const auto unit_value{ UnitValue(unit.value()) };
    return Size{ width.value() * unit_value, height.value() * unit_value };
}

std::string FormatLength(Length length, Unit unit)
{
    return fmt::format("{:.2f} {}", static_cast<float>(length / UnitValue(unit)), UnitShortName(unit));
}
