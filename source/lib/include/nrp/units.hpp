#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nrp/util.hpp>

enum class Unit
{
    Millimeter,
    Centimeter,
    Inches,
    Points,
};

constexpr Length UnitValue(Unit unit);
constexpr std::string_view UnitName(Unit unit);
constexpr std::string_view UnitShortName(Unit unit);

constexpr std::optional<Unit> UnitFromName(std::string_view unit_name);

/*
        Parses "<value> <unit>", e.g. "3 mm" or "0,125 in"
*/
std::optional<Length> ParseLength(std::string_view str);

/*
        Parses "<width> x <height> <unit>", e.g. "8.5 x 11 inches"
*/
std::optional<Size> ParseSize(std::string_view str);

std::string FormatLength(Length length, Unit unit = Unit::Millimeter);

#include <nrp/units.inl>
