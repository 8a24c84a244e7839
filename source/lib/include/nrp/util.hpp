#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include <dla/literals.h>
#include <dla/vector.h>

namespace fs = std::filesystem;

using Length = dla::length_unit;

namespace dla::unit_name
{
struct pixel
{
    static constexpr const char* id = "pixels";
    static constexpr const char* symbol = "pixels";
};
} // namespace dla::unit_name
using pixel_tag = dla::unit_tag<dla::unit_name::pixel>;
using Pixel = dla::base_unit<pixel_tag>;

using Size = dla::tvec2<Length>;
using Position = dla::tvec2<Length>;

// clang-format off
using namespace dla::literals;
using namespace dla::int_literals;

constexpr auto operator""_mm(long double v) { return Length{ float(v * 0.001L) }; }
constexpr auto operator""_mm(unsigned long long v) { return Length{ float(v * 0.001L) }; }

constexpr auto operator""_cm(long double v) { return Length{ float(v * 0.01L) }; }
constexpr auto operator""_cm(unsigned long long v) { return Length{ float(v * 0.01L) }; }

constexpr auto operator""_in(long double v) { return Length{ float(v * 0.0254L) }; }
constexpr auto operator""_in(unsigned long long v) { return Length{ float(v * 0.0254L) }; }

constexpr auto operator""_pts(long double v) { return 0.0138889_in * float(v); }
constexpr auto operator""_pts(unsigned long long v) { return 0.0138889_in * float(v); }

constexpr auto operator""_pix(long double v) { return Pixel(float(v)); }
constexpr auto operator""_pix(unsigned long long v) { return Pixel{ float(v) }; }

inline auto operator""_p(const char *str, size_t len) { return fs::path(str, str + len); }
// clang-format on

/*
        Axis-aligned rectangle, top-left origin with y pointing down the page
*/
struct Rect
{
    Position m_Position;
    Size m_Size;

    Length Left() const
    {
        return m_Position.x;
    }
    Length Top() const
    {
        return m_Position.y;
    }
    Length Right() const
    {
        return m_Position.x + m_Size.x;
    }
    Length Bottom() const
    {
        return m_Position.y + m_Size.y;
    }
};

template<class FunT>
struct AtScopeExit
{
    AtScopeExit(const AtScopeExit&) = delete;
    AtScopeExit& operator=(const AtScopeExit&) = delete;

    AtScopeExit(FunT fun)
        : m_Dtor{ std::move(fun) }
    {
    }
    ~AtScopeExit()
    {
        m_Dtor();
    }

    FunT m_Dtor;
};

// Turns a local path into a file url, relative paths are made absolute and existing file urls are kept as they are
std::string ToFileUrl(std::string_view path);
bool IsFileUrl(std::string_view url);
fs::path FileUrlToPath(std::string_view url);

// Strips all non-ascii characters, keeps the input if nothing would be left
std::string StripNonAscii(std::string_view text);

// Sibling of `path` that output is staged in before being renamed over `path`
fs::path StagingPath(const fs::path& path);
