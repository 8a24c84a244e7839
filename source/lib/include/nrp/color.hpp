#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include <dla/vector.h>

using ColorRGB8 = dla::tvec3<uint8_t>;
using ColorRGB32f = dla::tvec3<float>;

ColorRGB32f ToColorRGB32f(const ColorRGB8& color);

// Accepts "#rrggbb" and "rrggbb"
std::optional<ColorRGB8> ColorFromHex(std::string_view hex);
