#pragma once

#include <string_view>

std::string_view NrpVersion();
std::string_view NrpBuildTime();

// Written into every compiled manifest, readers reject any other value
consteval std::string_view ManifestFormatVersion()
{
    return "NRP00001";
}
