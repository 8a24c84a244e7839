#include <nrp/version.hpp>

#define STRINGIFY(x) #x
#define TOSTRING(x) STRINGIFY(x)

std::string_view NrpVersion()
{
#ifdef NRP_VERSION
    return TOSTRING(NRP_VERSION);
#else
    return "<unknown version>";
#endif
}

std::string_view NrpBuildTime()
{
#ifdef NRP_BUILD_TIME
    return TOSTRING(NRP_BUILD_TIME);
#else
    return "<unknown build time>";
#endif
}
