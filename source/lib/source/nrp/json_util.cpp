#include <nrp/json_util.hpp>

#include <fstream>

nlohmann::json ReadJsonFile(const fs::path& path)
{
    std::ifstream file{ path };
    if (!file.is_open())
    {
        throw LoadError{ fmt::format("Could not open {}", path.string()) };
    }

    try
    {
        return nlohmann::json::parse(file);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        throw LoadError{ fmt::format("Could not parse {}: {}", path.string(), e.what()) };
    }
}
