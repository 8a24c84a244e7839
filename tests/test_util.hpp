#pragma once

#include <algorithm>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include <nrp/util.hpp>
#include <nrp/util/log.hpp>

/*
        Directory below the working directory that is wiped on construction and destruction
*/
struct ScopedTestDir
{
    ScopedTestDir(std::string_view name)
        : m_Path{ fs::current_path() / name }
    {
        fs::remove_all(m_Path);
        fs::create_directories(m_Path);
    }
    ~ScopedTestDir()
    {
        std::error_code error;
        fs::remove_all(m_Path, error);
    }

    fs::path operator/(std::string_view child) const
    {
        return m_Path / child;
    }

    fs::path m_Path;
};

inline void WriteTextFile(const fs::path& path, std::string_view content)
{
    fs::create_directories(path.parent_path());
    std::ofstream file{ path, std::ios::binary };
    file << content;
}

inline std::string ReadTextFile(const fs::path& path)
{
    std::ifstream file{ path, std::ios::binary };
    return std::string{ std::istreambuf_iterator<char>{ file }, std::istreambuf_iterator<char>{} };
}

// Writes <root>/v2/cards/<card_id>.json
inline void WriteCardJson(const fs::path& root, std::string_view card_id, std::string_view json)
{
    WriteTextFile(root / "v2" / "cards" / fmt::format("{}.json", card_id), json);
}

// Writes <root>/v2/printings/<spec>.json
inline void WritePrintingsJson(const fs::path& root, std::string_view spec, std::string_view json)
{
    WriteTextFile(root / "v2" / "printings" / fmt::format("{}.json", spec), json);
}

/*
        Owns the main log for the duration of a test and records every warning
*/
struct CapturedLog
{
    CapturedLog()
        : m_Log{ LogFlags::Console, Log::c_MainLogName }
    {
        m_HookId = m_Log.InstallHook(
            [this](const Log::DetailInformation& /*detail_info*/, Log::LogLevel level, std::string_view message)
            {
                if (level == Log::LogLevel::Warning)
                {
                    m_Warnings.emplace_back(message);
                }
            });
    }
    ~CapturedLog()
    {
        m_Log.UninstallHook(m_HookId);
    }

    bool Warned(std::string_view fragment) const
    {
        return std::ranges::any_of(m_Warnings,
                                   [&](const std::string& warning)
                                   { return warning.find(fragment) != std::string::npos; });
    }

    Log m_Log;
    uint32_t m_HookId{};
    std::vector<std::string> m_Warnings;
};

/*
        Small printings dataset: 6 cards with 9 expanded printings, one flip card and one card with art variants
*/
inline void WriteSampleDataset(const fs::path& root)
{
    WriteCardJson(root, "noise_hacker_extraordinaire", R"({ "title": "Noise: Hacker Extraordinaire" })");
    WriteCardJson(root, "deja_vu", R"({ "title": "Déjà Vu", "stripped_title": "Deja Vu" })");
    WriteCardJson(root, "sure_gamble", R"({ "title": "Sure Gamble" })");
    WriteCardJson(root, "diversion_of_funds", R"({ "title": "Diversion of Funds" })");
    WriteCardJson(root, "hoshiko_shiro_untold_protagonist", R"({
        "title": "Hoshiko Shiro: Untold Protagonist",
        "faces": [{ "title": "Hoshiko Shiro: Mahou Shoujo" }]
    })");
    WriteCardJson(root, "aniccam", R"({ "title": "Aniccam" })");

    WritePrintingsJson(root, "core", R"([
        { "id": "01001", "card_id": "noise_hacker_extraordinaire" },
        { "id": "01002", "card_id": "deja_vu" },
        { "id": "01050", "card_id": "sure_gamble" }
    ])");
    WritePrintingsJson(root, "system_update_2021", R"([
        { "id": "32003", "card_id": "diversion_of_funds" }
    ])");
    WritePrintingsJson(root, "midnight_sun", R"([
        { "id": "33004", "card_id": "hoshiko_shiro_untold_protagonist" }
    ])");
    WritePrintingsJson(root, "parhelion", R"([
        { "id": "34001", "card_id": "aniccam", "faces": [{ "id": "34001-2" }, { "id": "34001-3" }] }
    ])");
}

inline constexpr std::string_view c_SampleCollections{ R"(
[[collection]]
name = "English"
group = "english"

[[collection.printing]]
spec = "core"
name = "Core Set"

[[collection.printing]]
spec = "system_update_2021"
name = "System Update 2021"

[[collection.printing]]
spec = "midnight_sun"
name = "Midnight Sun"

[[collection.printing]]
spec = "parhelion"
name = "Parhelion"

[[collection.insert]]
id = "rules"
title = "Rules Reference"
)" };
