#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nrp/color.hpp>
#include <nrp/units.hpp>
#include <nrp/util.hpp>

enum class CutIndicator
{
    None,
    Marks,
    Lines,
};

enum class ImageFormat
{
    Png,
    Jpg,
};

struct Config
{
    uint32_t m_MaxWorkerThreads{ 16 };
    std::chrono::milliseconds m_FetchTimeout{ 30000 };

    std::string m_ImageUrlRoot{ c_DefaultImageUrlRoot };
    fs::path m_LocalOverlayPath{ "local-assets/manifest.local.toml"_p };

    std::string m_DefaultPageSize{ "A4" };
    std::string m_DefaultCardSize{ "Standard" };
    Length m_BleedEdge{ 0_mm };
    Size m_Spacing{ 0_mm, 0_mm };
    uint32_t m_Columns{ 3 };
    uint32_t m_Rows{ 3 };

    CutIndicator m_CutIndicator{ CutIndicator::Marks };
    Length m_GuidesLength{ 0.25_in };
    Length m_GuidesThickness{ 1_pts };
    ColorRGB8 m_GuidesColor{ 0, 0, 0 };

    ImageFormat m_PdfImageFormat{ ImageFormat::Jpg };
    std::optional<int> m_PngCompression{ std::nullopt };
    std::optional<int> m_JpgQuality{ std::nullopt };
    bool m_DeterministicPdfOutput{ false };

    bool m_LogToFile{ false };

    static inline constexpr std::string_view c_DefaultImageUrlRoot{
        "https://nro-public.s3.nl-ams.scw.cloud/nro/card-printings/v2/webp"
    };

    inline static const std::map<std::string, Size> g_DefaultPageSizes{
        { "Letter", { 8.5_in, 11_in } },
        { "Legal", { 8.5_in, 14_in } },
        { "Ledger", { 11_in, 17_in } },
        { "A5", { 148.5_mm, 210_mm } },
        { "A4", { 210_mm, 297_mm } },
        { "A3", { 297_mm, 420_mm } },
    };
    std::map<std::string, Size> m_PageSizes{ g_DefaultPageSizes };

    inline static const std::map<std::string, Size> g_DefaultCardSizes{
        { "Standard", { 63_mm, 88_mm } },
        { "Poker", { 2.5_in, 3.5_in } },
        { "Snug", { 2.45_in, 3.43_in } },
        { "Japanese", { 59_mm, 86_mm } },
    };
    std::map<std::string, Size> m_CardSizes{ g_DefaultCardSizes };

    std::optional<Size> GetPageSize(std::string_view name) const;
    std::optional<Size> GetCardSize(std::string_view name) const;
};

/*
        Reads config.ini if it exists, a missing file or missing keys fall back to defaults
        The file is never written here, g_Cfg holds defaults until the executable loads it
*/
Config LoadConfig(const fs::path& config_path = "config.ini"_p);

extern Config g_Cfg;
