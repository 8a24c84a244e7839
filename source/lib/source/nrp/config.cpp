#include <nrp/config.hpp>

#include <algorithm>

#include <QFile>
#include <QSettings>

#include <magic_enum/magic_enum.hpp>

#include <nrp/qt_util.hpp>
#include <nrp/util/log.hpp>

Config g_Cfg{};

std::optional<Size> Config::GetPageSize(std::string_view name) const
{
    const auto it{ m_PageSizes.find(std::string{ name }) };
    if (it != m_PageSizes.end())
    {
        return it->second;
    }
    return ParseSize(name);
}

std::optional<Size> Config::GetCardSize(std::string_view name) const
{
    const auto it{ m_CardSizes.find(std::string{ name }) };
    if (it != m_CardSizes.end())
    {
        return it->second;
    }
    return ParseSize(name);
}

Config LoadConfig(const fs::path& config_path)
{
    Config config{};
    if (!QFile::exists(ToQString(config_path)))
    {
        return config;
    }

    QSettings settings(ToQString(config_path), QSettings::IniFormat);
    if (settings.status() != QSettings::Status::NoError)
    {
        return config;
    }

    const auto get_string{
        [&settings](const char* key, std::string_view fallback)
        {
            return ToStdString(settings.value(key, ToQString(fallback)).toString());
        }
    };

    {
        settings.beginGroup("DEFAULT");

        config.m_MaxWorkerThreads = std::max(settings.value("Max.Worker.Threads", config.m_MaxWorkerThreads).toUInt(), 1u);
        config.m_FetchTimeout = std::chrono::milliseconds{
            settings.value("Fetch.Timeout.Ms", static_cast<qlonglong>(config.m_FetchTimeout.count())).toLongLong(),
        };
        config.m_ImageUrlRoot = get_string("Image.Url.Root", config.m_ImageUrlRoot);
        config.m_LocalOverlayPath = get_string("Local.Overlay.Path", config.m_LocalOverlayPath.string());
        config.m_LogToFile = settings.value("Log.To.File", config.m_LogToFile).toBool();

        settings.endGroup();
    }

    {
        settings.beginGroup("SHEET");

        config.m_DefaultPageSize = get_string("Page.Size", config.m_DefaultPageSize);
        config.m_DefaultCardSize = get_string("Card.Size", config.m_DefaultCardSize);
        config.m_Columns = settings.value("Columns", config.m_Columns).toUInt();
        config.m_Rows = settings.value("Rows", config.m_Rows).toUInt();

        if (auto bleed{ ParseLength(get_string("Bleed.Edge", "")) })
        {
            config.m_BleedEdge = bleed.value();
        }
        if (auto spacing{ ParseLength(get_string("Spacing", "")) })
        {
            config.m_Spacing = Size{ spacing.value(), spacing.value() };
        }

        {
            const auto cut_indicator{ get_string("Cut.Indicator", magic_enum::enum_name(config.m_CutIndicator)) };
            config.m_CutIndicator = magic_enum::enum_cast<CutIndicator>(cut_indicator, magic_enum::case_insensitive)
                                        .value_or(config.m_CutIndicator);
        }
        if (auto guides_length{ ParseLength(get_string("Guides.Length", "")) })
        {
            config.m_GuidesLength = guides_length.value();
        }
        if (auto guides_thickness{ ParseLength(get_string("Guides.Thickness", "")) })
        {
            config.m_GuidesThickness = guides_thickness.value();
        }
        if (auto guides_color{ ColorFromHex(get_string("Guides.Color", "")) })
        {
            config.m_GuidesColor = guides_color.value();
        }

        settings.endGroup();
    }

    {
        settings.beginGroup("PDF");

        {
            const auto image_format{ get_string("Image.Format", magic_enum::enum_name(config.m_PdfImageFormat)) };
            config.m_PdfImageFormat = magic_enum::enum_cast<ImageFormat>(image_format, magic_enum::case_insensitive)
                                          .value_or(config.m_PdfImageFormat);
        }

        {
            const auto png_compression{ settings.value("Png.Compression") };
            if (png_compression.isValid())
            {
                config.m_PngCompression = std::clamp(png_compression.toInt(), 0, 9);
            }
        }

        {
            const auto jpg_quality{ settings.value("Jpg.Quality") };
            if (jpg_quality.isValid())
            {
                config.m_JpgQuality = std::clamp(jpg_quality.toInt(), 0, 100);
            }
        }

        config.m_DeterministicPdfOutput = settings.value("Deterministic", config.m_DeterministicPdfOutput).toBool();

        settings.endGroup();
    }

    {
        settings.beginGroup("PAGE_SIZES");

        for (const QString& key : settings.allKeys())
        {
            const std::string name{ ToStdString(key) };
            const std::string value{ ToStdString(settings.value(key).toString()) };
            if (auto size{ ParseSize(value) })
            {
                config.m_PageSizes[name] = size.value();
            }
            else
            {
                LogWarning("Ignoring page size {}, could not parse \"{}\"", name, value);
            }
        }

        settings.endGroup();
    }

    {
        settings.beginGroup("CARD_SIZES");

        for (const QString& key : settings.allKeys())
        {
            const std::string name{ ToStdString(key) };
            const std::string value{ ToStdString(settings.value(key).toString()) };
            if (auto size{ ParseSize(value) })
            {
                config.m_CardSizes[name] = size.value();
            }
            else
            {
                LogWarning("Ignoring card size {}, could not parse \"{}\"", name, value);
            }
        }

        settings.endGroup();
    }

    return config;
}
