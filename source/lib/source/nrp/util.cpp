#include <nrp/util.hpp>

#include <algorithm>
#include <ranges>

#include <QString>
#include <QUrl>

#include <nrp/qt_util.hpp>

std::string ToFileUrl(std::string_view path)
{
    std::string url{ path };
    std::ranges::replace(url, '\\', '/');
    if (IsFileUrl(url))
    {
        return url;
    }

    // Relative paths are resolved against the working directory
    if (!fs::path{ url }.is_absolute() && !url.starts_with('/'))
    {
        url = fs::absolute(fs::path{ url }).generic_string();
    }

    // Reserved characters like '#' and '%' are percent-encoded
    const QUrl qt_url{ QUrl::fromLocalFile(ToQString(url)) };
    return qt_url.toString(QUrl::FullyEncoded).toStdString();
}

bool IsFileUrl(std::string_view url)
{
    return url.starts_with("file://");
}

fs::path FileUrlToPath(std::string_view url)
{
    const QUrl qt_url{ ToQString(url), QUrl::TolerantMode };
    const QString local_file{ qt_url.toLocalFile() };
    if (local_file.isEmpty())
    {
        return fs::path{ url.substr(std::min(url.size(), std::string_view{ "file://" }.size())) };
    }
    return fs::path{ local_file.toStdString() };
}

std::string StripNonAscii(std::string_view text)
{
    std::string stripped{
        text |
        std::views::filter([](char c)
                           { return static_cast<unsigned char>(c) < 0x80; }) |
        std::ranges::to<std::string>()
    };
    if (stripped.empty())
    {
        return std::string{ text };
    }
    return stripped;
}

fs::path StagingPath(const fs::path& path)
{
    fs::path staging_path{ path };
    staging_path += ".part";
    return staging_path;
}
