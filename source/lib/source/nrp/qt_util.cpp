#include <nrp/qt_util.hpp>

#include <QString>

QString ToQString(const char* c_string)
{
    return QString::fromUtf8(c_string);
}

QString ToQString(const std::string& string)
{
    return QString::fromStdString(string);
}

QString ToQString(std::string_view string_view)
{
    return QString::fromUtf8(string_view.data(), static_cast<qsizetype>(string_view.size()));
}

QString ToQString(const fs::path& path)
{
#ifdef _WIN32
    return QString::fromStdWString(path.wstring());
#else
    return QString::fromStdString(path.string());
#endif
}

std::string ToStdString(const QString& string)
{
    return string.toUtf8().toStdString();
}
