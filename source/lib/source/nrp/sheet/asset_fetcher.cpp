#include <nrp/sheet/asset_fetcher.hpp>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <ranges>
#include <system_error>
#include <vector>

#include <QByteArray>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QRunnable>
#include <QThreadPool>
#include <QTimer>
#include <QUrl>

#include <opencv2/core.hpp>

#include <fmt/format.h>

#include <nrp/config.hpp>
#include <nrp/errors.hpp>
#include <nrp/qt_util.hpp>
#include <nrp/util/log.hpp>

Image LoadLocalAsset(const fs::path& path)
{
    std::error_code error{};
    if (!fs::exists(path, error))
    {
        throw AssetError{ fmt::format("Image file {} does not exist", path.string()) };
    }

    if (!fs::is_regular_file(path, error))
    {
        throw AssetError{ fmt::format("Image path {} is not a file", path.string()) };
    }

    const auto file_size{ fs::file_size(path, error) };
    if (error)
    {
        throw AssetError{ fmt::format("Image file {} could not be inspected: {}", path.string(), error.message()) };
    }

    std::ifstream file{ path, std::ios::binary };
    if (!file)
    {
        throw AssetError{ fmt::format("Image file {} could not be opened", path.string()) };
    }

    EncodedImage buffer(file_size, std::byte{});
    file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(file_size));
    if (!file)
    {
        throw AssetError{ fmt::format("Image file {} could not be read", path.string()) };
    }

    return DecodeAsset(buffer, path.string());
}

Image DecodeAsset(EncodedImageView buffer, std::string_view url)
{
    if (buffer.empty())
    {
        throw AssetError{ fmt::format("Received no data for {}", url) };
    }

    try
    {
        Image image{ Image::Decode(buffer) };
        if (!image.Valid())
        {
            throw AssetError{ fmt::format("Data of {} is not a known image format", url) };
        }
        return image;
    }
    catch (const cv::Exception& e)
    {
        throw AssetError{ fmt::format("Failed decoding {}: {}", url, e.what()) };
    }
}

namespace
{
class AssetWork : public QRunnable
{
  public:
    AssetWork(std::string_view url, FetchedAsset& result, std::stop_token stop_token)
        : m_Url{ url }
        , m_Result{ result }
        , m_StopToken{ std::move(stop_token) }
    {
        setAutoDelete(true);
    }

    virtual void run() override
    {
        if (m_StopToken.stop_requested())
        {
            return;
        }

        try
        {
            m_Result.m_Image = Load();
            LogDebug("Loaded {}", m_Url);
        }
        catch (const AssetError& e)
        {
            m_Result.m_Error = e.what();
        }
        catch (const std::exception& e)
        {
            m_Result.m_Error = fmt::format("Failed loading {}: {}", m_Url, e.what());
        }
    }

  protected:
    virtual Image Load() = 0;

    std::string m_Url;

  private:
    FetchedAsset& m_Result;
    std::stop_token m_StopToken;
};

class LocalAssetWork : public AssetWork
{
  public:
    using AssetWork::AssetWork;

  protected:
    virtual Image Load() override
    {
        return LoadLocalAsset(FileUrlToPath(m_Url));
    }
};

class DecodeAssetWork : public AssetWork
{
  public:
    DecodeAssetWork(std::string_view url, QByteArray data, FetchedAsset& result, std::stop_token stop_token)
        : AssetWork{ url, result, std::move(stop_token) }
        , m_Data{ std::move(data) }
    {
    }

  protected:
    virtual Image Load() override
    {
        const EncodedImageView buffer{
            reinterpret_cast<const std::byte*>(m_Data.constData()),
            static_cast<size_t>(m_Data.size()),
        };
        return DecodeAsset(buffer, m_Url);
    }

  private:
    QByteArray m_Data;
};
} // namespace

AssetMap FetchAssets(std::span<const std::string> urls, std::stop_token stop_token)
{
    AssetMap assets;
    for (const std::string& url : urls)
    {
        assets.try_emplace(url);
    }

    QThreadPool& thread_pool{ *QThreadPool::globalInstance() };

    std::vector<std::string_view> remote_urls;
    for (auto& [url, asset] : assets)
    {
        if (IsFileUrl(url))
        {
            thread_pool.start(new LocalAssetWork{ url, asset, stop_token });
        }
        else
        {
            remote_urls.push_back(url);
        }
    }

    bool cancelled{ false };
    if (!remote_urls.empty())
    {
        QNetworkAccessManager network_manager;
        network_manager.setTransferTimeout(static_cast<int>(g_Cfg.m_FetchTimeout.count()));

        QEventLoop loop;
        std::vector<QNetworkReply*> replies;
        AtScopeExit delete_replies{
            [&replies]()
            {
                for (QNetworkReply* reply : replies)
                {
                    delete reply;
                }
            }
        };

        size_t outstanding{ remote_urls.size() };
        for (std::string_view url : remote_urls)
        {
            LogDebug("Requesting {}", url);

            QNetworkRequest request{ QUrl{ ToQString(url) } };
            QNetworkReply* reply{ network_manager.get(std::move(request)) };
            replies.push_back(reply);

            FetchedAsset* asset{ &assets.find(url)->second };
            QObject::connect(reply,
                             &QNetworkReply::finished,
                             &loop,
                             [&, url, reply, asset]()
                             {
                                 if (reply->error() != QNetworkReply::NetworkError::NoError)
                                 {
                                     asset->m_Error = fmt::format("Request for {} failed: {}",
                                                                 url,
                                                                 ToStdString(reply->errorString()));
                                 }
                                 else if (!cancelled)
                                 {
                                     thread_pool.start(new DecodeAssetWork{ url, reply->readAll(), *asset, stop_token });
                                 }

                                 --outstanding;
                                 if (outstanding == 0)
                                 {
                                     loop.quit();
                                 }
                             });
        }

        QTimer stop_poll;
        QObject::connect(&stop_poll,
                         &QTimer::timeout,
                         &loop,
                         [&]()
                         {
                             if (stop_token.stop_requested() && !cancelled)
                             {
                                 cancelled = true;
                                 for (QNetworkReply* reply : replies)
                                 {
                                     reply->abort();
                                 }
                                 loop.quit();
                             }
                         });
        stop_poll.start(std::chrono::milliseconds{ 50 });

        if (outstanding > 0)
        {
            loop.exec();
        }
    }

    thread_pool.waitForDone();

    if (cancelled || stop_token.stop_requested())
    {
        throw GenerationCancelled{};
    }

    for (const auto& [url, asset] : assets)
    {
        if (!asset.Ok())
        {
            LogWarning("Could not fetch {}: {}", url, asset.m_Error);
        }
    }

    const auto num_failed{ std::ranges::count_if(assets | std::views::values, [](const FetchedAsset& asset)
                                                 { return !asset.Ok(); }) };
    LogInfo("Fetched {} of {} images", assets.size() - static_cast<size_t>(num_failed), assets.size());
    return assets;
}

AssetMap FetchSelectionAssets(const Selection& selection, std::stop_token stop_token)
{
    const auto urls{
        selection |
        std::views::transform(&SelectedPrinting::m_ImageUrl) |
        std::ranges::to<std::vector<std::string>>()
    };
    return FetchAssets(urls, std::move(stop_token));
}
