#include <catch2/catch_test_macros.hpp>

#include <stop_token>

#include <opencv2/core.hpp>

#include <nrp/errors.hpp>
#include <nrp/image.hpp>
#include <nrp/sheet/asset_fetcher.hpp>

#include "test_util.hpp"

namespace
{
fs::path WriteTestImage(const fs::path& path, int width, int height)
{
    const Image image{ cv::Mat{ height, width, CV_8UC3, cv::Scalar{ 40, 80, 160 } } };
    REQUIRE(image.Write(path));
    return path;
}
} // namespace

TEST_CASE("Fetch local images", "[assets_local]")
{
    const ScopedTestDir dir{ "assets_local" };
    const std::string card_url{ ToFileUrl(WriteTestImage(dir / "card.png", 63, 88).string()) };
    const std::string missing_url{ ToFileUrl((dir / "missing.png").string()) };
    WriteTextFile(dir / "garbage.png", "this is not an image");
    const std::string garbage_url{ ToFileUrl((dir / "garbage.png").string()) };

    const std::vector<std::string> urls{ card_url, missing_url, card_url, garbage_url };
    const AssetMap assets{ FetchAssets(urls) };

    // Duplicate urls are fetched once
    REQUIRE(assets.size() == 3);

    const FetchedAsset& card{ assets.at(card_url) };
    REQUIRE(card.Ok());
    REQUIRE(card.m_Image->Width() == 63_pix);
    REQUIRE(card.m_Image->Height() == 88_pix);

    // Failures only affect their own url
    const FetchedAsset& missing{ assets.at(missing_url) };
    REQUIRE_FALSE(missing.Ok());
    REQUIRE_FALSE(missing.m_Error.empty());

    const FetchedAsset& garbage{ assets.at(garbage_url) };
    REQUIRE_FALSE(garbage.Ok());
    REQUIRE_FALSE(garbage.m_Error.empty());
}

TEST_CASE("Cancelled fetch", "[assets_cancelled]")
{
    const ScopedTestDir dir{ "assets_cancelled" };
    const std::vector<std::string> urls{ ToFileUrl(WriteTestImage(dir / "card.png", 63, 88).string()) };

    std::stop_source stop_source{};
    stop_source.request_stop();
    REQUIRE_THROWS_AS(FetchAssets(urls, stop_source.get_token()), GenerationCancelled);
}

TEST_CASE("Load and decode single assets", "[assets_single]")
{
    const ScopedTestDir dir{ "assets_single" };
    WriteTestImage(dir / "card.png", 20, 10);

    const Image image{ LoadLocalAsset(dir / "card.png") };
    REQUIRE(image.Valid());
    REQUIRE(image.AspectRatio() == 2.0f);

    REQUIRE_THROWS_AS(LoadLocalAsset(dir / "missing.png"), AssetError);
    REQUIRE_THROWS_AS(DecodeAsset({}, "empty.png"), AssetError);

    const EncodedImage garbage(64, std::byte{ 0x2a });
    REQUIRE_THROWS_AS(DecodeAsset(garbage, "garbage.png"), AssetError);
}

TEST_CASE("Directories are not images", "[assets_directory]")
{
    const ScopedTestDir dir{ "assets_directory" };
    fs::create_directories(dir / "folder.webp");
    const std::string card_url{ ToFileUrl(WriteTestImage(dir / "card.png", 63, 88).string()) };
    const std::string folder_url{ ToFileUrl((dir / "folder.webp").string()) };

    REQUIRE_THROWS_AS(LoadLocalAsset(dir / "folder.webp"), AssetError);

    const std::vector<std::string> urls{ card_url, folder_url };
    const AssetMap assets{ FetchAssets(urls) };
    REQUIRE(assets.at(card_url).Ok());
    REQUIRE_FALSE(assets.at(folder_url).Ok());
    REQUIRE_FALSE(assets.at(folder_url).m_Error.empty());
}

TEST_CASE("Local images with reserved url characters", "[assets_file_url]")
{
    const ScopedTestDir dir{ "assets_file_url" };
    const fs::path image_path{ WriteTestImage(dir / "art#2 100%.png", 63, 88) };

    const std::string url{ ToFileUrl(image_path.string()) };
    REQUIRE(IsFileUrl(url));
    REQUIRE(FileUrlToPath(url) == image_path);

    const std::vector<std::string> urls{ url };
    const AssetMap assets{ FetchAssets(urls) };
    REQUIRE(assets.at(url).Ok());
}

TEST_CASE("Cover crop keeps the card aspect", "[assets_cover_crop]")
{
    const Image wide{ cv::Mat{ 88, 200, CV_8UC3, cv::Scalar{ 0, 0, 0 } } };
    const Image cropped_wide{ wide.CoverCrop(63.0f / 88.0f) };
    REQUIRE(cropped_wide.Height() == 88_pix);
    REQUIRE(cropped_wide.Width() == 63_pix);

    const Image tall{ cv::Mat{ 301, 63, CV_8UC3, cv::Scalar{ 0, 0, 0 } } };
    const Image cropped_tall{ tall.CoverCrop(63.0f / 88.0f) };
    REQUIRE(cropped_tall.Width() == 63_pix);
    REQUIRE(cropped_tall.Height() == 88_pix);

    const Image exact{ cv::Mat{ 88, 63, CV_8UC3, cv::Scalar{ 0, 0, 0 } } };
    const Image cropped_exact{ exact.CoverCrop(63.0f / 88.0f) };
    REQUIRE(cropped_exact.Width() == 63_pix);
    REQUIRE(cropped_exact.Height() == 88_pix);
}
