#pragma once

#include <map>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>

#include <nrp/image.hpp>
#include <nrp/sheet/selection.hpp>

struct FetchedAsset
{
    std::optional<Image> m_Image{};
    std::string m_Error{};

    bool Ok() const
    {
        return m_Image.has_value();
    }
};
using AssetMap = std::map<std::string, FetchedAsset, std::less<>>;

/*
        Fetches each unique url once, file urls are read on the worker pool and everything else
        goes through the network manager before being decoded on the worker pool
        A failed url only ever marks its own entry, cancellation throws GenerationCancelled
*/
AssetMap FetchAssets(std::span<const std::string> urls, std::stop_token stop_token = {});
AssetMap FetchSelectionAssets(const Selection& selection, std::stop_token stop_token = {});

// Both throw AssetError
Image LoadLocalAsset(const fs::path& path);
Image DecodeAsset(EncodedImageView buffer, std::string_view url);
