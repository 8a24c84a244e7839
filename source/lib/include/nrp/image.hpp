#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <opencv2/core/mat.hpp>

#include <nrp/util.hpp>

using EncodedImage = std::vector<std::byte>;
using EncodedImageView = std::span<const std::byte>;

class [[nodiscard]] Image
{
  public:
    Image() = default;
    Image(cv::Mat impl);
    ~Image() = default;

    Image(Image&& rhs) noexcept = default;
    Image(const Image& rhs);

    Image& operator=(Image&& rhs) noexcept = default;
    Image& operator=(const Image& rhs);

    bool Write(const fs::path& path) const;

    static Image Decode(EncodedImageView buffer);

    EncodedImage EncodePng(std::optional<int32_t> compression = std::nullopt) const;
    EncodedImage EncodeJpg(std::optional<int32_t> quality = std::nullopt) const;

    explicit operator bool() const;
    bool Valid() const;

    Image Crop(Pixel left, Pixel top, Pixel right, Pixel bottom) const;

    /*
            Crops symmetrically so the result has the target aspect ratio (width / height),
            the image is never stretched
    */
    Image CoverCrop(float target_aspect_ratio) const;

    Pixel Width() const;
    Pixel Height() const;
    float AspectRatio() const;

  private:
    bool HasAlpha() const;

    cv::Mat m_Impl{};
};
