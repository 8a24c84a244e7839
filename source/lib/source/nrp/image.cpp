#include <nrp/image.hpp>

#include <algorithm>
#include <cmath>
#include <cstring>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

Image::Image(cv::Mat impl)
    : m_Impl{ std::move(impl) }
{
}

Image::Image(const Image& rhs)
    : m_Impl{ rhs.m_Impl.clone() }
{
}

Image& Image::operator=(const Image& rhs)
{
    m_Impl = rhs.m_Impl.clone();
    return *this;
}

bool Image::Write(const fs::path& path) const
{
    return cv::imwrite(path.string(), m_Impl);
}

Image Image::Decode(EncodedImageView buffer)
{
    if (buffer.empty())
    {
        return Image{};
    }

    Image img{};
    const cv::Mat cv_buffer{
        1,
        static_cast<int>(buffer.size()),
        CV_8UC1,
        const_cast<std::byte*>(buffer.data()),
    };
    img.m_Impl = cv::imdecode(cv_buffer, cv::IMREAD_UNCHANGED);
    return img;
}

EncodedImage Image::EncodePng(std::optional<int32_t> compression) const
{
    if (m_Impl.empty())
    {
        return {};
    }

    std::vector<int> png_params;
    if (compression.has_value())
    {
        png_params = {
            cv::IMWRITE_PNG_COMPRESSION,
            compression.value(),
            cv::IMWRITE_PNG_STRATEGY,
            cv::IMWRITE_PNG_STRATEGY_DEFAULT,
        };
    }

    std::vector<uchar> cv_buffer;
    if (cv::imencode(".png", m_Impl, cv_buffer, png_params))
    {
        EncodedImage out_buffer(cv_buffer.size(), std::byte{});
        std::memcpy(out_buffer.data(), cv_buffer.data(), cv_buffer.size());
        return out_buffer;
    }
    return {};
}

EncodedImage Image::EncodeJpg(std::optional<int32_t> quality) const
{
    if (m_Impl.empty())
    {
        return {};
    }

    std::vector<int> jpg_params;
    if (quality.has_value())
    {
        jpg_params = {
            cv::IMWRITE_JPEG_QUALITY,
            quality.value(),
        };
    }

    // Jpg has no alpha, flatten onto white
    cv::Mat flat;
    if (HasAlpha())
    {
        cv::Mat white{ m_Impl.size(), CV_8UC3, cv::Scalar{ 255, 255, 255 } };
        std::vector<cv::Mat> channels;
        cv::split(m_Impl, channels);
        cv::Mat alpha;
        channels[3].convertTo(alpha, CV_32F, 1.0 / 255.0);
        cv::cvtColor(alpha, alpha, cv::COLOR_GRAY2BGR);
        cv::Mat color;
        cv::cvtColor(m_Impl, color, cv::COLOR_BGRA2BGR);
        cv::Mat color_f;
        cv::Mat white_f;
        color.convertTo(color_f, CV_32FC3);
        white.convertTo(white_f, CV_32FC3);
        cv::Mat blended{ color_f.mul(alpha) + white_f.mul(cv::Scalar::all(1.0) - alpha) };
        blended.convertTo(flat, CV_8UC3);
    }
    else
    {
        flat = m_Impl;
    }

    std::vector<uchar> cv_buffer;
    if (cv::imencode(".jpg", flat, cv_buffer, jpg_params))
    {
        EncodedImage out_buffer(cv_buffer.size(), std::byte{});
        std::memcpy(out_buffer.data(), cv_buffer.data(), cv_buffer.size());
        return out_buffer;
    }
    return {};
}

Image::operator bool() const
{
    return !m_Impl.empty();
}

bool Image::Valid() const
{
    return static_cast<bool>(*this);
}

Image Image::Crop(Pixel left, Pixel top, Pixel right, Pixel bottom) const
{
    const int w{ m_Impl.cols };
    const int h{ m_Impl.rows };

    const int safe_left{ std::max(0, static_cast<int>(left.value)) };
    const int safe_top{ std::max(0, static_cast<int>(top.value)) };
    const int end_x{ w - std::max(0, static_cast<int>(right.value)) };
    const int end_y{ h - std::max(0, static_cast<int>(bottom.value)) };

    if (safe_top >= end_y || safe_left >= end_x)
    {
        return Image{};
    }

    Image img{};
    img.m_Impl = m_Impl(
        cv::Range(safe_top, end_y),
        cv::Range(safe_left, end_x));
    return img;
}

Image Image::CoverCrop(float target_aspect_ratio) const
{
    static constexpr float c_IgnoreThreshold{ 0.001f };
    const float aspect_ratio{ AspectRatio() };
    if (!Valid() || target_aspect_ratio <= 0.0f || std::abs(aspect_ratio - target_aspect_ratio) < c_IgnoreThreshold)
    {
        return *this;
    }

    const float width{ static_cast<float>(m_Impl.cols) };
    const float height{ static_cast<float>(m_Impl.rows) };

    if (aspect_ratio > target_aspect_ratio)
    {
        // Too wide, cut left and right
        const float target_width{ height * target_aspect_ratio };
        const float cut{ (width - target_width) / 2.0f };
        const Pixel left{ std::floor(cut) };
        const Pixel right{ std::ceil(cut) };
        return Crop(left, 0_pix, right, 0_pix);
    }
    else
    {
        // Too tall, cut top and bottom
        const float target_height{ width / target_aspect_ratio };
        const float cut{ (height - target_height) / 2.0f };
        const Pixel top{ std::floor(cut) };
        const Pixel bottom{ std::ceil(cut) };
        return Crop(0_pix, top, 0_pix, bottom);
    }
}

Pixel Image::Width() const
{
    return Pixel{ static_cast<float>(m_Impl.cols) };
}

Pixel Image::Height() const
{
    return Pixel{ static_cast<float>(m_Impl.rows) };
}

float Image::AspectRatio() const
{
    if (m_Impl.rows == 0)
    {
        return 0.0f;
    }
    return static_cast<float>(m_Impl.cols) / static_cast<float>(m_Impl.rows);
}

bool Image::HasAlpha() const
{
    return m_Impl.channels() == 4;
}
