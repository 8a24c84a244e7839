#pragma once

#include <memory>
#include <string_view>

#include <nrp/color.hpp>
#include <nrp/image.hpp>
#include <nrp/util.hpp>

class PdfDocument;

/*
        All positions handed to a page are in pdf space, origin at the bottom-left page corner
*/
std::unique_ptr<PdfDocument> CreatePdfDocument(Size page_size);

class PdfPage
{
  public:
    virtual ~PdfPage() = default;

    struct LineData
    {
        Position m_From;
        Position m_To;
    };

    struct LineStyle
    {
        Length m_Thickness{ 0.5_mm };
        ColorRGB32f m_Color;
    };

    struct ImageData
    {
        const Image& m_Image;
        std::string_view m_CacheKey;
        Position m_Pos;
        Size m_Size;
    };

    struct TextBoundingBox
    {
        Size m_TopLeft;
        Size m_BottomRight;
    };

    struct TextData
    {
        std::string_view m_Text;
        TextBoundingBox m_BoundingBox;
    };

    virtual void DrawSolidLine(LineData data, LineStyle style) = 0;

    virtual void DrawImage(ImageData data) = 0;

    virtual void DrawText(TextData data) = 0;

    virtual void Finish() = 0;
};

class PdfDocument
{
  public:
    virtual ~PdfDocument() = default;

    virtual void ReservePages(size_t pages) = 0;
    virtual PdfPage* NextPage() = 0;

    // Writes the whole document to `path`, throws std::runtime_error on failure
    virtual void Write(const fs::path& path) = 0;
};
