#include <nrp/pdf/podofo_backend.hpp>

#include <algorithm>
#include <stdexcept>

#include <podofo/podofo.h>

#include <fmt/format.h>

#include <nrp/config.hpp>
#include <nrp/util/log.hpp>

inline double ToPoDoFoPoints(Length l)
{
    return static_cast<double>(l / 1_pts);
}

auto Save(PoDoFo::PdfPainter& painter)
{
    painter.Save();
    return AtScopeExit{
        [&painter]
        {
            painter.Restore();
        }
    };
}

PoDoFoPage::PoDoFoPage(PoDoFo::PdfPage* page,
                       PoDoFo::PdfPainter* painter,
                       PoDoFoDocument* document,
                       PoDoFoImageCache* image_cache)
    : m_Page{ page }
    , m_Painter{ painter }
    , m_Document{ document }
    , m_ImageCache{ image_cache }
{
    m_Painter->SetCanvas(*m_Page, PoDoFo::PdfPainterFlags::NoSaveRestorePrior);
}

void PoDoFoPage::DrawSolidLine(LineData data, LineStyle style)
{
    const auto real_fx{ ToPoDoFoPoints(data.m_From.x) };
    const auto real_fy{ ToPoDoFoPoints(data.m_From.y) };
    const auto real_tx{ ToPoDoFoPoints(data.m_To.x) };
    const auto real_ty{ ToPoDoFoPoints(data.m_To.y) };
    const auto line_width{ ToPoDoFoPoints(style.m_Thickness) };
    const PoDoFo::PdfColor col{ style.m_Color.r, style.m_Color.g, style.m_Color.b };

    auto save{ Save(*m_Painter) };
    m_Painter->GraphicsState.SetLineWidth(line_width);
    m_Painter->GraphicsState.SetStrokingColor(col);
    m_Painter->SetStrokeStyle(PoDoFo::PdfStrokeStyle::Solid);
    m_Painter->DrawLine(real_fx, real_fy, real_tx, real_ty);
}

void PoDoFoPage::DrawImage(ImageData data)
{
    const auto real_x{ ToPoDoFoPoints(data.m_Pos.x) };
    const auto real_y{ ToPoDoFoPoints(data.m_Pos.y) };
    const auto real_w{ ToPoDoFoPoints(data.m_Size.x) };
    const auto real_h{ ToPoDoFoPoints(data.m_Size.y) };

    auto* image{ m_ImageCache->GetImage(data.m_CacheKey, data.m_Image) };
    const auto w_scale{ real_w / image->GetWidth() };
    const auto h_scale{ real_h / image->GetHeight() };

    auto save{ Save(*m_Painter) };
    m_Painter->DrawImage(*image, real_x, real_y, w_scale, h_scale);
}

void PoDoFoPage::DrawText(TextData data)
{
    const auto& bb{ data.m_BoundingBox };
    const PoDoFo::Rect rect{
        ToPoDoFoPoints(bb.m_TopLeft.x),
        ToPoDoFoPoints(bb.m_BottomRight.y),
        ToPoDoFoPoints(bb.m_BottomRight.x - bb.m_TopLeft.x),
        ToPoDoFoPoints(bb.m_TopLeft.y - bb.m_BottomRight.y),
    };
    const PoDoFo::PdfString str{ data.m_Text };
    auto& font{ m_Document->GetFont() };

    auto save{ Save(*m_Painter) };
    m_Painter->TextState.SetFont(font, 12);

    PoDoFo::PdfDrawTextMultiLineParams params{
        .HorizontalAlignment = PoDoFo::PdfHorizontalAlignment::Center,
        .VerticalAlignment = PoDoFo::PdfVerticalAlignment::Center,
    };
    m_Painter->DrawTextMultiLine(str,
                                 rect,
                                 params);
}

void PoDoFoPage::Finish()
{
    m_Painter->FinishDrawing();
}

PoDoFoImageCache::PoDoFoImageCache(PoDoFoDocument& document)
    : m_Document{ document }
{
}

PoDoFo::PdfImage* PoDoFoImageCache::GetImage(std::string_view cache_key, const Image& image)
{
    const auto it{
        std::ranges::find(m_Cache, cache_key, &ImageCacheEntry::m_CacheKey)
    };
    if (it != m_Cache.end())
    {
        return it->m_PoDoFoImage.get();
    }

    const auto encoded_image{
        g_Cfg.m_PdfImageFormat == ImageFormat::Png
            ? image.EncodePng(g_Cfg.m_PngCompression)
            : image.EncodeJpg(g_Cfg.m_JpgQuality)
    };
    if (encoded_image.empty())
    {
        throw std::runtime_error{ fmt::format("Failed encoding image {} for embedding", cache_key) };
    }

    std::unique_ptr podofo_image{ m_Document.MakeImage() };
    podofo_image.get()->LoadFromBuffer(
        PoDoFo::bufferview{
            reinterpret_cast<const char*>(encoded_image.data()),
            encoded_image.size(),
        });

    m_Cache.push_back({
        std::string{ cache_key },
        std::move(podofo_image),
    });
    return m_Cache.back().m_PoDoFoImage.get();
}

PoDoFoDocument::PoDoFoDocument(Size page_size)
    : m_PageSize{ page_size }
{
    m_ImageCache = std::make_unique<PoDoFoImageCache>(*this);
}

void PoDoFoDocument::ReservePages(size_t pages)
{
    m_Pages.reserve(pages);
}

PoDoFoPage* PoDoFoDocument::NextPage()
{
    const int new_page_idx{ static_cast<int>(m_Pages.size()) };
    PoDoFo::PdfPage* page{
        &m_Document.GetPages().CreatePageAt(
            new_page_idx,
            PoDoFo::Rect(
                0.0,
                0.0,
                ToPoDoFoPoints(m_PageSize.x),
                ToPoDoFoPoints(m_PageSize.y))),
    };

    auto* painter{ m_Painters.emplace_back(new PoDoFo::PdfPainter).get() };

    m_Pages.push_back(PoDoFoPage{ page, painter, this, m_ImageCache.get() });
    return &m_Pages.back();
}

void PoDoFoDocument::Write(const fs::path& path)
{
    try
    {
        const auto pdf_path_string{ path.string() };
        LogInfo("Saving to {}...", pdf_path_string);

        if (g_Cfg.m_DeterministicPdfOutput)
        {
            auto& trailer{ m_Document.GetTrailer() };
            const auto& ref = trailer.GetDictionary().GetKey("Info")->GetReference();
            auto* obj = m_Document.GetObjects().GetObject(ref);
            obj->GetDictionary().RemoveKey("CreationDate");

            m_Document.Save(pdf_path_string, PoDoFo::PdfSaveOptions::NoMetadataUpdate);
        }
        else
        {
            m_Document.Save(pdf_path_string);
        }
    }
    catch (const PoDoFo::PdfError& e)
    {
        // Rethrow as a std::exception so the agnostic code can catch it
        throw std::runtime_error{ e.what() };
    }
}

PoDoFo::PdfFont& PoDoFoDocument::GetFont()
{
    return m_Document
        .GetFonts()
        .GetStandard14Font(PoDoFo::PdfStandard14FontType::Helvetica);
}

std::unique_ptr<PoDoFo::PdfImage> PoDoFoDocument::MakeImage()
{
    return m_Document.CreateImage();
}
