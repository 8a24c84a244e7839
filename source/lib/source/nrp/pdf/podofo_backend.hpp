#pragma once

#include <memory>
#include <string>
#include <vector>

#include <podofo/main/PdfImage.h>
#include <podofo/main/PdfMemDocument.h>
#include <podofo/main/PdfPainter.h>

#include <nrp/pdf/backend.hpp>

class PoDoFoDocument;
class PoDoFoImageCache;

class PoDoFoPage final : public PdfPage
{
    friend class PoDoFoDocument;

  public:
    virtual ~PoDoFoPage() override = default;

    virtual void DrawSolidLine(LineData data, LineStyle style) override;

    virtual void DrawImage(ImageData data) override;

    virtual void DrawText(TextData data) override;

    virtual void Finish() override;

  private:
    PoDoFoPage(PoDoFo::PdfPage* page,
               PoDoFo::PdfPainter* painter,
               PoDoFoDocument* document,
               PoDoFoImageCache* image_cache);

    PoDoFo::PdfPage* m_Page{ nullptr };
    PoDoFo::PdfPainter* m_Painter{ nullptr };
    PoDoFoDocument* m_Document{ nullptr };
    PoDoFoImageCache* m_ImageCache;
};

/*
        Every image is embedded once per cache key, repeated draws reference the same xobject
*/
class PoDoFoImageCache
{
  public:
    PoDoFoImageCache(PoDoFoDocument& document);

    PoDoFo::PdfImage* GetImage(std::string_view cache_key, const Image& image);

  private:
    PoDoFoDocument& m_Document;

    struct ImageCacheEntry
    {
        std::string m_CacheKey;
        std::unique_ptr<PoDoFo::PdfImage> m_PoDoFoImage;
    };
    std::vector<ImageCacheEntry> m_Cache;
};

class PoDoFoDocument final : public PdfDocument
{
  public:
    PoDoFoDocument(Size page_size);
    virtual ~PoDoFoDocument() override = default;

    virtual void ReservePages(size_t pages) override;
    virtual PoDoFoPage* NextPage() override;

    virtual void Write(const fs::path& path) override;

    PoDoFo::PdfFont& GetFont();
    std::unique_ptr<PoDoFo::PdfImage> MakeImage();

  private:
    Size m_PageSize;

    PoDoFo::PdfMemDocument m_Document;
    std::vector<PoDoFoPage> m_Pages;
    std::vector<std::unique_ptr<PoDoFo::PdfPainter>> m_Painters;

    std::unique_ptr<PoDoFoImageCache> m_ImageCache;
};
