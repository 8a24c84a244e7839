#include <nrp/pdf/generate.hpp>

#include <algorithm>
#include <map>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>

#include <nrp/config.hpp>
#include <nrp/errors.hpp>
#include <nrp/manifest/serializer.hpp>
#include <nrp/util/log.hpp>

#include <nrp/pdf/backend.hpp>

namespace
{
const ColorRGB32f c_PlaceholderColor{ 0.6f, 0.6f, 0.6f };
inline constexpr auto c_PlaceholderThickness{ 0.5_mm };

Position ToPdfPoint(Position position, Length page_height)
{
    return { position.x, page_height - position.y };
}

// Bottom-left corner of the rect in pdf space
Position ToPdfOrigin(const Rect& rect, Length page_height)
{
    return { rect.m_Position.x, page_height - rect.m_Position.y - rect.m_Size.y };
}

void DrawPlaceholder(PdfPage& page, const Rect& rect, const std::string& label, Length page_height)
{
    const auto [x, y]{ ToPdfOrigin(rect, page_height).pod() };
    const auto [w, h]{ rect.m_Size.pod() };

    const Position bottom_left{ x, y };
    const Position bottom_right{ x + w, y };
    const Position top_left{ x, y + h };
    const Position top_right{ x + w, y + h };

    const PdfPage::LineStyle style{
        .m_Thickness{ c_PlaceholderThickness },
        .m_Color{ c_PlaceholderColor },
    };
    page.DrawSolidLine({ bottom_left, bottom_right }, style);
    page.DrawSolidLine({ bottom_right, top_right }, style);
    page.DrawSolidLine({ top_right, top_left }, style);
    page.DrawSolidLine({ top_left, bottom_left }, style);
    page.DrawSolidLine({ bottom_left, top_right }, style);
    page.DrawSolidLine({ top_left, bottom_right }, style);

    page.DrawText(PdfPage::TextData{
        .m_Text{ label },
        .m_BoundingBox{
            .m_TopLeft{ x, y + h * 0.6f },
            .m_BottomRight{ x + w, y + h * 0.4f },
        },
    });
}
} // namespace

std::string PlaceholderLabel(const SelectedPrinting& printing)
{
    const bool has_ascii{ std::ranges::any_of(printing.m_Label, [](char c)
                                              { return static_cast<unsigned char>(c) < 0x80 && c != ' '; }) };
    if (!has_ascii)
    {
        // Helvetica can only draw ascii
        return printing.m_Key.has_value() ? ToString(printing.m_Key.value()) : std::string{ "?" };
    }
    return StripNonAscii(printing.m_Label);
}

SheetReport GenerateSheetPdf(const Selection& selection,
                             const SheetLayout& layout,
                             const AssetMap& assets,
                             const fs::path& output_path,
                             std::stop_token stop_token)
{
    const GeometryProfile& profile{ layout.m_Profile };
    const Length page_height{ profile.m_PageSize.y };
    const PdfPage::LineStyle guides_style{
        .m_Thickness{ profile.m_GuidesThickness },
        .m_Color{ ToColorRGB32f(profile.m_GuidesColor) },
    };

    SheetReport report{
        .m_OutputPath{ output_path },
        .m_NumPages = layout.m_Pages.size(),
        .m_NumCards = selection.size(),
    };

    std::unique_ptr<PdfDocument> pdf{ CreatePdfDocument(profile.m_PageSize) };
    pdf->ReservePages(layout.m_Pages.size());

    // Every slot has the same draw size, so each image only needs to be cropped once
    std::map<std::string_view, Image> cropped_images;

    for (size_t page_index = 0; page_index < layout.m_Pages.size(); ++page_index)
    {
        if (stop_token.stop_requested())
        {
            throw GenerationCancelled{};
        }

        LogInfo("Rendering page {}...", page_index + 1);

        const SheetPage& page{ layout.m_Pages[page_index] };
        PdfPage* pdf_page{ pdf->NextPage() };

        for (const SheetSlot& slot : page.m_Slots)
        {
            if (!slot.m_SelectionIndex.has_value())
            {
                continue;
            }

            const size_t selection_index{ slot.m_SelectionIndex.value() };
            const SelectedPrinting& printing{ selection.at(selection_index) };
            const Rect& draw_rect{ slot.m_DrawRect };

            const auto asset_it{ assets.find(printing.m_ImageUrl) };
            if (asset_it == assets.end() || !asset_it->second.Ok())
            {
                LogWarning("No image for {} on page {}, drawing a placeholder", printing.m_Label, page_index + 1);
                DrawPlaceholder(*pdf_page, draw_rect, PlaceholderLabel(printing), page_height);
                report.m_PlaceholderSlots.push_back(selection_index);
                continue;
            }

            const std::string_view url{ asset_it->first };
            auto cropped_it{ cropped_images.find(url) };
            if (cropped_it == cropped_images.end())
            {
                const float aspect_ratio{ static_cast<float>(draw_rect.m_Size.x / draw_rect.m_Size.y) };
                cropped_it = cropped_images.emplace(url, asset_it->second.m_Image->CoverCrop(aspect_ratio)).first;
            }

            pdf_page->DrawImage(PdfPage::ImageData{
                .m_Image{ cropped_it->second },
                .m_CacheKey{ url },
                .m_Pos{ ToPdfOrigin(draw_rect, page_height) },
                .m_Size{ draw_rect.m_Size },
            });
        }

        for (const LineSegment& guide : page.m_CutGuides)
        {
            pdf_page->DrawSolidLine(
                PdfPage::LineData{
                    .m_From{ ToPdfPoint(guide.m_From, page_height) },
                    .m_To{ ToPdfPoint(guide.m_To, page_height) },
                },
                guides_style);
        }

        pdf_page->Finish();
    }

    if (stop_token.stop_requested())
    {
        throw GenerationCancelled{};
    }

    const fs::path staging_path{ StagingPath(output_path) };
    AtScopeExit remove_staging{
        [&staging_path]()
        {
            std::error_code error;
            fs::remove(staging_path, error);
        }
    };

    try
    {
        pdf->Write(staging_path);
    }
    catch (const std::runtime_error& e)
    {
        throw SerializationError{ fmt::format("Failed writing {}: {}", output_path.string(), e.what()) };
    }

    std::error_code error;
    fs::rename(staging_path, output_path, error);
    if (error)
    {
        throw SerializationError{ fmt::format("Failed moving {} to {}: {}",
                                              staging_path.string(),
                                              output_path.string(),
                                              error.message()) };
    }

    if (!report.m_PlaceholderSlots.empty())
    {
        LogWarning("{} of {} cards were drawn as placeholders", report.m_PlaceholderSlots.size(), report.m_NumCards);
    }
    LogInfo("Wrote {} cards on {} pages to {}", report.m_NumCards, report.m_NumPages, output_path.string());
    return report;
}

std::optional<fs::path> ResolveLocalOverlayPath(const std::optional<fs::path>& explicit_path)
{
    if (explicit_path.has_value())
    {
        if (!fs::exists(explicit_path.value()))
        {
            throw LoadError{ fmt::format("Local overlay {} does not exist", explicit_path->string()) };
        }
        return explicit_path;
    }

    if (fs::exists(g_Cfg.m_LocalOverlayPath))
    {
        LogInfo("Using local overlay {}", g_Cfg.m_LocalOverlayPath.string());
        return g_Cfg.m_LocalOverlayPath;
    }
    return std::nullopt;
}

SheetReport RenderProxySheets(const ProxySheetOptions& options, std::stop_token stop_token)
{
    const Manifest manifest{ ReadManifest(options.m_ManifestPath) };

    std::optional<LocalOverlayManifest> overlay;
    if (options.m_LocalOverlayPath.has_value())
    {
        overlay = ReadManifest(options.m_LocalOverlayPath.value());
    }

    const std::vector<SelectionEntry> entries{ ReadSelectionFile(options.m_SelectionPath) };
    const Selection selection{
        ResolveSelection(entries,
                         manifest,
                         overlay.has_value() ? &overlay.value() : nullptr,
                         options.m_ImageRoot),
    };

    const SheetLayout layout{ ComputeSheetLayout(selection.size(), options.m_Profile) };
    const AssetMap assets{ FetchSelectionAssets(selection, stop_token) };
    return GenerateSheetPdf(selection, layout, assets, options.m_OutputPath, stop_token);
}
