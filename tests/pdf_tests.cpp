#include <catch2/catch_test_macros.hpp>

#include <stop_token>

#include <opencv2/core.hpp>

#include <podofo/podofo.h>

#include <fmt/format.h>

#include <nrp/errors.hpp>
#include <nrp/pdf/generate.hpp>

#include "test_util.hpp"

namespace
{
Selection MakeSelection(size_t count)
{
    Selection selection;
    for (size_t i = 0; i < count; ++i)
    {
        selection.push_back(SelectedPrinting{
            .m_Label{ fmt::format("Card {}", i) },
            .m_ImageUrl{ fmt::format("https://img.example/english/card/{:05}.webp", i) },
            .m_Key{},
        });
    }
    return selection;
}

AssetMap MakeAssets(const Selection& selection)
{
    AssetMap assets;
    for (const SelectedPrinting& printing : selection)
    {
        assets[printing.m_ImageUrl].m_Image = Image{ cv::Mat{ 88, 63, CV_8UC3, cv::Scalar{ 200, 100, 50 } } };
    }
    return assets;
}

size_t CountPages(const fs::path& path)
{
    PoDoFo::PdfMemDocument document;
    document.Load(path.string());
    return document.GetPages().GetCount();
}
} // namespace

TEST_CASE("Missing images become placeholders", "[pdf_placeholders]")
{
    const CapturedLog log{};
    const ScopedTestDir dir{ "pdf_placeholders" };

    const Selection selection{ MakeSelection(11) };
    AssetMap assets{ MakeAssets(selection) };
    assets[selection[0].m_ImageUrl] = FetchedAsset{ .m_Image{}, .m_Error{ "Request failed" } };
    assets.erase(selection[10].m_ImageUrl);

    const SheetLayout layout{ ComputeSheetLayout(selection.size(), GeometryProfile{}) };
    const SheetReport report{ GenerateSheetPdf(selection, layout, assets, dir / "sheet.pdf") };

    REQUIRE(report.m_OutputPath == dir / "sheet.pdf");
    REQUIRE(report.m_NumPages == 2);
    REQUIRE(report.m_NumCards == 11);
    REQUIRE(report.m_PlaceholderSlots == std::vector<size_t>{ 0, 10 });
    REQUIRE(log.Warned("Card 0"));

    REQUIRE(fs::exists(dir / "sheet.pdf"));
    REQUIRE_FALSE(fs::exists(StagingPath(dir / "sheet.pdf")));
    REQUIRE(CountPages(dir / "sheet.pdf") == 2);
}

TEST_CASE("Placeholder labels are ascii", "[pdf_placeholder_label]")
{
    const PrintingKey key{ .m_Group{ "chinese" }, .m_Id{ 1050 } };
    REQUIRE(PlaceholderLabel(SelectedPrinting{ .m_Label{ "Déjà Vu" }, .m_ImageUrl{}, .m_Key{ key } }) == "Dj Vu");
    REQUIRE(PlaceholderLabel(SelectedPrinting{ .m_Label{ "快速赌博" }, .m_ImageUrl{}, .m_Key{ key } }) == "chinese/1050");
    REQUIRE(PlaceholderLabel(SelectedPrinting{ .m_Label{ "快速赌博" }, .m_ImageUrl{}, .m_Key{} }) == "?");
}

TEST_CASE("Sheets without any images", "[pdf_no_images]")
{
    const ScopedTestDir dir{ "pdf_no_images" };

    const Selection selection{ MakeSelection(3) };
    const GeometryProfile profile{ .m_CutIndicator = CutIndicator::Lines };
    const SheetLayout layout{ ComputeSheetLayout(selection.size(), profile) };
    const SheetReport report{ GenerateSheetPdf(selection, layout, AssetMap{}, dir / "sheet.pdf") };

    REQUIRE(report.m_PlaceholderSlots.size() == 3);
    REQUIRE(CountPages(dir / "sheet.pdf") == 1);
}

TEST_CASE("Cancelled generation writes nothing", "[pdf_cancelled]")
{
    const ScopedTestDir dir{ "pdf_cancelled" };

    const Selection selection{ MakeSelection(20) };
    const AssetMap assets{ MakeAssets(selection) };
    const SheetLayout layout{ ComputeSheetLayout(selection.size(), GeometryProfile{}) };

    std::stop_source stop_source{};
    stop_source.request_stop();
    REQUIRE_THROWS_AS(GenerateSheetPdf(selection, layout, assets, dir / "sheet.pdf", stop_source.get_token()),
                      GenerationCancelled);

    REQUIRE_FALSE(fs::exists(dir / "sheet.pdf"));
    REQUIRE_FALSE(fs::exists(StagingPath(dir / "sheet.pdf")));
}

TEST_CASE("Unwritable output", "[pdf_unwritable]")
{
    const ScopedTestDir dir{ "pdf_unwritable" };

    const Selection selection{ MakeSelection(1) };
    const SheetLayout layout{ ComputeSheetLayout(selection.size(), GeometryProfile{}) };
    REQUIRE_THROWS_AS(GenerateSheetPdf(selection, layout, AssetMap{}, dir / "missing_dir/sheet.pdf"), SerializationError);
}

TEST_CASE("Local overlay resolution", "[pdf_local_overlay]")
{
    const ScopedTestDir dir{ "pdf_local_overlay" };

    REQUIRE_THROWS_AS(ResolveLocalOverlayPath(dir / "missing.local.toml"), LoadError);

    WriteTextFile(dir / "mine.local.toml", "");
    REQUIRE(ResolveLocalOverlayPath(dir / "mine.local.toml") == dir / "mine.local.toml");
}
