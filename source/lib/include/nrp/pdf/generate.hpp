#pragma once

#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include <nrp/sheet/asset_fetcher.hpp>
#include <nrp/sheet/layout.hpp>
#include <nrp/sheet/selection.hpp>
#include <nrp/util.hpp>

struct SheetReport
{
    fs::path m_OutputPath;
    size_t m_NumPages{};
    size_t m_NumCards{};

    // Selection indices that were drawn as placeholders, in drawing order
    std::vector<size_t> m_PlaceholderSlots{};
};

// Ascii text drawn into a placeholder, the printing key if the label has no ascii characters
std::string PlaceholderLabel(const SelectedPrinting& printing);

/*
        Renders one pdf page per layout page and moves the document to `output_path` once all
        pages are done, cancellation or failure leaves nothing at `output_path`
        Throws GenerationCancelled or SerializationError if the file can not be written
*/
SheetReport GenerateSheetPdf(const Selection& selection,
                             const SheetLayout& layout,
                             const AssetMap& assets,
                             const fs::path& output_path,
                             std::stop_token stop_token = {});

struct ProxySheetOptions
{
    fs::path m_ManifestPath;
    fs::path m_SelectionPath;
    fs::path m_OutputPath;
    std::optional<fs::path> m_LocalOverlayPath;
    GeometryProfile m_Profile;
    std::string m_ImageRoot;
};

// An explicit overlay must exist, otherwise the configured overlay path is probed once
std::optional<fs::path> ResolveLocalOverlayPath(const std::optional<fs::path>& explicit_path);

/*
        Full proxysheet pipeline: manifests, selection, layout, images and finally the pdf
*/
SheetReport RenderProxySheets(const ProxySheetOptions& options, std::stop_token stop_token = {});
