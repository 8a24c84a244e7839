#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nrp/manifest/types.hpp>
#include <nrp/util.hpp>

enum class SelectionKind
{
    Printing,
    Card,
    Insert,
};

/*
        One line of a selection file
*/
struct SelectionEntry
{
    SelectionKind m_Kind{ SelectionKind::Printing };
    uint32_t m_Count{ 1 };
    std::string m_Group;
    std::string m_Id;
    std::optional<uint32_t> m_Specifier{};
    size_t m_Line{};
};

struct SelectedPrinting
{
    std::string m_Label;
    std::string m_ImageUrl;
    std::optional<PrintingKey> m_Key{};
};
using Selection = std::vector<SelectedPrinting>;

std::vector<SelectionEntry> ParseSelection(std::string_view text, std::string_view source_name);
std::vector<SelectionEntry> ReadSelectionFile(const fs::path& path);

/*
        Expands every entry into the printings it stands for, in file order
        Faces of a flip card are all selected, variants are handed out round robin
*/
Selection ResolveSelection(std::span<const SelectionEntry> entries,
                           const Manifest& manifest,
                           const LocalOverlayManifest* overlay,
                           std::string_view image_root);

std::string DefaultImageUrl(std::string_view image_root, const PrintingKey& key);
std::string InsertImageUrl(std::string_view image_root, const Insert& insert);
