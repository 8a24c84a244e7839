#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

inline constexpr std::string_view c_DefaultGroup{ "english" };
inline constexpr std::string_view c_DefaultPrintingName{ "Custom" };

struct Title
{
    std::string m_Title;
    std::string m_StrippedTitle;

    bool operator==(const Title&) const = default;
};

// Derives the stripped title when none is given
Title MakeTitle(std::string title, std::optional<std::string> stripped_title = std::nullopt);

/*
        Identity of a single printed face: the numeric printing id is shared by all faces
        and variants of one physical printing, the face/variant ordinal tells them apart
*/
struct PrintingKey
{
    std::string m_Group;
    uint32_t m_Id{};
    std::optional<uint32_t> m_Face{};
    std::optional<uint32_t> m_Variant{};

    std::optional<uint32_t> Specifier() const;

    auto operator<=>(const PrintingKey&) const = default;
};
std::string ToString(const PrintingKey& key);

struct Printing
{
    uint32_t m_Id{};
    std::string m_Name;
    std::optional<uint32_t> m_Face{};
    std::optional<uint32_t> m_Variant{};

    std::optional<uint32_t> Specifier() const;

    bool operator==(const Printing&) const = default;
};

/*
        A printing as declared in a source, before faces or variants are expanded
*/
struct PrintingRoot
{
    uint32_t m_Id{};
    std::string m_Name;

    bool operator==(const PrintingRoot&) const = default;
};

/*
        Unexpanded card, this is what the loader produces and what overrides amend
*/
struct CardRecord
{
    std::string m_Id;
    std::string m_Group;
    Title m_Title;
    std::vector<Title> m_Faces;
    std::optional<uint32_t> m_Variants;
    std::vector<PrintingRoot> m_Printings;
};

struct Card
{
    std::string m_Id;
    std::string m_Group;
    Title m_Title;
    std::vector<Title> m_Faces;
    std::optional<uint32_t> m_Variants;
    std::vector<Printing> m_Printings;

    PrintingKey KeyOf(const Printing& printing) const;
    const Printing* FindPrinting(uint32_t id, std::optional<uint32_t> specifier) const;
    std::vector<const Printing*> FindPrintings(uint32_t id) const;

    bool operator==(const Card&) const = default;
};

struct Insert
{
    std::string m_Name;
    std::string m_Group;
    Title m_Title;
    std::vector<std::string> m_InsertGroups;

    bool operator==(const Insert&) const = default;
};

struct Collection
{
    std::string m_Group;
    std::string m_Name;

    bool operator==(const Collection&) const = default;
};

struct NrdbRemap
{
    uint32_t m_From{};
    uint32_t m_To{};

    bool operator==(const NrdbRemap&) const = default;
};

struct LocalImageOverride
{
    std::string m_Group;
    uint32_t m_Id{};
    std::optional<uint32_t> m_Face{};
    std::string m_Url;

    bool operator==(const LocalImageOverride&) const = default;
};

/*
        Compiled, immutable card set. The local overlay uses the same type but is always
        compiled and stored separately from the primary manifest
*/
struct Manifest
{
    std::vector<Collection> m_Collections;
    std::vector<Card> m_Cards;
    std::vector<Insert> m_Inserts;
    std::vector<NrdbRemap> m_NrdbRemaps;
    std::vector<LocalImageOverride> m_LocalImages;

    bool Empty() const;
    bool HasGroup(std::string_view group) const;

    const Card* FindCard(std::string_view group, std::string_view card_id) const;
    const Card* FindCardByPrinting(std::string_view group, uint32_t printing_id) const;
    const Insert* FindInsert(std::string_view group, std::string_view name) const;
    const LocalImageOverride* FindLocalImage(const PrintingKey& key) const;
    std::optional<uint32_t> FindRemap(uint32_t from) const;

    size_t NumPrintings() const;
    std::vector<PrintingKey> PrintingKeys() const;

    bool operator==(const Manifest&) const = default;
};
using LocalOverlayManifest = Manifest;
