#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nrp/util.hpp>

struct CollectionPrintingInput
{
    std::string m_Spec;
    std::string m_Name;
};

struct InsertInput
{
    std::string m_Id;
    std::string m_Title;
    std::optional<std::string> m_StrippedTitle;
    std::vector<std::string> m_InsertGroups;
};

/*
        Declares a group and which dataset printing files belong to it
*/
struct CollectionInput
{
    std::string m_Name;
    std::string m_Group;
    std::vector<CollectionPrintingInput> m_Printings;
    std::vector<InsertInput> m_Inserts;
};

struct PrintingInput
{
    uint32_t m_Id{};
    std::optional<std::string> m_Name;
};

/*
        A [[card]] table, adds a card if its id is unknown and amends only the given fields otherwise
*/
struct CardOverride
{
    size_t m_Index{};
    std::string m_Id;
    std::string m_Group;
    std::optional<std::string> m_Title;
    std::optional<std::string> m_StrippedTitle;
    std::optional<std::string> m_PrintingName;
    std::vector<PrintingInput> m_Printings;
    std::optional<std::vector<std::string>> m_Faces;
    std::optional<uint32_t> m_Variants;
};

struct RemapOverride
{
    uint32_t m_From{};
    uint32_t m_To{};
    bool m_Supersede{ false };
};

struct LocalImageInput
{
    uint32_t m_Id{};
    std::string m_Group;
    std::optional<uint32_t> m_Face;
    std::optional<std::string> m_Url;
    std::optional<std::string> m_Path;
};

struct LocalImageRootInput
{
    std::optional<std::string> m_Url;
    std::optional<std::string> m_Path;
};

struct OverrideFile
{
    std::string m_Source;
    std::vector<CollectionInput> m_Collections;
    std::vector<CardOverride> m_Cards;
    std::vector<RemapOverride> m_Remaps;
    std::vector<LocalImageInput> m_LocalImages;
    std::optional<LocalImageRootInput> m_LocalImageRoot;
};

OverrideFile ParseOverrideFile(const fs::path& path);
OverrideFile ParseOverrideString(std::string_view text, std::string_view source_name);
