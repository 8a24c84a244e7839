#include <nrp/manifest/overrides.hpp>

#include <ranges>

#include <fmt/format.h>

#include <nrp/errors.hpp>
#include <nrp/manifest/toml_reader.hpp>
#include <nrp/manifest/types.hpp>
#include <nrp/util/log.hpp>

namespace
{
CollectionInput ParseCollection(const toml::table& table, std::string context)
{
    const TomlTableReader reader{ table, std::move(context), { "name", "group", "printing", "insert" } };

    CollectionInput collection{
        .m_Name{ reader.RequireString("name") },
        .m_Group{ reader.RequireString("group") },
    };

    for (const auto& [i, printing_table] : reader.TableArray("printing") | std::views::enumerate)
    {
        const TomlTableReader printing{
            *printing_table,
            fmt::format("{} printing #{}", reader.Context(), i + 1),
            { "spec", "name" },
        };
        collection.m_Printings.push_back(CollectionPrintingInput{
            .m_Spec{ printing.RequireString("spec") },
            .m_Name{ printing.RequireString("name") },
        });
    }

    for (const auto& [i, insert_table] : reader.TableArray("insert") | std::views::enumerate)
    {
        const TomlTableReader insert{
            *insert_table,
            fmt::format("{} insert #{}", reader.Context(), i + 1),
            { "id", "title", "stripped_title", "insert_groups" },
        };
        collection.m_Inserts.push_back(InsertInput{
            .m_Id{ insert.RequireId("id") },
            .m_Title{ insert.RequireString("title") },
            .m_StrippedTitle{ insert.OptionalString("stripped_title") },
            .m_InsertGroups{ insert.OptionalStringArray("insert_groups").value_or(std::vector<std::string>{}) },
        });
    }

    return collection;
}

CardOverride ParseCard(const toml::table& table, size_t index, std::string_view source)
{
    const TomlTableReader reader{
        table,
        fmt::format("{}: [[card]] #{}", source, index + 1),
        {
            "id",
            "title",
            "stripped_title",
            "group",
            "printing_name",
            "printing_id",
            "printings",
            "faces",
            "variants",
        },
    };

    CardOverride card{
        .m_Index = index,
        .m_Id{ reader.RequireId("id") },
        .m_Group{ reader.OptionalString("group").value_or(std::string{ c_DefaultGroup }) },
        .m_Title{ reader.OptionalString("title") },
        .m_StrippedTitle{ reader.OptionalString("stripped_title") },
        .m_PrintingName{ reader.OptionalString("printing_name") },
        .m_Printings{},
        .m_Faces{ reader.OptionalStringArray("faces") },
        .m_Variants{ reader.OptionalUnsigned("variants") },
    };

    if (reader.Has("printing_id") && reader.Has("printings"))
    {
        throw LoadError{ fmt::format("{} (id {}): `printing_id` and `printings` are mutually exclusive", reader.Context(), card.m_Id) };
    }
    if (card.m_Faces.has_value() && card.m_Variants.has_value())
    {
        throw LoadError{ fmt::format("{} (id {}): `faces` and `variants` are mutually exclusive", reader.Context(), card.m_Id) };
    }
    if (card.m_Variants.has_value() && card.m_Variants.value() < 2)
    {
        throw LoadError{ fmt::format("{} (id {}): `variants` must be at least 2, omit it for single-face cards", reader.Context(), card.m_Id) };
    }

    if (const auto printing_id{ reader.OptionalUnsigned("printing_id") })
    {
        card.m_Printings.push_back(PrintingInput{ printing_id.value(), std::nullopt });
    }

    for (const auto& [i, printing_table] : reader.TableArray("printings") | std::views::enumerate)
    {
        const TomlTableReader printing{
            *printing_table,
            fmt::format("{} (id {}) printing #{}", reader.Context(), card.m_Id, i + 1),
            { "id", "name" },
        };
        card.m_Printings.push_back(PrintingInput{
            printing.RequireUnsigned("id"),
            printing.OptionalString("name"),
        });
    }

    return card;
}

RemapOverride ParseRemap(const toml::table& table, size_t index, std::string_view source)
{
    const TomlTableReader reader{
        table,
        fmt::format("{}: [[nrdb_remap]] #{}", source, index + 1),
        { "from", "to", "supersede" },
    };
    return RemapOverride{
        .m_From = reader.RequireUnsigned("from"),
        .m_To = reader.RequireUnsigned("to"),
        .m_Supersede = reader.OptionalBool("supersede").value_or(false),
    };
}

LocalImageInput ParseLocalImage(const toml::table& table, size_t index, std::string_view source)
{
    const TomlTableReader reader{
        table,
        fmt::format("{}: [[local_image]] #{}", source, index + 1),
        { "id", "face", "group", "url", "path" },
    };

    LocalImageInput local_image{
        .m_Id = reader.RequireUnsigned("id"),
        .m_Group{ reader.OptionalString("group").value_or(std::string{ c_DefaultGroup }) },
        .m_Face{ reader.OptionalUnsigned("face") },
        .m_Url{ reader.OptionalString("url") },
        .m_Path{ reader.OptionalString("path") },
    };

    if (local_image.m_Url.has_value() && local_image.m_Path.has_value())
    {
        throw LoadError{ fmt::format("{} (id {}): `url` and `path` are mutually exclusive", reader.Context(), local_image.m_Id) };
    }

    return local_image;
}

OverrideFile ParseOverrideTable(const toml::table& root, std::string_view source)
{
    const TomlTableReader reader{
        root,
        std::string{ source },
        { "collection", "card", "nrdb_remap", "local_image", "local_image_root" },
    };

    OverrideFile overrides{ .m_Source{ std::string{ source } } };

    for (const auto& [i, table] : reader.TableArray("collection") | std::views::enumerate)
    {
        overrides.m_Collections.push_back(ParseCollection(*table, fmt::format("{}: [[collection]] #{}", source, i + 1)));
    }

    for (const auto& [i, table] : reader.TableArray("card") | std::views::enumerate)
    {
        overrides.m_Cards.push_back(ParseCard(*table, static_cast<size_t>(i), source));
    }

    for (const auto& [i, table] : reader.TableArray("nrdb_remap") | std::views::enumerate)
    {
        overrides.m_Remaps.push_back(ParseRemap(*table, static_cast<size_t>(i), source));
    }

    for (const auto& [i, table] : reader.TableArray("local_image") | std::views::enumerate)
    {
        overrides.m_LocalImages.push_back(ParseLocalImage(*table, static_cast<size_t>(i), source));
    }

    if (const toml::table* root_table{ reader.OptionalTable("local_image_root") })
    {
        const TomlTableReader root_reader{
            *root_table,
            fmt::format("{}: [local_image_root]", source),
            { "url", "path" },
        };
        overrides.m_LocalImageRoot = LocalImageRootInput{
            .m_Url{ root_reader.OptionalString("url") },
            .m_Path{ root_reader.OptionalString("path") },
        };
    }

    for (const LocalImageInput& local_image : overrides.m_LocalImages)
    {
        const bool has_root{
            overrides.m_LocalImageRoot.has_value() &&
            (overrides.m_LocalImageRoot->m_Url.has_value() || overrides.m_LocalImageRoot->m_Path.has_value())
        };
        if (!local_image.m_Url.has_value() && !local_image.m_Path.has_value() && !has_root)
        {
            throw LoadError{
                fmt::format("{}: local image {} has neither `url` nor `path` and there is no [local_image_root]",
                            source,
                            local_image.m_Id),
            };
        }
    }

    LogDebug("Parsed {}: {} collections, {} cards, {} remaps, {} local images",
             source,
             overrides.m_Collections.size(),
             overrides.m_Cards.size(),
             overrides.m_Remaps.size(),
             overrides.m_LocalImages.size());

    return overrides;
}
} // namespace

OverrideFile ParseOverrideFile(const fs::path& path)
{
    const toml::table root{ ParseTomlFile(path) };
    return ParseOverrideTable(root, path.string());
}

OverrideFile ParseOverrideString(std::string_view text, std::string_view source_name)
{
    const toml::table root{ ParseTomlString(text, source_name) };
    return ParseOverrideTable(root, source_name);
}
