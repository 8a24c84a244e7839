#include <nrp/manifest/serializer.hpp>

#include <algorithm>
#include <fstream>
#include <optional>
#include <ranges>
#include <sstream>
#include <tuple>
#include <vector>

#include <fmt/format.h>

#include <toml++/toml.hpp>

#include <nrp/errors.hpp>
#include <nrp/manifest/toml_reader.hpp>
#include <nrp/util.hpp>
#include <nrp/util/log.hpp>
#include <nrp/version.hpp>

namespace
{
void InsertTitle(toml::table& table, const Title& title)
{
    table.insert("title", title.m_Title);
    table.insert("stripped_title", title.m_StrippedTitle);
}

void InsertOptional(toml::table& table, std::string_view key, std::optional<uint32_t> value)
{
    if (value.has_value())
    {
        table.insert(key, static_cast<int64_t>(value.value()));
    }
}

void InsertTableArray(toml::table& table, std::string_view key, toml::array array)
{
    if (!array.empty())
    {
        table.insert(key, std::move(array));
    }
}

toml::table CardToToml(const Card& card)
{
    toml::table card_table;
    card_table.insert("id", card.m_Id);
    card_table.insert("group", card.m_Group);
    InsertTitle(card_table, card.m_Title);
    InsertOptional(card_table, "variants", card.m_Variants);

    toml::array faces;
    for (const Title& face : card.m_Faces)
    {
        toml::table face_table;
        InsertTitle(face_table, face);
        faces.push_back(std::move(face_table));
    }
    InsertTableArray(card_table, "face", std::move(faces));

    toml::array printings;
    for (const Printing& printing : card.m_Printings)
    {
        toml::table printing_table;
        printing_table.insert("id", static_cast<int64_t>(printing.m_Id));
        printing_table.insert("name", printing.m_Name);
        InsertOptional(printing_table, "face", printing.m_Face);
        InsertOptional(printing_table, "variant", printing.m_Variant);
        printings.push_back(std::move(printing_table));
    }
    InsertTableArray(card_table, "printing", std::move(printings));

    return card_table;
}

toml::table ManifestToToml(const Manifest& manifest)
{
    toml::table root;
    root.insert("format_version", std::string{ ManifestFormatVersion() });

    toml::array collections;
    for (const Collection& collection : manifest.m_Collections)
    {
        collections.push_back(toml::table{
            { "group", collection.m_Group },
            { "name", collection.m_Name },
        });
    }
    InsertTableArray(root, "collection", std::move(collections));

    toml::array cards;
    for (const Card& card : manifest.m_Cards)
    {
        cards.push_back(CardToToml(card));
    }
    InsertTableArray(root, "card", std::move(cards));

    toml::array inserts;
    for (const Insert& insert : manifest.m_Inserts)
    {
        toml::table insert_table;
        insert_table.insert("name", insert.m_Name);
        insert_table.insert("group", insert.m_Group);
        InsertTitle(insert_table, insert.m_Title);
        if (!insert.m_InsertGroups.empty())
        {
            toml::array insert_groups;
            for (const std::string& insert_group : insert.m_InsertGroups)
            {
                insert_groups.push_back(insert_group);
            }
            insert_table.insert("insert_groups", std::move(insert_groups));
        }
        inserts.push_back(std::move(insert_table));
    }
    InsertTableArray(root, "insert", std::move(inserts));

    toml::array remaps;
    for (const NrdbRemap& remap : manifest.m_NrdbRemaps)
    {
        remaps.push_back(toml::table{
            { "from", static_cast<int64_t>(remap.m_From) },
            { "to", static_cast<int64_t>(remap.m_To) },
        });
    }
    InsertTableArray(root, "nrdb_remap", std::move(remaps));

    toml::array local_images;
    for (const LocalImageOverride& local_image : manifest.m_LocalImages)
    {
        toml::table local_image_table;
        local_image_table.insert("group", local_image.m_Group);
        local_image_table.insert("id", static_cast<int64_t>(local_image.m_Id));
        InsertOptional(local_image_table, "face", local_image.m_Face);
        local_image_table.insert("url", local_image.m_Url);
        local_images.push_back(std::move(local_image_table));
    }
    InsertTableArray(root, "local_image", std::move(local_images));

    return root;
}

Title ReadTitle(const TomlTableReader& reader)
{
    return MakeTitle(reader.RequireString("title"), reader.OptionalString("stripped_title"));
}

Card ReadCard(const toml::table& table, std::string context)
{
    const TomlTableReader reader{
        table,
        std::move(context),
        { "id", "group", "title", "stripped_title", "variants", "face", "printing" },
    };

    Card card{
        .m_Id{ reader.RequireId("id") },
        .m_Group{ reader.RequireString("group") },
        .m_Title{ ReadTitle(reader) },
        .m_Faces{},
        .m_Variants{ reader.OptionalUnsigned("variants") },
        .m_Printings{},
    };

    for (const auto& [i, face_table] : reader.TableArray("face") | std::views::enumerate)
    {
        const TomlTableReader face{
            *face_table,
            fmt::format("{} (id {}) face #{}", reader.Context(), card.m_Id, i + 1),
            { "title", "stripped_title" },
        };
        card.m_Faces.push_back(ReadTitle(face));
    }

    for (const auto& [i, printing_table] : reader.TableArray("printing") | std::views::enumerate)
    {
        const TomlTableReader printing{
            *printing_table,
            fmt::format("{} (id {}) printing #{}", reader.Context(), card.m_Id, i + 1),
            { "id", "name", "face", "variant" },
        };
        card.m_Printings.push_back(Printing{
            .m_Id = printing.RequireUnsigned("id"),
            .m_Name{ printing.RequireString("name") },
            .m_Face{ printing.OptionalUnsigned("face") },
            .m_Variant{ printing.OptionalUnsigned("variant") },
        });
    }

    return card;
}

Manifest ManifestFromToml(const toml::table& root, std::string_view source)
{
    const TomlTableReader reader{
        root,
        std::string{ source },
        { "format_version", "collection", "card", "insert", "nrdb_remap", "local_image" },
    };

    const std::string format_version{ reader.RequireString("format_version") };
    if (format_version != ManifestFormatVersion())
    {
        throw LoadError{
            fmt::format("{} has format version {}, expected {}, recompile it with prepare",
                        source,
                        format_version,
                        ManifestFormatVersion()),
        };
    }

    Manifest manifest;

    for (const auto& [i, table] : reader.TableArray("collection") | std::views::enumerate)
    {
        const TomlTableReader collection{
            *table,
            fmt::format("{}: [[collection]] #{}", source, i + 1),
            { "group", "name" },
        };
        manifest.m_Collections.push_back(Collection{
            collection.RequireString("group"),
            collection.RequireString("name"),
        });
    }

    for (const auto& [i, table] : reader.TableArray("card") | std::views::enumerate)
    {
        manifest.m_Cards.push_back(ReadCard(*table, fmt::format("{}: [[card]] #{}", source, i + 1)));
    }

    for (const auto& [i, table] : reader.TableArray("insert") | std::views::enumerate)
    {
        const TomlTableReader insert{
            *table,
            fmt::format("{}: [[insert]] #{}", source, i + 1),
            { "name", "group", "title", "stripped_title", "insert_groups" },
        };
        manifest.m_Inserts.push_back(Insert{
            insert.RequireId("name"),
            insert.RequireString("group"),
            ReadTitle(insert),
            insert.OptionalStringArray("insert_groups").value_or(std::vector<std::string>{}),
        });
    }

    for (const auto& [i, table] : reader.TableArray("nrdb_remap") | std::views::enumerate)
    {
        const TomlTableReader remap{
            *table,
            fmt::format("{}: [[nrdb_remap]] #{}", source, i + 1),
            { "from", "to" },
        };
        manifest.m_NrdbRemaps.push_back(NrdbRemap{
            remap.RequireUnsigned("from"),
            remap.RequireUnsigned("to"),
        });
    }

    for (const auto& [i, table] : reader.TableArray("local_image") | std::views::enumerate)
    {
        const TomlTableReader local_image{
            *table,
            fmt::format("{}: [[local_image]] #{}", source, i + 1),
            { "group", "id", "face", "url" },
        };
        manifest.m_LocalImages.push_back(LocalImageOverride{
            .m_Group{ local_image.RequireString("group") },
            .m_Id = local_image.RequireUnsigned("id"),
            .m_Face{ local_image.OptionalUnsigned("face") },
            .m_Url{ local_image.RequireString("url") },
        });
    }

    return manifest;
}

void RemoveStagingFiles(std::span<const fs::path> staging_paths)
{
    for (const fs::path& staging_path : staging_paths)
    {
        std::error_code error;
        fs::remove(staging_path, error);
        if (error)
        {
            LogWarning("Could not remove staging file {}: {}", staging_path.string(), error.message());
        }
    }
}

struct CommittedOutput
{
    fs::path m_Path;
    std::optional<fs::path> m_Backup{};
};

// Puts back whatever was at each path before, or removes the new file if nothing was
void RollBackOutputs(std::span<const CommittedOutput> committed)
{
    for (const CommittedOutput& output : committed | std::views::reverse)
    {
        std::error_code error;
        if (output.m_Backup.has_value())
        {
            if (fs::exists(output.m_Backup.value(), error))
            {
                fs::rename(output.m_Backup.value(), output.m_Path, error);
            }
        }
        else if (fs::is_regular_file(output.m_Path, error))
        {
            fs::remove(output.m_Path, error);
        }

        if (error)
        {
            LogError("Could not restore {}: {}", output.m_Path.string(), error.message());
        }
    }
}
} // namespace

void SortManifest(Manifest& manifest)
{
    std::ranges::sort(manifest.m_Collections, {}, &Collection::m_Group);

    std::ranges::sort(manifest.m_Cards,
                      {},
                      [](const Card& card)
                      { return std::tie(card.m_Group, card.m_Id); });
    for (Card& card : manifest.m_Cards)
    {
        std::ranges::sort(card.m_Printings,
                          {},
                          [](const Printing& printing)
                          { return std::tie(printing.m_Id, printing.m_Face, printing.m_Variant); });
    }

    std::ranges::sort(manifest.m_Inserts,
                      {},
                      [](const Insert& insert)
                      { return std::tie(insert.m_Group, insert.m_Name); });

    std::ranges::sort(manifest.m_NrdbRemaps, {}, &NrdbRemap::m_From);

    std::ranges::sort(manifest.m_LocalImages,
                      {},
                      [](const LocalImageOverride& local_image)
                      { return std::tie(local_image.m_Group, local_image.m_Id, local_image.m_Face, local_image.m_Url); });
}

std::string DumpManifest(const Manifest& manifest)
{
    Manifest sorted{ manifest };
    SortManifest(sorted);

    std::ostringstream out;
    out << toml::toml_formatter{ ManifestToToml(sorted) } << '\n';
    return std::move(out).str();
}

void WriteManifests(std::span<const ManifestOutput> outputs)
{
    std::vector<fs::path> staging_paths;
    try
    {
        for (const ManifestOutput& output : outputs)
        {
            const std::string text{ DumpManifest(*output.m_Manifest) };

            const fs::path staging_path{ StagingPath(output.m_Path) };
            if (output.m_Path.has_parent_path())
            {
                std::error_code error;
                fs::create_directories(output.m_Path.parent_path(), error);
                if (error)
                {
                    throw SerializationError{
                        fmt::format("Could not create directory {}: {}", output.m_Path.parent_path().string(), error.message()),
                    };
                }
            }

            staging_paths.push_back(staging_path);
            std::ofstream file{ staging_path, std::ios::binary | std::ios::trunc };
            if (!file.is_open())
            {
                throw SerializationError{ fmt::format("Could not open {} for writing", staging_path.string()) };
            }
            file << text;
            file.close();
            if (!file)
            {
                throw SerializationError{ fmt::format("Could not write {}", staging_path.string()) };
            }
        }

        for (const ManifestOutput& output : outputs)
        {
            std::error_code error;
            if (fs::exists(output.m_Path, error) && !fs::is_regular_file(output.m_Path, error))
            {
                throw SerializationError{ fmt::format("Could not write {}: Path exists and is not a file", output.m_Path.string()) };
            }
        }

        // Replaced files are kept until every output is in place
        std::vector<CommittedOutput> committed;
        AtScopeExit discard_backups{
            [&committed]()
            {
                for (const CommittedOutput& output : committed)
                {
                    if (output.m_Backup.has_value())
                    {
                        std::error_code error;
                        fs::remove(output.m_Backup.value(), error);
                    }
                }
            }
        };

        try
        {
            for (const auto& [output, staging_path] : std::views::zip(outputs, staging_paths))
            {
                CommittedOutput commit{ .m_Path{ output.m_Path } };

                std::error_code error;
                if (fs::exists(output.m_Path, error))
                {
                    fs::path backup{ output.m_Path };
                    backup += ".prev";
                    fs::rename(output.m_Path, backup, error);
                    if (error)
                    {
                        throw SerializationError{
                            fmt::format("Could not move {} aside: {}", output.m_Path.string(), error.message()),
                        };
                    }
                    commit.m_Backup = std::move(backup);
                }
                committed.push_back(std::move(commit));

                fs::rename(staging_path, output.m_Path, error);
                if (error)
                {
                    throw SerializationError{
                        fmt::format("Could not move {} to {}: {}", staging_path.string(), output.m_Path.string(), error.message()),
                    };
                }
            }
        }
        catch (const SerializationError&)
        {
            RollBackOutputs(committed);
            committed.clear();
            throw;
        }

        for (const ManifestOutput& output : outputs)
        {
            LogInfo("Wrote {}", output.m_Path.string());
        }
    }
    catch (const SerializationError&)
    {
        RemoveStagingFiles(staging_paths);
        throw;
    }
}

Manifest ReadManifest(const fs::path& path)
{
    const toml::table root{ ParseTomlFile(path) };
    return ManifestFromToml(root, path.string());
}

Manifest ParseManifest(std::string_view text, std::string_view source_name)
{
    const toml::table root{ ParseTomlString(text, source_name) };
    return ManifestFromToml(root, source_name);
}
