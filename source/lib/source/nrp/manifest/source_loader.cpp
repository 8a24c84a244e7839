#include <nrp/manifest/source_loader.hpp>

#include <algorithm>
#include <charconv>
#include <map>

#include <fmt/format.h>

#include <nrp/errors.hpp>
#include <nrp/json_util.hpp>
#include <nrp/util/log.hpp>

namespace
{
struct SourceCard
{
    Title m_Title;
    std::vector<Title> m_Faces;
};

SourceCard ReadSourceCard(const fs::path& cards_dir, const std::string& card_id)
{
    const fs::path card_path{ cards_dir / fmt::format("{}.json", card_id) };
    if (!fs::exists(card_path))
    {
        throw LoadError{ fmt::format("Card {} has no record, expected {}", card_id, card_path.string()) };
    }

    const nlohmann::json card_json = ReadJsonFile(card_path);
    const std::string context{ fmt::format("{} (card {})", card_path.string(), card_id) };

    SourceCard card{
        MakeTitle(GetJsonField<std::string>(card_json, "title", context),
                  GetOptionalJsonField<std::string>(card_json, "stripped_title", context)),
        {},
    };

    if (const auto faces{ GetOptionalJsonField<nlohmann::json>(card_json, "faces", context) })
    {
        if (!faces->is_array())
        {
            throw LoadError{ fmt::format("{}: field `faces` must be an array", context) };
        }

        for (size_t i = 0; i < faces->size(); ++i)
        {
            const nlohmann::json& face{ faces->at(i) };
            const std::string face_context{ fmt::format("{} face #{}", context, i + 1) };
            card.m_Faces.push_back(
                MakeTitle(GetJsonField<std::string>(face, "title", face_context),
                          GetOptionalJsonField<std::string>(face, "stripped_title", face_context)));
        }
    }

    return card;
}
} // namespace

CardRecord* SourceDataset::FindCard(std::string_view group, std::string_view card_id)
{
    const auto it{
        std::ranges::find_if(m_Cards,
                             [&](const CardRecord& card)
                             { return card.m_Group == group && card.m_Id == card_id; }),
    };
    return it != m_Cards.end() ? &*it : nullptr;
}

const CardRecord* SourceDataset::FindCard(std::string_view group, std::string_view card_id) const
{
    return const_cast<SourceDataset*>(this)->FindCard(group, card_id);
}

std::optional<uint32_t> ParsePrintingId(std::string_view id)
{
    uint32_t value{};
    const auto [ptr, ec]{ std::from_chars(id.data(), id.data() + id.size(), value) };
    if (id.empty() || ec != std::errc{} || ptr != id.data() + id.size())
    {
        return std::nullopt;
    }
    return value;
}

SourceDataset LoadSourceDataset(const fs::path& dataset_dir, std::span<const CollectionInput> collections)
{
    if (!fs::is_directory(dataset_dir))
    {
        throw LoadError{ fmt::format("Dataset directory {} does not exist", dataset_dir.string()) };
    }

    const fs::path printings_dir{ dataset_dir / "v2" / "printings" };
    const fs::path cards_dir{ dataset_dir / "v2" / "cards" };

    // Card files are shared between groups, only read each once
    std::map<std::string, SourceCard> card_cache;

    SourceDataset dataset;
    for (const CollectionInput& collection : collections)
    {
        if (std::ranges::contains(dataset.m_Collections, collection.m_Group, &Collection::m_Group))
        {
            throw LoadError{ fmt::format("Group {} is declared by more than one collection", collection.m_Group) };
        }
        dataset.m_Collections.push_back(Collection{ collection.m_Group, collection.m_Name });

        for (const InsertInput& insert : collection.m_Inserts)
        {
            if (std::ranges::any_of(dataset.m_Inserts,
                                    [&](const Insert& existing)
                                    { return existing.m_Group == collection.m_Group && existing.m_Name == insert.m_Id; }))
            {
                throw LoadError{ fmt::format("Insert {} is declared twice in group {}", insert.m_Id, collection.m_Group) };
            }

            dataset.m_Inserts.push_back(Insert{
                insert.m_Id,
                collection.m_Group,
                MakeTitle(insert.m_Title, insert.m_StrippedTitle),
                insert.m_InsertGroups,
            });
        }

        for (const CollectionPrintingInput& printing_file : collection.m_Printings)
        {
            const fs::path printings_path{ printings_dir / fmt::format("{}.json", printing_file.m_Spec) };
            const nlohmann::json printings_json = ReadJsonFile(printings_path);
            if (!printings_json.is_array())
            {
                throw LoadError{ fmt::format("{}: expected an array of printings", printings_path.string()) };
            }

            LogDebug("Reading {} printings from {}", printings_json.size(), printings_path.string());

            for (size_t i = 0; i < printings_json.size(); ++i)
            {
                const nlohmann::json& printing_json{ printings_json.at(i) };
                const std::string context{ fmt::format("{} printing #{}", printings_path.string(), i + 1) };

                const std::string id_str{ GetJsonField<std::string>(printing_json, "id", context) };
                const auto printing_id{ ParsePrintingId(id_str) };
                if (!printing_id.has_value())
                {
                    throw LoadError{ fmt::format("{}: printing id {} is not a number", context, id_str) };
                }

                const std::string card_id{ GetJsonField<std::string>(printing_json, "card_id", context) };
                const auto printing_faces{ GetOptionalJsonField<nlohmann::json>(printing_json, "faces", context) };
                if (printing_faces.has_value() && !printing_faces->is_array())
                {
                    throw LoadError{ fmt::format("{} (id {}): field `faces` must be an array", context, id_str) };
                }

                CardRecord* card{ dataset.FindCard(collection.m_Group, card_id) };
                if (card == nullptr)
                {
                    auto cached{ card_cache.find(card_id) };
                    if (cached == card_cache.end())
                    {
                        cached = card_cache.emplace(card_id, ReadSourceCard(cards_dir, card_id)).first;
                    }

                    dataset.m_Cards.push_back(CardRecord{
                        .m_Id{ card_id },
                        .m_Group{ collection.m_Group },
                        .m_Title{ cached->second.m_Title },
                        .m_Faces{ cached->second.m_Faces },
                        .m_Variants{},
                        .m_Printings{},
                    });
                    card = &dataset.m_Cards.back();
                }

                // Faces on a printing of a single-titled card are art variants
                if (printing_faces.has_value() && !printing_faces->empty() && card->m_Faces.empty())
                {
                    const auto num_variants{ static_cast<uint32_t>(printing_faces->size() + 1) };
                    card->m_Variants = std::max(card->m_Variants.value_or(0), num_variants);
                }

                if (std::ranges::contains(card->m_Printings, printing_id.value(), &PrintingRoot::m_Id))
                {
                    throw LoadError{ fmt::format("{}: printing {} is listed twice for card {}", context, id_str, card_id) };
                }
                card->m_Printings.push_back(PrintingRoot{ printing_id.value(), printing_file.m_Name });
            }
        }
    }

    LogInfo("Loaded {} cards and {} inserts in {} groups from {}",
            dataset.m_Cards.size(),
            dataset.m_Inserts.size(),
            dataset.m_Collections.size(),
            dataset_dir.string());

    return dataset;
}
