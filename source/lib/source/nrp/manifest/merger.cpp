#include <nrp/manifest/merger.hpp>

#include <algorithm>
#include <iterator>
#include <map>
#include <ranges>
#include <set>
#include <tuple>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <nrp/errors.hpp>
#include <nrp/util.hpp>
#include <nrp/util/log.hpp>

namespace
{
std::string FacesString(const std::vector<Title>& faces)
{
    const auto titles{ faces | std::views::transform(&Title::m_Title) };
    return fmt::format("[{}]", fmt::join(titles, ", "));
}

std::string VariantsString(std::optional<uint32_t> variants)
{
    return variants.has_value() ? fmt::format("{}", variants.value()) : std::string{ "none" };
}

class CardOverrideApplier
{
  public:
    CardOverrideApplier(CardRecord& card, const CardOverride& card_override, std::string_view source)
        : m_Card{ card }
        , m_Override{ card_override }
        , m_Source{ source }
    {
    }

    void Apply()
    {
        if (m_Override.m_Title.has_value())
        {
            Title title{ MakeTitle(m_Override.m_Title.value(), m_Override.m_StrippedTitle) };
            if (!m_Card.m_Title.m_Title.empty() && m_Card.m_Title.m_Title != title.m_Title)
            {
                Warn("title", m_Card.m_Title.m_Title, title.m_Title);
            }
            if (m_Override.m_StrippedTitle.has_value() &&
                !m_Card.m_Title.m_StrippedTitle.empty() &&
                m_Card.m_Title.m_StrippedTitle != title.m_StrippedTitle)
            {
                Warn("stripped_title", m_Card.m_Title.m_StrippedTitle, title.m_StrippedTitle);
            }
            m_Card.m_Title = std::move(title);
        }
        else if (m_Override.m_StrippedTitle.has_value())
        {
            const std::string& stripped_title{ m_Override.m_StrippedTitle.value() };
            if (!m_Card.m_Title.m_StrippedTitle.empty() && m_Card.m_Title.m_StrippedTitle != stripped_title)
            {
                Warn("stripped_title", m_Card.m_Title.m_StrippedTitle, stripped_title);
            }
            m_Card.m_Title.m_StrippedTitle = stripped_title;
        }

        if (m_Override.m_Faces.has_value())
        {
            std::vector<Title> faces{
                m_Override.m_Faces.value() |
                std::views::transform([](const std::string& face)
                                      { return MakeTitle(face); }) |
                std::ranges::to<std::vector>(),
            };
            if (!m_Card.m_Faces.empty() && m_Card.m_Faces != faces)
            {
                Warn("faces", FacesString(m_Card.m_Faces), FacesString(faces));
            }
            if (m_Card.m_Variants.has_value())
            {
                Warn("variants", VariantsString(m_Card.m_Variants), VariantsString(std::nullopt));
            }
            m_Card.m_Faces = std::move(faces);
            m_Card.m_Variants = std::nullopt;
        }

        if (m_Override.m_Variants.has_value())
        {
            if (m_Card.m_Variants.has_value() && m_Card.m_Variants != m_Override.m_Variants)
            {
                Warn("variants", VariantsString(m_Card.m_Variants), VariantsString(m_Override.m_Variants));
            }
            if (!m_Card.m_Faces.empty())
            {
                Warn("faces", FacesString(m_Card.m_Faces), FacesString({}));
            }
            m_Card.m_Variants = m_Override.m_Variants;
            m_Card.m_Faces.clear();
        }

        if (m_Override.m_Printings.empty())
        {
            // Without printings the printing name renames everything the card already has
            if (m_Override.m_PrintingName.has_value())
            {
                for (PrintingRoot& printing : m_Card.m_Printings)
                {
                    SetPrintingName(printing, m_Override.m_PrintingName.value());
                }
            }
            return;
        }

        for (const PrintingInput& printing_input : m_Override.m_Printings)
        {
            const std::optional<std::string>& explicit_name{
                printing_input.m_Name.has_value()
                    ? printing_input.m_Name
                    : m_Override.m_PrintingName,
            };

            // Existing printings keep their name unless one is given
            const auto existing{ std::ranges::find(m_Card.m_Printings, printing_input.m_Id, &PrintingRoot::m_Id) };
            if (existing != m_Card.m_Printings.end())
            {
                if (explicit_name.has_value())
                {
                    SetPrintingName(*existing, explicit_name.value());
                }
            }
            else
            {
                m_Card.m_Printings.push_back(PrintingRoot{
                    printing_input.m_Id,
                    explicit_name.value_or(std::string{ c_DefaultPrintingName }),
                });
            }
        }
    }

  private:
    void SetPrintingName(PrintingRoot& printing, const std::string& name)
    {
        if (printing.m_Name != name)
        {
            Warn(fmt::format("name of printing {}", printing.m_Id), printing.m_Name, name);
            printing.m_Name = name;
        }
    }

    void Warn(std::string_view field, std::string_view from, std::string_view to) const
    {
        LogWarning("{}: [[card]] #{} overrides {} of card {}/{}: `{}` -> `{}`",
                   m_Source,
                   m_Override.m_Index + 1,
                   field,
                   m_Card.m_Group,
                   m_Card.m_Id,
                   from,
                   to);
    }

    CardRecord& m_Card;
    const CardOverride& m_Override;
    std::string_view m_Source;
};

std::string ExpandedPrintingName(std::string_view name, std::string_view kind, uint32_t ordinal, size_t count)
{
    return fmt::format("{} ({} {}/{})", name, kind, ordinal, count);
}

bool IsRemapSource(std::span<const RemapOverride> remaps, uint32_t id)
{
    return std::ranges::contains(remaps, id, &RemapOverride::m_From);
}

void ValidateRemapTable(std::span<const RemapOverride> remaps, std::string_view source)
{
    std::set<uint32_t> seen_sources;
    for (const auto& [i, remap] : remaps | std::views::enumerate)
    {
        if (remap.m_From == remap.m_To)
        {
            throw MergeConflictError{
                fmt::format("{}: [[nrdb_remap]] #{} maps printing {} onto itself", source, i + 1, remap.m_From),
            };
        }
        if (!seen_sources.insert(remap.m_From).second)
        {
            throw MergeConflictError{
                fmt::format("{}: [[nrdb_remap]] #{} remaps printing {} a second time", source, i + 1, remap.m_From),
            };
        }
        if (IsRemapSource(remaps, remap.m_To))
        {
            throw MergeConflictError{
                fmt::format("{}: [[nrdb_remap]] #{} chains {} -> {} into another remap, remaps must be a single hop",
                            source,
                            i + 1,
                            remap.m_From,
                            remap.m_To),
            };
        }
    }
}

bool HasPrintingId(std::span<const Card> cards, uint32_t id)
{
    return std::ranges::any_of(cards,
                               [id](const Card& card)
                               { return std::ranges::contains(card.m_Printings, id, &Printing::m_Id); });
}

void CheckOverlayAgainstPrimary(const Manifest& primary, std::span<const Card> overlay_cards)
{
    for (const Card& overlay_card : overlay_cards)
    {
        for (const Printing& printing : overlay_card.m_Printings)
        {
            if (const auto remapped_to{ primary.FindRemap(printing.m_Id) })
            {
                throw MergeConflictError{
                    fmt::format("Local printing {} of card {} uses an id the primary manifest remaps to {}",
                                ToString(overlay_card.KeyOf(printing)),
                                overlay_card.m_Id,
                                remapped_to.value()),
                };
            }

            const Card* primary_card{ primary.FindCardByPrinting(overlay_card.m_Group, printing.m_Id) };
            if (primary_card == nullptr)
            {
                continue;
            }

            if (primary_card->m_Id != overlay_card.m_Id)
            {
                throw MergeConflictError{
                    fmt::format("Local printing {} of card {} belongs to card {} in the primary manifest",
                                ToString(overlay_card.KeyOf(printing)),
                                overlay_card.m_Id,
                                primary_card->m_Id),
                };
            }
            if (primary_card->FindPrinting(printing.m_Id, printing.Specifier()) != nullptr)
            {
                throw MergeConflictError{
                    fmt::format("Local printing {} of card {} already exists in the primary manifest",
                                ToString(overlay_card.KeyOf(printing)),
                                overlay_card.m_Id),
                };
            }
        }
    }
}

std::vector<NrdbRemap> ResolveOverlayRemaps(const Manifest& primary,
                                            std::span<const Card> overlay_cards,
                                            std::span<const RemapOverride> remaps,
                                            std::string_view source)
{
    ValidateRemapTable(remaps, source);

    std::vector<NrdbRemap> resolved;
    for (const auto& [i, remap] : remaps | std::views::enumerate)
    {
        if (primary.FindRemap(remap.m_From).has_value())
        {
            throw MergeConflictError{
                fmt::format("{}: [[nrdb_remap]] #{} remaps printing {} which the primary manifest already remaps",
                            source,
                            i + 1,
                            remap.m_From),
            };
        }
        if (HasPrintingId(primary.m_Cards, remap.m_From) || HasPrintingId(overlay_cards, remap.m_From))
        {
            throw MergeConflictError{
                fmt::format("{}: [[nrdb_remap]] #{} remaps printing {} which is still a printing, local remaps never rewrite printings",
                            source,
                            i + 1,
                            remap.m_From),
            };
        }
        if (!HasPrintingId(primary.m_Cards, remap.m_To) && !HasPrintingId(overlay_cards, remap.m_To))
        {
            throw MergeConflictError{
                fmt::format("{}: [[nrdb_remap]] #{} targets printing {} which does not exist", source, i + 1, remap.m_To),
            };
        }
        resolved.push_back(NrdbRemap{ remap.m_From, remap.m_To });
    }
    return resolved;
}

std::string LocalImageUrl(const LocalImageInput& local_image,
                          const std::optional<LocalImageRootInput>& root,
                          std::optional<uint32_t> specifier)
{
    if (local_image.m_Url.has_value())
    {
        return local_image.m_Url.value();
    }
    if (local_image.m_Path.has_value())
    {
        return ToFileUrl(local_image.m_Path.value());
    }

    const std::string file_name{
        specifier.has_value()
            ? fmt::format("{}.{}.webp", local_image.m_Id, specifier.value())
            : fmt::format("{}.webp", local_image.m_Id),
    };

    const auto trim_slashes{
        [](std::string root_str)
        {
            std::ranges::replace(root_str, '\\', '/');
            while (root_str.ends_with('/'))
            {
                root_str.pop_back();
            }
            return root_str;
        }
    };

    if (root.has_value() && root->m_Url.has_value())
    {
        return fmt::format("{}/{}", trim_slashes(root->m_Url.value()), file_name);
    }
    if (root.has_value() && root->m_Path.has_value())
    {
        return ToFileUrl(fmt::format("{}/{}", trim_slashes(root->m_Path.value()), file_name));
    }

    throw LoadError{
        fmt::format("Local image {} has neither `url` nor `path` and there is no [local_image_root]", local_image.m_Id),
    };
}
} // namespace

void ApplyCardOverrides(std::vector<CardRecord>& records,
                        std::span<const CardOverride> overrides,
                        std::span<const Collection> groups,
                        std::string_view source,
                        const Manifest* seed)
{
    std::set<std::pair<std::string, std::string>> added_cards;

    for (const CardOverride& card_override : overrides)
    {
        if (!std::ranges::contains(groups, card_override.m_Group, &Collection::m_Group))
        {
            throw LoadError{
                fmt::format("{}: [[card]] #{} (id {}) uses group {} which no collection declares",
                            source,
                            card_override.m_Index + 1,
                            card_override.m_Id,
                            card_override.m_Group),
            };
        }

        auto card{
            std::ranges::find_if(records,
                                 [&](const CardRecord& record)
                                 { return record.m_Group == card_override.m_Group && record.m_Id == card_override.m_Id; }),
        };
        if (card == records.end())
        {
            CardRecord record{
                .m_Id{ card_override.m_Id },
                .m_Group{ card_override.m_Group },
                .m_Title{},
                .m_Faces{},
                .m_Variants{},
                .m_Printings{},
            };

            if (seed != nullptr)
            {
                if (const Card* seed_card{ seed->FindCard(card_override.m_Group, card_override.m_Id) })
                {
                    record.m_Title = seed_card->m_Title;
                    record.m_Faces = seed_card->m_Faces;
                    record.m_Variants = seed_card->m_Variants;
                }
            }

            LogDebug("{}: [[card]] #{} adds card {}/{}", source, card_override.m_Index + 1, record.m_Group, record.m_Id);
            added_cards.emplace(record.m_Group, record.m_Id);
            records.push_back(std::move(record));
            card = std::prev(records.end());
        }

        CardOverrideApplier{ *card, card_override, source }.Apply();
    }

    for (const CardRecord& record : records)
    {
        if (!added_cards.contains({ record.m_Group, record.m_Id }))
        {
            continue;
        }

        if (record.m_Title.m_Title.empty())
        {
            throw LoadError{ fmt::format("{}: new card {}/{} has no `title`", source, record.m_Group, record.m_Id) };
        }
        if (record.m_Printings.empty())
        {
            throw LoadError{
                fmt::format("{}: new card {}/{} has neither `printing_id` nor `printings`", source, record.m_Group, record.m_Id),
            };
        }
    }
}

Card ExpandCard(const CardRecord& record)
{
    Card card{
        .m_Id{ record.m_Id },
        .m_Group{ record.m_Group },
        .m_Title{ record.m_Title },
        .m_Faces{ record.m_Faces },
        .m_Variants{ record.m_Variants },
        .m_Printings{},
    };

    for (const PrintingRoot& root : record.m_Printings)
    {
        if (!record.m_Faces.empty())
        {
            const size_t num_faces{ record.m_Faces.size() + 1 };
            for (uint32_t face = 1; face <= num_faces; ++face)
            {
                card.m_Printings.push_back(Printing{
                    .m_Id = root.m_Id,
                    .m_Name{ ExpandedPrintingName(root.m_Name, "face", face, num_faces) },
                    .m_Face = face,
                    .m_Variant{},
                });
            }
        }
        else if (record.m_Variants.has_value())
        {
            const uint32_t num_variants{ record.m_Variants.value() };
            for (uint32_t variant = 1; variant <= num_variants; ++variant)
            {
                card.m_Printings.push_back(Printing{
                    .m_Id = root.m_Id,
                    .m_Name{ ExpandedPrintingName(root.m_Name, "variant", variant, num_variants) },
                    .m_Face{},
                    .m_Variant = variant,
                });
            }
        }
        else
        {
            card.m_Printings.push_back(Printing{
                .m_Id = root.m_Id,
                .m_Name{ root.m_Name },
                .m_Face{},
                .m_Variant{},
            });
        }
    }

    return card;
}

std::vector<Card> ExpandCards(std::span<const CardRecord> records)
{
    return records | std::views::transform(&ExpandCard) | std::ranges::to<std::vector>();
}

void CheckPrintingUniqueness(std::span<const Card> cards)
{
    std::map<std::pair<std::string_view, uint32_t>, std::string_view> printing_owners;
    for (const Card& card : cards)
    {
        for (const Printing& printing : card.m_Printings)
        {
            const auto [it, inserted]{ printing_owners.try_emplace({ card.m_Group, printing.m_Id }, card.m_Id) };
            if (!inserted && it->second != card.m_Id)
            {
                throw MergeConflictError{
                    fmt::format("Printing {}/{} is claimed by both card {} and card {}",
                                card.m_Group,
                                printing.m_Id,
                                it->second,
                                card.m_Id),
                };
            }
        }
    }
}

std::vector<NrdbRemap> ResolveRemaps(std::vector<Card>& cards,
                                     std::span<const RemapOverride> remaps,
                                     std::string_view source)
{
    ValidateRemapTable(remaps, source);

    std::vector<NrdbRemap> resolved;
    for (const auto& [i, remap] : remaps | std::views::enumerate)
    {
        if (!HasPrintingId(cards, remap.m_From))
        {
            throw MergeConflictError{
                fmt::format("{}: [[nrdb_remap]] #{} remaps printing {} which does not exist", source, i + 1, remap.m_From),
            };
        }

        if (HasPrintingId(cards, remap.m_To))
        {
            if (!remap.m_Supersede)
            {
                throw MergeConflictError{
                    fmt::format("{}: [[nrdb_remap]] #{} remaps {} onto existing printing {}, set `supersede = true` to replace it",
                                source,
                                i + 1,
                                remap.m_From,
                                remap.m_To),
                };
            }

            for (Card& card : cards)
            {
                const size_t num_erased{ std::erase_if(card.m_Printings,
                                                       [&](const Printing& printing)
                                                       { return printing.m_Id == remap.m_To; }) };
                if (num_erased > 0)
                {
                    LogWarning("{}: [[nrdb_remap]] #{} supersedes {} printings {} of card {}/{} with printing {}",
                               source,
                               i + 1,
                               num_erased,
                               remap.m_To,
                               card.m_Group,
                               card.m_Id,
                               remap.m_From);
                }
            }

            std::erase_if(cards,
                          [&](const Card& card)
                          {
                              if (card.m_Printings.empty())
                              {
                                  LogWarning("{}: card {}/{} has no printings left after remapping and is dropped",
                                             source,
                                             card.m_Group,
                                             card.m_Id);
                                  return true;
                              }
                              return false;
                          });
        }

        for (Card& card : cards)
        {
            for (Printing& printing : card.m_Printings)
            {
                if (printing.m_Id == remap.m_From)
                {
                    printing.m_Id = remap.m_To;
                }
            }
        }

        LogDebug("Remapped printing {} to {}", remap.m_From, remap.m_To);
        resolved.push_back(NrdbRemap{ remap.m_From, remap.m_To });
    }

    return resolved;
}

std::vector<LocalImageOverride> ResolveLocalImages(const OverrideFile& overrides,
                                                   const Manifest& primary,
                                                   const LocalOverlayManifest& overlay)
{
    std::vector<LocalImageOverride> local_images;
    for (const auto& [i, local_image] : overrides.m_LocalImages | std::views::enumerate)
    {
        if (!primary.HasGroup(local_image.m_Group))
        {
            throw LoadError{
                fmt::format("{}: [[local_image]] #{} (id {}) uses group {} which no collection declares",
                            overrides.m_Source,
                            i + 1,
                            local_image.m_Id,
                            local_image.m_Group),
            };
        }

        std::vector<std::optional<uint32_t>> specifiers;
        for (const Manifest* manifest : { &primary, &overlay })
        {
            for (const Card& card : manifest->m_Cards)
            {
                if (card.m_Group != local_image.m_Group)
                {
                    continue;
                }
                for (const Printing* printing : card.FindPrintings(local_image.m_Id))
                {
                    specifiers.push_back(printing->Specifier());
                }
            }
        }

        if (specifiers.empty())
        {
            throw MergeConflictError{
                fmt::format("{}: [[local_image]] #{} does not match any printing {}/{}",
                            overrides.m_Source,
                            i + 1,
                            local_image.m_Group,
                            local_image.m_Id),
            };
        }

        std::optional<uint32_t> specifier;
        if (local_image.m_Face.has_value())
        {
            if (!std::ranges::contains(specifiers, local_image.m_Face))
            {
                throw MergeConflictError{
                    fmt::format("{}: [[local_image]] #{} asks for face {} which printing {}/{} does not have",
                                overrides.m_Source,
                                i + 1,
                                local_image.m_Face.value(),
                                local_image.m_Group,
                                local_image.m_Id),
                };
            }
            specifier = local_image.m_Face;
        }
        else if (specifiers.size() == 1)
        {
            specifier = specifiers.front();
        }
        else
        {
            throw MergeConflictError{
                fmt::format("{}: [[local_image]] #{} matches {} faces of printing {}/{}, specify `face`",
                            overrides.m_Source,
                            i + 1,
                            specifiers.size(),
                            local_image.m_Group,
                            local_image.m_Id),
            };
        }

        local_images.push_back(LocalImageOverride{
            .m_Group{ local_image.m_Group },
            .m_Id = local_image.m_Id,
            .m_Face = specifier,
            .m_Url{ LocalImageUrl(local_image, overrides.m_LocalImageRoot, specifier) },
        });
    }
    return local_images;
}

CompiledManifests MergeOverrides(SourceDataset dataset,
                                 const OverrideFile& overrides,
                                 const OverrideFile* local_overrides)
{
    CompiledManifests compiled{};

    std::vector<CardRecord> records{ std::move(dataset.m_Cards) };
    ApplyCardOverrides(records, overrides.m_Cards, dataset.m_Collections, overrides.m_Source);

    std::vector<Card> cards{ ExpandCards(records) };
    CheckPrintingUniqueness(cards);

    Manifest& primary{ compiled.m_Primary };
    primary.m_NrdbRemaps = ResolveRemaps(cards, overrides.m_Remaps, overrides.m_Source);
    primary.m_Collections = std::move(dataset.m_Collections);
    primary.m_Cards = std::move(cards);
    primary.m_Inserts = std::move(dataset.m_Inserts);

    LocalOverlayManifest& overlay{ compiled.m_Overlay };
    if (local_overrides != nullptr)
    {
        if (!local_overrides->m_Collections.empty())
        {
            throw LoadError{ fmt::format("{}: [[collection]] is not allowed in a local override file", local_overrides->m_Source) };
        }

        std::vector<CardRecord> overlay_records;
        ApplyCardOverrides(overlay_records, local_overrides->m_Cards, primary.m_Collections, local_overrides->m_Source, &primary);

        std::vector<Card> overlay_cards{ ExpandCards(overlay_records) };
        CheckPrintingUniqueness(overlay_cards);
        CheckOverlayAgainstPrimary(primary, overlay_cards);

        overlay.m_NrdbRemaps = ResolveOverlayRemaps(primary, overlay_cards, local_overrides->m_Remaps, local_overrides->m_Source);
        overlay.m_Cards = std::move(overlay_cards);
    }

    overlay.m_LocalImages = ResolveLocalImages(overrides, primary, overlay);
    if (local_overrides != nullptr)
    {
        std::ranges::move(ResolveLocalImages(*local_overrides, primary, overlay), std::back_inserter(overlay.m_LocalImages));
    }

    std::set<std::tuple<std::string_view, uint32_t, std::optional<uint32_t>>> local_image_keys;
    for (const LocalImageOverride& local_image : overlay.m_LocalImages)
    {
        if (!local_image_keys.emplace(local_image.m_Group, local_image.m_Id, local_image.m_Face).second)
        {
            const PrintingKey key{ local_image.m_Group, local_image.m_Id, local_image.m_Face, std::nullopt };
            throw MergeConflictError{ fmt::format("Printing {} has more than one local image", ToString(key)) };
        }
    }

    LogInfo("Merged {} cards with {} printings and {} remaps",
            primary.m_Cards.size(),
            primary.NumPrintings(),
            primary.m_NrdbRemaps.size());
    if (!overlay.Empty())
    {
        LogInfo("Local overlay holds {} cards with {} printings, {} remaps and {} local images",
                overlay.m_Cards.size(),
                overlay.NumPrintings(),
                overlay.m_NrdbRemaps.size(),
                overlay.m_LocalImages.size());
    }

    return compiled;
}
