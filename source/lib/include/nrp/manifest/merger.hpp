#pragma once

#include <span>
#include <string_view>
#include <vector>

#include <nrp/manifest/overrides.hpp>
#include <nrp/manifest/source_loader.hpp>
#include <nrp/manifest/types.hpp>

struct CompiledManifests
{
    Manifest m_Primary;
    LocalOverlayManifest m_Overlay;
};

/*
        Applies the override file on top of the dataset and builds the local overlay from `local_overrides`
        Any conflict aborts the whole merge, nothing partial is ever returned
*/
CompiledManifests MergeOverrides(SourceDataset dataset,
                                 const OverrideFile& overrides,
                                 const OverrideFile* local_overrides);

// Applies card overrides in declaration order, `seed` provides titles and faces for ids not yet in `records`
void ApplyCardOverrides(std::vector<CardRecord>& records,
                        std::span<const CardOverride> overrides,
                        std::span<const Collection> groups,
                        std::string_view source,
                        const Manifest* seed = nullptr);

Card ExpandCard(const CardRecord& record);
std::vector<Card> ExpandCards(std::span<const CardRecord> records);

// Throws MergeConflictError if a printing id is claimed by two cards of one group
void CheckPrintingUniqueness(std::span<const Card> cards);

// Rewrites remapped printings in place and returns the remap table
std::vector<NrdbRemap> ResolveRemaps(std::vector<Card>& cards,
                                     std::span<const RemapOverride> remaps,
                                     std::string_view source);

std::vector<LocalImageOverride> ResolveLocalImages(const OverrideFile& overrides,
                                                   const Manifest& primary,
                                                   const LocalOverlayManifest& overlay);
