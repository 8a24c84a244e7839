#pragma once

#include <span>
#include <vector>

#include <nrp/manifest/overrides.hpp>
#include <nrp/manifest/types.hpp>
#include <nrp/util.hpp>

/*
        Raw contents of a netrunner-cards-json checkout, restricted to the printing files the collections name
        Cards are unexpanded and kept in dataset order
*/
struct SourceDataset
{
    std::vector<Collection> m_Collections;
    std::vector<CardRecord> m_Cards;
    std::vector<Insert> m_Inserts;

    CardRecord* FindCard(std::string_view group, std::string_view card_id);
    const CardRecord* FindCard(std::string_view group, std::string_view card_id) const;
};

SourceDataset LoadSourceDataset(const fs::path& dataset_dir, std::span<const CollectionInput> collections);

// Parses a dataset printing id such as "01001"
std::optional<uint32_t> ParsePrintingId(std::string_view id);
