#include <nrp/manifest/types.hpp>

#include <algorithm>
#include <ranges>

#include <fmt/format.h>

#include <nrp/util.hpp>

Title MakeTitle(std::string title, std::optional<std::string> stripped_title)
{
    std::string stripped{ stripped_title.has_value()
                               ? std::move(stripped_title).value()
                               : StripNonAscii(title) };
    return Title{
        std::move(title),
        std::move(stripped),
    };
}

std::optional<uint32_t> PrintingKey::Specifier() const
{
    return m_Face.has_value() ? m_Face : m_Variant;
}

std::string ToString(const PrintingKey& key)
{
    if (const auto specifier{ key.Specifier() })
    {
        return fmt::format("{}/{}.{}", key.m_Group, key.m_Id, specifier.value());
    }
    return fmt::format("{}/{}", key.m_Group, key.m_Id);
}

std::optional<uint32_t> Printing::Specifier() const
{
    return m_Face.has_value() ? m_Face : m_Variant;
}

PrintingKey Card::KeyOf(const Printing& printing) const
{
    return PrintingKey{
        m_Group,
        printing.m_Id,
        printing.m_Face,
        printing.m_Variant,
    };
}

const Printing* Card::FindPrinting(uint32_t id, std::optional<uint32_t> specifier) const
{
    const auto it{
        std::ranges::find_if(m_Printings,
                             [&](const Printing& printing)
                             { return printing.m_Id == id && printing.Specifier() == specifier; }),
    };
    return it != m_Printings.end() ? &*it : nullptr;
}

std::vector<const Printing*> Card::FindPrintings(uint32_t id) const
{
    std::vector<const Printing*> printings;
    for (const Printing& printing : m_Printings)
    {
        if (printing.m_Id == id)
        {
            printings.push_back(&printing);
        }
    }
    return printings;
}

bool Manifest::Empty() const
{
    return m_Cards.empty() && m_Inserts.empty() && m_NrdbRemaps.empty() && m_LocalImages.empty();
}

bool Manifest::HasGroup(std::string_view group) const
{
    return std::ranges::contains(m_Collections, group, &Collection::m_Group);
}

const Card* Manifest::FindCard(std::string_view group, std::string_view card_id) const
{
    const auto it{
        std::ranges::find_if(m_Cards,
                             [&](const Card& card)
                             { return card.m_Group == group && card.m_Id == card_id; }),
    };
    return it != m_Cards.end() ? &*it : nullptr;
}

const Card* Manifest::FindCardByPrinting(std::string_view group, uint32_t printing_id) const
{
    const auto it{
        std::ranges::find_if(m_Cards,
                             [&](const Card& card)
                             {
                                 return card.m_Group == group &&
                                        std::ranges::contains(card.m_Printings, printing_id, &Printing::m_Id);
                             }),
    };
    return it != m_Cards.end() ? &*it : nullptr;
}

const Insert* Manifest::FindInsert(std::string_view group, std::string_view name) const
{
    const auto it{
        std::ranges::find_if(m_Inserts,
                             [&](const Insert& insert)
                             { return insert.m_Group == group && insert.m_Name == name; }),
    };
    return it != m_Inserts.end() ? &*it : nullptr;
}

const LocalImageOverride* Manifest::FindLocalImage(const PrintingKey& key) const
{
    const auto specifier{ key.Specifier() };
    const auto it{
        std::ranges::find_if(m_LocalImages,
                             [&](const LocalImageOverride& local_image)
                             {
                                 return local_image.m_Group == key.m_Group &&
                                        local_image.m_Id == key.m_Id &&
                                        local_image.m_Face == specifier;
                             }),
    };
    return it != m_LocalImages.end() ? &*it : nullptr;
}

std::optional<uint32_t> Manifest::FindRemap(uint32_t from) const
{
    const auto it{ std::ranges::find(m_NrdbRemaps, from, &NrdbRemap::m_From) };
    if (it != m_NrdbRemaps.end())
    {
        return it->m_To;
    }
    return std::nullopt;
}

size_t Manifest::NumPrintings() const
{
    size_t num_printings{ 0 };
    for (const Card& card : m_Cards)
    {
        num_printings += card.m_Printings.size();
    }
    return num_printings;
}

std::vector<PrintingKey> Manifest::PrintingKeys() const
{
    std::vector<PrintingKey> keys;
    keys.reserve(NumPrintings());
    for (const Card& card : m_Cards)
    {
        for (const Printing& printing : card.m_Printings)
        {
            keys.push_back(card.KeyOf(printing));
        }
    }
    return keys;
}
