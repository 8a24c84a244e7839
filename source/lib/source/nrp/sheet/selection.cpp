#include <nrp/sheet/selection.hpp>

#include <algorithm>
#include <fstream>
#include <map>
#include <ranges>
#include <sstream>

#include <fmt/format.h>

#include <nrp/errors.hpp>
#include <nrp/manifest/source_loader.hpp>
#include <nrp/util/log.hpp>

namespace
{
constexpr std::string_view c_Whitespace{ " \t\r\n" };

std::string_view Trim(std::string_view str)
{
    const size_t first{ str.find_first_not_of(c_Whitespace) };
    if (first == std::string_view::npos)
    {
        return {};
    }
    const size_t last{ str.find_last_not_of(c_Whitespace) };
    return str.substr(first, last - first + 1);
}

std::vector<std::string_view> SplitWhitespace(std::string_view str)
{
    std::vector<std::string_view> tokens;
    while (!str.empty())
    {
        const size_t first{ str.find_first_not_of(c_Whitespace) };
        if (first == std::string_view::npos)
        {
            break;
        }
        str.remove_prefix(first);

        const size_t end{ std::min(str.find_first_of(c_Whitespace), str.size()) };
        tokens.push_back(str.substr(0, end));
        str.remove_prefix(end);
    }
    return tokens;
}

std::optional<uint32_t> ParseCount(std::string_view token)
{
    if (token.ends_with('x') || token.ends_with('X'))
    {
        token.remove_suffix(1);
    }
    const auto count{ ParsePrintingId(token) };
    if (!count.has_value() || count.value() == 0)
    {
        return std::nullopt;
    }
    return count;
}

std::string TrimTrailingSlashes(std::string_view root)
{
    while (root.ends_with('/'))
    {
        root.remove_suffix(1);
    }
    return std::string{ root };
}

class SelectionResolver
{
  public:
    SelectionResolver(const Manifest& manifest, const LocalOverlayManifest* overlay, std::string_view image_root)
        : m_Manifest{ manifest }
        , m_ImageRoot{ image_root }
    {
        m_Manifests.push_back(&manifest);
        if (overlay != nullptr)
        {
            m_Manifests.push_back(overlay);
        }
    }

    void Resolve(const SelectionEntry& entry, Selection& selection)
    {
        if (!m_Manifest.HasGroup(entry.m_Group))
        {
            throw LoadError{ fmt::format("Line {}: group {} is not part of the manifest", entry.m_Line, entry.m_Group) };
        }

        switch (entry.m_Kind)
        {
        case SelectionKind::Printing:
        {
            const auto printing_id{ ParsePrintingId(entry.m_Id) };
            if (!printing_id.has_value())
            {
                throw LoadError{ fmt::format("Line {}: {} is not a printing id", entry.m_Line, entry.m_Id) };
            }
            ResolvePrinting(entry, FollowRemap(printing_id.value(), entry.m_Line), selection);
            break;
        }
        case SelectionKind::Card:
            ResolvePrinting(entry, NewestPrinting(entry), selection);
            break;
        case SelectionKind::Insert:
            ResolveInsert(entry, selection);
            break;
        }
    }

  private:
    struct FoundPrinting
    {
        const Card* m_Card;
        const Printing* m_Printing;
    };

    uint32_t FollowRemap(uint32_t printing_id, size_t line) const
    {
        for (const Manifest* manifest : m_Manifests)
        {
            if (const auto remapped{ manifest->FindRemap(printing_id) })
            {
                LogInfo("Line {}: printing {} was remapped to {}", line, printing_id, remapped.value());
                return remapped.value();
            }
        }
        return printing_id;
    }

    uint32_t NewestPrinting(const SelectionEntry& entry) const
    {
        std::optional<uint32_t> newest;
        for (const Manifest* manifest : m_Manifests)
        {
            if (const Card* card{ manifest->FindCard(entry.m_Group, entry.m_Id) })
            {
                for (const Printing& printing : card->m_Printings)
                {
                    newest = std::max(newest.value_or(0), printing.m_Id);
                }
            }
        }

        if (!newest.has_value())
        {
            throw LoadError{ fmt::format("Line {}: unknown card {}/{}", entry.m_Line, entry.m_Group, entry.m_Id) };
        }
        return newest.value();
    }

    std::vector<FoundPrinting> FindPrintings(std::string_view group, uint32_t printing_id) const
    {
        std::vector<FoundPrinting> found;
        for (const Manifest* manifest : m_Manifests)
        {
            if (const Card* card{ manifest->FindCardByPrinting(group, printing_id) })
            {
                for (const Printing* printing : card->FindPrintings(printing_id))
                {
                    found.push_back(FoundPrinting{ card, printing });
                }
            }
        }
        return found;
    }

    void ResolvePrinting(const SelectionEntry& entry, uint32_t printing_id, Selection& selection)
    {
        const std::vector<FoundPrinting> found{ FindPrintings(entry.m_Group, printing_id) };
        if (found.empty())
        {
            throw LoadError{ fmt::format("Line {}: unknown printing {}/{}", entry.m_Line, entry.m_Group, printing_id) };
        }

        if (entry.m_Specifier.has_value())
        {
            const auto it{
                std::ranges::find_if(found,
                                     [&](const FoundPrinting& candidate)
                                     { return candidate.m_Printing->Specifier() == entry.m_Specifier; }),
            };
            if (it == found.end())
            {
                throw LoadError{
                    fmt::format("Line {}: printing {}/{} has no face or variant {}",
                                entry.m_Line,
                                entry.m_Group,
                                printing_id,
                                entry.m_Specifier.value()),
                };
            }

            for (uint32_t i = 0; i < entry.m_Count; ++i)
            {
                selection.push_back(Select(*it));
            }
            return;
        }

        const bool is_variant{ found.front().m_Printing->m_Variant.has_value() };
        for (uint32_t i = 0; i < entry.m_Count; ++i)
        {
            if (is_variant)
            {
                selection.push_back(Select(LeastUsedVariant(entry.m_Group, found)));
            }
            else
            {
                for (const FoundPrinting& printing : found)
                {
                    selection.push_back(Select(printing));
                }
            }
        }
    }

    const FoundPrinting& LeastUsedVariant(std::string_view group, const std::vector<FoundPrinting>& variants)
    {
        std::map<uint32_t, uint32_t>& usage{ m_VariantUsage[{ std::string{ group }, variants.front().m_Printing->m_Id }] };

        const auto it{
            std::ranges::min_element(variants,
                                     {},
                                     [&](const FoundPrinting& variant)
                                     { return usage[variant.m_Printing->m_Variant.value()]; }),
        };
        ++usage[it->m_Printing->m_Variant.value()];
        return *it;
    }

    SelectedPrinting Select(const FoundPrinting& found) const
    {
        const Card& card{ *found.m_Card };
        const Printing& printing{ *found.m_Printing };
        const PrintingKey key{ card.KeyOf(printing) };

        std::string_view title{ card.m_Title.m_Title };
        if (printing.m_Face.has_value() && printing.m_Face.value() >= 2 && printing.m_Face.value() - 2 < card.m_Faces.size())
        {
            title = card.m_Faces[printing.m_Face.value() - 2].m_Title;
        }

        return SelectedPrinting{
            .m_Label{ fmt::format("{} ({})", title, ToString(key)) },
            .m_ImageUrl{ ImageUrl(key) },
            .m_Key{ key },
        };
    }

    std::string ImageUrl(const PrintingKey& key) const
    {
        for (const Manifest* manifest : m_Manifests | std::views::reverse)
        {
            if (const LocalImageOverride* local_image{ manifest->FindLocalImage(key) })
            {
                return local_image->m_Url;
            }
        }
        return DefaultImageUrl(m_ImageRoot, key);
    }

    void ResolveInsert(const SelectionEntry& entry, Selection& selection) const
    {
        const Insert* insert{ nullptr };
        for (const Manifest* manifest : m_Manifests)
        {
            insert = manifest->FindInsert(entry.m_Group, entry.m_Id);
            if (insert != nullptr)
            {
                break;
            }
        }
        if (insert == nullptr)
        {
            throw LoadError{ fmt::format("Line {}: unknown insert {}/{}", entry.m_Line, entry.m_Group, entry.m_Id) };
        }

        for (uint32_t i = 0; i < entry.m_Count; ++i)
        {
            selection.push_back(SelectedPrinting{
                .m_Label{ fmt::format("{} ({}/insert/{})", insert->m_Title.m_Title, insert->m_Group, insert->m_Name) },
                .m_ImageUrl{ InsertImageUrl(m_ImageRoot, *insert) },
                .m_Key{},
            });
        }
    }

    const Manifest& m_Manifest;
    std::vector<const Manifest*> m_Manifests;
    std::string_view m_ImageRoot;
    std::map<std::pair<std::string, uint32_t>, std::map<uint32_t, uint32_t>> m_VariantUsage;
};
} // namespace

std::vector<SelectionEntry> ParseSelection(std::string_view text, std::string_view source_name)
{
    std::vector<SelectionEntry> entries;

    size_t line_number{ 0 };
    for (auto raw_line : text | std::views::split('\n'))
    {
        ++line_number;

        std::string_view line{ raw_line.begin(), raw_line.end() };
        line = Trim(line.substr(0, line.find('#')));
        if (line.empty())
        {
            continue;
        }

        const auto fail{
            [&](std::string_view problem)
            {
                return LoadError{ fmt::format("{}:{}: {} in `{}`", source_name, line_number, problem, line) };
            }
        };

        const std::vector<std::string_view> tokens{ SplitWhitespace(line) };
        if (tokens.size() > 2)
        {
            throw fail("expected an optional count and a single entry");
        }

        SelectionEntry entry{ .m_Line = line_number };
        if (tokens.size() == 2)
        {
            const auto count{ ParseCount(tokens[0]) };
            if (!count.has_value())
            {
                throw fail("invalid count");
            }
            entry.m_Count = count.value();
        }

        std::string_view body{ tokens.back() };
        if (body.starts_with("card:"))
        {
            entry.m_Kind = SelectionKind::Card;
            body.remove_prefix(5);
        }
        else if (body.starts_with("insert:"))
        {
            entry.m_Kind = SelectionKind::Insert;
            body.remove_prefix(7);
        }

        if (const size_t slash{ body.find('/') }; slash != std::string_view::npos)
        {
            entry.m_Group = body.substr(0, slash);
            body.remove_prefix(slash + 1);
        }
        else
        {
            entry.m_Group = c_DefaultGroup;
        }

        if (entry.m_Kind == SelectionKind::Printing)
        {
            if (const size_t dot{ body.find('.') }; dot != std::string_view::npos)
            {
                entry.m_Specifier = ParsePrintingId(body.substr(dot + 1));
                if (!entry.m_Specifier.has_value() || entry.m_Specifier.value() == 0)
                {
                    throw fail("invalid face or variant");
                }
                body = body.substr(0, dot);
            }
            if (!ParsePrintingId(body).has_value())
            {
                throw fail("invalid printing id");
            }
        }

        if (entry.m_Group.empty() || body.empty())
        {
            throw fail("missing group or id");
        }
        entry.m_Id = body;
        entries.push_back(std::move(entry));
    }

    return entries;
}

std::vector<SelectionEntry> ReadSelectionFile(const fs::path& path)
{
    std::ifstream file{ path, std::ios::binary };
    if (!file.is_open())
    {
        throw LoadError{ fmt::format("Could not open selection file {}", path.string()) };
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return ParseSelection(buffer.str(), path.string());
}

Selection ResolveSelection(std::span<const SelectionEntry> entries,
                           const Manifest& manifest,
                           const LocalOverlayManifest* overlay,
                           std::string_view image_root)
{
    SelectionResolver resolver{ manifest, overlay, image_root };

    Selection selection;
    for (const SelectionEntry& entry : entries)
    {
        resolver.Resolve(entry, selection);
    }

    LogInfo("Selected {} printings from {} entries", selection.size(), entries.size());
    return selection;
}

std::string DefaultImageUrl(std::string_view image_root, const PrintingKey& key)
{
    const std::string root{ TrimTrailingSlashes(image_root) };
    if (const auto specifier{ key.Specifier() })
    {
        return fmt::format("{}/{}/card/{:05}.{}.webp", root, key.m_Group, key.m_Id, specifier.value());
    }
    return fmt::format("{}/{}/card/{:05}.webp", root, key.m_Group, key.m_Id);
}

std::string InsertImageUrl(std::string_view image_root, const Insert& insert)
{
    return fmt::format("{}/{}/insert/{}.webp", TrimTrailingSlashes(image_root), insert.m_Group, insert.m_Name);
}
