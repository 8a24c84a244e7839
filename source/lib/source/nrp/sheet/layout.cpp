#include <nrp/sheet/layout.hpp>

#include <algorithm>
#include <iterator>
#include <ranges>

#include <fmt/format.h>

#include <nrp/errors.hpp>
#include <nrp/units.hpp>
#include <nrp/util/log.hpp>

size_t SheetPage::OccupiedSlots() const
{
    return static_cast<size_t>(std::ranges::count_if(m_Slots,
                                                     [](const SheetSlot& slot)
                                                     { return slot.m_SelectionIndex.has_value(); }));
}

GeometryProfile MakeGeometryProfile(const Config& config)
{
    const auto page_size{ config.GetPageSize(config.m_DefaultPageSize) };
    if (!page_size.has_value())
    {
        throw LayoutError{ fmt::format("Unknown page size {}", config.m_DefaultPageSize) };
    }

    const auto card_size{ config.GetCardSize(config.m_DefaultCardSize) };
    if (!card_size.has_value())
    {
        throw LayoutError{ fmt::format("Unknown card size {}", config.m_DefaultCardSize) };
    }

    return GeometryProfile{
        .m_PageSize{ page_size.value() },
        .m_CardSize{ card_size.value() },
        .m_Bleed{ config.m_BleedEdge },
        .m_Spacing{ config.m_Spacing },
        .m_Columns = static_cast<int32_t>(config.m_Columns),
        .m_Rows = static_cast<int32_t>(config.m_Rows),
        .m_CutIndicator = config.m_CutIndicator,
        .m_GuidesLength{ config.m_GuidesLength },
        .m_GuidesThickness{ config.m_GuidesThickness },
        .m_GuidesColor{ config.m_GuidesColor },
    };
}

void ValidateGeometryProfile(const GeometryProfile& profile)
{
    if (profile.m_Columns <= 0 || profile.m_Rows <= 0)
    {
        throw LayoutError{ fmt::format("A grid of {}x{} cards holds no cards", profile.m_Columns, profile.m_Rows) };
    }
    if (profile.m_PageSize.x <= 0_mm || profile.m_PageSize.y <= 0_mm)
    {
        throw LayoutError{ fmt::format("Page size {} x {} is not positive",
                                       FormatLength(profile.m_PageSize.x),
                                       FormatLength(profile.m_PageSize.y)) };
    }
    if (profile.m_CardSize.x <= 0_mm || profile.m_CardSize.y <= 0_mm)
    {
        throw LayoutError{ fmt::format("Card size {} x {} is not positive",
                                       FormatLength(profile.m_CardSize.x),
                                       FormatLength(profile.m_CardSize.y)) };
    }
    if (profile.m_Bleed < 0_mm)
    {
        throw LayoutError{ fmt::format("Bleed {} is negative", FormatLength(profile.m_Bleed)) };
    }
    if (profile.m_Spacing.x < 0_mm || profile.m_Spacing.y < 0_mm)
    {
        throw LayoutError{ fmt::format("Spacing {} x {} is negative",
                                       FormatLength(profile.m_Spacing.x),
                                       FormatLength(profile.m_Spacing.y)) };
    }

    const auto columns{ static_cast<float>(profile.m_Columns) };
    const auto rows{ static_cast<float>(profile.m_Rows) };
    const Size cell_size{ profile.m_CardSize.x + profile.m_Bleed * 2.0f, profile.m_CardSize.y + profile.m_Bleed * 2.0f };
    const Size grid_size{
        cell_size.x * columns + profile.m_Spacing.x * (columns - 1),
        cell_size.y * rows + profile.m_Spacing.y * (rows - 1),
    };
    if (grid_size.x > profile.m_PageSize.x || grid_size.y > profile.m_PageSize.y)
    {
        throw LayoutError{
            fmt::format("A grid of {}x{} cards needs {} x {} but the page is only {} x {}",
                        profile.m_Columns,
                        profile.m_Rows,
                        FormatLength(grid_size.x),
                        FormatLength(grid_size.y),
                        FormatLength(profile.m_PageSize.x),
                        FormatLength(profile.m_PageSize.y)),
        };
    }
}

std::vector<SheetSlot> ComputeSlots(const GeometryProfile& profile)
{
    const auto columns{ static_cast<float>(profile.m_Columns) };
    const auto rows{ static_cast<float>(profile.m_Rows) };
    const Size cell_size{ profile.m_CardSize.x + profile.m_Bleed * 2.0f, profile.m_CardSize.y + profile.m_Bleed * 2.0f };
    const Size grid_size{
        cell_size.x * columns + profile.m_Spacing.x * (columns - 1),
        cell_size.y * rows + profile.m_Spacing.y * (rows - 1),
    };
    const Position origin{
        (profile.m_PageSize.x - grid_size.x) / 2.0f,
        (profile.m_PageSize.y - grid_size.y) / 2.0f,
    };

    std::vector<SheetSlot> slots;
    slots.reserve(static_cast<size_t>(profile.Capacity()));
    for (int32_t i = 0; i < profile.Capacity(); ++i)
    {
        const auto column{ static_cast<float>(i % profile.m_Columns) };
        const auto row{ static_cast<float>(i / profile.m_Columns) };
        const Position draw_position{
            origin.x + column * (cell_size.x + profile.m_Spacing.x),
            origin.y + row * (cell_size.y + profile.m_Spacing.y),
        };
        const Position trim_position{
            draw_position.x + profile.m_Bleed,
            draw_position.y + profile.m_Bleed,
        };

        slots.push_back(SheetSlot{
            .m_TrimRect{ trim_position, profile.m_CardSize },
            .m_DrawRect{ draw_position, cell_size },
            .m_SelectionIndex{},
        });
    }
    return slots;
}

std::vector<LineSegment> ComputeCornerMarks(const SheetSlot& slot, Length length)
{
    const Rect& trim{ slot.m_TrimRect };
    const Rect& draw{ slot.m_DrawRect };

    // Two segments per trim corner, both start on the draw rect and point away from the card
    return {
        LineSegment{ { draw.Left(), trim.Top() }, { draw.Left() - length, trim.Top() } },
        LineSegment{ { trim.Left(), draw.Top() }, { trim.Left(), draw.Top() - length } },

        LineSegment{ { draw.Right(), trim.Top() }, { draw.Right() + length, trim.Top() } },
        LineSegment{ { trim.Right(), draw.Top() }, { trim.Right(), draw.Top() - length } },

        LineSegment{ { draw.Left(), trim.Bottom() }, { draw.Left() - length, trim.Bottom() } },
        LineSegment{ { trim.Left(), draw.Bottom() }, { trim.Left(), draw.Bottom() + length } },

        LineSegment{ { draw.Right(), trim.Bottom() }, { draw.Right() + length, trim.Bottom() } },
        LineSegment{ { trim.Right(), draw.Bottom() }, { trim.Right(), draw.Bottom() + length } },
    };
}

std::vector<LineSegment> ComputeExtendedGuides(const std::vector<SheetSlot>& slots, Size page_size)
{
    std::vector<LineSegment> guides;
    if (slots.empty())
    {
        return guides;
    }

    static constexpr auto c_Precision{ 0.01_pts };

    struct ApproximatePosition
    {
        int64_t m_Approximate;
        Length m_Exact;
    };

    const auto add_unique{
        [](std::vector<ApproximatePosition>& unique, Length exact)
        {
            const auto approximate{ static_cast<int64_t>(exact / c_Precision) };
            if (!std::ranges::contains(unique, approximate, &ApproximatePosition::m_Approximate))
            {
                unique.push_back({ approximate, exact });
            }
        }
    };

    std::vector<ApproximatePosition> unique_x;
    std::vector<ApproximatePosition> unique_y;
    for (const SheetSlot& slot : slots)
    {
        add_unique(unique_x, slot.m_TrimRect.Left());
        add_unique(unique_x, slot.m_TrimRect.Right());
        add_unique(unique_y, slot.m_TrimRect.Top());
        add_unique(unique_y, slot.m_TrimRect.Bottom());
    }
    std::ranges::sort(unique_x, {}, &ApproximatePosition::m_Approximate);
    std::ranges::sort(unique_y, {}, &ApproximatePosition::m_Approximate);

    const auto x_min{ std::ranges::min(slots, {}, [](const SheetSlot& slot)
                                       { return slot.m_DrawRect.Left(); })
                          .m_DrawRect.Left() };
    const auto x_max{ std::ranges::max(slots, {}, [](const SheetSlot& slot)
                                       { return slot.m_DrawRect.Right(); })
                          .m_DrawRect.Right() };
    const auto y_min{ std::ranges::min(slots, {}, [](const SheetSlot& slot)
                                       { return slot.m_DrawRect.Top(); })
                          .m_DrawRect.Top() };
    const auto y_max{ std::ranges::max(slots, {}, [](const SheetSlot& slot)
                                       { return slot.m_DrawRect.Bottom(); })
                          .m_DrawRect.Bottom() };

    for (const auto& [_, x] : unique_x)
    {
        guides.push_back(LineSegment{
            .m_From{ x, y_min },
            .m_To{ x, 0_mm },
        });
        guides.push_back(LineSegment{
            .m_From{ x, y_max },
            .m_To{ x, page_size.y },
        });
    }

    for (const auto& [_, y] : unique_y)
    {
        guides.push_back(LineSegment{
            .m_From{ x_min, y },
            .m_To{ 0_mm, y },
        });
        guides.push_back(LineSegment{
            .m_From{ x_max, y },
            .m_To{ page_size.x, y },
        });
    }

    return guides;
}

SheetLayout ComputeSheetLayout(size_t selection_size, const GeometryProfile& profile)
{
    if (selection_size == 0)
    {
        throw LayoutError{ "Nothing was selected, refusing to lay out an empty sheet" };
    }
    ValidateGeometryProfile(profile);

    const std::vector<SheetSlot> page_slots{ ComputeSlots(profile) };
    const size_t capacity{ page_slots.size() };
    const size_t num_pages{ (selection_size + capacity - 1) / capacity };

    const std::vector<LineSegment> extended_guides{
        profile.m_CutIndicator == CutIndicator::Lines
            ? ComputeExtendedGuides(page_slots, profile.m_PageSize)
            : std::vector<LineSegment>{},
    };

    SheetLayout layout{ .m_Profile{ profile }, .m_Pages{} };
    layout.m_Pages.reserve(num_pages);

    for (size_t p = 0; p < num_pages; ++p)
    {
        SheetPage& page{ layout.m_Pages.emplace_back() };
        page.m_Slots = page_slots;

        for (size_t i = 0; i < capacity; ++i)
        {
            const size_t selection_index{ p * capacity + i };
            if (selection_index >= selection_size)
            {
                break;
            }

            SheetSlot& slot{ page.m_Slots[i] };
            slot.m_SelectionIndex = selection_index;
            if (profile.m_CutIndicator == CutIndicator::Marks)
            {
                std::ranges::move(ComputeCornerMarks(slot, profile.m_GuidesLength), std::back_inserter(page.m_CutGuides));
            }
        }

        if (profile.m_CutIndicator == CutIndicator::Lines)
        {
            page.m_CutGuides = extended_guides;
        }
    }

    LogInfo("Laid out {} cards on {} pages of {}x{}", selection_size, num_pages, profile.m_Columns, profile.m_Rows);
    return layout;
}
