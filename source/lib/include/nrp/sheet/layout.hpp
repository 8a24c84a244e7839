#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <nrp/color.hpp>
#include <nrp/config.hpp>
#include <nrp/util.hpp>

struct GeometryProfile
{
    Size m_PageSize{ 210_mm, 297_mm };
    Size m_CardSize{ 63_mm, 88_mm };
    Length m_Bleed{ 0_mm };
    Size m_Spacing{ 0_mm, 0_mm };
    int32_t m_Columns{ 3 };
    int32_t m_Rows{ 3 };

    CutIndicator m_CutIndicator{ CutIndicator::Marks };
    Length m_GuidesLength{ 0.25_in };
    Length m_GuidesThickness{ 1_pts };
    ColorRGB8 m_GuidesColor{ 0, 0, 0 };

    int32_t Capacity() const
    {
        return m_Columns * m_Rows;
    }
};

// Profile built from the config defaults, throws LayoutError if a named size is unknown
GeometryProfile MakeGeometryProfile(const Config& config);

struct LineSegment
{
    Position m_From;
    Position m_To;
};

/*
        The trim rect is the final card outline, the draw rect is the trim rect grown by the bleed
*/
struct SheetSlot
{
    Rect m_TrimRect;
    Rect m_DrawRect;
    std::optional<size_t> m_SelectionIndex{};
};

struct SheetPage
{
    std::vector<SheetSlot> m_Slots;
    std::vector<LineSegment> m_CutGuides;

    size_t OccupiedSlots() const;
};

struct SheetLayout
{
    GeometryProfile m_Profile;
    std::vector<SheetPage> m_Pages;
};

/*
        Distributes `selection_size` cards onto pages in selection order, all positions are
        measured from the top-left page corner
*/
SheetLayout ComputeSheetLayout(size_t selection_size, const GeometryProfile& profile);

void ValidateGeometryProfile(const GeometryProfile& profile);

// Slot geometry of a full page, row-major
std::vector<SheetSlot> ComputeSlots(const GeometryProfile& profile);

std::vector<LineSegment> ComputeCornerMarks(const SheetSlot& slot, Length length);
std::vector<LineSegment> ComputeExtendedGuides(const std::vector<SheetSlot>& slots, Size page_size);
