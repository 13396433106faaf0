#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/grid.h"

// Display palettes for grid colours.
//
// Palettes are built once and shared by const reference; every renderer and
// exporter looks colours up here instead of carrying its own table.
namespace arcgrid::colour
{
struct Rgb8
{
    std::uint8_t r = 0, g = 0, b = 0;

    bool operator==(const Rgb8& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Rgb8& o) const { return !(*this == o); }
};

enum class BuiltinPalette : std::uint32_t
{
    Arc10 = 1, // ARC base palette, colours 0..9
    Arc16 = 2, // ARC-AGI-3 extended palette, colours 0..15
};

struct Palette
{
    BuiltinPalette    id = BuiltinPalette::Arc10;
    std::string       title;
    std::vector<Rgb8> rgb;

    int MaxColour() const { return (int)rgb.size() - 1; }
};

const Palette& GetBuiltinPalette(BuiltinPalette id);

// Stable config/CLI names: "arc10", "arc16".
std::string_view BuiltinPaletteName(BuiltinPalette id);
std::optional<BuiltinPalette> ParseBuiltinPaletteName(std::string_view name);

// Empty for indices the palette does not cover.
std::optional<Rgb8> RgbForIndex(const Palette& palette, int index);
// "#RRGGBB", or an empty string for indices the palette does not cover.
std::string HexForIndex(const Palette& palette, int index);

GridLimits LimitsForPalette(const Palette& palette, int max_width, int max_height);

} // namespace arcgrid::colour
