#include "core/palette/palette.h"

#include <cctype>
#include <string>
#include <utility>

namespace arcgrid::colour
{
static std::vector<Rgb8> MakeArc10Rgb()
{
    return {
        {0x00, 0x00, 0x00}, // 0 black
        {0x00, 0x74, 0xD9}, // 1 blue
        {0xFF, 0x41, 0x36}, // 2 red
        {0x2E, 0xCC, 0x40}, // 3 green
        {0xFF, 0xDC, 0x00}, // 4 yellow
        {0xAA, 0xAA, 0xAA}, // 5 grey
        {0xF0, 0x12, 0xBE}, // 6 magenta
        {0xFF, 0x85, 0x1B}, // 7 orange
        {0x7F, 0xDB, 0xFF}, // 8 sky blue
        {0x87, 0x0C, 0x25}, // 9 maroon
    };
}

static std::vector<Rgb8> MakeArc16Rgb()
{
    auto v = MakeArc10Rgb();
    v.push_back({0x57, 0x75, 0x90}); // 10 slate grey
    v.push_back({0xFF, 0xC3, 0xA0}); // 11 peach
    v.push_back({0xB4, 0xFF, 0xB4}); // 12 light green
    v.push_back({0xFF, 0xFF, 0xC8}); // 13 cream
    v.push_back({0xDC, 0xA0, 0xDC}); // 14 lavender
    v.push_back({0xA0, 0xDC, 0xFF}); // 15 light blue
    return v;
}

static Palette MakeBuiltin(BuiltinPalette id, std::string title, std::vector<Rgb8> rgb)
{
    Palette p;
    p.id = id;
    p.title = std::move(title);
    p.rgb = std::move(rgb);
    return p;
}

const Palette& GetBuiltinPalette(BuiltinPalette id)
{
    static const Palette arc10 = MakeBuiltin(BuiltinPalette::Arc10, "ARC (10 colours)", MakeArc10Rgb());
    static const Palette arc16 = MakeBuiltin(BuiltinPalette::Arc16, "ARC-AGI-3 (16 colours)", MakeArc16Rgb());

    switch (id)
    {
        case BuiltinPalette::Arc16:
            return arc16;
        case BuiltinPalette::Arc10:
        default:
            return arc10;
    }
}

std::string_view BuiltinPaletteName(BuiltinPalette id)
{
    switch (id)
    {
        case BuiltinPalette::Arc10: return "arc10";
        case BuiltinPalette::Arc16: return "arc16";
    }
    return "arc10";
}

std::optional<BuiltinPalette> ParseBuiltinPaletteName(std::string_view name)
{
    std::string lower;
    lower.reserve(name.size());
    for (char c : name)
        lower.push_back((char)std::tolower((unsigned char)c));

    if (lower == "arc10")
        return BuiltinPalette::Arc10;
    if (lower == "arc16")
        return BuiltinPalette::Arc16;
    return std::nullopt;
}

std::optional<Rgb8> RgbForIndex(const Palette& palette, int index)
{
    if (index < 0 || (std::size_t)index >= palette.rgb.size())
        return std::nullopt;
    return palette.rgb[(std::size_t)index];
}

static std::string ToHex(const Rgb8& c)
{
    auto hex2 = [](std::uint8_t v) -> std::string {
        static const char* k = "0123456789ABCDEF";
        std::string s;
        s.resize(2);
        s[0] = k[(v >> 4) & 0xFu];
        s[1] = k[v & 0xFu];
        return s;
    };
    return std::string("#") + hex2(c.r) + hex2(c.g) + hex2(c.b);
}

std::string HexForIndex(const Palette& palette, int index)
{
    const auto c = RgbForIndex(palette, index);
    return c ? ToHex(*c) : std::string();
}

GridLimits LimitsForPalette(const Palette& palette, int max_width, int max_height)
{
    GridLimits l;
    l.max_width = max_width;
    l.max_height = max_height;
    l.max_colour = palette.MaxColour();
    return l;
}

} // namespace arcgrid::colour
