// Indexed-colour grid model for arcgrid.
//
// A Grid is a bounded, rectangular matrix of small palette indices ("colours").
// Editors and games own one by value and mutate it through the operations below.
// Coordinates are (x, y) = (column, row); the nested-array interop form is [row][col].

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace arcgrid
{
// Nested-array form used at the persistence/UI boundary: rows[y][x].
using CellRows = std::vector<std::vector<int>>;

// Common base so callers can catch every grid failure in one place.
class GridError
{
public:
    virtual ~GridError() = default;
};

// Dimensions, colours or nested-array input outside the configured bounds.
class ValidationError : public std::invalid_argument, public GridError
{
public:
    explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
};

// Get/Set coordinates outside the current grid extent.
class OutOfBounds : public std::out_of_range, public GridError
{
public:
    explicit OutOfBounds(const std::string& what) : std::out_of_range(what) {}
};

struct GridLimits
{
    int max_width = 64;
    int max_height = 64;
    int max_colour = 9;

    // ARC base palette (0..9).
    static GridLimits Base() { return GridLimits{}; }
    // Extended 16-colour palette (0..15).
    static GridLimits Extended()
    {
        GridLimits l;
        l.max_colour = 15;
        return l;
    }

    bool operator==(const GridLimits& o) const
    {
        return max_width == o.max_width && max_height == o.max_height && max_colour == o.max_colour;
    }
    bool operator!=(const GridLimits& o) const { return !(*this == o); }
};

class Grid
{
public:
    // Throws ValidationError if the dimensions, fill or limits are out of range.
    explicit Grid(int width = 8, int height = 8, int fill = 0, GridLimits limits = {});

    int Width() const { return m_width; }
    int Height() const { return m_height; }
    const GridLimits& Limits() const { return m_limits; }

    bool InBounds(int x, int y) const { return x >= 0 && y >= 0 && x < m_width && y < m_height; }
    bool IsValidColour(int value) const { return value >= 0 && value <= m_limits.max_colour; }

    // Strict accessors: out-of-range coordinates throw OutOfBounds, never a default.
    int  Get(int x, int y) const;
    void Set(int x, int y, int value);

    // Reallocates at the new size, keeping the overlapping top-left region.
    // New cells are `fill`; cells outside the new extent are discarded.
    void Resize(int width, int height, int fill = 0);

    Grid Clone() const { return *this; }

    // 4-connected fill from (x, y). An off-grid start is a no-op whatever the colour;
    // otherwise the colour is validated, and filling with the colour already
    // present is a no-op. Returns the number of cells recoloured.
    int FloodFill(int x, int y, int colour);

    CellRows ToList() const;
    // Replaces dimensions and cells wholesale. Leaves the grid untouched on failure.
    void FromList(const CellRows& rows);

    std::string ToString() const;
    std::string Describe() const;

    bool operator==(const Grid& o) const
    {
        return m_width == o.m_width && m_height == o.m_height && m_cells == o.m_cells;
    }
    bool operator!=(const Grid& o) const { return !(*this == o); }

private:
    void ValidateDimensions(int width, int height) const;
    void ValidateColour(int value, const char* what) const;
    void CheckCoords(int x, int y) const;

    std::size_t Index(int x, int y) const { return (std::size_t)y * (std::size_t)m_width + (std::size_t)x; }

    int m_width = 0;
    int m_height = 0;
    GridLimits m_limits;

    // Row-major, width * height entries.
    std::vector<std::uint8_t> m_cells;
};

} // namespace arcgrid
