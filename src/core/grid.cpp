#include "core/grid.h"

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace arcgrid
{
namespace
{
static std::string CoordText(int x, int y)
{
    return "(" + std::to_string(x) + ", " + std::to_string(y) + ")";
}

static void ValidateLimits(const GridLimits& l)
{
    if (l.max_width < 1)
        throw ValidationError("limits: max_width " + std::to_string(l.max_width) + " must be >= 1");
    if (l.max_height < 1)
        throw ValidationError("limits: max_height " + std::to_string(l.max_height) + " must be >= 1");
    if (l.max_colour < 0 || l.max_colour > 255)
        throw ValidationError("limits: max_colour " + std::to_string(l.max_colour) + " must be in 0..255");
}
} // namespace

Grid::Grid(int width, int height, int fill, GridLimits limits)
    : m_limits(limits)
{
    ValidateLimits(m_limits);
    ValidateDimensions(width, height);
    ValidateColour(fill, "fill");

    m_width = width;
    m_height = height;
    m_cells.assign((std::size_t)width * (std::size_t)height, (std::uint8_t)fill);
}

void Grid::ValidateDimensions(int width, int height) const
{
    if (width < 1)
        throw ValidationError("width " + std::to_string(width) + " must be >= 1");
    if (height < 1)
        throw ValidationError("height " + std::to_string(height) + " must be >= 1");
    if (width > m_limits.max_width)
        throw ValidationError("width " + std::to_string(width) + " exceeds maximum " +
                              std::to_string(m_limits.max_width));
    if (height > m_limits.max_height)
        throw ValidationError("height " + std::to_string(height) + " exceeds maximum " +
                              std::to_string(m_limits.max_height));
}

void Grid::ValidateColour(int value, const char* what) const
{
    if (!IsValidColour(value))
        throw ValidationError(std::string(what) + " " + std::to_string(value) + " must be between 0-" +
                              std::to_string(m_limits.max_colour));
}

void Grid::CheckCoords(int x, int y) const
{
    if (!InBounds(x, y))
        throw OutOfBounds("coordinates " + CoordText(x, y) + " out of bounds for " + std::to_string(m_width) +
                          "x" + std::to_string(m_height) + " grid");
}

int Grid::Get(int x, int y) const
{
    CheckCoords(x, y);
    return (int)m_cells[Index(x, y)];
}

void Grid::Set(int x, int y, int value)
{
    CheckCoords(x, y);
    ValidateColour(value, "value");
    m_cells[Index(x, y)] = (std::uint8_t)value;
}

void Grid::Resize(int width, int height, int fill)
{
    ValidateDimensions(width, height);
    ValidateColour(fill, "fill");

    std::vector<std::uint8_t> cells((std::size_t)width * (std::size_t)height, (std::uint8_t)fill);
    const int keep_w = std::min(width, m_width);
    const int keep_h = std::min(height, m_height);
    for (int y = 0; y < keep_h; ++y)
    {
        const auto src = m_cells.begin() + (std::ptrdiff_t)Index(0, y);
        std::copy(src, src + keep_w, cells.begin() + (std::ptrdiff_t)y * width);
    }

    m_width = width;
    m_height = height;
    m_cells = std::move(cells);
}

int Grid::FloodFill(int x, int y, int colour)
{
    if (!InBounds(x, y))
        return 0;
    ValidateColour(colour, "colour");

    const std::uint8_t original = m_cells[Index(x, y)];
    const std::uint8_t replacement = (std::uint8_t)colour;
    if (original == replacement)
        return 0;

    struct Pos
    {
        int x = 0;
        int y = 0;
    };

    // LIFO frontier. Neighbours are pushed unfiltered; bounds, visited and colour are checked on pop.
    std::vector<Pos> stack;
    std::vector<bool> visited(m_cells.size(), false);
    stack.push_back({x, y});

    int changed = 0;
    while (!stack.empty())
    {
        const Pos p = stack.back();
        stack.pop_back();

        if (!InBounds(p.x, p.y))
            continue;
        const std::size_t i = Index(p.x, p.y);
        if (visited[i])
            continue;
        if (m_cells[i] != original)
            continue;

        visited[i] = true;
        m_cells[i] = replacement;
        ++changed;

        stack.push_back({p.x, p.y + 1});
        stack.push_back({p.x, p.y - 1});
        stack.push_back({p.x + 1, p.y});
        stack.push_back({p.x - 1, p.y});
    }
    return changed;
}

CellRows Grid::ToList() const
{
    CellRows rows;
    rows.reserve((std::size_t)m_height);
    for (int y = 0; y < m_height; ++y)
    {
        const auto begin = m_cells.begin() + (std::ptrdiff_t)Index(0, y);
        rows.emplace_back(begin, begin + m_width);
    }
    return rows;
}

void Grid::FromList(const CellRows& rows)
{
    if (rows.empty() || rows.front().empty())
        throw ValidationError("grid data cannot be empty");

    const std::size_t width = rows.front().size();
    for (std::size_t y = 0; y < rows.size(); ++y)
    {
        if (rows[y].size() != width)
            throw ValidationError("ragged rows: row " + std::to_string(y) + " has length " +
                                  std::to_string(rows[y].size()) + ", expected " + std::to_string(width));
    }

    // Guard the int conversion before ValidateDimensions sees the values.
    if (width > (std::size_t)m_limits.max_width)
        throw ValidationError("width " + std::to_string(width) + " exceeds maximum " +
                              std::to_string(m_limits.max_width));
    if (rows.size() > (std::size_t)m_limits.max_height)
        throw ValidationError("height " + std::to_string(rows.size()) + " exceeds maximum " +
                              std::to_string(m_limits.max_height));
    ValidateDimensions((int)width, (int)rows.size());

    std::vector<std::uint8_t> cells;
    cells.reserve(width * rows.size());
    for (std::size_t y = 0; y < rows.size(); ++y)
    {
        for (std::size_t x = 0; x < width; ++x)
        {
            const int v = rows[y][x];
            if (!IsValidColour(v))
                throw ValidationError("value " + std::to_string(v) + " at " + CoordText((int)x, (int)y) +
                                      " must be between 0-" + std::to_string(m_limits.max_colour));
            cells.push_back((std::uint8_t)v);
        }
    }

    m_width = (int)width;
    m_height = (int)rows.size();
    m_cells = std::move(cells);
}

std::string Grid::ToString() const
{
    std::string out;
    out.reserve((std::size_t)m_width * (std::size_t)m_height * 3u);
    for (int y = 0; y < m_height; ++y)
    {
        if (y > 0)
            out.push_back('\n');
        for (int x = 0; x < m_width; ++x)
        {
            if (x > 0)
                out.push_back(' ');
            out += std::to_string((int)m_cells[Index(x, y)]);
        }
    }
    return out;
}

std::string Grid::Describe() const
{
    return "Grid(" + std::to_string(m_width) + "x" + std::to_string(m_height) + ")";
}

} // namespace arcgrid
