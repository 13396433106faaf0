#include "app/editor_session.h"

#include <algorithm>
#include <filesystem>
#include <utility>

std::string_view ToolName(EditorSession::Tool tool)
{
    switch (tool)
    {
        case EditorSession::Tool::Paint: return "Paint";
        case EditorSession::Tool::Fill:  return "Fill";
    }
    return "Paint";
}

EditorSession::EditorSession(const EditorConfig& cfg)
    : m_palette(&PaletteFor(cfg))
    , m_limits(GridLimitsFor(cfg))
{
    m_default_width = std::clamp(cfg.default_width, 1, m_limits.max_width);
    m_default_height = std::clamp(cfg.default_height, 1, m_limits.max_height);
    m_grid = MakeDefaultGrid();
    m_task = arcgrid::task_file::CreateEmptyTask();
}

arcgrid::Grid EditorSession::MakeDefaultGrid() const
{
    return arcgrid::Grid(m_default_width, m_default_height, 0, m_limits);
}

bool EditorSession::SetCurrentColour(int colour)
{
    if (colour < 0 || colour > m_limits.max_colour)
        return false;
    m_colour = colour;
    return true;
}

std::string EditorSession::CurrentColourHex() const
{
    return arcgrid::colour::HexForIndex(*m_palette, m_colour);
}

bool EditorSession::HandleKey(char ch)
{
    if (ch >= '0' && ch <= '9')
        return SetCurrentColour(ch - '0');

    switch (ch)
    {
        case 'p':
        case 'P':
            SetTool(Tool::Paint);
            return true;
        case 'f':
        case 'F':
            SetTool(Tool::Fill);
            return true;
        default:
            return false;
    }
}

bool EditorSession::ApplyAt(int x, int y)
{
    bool changed = false;
    if (m_tool == Tool::Paint)
    {
        if (!m_grid.InBounds(x, y))
            return false;
        if (m_grid.Get(x, y) != m_colour)
        {
            m_grid.Set(x, y, m_colour);
            changed = true;
        }
    }
    else
    {
        changed = m_grid.FloodFill(x, y, m_colour) > 0;
    }

    if (changed)
        TouchContent();
    return changed;
}

void EditorSession::Clear()
{
    arcgrid::Grid cleared(m_grid.Width(), m_grid.Height(), 0, m_limits);
    if (cleared == m_grid)
        return;
    m_grid = std::move(cleared);
    TouchContent();
}

void EditorSession::Resize(int width, int height)
{
    if (width == m_grid.Width() && height == m_grid.Height())
        return;
    m_grid.Resize(width, height);
    TouchContent();
}

void EditorSession::NewTask()
{
    m_grid = MakeDefaultGrid();
    m_task = arcgrid::task_file::CreateEmptyTask();
    m_file_path.clear();
    TouchContent();
    MarkSaved();
}

bool EditorSession::OpenTask(const std::string& path, std::string& err)
{
    arcgrid::task_file::Task task;
    if (!arcgrid::task_file::LoadTaskFromFile(path, m_limits, task, err))
        return false;

    // A task without training examples keeps the grid being edited.
    if (!task.train.empty())
    {
        arcgrid::Grid grid = MakeDefaultGrid();
        if (!arcgrid::task_file::GridFromRows(task.train.front().input, m_limits, grid, err))
            return false;
        m_grid = std::move(grid);
    }

    m_task = std::move(task);
    m_file_path = path;
    TouchContent();
    MarkSaved();
    return true;
}

bool EditorSession::SaveTask(std::string& err)
{
    if (m_file_path.empty())
    {
        err = "No file path; use Save As.";
        return false;
    }
    return SaveTaskAs(m_file_path, err);
}

bool EditorSession::SaveTaskAs(const std::string& path, std::string& err)
{
    // Work on a copy so a failed save leaves the in-memory task untouched.
    arcgrid::task_file::Task task = m_task;
    const arcgrid::CellRows snapshot = m_grid.ToList();
    if (task.train.empty())
    {
        if (!arcgrid::task_file::AddTrainExample(task, snapshot, snapshot, m_limits, err))
            return false;
    }
    else
    {
        task.train.front().input = snapshot;
    }

    if (!arcgrid::task_file::SaveTaskToFile(path, task, err))
        return false;

    m_task = std::move(task);
    m_file_path = path;
    MarkSaved();
    return true;
}

std::string EditorSession::StatusText() const
{
    return std::string(ToolName(m_tool)) + " | Colour " + std::to_string(m_colour) + " | Grid " +
           std::to_string(m_grid.Width()) + "x" + std::to_string(m_grid.Height());
}

std::string EditorSession::WindowTitle() const
{
    std::string name = "Untitled";
    if (!m_file_path.empty())
        name = std::filesystem::path(m_file_path).filename().string();
    return "ARC Grid Editor - " + name;
}
