#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "core/grid.h"
#include "core/palette/palette.h"
#include "io/editor_config.h"
#include "io/task_file.h"

// Headless state behind one editor window: the grid being edited, the task it
// belongs to, and the selected colour/tool. The UI layer forwards pointer and
// key events here and shows StatusText()/WindowTitle().
class EditorSession
{
public:
    enum class Tool : std::uint8_t
    {
        Paint = 0,
        Fill = 1,
    };

    explicit EditorSession(const EditorConfig& cfg = EditorConfig{});

    arcgrid::Grid&                  GetGrid() { return m_grid; }
    const arcgrid::Grid&            GetGrid() const { return m_grid; }
    const arcgrid::task_file::Task& GetTask() const { return m_task; }
    const arcgrid::GridLimits&      Limits() const { return m_limits; }
    const arcgrid::colour::Palette& GetPalette() const { return *m_palette; }

    int  CurrentColour() const { return m_colour; }
    // Colours outside the palette are ignored (returns false).
    bool SetCurrentColour(int colour);
    // "#RRGGBB" of the current colour in the session palette.
    std::string CurrentColourHex() const;

    Tool CurrentTool() const { return m_tool; }
    void SetTool(Tool tool) { m_tool = tool; }

    // Keyboard shortcuts: '0'..'9' pick a colour, 'p' paint, 'f' fill.
    // Returns true if the key was consumed.
    bool HandleKey(char ch);

    // Pointer interaction at grid cell (x, y) with the current tool.
    // Off-grid positions change nothing. Returns true if any cell changed.
    bool ApplyAt(int x, int y);

    void Clear();
    // Throws arcgrid::ValidationError for dimensions outside the limits.
    void Resize(int width, int height);

    void NewTask();
    // Loads a task; its first training input becomes the edited grid. A task
    // with no training examples leaves the current grid in place.
    bool OpenTask(const std::string& path, std::string& err);
    // Writes the grid back into the task (train[0].input) and saves.
    bool SaveTask(std::string& err);
    bool SaveTaskAs(const std::string& path, std::string& err);

    bool HasFilePath() const { return !m_file_path.empty(); }
    const std::string& GetFilePath() const { return m_file_path; }

    // Dirty state (savepoint tracking).
    bool IsModifiedSinceLastSave() const { return m_state_token != m_saved_state_token; }
    void MarkSaved() { m_saved_state_token = m_state_token; }

    std::string StatusText() const;
    std::string WindowTitle() const;

private:
    void TouchContent() { ++m_state_token; }
    arcgrid::Grid MakeDefaultGrid() const;

    const arcgrid::colour::Palette* m_palette = nullptr;
    arcgrid::GridLimits      m_limits;
    int                      m_default_width = 8;
    int                      m_default_height = 8;

    arcgrid::Grid            m_grid;
    arcgrid::task_file::Task m_task;
    std::string              m_file_path;

    int  m_colour = 0;
    Tool m_tool = Tool::Paint;

    std::uint64_t m_state_token = 1;
    std::uint64_t m_saved_state_token = 1;
};

std::string_view ToolName(EditorSession::Tool tool);
