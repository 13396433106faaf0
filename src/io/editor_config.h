#pragma once

#include <string>

#include "core/grid.h"
#include "core/palette/palette.h"

// Persistent editor preferences (<config_dir>/config.json).
//
// Loading is forgiving: a missing file keeps the defaults, unknown keys and
// wrongly-typed values are ignored, numbers are clamped into range. Only an
// unreadable or unparsable file is an error.
struct EditorConfig
{
    std::string palette = "arc10"; // "arc10" | "arc16"

    // Largest grid the editor will create, resize to or load.
    int max_width = 64;
    int max_height = 64;

    // Size of the grid in a new document.
    int default_width = 8;
    int default_height = 8;
};

bool LoadEditorConfigFromFile(const std::string& path, EditorConfig& out, std::string& err);
bool SaveEditorConfigToFile(const std::string& path, const EditorConfig& cfg, std::string& err);

// Same as above, at GetEditorConfigPath().
bool LoadEditorConfig(EditorConfig& out, std::string& err);

// Unknown palette names resolve to arc10.
const arcgrid::colour::Palette& PaletteFor(const EditorConfig& cfg);
arcgrid::GridLimits GridLimitsFor(const EditorConfig& cfg);
