#pragma once

#include <string>

// Returns the per-user config directory used by arcgrid.
//
// $XDG_CONFIG_HOME/arcgrid, else $HOME/.config/arcgrid, else the current directory.
std::string GetArcGridConfigDir();

// Joins the config dir and a relative path within it.
// Example: ArcGridConfigPath("config.json") -> "<config_dir>/config.json"
std::string ArcGridConfigPath(const std::string& relative);

// "<config_dir>/config.json"
std::string GetEditorConfigPath();
