#include "core/paths.h"

#include <cstdlib>
#include <filesystem>

static std::string EnvOrEmpty(const char* name)
{
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::string();
}

std::string GetArcGridConfigDir()
{
    const std::string xdg = EnvOrEmpty("XDG_CONFIG_HOME");
    if (!xdg.empty())
        return xdg + "/arcgrid";

    const std::string home = EnvOrEmpty("HOME");
    if (!home.empty())
        return home + "/.config/arcgrid";

    // Last resort: current directory
    return ".";
}

std::string ArcGridConfigPath(const std::string& relative)
{
    namespace fs = std::filesystem;
    if (relative.empty())
        return GetArcGridConfigDir();
    return (fs::path(GetArcGridConfigDir()) / relative).string();
}

std::string GetEditorConfigPath()
{
    return ArcGridConfigPath("config.json");
}
