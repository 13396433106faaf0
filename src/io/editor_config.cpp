#include "io/editor_config.h"

#include "core/palette/palette.h"
#include "core/paths.h"
#include "io/text_file.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <exception>
#include <filesystem>

using json = nlohmann::json;
namespace fs = std::filesystem;

static constexpr int kSchemaVersion = 1;
static constexpr int kMaxConfigurableSize = 256;

static int ClampInt(const json& j, const char* key, int fallback, int lo, int hi)
{
    if (!j.contains(key) || !j[key].is_number_integer())
        return fallback;
    const std::int64_t v = j[key].get<std::int64_t>();
    return (int)std::clamp<std::int64_t>(v, lo, hi);
}

static json ToJson(const EditorConfig& cfg)
{
    json j;
    j["schema_version"] = kSchemaVersion;
    j["palette"] = cfg.palette;

    json grid;
    grid["max_width"] = cfg.max_width;
    grid["max_height"] = cfg.max_height;
    grid["default_width"] = cfg.default_width;
    grid["default_height"] = cfg.default_height;
    j["grid"] = std::move(grid);
    return j;
}

static void FromJson(const json& j, EditorConfig& out)
{
    if (j.contains("palette") && j["palette"].is_string())
    {
        const auto id = arcgrid::colour::ParseBuiltinPaletteName(j["palette"].get<std::string>());
        out.palette = std::string(arcgrid::colour::BuiltinPaletteName(id ? *id : arcgrid::colour::BuiltinPalette::Arc10));
    }

    if (j.contains("grid") && j["grid"].is_object())
    {
        const json& g = j["grid"];
        out.max_width = ClampInt(g, "max_width", out.max_width, 1, kMaxConfigurableSize);
        out.max_height = ClampInt(g, "max_height", out.max_height, 1, kMaxConfigurableSize);
        out.default_width = ClampInt(g, "default_width", out.default_width, 1, out.max_width);
        out.default_height = ClampInt(g, "default_height", out.default_height, 1, out.max_height);
    }

    // A lowered maximum can leave untouched defaults above it.
    out.default_width = std::min(out.default_width, out.max_width);
    out.default_height = std::min(out.default_height, out.max_height);
}

bool LoadEditorConfigFromFile(const std::string& path, EditorConfig& out, std::string& err)
{
    err.clear();

    std::error_code ec;
    if (!fs::exists(path, ec))
        return true; // first run: keep defaults

    std::string text;
    if (!text_file::ReadAllLimited(path, text, err, 1024u * 1024u))
        return false;

    json j;
    try
    {
        j = json::parse(text);
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to parse config (") + path + "): " + e.what();
        return false;
    }

    if (!j.is_object())
    {
        err = std::string("Config root must be a JSON object: ") + path;
        return false;
    }

    if (j.contains("schema_version") && j["schema_version"].is_number_integer())
    {
        // Unknown schema: ignore file rather than failing startup.
        if (j["schema_version"].get<int>() != kSchemaVersion)
            return true;
    }

    FromJson(j, out);
    return true;
}

bool SaveEditorConfigToFile(const std::string& path, const EditorConfig& cfg, std::string& err)
{
    std::string text;
    try
    {
        text = ToJson(cfg).dump(2);
        text.push_back('\n');
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to encode config: ") + e.what();
        return false;
    }
    return text_file::WriteAtomic(path, text, err);
}

bool LoadEditorConfig(EditorConfig& out, std::string& err)
{
    return LoadEditorConfigFromFile(GetEditorConfigPath(), out, err);
}

const arcgrid::colour::Palette& PaletteFor(const EditorConfig& cfg)
{
    const auto id = arcgrid::colour::ParseBuiltinPaletteName(cfg.palette);
    return arcgrid::colour::GetBuiltinPalette(id ? *id : arcgrid::colour::BuiltinPalette::Arc10);
}

arcgrid::GridLimits GridLimitsFor(const EditorConfig& cfg)
{
    return arcgrid::colour::LimitsForPalette(PaletteFor(cfg),
                                             std::clamp(cfg.max_width, 1, kMaxConfigurableSize),
                                             std::clamp(cfg.max_height, 1, kMaxConfigurableSize));
}
