// arcgrid: headless grid editor.
//
// Applies editing operations to a grid (optionally the first training input
// of an ARC task file) in command-line order, then prints and/or saves it.

#include "app/editor_session.h"
#include "core/paths.h"
#include "io/editor_config.h"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace
{
static void PrintUsage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " [--config <path>] [--open <task.json>] [operations...]\n"
              << "               [--print] [--save | -o <path>]\n"
              << "\n"
              << "Operations (applied in order):\n"
              << "  --colour C       Select colour C\n"
              << "  --tool paint|fill\n"
              << "                   Select the tool used by --at\n"
              << "  --at X,Y         Paint or flood fill at cell (X, Y)\n"
              << "  --resize WxH     Resize the grid, keeping the top-left region\n"
              << "  --clear          Set every cell to 0\n"
              << "\n"
              << "Output:\n"
              << "  --print          Print the grid, status line and current colour to stdout\n"
              << "  --save           Save back to the opened task file\n"
              << "  -o <path>        Save the task to <path>\n"
              << "\n"
              << "Config defaults to " << GetEditorConfigPath() << "\n";
}

static bool ParseInt(std::string_view s, int& out)
{
    if (s.empty())
        return false;
    bool neg = false;
    if (s.front() == '-')
    {
        neg = true;
        s.remove_prefix(1);
        if (s.empty())
            return false;
    }
    int v = 0;
    for (char c : s)
    {
        if (c < '0' || c > '9')
            return false;
        v = v * 10 + (c - '0');
        if (v > 1000000)
            return false;
    }
    out = neg ? -v : v;
    return true;
}

static bool ParsePair(std::string_view s, char sep, int& a, int& b)
{
    const size_t p = s.find(sep);
    if (p == std::string_view::npos)
        return false;
    return ParseInt(s.substr(0, p), a) && ParseInt(s.substr(p + 1), b);
}

struct Op
{
    std::string name;
    std::string value;
};
} // namespace

int main(int argc, char** argv)
{
    std::string config_path;
    std::string open_path;
    std::string save_path;
    bool save_in_place = false;
    bool print = false;
    std::vector<Op> ops;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view a = argv[i];
        auto need = [&](const char* opt) -> std::string {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << opt << "\n";
                PrintUsage(argv[0]);
                std::exit(2);
            }
            return std::string(argv[++i]);
        };

        if (a == "--help" || a == "-h")
        {
            PrintUsage(argv[0]);
            return 0;
        }
        else if (a == "--config")
            config_path = need("--config");
        else if (a == "--open")
            open_path = need("--open");
        else if (a == "--print")
            print = true;
        else if (a == "--save")
            save_in_place = true;
        else if (a == "-o")
            save_path = need("-o");
        else if (a == "--colour" || a == "--tool" || a == "--at" || a == "--resize")
            ops.push_back({std::string(a), need(argv[i])});
        else if (a == "--clear")
            ops.push_back({std::string(a), std::string()});
        else
        {
            std::cerr << "Unknown arg: " << a << "\n";
            PrintUsage(argv[0]);
            return 2;
        }
    }

    if (save_in_place && open_path.empty())
    {
        std::cerr << "--save requires --open\n";
        return 2;
    }

    EditorConfig cfg;
    {
        std::string err;
        const bool ok = config_path.empty() ? LoadEditorConfig(cfg, err)
                                            : LoadEditorConfigFromFile(config_path, cfg, err);
        if (!ok)
            std::fprintf(stderr, "[config] %s (using defaults)\n", err.c_str());
    }

    EditorSession session(cfg);
    if (!open_path.empty())
    {
        std::string err;
        if (!session.OpenTask(open_path, err))
        {
            std::fprintf(stderr, "[task] open %s: %s\n", open_path.c_str(), err.c_str());
            return 1;
        }
    }

    for (const Op& op : ops)
    {
        if (op.name == "--colour")
        {
            int c = 0;
            if (!ParseInt(op.value, c) || !session.SetCurrentColour(c))
            {
                std::fprintf(stderr, "[session] invalid colour '%s' (expected 0-%d)\n", op.value.c_str(),
                             session.Limits().max_colour);
                return 1;
            }
        }
        else if (op.name == "--tool")
        {
            if (op.value == "paint")
                session.SetTool(EditorSession::Tool::Paint);
            else if (op.value == "fill")
                session.SetTool(EditorSession::Tool::Fill);
            else
            {
                std::fprintf(stderr, "[session] unknown tool '%s' (expected paint|fill)\n", op.value.c_str());
                return 2;
            }
        }
        else if (op.name == "--at")
        {
            int x = 0, y = 0;
            if (!ParsePair(op.value, ',', x, y))
            {
                std::fprintf(stderr, "[session] invalid cell '%s' (expected X,Y)\n", op.value.c_str());
                return 2;
            }
            if (!session.ApplyAt(x, y))
                std::fprintf(stderr, "[session] %s at (%d, %d) changed nothing\n",
                             std::string(ToolName(session.CurrentTool())).c_str(), x, y);
        }
        else if (op.name == "--resize")
        {
            int w = 0, h = 0;
            if (!ParsePair(op.value, 'x', w, h))
            {
                std::fprintf(stderr, "[session] invalid size '%s' (expected WxH)\n", op.value.c_str());
                return 2;
            }
            try
            {
                session.Resize(w, h);
            }
            catch (const arcgrid::ValidationError& e)
            {
                std::fprintf(stderr, "[session] resize failed: %s\n", e.what());
                return 1;
            }
        }
        else if (op.name == "--clear")
        {
            session.Clear();
        }
    }

    if (print)
    {
        std::cout << session.GetGrid().ToString() << "\n";
        std::cout << session.StatusText() << "\n";
        std::cout << "Colour " << session.CurrentColour() << " " << session.CurrentColourHex() << "\n";
    }

    if (save_in_place || !save_path.empty())
    {
        std::string err;
        const bool ok = save_in_place ? session.SaveTask(err) : session.SaveTaskAs(save_path, err);
        if (!ok)
        {
            std::fprintf(stderr, "[task] save failed: %s\n", err.c_str());
            return 1;
        }
    }

    return 0;
}
