#include "core/palette/palette.h"
#include "io/task_file.h"

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace
{
// The ARC task corpus never exceeds 30x30.
static constexpr int kDefaultTaskMaxSize = 30;

static void PrintUsage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " [--max-size N] [--palette arc10|arc16] <task.json>...\n"
              << "\n"
              << "Validates ARC task files: 'train'/'test' structure, example keys, and every grid\n"
              << "(rectangular, within N x N, colours within the palette).\n"
              << "\n"
              << "Options:\n"
              << "  --max-size N     Largest allowed width/height (default: 30)\n"
              << "  --palette NAME   Colour range: arc10 (0-9, default) or arc16 (0-15)\n";
}
} // namespace

int main(int argc, char** argv)
{
    int max_size = kDefaultTaskMaxSize;
    arcgrid::colour::BuiltinPalette palette_id = arcgrid::colour::BuiltinPalette::Arc10;
    std::vector<std::string> paths;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view a = argv[i];
        auto need = [&](const char* opt) -> std::string_view {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << opt << "\n";
                PrintUsage(argv[0]);
                std::exit(2);
            }
            return std::string_view(argv[++i]);
        };

        if (a == "--help" || a == "-h")
        {
            PrintUsage(argv[0]);
            return 0;
        }
        else if (a == "--max-size")
        {
            const std::string v(need("--max-size"));
            char* end = nullptr;
            const long n = std::strtol(v.c_str(), &end, 10);
            if (v.empty() || *end != '\0' || n < 1 || n > 4096)
            {
                std::cerr << "Invalid --max-size value: " << v << "\n";
                return 2;
            }
            max_size = (int)n;
        }
        else if (a == "--palette")
        {
            const std::string_view v = need("--palette");
            const auto id = arcgrid::colour::ParseBuiltinPaletteName(v);
            if (!id)
            {
                std::cerr << "Invalid --palette value (expected arc10|arc16)\n";
                return 2;
            }
            palette_id = *id;
        }
        else if (!a.empty() && a[0] == '-')
        {
            std::cerr << "Unknown arg: " << a << "\n";
            PrintUsage(argv[0]);
            return 2;
        }
        else
        {
            paths.emplace_back(a);
        }
    }

    if (paths.empty())
    {
        PrintUsage(argv[0]);
        return 2;
    }

    const arcgrid::GridLimits limits =
        arcgrid::colour::LimitsForPalette(arcgrid::colour::GetBuiltinPalette(palette_id), max_size, max_size);

    int failures = 0;
    for (const std::string& path : paths)
    {
        arcgrid::task_file::Task task;
        std::string err;
        if (!arcgrid::task_file::LoadTaskFromFile(path, limits, task, err))
        {
            std::cout << "FAIL " << path << ": " << err << "\n";
            ++failures;
            continue;
        }
        std::cout << "OK " << path << " (train " << task.train.size() << ", test " << task.test.size() << ")\n";
    }

    if (failures > 0)
    {
        std::cerr << failures << " of " << paths.size() << " task file(s) failed validation.\n";
        return 1;
    }
    return 0;
}
