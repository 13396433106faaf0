#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/grid.h"

// ARC task files (*.json).
//
// Shape:
//   { "train": [ {"input": G, "output": G}, ... ],
//     "test":  [ {"input": G, "output"?: G}, ... ] }
// where G is a nested integer array rows[y][x].
//
// All functions report failures through `err` and never throw.
namespace arcgrid::task_file
{
struct Example
{
    CellRows                input;
    std::optional<CellRows> output; // always present for train examples
};

struct Task
{
    std::vector<Example> train;
    std::vector<Example> test;

    // Unknown top-level keys, kept so a load/save cycle doesn't drop them.
    nlohmann::json extras = nlohmann::json::object();
};

Task CreateEmptyTask();

// Shape/range checks on an already-typed grid. `context` prefixes the message ("train[0].input").
bool ValidateGridRows(const CellRows& rows, const GridLimits& limits, std::string_view context, std::string& err);

// Type checks (arrays of arrays of integers) followed by ValidateGridRows.
bool GridFromJson(const nlohmann::json& j,
                  const GridLimits& limits,
                  std::string_view context,
                  CellRows& out,
                  std::string& err);

bool ParseTaskJson(const nlohmann::json& j, const GridLimits& limits, Task& out, std::string& err);
bool ParseTaskText(std::string_view text, const GridLimits& limits, Task& out, std::string& err);
bool LoadTaskFromFile(const std::string& path, const GridLimits& limits, Task& out, std::string& err);

nlohmann::json TaskToJson(const Task& task);
bool SaveTaskToFile(const std::string& path, const Task& task, std::string& err);

// Validate, then append. The task is unchanged on failure.
bool AddTrainExample(Task& task,
                     const CellRows& input,
                     const CellRows& output,
                     const GridLimits& limits,
                     std::string& err);
bool AddTestExample(Task& task,
                    const CellRows& input,
                    const std::optional<CellRows>& output,
                    const GridLimits& limits,
                    std::string& err);

// Bridges to the grid model, turning its exceptions into `err`.
CellRows GridToRows(const Grid& grid);
bool GridFromRows(const CellRows& rows, const GridLimits& limits, Grid& out, std::string& err);

} // namespace arcgrid::task_file
