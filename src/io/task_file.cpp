#include "io/task_file.h"

#include "io/text_file.h"

#include <cstdint>
#include <exception>
#include <string>
#include <utility>

using json = nlohmann::json;

namespace arcgrid::task_file
{
namespace
{
// Tasks are a handful of small grids; anything bigger is not a task file.
static constexpr std::size_t kMaxTaskFileBytes = 16u * 1024u * 1024u;

static std::string Prefixed(std::string_view context, const std::string& msg)
{
    if (context.empty())
        return msg;
    return std::string(context) + ": " + msg;
}

static bool ParseExamples(const json& arr,
                          const char* split,
                          bool require_output,
                          const GridLimits& limits,
                          std::vector<Example>& out,
                          std::string& err)
{
    out.clear();
    for (std::size_t i = 0; i < arr.size(); ++i)
    {
        const json& item = arr[i];
        const std::string ctx = std::string(split) + "[" + std::to_string(i) + "]";
        if (!item.is_object())
        {
            err = ctx + " must be an object";
            return false;
        }
        if (!item.contains("input"))
        {
            err = ctx + " is missing 'input'";
            return false;
        }
        if (require_output && !item.contains("output"))
        {
            err = ctx + " is missing 'output'";
            return false;
        }

        Example ex;
        if (!GridFromJson(item["input"], limits, ctx + ".input", ex.input, err))
            return false;
        if (item.contains("output"))
        {
            CellRows rows;
            if (!GridFromJson(item["output"], limits, ctx + ".output", rows, err))
                return false;
            ex.output = std::move(rows);
        }
        out.push_back(std::move(ex));
    }
    return true;
}

static bool CheckShape(const CellRows& rows, std::string_view context, std::string& err)
{
    if (rows.empty())
    {
        err = Prefixed(context, "grid cannot be empty");
        return false;
    }
    if (rows.front().empty())
    {
        err = Prefixed(context, "rows cannot be empty");
        return false;
    }
    const std::size_t width = rows.front().size();
    for (std::size_t y = 0; y < rows.size(); ++y)
    {
        if (rows[y].size() != width)
        {
            err = Prefixed(context, "ragged rows: row " + std::to_string(y) + " has length " +
                                        std::to_string(rows[y].size()) + ", expected " + std::to_string(width));
            return false;
        }
    }
    return true;
}

static json ExampleToJson(const Example& ex)
{
    json j = json::object();
    j["input"] = ex.input;
    if (ex.output)
        j["output"] = *ex.output;
    return j;
}
} // namespace

Task CreateEmptyTask()
{
    return Task{};
}

bool ValidateGridRows(const CellRows& rows, const GridLimits& limits, std::string_view context, std::string& err)
{
    err.clear();
    if (!CheckShape(rows, context, err))
        return false;

    const std::size_t height = rows.size();
    const std::size_t width = rows.front().size();
    if (width > (std::size_t)limits.max_width || height > (std::size_t)limits.max_height)
    {
        err = Prefixed(context, "dimensions " + std::to_string(width) + "x" + std::to_string(height) +
                                    " exceed maximum " + std::to_string(limits.max_width) + "x" +
                                    std::to_string(limits.max_height));
        return false;
    }

    for (std::size_t y = 0; y < height; ++y)
    {
        for (std::size_t x = 0; x < width; ++x)
        {
            const int v = rows[y][x];
            if (v < 0 || v > limits.max_colour)
            {
                err = Prefixed(context, "invalid value " + std::to_string(v) + " at (" + std::to_string(x) + ", " +
                                            std::to_string(y) + "), expected 0-" +
                                            std::to_string(limits.max_colour));
                return false;
            }
        }
    }
    return true;
}

bool GridFromJson(const json& j, const GridLimits& limits, std::string_view context, CellRows& out, std::string& err)
{
    err.clear();
    out.clear();

    if (!j.is_array())
    {
        err = Prefixed(context, "must be an array of rows");
        return false;
    }

    CellRows rows;
    rows.reserve(j.size());
    for (std::size_t y = 0; y < j.size(); ++y)
    {
        const json& row = j[y];
        if (!row.is_array())
        {
            err = Prefixed(context, "row " + std::to_string(y) + " must be an array");
            return false;
        }
        std::vector<int> r;
        r.reserve(row.size());
        for (std::size_t x = 0; x < row.size(); ++x)
        {
            const json& v = row[x];
            // is_number_integer() is false for booleans and floats.
            if (!v.is_number_integer())
            {
                err = Prefixed(context, "invalid value " + v.dump() + " at (" + std::to_string(x) + ", " +
                                            std::to_string(y) + "), expected an integer");
                return false;
            }
            const std::int64_t iv = v.get<std::int64_t>();
            if (iv < 0 || iv > limits.max_colour)
            {
                err = Prefixed(context, "invalid value " + std::to_string(iv) + " at (" + std::to_string(x) +
                                            ", " + std::to_string(y) + "), expected 0-" +
                                            std::to_string(limits.max_colour));
                return false;
            }
            r.push_back((int)iv);
        }
        rows.push_back(std::move(r));
    }

    if (!ValidateGridRows(rows, limits, context, err))
        return false;
    out = std::move(rows);
    return true;
}

bool ParseTaskJson(const json& j, const GridLimits& limits, Task& out, std::string& err)
{
    err.clear();
    out = Task{};

    if (!j.is_object())
    {
        err = "task must be a JSON object";
        return false;
    }
    if (!j.contains("train"))
    {
        err = "task must contain 'train' key";
        return false;
    }
    if (!j["train"].is_array())
    {
        err = "'train' must be an array";
        return false;
    }

    Task task;
    if (!ParseExamples(j["train"], "train", true, limits, task.train, err))
        return false;

    if (j.contains("test"))
    {
        if (!j["test"].is_array())
        {
            err = "'test' must be an array";
            return false;
        }
        if (!ParseExamples(j["test"], "test", false, limits, task.test, err))
            return false;
    }

    for (auto it = j.begin(); it != j.end(); ++it)
    {
        if (it.key() != "train" && it.key() != "test")
            task.extras[it.key()] = it.value();
    }

    out = std::move(task);
    return true;
}

bool ParseTaskText(std::string_view text, const GridLimits& limits, Task& out, std::string& err)
{
    json j;
    try
    {
        j = json::parse(text.begin(), text.end());
    }
    catch (const std::exception& e)
    {
        err = std::string("Invalid JSON: ") + e.what();
        out = Task{};
        return false;
    }
    return ParseTaskJson(j, limits, out, err);
}

bool LoadTaskFromFile(const std::string& path, const GridLimits& limits, Task& out, std::string& err)
{
    std::string text;
    if (!text_file::ReadAllLimited(path, text, err, kMaxTaskFileBytes))
        return false;
    return ParseTaskText(text, limits, out, err);
}

json TaskToJson(const Task& task)
{
    json j = task.extras.is_object() ? task.extras : json::object();

    json train = json::array();
    for (const Example& ex : task.train)
        train.push_back(ExampleToJson(ex));
    j["train"] = std::move(train);

    json test = json::array();
    for (const Example& ex : task.test)
        test.push_back(ExampleToJson(ex));
    j["test"] = std::move(test);
    return j;
}

bool SaveTaskToFile(const std::string& path, const Task& task, std::string& err)
{
    err.clear();

    for (std::size_t i = 0; i < task.train.size(); ++i)
    {
        const std::string ctx = "train[" + std::to_string(i) + "]";
        if (!CheckShape(task.train[i].input, ctx + ".input", err))
            return false;
        if (!task.train[i].output)
        {
            err = ctx + " is missing 'output'";
            return false;
        }
        if (!CheckShape(*task.train[i].output, ctx + ".output", err))
            return false;
    }
    for (std::size_t i = 0; i < task.test.size(); ++i)
    {
        const std::string ctx = "test[" + std::to_string(i) + "]";
        if (!CheckShape(task.test[i].input, ctx + ".input", err))
            return false;
        if (task.test[i].output && !CheckShape(*task.test[i].output, ctx + ".output", err))
            return false;
    }

    std::string text;
    try
    {
        text = TaskToJson(task).dump(2);
        text.push_back('\n');
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to encode task: ") + e.what();
        return false;
    }
    return text_file::WriteAtomic(path, text, err);
}

bool AddTrainExample(Task& task,
                     const CellRows& input,
                     const CellRows& output,
                     const GridLimits& limits,
                     std::string& err)
{
    if (!ValidateGridRows(input, limits, "input grid", err))
        return false;
    if (!ValidateGridRows(output, limits, "output grid", err))
        return false;

    Example ex;
    ex.input = input;
    ex.output = output;
    task.train.push_back(std::move(ex));
    return true;
}

bool AddTestExample(Task& task,
                    const CellRows& input,
                    const std::optional<CellRows>& output,
                    const GridLimits& limits,
                    std::string& err)
{
    if (!ValidateGridRows(input, limits, "input grid", err))
        return false;
    if (output && !ValidateGridRows(*output, limits, "output grid", err))
        return false;

    Example ex;
    ex.input = input;
    ex.output = output;
    task.test.push_back(std::move(ex));
    return true;
}

CellRows GridToRows(const Grid& grid)
{
    return grid.ToList();
}

bool GridFromRows(const CellRows& rows, const GridLimits& limits, Grid& out, std::string& err)
{
    err.clear();
    try
    {
        Grid g(1, 1, 0, limits);
        g.FromList(rows);
        out = std::move(g);
    }
    catch (const ValidationError& e)
    {
        err = e.what();
        return false;
    }
    return true;
}

} // namespace arcgrid::task_file
