#include "io/text_file.h"

#include <cstdint>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace text_file
{
bool ReadAllLimited(const std::string& path, std::string& out, std::string& err, std::size_t limit_bytes)
{
    err.clear();
    out.clear();
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        err = "Failed to open file for reading: " + path;
        return false;
    }
    in.seekg(0, std::ios::end);
    std::streamoff sz = in.tellg();
    if (sz < 0)
    {
        err = "Failed to read file size.";
        return false;
    }
    if ((std::uint64_t)sz > (std::uint64_t)limit_bytes)
    {
        err = "File too large.";
        return false;
    }
    in.seekg(0, std::ios::beg);
    out.resize((size_t)sz);
    if (sz > 0)
        in.read(out.data(), sz);
    if (!in && sz > 0)
    {
        err = "Failed to read file contents.";
        return false;
    }
    return true;
}

bool WriteAtomic(const std::string& path, const std::string& contents, std::string& err)
{
    err.clear();

    std::error_code ec;
    const fs::path p(path);
    if (p.has_parent_path())
    {
        fs::create_directories(p.parent_path(), ec);
        if (ec)
        {
            err = "Failed to create directory " + p.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            err = "Failed to open temp file for writing: " + tmp_path;
            return false;
        }
        out.write(contents.data(), (std::streamsize)contents.size());
        out.close();
        if (!out)
        {
            err = "Failed to finalize temp file write: " + tmp_path;
            std::error_code rm_ec;
            fs::remove(tmp_path, rm_ec);
            return false;
        }
    }

    fs::rename(tmp_path, path, ec);
    if (ec)
    {
        err = "Failed to replace " + path + ": " + ec.message();
        // Best effort cleanup; the rename error is what gets reported.
        std::error_code rm_ec;
        fs::remove(tmp_path, rm_ec);
        return false;
    }
    return true;
}
} // namespace text_file
