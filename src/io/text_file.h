#pragma once

#include <cstddef>
#include <string>

// Small file helpers shared by the JSON readers/writers.
namespace text_file
{
// Reads the whole file. Fails if it cannot be opened or exceeds `limit_bytes`.
bool ReadAllLimited(const std::string& path, std::string& out, std::string& err, std::size_t limit_bytes);

// Creates parent directories, writes `contents` to "<path>.tmp", then renames it over `path`.
bool WriteAtomic(const std::string& path, const std::string& contents, std::string& err);
} // namespace text_file
