#pragma once

#include <filesystem>
#include <functional>
#include <string>

namespace docimg {

namespace fs = std::filesystem;

// Bound on the disambiguating counter appended to an existing output name
constexpr unsigned MAX_UNIQUE_NAME_ATTEMPTS = 1000;

// Existence check used while probing for a free name
using PathProbe = std::function<bool(const fs::path &)>;

// Name of the output file for the seq_index-th (0-based) of total_count
// images: "{base}_{seq+1}.{ext}" when total_count > 1, else "{base}.{ext}".
std::string output_file_name(const std::string &base_name, size_t seq_index,
                             size_t total_count, const std::string &extension);

// Returns a path under output_dir that does not exist yet. On collision a
// counter is appended to the stem ("{stem}_{n}.{ext}", n = 1..1000); throws
// ExtractError(UniqueNameExhausted) once the bound is passed. Does not
// create the file.
fs::path allocate_output_path(const fs::path &output_dir, const std::string &base_name,
                              size_t seq_index, size_t total_count,
                              const std::string &extension);

fs::path allocate_output_path(const fs::path &output_dir, const std::string &base_name,
                              size_t seq_index, size_t total_count,
                              const std::string &extension, const PathProbe &exists);

// Create output_dir and its parents if missing
void ensure_output_directory(const fs::path &output_dir);

} // namespace docimg
