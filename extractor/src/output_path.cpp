#include "output_path.h"
#include "extract_error.h"

#include <system_error>

namespace docimg {

// Existence probe on the real filesystem. An unreadable path counts as
// taken so it is never overwritten.
static bool path_exists_on_disk(const fs::path &path) {
    std::error_code ec;
    bool found = fs::exists(path, ec);
    return found || ec;
}

std::string output_file_name(const std::string &base_name, size_t seq_index,
                             size_t total_count, const std::string &extension) {
    if (total_count > 1) {
        return base_name + "_" + std::to_string(seq_index + 1) + "." + extension;
    }
    return base_name + "." + extension;
}

fs::path allocate_output_path(const fs::path &output_dir, const std::string &base_name,
                              size_t seq_index, size_t total_count,
                              const std::string &extension) {
    return allocate_output_path(output_dir, base_name, seq_index, total_count, extension,
                                path_exists_on_disk);
}

fs::path allocate_output_path(const fs::path &output_dir, const std::string &base_name,
                              size_t seq_index, size_t total_count,
                              const std::string &extension, const PathProbe &exists) {
    fs::path output_path = output_dir / output_file_name(base_name, seq_index, total_count, extension);
    if (!exists(output_path)) return output_path;

    // Stem of the composed name, e.g. "Report_2" for "Report_2.png"
    std::string base_stem = base_name;
    if (total_count > 1) base_stem += "_" + std::to_string(seq_index + 1);

    for (unsigned counter = 1; counter <= MAX_UNIQUE_NAME_ATTEMPTS; counter++) {
        output_path = output_dir / (base_stem + "_" + std::to_string(counter) + "." + extension);
        if (!exists(output_path)) return output_path;
    }

    throw ExtractError(ErrorKind::UniqueNameExhausted,
                       "Could not find unique filename after " +
                       std::to_string(MAX_UNIQUE_NAME_ATTEMPTS) + " attempts for " + base_stem);
}

void ensure_output_directory(const fs::path &output_dir) {
    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        throw ExtractError(ErrorKind::Filesystem,
                           "Failed to create output directory " + output_dir.string() +
                           ": " + ec.message());
    }
}

} // namespace docimg
