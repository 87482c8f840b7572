#pragma once

#include <string>

namespace docimg {

// Returns false for archive entry names that could escape the output
// directory: any ".." segment, a leading '/' or '\', or a drive prefix.
bool is_safe_archive_path(const std::string &entry_name);

} // namespace docimg
