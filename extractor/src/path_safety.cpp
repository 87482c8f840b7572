#include "path_safety.h"

#include <cctype>

namespace docimg {

bool is_safe_archive_path(const std::string &entry_name) {
    if (entry_name.empty()) return true;

    if (entry_name[0] == '/' || entry_name[0] == '\\') {
        return false;
    }

    // "C:foo" / "C:\foo"
    if (entry_name.size() >= 2 && entry_name[1] == ':' &&
        std::isalpha(static_cast<unsigned char>(entry_name[0]))) {
        return false;
    }

    size_t segment_start = 0;
    while (segment_start <= entry_name.size()) {
        size_t segment_end = entry_name.find_first_of("/\\", segment_start);
        if (segment_end == std::string::npos) segment_end = entry_name.size();

        if (entry_name.compare(segment_start, segment_end - segment_start, "..") == 0) {
            return false;
        }
        segment_start = segment_end + 1;
    }
    return true;
}

} // namespace docimg
