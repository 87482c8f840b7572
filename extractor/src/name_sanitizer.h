#pragma once

#include <string>

namespace docimg {

// Replace characters that are invalid in a filename with '_' and trim the
// surrounding spaces. Reserved characters are / \ : * ? " < > |, NUL and
// every C0/C1 control character. Idempotent.
std::string sanitize_filename(const std::string &raw_name);

// Build the output base name for a document from its author and title.
// Blank values count as absent; with neither present the fallback is used.
std::string format_base_name(const std::string &author, const std::string &title,
                             const std::string &fallback);

// Strip leading and trailing ASCII whitespace
std::string trim_whitespace(const std::string &text);

} // namespace docimg
