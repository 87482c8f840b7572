#pragma once

#include <set>
#include <string>
#include <vector>

namespace docimg {

using ExtensionSet = std::set<std::string>;

// Every extension the extractor can emit
const ExtensionSet &supported_image_extensions();

// Lowercased text after the last '.' of the final path component, or an
// empty string when there is none.
std::string extension_from_name(const std::string &path);

// Canonical extension for an image MIME type, or an empty string if the
// type is unknown.
std::string extension_from_mime(const std::string &mime_type);

// Map one user format token to its extension group ("jpeg" -> {jpg, jpeg}).
// Unrecognized tokens print a warning and yield an empty set.
ExtensionSet normalize_format_filter(const std::string &format_token);

// Union of the groups for each token. Falls back to the full supported set
// when no token is recognized.
ExtensionSet allowed_extensions_for(const std::vector<std::string> &format_tokens);

std::string to_lower(const std::string &text);

} // namespace docimg
