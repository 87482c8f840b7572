#include "image_formats.h"
#include "name_sanitizer.h"

#include <cctype>
#include <iostream>
#include <map>

namespace docimg {

const ExtensionSet &supported_image_extensions() {
    static const ExtensionSet SUPPORTED_EXTS = {
        "jpg", "jpeg", "png", "gif", "bmp", "tiff", "tif", "svg", "wmf", "emf", "webp", "ico"
    };
    return SUPPORTED_EXTS;
}

std::string to_lower(const std::string &text) {
    std::string lowered;
    lowered.reserve(text.size());
    for (char ch : text) lowered += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return lowered;
}

std::string extension_from_name(const std::string &path) {
    size_t name_start = path.find_last_of("/\\");
    name_start = (name_start == std::string::npos) ? 0 : name_start + 1;

    size_t dot = path.rfind('.');
    // No dot in the file name itself, or a dotfile like ".hidden"
    if (dot == std::string::npos || dot <= name_start) return "";

    return to_lower(path.substr(dot + 1));
}

std::string extension_from_mime(const std::string &mime_type) {
    static const std::map<std::string, std::string> MIME_EXTS = {
        {"image/jpeg", "jpg"},
        {"image/png", "png"},
        {"image/gif", "gif"},
        {"image/bmp", "bmp"},
        {"image/webp", "webp"},
        {"image/svg+xml", "svg"},
        {"image/tiff", "tiff"},
        {"image/x-icon", "ico"},
        {"image/vnd.microsoft.icon", "ico"},
        {"image/x-emf", "emf"},
        {"image/emf", "emf"},
        {"image/x-wmf", "wmf"},
        {"image/wmf", "wmf"},
    };

    auto it = MIME_EXTS.find(mime_type);
    return it == MIME_EXTS.end() ? "" : it->second;
}

ExtensionSet normalize_format_filter(const std::string &format_token) {
    std::string token = to_lower(trim_whitespace(format_token));

    if (token == "jpg" || token == "jpeg") return {"jpg", "jpeg"};
    if (token == "tiff" || token == "tif") return {"tiff", "tif"};
    if (supported_image_extensions().count(token)) return {token};

    std::cerr << "Warning: Unrecognized format '" << trim_whitespace(format_token)
              << "' ignored" << std::endl;
    return {};
}

ExtensionSet allowed_extensions_for(const std::vector<std::string> &format_tokens) {
    ExtensionSet target_extensions;
    for (const auto &token : format_tokens) {
        ExtensionSet group = normalize_format_filter(token);
        target_extensions.insert(group.begin(), group.end());
    }

    if (target_extensions.empty()) return supported_image_extensions();
    return target_extensions;
}

} // namespace docimg
