#include "name_sanitizer.h"

namespace docimg {

static bool is_reserved_char(unsigned char c) {
    switch (c) {
        case '/': case '\\': case ':': case '*': case '?':
        case '"': case '<':  case '>': case '|':
            return true;
        default:
            return c < 0x20 || c == 0x7f;
    }
}

std::string sanitize_filename(const std::string &raw_name) {
    std::string safe_name;
    safe_name.reserve(raw_name.size());

    for (size_t i = 0; i < raw_name.size(); i++) {
        unsigned char c = static_cast<unsigned char>(raw_name[i]);

        // C1 controls (U+0080..U+009F) are two bytes in UTF-8
        if (c == 0xc2 && i + 1 < raw_name.size()) {
            unsigned char next = static_cast<unsigned char>(raw_name[i + 1]);
            if (next >= 0x80 && next <= 0x9f) {
                safe_name += '_';
                i++;
                continue;
            }
        }

        safe_name += is_reserved_char(c) ? '_' : raw_name[i];
    }

    // Controls are already '_' here, so only spaces are left to trim
    size_t first = safe_name.find_first_not_of(' ');
    if (first == std::string::npos) return "";
    size_t last = safe_name.find_last_not_of(' ');
    return safe_name.substr(first, last - first + 1);
}

std::string trim_whitespace(const std::string &text) {
    const char *whitespace = " \t\r\n\f\v";
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

std::string format_base_name(const std::string &author, const std::string &title,
                             const std::string &fallback) {
    std::string trimmed_author = trim_whitespace(author);
    std::string trimmed_title = trim_whitespace(title);

    std::string raw_name;
    if (!trimmed_author.empty() && !trimmed_title.empty()) {
        raw_name = trimmed_author + " - " + trimmed_title;
    } else if (!trimmed_title.empty()) {
        raw_name = trimmed_title;
    } else if (!trimmed_author.empty()) {
        raw_name = trimmed_author;
    } else {
        raw_name = fallback;
    }

    return sanitize_filename(raw_name);
}

} // namespace docimg
