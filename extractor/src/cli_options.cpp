#include "cli_options.h"

#include <iostream>

namespace docimg {

std::vector<std::string> split_format_list(const std::string &list) {
    std::vector<std::string> tokens;
    size_t start = 0;
    while (start <= list.size()) {
        size_t comma = list.find(',', start);
        if (comma == std::string::npos) comma = list.size();
        std::string token = list.substr(start, comma - start);
        if (token.find_first_not_of(" \t") != std::string::npos) tokens.push_back(token);
        start = comma + 1;
    }
    return tokens;
}

static bool is_option(const std::string &arg) {
    return arg.size() > 1 && arg[0] == '-';
}

bool parse_cli(int argc, char *argv[], CliOptions &options, std::string &error) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg == "--version" || arg == "-V") {
            options.show_version = true;
        } else if (arg == "--input" || arg == "-i") {
            // Takes one or more paths
            int taken = 0;
            while (i + 1 < argc && !is_option(argv[i + 1])) {
                options.inputs.emplace_back(argv[++i]);
                taken++;
            }
            if (taken == 0) {
                error = arg + " requires at least one path";
                return false;
            }
        } else if (arg == "--output" || arg == "-o") {
            if (i + 1 >= argc || is_option(argv[i + 1])) {
                error = arg + " requires a directory";
                return false;
            }
            options.output_dir = argv[++i];
        } else if (arg == "--recursive" || arg == "-r") {
            options.recursive = true;
        } else if (arg == "--formats" || arg == "-f") {
            // Takes zero or more comma-separated lists
            while (i + 1 < argc && !is_option(argv[i + 1])) {
                for (const auto &token : split_format_list(argv[++i])) {
                    options.formats.push_back(token);
                }
            }
        } else if (arg == "--cover-only" || arg == "-c") {
            options.cover_only = true;
        } else if (arg == "--cover-fallback") {
            options.cover_fallback = true;
        } else if (arg == "--title" || arg == "--author") {
            if (i + 1 >= argc) {
                error = arg + " requires a value";
                return false;
            }
            if (arg == "--title") {
                options.title_filter = argv[++i];
            } else {
                options.author_filter = argv[++i];
            }
        } else if (is_option(arg)) {
            error = "Unknown option: " + arg;
            return false;
        } else {
            options.inputs.emplace_back(arg);
        }
    }

    if (options.show_help || options.show_version) return true;

    if (options.cover_fallback && !options.cover_only) {
        error = "--cover-fallback requires --cover-only";
        return false;
    }
    if (options.inputs.empty()) {
        error = "At least one input path is required";
        return false;
    }
    return true;
}

void print_usage(const char *prog) {
    std::cerr << "Extract images from Word (.docx) and EPUB files\n"
              << "\n"
              << "Usage:\n"
              << "  " << prog << " [options] <file-or-dir>...\n"
              << "\n"
              << "Options:\n"
              << "  -i, --input <path>...     Input .docx/.epub files or directories\n"
              << "  -o, --output <dir>        Output directory (default: current directory)\n"
              << "  -r, --recursive           Search input directories recursively\n"
              << "  -f, --formats <list>      Image formats to extract, e.g. \"png,jpg\"\n"
              << "                            (default: all supported formats)\n"
              << "  -c, --cover-only          EPUB: extract only the cover image\n"
              << "      --cover-fallback      EPUB: extract all images when no cover is found\n"
              << "                            (requires --cover-only)\n"
              << "      --title <text>        EPUB: only books whose title contains text\n"
              << "      --author <text>       EPUB: only books whose author contains text\n"
              << "  -h, --help                Show this help\n"
              << "  -V, --version             Show version\n"
              << "\n"
              << "Progress goes to stdout. Warnings/errors go to stderr.\n";
}

} // namespace docimg
