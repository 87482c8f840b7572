#pragma once

#include <filesystem>
#include <string>
#include <vector>

#define DOCIMG_VERSION "0.3.0"

namespace docimg {

struct CliOptions {
    std::vector<std::filesystem::path> inputs;
    std::filesystem::path output_dir = ".";
    bool recursive = false;
    std::vector<std::string> formats;
    bool cover_only = false;
    bool cover_fallback = false;
    std::string title_filter;
    std::string author_filter;
    bool show_help = false;
    bool show_version = false;
};

// Parse argv into options. Returns false with a message in error when the
// command line is invalid.
bool parse_cli(int argc, char *argv[], CliOptions &options, std::string &error);

// Split a comma-separated format list, dropping empty tokens
std::vector<std::string> split_format_list(const std::string &list);

void print_usage(const char *prog);

} // namespace docimg
