#include "batch.h"
#include "cli_options.h"
#include "image_formats.h"

#include <iostream>
#include <string>

int main(int argc, char *argv[]) {
    docimg::CliOptions cli;
    std::string parse_error;
    if (!docimg::parse_cli(argc, argv, cli, parse_error)) {
        std::cerr << "Error: " << parse_error << "\n\n";
        docimg::print_usage(argv[0]);
        return 1;
    }
    if (cli.show_help) { docimg::print_usage(argv[0]); return 0; }
    if (cli.show_version) { std::cout << "docimg " << DOCIMG_VERSION << std::endl; return 0; }

    docimg::BatchRequest request;
    request.inputs = cli.inputs;
    request.output_dir = cli.output_dir;
    request.recursive = cli.recursive;
    request.options.allowed_extensions = docimg::allowed_extensions_for(cli.formats);
    request.options.cover_only = cli.cover_only;
    request.options.cover_fallback = cli.cover_fallback;
    request.options.filter.title = cli.title_filter;
    request.options.filter.author = cli.author_filter;

    docimg::BatchReport report = docimg::run_batch(request);

    if (report.total_images > 0) {
        std::cout << "Processing complete! Extracted " << report.total_images << " images from "
                  << report.documents_with_images << " document(s)." << std::endl;
    } else {
        std::cout << "Processing complete! No images found." << std::endl;
    }

    // Only documents named directly on the command line affect the exit status
    return report.explicit_failures > 0 ? 1 : 0;
}
