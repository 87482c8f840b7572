#include "batch.h"
#include "extract_error.h"

#include <algorithm>
#include <iostream>
#include <system_error>

namespace docimg {

void BatchReport::add(const DocumentOutcome &outcome) {
    if (outcome.succeeded) {
        total_images += outcome.images;
        if (outcome.images > 0) documents_with_images++;
    } else {
        failures++;
        if (outcome.explicit_target) explicit_failures++;
    }
    outcomes.push_back(outcome);
}

std::vector<fs::path> collect_documents(const fs::path &dir, bool recursive) {
    std::vector<fs::path> documents;
    std::error_code ec;

    auto consider = [&documents](const fs::directory_entry &entry) {
        std::error_code status_ec;
        if (entry.is_regular_file(status_ec) && is_supported_document(entry.path())) {
            documents.push_back(entry.path());
        }
    };

    if (recursive) {
        fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            std::cerr << "Warning: Could not read directory " << dir.string() << ": " << ec.message() << std::endl;
            return documents;
        }
        for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) {
                std::cerr << "Warning: Could not access path: " << ec.message() << std::endl;
                ec.clear();
                break;
            }
            consider(*it);
        }
    } else {
        fs::directory_iterator it(dir, ec);
        if (ec) {
            std::cerr << "Warning: Could not read directory " << dir.string() << ": " << ec.message() << std::endl;
            return documents;
        }
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                std::cerr << "Warning: Could not access entry: " << ec.message() << std::endl;
                ec.clear();
                break;
            }
            consider(*it);
        }
    }

    std::sort(documents.begin(), documents.end());
    return documents;
}

DocumentOutcome process_one(const fs::path &input_path, bool explicit_target,
                            const fs::path &output_dir, const ExtractOptions &options) {
    DocumentOutcome outcome;
    outcome.path = input_path;
    outcome.explicit_target = explicit_target;

    try {
        outcome.images = process_document(input_path, output_dir, options);
        outcome.succeeded = true;
    } catch (const ExtractError &e) {
        outcome.error = e.what();
        std::cerr << "Error processing " << input_path.string() << ": " << e.what() << std::endl;
    }
    return outcome;
}

BatchReport run_batch(const BatchRequest &request) {
    BatchReport report;

    for (const auto &input : request.inputs) {
        std::error_code ec;
        if (!fs::exists(input, ec)) {
            std::cerr << "Warning: Input path does not exist: " << input.string() << std::endl;
            continue;
        }

        if (fs::is_directory(input, ec)) {
            for (const auto &document : collect_documents(input, request.recursive)) {
                report.add(process_one(document, false, request.output_dir, request.options));
            }
        } else {
            report.add(process_one(input, true, request.output_dir, request.options));
        }
    }
    return report;
}

} // namespace docimg
