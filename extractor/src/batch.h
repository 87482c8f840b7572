#pragma once

#include "pipeline.h"

#include <filesystem>
#include <string>
#include <vector>

namespace docimg {

namespace fs = std::filesystem;

// Result of processing one document
struct DocumentOutcome {
    fs::path path;
    bool explicit_target = false;  // named directly on the command line
    bool succeeded = false;
    size_t images = 0;
    std::string error;
};

struct BatchReport {
    std::vector<DocumentOutcome> outcomes;
    size_t total_images = 0;
    size_t documents_with_images = 0;
    size_t failures = 0;
    size_t explicit_failures = 0;

    void add(const DocumentOutcome &outcome);
};

struct BatchRequest {
    std::vector<fs::path> inputs;
    fs::path output_dir = ".";
    bool recursive = false;
    ExtractOptions options;
};

// Supported documents directly inside dir, or anywhere below it when
// recursive is set, in sorted order
std::vector<fs::path> collect_documents(const fs::path &dir, bool recursive);

// Process one document, capturing its failure in the outcome
DocumentOutcome process_one(const fs::path &input_path, bool explicit_target,
                            const fs::path &output_dir, const ExtractOptions &options);

// Process every input in turn. A failing document is logged and recorded;
// it never stops the rest of the batch.
BatchReport run_batch(const BatchRequest &request);

} // namespace docimg
