#pragma once

#include "container_reader.h"
#include "epub_reader.h"
#include "image_formats.h"

#include <filesystem>
#include <string>
#include <vector>

namespace docimg {

namespace fs = std::filesystem;

enum class DocumentType {
    Unknown,
    Docx,
    Epub,
};

// Document type from the file suffix, case-insensitive
DocumentType document_type_for(const fs::path &path);

bool is_supported_document(const fs::path &path);

struct ExtractOptions {
    ExtensionSet allowed_extensions = supported_image_extensions();
    bool cover_only = false;      // EPUB: extract only the cover image
    bool cover_fallback = false;  // EPUB: with cover_only, extract all when no cover
    MetadataFilter filter;        // EPUB: skip documents that do not match
};

// Extract the images of one document into output_dir and return how many
// files were written. A document without matches returns 0 and leaves the
// filesystem untouched. Throws ExtractError on any failure.
size_t process_document(const fs::path &input_path, const fs::path &output_dir,
                        const ExtractOptions &options);

// Write each candidate in order under base_name. Creates output_dir only
// when there is something to write.
size_t extract_candidates(const ContainerReader &reader, const std::vector<CandidateImage> &images,
                          const fs::path &output_dir, const std::string &base_name,
                          const fs::path &input_path);

// Copy one candidate into output_path. A partial file is removed on failure.
void write_image_file(const ContainerReader &reader, const CandidateImage &image,
                      const fs::path &output_path);

} // namespace docimg
