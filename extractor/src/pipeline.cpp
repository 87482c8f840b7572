#include "pipeline.h"
#include "docx_reader.h"
#include "extract_error.h"
#include "name_sanitizer.h"
#include "output_path.h"

#include <fstream>
#include <iostream>
#include <system_error>

namespace docimg {

DocumentType document_type_for(const fs::path &path) {
    std::string ext = to_lower(path.extension().string());
    if (ext == ".docx") return DocumentType::Docx;
    if (ext == ".epub") return DocumentType::Epub;
    return DocumentType::Unknown;
}

bool is_supported_document(const fs::path &path) {
    return document_type_for(path) != DocumentType::Unknown;
}

void write_image_file(const ContainerReader &reader, const CandidateImage &image,
                      const fs::path &output_path) {
    std::ofstream output_file(output_path, std::ios::binary | std::ios::trunc);
    if (!output_file.is_open()) {
        throw ExtractError(ErrorKind::Filesystem,
                           "Failed to create output file: " + output_path.string());
    }

    try {
        reader.copy_to(image, output_file);
        output_file.close();
        if (output_file.fail()) {
            throw ExtractError(ErrorKind::Filesystem,
                               "Failed to write image data to " + output_path.string());
        }
    } catch (const ExtractError &) {
        output_file.close();
        std::error_code ec;
        fs::remove(output_path, ec);
        throw;
    }
}

size_t extract_candidates(const ContainerReader &reader, const std::vector<CandidateImage> &images,
                          const fs::path &output_dir, const std::string &base_name,
                          const fs::path &input_path) {
    if (images.empty()) return 0;

    ensure_output_directory(output_dir);

    size_t total_images = images.size();
    std::cout << "Found " << total_images << " image files in " << input_path.string() << "." << std::endl;

    size_t written = 0;
    for (size_t seq_index = 0; seq_index < total_images; seq_index++) {
        const CandidateImage &image = images[seq_index];
        fs::path output_path = allocate_output_path(output_dir, base_name, seq_index,
                                                    total_images, image.extension);

        std::cout << "Extracting to: " << output_path.string() << std::endl;
        write_image_file(reader, image, output_path);
        written++;
    }
    return written;
}

// Extract only the cover, falling back to every image when asked to
static size_t extract_epub_cover(const EpubReader &reader, const fs::path &output_dir,
                                 const std::string &base_name, const ExtractOptions &options,
                                 const fs::path &input_path) {
    CandidateImage cover;
    if (!reader.find_cover(cover)) {
        if (options.cover_fallback) {
            std::cerr << "Warning: No cover image found in " << input_path.string()
                      << ", falling back to extracting all images." << std::endl;
            return extract_candidates(reader, reader.enumerate(), output_dir, base_name, input_path);
        }
        std::cerr << "Warning: No cover image found in " << input_path.string() << std::endl;
        return 0;
    }

    if (!options.allowed_extensions.count(cover.extension)) {
        std::cerr << "Warning: Cover image format '" << cover.extension
                  << "' not in allowed formats, skipping." << std::endl;
        return 0;
    }

    ensure_output_directory(output_dir);

    // A lone cover never gets a sequence suffix
    fs::path output_path = allocate_output_path(output_dir, base_name, 0, 1, cover.extension);
    std::cout << "Extracting cover from " << input_path.string()
              << " to: " << output_path.string() << std::endl;
    write_image_file(reader, cover, output_path);
    return 1;
}

static size_t process_epub(const fs::path &input_path, const fs::path &output_dir,
                           const std::string &fallback_name, const ExtractOptions &options) {
    EpubReader reader(input_path, options.allowed_extensions);
    const EpubMetadata &metadata = reader.metadata();

    // Non-matching documents are skipped silently
    if (!options.filter.empty() && !options.filter.matches(metadata)) {
        return 0;
    }

    std::string base_name = format_base_name(metadata.author, metadata.title, fallback_name);
    if (base_name.empty()) {
        throw ExtractError(ErrorKind::InvalidInput, "Invalid filename: " + input_path.string());
    }

    if (!metadata.title.empty()) std::cout << "EPUB Title: " << metadata.title << std::endl;
    if (!metadata.author.empty()) std::cout << "EPUB Author: " << metadata.author << std::endl;

    if (options.cover_only) {
        return extract_epub_cover(reader, output_dir, base_name, options, input_path);
    }
    return extract_candidates(reader, reader.enumerate(), output_dir, base_name, input_path);
}

size_t process_document(const fs::path &input_path, const fs::path &output_dir,
                        const ExtractOptions &options) {
    DocumentType doc_type = document_type_for(input_path);
    if (doc_type == DocumentType::Unknown) {
        throw ExtractError(ErrorKind::InvalidInput,
                           "Unsupported file type: " + input_path.string() +
                           ". Supported types: .docx, .epub");
    }

    std::string doc_name = sanitize_filename(input_path.stem().string());
    if (doc_name.empty()) {
        throw ExtractError(ErrorKind::InvalidInput, "Invalid filename: " + input_path.string());
    }

    if (doc_type == DocumentType::Epub) {
        return process_epub(input_path, output_dir, doc_name, options);
    }

    DocxReader reader(input_path, options.allowed_extensions);
    return extract_candidates(reader, reader.enumerate(), output_dir, doc_name, input_path);
}

} // namespace docimg
