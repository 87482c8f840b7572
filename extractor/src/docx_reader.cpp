#include "docx_reader.h"
#include "path_safety.h"

namespace docimg {

DocxReader::DocxReader(const std::filesystem::path &docx_path,
                       const ExtensionSet &allowed_extensions)
    : archive_(docx_path), allowed_extensions_(allowed_extensions) {}

std::vector<CandidateImage> DocxReader::enumerate() const {
    std::vector<CandidateImage> images;
    zip_int64_t total_entries = archive_.entry_count();

    for (zip_int64_t entry_idx = 0; entry_idx < total_entries; entry_idx++) {
        std::string entry_path = archive_.entry_name(entry_idx);

        // Skip entries that would escape the output directory
        if (!is_safe_archive_path(entry_path)) continue;

        std::string extension = extension_from_name(entry_path);
        if (extension.empty() || !allowed_extensions_.count(extension)) continue;

        CandidateImage image;
        image.entry_index = static_cast<zip_uint64_t>(entry_idx);
        image.extension = extension;
        images.push_back(image);
    }
    return images;
}

void DocxReader::copy_to(const CandidateImage &image, std::ostream &out) const {
    archive_.copy_entry(image.entry_index, out);
}

} // namespace docimg
