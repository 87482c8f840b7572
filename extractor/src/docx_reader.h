#pragma once

#include "container_reader.h"
#include "image_formats.h"
#include "zip_archive.h"

#include <filesystem>

namespace docimg {

// Images stored as plain entries of a ZIP container (DOCX)
class DocxReader : public ContainerReader {
public:
    DocxReader(const std::filesystem::path &docx_path, const ExtensionSet &allowed_extensions);

    // Entries in archive storage order whose name is safe and whose
    // extension is allowed
    std::vector<CandidateImage> enumerate() const override;

    void copy_to(const CandidateImage &image, std::ostream &out) const override;

private:
    ZipArchive archive_;
    ExtensionSet allowed_extensions_;
};

} // namespace docimg
