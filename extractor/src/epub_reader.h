#pragma once

#include "container_reader.h"
#include "image_formats.h"
#include "zip_archive.h"

#include <filesystem>
#include <string>
#include <vector>

namespace docimg {

// One manifest item of the package document
struct EpubResource {
    std::string id;
    std::string path;       // archive entry name, resolved against the OPF directory
    std::string mime_type;
};

// Dublin Core fields used for naming; empty when not declared
struct EpubMetadata {
    std::string title;
    std::string author;
};

// Case-insensitive substring filter on title and author. Every non-empty
// criterion must match.
struct MetadataFilter {
    std::string title;
    std::string author;

    bool empty() const { return title.empty() && author.empty(); }
    bool matches(const EpubMetadata &metadata) const;
};

// Images declared in the manifest of an EPUB package
class EpubReader : public ContainerReader {
public:
    // Opens the archive and parses container.xml and the package document.
    // Throws ExtractError(Archive) if either is missing or malformed.
    EpubReader(const std::filesystem::path &epub_path, const ExtensionSet &allowed_extensions);

    const EpubMetadata &metadata() const { return metadata_; }
    const std::vector<EpubResource> &resources() const { return resources_; }

    // Image resources in manifest order with a safe path and an allowed
    // extension (taken from the path, else from the MIME type)
    std::vector<CandidateImage> enumerate() const override;

    void copy_to(const CandidateImage &image, std::ostream &out) const override;

    // The declared cover image. Its extension is not checked against the
    // allowed set. Returns false when there is no usable cover.
    bool find_cover(CandidateImage &cover) const;

private:
    void load_package();
    const EpubResource *find_resource(const std::string &id) const;

    ZipArchive archive_;
    ExtensionSet allowed_extensions_;
    EpubMetadata metadata_;
    std::vector<EpubResource> resources_;
    std::string cover_id_;
};

// Decode %XX escapes of a manifest href
std::string percent_decode(const std::string &href);

// Join a manifest href onto the package document's directory, dropping "."
// segments. ".." segments are kept so path safety can reject them.
std::string resolve_href(const std::string &opf_path, const std::string &href);

} // namespace docimg
