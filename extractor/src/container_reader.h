#pragma once

#include <zip.h>

#include <iosfwd>
#include <string>
#include <vector>

namespace docimg {

// An entry selected for extraction. DOCX entries are addressed by archive
// index, EPUB resources by manifest id.
struct CandidateImage {
    zip_uint64_t entry_index = 0;
    std::string resource_id;
    std::string extension;
};

// Source of candidate images within one opened document
class ContainerReader {
public:
    virtual ~ContainerReader() = default;

    // Candidates in a stable order; the order fixes output numbering
    virtual std::vector<CandidateImage> enumerate() const = 0;

    // Stream the bytes of one candidate into out
    virtual void copy_to(const CandidateImage &image, std::ostream &out) const = 0;
};

} // namespace docimg
