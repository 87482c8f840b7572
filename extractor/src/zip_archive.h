#pragma once

#include <zip.h>

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>

namespace docimg {

// Maximum size of an XML part read fully into memory (100 MB)
constexpr size_t MAX_ZIP_ENTRY_SIZE = 100 * 1024 * 1024;

// Read-only libzip archive, closed on destruction
class ZipArchive {
public:
    // Throws ExtractError(Archive) when the file is missing or not a ZIP
    explicit ZipArchive(const std::filesystem::path &archive_path);

    zip_int64_t entry_count() const;

    // Stored name of the entry at index; throws if the index is unreadable
    std::string entry_name(zip_uint64_t index) const;

    // Index of the named entry, or -1 if absent
    zip_int64_t locate(const std::string &entry_name) const;

    // Whole contents of a named entry. Returns false when the entry is
    // missing or larger than MAX_ZIP_ENTRY_SIZE.
    bool read_file(const std::string &entry_name, std::string &contents) const;

    // Stream an entry's decompressed bytes into out. Throws
    // ExtractError(Archive) on read failure, ExtractError(Filesystem) when
    // out rejects a write.
    void copy_entry(zip_uint64_t index, std::ostream &out) const;

    const std::filesystem::path &path() const { return path_; }

private:
    struct Closer {
        void operator()(zip_t *archive) const { zip_discard(archive); }
    };
    struct FileCloser {
        void operator()(zip_file_t *file) const { zip_fclose(file); }
    };

    std::filesystem::path path_;
    std::unique_ptr<zip_t, Closer> archive_;
};

} // namespace docimg
