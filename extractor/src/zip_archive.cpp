#include "zip_archive.h"
#include "extract_error.h"

#include <ostream>
#include <vector>

namespace docimg {

// Chunk size when streaming entries to disk
static constexpr size_t COPY_CHUNK_SIZE = 64 * 1024;

static std::string zip_open_error_message(int error_code) {
    zip_error_t zip_error;
    zip_error_init_with_code(&zip_error, error_code);
    std::string message = zip_error_strerror(&zip_error);
    zip_error_fini(&zip_error);
    return message;
}

ZipArchive::ZipArchive(const std::filesystem::path &archive_path) : path_(archive_path) {
    int zip_error = 0;
    zip_t *archive = zip_open(archive_path.string().c_str(), ZIP_RDONLY, &zip_error);
    if (!archive) {
        throw ExtractError(ErrorKind::Archive,
                           "Failed to read zip archive: " + archive_path.string() +
                           ": " + zip_open_error_message(zip_error));
    }
    archive_.reset(archive);
}

zip_int64_t ZipArchive::entry_count() const {
    return zip_get_num_entries(archive_.get(), 0);
}

std::string ZipArchive::entry_name(zip_uint64_t index) const {
    const char *raw_entry_name = zip_get_name(archive_.get(), index, 0);
    if (!raw_entry_name) {
        throw ExtractError(ErrorKind::Archive,
                           "Failed to read entry " + std::to_string(index) + " of " +
                           path_.string() + ": " + zip_strerror(archive_.get()));
    }
    return raw_entry_name;
}

zip_int64_t ZipArchive::locate(const std::string &entry_name) const {
    return zip_name_locate(archive_.get(), entry_name.c_str(), 0);
}

bool ZipArchive::read_file(const std::string &entry_name, std::string &contents) const {
    zip_stat_t entry_stat;
    zip_stat_init(&entry_stat);
    if (zip_stat(archive_.get(), entry_name.c_str(), 0, &entry_stat) != 0) {
        return false;
    }

    if (!(entry_stat.valid & ZIP_STAT_SIZE) || entry_stat.size > MAX_ZIP_ENTRY_SIZE) {
        return false;
    }

    std::unique_ptr<zip_file_t, FileCloser> zip_handle(
        zip_fopen(archive_.get(), entry_name.c_str(), 0));
    if (!zip_handle) {
        return false;
    }

    contents.assign(entry_stat.size, '\0');
    zip_int64_t bytes_read = zip_fread(zip_handle.get(), &contents[0], entry_stat.size);

    if (bytes_read < 0 || (zip_uint64_t)bytes_read != entry_stat.size) {
        contents.clear();
        return false;
    }
    return true;
}

void ZipArchive::copy_entry(zip_uint64_t index, std::ostream &out) const {
    std::unique_ptr<zip_file_t, FileCloser> zip_handle(zip_fopen_index(archive_.get(), index, 0));
    if (!zip_handle) {
        throw ExtractError(ErrorKind::Archive,
                           "Failed to open entry " + std::to_string(index) + " of " +
                           path_.string() + ": " + zip_strerror(archive_.get()));
    }

    std::vector<char> buffer(COPY_CHUNK_SIZE);
    for (;;) {
        zip_int64_t bytes_read = zip_fread(zip_handle.get(), buffer.data(), buffer.size());
        if (bytes_read < 0) {
            throw ExtractError(ErrorKind::Archive,
                               "Failed to read image from archive " + path_.string() +
                               ": " + zip_file_strerror(zip_handle.get()));
        }
        if (bytes_read == 0) break;

        if (!out.write(buffer.data(), static_cast<std::streamsize>(bytes_read))) {
            throw ExtractError(ErrorKind::Filesystem, "Failed to write image data");
        }
    }
}

} // namespace docimg
