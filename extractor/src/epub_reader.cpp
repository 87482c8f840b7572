#include "epub_reader.h"
#include "extract_error.h"
#include "name_sanitizer.h"
#include "path_safety.h"

#include <pugixml.hpp>

#include <cstring>
#include <set>
#include <sstream>

namespace docimg {

static const char *CONTAINER_PATH = "META-INF/container.xml";

// Element name without its namespace prefix ("dc:title" -> "title")
static const char *local_name(const pugi::xml_node &node) {
    const char *name = node.name();
    const char *colon = std::strrchr(name, ':');
    return colon ? colon + 1 : name;
}

static pugi::xml_node find_by_local_name(const pugi::xml_node &root, const char *name) {
    return root.find_node([name](const pugi::xml_node &node) {
        return node.type() == pugi::node_element && std::strcmp(local_name(node), name) == 0;
    });
}

static bool contains_ignore_case(const std::string &haystack, const std::string &needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

// True when a space-separated properties attribute contains token
static bool has_property(const std::string &properties, const std::string &token) {
    std::istringstream property_stream(properties);
    std::string property;
    while (property_stream >> property) {
        if (property == token) return true;
    }
    return false;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool MetadataFilter::matches(const EpubMetadata &metadata) const {
    bool title_matches = title.empty() ||
        (!metadata.title.empty() && contains_ignore_case(metadata.title, title));
    bool author_matches = author.empty() ||
        (!metadata.author.empty() && contains_ignore_case(metadata.author, author));
    return title_matches && author_matches;
}

std::string percent_decode(const std::string &href) {
    std::string decoded;
    decoded.reserve(href.size());
    for (size_t i = 0; i < href.size(); i++) {
        if (href[i] == '%' && i + 2 < href.size()) {
            int high = hex_value(href[i + 1]);
            int low = hex_value(href[i + 2]);
            if (high >= 0 && low >= 0) {
                decoded += static_cast<char>(high * 16 + low);
                i += 2;
                continue;
            }
        }
        decoded += href[i];
    }
    return decoded;
}

std::string resolve_href(const std::string &opf_path, const std::string &href) {
    size_t dir_end = opf_path.rfind('/');
    std::string joined = (dir_end == std::string::npos) ? href : opf_path.substr(0, dir_end + 1) + href;

    std::string resolved;
    size_t segment_start = 0;
    while (segment_start <= joined.size()) {
        size_t segment_end = joined.find('/', segment_start);
        if (segment_end == std::string::npos) segment_end = joined.size();

        std::string segment = joined.substr(segment_start, segment_end - segment_start);
        if (segment != ".") {
            if (!resolved.empty()) resolved += '/';
            resolved += segment;
        }
        segment_start = segment_end + 1;
    }
    return resolved;
}

EpubReader::EpubReader(const std::filesystem::path &epub_path,
                       const ExtensionSet &allowed_extensions)
    : archive_(epub_path), allowed_extensions_(allowed_extensions) {
    load_package();
}

void EpubReader::load_package() {
    std::string container_xml;
    if (!archive_.read_file(CONTAINER_PATH, container_xml)) {
        throw ExtractError(ErrorKind::Archive,
                           "Failed to open EPUB file: missing " + std::string(CONTAINER_PATH));
    }

    pugi::xml_document container_doc;
    pugi::xml_parse_result parse_result = container_doc.load_string(container_xml.c_str());
    if (!parse_result) {
        throw ExtractError(ErrorKind::Archive,
                           "Failed to parse container.xml: " + std::string(parse_result.description()));
    }

    pugi::xml_node rootfile = container_doc.find_node([](const pugi::xml_node &node) {
        return std::strcmp(local_name(node), "rootfile") == 0 && node.attribute("full-path");
    });
    std::string opf_path = rootfile ? rootfile.attribute("full-path").value() : "";
    if (opf_path.empty()) {
        throw ExtractError(ErrorKind::Archive, "Failed to open EPUB file: no package document declared");
    }

    std::string opf_xml;
    if (!archive_.read_file(opf_path, opf_xml)) {
        throw ExtractError(ErrorKind::Archive,
                           "Failed to open EPUB file: missing package document " + opf_path);
    }

    pugi::xml_document opf_doc;
    parse_result = opf_doc.load_string(opf_xml.c_str());
    if (!parse_result) {
        throw ExtractError(ErrorKind::Archive,
                           "Failed to parse " + opf_path + ": " + parse_result.description());
    }

    pugi::xml_node metadata = find_by_local_name(opf_doc, "metadata");
    if (metadata) {
        metadata_.title = trim_whitespace(find_by_local_name(metadata, "title").text().get());
        metadata_.author = trim_whitespace(find_by_local_name(metadata, "creator").text().get());

        // EPUB 2 cover declaration: <meta name="cover" content="item-id"/>
        pugi::xml_node cover_meta = metadata.find_node([](const pugi::xml_node &node) {
            return std::strcmp(local_name(node), "meta") == 0 &&
                   std::strcmp(node.attribute("name").value(), "cover") == 0;
        });
        cover_id_ = cover_meta.attribute("content").value();
    }

    pugi::xml_node manifest = find_by_local_name(opf_doc, "manifest");
    std::set<std::string> seen_ids;
    std::string cover_image_id;

    for (pugi::xml_node item : manifest.children()) {
        if (std::strcmp(local_name(item), "item") != 0) continue;

        EpubResource resource;
        resource.id = item.attribute("id").value();
        std::string href = item.attribute("href").value();
        if (resource.id.empty() || href.empty() || !seen_ids.insert(resource.id).second) continue;

        resource.path = resolve_href(opf_path, percent_decode(href));
        resource.mime_type = to_lower(trim_whitespace(item.attribute("media-type").value()));

        if (cover_image_id.empty() && has_property(item.attribute("properties").value(), "cover-image")) {
            cover_image_id = resource.id;
        }
        resources_.push_back(resource);
    }

    // EPUB 3 cover-image property wins over the legacy meta element
    if (!cover_image_id.empty()) cover_id_ = cover_image_id;
}

const EpubResource *EpubReader::find_resource(const std::string &id) const {
    for (const auto &resource : resources_) {
        if (resource.id == id) return &resource;
    }
    return nullptr;
}

std::vector<CandidateImage> EpubReader::enumerate() const {
    std::vector<CandidateImage> images;

    for (const auto &resource : resources_) {
        if (!is_safe_archive_path(resource.path)) continue;
        if (resource.mime_type.rfind("image/", 0) != 0) continue;

        std::string extension = extension_from_name(resource.path);
        if (extension.empty()) extension = extension_from_mime(resource.mime_type);
        if (extension.empty() || !allowed_extensions_.count(extension)) continue;

        CandidateImage image;
        image.resource_id = resource.id;
        image.extension = extension;
        images.push_back(image);
    }
    return images;
}

bool EpubReader::find_cover(CandidateImage &cover) const {
    if (cover_id_.empty()) return false;

    const EpubResource *resource = find_resource(cover_id_);
    if (!resource || !is_safe_archive_path(resource->path)) return false;
    if (resource->mime_type.rfind("image/", 0) != 0) return false;

    std::string extension = extension_from_mime(resource->mime_type);
    if (extension.empty()) extension = extension_from_name(resource->path);
    if (extension.empty()) extension = "jpg";

    cover.resource_id = resource->id;
    cover.extension = extension;
    return true;
}

void EpubReader::copy_to(const CandidateImage &image, std::ostream &out) const {
    const EpubResource *resource = find_resource(image.resource_id);
    zip_int64_t entry_idx = resource ? archive_.locate(resource->path) : -1;
    if (entry_idx < 0) {
        throw ExtractError(ErrorKind::Archive,
                           "Failed to get resource '" + image.resource_id + "'");
    }
    archive_.copy_entry(static_cast<zip_uint64_t>(entry_idx), out);
}

} // namespace docimg
