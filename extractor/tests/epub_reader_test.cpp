#include "epub_reader.h"
#include "extract_error.h"
#include "test_archive.h"

#include <gtest/gtest.h>

#include <sstream>

namespace docimg {
namespace {

using test::TempDir;
namespace fs = std::filesystem;

TEST(EpubReader, ReadsMetadata) {
    TempDir dir;
    fs::path epub = dir / "book.epub";
    test::write_epub(epub, "OEBPS/content.opf",
                     test::make_opf("    <dc:title>  The Shining </dc:title>\n"
                                    "    <dc:creator>Stephen King</dc:creator>\n"
                                    "    <dc:creator>Someone Else</dc:creator>\n",
                                    ""),
                     {});

    EpubReader reader(epub, supported_image_extensions());
    EXPECT_EQ(reader.metadata().title, "The Shining");
    EXPECT_EQ(reader.metadata().author, "Stephen King");
}

TEST(EpubReader, ResolvesManifestPathsAgainstPackageDirectory) {
    TempDir dir;
    fs::path epub = dir / "book.epub";
    test::write_epub(epub, "OEBPS/content.opf",
                     test::make_opf("",
                                    "    <item id=\"a\" href=\"images/my%20pic.png\" media-type=\"image/png\"/>\n"
                                    "    <item id=\"b\" href=\"./images/b.gif\" media-type=\"image/gif\"/>\n"),
                     {{"OEBPS/images/my pic.png", "a"}, {"OEBPS/images/b.gif", "b"}});

    EpubReader reader(epub, supported_image_extensions());
    ASSERT_EQ(reader.resources().size(), 2u);
    EXPECT_EQ(reader.resources()[0].path, "OEBPS/images/my pic.png");
    EXPECT_EQ(reader.resources()[1].path, "OEBPS/images/b.gif");

    std::vector<CandidateImage> images = reader.enumerate();
    ASSERT_EQ(images.size(), 2u);
    std::ostringstream out;
    reader.copy_to(images[0], out);
    EXPECT_EQ(out.str(), "a");
}

TEST(EpubReader, EnumeratesImagesInManifestOrder) {
    TempDir dir;
    fs::path epub = dir / "book.epub";
    test::write_epub(epub, "content.opf",
                     test::make_opf("",
                                    "    <item id=\"ch1\" href=\"ch1.xhtml\" media-type=\"application/xhtml+xml\"/>\n"
                                    "    <item id=\"z\" href=\"z.JPG\" media-type=\"image/jpeg\"/>\n"
                                    "    <item id=\"noext\" href=\"pictures/plate\" media-type=\"image/png\"/>\n"
                                    "    <item id=\"odd\" href=\"odd\" media-type=\"image/x-unknown\"/>\n"
                                    "    <item id=\"evil\" href=\"../evil.png\" media-type=\"image/png\"/>\n"
                                    "    <item id=\"fake\" href=\"fake.png\" media-type=\"text/plain\"/>\n"),
                     {{"ch1.xhtml", "<html/>"}, {"z.JPG", "z"}, {"pictures/plate", "p"}});

    EpubReader reader(epub, supported_image_extensions());
    std::vector<CandidateImage> images = reader.enumerate();

    ASSERT_EQ(images.size(), 2u);
    EXPECT_EQ(images[0].resource_id, "z");
    EXPECT_EQ(images[0].extension, "jpg");
    EXPECT_EQ(images[1].resource_id, "noext");
    EXPECT_EQ(images[1].extension, "png");
}

TEST(EpubReader, FiltersByAllowedExtensions) {
    TempDir dir;
    fs::path epub = dir / "book.epub";
    test::write_epub(epub, "content.opf",
                     test::make_opf("",
                                    "    <item id=\"a\" href=\"a.png\" media-type=\"image/png\"/>\n"
                                    "    <item id=\"b\" href=\"b.svg\" media-type=\"image/svg+xml\"/>\n"),
                     {{"a.png", "a"}, {"b.svg", "<svg/>"}});

    EpubReader reader(epub, ExtensionSet{"svg"});
    std::vector<CandidateImage> images = reader.enumerate();
    ASSERT_EQ(images.size(), 1u);
    EXPECT_EQ(images[0].resource_id, "b");
}

TEST(EpubReader, FindsCoverFromPropertiesOrMeta) {
    TempDir dir;
    fs::path epub3 = dir / "epub3.epub";
    test::write_epub(epub3, "content.opf",
                     test::make_opf("    <meta name=\"cover\" content=\"old\"/>\n",
                                    "    <item id=\"old\" href=\"old.gif\" media-type=\"image/gif\"/>\n"
                                    "    <item id=\"new\" href=\"new.png\" media-type=\"image/png\" properties=\"svg cover-image\"/>\n"),
                     {{"old.gif", "g"}, {"new.png", "n"}});

    CandidateImage cover;
    ASSERT_TRUE(EpubReader(epub3, supported_image_extensions()).find_cover(cover));
    EXPECT_EQ(cover.resource_id, "new");
    EXPECT_EQ(cover.extension, "png");

    fs::path epub2 = dir / "epub2.epub";
    test::write_epub(epub2, "content.opf",
                     test::make_opf("    <meta name=\"cover\" content=\"cov\"/>\n",
                                    "    <item id=\"cov\" href=\"cover.jpeg\" media-type=\"image/jpeg\"/>\n"),
                     {{"cover.jpeg", "c"}});

    ASSERT_TRUE(EpubReader(epub2, supported_image_extensions()).find_cover(cover));
    EXPECT_EQ(cover.resource_id, "cov");
    EXPECT_EQ(cover.extension, "jpg");
}

TEST(EpubReader, NoCoverWhenUndeclaredOrNotAnImage) {
    TempDir dir;
    fs::path epub = dir / "book.epub";
    test::write_epub(epub, "content.opf",
                     test::make_opf("    <meta name=\"cover\" content=\"page\"/>\n",
                                    "    <item id=\"page\" href=\"cover.xhtml\" media-type=\"application/xhtml+xml\"/>\n"),
                     {{"cover.xhtml", "<html/>"}});

    CandidateImage cover;
    EXPECT_FALSE(EpubReader(epub, supported_image_extensions()).find_cover(cover));

    fs::path plain = dir / "plain.epub";
    test::write_epub(plain, "content.opf", test::make_opf("", ""), {});
    EXPECT_FALSE(EpubReader(plain, supported_image_extensions()).find_cover(cover));
}

TEST(EpubReader, MissingResourceIsAnArchiveError) {
    TempDir dir;
    fs::path epub = dir / "book.epub";
    test::write_epub(epub, "content.opf",
                     test::make_opf("", "    <item id=\"gone\" href=\"gone.png\" media-type=\"image/png\"/>\n"),
                     {});

    EpubReader reader(epub, supported_image_extensions());
    std::vector<CandidateImage> images = reader.enumerate();
    ASSERT_EQ(images.size(), 1u);

    std::ostringstream out;
    try {
        reader.copy_to(images[0], out);
        FAIL() << "expected an archive error";
    } catch (const ExtractError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::Archive);
        EXPECT_NE(std::string(e.what()).find("gone"), std::string::npos);
    }
}

TEST(EpubReader, RejectsZipWithoutContainer) {
    TempDir dir;
    fs::path epub = dir / "bare.epub";
    test::write_zip(epub, {{"mimetype", "application/epub+zip"}});

    try {
        EpubReader reader(epub, supported_image_extensions());
        FAIL() << "expected an archive error";
    } catch (const ExtractError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::Archive);
    }
}

TEST(MetadataFilter, MatchesCaseInsensitiveSubstrings) {
    EpubMetadata metadata;
    metadata.title = "The Shining";
    metadata.author = "Stephen King";

    MetadataFilter filter;
    EXPECT_TRUE(filter.empty());
    EXPECT_TRUE(filter.matches(metadata));

    filter.title = "shin";
    EXPECT_TRUE(filter.matches(metadata));
    filter.author = "KING";
    EXPECT_TRUE(filter.matches(metadata));
    filter.author = "Rowling";
    EXPECT_FALSE(filter.matches(metadata));

    MetadataFilter author_only;
    author_only.author = "king";
    EpubMetadata untitled;
    EXPECT_FALSE(author_only.matches(untitled));
}

TEST(EpubHref, DecodesAndResolves) {
    EXPECT_EQ(percent_decode("a%20b%2Fc"), "a b/c");
    EXPECT_EQ(percent_decode("100%"), "100%");
    EXPECT_EQ(percent_decode("%zz"), "%zz");
    EXPECT_EQ(resolve_href("OEBPS/content.opf", "img/a.png"), "OEBPS/img/a.png");
    EXPECT_EQ(resolve_href("content.opf", "./a.png"), "a.png");
    EXPECT_EQ(resolve_href("OEBPS/content.opf", "../a.png"), "OEBPS/../a.png");
}

} // namespace
} // namespace docimg
