#include "cli_options.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace docimg {
namespace {

// Owns argv storage for parse_cli
class Args {
public:
    Args(std::initializer_list<const char *> args) : storage_(args.begin(), args.end()) {
        storage_.insert(storage_.begin(), "docimg");
        for (auto &arg : storage_) argv_.push_back(&arg[0]);
    }

    int argc() const { return static_cast<int>(argv_.size()); }
    char **argv() { return argv_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char *> argv_;
};

TEST(CliOptions, ParsesFullCommandLine) {
    Args args({"one.docx", "-i", "two.epub", "dir", "-o", "out", "-r", "-f", "png,JPG", "gif",
               "-c", "--cover-fallback", "--title", "Shining", "--author", "King"});
    CliOptions options;
    std::string error;
    ASSERT_TRUE(parse_cli(args.argc(), args.argv(), options, error)) << error;

    ASSERT_EQ(options.inputs.size(), 3u);
    EXPECT_EQ(options.inputs[0].string(), "one.docx");
    EXPECT_EQ(options.inputs[2].string(), "dir");
    EXPECT_EQ(options.output_dir.string(), "out");
    EXPECT_TRUE(options.recursive);
    EXPECT_EQ(options.formats, (std::vector<std::string>{"png", "JPG", "gif"}));
    EXPECT_TRUE(options.cover_only);
    EXPECT_TRUE(options.cover_fallback);
    EXPECT_EQ(options.title_filter, "Shining");
    EXPECT_EQ(options.author_filter, "King");
}

TEST(CliOptions, DefaultsToCurrentDirectory) {
    Args args({"book.epub"});
    CliOptions options;
    std::string error;
    ASSERT_TRUE(parse_cli(args.argc(), args.argv(), options, error));
    EXPECT_EQ(options.output_dir.string(), ".");
    EXPECT_TRUE(options.formats.empty());
    EXPECT_FALSE(options.cover_only);
}

TEST(CliOptions, EmptyFormatListIsAllowed) {
    Args args({"-f", "--recursive", "docs"});
    CliOptions options;
    std::string error;
    ASSERT_TRUE(parse_cli(args.argc(), args.argv(), options, error));
    EXPECT_TRUE(options.formats.empty());
    EXPECT_TRUE(options.recursive);
}

TEST(CliOptions, RejectsInvalidCommandLines) {
    CliOptions options;
    std::string error;

    Args no_inputs({"-r"});
    EXPECT_FALSE(parse_cli(no_inputs.argc(), no_inputs.argv(), options, error));

    CliOptions fallback_options;
    Args fallback_alone({"book.epub", "--cover-fallback"});
    EXPECT_FALSE(parse_cli(fallback_alone.argc(), fallback_alone.argv(), fallback_options, error));
    EXPECT_NE(error.find("--cover-only"), std::string::npos);

    CliOptions unknown_options;
    Args unknown({"book.epub", "--bogus"});
    EXPECT_FALSE(parse_cli(unknown.argc(), unknown.argv(), unknown_options, error));

    CliOptions output_options;
    Args missing_output({"book.epub", "-o"});
    EXPECT_FALSE(parse_cli(missing_output.argc(), missing_output.argv(), output_options, error));
}

TEST(CliOptions, SplitsFormatLists) {
    EXPECT_EQ(split_format_list("png,jpg"), (std::vector<std::string>{"png", "jpg"}));
    EXPECT_EQ(split_format_list("png,,jpg, "), (std::vector<std::string>{"png", "jpg"}));
    EXPECT_TRUE(split_format_list("").empty());
}

TEST(CliOptions, HelpNeedsNoInputs) {
    Args args({"--help"});
    CliOptions options;
    std::string error;
    ASSERT_TRUE(parse_cli(args.argc(), args.argv(), options, error));
    EXPECT_TRUE(options.show_help);
}

} // namespace
} // namespace docimg
