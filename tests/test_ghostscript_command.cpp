#include "core/ghostscript_command.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace pdfshrink {
namespace {

bool contains(const std::vector<std::string>& argv, const std::string& arg) {
    return std::find(argv.begin(), argv.end(), arg) != argv.end();
}

TEST(BuildCommand, EngineFirstThenOutputAndInputLast) {
    auto argv = build_command(ShrinkSettings{}, "scan.pdf", "scan.shrunk.pdf");

    ASSERT_GE(argv.size(), 3u);
    EXPECT_EQ(argv.front(), "gs");
    EXPECT_EQ(argv[argv.size() - 2], "-sOutputFile=scan.shrunk.pdf");
    EXPECT_EQ(argv.back(), "scan.pdf");
}

TEST(BuildCommand, FixedParameterTemplate) {
    auto argv = build_command(ShrinkSettings{}, "in.pdf", "out.pdf");

    for (const char* expected : {
             "-q", "-dBATCH", "-dSAFER", "-dNOPAUSE",
             "-sDEVICE=pdfwrite",
             "-dCompatibilityLevel=1.4",
             "-dPDFSETTINGS=/ebook",
             "-dAutoRotatePages=/None",
         }) {
        EXPECT_TRUE(contains(argv, expected)) << expected;
    }

    for (const char* image_class : {"Color", "Gray", "Mono"}) {
        const std::string c(image_class);
        EXPECT_TRUE(contains(argv, "-dDownsample" + c + "Images=true")) << c;
        EXPECT_TRUE(contains(argv, "-d" + c + "ImageDownsampleType=/Bicubic")) << c;
        EXPECT_TRUE(contains(argv, "-d" + c + "ImageResolution=135")) << c;
        EXPECT_TRUE(contains(argv, "-d" + c + "ImageDownsampleThreshold=1.5")) << c;
    }
}

TEST(BuildCommand, SettingsAreHonoured) {
    ShrinkSettings settings;
    settings.engine = "/opt/gs/bin/gs";
    settings.color.resolution = 200;
    settings.mono.type = "/Subsample";

    auto argv = build_command(settings, "in.pdf", "out.pdf");
    EXPECT_EQ(argv.front(), "/opt/gs/bin/gs");
    EXPECT_TRUE(contains(argv, "-dColorImageResolution=200"));
    EXPECT_TRUE(contains(argv, "-dGrayImageResolution=135"));
    EXPECT_TRUE(contains(argv, "-dMonoImageDownsampleType=/Subsample"));
}

TEST(BuildCommand, PathsArePassedVerbatim) {
    auto argv = build_command(ShrinkSettings{}, "my dir/it's $HOME.pdf", "out dir/x.pdf");
    EXPECT_EQ(argv.back(), "my dir/it's $HOME.pdf");
    EXPECT_EQ(argv[argv.size() - 2], "-sOutputFile=out dir/x.pdf");
}

TEST(BuildCommand, InputStartingWithDashIsNotAnOption) {
    auto argv = build_command(ShrinkSettings{}, "-dFOO.pdf", "out.pdf");
    EXPECT_EQ(argv.back(), "./-dFOO.pdf");
}

TEST(BuildCommand, PercentInOutputIsLiteral) {
    auto argv = build_command(ShrinkSettings{}, "scan%d.pdf", "scan%d.shrunk.pdf");
    EXPECT_EQ(argv[argv.size() - 2], "-sOutputFile=scan%%d.shrunk.pdf");
    EXPECT_EQ(argv.back(), "scan%d.pdf");
}

TEST(OutputFileValue, TemplateCharactersAreEscaped) {
    EXPECT_EQ(output_file_value("out.pdf"), "out.pdf");
    EXPECT_EQ(output_file_value("/tmp/100%.pdf"), "/tmp/100%%.pdf");
    EXPECT_EQ(output_file_value(".a%d%%.pdf.XXXXXX.tmp"), ".a%%d%%%%.pdf.XXXXXX.tmp");
}

TEST(OutputFileValue, PipeAndDevicePrefixesBecomeFiles) {
    EXPECT_EQ(output_file_value("|lpr.pdf"), "./|lpr.pdf");
    EXPECT_EQ(output_file_value("%stdout"), "./%%stdout");
    EXPECT_EQ(output_file_value("/tmp/|x.pdf"), "/tmp/|x.pdf");
}

TEST(ShellQuote, SafeArgumentsAreUnchanged) {
    EXPECT_EQ(shell_quote("-dPDFSETTINGS=/ebook"), "-dPDFSETTINGS=/ebook");
    EXPECT_EQ(shell_quote("dir/scan_01.shrunk.pdf"), "dir/scan_01.shrunk.pdf");
    EXPECT_EQ(shell_quote("a@b%c+d:e,f"), "a@b%c+d:e,f");
}

TEST(ShellQuote, UnsafeArgumentsAreSingleQuoted) {
    EXPECT_EQ(shell_quote(""), "''");
    EXPECT_EQ(shell_quote("spaced name.pdf"), "'spaced name.pdf'");
    EXPECT_EQ(shell_quote("$HOME"), "'$HOME'");
    EXPECT_EQ(shell_quote("a;rm -rf b"), "'a;rm -rf b'");
    EXPECT_EQ(shell_quote("strange'name"), "'strange'\\''name'");
}

TEST(FormatCommandLine, JoinsQuotedArguments) {
    EXPECT_EQ(format_command_line({"gs", "-q", "-sOutputFile=out dir/a.pdf", "a.pdf"}),
              "gs -q '-sOutputFile=out dir/a.pdf' a.pdf");
    EXPECT_EQ(format_command_line({}), "");
}

TEST(FormatCommandLine, SameInputsGiveSameLine) {
    auto first = format_command_line(build_command(ShrinkSettings{}, "a b.pdf", "a b.shrunk.pdf"));
    auto second = format_command_line(build_command(ShrinkSettings{}, "a b.pdf", "a b.shrunk.pdf"));
    EXPECT_EQ(first, second);
    EXPECT_NE(first.find("'a b.pdf'"), std::string::npos);
}

}  // namespace
}  // namespace pdfshrink
