#include <catch2/catch_test_macros.hpp>
#include "source_scanner.hpp"
#include "pattern_matcher.hpp"
#include "test_utils.hpp"
#include <stdexcept>

namespace {

std::vector<std::string> relativePaths(const std::vector<SourceScanner::ScannedFile>& files) {
    std::vector<std::string> paths;
    for (const auto& file : files) {
        paths.push_back(file.relativePath);
    }
    return paths;
}

} // namespace

TEST_CASE("SourceScanner scans the src directory", "[SourceScanner]") {
    TempProject project("scanner");
    project.write("Cargo.toml", "[package]\nname = \"demo\"\n");
    project.write("build.rs", "fn main() {}\n");
    project.write("src/lib.rs", "pub mod model;\n");
    project.write("src/model/user.rs", "pub struct User;\n");
    project.write("src/tests/helper.rs", "fn helper() {}\n");
    project.write("src/foo_test.rs", "fn t() {}\n");
    project.write("src/README.md", "# docs\n");
    project.write("src/target/gen.rs", "struct Gen;\n");

    PatternMatcher matcher;

    SECTION("Test code is excluded by default") {
        SourceScanner scanner(matcher);

        auto files = scanner.scanProject(project.root());

        REQUIRE(relativePaths(files) == std::vector<std::string>{"src/lib.rs", "src/model/user.rs"});
        REQUIRE(files[1].content == "pub struct User;\n");
        REQUIRE(files[1].lineCount == 1);
        REQUIRE(files[1].byteSize == files[1].content.size());
        REQUIRE(files[1].processed);
        REQUIRE(scanner.failedFileCount() == 0);
    }

    SECTION("Test code can be included") {
        matcher.setIncludeTests(true);
        SourceScanner scanner(matcher);

        auto files = scanner.scanProject(project.root());

        REQUIRE(relativePaths(files) == std::vector<std::string>{
            "src/foo_test.rs", "src/lib.rs", "src/model/user.rs", "src/tests/helper.rs"});
    }

    SECTION("Exclude patterns apply to paths relative to the project root") {
        matcher.setExcludePatterns("src/model/**");
        SourceScanner scanner(matcher);

        auto files = scanner.scanProject(project.root());

        REQUIRE(relativePaths(files) == std::vector<std::string>{"src/lib.rs"});
    }
}

TEST_CASE("SourceScanner falls back to the project root", "[SourceScanner]") {
    TempProject project("scanner_root");
    project.write("main.rs", "fn main() {}\n");
    project.write("target/debug/out.rs", "struct Out;\n");

    PatternMatcher matcher;
    SourceScanner scanner(matcher);

    auto files = scanner.scanProject(project.root());

    REQUIRE(relativePaths(files) == std::vector<std::string>{"main.rs"});
    REQUIRE(SourceScanner::resolveSourceRoot(project.root()) == project.root());
}

TEST_CASE("SourceScanner handles empty and invalid inputs", "[SourceScanner]") {
    PatternMatcher matcher;
    SourceScanner scanner(matcher);

    SECTION("Empty src directory gives no files") {
        TempProject project("scanner_empty");
        project.mkdir("src");

        REQUIRE(scanner.scanProject(project.root()).empty());
    }

    SECTION("Empty path") {
        REQUIRE_THROWS_AS(scanner.scanProject(fs::path()), std::invalid_argument);
    }

    SECTION("Missing directory") {
        TempProject project("scanner_missing");
        REQUIRE_THROWS_AS(scanner.scanProject(project.root() / "nope"), std::runtime_error);
    }

    SECTION("Path to a file") {
        TempProject project("scanner_file");
        const auto file = project.write("lib.rs", "struct A;\n");
        REQUIRE_THROWS_AS(scanner.scanProject(file), std::runtime_error);
    }
}

TEST_CASE("SourceScanner replaces invalid UTF-8", "[SourceScanner]") {
    TempProject project("scanner_utf8");
    project.write("src/lib.rs", std::string("fn a() {}\xff\xfe\n"));

    PatternMatcher matcher;
    SourceScanner scanner(matcher);

    auto files = scanner.scanProject(project.root());

    REQUIRE(files.size() == 1);
    REQUIRE(files[0].hadInvalidUtf8);
    REQUIRE(files[0].content == "fn a() {}\xEF\xBF\xBD\xEF\xBF\xBD\n");
    REQUIRE(files[0].byteSize == 12);
}

TEST_CASE("SourceScanner::decodeUtf8Lossy", "[SourceScanner]") {
    bool replaced = true;

    SECTION("Valid text is unchanged") {
        REQUIRE(SourceScanner::decodeUtf8Lossy("h\xC3\xA9llo \xE2\x82\xAC \xF0\x9F\xA6\x80", &replaced) ==
                "h\xC3\xA9llo \xE2\x82\xAC \xF0\x9F\xA6\x80");
        REQUIRE_FALSE(replaced);
    }

    SECTION("Overlong encodings are replaced byte by byte") {
        REQUIRE(SourceScanner::decodeUtf8Lossy("\xC0\xAF", &replaced) == "\xEF\xBF\xBD\xEF\xBF\xBD");
        REQUIRE(replaced);
    }

    SECTION("Truncated sequences are replaced") {
        REQUIRE(SourceScanner::decodeUtf8Lossy("ok\xE2\x82", &replaced) == "ok\xEF\xBF\xBD\xEF\xBF\xBD");
        REQUIRE(replaced);
    }

    SECTION("Surrogates are replaced") {
        REQUIRE(SourceScanner::decodeUtf8Lossy("\xED\xA0\x80", &replaced) ==
                "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
    }
}

TEST_CASE("SourceScanner counts lines correctly", "[SourceScanner]") {
    REQUIRE(SourceScanner::countLines("") == 0);
    REQUIRE(SourceScanner::countLines("Line 1\n") == 1);
    REQUIRE(SourceScanner::countLines("Line 1") == 1);
    REQUIRE(SourceScanner::countLines("Line 1\nLine 2\n\nLine 4") == 4);
}

TEST_CASE("SourceScanner::scanFile reports failures", "[SourceScanner]") {
    TempProject project("scanner_scanfile");
    PatternMatcher matcher;
    SourceScanner scanner(matcher);

    auto result = scanner.scanFile(project.root() / "missing.rs", project.root());

    REQUIRE_FALSE(result.processed);
    REQUIRE_FALSE(result.error.empty());
    REQUIRE(result.relativePath == "missing.rs");
}
