#include <catch2/catch_test_macros.hpp>
#include "code_metrics.hpp"

TEST_CASE("CodeMetrics classifies lines", "[CodeMetrics]") {
    CodeMetrics metrics;
    metrics.addFile("fn main() {\n    // comment\n\n    /* block */\n    let x = 1;\n}\n");

    // The trailing newline starts one more, empty line
    REQUIRE(metrics.files == 1);
    REQUIRE(metrics.lines == 7);
    REQUIRE(metrics.code == 3);
    REQUIRE(metrics.comments == 2);
    REQUIRE(metrics.blanks == 2);
}

TEST_CASE("CodeMetrics sums over files", "[CodeMetrics]") {
    std::vector<SourceScanner::ScannedFile> files(2);
    files[0].content = "struct A;";
    files[1].content = "/// doc\nstruct B;";

    const CodeMetrics metrics = CodeMetrics::collect(files);

    REQUIRE(metrics.files == 2);
    REQUIRE(metrics.lines == 3);
    REQUIRE(metrics.code == 2);
    REQUIRE(metrics.comments == 1);
    REQUIRE(metrics.blanks == 0);

    const nlohmann::json j = metrics;
    REQUIRE(j["rust_files"] == 2);
    REQUIRE(j["lines"] == metrics.lines);
}

TEST_CASE("CodeMetrics on no files", "[CodeMetrics]") {
    const CodeMetrics metrics = CodeMetrics::collect({});

    REQUIRE(metrics.files == 0);
    REQUIRE(metrics.lines == 0);
}
