#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "archlens.hpp"
#include "test_utils.hpp"
#include <algorithm>
#include <stdexcept>

using json = nlohmann::json;
using Catch::Approx;

namespace {

void writeShopProject(const TempProject& project) {
    project.write("Cargo.toml",
        "[package]\n"
        "name = \"shop\"\n"
        "version = \"0.1.0\"\n"
        "\n"
        "[dependencies]\n"
        "tokio = { version = \"1\" }\n");
    project.write("src/main.rs",
        "mod model;\n"
        "mod service;\n"
        "\n"
        "#[tokio::main]\n"
        "async fn main() {\n"
        "    service::run().await;\n"
        "}\n");
    project.write("src/model.rs",
        "/// A customer order.\n"
        "#[derive(Debug, Clone)]\n"
        "pub struct Order {\n"
        "    pub id: u64,\n"
        "}\n");
    project.write("src/service.rs",
        "use crate::model::Order;\n"
        "use std::sync::{Arc, Mutex};\n"
        "\n"
        "pub struct OrderService {\n"
        "    orders: Arc<Mutex<Vec<Order>>>,\n"
        "}\n"
        "\n"
        "pub async fn run() {}\n");
    project.write("tests/smoke.rs", "struct Smoke;\n");
}

json readJson(const fs::path& path) {
    std::ifstream file(path);
    return json::parse(file);
}

const Detection* findDetection(const std::vector<Detection>& detections, const std::string& name) {
    auto it = std::find_if(detections.begin(), detections.end(),
        [&](const Detection& d) { return d.name == name; });
    return it == detections.end() ? nullptr : &*it;
}

} // namespace

TEST_CASE("ArchLens analyzes a project end to end", "[ArchLens]") {
    TempProject project("archlens_shop");
    writeShopProject(project);

    ArchLensOptions options;
    options.inputDir = project.root();
    options.writeOutput = false;

    ArchLens lens(options);
    const AnalysisResult& result = lens.analyze();

    SECTION("Manifest and metrics") {
        REQUIRE(result.project == project.root().filename().string());
        REQUIRE(result.manifest.packageCount == 1);
        REQUIRE_FALSE(result.manifest.isWorkspace);
        REQUIRE(result.metrics.files == 3);
        REQUIRE(result.skippedFiles == 0);
    }

    SECTION("Entities and docs") {
        const auto& nodes = result.graph.nodes;
        auto order = std::find_if(nodes.begin(), nodes.end(), [](const Entity& e) { return e.name == "Order"; });
        REQUIRE(order != nodes.end());
        REQUIRE(order->module == "src/model.rs");
        REQUIRE(order->doc == std::optional<std::string>("A customer order."));

        // Only src/ is scanned
        REQUIRE(std::none_of(nodes.begin(), nodes.end(), [](const Entity& e) { return e.name == "Smoke"; }));
    }

    SECTION("Semantic index") {
        REQUIRE(result.semanticIndex.stats.totalPublicApis == 3);
        REQUIRE(result.semanticIndex.entryPoints.size() == 2);
        REQUIRE(result.semanticIndex.entryPoints[0].type == "main");
        REQUIRE(result.semanticIndex.entryPoints[1].type == "main_function");
    }

    SECTION("Detections") {
        const Detection* async = findDetection(result.designPatterns, "Async/Await Runtime");
        REQUIRE(async != nullptr);
        REQUIRE(async->confidence == Approx(0.5));

        const Detection* reactor = findDetection(result.architectureStyles, "Reactor/Proactor");
        REQUIRE(reactor != nullptr);
        REQUIRE(reactor->confidence == Approx(2.0 / 6.0));
        REQUIRE(findDetection(result.architectureStyles, "Modular Monolith") == nullptr);

        REQUIRE(result.communicationPatterns.size() == 1);
        REQUIRE(result.communicationPatterns[0].name == "Shared State (Mutex)");
        REQUIRE(result.communicationPatterns[0].usageCount == 2);
    }
}

TEST_CASE("ArchLens reports root entry files outside src", "[ArchLens]") {
    TempProject project("archlens_entries");
    project.write("src/lib.rs", "pub fn run() {}\n");
    project.write("main.rs", "fn main() {}\n");

    ArchLensOptions options;
    options.inputDir = project.root();
    options.writeOutput = false;

    ArchLens lens(options);
    const AnalysisResult& result = lens.analyze();

    // Only src/ is scanned, so there is no main function entity
    REQUIRE(result.metrics.files == 1);
    REQUIRE(result.semanticIndex.entryPoints.size() == 2);
    REQUIRE(result.semanticIndex.entryPoints[0].file == "src/lib.rs");
    REQUIRE(result.semanticIndex.entryPoints[0].type == "lib");
    REQUIRE(result.semanticIndex.entryPoints[1].file == "main.rs");
    REQUIRE(result.semanticIndex.entryPoints[1].type == "main");
}

TEST_CASE("ArchLens writes the output documents", "[ArchLens]") {
    TempProject project("archlens_output");
    writeShopProject(project);

    ArchLensOptions options;
    options.inputDir = project.root();
    options.outputDir = project.root() / "out";

    ArchLens lens(options);
    REQUIRE(lens.run());

    for (const char* name : {ArchLens::KNOWLEDGE_GRAPH_FILE, ArchLens::PATTERNS_FILE, ArchLens::ARCHITECTURE_FILE,
                             ArchLens::SEMANTIC_INDEX_FILE, ArchLens::API_SURFACE_FILE, ArchLens::METRICS_FILE}) {
        REQUIRE(fs::exists(options.outputDir / name));
    }

    const json graph = readJson(options.outputDir / ArchLens::KNOWLEDGE_GRAPH_FILE);
    REQUIRE(graph["stats"]["total_nodes"] == lens.result().graph.nodes.size());
    REQUIRE(graph["stats"]["total_edges"] == lens.result().graph.edges.size());

    const json patterns = readJson(options.outputDir / ArchLens::PATTERNS_FILE);
    REQUIRE(patterns["catalog_version"] == "1");
    REQUIRE(patterns["patterns"][0]["name"] == lens.result().designPatterns[0].name);

    const json architecture = readJson(options.outputDir / ArchLens::ARCHITECTURE_FILE);
    REQUIRE(architecture["workspace"]["package_count"] == 1);
    REQUIRE(architecture["communication_patterns"][0]["usage_count"] == 2);

    const json index = readJson(options.outputDir / ArchLens::SEMANTIC_INDEX_FILE);
    REQUIRE(index["project"] == lens.result().project);

    const json metrics = readJson(options.outputDir / ArchLens::METRICS_FILE);
    REQUIRE(metrics["rust_files"] == 3);

    const std::string summary = lens.getSummary();
    REQUIRE(summary.find("Files analyzed: 3") != std::string::npos);
    REQUIRE(summary.find("Async/Await Runtime") != std::string::npos);
    REQUIRE(lens.getTimingInfo().find("Total time") != std::string::npos);
}

TEST_CASE("ArchLens on a project with an empty src directory", "[ArchLens]") {
    TempProject project("archlens_empty");
    project.mkdir("src");

    ArchLensOptions options;
    options.inputDir = project.root();
    options.writeOutput = false;

    ArchLens lens(options);
    const AnalysisResult& result = lens.analyze();

    REQUIRE(result.graph.nodes.empty());
    REQUIRE(result.graph.edges.empty());
    REQUIRE(result.graph.clusters.empty());
    REQUIRE(result.architectureStyles.empty());
    REQUIRE(result.designPatterns.empty());
    REQUIRE(result.communicationPatterns.empty());
    REQUIRE(result.semanticIndex.stats.totalFiles == 0);
    REQUIRE(result.semanticIndex.stats.totalConcepts == 0);
    REQUIRE(result.semanticIndex.stats.totalPublicApis == 0);
    REQUIRE(result.semanticIndex.stats.totalHotSpots == 0);
    REQUIRE(result.semanticIndex.stats.totalEntryPoints == 0);
    REQUIRE(result.apiSurface.stats.totalPubItems == 0);
    REQUIRE(result.metrics.files == 0);
}

TEST_CASE("ArchLens results are deterministic", "[ArchLens]") {
    TempProject project("archlens_determinism");
    writeShopProject(project);

    ArchLensOptions options;
    options.inputDir = project.root();
    options.writeOutput = false;

    ArchLens first(options);
    first.analyze();
    ArchLens second(options);
    second.analyze();

    REQUIRE(json(first.result().graph).dump() == json(second.result().graph).dump());
    REQUIRE(first.patternsJson().dump() == second.patternsJson().dump());
    REQUIRE(first.architectureJson().dump() == second.architectureJson().dump());
}

TEST_CASE("ArchLens honors options", "[ArchLens]") {
    TempProject project("archlens_options");
    writeShopProject(project);

    ArchLensOptions options;
    options.inputDir = project.root();
    options.writeOutput = false;

    SECTION("Exclude patterns") {
        options.excludePatterns = "src/service.rs";
        ArchLens lens(options);

        const auto& nodes = lens.analyze().graph.nodes;

        REQUIRE(std::none_of(nodes.begin(), nodes.end(), [](const Entity& e) { return e.name == "OrderService"; }));
        REQUIRE(lens.result().metrics.files == 2);
    }

    SECTION("Custom signature catalog") {
        options.signaturesFile = project.write("signatures.json",
            R"({"version": "custom", "design_patterns": [{"name": "Order Pattern", "keywords": ["Order"]}]})");
        ArchLens lens(options);

        const auto& patterns = lens.analyze().designPatterns;

        REQUIRE(patterns.size() == 1);
        REQUIRE(patterns[0].name == "Order Pattern");
        REQUIRE(patterns[0].confidence == Approx(1.0));
        REQUIRE(lens.patternsJson()["catalog_version"] == "custom");
    }

    SECTION("Cargo metadata file") {
        options.metadataFile = project.write("metadata.json",
            R"({"packages": [{"name": "a"}, {"name": "b"}, {"name": "c"}, {"name": "d"}, {"name": "e"}]})");
        ArchLens lens(options);

        const auto& styles = lens.analyze().architectureStyles;

        REQUIRE_FALSE(styles.empty());
        REQUIRE(styles[0].name == "Multi-Crate Workspace");
        REQUIRE(styles[0].evidence == std::vector<std::string>{"Workspace with 5 packages"});
    }
}

TEST_CASE("ArchLens reports errors", "[ArchLens]") {
    TempProject project("archlens_errors");

    SECTION("Empty input path throws") {
        ArchLensOptions options;
        options.writeOutput = false;
        ArchLens lens(options);
        REQUIRE_THROWS_AS(lens.analyze(), std::invalid_argument);
    }

    SECTION("Missing directory fails the run") {
        ArchLensOptions options;
        options.inputDir = project.root() / "missing";
        options.writeOutput = false;
        ArchLens lens(options);
        REQUIRE_THROWS_AS(lens.analyze(), std::runtime_error);
        REQUIRE_FALSE(lens.run());
    }

    SECTION("Bad signature catalog fails the run") {
        project.mkdir("src");
        ArchLensOptions options;
        options.inputDir = project.root();
        options.signaturesFile = project.write("bad.json", "[1, 2");
        options.writeOutput = false;
        ArchLens lens(options);
        REQUIRE_THROWS_AS(lens.analyze(), std::runtime_error);
        REQUIRE_FALSE(lens.run());
    }
}
