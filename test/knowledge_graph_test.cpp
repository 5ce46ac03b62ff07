#include <catch2/catch_test_macros.hpp>
#include "knowledge_graph.hpp"
#include "test_utils.hpp"
#include <algorithm>

namespace {

SourceScanner::ScannedFile sourceFile(const std::string& relativePath, const std::string& content) {
    SourceScanner::ScannedFile file;
    file.path = relativePath;
    file.relativePath = relativePath;
    file.content = content;
    file.processed = true;
    return file;
}

std::vector<SourceScanner::ScannedFile> layeredProject() {
    return {
        sourceFile("src/lib.rs",
            "pub mod model;\n"
            "pub mod service;\n"),
        sourceFile("src/model/user.rs",
            "#[derive(Debug, Clone)]\n"
            "pub struct User {\n"
            "    id: UserId,\n"
            "}\n"
            "pub struct UserId(u64);\n"),
        sourceFile("src/service/auth.rs",
            "use crate::model::User;\n"
            "pub struct AuthService {\n"
            "    user: Option<User>,\n"
            "}\n"
            "impl Default for AuthService {\n"
            "    fn default() -> Self { AuthService { user: None } }\n"
            "}\n")
    };
}

size_t countKind(const std::vector<Edge>& edges, RelationshipKind kind) {
    return static_cast<size_t>(std::count_if(edges.begin(), edges.end(),
        [kind](const Edge& e) { return e.relationship == kind; }));
}

} // namespace

TEST_CASE("KnowledgeGraphBuilder builds nodes, edges and clusters", "[KnowledgeGraph]") {
    KnowledgeGraphBuilder builder;

    const KnowledgeGraph graph = builder.build("layered", layeredProject());

    REQUIRE(graph.project == "layered");

    SECTION("Nodes are unique names in first-seen order") {
        std::vector<std::string> names;
        for (const auto& node : graph.nodes) {
            names.push_back(node.name);
        }
        REQUIRE(names == std::vector<std::string>{"model", "service", "User", "UserId", "AuthService", "Default"});
        REQUIRE(graph.entities.size() == 6);
    }

    SECTION("Edges of every kind") {
        REQUIRE(graph.edges.size() == 8);
        REQUIRE(countKind(graph.edges, RelationshipKind::Contains) == 2);
        REQUIRE(countKind(graph.edges, RelationshipKind::Derives) == 2);
        REQUIRE(countKind(graph.edges, RelationshipKind::References) == 2);
        REQUIRE(countKind(graph.edges, RelationshipKind::Implements) == 1);
        REQUIRE(countKind(graph.edges, RelationshipKind::Uses) == 1);

        // Files are processed in the order given
        REQUIRE(graph.edges.front().source == "src/lib.rs");
        REQUIRE(graph.edges.back().source == "src/service/auth.rs");
    }

    SECTION("Clusters follow the directory layout") {
        REQUIRE(graph.clusters.size() == 3);
        REQUIRE(graph.clusters[0].name == "Application Layer");
        REQUIRE(graph.clusters[0].entityIds == std::vector<std::string>{"AuthService", "Default"});
        REQUIRE(graph.clusters[1].name == "Domain Layer");
        REQUIRE(graph.clusters[1].entityIds == std::vector<std::string>{"User", "UserId"});
        REQUIRE(graph.clusters[2].name == "Module: src");
    }

    SECTION("JSON output") {
        const nlohmann::json j = graph;
        REQUIRE(j["project"] == "layered");
        REQUIRE(j["stats"]["total_nodes"] == 6);
        REQUIRE(j["stats"]["total_edges"] == 8);
        REQUIRE(j["stats"]["total_clusters"] == 3);
        REQUIRE(j["nodes"][0]["id"] == "model");
        REQUIRE(j["edges"][0]["relationship"] == "contains");
    }
}

TEST_CASE("KnowledgeGraphBuilder resolves names declared in later files", "[KnowledgeGraph]") {
    KnowledgeGraphBuilder builder;

    const KnowledgeGraph graph = builder.build("order", {
        sourceFile("src/a.rs", "use crate::z::Zed;\n"),
        sourceFile("src/z.rs", "pub struct Zed;\n")
    });

    REQUIRE(graph.edges.size() == 1);
    REQUIRE(graph.edges[0].from == "a");
    REQUIRE(graph.edges[0].to == "Zed");
    REQUIRE(graph.edges[0].relationship == RelationshipKind::Uses);
}

TEST_CASE("KnowledgeGraphBuilder keeps every candidate in entities", "[KnowledgeGraph]") {
    KnowledgeGraphBuilder builder;

    const KnowledgeGraph graph = builder.build("dupes", {
        sourceFile("src/a.rs", "pub struct Config;\n"),
        sourceFile("src/b.rs", "pub struct Config;\nimpl Config {}\n")
    });

    REQUIRE(graph.entities.size() == 3);
    REQUIRE(graph.nodes.size() == 1);
    REQUIRE(graph.nodes[0].module == "src/a.rs");
}

TEST_CASE("KnowledgeGraphBuilder survives generated and unterminated input", "[KnowledgeGraph]") {
    KnowledgeGraphBuilder builder;

    const KnowledgeGraph graph = builder.build("generated", {
        sourceFile("src/blob.rs",
            "pub const BLOB: &str = \"" + std::string(64 * 1024, 'f') + "\";\n"
            "pub struct Holder { item: Item }\n"),
        sourceFile("src/open.rs",
            "#[derive(" + std::string(200000, 'a') + "\n"),
        sourceFile("src/item.rs", "pub struct Item;\n")
    });

    std::vector<std::string> names;
    for (const auto& node : graph.nodes) {
        names.push_back(node.name);
    }
    REQUIRE(names == std::vector<std::string>{"BLOB", "Holder", "Item"});
    REQUIRE(graph.edges.size() == 1);
    REQUIRE(graph.edges[0].to == "Item");
    REQUIRE(graph.edges[0].relationship == RelationshipKind::References);
}

TEST_CASE("KnowledgeGraphBuilder on an empty project", "[KnowledgeGraph]") {
    KnowledgeGraphBuilder builder;

    const KnowledgeGraph graph = builder.build("empty", {});

    REQUIRE(graph.entities.empty());
    REQUIRE(graph.nodes.empty());
    REQUIRE(graph.edges.empty());
    REQUIRE(graph.clusters.empty());
}

TEST_CASE("KnowledgeGraphBuilder is deterministic", "[KnowledgeGraph]") {
    KnowledgeGraphBuilder builder;

    const nlohmann::json first = builder.build("layered", layeredProject());
    const nlohmann::json second = builder.build("layered", layeredProject());

    REQUIRE(first.dump() == second.dump());
}

TEST_CASE("KnowledgeGraphBuilder::knownNames", "[KnowledgeGraph]") {
    Entity a;
    a.name = "A";
    Entity b;
    b.name = "B";

    const auto names = KnowledgeGraphBuilder::knownNames({a, b, a});

    REQUIRE(names.size() == 2);
    REQUIRE(names.count("A") == 1);
}
