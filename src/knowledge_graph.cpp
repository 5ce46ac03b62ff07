#include "knowledge_graph.hpp"
#include "cluster_assigner.hpp"
#include <iostream>
#include <iterator>
#include <regex>

using json = nlohmann::json;

KnowledgeGraphBuilder::KnowledgeGraphBuilder(std::unique_ptr<EntityExtractor> extractor, bool verbose)
    : entityExtractor_(std::move(extractor)),
      verbose_(verbose) {
    if (!entityExtractor_) {
        entityExtractor_ = EntityExtractor::create();
    }
}

std::unordered_set<std::string> KnowledgeGraphBuilder::knownNames(const std::vector<Entity>& entities) {
    std::unordered_set<std::string> names;
    for (const auto& entity : entities) {
        names.insert(entity.name);
    }
    return names;
}

KnowledgeGraph KnowledgeGraphBuilder::build(const std::string& project,
                                            const std::vector<SourceScanner::ScannedFile>& files) const {
    KnowledgeGraph graph;
    graph.project = project;

    std::unordered_set<std::string> seen;

    // Pass 1: entities
    for (const auto& file : files) {
        try {
            auto fileEntities = entityExtractor_->extractEntities(file.content, file.relativePath);
            for (auto& entity : fileEntities) {
                if (seen.insert(entity.name).second) {
                    graph.nodes.push_back(entity);
                }
                graph.entities.push_back(std::move(entity));
            }
        } catch (const std::regex_error& e) {
            std::cerr << "Warning: Skipping entities of " << file.relativePath << ": " << e.what() << std::endl;
        }
    }

    // Pass 2: relationships against every known name
    const std::unordered_set<std::string> names = knownNames(graph.nodes);
    for (const auto& file : files) {
        try {
            auto fileEdges = relationshipExtractor_.extractRelationships(file.content, file.relativePath, names);
            graph.edges.insert(graph.edges.end(),
                               std::make_move_iterator(fileEdges.begin()),
                               std::make_move_iterator(fileEdges.end()));
        } catch (const std::regex_error& e) {
            std::cerr << "Warning: Skipping relationships of " << file.relativePath << ": " << e.what() << std::endl;
        }
    }

    graph.clusters = ClusterAssigner::assignClusters(graph.nodes);

    if (verbose_) {
        std::cout << "Knowledge graph: " << graph.nodes.size() << " nodes, "
                  << graph.edges.size() << " edges, "
                  << graph.clusters.size() << " clusters" << std::endl;
    }

    return graph;
}

void to_json(json& j, const KnowledgeGraph& graph) {
    j = json{
        {"project", graph.project},
        {"nodes", graph.nodes},
        {"edges", graph.edges},
        {"clusters", graph.clusters},
        {"stats", {
            {"total_nodes", graph.nodes.size()},
            {"total_edges", graph.edges.size()},
            {"total_clusters", graph.clusters.size()}
        }}
    };
}
