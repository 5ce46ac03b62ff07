#pragma once

#include <string>
#include <vector>
#include <memory>
#include <unordered_set>
#include <nlohmann/json.hpp>
#include "knowledge_types.hpp"
#include "entity_extractor.hpp"
#include "relationship_extractor.hpp"
#include "source_scanner.hpp"

struct KnowledgeGraph {
    std::string project;
    std::vector<Entity> entities;       // Every extracted candidate, file order
    std::vector<Entity> nodes;          // First-seen entity per name
    std::vector<Edge> edges;
    std::vector<Cluster> clusters;
};

// Runs entity and relationship extraction over a scanned project.
//
// Two passes: entities are collected from every file first, then
// relationships are extracted per file against the complete name set, so
// the result does not depend on which file declares a name.
class KnowledgeGraphBuilder {
public:
    explicit KnowledgeGraphBuilder(std::unique_ptr<EntityExtractor> extractor = EntityExtractor::create(),
                                   bool verbose = false);

    KnowledgeGraph build(const std::string& project,
                         const std::vector<SourceScanner::ScannedFile>& files) const;

    // Names of all entities
    static std::unordered_set<std::string> knownNames(const std::vector<Entity>& entities);

private:
    std::unique_ptr<EntityExtractor> entityExtractor_;
    RelationshipExtractor relationshipExtractor_;
    bool verbose_;
};

void to_json(nlohmann::json& j, const KnowledgeGraph& graph);
