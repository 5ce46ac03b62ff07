#pragma once

#include <string>
#include <vector>
#include "knowledge_types.hpp"

// Groups entities into architectural layers by file path.
class ClusterAssigner {
public:
    // Layer label for a module path; first matching rule wins
    static std::string layerFor(const std::string& modulePath);

    // Every entity lands in exactly one cluster. Clusters are sorted by name,
    // member ids are sorted and unique.
    static std::vector<Cluster> assignClusters(const std::vector<Entity>& entities);
};
