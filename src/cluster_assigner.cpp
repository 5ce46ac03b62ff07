#include "cluster_assigner.hpp"
#include <map>
#include <set>

namespace {

struct LayerRule {
    std::vector<std::string> markers;
    std::string layer;
};

const std::vector<LayerRule>& layerRules() {
    static const std::vector<LayerRule> rules = {
        {{"domain", "entity", "model"}, "Domain Layer"},
        {{"service", "application", "handler"}, "Application Layer"},
        {{"repo", "db", "storage"}, "Infrastructure Layer"},
        {{"api", "http", "web"}, "Interface Layer"},
        {{"util", "common", "helper"}, "Utilities"}
    };
    return rules;
}

bool endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::string ClusterAssigner::layerFor(const std::string& modulePath) {
    for (const auto& rule : layerRules()) {
        for (const auto& marker : rule.markers) {
            if (modulePath.find(marker) != std::string::npos) {
                return rule.layer;
            }
        }
    }

    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        const auto slash = modulePath.find('/', start);
        parts.push_back(modulePath.substr(start, slash - start));
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }

    if (parts.size() > 1) {
        // Module paths name files, so the directory holding the file is the module
        const std::string& dir = endsWith(parts.back(), ".rs") ? parts[parts.size() - 2] : parts.back();
        return "Module: " + dir;
    }
    return "Core";
}

std::vector<Cluster> ClusterAssigner::assignClusters(const std::vector<Entity>& entities) {
    std::map<std::string, std::set<std::string>> layers;

    for (const auto& entity : entities) {
        layers[layerFor(entity.module)].insert(entity.name);
    }

    std::vector<Cluster> clusters;
    clusters.reserve(layers.size());
    for (const auto& [name, ids] : layers) {
        clusters.push_back({name, std::vector<std::string>(ids.begin(), ids.end())});
    }

    return clusters;
}
