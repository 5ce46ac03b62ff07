#pragma once

#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>
#include "knowledge_types.hpp"

// Non-private declarations of a project, grouped for navigation
struct ApiSurface {
    std::vector<Entity> items;
    std::map<std::string, std::vector<std::string>> byType;
    std::map<std::string, std::vector<std::string>> byVisibility;
    std::map<std::string, std::vector<std::string>> byModule;

    struct Stats {
        size_t totalPubItems = 0;
        size_t pubStructs = 0;
        size_t pubEnums = 0;
        size_t pubTraits = 0;
        size_t pubFunctions = 0;
        size_t pubModules = 0;
    } stats;
};

class ApiSurfaceAnalyzer {
public:
    // Keeps entities that are not private and not impl blocks
    static ApiSurface analyze(const std::vector<Entity>& entities);

    // Directory of a file path, "root" for top-level files
    static std::string moduleOf(const std::string& filePath);
};

void to_json(nlohmann::json& j, const ApiSurface& surface);
