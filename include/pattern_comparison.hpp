#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "knowledge_types.hpp"
#include "signature.hpp"

namespace fs = std::filesystem;

struct ProjectPatterns {
    std::string project;
    std::vector<Detection> styles;
    std::vector<Detection> designPatterns;
    std::vector<CommunicationPattern> communication;
    size_t crateCount = 1;
};

struct PatternComparison {
    std::vector<ProjectPatterns> projects;      // In the order given
    std::vector<std::string> allStyles;         // Sorted union
    std::vector<std::string> allPatterns;       // Sorted union
    std::vector<std::string> allCommunication;  // Sorted union
};

struct ComparisonOptions {
    fs::path signaturesFile;
    bool includeTests = false;
    bool verbose = false;
};

// Runs style, pattern and communication detection over several projects.
// Throws like ArchLens::analyze when a project cannot be analyzed.
PatternComparison comparePatterns(const std::vector<fs::path>& projectPaths,
                                  const ComparisonOptions& options = ComparisonOptions());

void to_json(nlohmann::json& j, const ProjectPatterns& project);
void to_json(nlohmann::json& j, const PatternComparison& comparison);
