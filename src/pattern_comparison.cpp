#include "pattern_comparison.hpp"
#include "archlens.hpp"
#include <iostream>
#include <set>

using json = nlohmann::json;

namespace {

std::vector<std::string> names(const std::vector<Detection>& detections) {
    std::vector<std::string> result;
    for (const auto& detection : detections) {
        result.push_back(detection.name);
    }
    return result;
}

} // namespace

PatternComparison comparePatterns(const std::vector<fs::path>& projectPaths, const ComparisonOptions& options) {
    PatternComparison comparison;
    std::set<std::string> styles;
    std::set<std::string> patterns;
    std::set<std::string> communication;

    for (const auto& projectPath : projectPaths) {
        ArchLensOptions lensOptions;
        lensOptions.inputDir = projectPath;
        lensOptions.signaturesFile = options.signaturesFile;
        lensOptions.includeTests = options.includeTests;
        lensOptions.verbose = options.verbose;
        lensOptions.writeOutput = false;

        ArchLens lens(lensOptions);
        const AnalysisResult& result = lens.analyze();

        ProjectPatterns project;
        project.project = result.project;
        project.styles = result.architectureStyles;
        project.designPatterns = result.designPatterns;
        project.communication = result.communicationPatterns;
        // A project without manifest metadata still counts as one crate
        project.crateCount = result.manifest.packageCount > 0 ? result.manifest.packageCount : 1;

        for (const auto& style : project.styles) {
            styles.insert(style.name);
        }
        for (const auto& pattern : project.designPatterns) {
            patterns.insert(pattern.name);
        }
        for (const auto& comm : project.communication) {
            communication.insert(comm.name);
        }

        if (options.verbose) {
            std::cout << "Compared " << project.project << ": " << project.styles.size() << " styles, "
                      << project.designPatterns.size() << " patterns" << std::endl;
        }

        comparison.projects.push_back(std::move(project));
    }

    comparison.allStyles.assign(styles.begin(), styles.end());
    comparison.allPatterns.assign(patterns.begin(), patterns.end());
    comparison.allCommunication.assign(communication.begin(), communication.end());
    return comparison;
}

void to_json(json& j, const ProjectPatterns& project) {
    std::vector<std::string> communication;
    for (const auto& comm : project.communication) {
        communication.push_back(comm.name);
    }

    j = json{
        {"styles", names(project.styles)},
        {"style_details", project.styles},
        {"design_patterns", names(project.designPatterns)},
        {"pattern_details", project.designPatterns},
        {"communication", communication},
        {"crate_count", project.crateCount}
    };
}

void to_json(json& j, const PatternComparison& comparison) {
    json projects = json::object();
    for (const auto& project : comparison.projects) {
        projects[project.project] = project;
    }

    j = json{
        {"projects", projects},
        {"all_styles", comparison.allStyles},
        {"all_patterns", comparison.allPatterns},
        {"all_communication", comparison.allCommunication}
    };
}
