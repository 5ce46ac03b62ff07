#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <memory>
#include <chrono>
#include <nlohmann/json.hpp>
#include "api_surface.hpp"
#include "code_metrics.hpp"
#include "entity_extractor.hpp"
#include "knowledge_graph.hpp"
#include "manifest_reader.hpp"
#include "pattern_detector.hpp"
#include "pattern_matcher.hpp"
#include "signature.hpp"

namespace fs = std::filesystem;

struct ArchLensOptions {
    fs::path inputDir;
    fs::path outputDir = "archlens-output";
    fs::path metadataFile;              // Saved `cargo metadata --format-version 1` output (optional)
    fs::path signaturesFile;            // Custom signature catalog (optional)
    std::string excludePatterns;        // Comma-separated list of glob patterns to exclude
    bool includeTests = false;          // Analyze test/bench/example code too
    bool verbose = false;
    bool showTiming = false;
    bool writeOutput = true;            // Write the JSON files into outputDir
    ExtractionOptions extraction;
};

// Everything one analysis produces
struct AnalysisResult {
    std::string project;
    ManifestInfo manifest;
    KnowledgeGraph graph;
    std::vector<Detection> architectureStyles;
    std::vector<Detection> designPatterns;
    std::vector<CommunicationPattern> communicationPatterns;
    SemanticIndex semanticIndex;
    ApiSurface apiSurface;
    CodeMetrics metrics;
    size_t skippedFiles = 0;
};

class ArchLens {
public:
    explicit ArchLens(const ArchLensOptions& options);

    // Run the analysis and write outputs. Errors are reported on stderr and
    // turn into a false return.
    bool run();

    // Run the analysis only. Throws std::invalid_argument for an empty input
    // path and std::runtime_error for a missing directory or a bad catalog.
    const AnalysisResult& analyze();

    const AnalysisResult& result() const { return result_; }

    // Get the summary of the analyzed project
    std::string getSummary() const;

    // Get timing information
    std::string getTimingInfo() const;

    // JSON documents written by run()
    nlohmann::json patternsJson() const;
    nlohmann::json architectureJson() const;

    // File names inside the output directory
    static constexpr const char* KNOWLEDGE_GRAPH_FILE = "knowledge_graph.json";
    static constexpr const char* PATTERNS_FILE = "patterns.json";
    static constexpr const char* ARCHITECTURE_FILE = "architecture.json";
    static constexpr const char* SEMANTIC_INDEX_FILE = "semantic_index.json";
    static constexpr const char* API_SURFACE_FILE = "api_surface.json";
    static constexpr const char* METRICS_FILE = "metrics.json";

private:
    ArchLensOptions options_;
    std::unique_ptr<PatternMatcher> patternMatcher_;
    std::unique_ptr<PatternDetector> patternDetector_;
    AnalysisResult result_;

    // Timing info
    std::chrono::milliseconds duration_{0};
    std::chrono::milliseconds scanDuration_{0};
    std::chrono::milliseconds extractionDuration_{0};
    std::chrono::milliseconds detectionDuration_{0};
    std::chrono::milliseconds outputDuration_{0};

    // Helper methods
    SignatureCatalog loadCatalog() const;
    void writeOutputs() const;
    void writeJson(const fs::path& path, const nlohmann::json& document) const;
    static std::string projectName(const fs::path& inputDir);
};
