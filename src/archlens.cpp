#include "archlens.hpp"
#include "semantic_indexer.hpp"
#include "source_scanner.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

template <typename Clock>
std::chrono::milliseconds elapsedSince(const typename Clock::time_point& start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

long long percentOf(std::chrono::milliseconds part, std::chrono::milliseconds total) {
    return part.count() * 100 / (total.count() ? total.count() : 1);
}

} // namespace

ArchLens::ArchLens(const ArchLensOptions& options)
    : options_(options),
      patternMatcher_(std::make_unique<PatternMatcher>()) {

    if (!options_.excludePatterns.empty()) {
        patternMatcher_->setExcludePatterns(options_.excludePatterns);
    }
    patternMatcher_->setIncludeTests(options_.includeTests);
}

bool ArchLens::run() {
    try {
        analyze();

        if (options_.writeOutput) {
            auto outputStart = std::chrono::steady_clock::now();
            writeOutputs();
            outputDuration_ = elapsedSince<std::chrono::steady_clock>(outputStart);
            duration_ += outputDuration_;
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return false;
    }
}

const AnalysisResult& ArchLens::analyze() {
    using Clock = std::chrono::steady_clock;
    const auto startTime = Clock::now();

    result_ = AnalysisResult();

    // A bad catalog fails before any scanning
    patternDetector_ = std::make_unique<PatternDetector>(loadCatalog());

    if (options_.verbose) {
        std::cout << "Analyzing project: " << options_.inputDir << std::endl;
    }

    // Scan
    auto scanStart = Clock::now();
    SourceScanner scanner(*patternMatcher_, options_.verbose);
    const auto files = scanner.scanProject(options_.inputDir);
    result_.skippedFiles = scanner.failedFileCount();
    result_.project = projectName(options_.inputDir);

    ManifestReader manifestReader(options_.verbose);
    result_.manifest = manifestReader.read(options_.inputDir, options_.metadataFile);
    scanDuration_ = elapsedSince<Clock>(scanStart);

    if (options_.verbose) {
        std::cout << "Files scanned: " << files.size() << std::endl;
    }

    // Extract
    auto extractionStart = Clock::now();
    KnowledgeGraphBuilder builder(EntityExtractor::create(options_.extraction), options_.verbose);
    result_.graph = builder.build(result_.project, files);

    result_.semanticIndex = SemanticIndexer::buildSemanticIndex(result_.graph.nodes, result_.graph.edges,
                                                                SemanticIndexer::findEntryFiles(options_.inputDir));
    result_.apiSurface = ApiSurfaceAnalyzer::analyze(result_.graph.entities);
    result_.metrics = CodeMetrics::collect(files);
    extractionDuration_ = elapsedSince<Clock>(extractionStart);

    // Detect
    auto detectionStart = Clock::now();

    std::string corpus;
    for (const auto& file : files) {
        corpus += file.content;
        corpus += "\n";
    }

    result_.architectureStyles = patternDetector_->detectArchitectureStyles(corpus, result_.manifest);
    result_.designPatterns = patternDetector_->detectDesignPatterns(corpus, result_.manifest.text);
    result_.communicationPatterns = patternDetector_->detectCommunicationPatterns(corpus, result_.manifest.text);
    detectionDuration_ = elapsedSince<Clock>(detectionStart);

    duration_ = elapsedSince<Clock>(startTime);

    if (options_.verbose) {
        std::cout << "Detected " << result_.architectureStyles.size() << " architecture styles and "
                  << result_.designPatterns.size() << " design patterns" << std::endl;
    }

    return result_;
}

SignatureCatalog ArchLens::loadCatalog() const {
    if (options_.signaturesFile.empty()) {
        return SignatureCatalog::defaults();
    }

    SignatureCatalog catalog = SignatureCatalog::loadFile(options_.signaturesFile);
    if (options_.verbose) {
        std::cout << "Loaded signature catalog version " << catalog.version
                  << " from " << options_.signaturesFile << std::endl;
    }
    return catalog;
}

json ArchLens::patternsJson() const {
    return json{
        {"project", result_.project},
        {"catalog_version", patternDetector_ ? patternDetector_->catalog().version : ""},
        {"patterns", result_.designPatterns}
    };
}

json ArchLens::architectureJson() const {
    return json{
        {"project", result_.project},
        {"workspace", result_.manifest},
        {"styles", result_.architectureStyles},
        {"communication_patterns", result_.communicationPatterns}
    };
}

void ArchLens::writeOutputs() const {
    fs::create_directories(options_.outputDir);

    json index = result_.semanticIndex;
    index["project"] = result_.project;

    json surface = result_.apiSurface;
    surface["project"] = result_.project;

    writeJson(options_.outputDir / KNOWLEDGE_GRAPH_FILE, result_.graph);
    writeJson(options_.outputDir / PATTERNS_FILE, patternsJson());
    writeJson(options_.outputDir / ARCHITECTURE_FILE, architectureJson());
    writeJson(options_.outputDir / SEMANTIC_INDEX_FILE, index);
    writeJson(options_.outputDir / API_SURFACE_FILE, surface);
    writeJson(options_.outputDir / METRICS_FILE, result_.metrics);

    if (options_.verbose) {
        std::cout << "Output written to " << options_.outputDir << std::endl;
    }
}

void ArchLens::writeJson(const fs::path& path, const json& document) const {
    std::ofstream outFile(path);
    if (!outFile) {
        throw std::runtime_error("Could not open output file: " + path.string());
    }
    outFile << document.dump(2) << std::endl;
}

std::string ArchLens::projectName(const fs::path& inputDir) {
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(inputDir, ec);
    if (ec) {
        resolved = inputDir.lexically_normal();
    }
    if (resolved.filename().empty()) {
        resolved = resolved.parent_path();
    }
    return resolved.filename().string();
}

std::string ArchLens::getSummary() const {
    std::stringstream ss;
    ss << "Architecture analysis summary for " << result_.project << ":" << std::endl;
    ss << "  Files analyzed: " << result_.metrics.files << std::endl;
    if (result_.skippedFiles > 0) {
        ss << "  Files skipped: " << result_.skippedFiles << std::endl;
    }
    ss << "  Lines: " << result_.metrics.lines << " (" << result_.metrics.code << " code, "
       << result_.metrics.comments << " comments, " << result_.metrics.blanks << " blank)" << std::endl;
    ss << "  Packages: " << result_.manifest.packageCount
       << (result_.manifest.isWorkspace ? " (workspace)" : "") << std::endl;
    ss << "  Entities: " << result_.graph.entities.size() << " (" << result_.graph.nodes.size()
       << " unique names)" << std::endl;
    ss << "  Relationships: " << result_.graph.edges.size() << std::endl;
    ss << "  Clusters: " << result_.graph.clusters.size() << std::endl;
    ss << "  Public APIs: " << result_.semanticIndex.stats.totalPublicApis << std::endl;

    ss << "  Architecture styles:" << std::endl;
    for (const auto& style : result_.architectureStyles) {
        ss << "    - " << style.name << " (" << std::fixed << std::setprecision(0)
           << style.confidence * 100 << "%)" << std::endl;
    }

    ss << "  Design patterns:" << std::endl;
    for (const auto& pattern : result_.designPatterns) {
        ss << "    - " << pattern.name << " (" << std::fixed << std::setprecision(0)
           << pattern.confidence * 100 << "%)" << std::endl;
    }

    if (options_.showTiming) {
        ss << "  Total time: " << duration_.count() << " ms" << std::endl;
    }

    return ss.str();
}

std::string ArchLens::getTimingInfo() const {
    std::stringstream ss;
    ss << "Timing Information:" << std::endl;
    ss << "- Total time: " << duration_.count() << "ms" << std::endl;
    ss << "- Scanning time: " << scanDuration_.count() << "ms ("
       << percentOf(scanDuration_, duration_) << "%)" << std::endl;
    ss << "- Extraction time: " << extractionDuration_.count() << "ms ("
       << percentOf(extractionDuration_, duration_) << "%)" << std::endl;
    ss << "- Detection time: " << detectionDuration_.count() << "ms ("
       << percentOf(detectionDuration_, duration_) << "%)" << std::endl;
    ss << "- Output time: " << outputDuration_.count() << "ms ("
       << percentOf(outputDuration_, duration_) << "%)" << std::endl;

    if (scanDuration_.count() + extractionDuration_.count() > 0) {
        const double seconds = (scanDuration_.count() + extractionDuration_.count()) / 1000.0;
        ss << "- Performance:" << std::endl;
        ss << "  * " << std::fixed << std::setprecision(2)
           << static_cast<double>(result_.metrics.files) / seconds << " files/second" << std::endl;
        ss << "  * " << std::fixed << std::setprecision(2)
           << static_cast<double>(result_.metrics.lines) / seconds << " lines/second" << std::endl;
    }

    return ss.str();
}
