#pragma once

#include <string>
#include <vector>
#include "knowledge_types.hpp"
#include "manifest_reader.hpp"
#include "signature.hpp"

// Inclusion thresholds and workspace-shape limits
struct DetectionThresholds {
    double designPattern = 0.2;             // Minimum confidence for a design pattern
    double architectureStyle = 0.3;         // Minimum confidence for a scored architecture style
    size_t workspacePackages = 3;           // Multi-Crate Workspace needs more packages than this
    size_t moduleDeclarations = 10;         // Modular Monolith needs more module declarations than this
    double workspaceConfidence = 0.9;
    double monolithConfidence = 0.7;
};

// Raw result of scoring one signature
struct SignatureScore {
    int score = 0;
    int maxScore = 0;
    std::vector<std::string> evidence;

    // score / maxScore clamped to [0, 1], 0 when nothing can match
    double confidence() const;
};

// Scores signatures against the aggregated corpus and manifest text.
// Works on text only; the entity graph is not consulted.
class PatternDetector {
public:
    static constexpr const char* MULTI_CRATE_WORKSPACE = "Multi-Crate Workspace";
    static constexpr const char* MODULAR_MONOLITH = "Modular Monolith";

    explicit PatternDetector(const SignatureCatalog& catalog = SignatureCatalog::defaults(),
                             const DetectionThresholds& thresholds = DetectionThresholds());

    // Score one signature
    static SignatureScore scoreSignature(const Signature& signature,
                                         const std::string& corpus,
                                         const std::string& manifest);

    // Score every signature and keep those with a hit and confidence >= threshold,
    // sorted by confidence descending (ties keep declaration order)
    static std::vector<Detection> detectSignatures(const std::string& corpus,
                                                   const std::string& manifest,
                                                   const std::vector<Signature>& signatures,
                                                   double threshold = 0.2);

    // Design patterns from the catalog
    std::vector<Detection> detectDesignPatterns(const std::string& corpus,
                                                const std::string& manifest) const;

    // Workspace-shape heuristics followed by keyword-scored styles
    std::vector<Detection> detectArchitectureStyles(const std::string& corpus,
                                                    const ManifestInfo& manifest) const;

    // Messaging evidence with usage counts, sorted by usage count descending
    std::vector<CommunicationPattern> detectCommunicationPatterns(const std::string& corpus,
                                                                  const std::string& manifest) const;

    // Number of `mod name` declarations in the corpus
    static size_t countModuleDeclarations(const std::string& corpus);

    const SignatureCatalog& catalog() const { return catalog_; }

private:
    SignatureCatalog catalog_;
    DetectionThresholds thresholds_;

    std::string styleDescription(const std::string& name) const;
};
