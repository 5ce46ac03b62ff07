#include "pattern_detector.hpp"
#include <algorithm>
#include <iterator>
#include <regex>

namespace {

size_t countOccurrences(const std::string& text, const std::string& needle) {
    if (needle.empty()) {
        return 0;
    }
    size_t count = 0;
    size_t pos = text.find(needle);
    while (pos != std::string::npos) {
        ++count;
        pos = text.find(needle, pos + needle.size());
    }
    return count;
}

void sortByConfidence(std::vector<Detection>& detections) {
    std::stable_sort(detections.begin(), detections.end(),
        [](const Detection& a, const Detection& b) { return a.confidence > b.confidence; });
}

} // namespace

double SignatureScore::confidence() const {
    if (maxScore <= 0) {
        return 0.0;
    }
    return std::min(static_cast<double>(score) / static_cast<double>(maxScore), 1.0);
}

PatternDetector::PatternDetector(const SignatureCatalog& catalog, const DetectionThresholds& thresholds)
    : catalog_(catalog),
      thresholds_(thresholds) {
}

SignatureScore PatternDetector::scoreSignature(const Signature& signature,
                                               const std::string& corpus,
                                               const std::string& manifest) {
    SignatureScore result;

    for (const auto& evidence : signature.evidence) {
        result.maxScore += evidence.weight;
        if (evidence.matches(corpus, manifest)) {
            result.score += evidence.weight;
            result.evidence.push_back(evidence.describe());
        }
    }

    return result;
}

std::vector<Detection> PatternDetector::detectSignatures(const std::string& corpus,
                                                         const std::string& manifest,
                                                         const std::vector<Signature>& signatures,
                                                         double threshold) {
    std::vector<Detection> detections;

    for (const auto& signature : signatures) {
        const SignatureScore result = scoreSignature(signature, corpus, manifest);
        if (result.score <= 0) {
            continue;
        }

        const double confidence = result.confidence();
        if (confidence >= threshold) {
            detections.push_back({signature.name, confidence, result.evidence, signature.description});
        }
    }

    sortByConfidence(detections);
    return detections;
}

std::vector<Detection> PatternDetector::detectDesignPatterns(const std::string& corpus,
                                                             const std::string& manifest) const {
    return detectSignatures(corpus, manifest, catalog_.designPatterns, thresholds_.designPattern);
}

std::vector<Detection> PatternDetector::detectArchitectureStyles(const std::string& corpus,
                                                                 const ManifestInfo& manifest) const {
    std::vector<Detection> detections;

    if (manifest.isWorkspace && manifest.packageCount > thresholds_.workspacePackages) {
        detections.push_back({
            MULTI_CRATE_WORKSPACE,
            thresholds_.workspaceConfidence,
            {"Workspace with " + std::to_string(manifest.packageCount) + " packages"},
            styleDescription(MULTI_CRATE_WORKSPACE)
        });
    } else if (!manifest.isWorkspace) {
        const size_t moduleCount = countModuleDeclarations(corpus);
        if (moduleCount > thresholds_.moduleDeclarations) {
            detections.push_back({
                MODULAR_MONOLITH,
                thresholds_.monolithConfidence,
                {"Single crate with " + std::to_string(moduleCount) + "+ module declarations"},
                styleDescription(MODULAR_MONOLITH)
            });
        }
    }

    // Remaining styles are scored on source and manifest together
    std::vector<Signature> scored;
    for (const auto& style : catalog_.architectureStyles) {
        if (style.name != MULTI_CRATE_WORKSPACE && style.name != MODULAR_MONOLITH) {
            scored.push_back(style);
        }
    }

    const std::string combined = corpus + manifest.text;
    for (auto& detection : detectSignatures(combined, manifest.text, scored, thresholds_.architectureStyle)) {
        detections.push_back(std::move(detection));
    }

    sortByConfidence(detections);
    return detections;
}

std::vector<CommunicationPattern> PatternDetector::detectCommunicationPatterns(
    const std::string& corpus,
    const std::string& manifest
) const {
    std::vector<CommunicationPattern> patterns;
    const std::string combined = corpus + manifest;

    for (const auto& signature : catalog_.communicationPatterns) {
        CommunicationPattern pattern;
        pattern.name = signature.name;

        for (const auto& evidence : signature.evidence) {
            const size_t count = countOccurrences(combined, evidence.value);
            if (count > 0) {
                pattern.evidence.push_back(evidence.value);
                pattern.usageCount += count;
            }
        }

        if (!pattern.evidence.empty()) {
            patterns.push_back(std::move(pattern));
        }
    }

    std::stable_sort(patterns.begin(), patterns.end(),
        [](const CommunicationPattern& a, const CommunicationPattern& b) {
            return a.usageCount > b.usageCount;
        });

    return patterns;
}

size_t PatternDetector::countModuleDeclarations(const std::string& corpus) {
    static const std::regex modDeclaration(R"(\bmod\s+\w+)");
    return static_cast<size_t>(std::distance(
        std::sregex_iterator(corpus.begin(), corpus.end(), modDeclaration),
        std::sregex_iterator()));
}

std::string PatternDetector::styleDescription(const std::string& name) const {
    const Signature* style = SignatureCatalog::find(catalog_.architectureStyles, name);
    return style ? style->description : "";
}
