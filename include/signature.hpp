#pragma once

#include <string>
#include <vector>
#include <regex>
#include <memory>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

enum class EvidenceKind {
    Keyword,    // Literal substring of the corpus
    Import,     // Dependency named in the manifest, or `use <name>` in the corpus
    Pattern,    // Regex searched in the corpus
    Trait       // Literal trait usage in the corpus
};

// One weighted piece of evidence a Signature looks for
struct Evidence {
    EvidenceKind kind = EvidenceKind::Keyword;
    std::string value;
    int weight = 1;
    std::shared_ptr<const std::regex> regex;   // Compiled form of Pattern evidence

    static Evidence keyword(const std::string& value);
    static Evidence import(const std::string& value);
    static Evidence trait(const std::string& value);

    // Throws std::regex_error if the pattern does not compile
    static Evidence pattern(const std::string& value);

    static int defaultWeight(EvidenceKind kind);

    // True if the evidence is present
    bool matches(const std::string& corpus, const std::string& manifest) const;

    // Human readable form used in Detection::evidence ("keyword: Builder")
    std::string describe() const;
};

// A named bundle of weighted evidence for a style or design pattern
struct Signature {
    std::string name;
    std::string description;
    std::vector<Evidence> evidence;

    // Values of one evidence category, in declaration order
    std::vector<std::string> values(EvidenceKind kind) const;
};

// Versioned set of signatures handed to the PatternDetector
struct SignatureCatalog {
    std::string version;
    std::vector<Signature> designPatterns;
    std::vector<Signature> architectureStyles;
    std::vector<Signature> communicationPatterns;

    // Built-in catalog
    static SignatureCatalog defaults();

    // Parse a catalog document. Missing sections keep the built-in defaults;
    // missing categories contribute nothing; invalid regexes are dropped
    // with a warning.
    static SignatureCatalog fromJson(const nlohmann::json& document);

    // Load a catalog file. Throws std::runtime_error if the file cannot be
    // read or is not valid JSON.
    static SignatureCatalog loadFile(const fs::path& path);

    // Look up a signature by name in a list, nullptr if absent
    static const Signature* find(const std::vector<Signature>& signatures, const std::string& name);
};

std::string toString(EvidenceKind kind);

void to_json(nlohmann::json& j, const Signature& signature);
void to_json(nlohmann::json& j, const SignatureCatalog& catalog);
