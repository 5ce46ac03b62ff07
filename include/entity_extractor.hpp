#pragma once

#include <string>
#include <vector>
#include <memory>
#include <regex>
#include <unordered_set>
#include "knowledge_types.hpp"

// Options controlling entity extraction
struct ExtractionOptions {
    size_t docWindowLines = 5;          // Max line distance between a doc block and its declaration
    size_t maxDocLength = 200;          // Doc text is truncated to this many characters
    bool attachDocs = true;             // Attach doc comments to entities

    // Identifiers that are never reported as entities
    std::unordered_set<std::string> noiseNames = {
        "self", "Self", "crate", "super", "new", "default", "from", "into", "as_ref", "as_mut"
    };
};

// Base class for declaration extraction.
//
// Implementations only need to honor the Entity contract, so a parser-backed
// extractor can replace the lexical one without touching consumers.
class EntityExtractor {
public:
    virtual ~EntityExtractor() = default;

    // Extract entities from the text of one file
    virtual std::vector<Entity> extractEntities(
        const std::string& content,
        const std::string& filePath
    ) const = 0;

    // Factory method for the default extractor
    static std::unique_ptr<EntityExtractor> create(const ExtractionOptions& options = ExtractionOptions());
};

// Lexical extractor driven by a tagged pattern table (kind -> matcher).
// Matches inside comments and string literals are reported like any other.
class RegexEntityExtractor : public EntityExtractor {
public:
    explicit RegexEntityExtractor(const ExtractionOptions& options = ExtractionOptions());

    std::vector<Entity> extractEntities(
        const std::string& content,
        const std::string& filePath
    ) const override;

    // Map a captured visibility qualifier to its canonical category
    static Visibility parseVisibility(const std::string& qualifier);

private:
    struct DeclarationPattern {
        EntityKind kind;
        std::regex regex;
        bool hasVisibility;             // Group 1 is the visibility qualifier, group 2 the name
    };

    struct DocBlock {
        size_t startLine = 0;
        std::string text;
        std::string declaredName;       // Name declared right after the block
    };

    ExtractionOptions options_;
    std::vector<DeclarationPattern> patterns_;

    static std::vector<DeclarationPattern> buildPatternTable();
    std::vector<DocBlock> extractDocBlocks(const std::string& content) const;
    void attachDocs(std::vector<Entity>& entities, const std::string& content) const;
};

// Line lookup for match offsets
class LineIndex {
public:
    explicit LineIndex(const std::string& content);

    // 1-based line containing the byte offset
    size_t lineAt(size_t offset) const;

private:
    std::vector<size_t> lineStarts_;
};
