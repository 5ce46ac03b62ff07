#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <regex>
#include <unordered_set>
#include "knowledge_types.hpp"

// Infers typed edges between entity names from raw file text.
//
// Each relationship kind is its own single pass over the text: regexes for
// implements, derives, contains and uses, a linear scanner for field
// annotations. Nothing is excluded: matches inside comments or string
// literals produce edges too.
// Edge sources are approximate: `uses` and `contains` edges start at the file
// stem, `references` edges start at the synthetic FIELD_USAGE_NODE.
class RelationshipExtractor {
public:
    static constexpr const char* FIELD_USAGE_NODE = "field_usage";

    RelationshipExtractor();

    // Scan one file. `knownEntities` is the set of entity names of the whole project.
    std::vector<Edge> extractRelationships(
        const std::string& content,
        const std::string& filePath,
        const std::unordered_set<std::string>& knownEntities
    ) const;

    // Built-in types that never become `references` targets
    static bool isPrimitive(const std::string& typeName);

    // File name without directory and extension ("src/net/conn.rs" -> "conn")
    static std::string fileStem(const std::string& filePath);

    // Type named by a `: [&][mut ][Option<|Vec<|Box<|Arc<|Rc<]Type` annotation
    // starting at `pos`, with the offset just past it
    static std::optional<std::pair<std::string, size_t>> matchFieldType(const std::string& content, size_t pos);

private:
    std::regex implementsRegex_;
    std::regex derivesRegex_;
    std::regex modRegex_;
    std::regex useRegex_;

    void extractImplements(const std::string& content, const std::string& filePath,
                           std::vector<Edge>& edges) const;
    void extractDerives(const std::string& content, const std::string& filePath,
                        std::vector<Edge>& edges) const;
    void extractContains(const std::string& content, const std::string& filePath,
                         std::vector<Edge>& edges) const;
    void extractUses(const std::string& content, const std::string& filePath,
                     const std::unordered_set<std::string>& knownEntities,
                     std::vector<Edge>& edges) const;
    void extractReferences(const std::string& content, const std::string& filePath,
                           const std::unordered_set<std::string>& knownEntities,
                           std::vector<Edge>& edges) const;
};
