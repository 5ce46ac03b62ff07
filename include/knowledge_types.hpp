#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>

// Kinds of declarations recognized by the entity extractor
enum class EntityKind {
    Struct,
    Enum,
    Trait,
    Function,
    Module,
    Impl,
    TypeAlias,
    Const,
    Static
};

// Canonical visibility categories
enum class Visibility {
    Pub,
    PubCrate,
    PubSuper,
    PubSelf,
    PubIn,
    Private
};

enum class RelationshipKind {
    Implements,
    Derives,
    Contains,
    Uses,
    References
};

// A named declaration found in source text
struct Entity {
    std::string name;
    EntityKind kind = EntityKind::Struct;
    Visibility visibility = Visibility::Private;
    std::string module;                 // File path relative to the project root
    size_t line = 0;                    // 1-based
    std::optional<std::string> doc;     // Attached doc comment, if any
};

// A directed, typed link between two entity names
struct Edge {
    std::string from;
    std::string to;
    RelationshipKind relationship = RelationshipKind::Uses;
    std::string source;                 // File the relationship was found in
};

// Scored result of matching a signature against a corpus
struct Detection {
    std::string name;
    double confidence = 0.0;
    std::vector<std::string> evidence;
    std::string description;
};

struct CommunicationPattern {
    std::string name;
    std::vector<std::string> evidence;
    size_t usageCount = 0;
};

// Architectural layer grouping
struct Cluster {
    std::string name;
    std::vector<std::string> entityIds;  // Sorted, unique
};

struct HotSpot {
    std::string name;
    size_t degree = 0;
};

struct EntryPoint {
    std::string file;
    std::string type;                   // "main", "lib" or "main_function"
    std::string description;
};

struct SemanticIndex {
    std::map<std::string, std::vector<std::string>> fileToConcepts;
    std::map<std::string, std::vector<std::string>> conceptToFiles;
    std::vector<HotSpot> hotSpots;
    std::vector<EntryPoint> entryPoints;
    std::vector<Entity> publicApis;

    struct Stats {
        size_t totalFiles = 0;
        size_t totalConcepts = 0;
        size_t totalPublicApis = 0;
        size_t totalHotSpots = 0;
        size_t totalEntryPoints = 0;
    } stats;
};

// String conversions used for JSON output
std::string toString(EntityKind kind);
std::string toString(Visibility visibility);
std::string toString(RelationshipKind relationship);

// nlohmann/json serializers
void to_json(nlohmann::json& j, const Entity& entity);
void to_json(nlohmann::json& j, const Edge& edge);
void to_json(nlohmann::json& j, const Detection& detection);
void to_json(nlohmann::json& j, const CommunicationPattern& pattern);
void to_json(nlohmann::json& j, const Cluster& cluster);
void to_json(nlohmann::json& j, const HotSpot& hotSpot);
void to_json(nlohmann::json& j, const EntryPoint& entryPoint);
void to_json(nlohmann::json& j, const SemanticIndex& index);
