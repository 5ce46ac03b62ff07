#include "knowledge_types.hpp"

using json = nlohmann::json;

std::string toString(EntityKind kind) {
    switch (kind) {
        case EntityKind::Struct:    return "struct";
        case EntityKind::Enum:      return "enum";
        case EntityKind::Trait:     return "trait";
        case EntityKind::Function:  return "fn";
        case EntityKind::Module:    return "mod";
        case EntityKind::Impl:      return "impl";
        case EntityKind::TypeAlias: return "type";
        case EntityKind::Const:     return "const";
        case EntityKind::Static:    return "static";
    }
    return "struct";
}

std::string toString(Visibility visibility) {
    switch (visibility) {
        case Visibility::Pub:      return "pub";
        case Visibility::PubCrate: return "pub(crate)";
        case Visibility::PubSuper: return "pub(super)";
        case Visibility::PubSelf:  return "pub(self)";
        case Visibility::PubIn:    return "pub(in ...)";
        case Visibility::Private:  return "private";
    }
    return "private";
}

std::string toString(RelationshipKind relationship) {
    switch (relationship) {
        case RelationshipKind::Implements: return "implements";
        case RelationshipKind::Derives:    return "derives";
        case RelationshipKind::Contains:   return "contains";
        case RelationshipKind::Uses:       return "uses";
        case RelationshipKind::References: return "references";
    }
    return "uses";
}

void to_json(json& j, const Entity& entity) {
    j = json{
        {"id", entity.name},
        {"name", entity.name},
        {"type", toString(entity.kind)},
        {"visibility", toString(entity.visibility)},
        {"module", entity.module},
        {"line", entity.line}
    };
    if (entity.doc) {
        j["doc"] = *entity.doc;
    }
}

void to_json(json& j, const Edge& edge) {
    j = json{
        {"from", edge.from},
        {"to", edge.to},
        {"relationship", toString(edge.relationship)},
        {"source", edge.source}
    };
}

void to_json(json& j, const Detection& detection) {
    j = json{
        {"name", detection.name},
        {"confidence", detection.confidence},
        {"evidence", detection.evidence}
    };
    if (!detection.description.empty()) {
        j["description"] = detection.description;
    }
}

void to_json(json& j, const CommunicationPattern& pattern) {
    j = json{
        {"pattern", pattern.name},
        {"evidence", pattern.evidence},
        {"usage_count", pattern.usageCount}
    };
}

void to_json(json& j, const Cluster& cluster) {
    j = json{
        {"name", cluster.name},
        {"nodes", cluster.entityIds}
    };
}

void to_json(json& j, const HotSpot& hotSpot) {
    j = json{
        {"name", hotSpot.name},
        {"degree", hotSpot.degree}
    };
}

void to_json(json& j, const EntryPoint& entryPoint) {
    j = json{
        {"file", entryPoint.file},
        {"type", entryPoint.type},
        {"description", entryPoint.description}
    };
}

void to_json(json& j, const SemanticIndex& index) {
    // Public APIs only carry the fields consumers navigate by
    json apis = json::array();
    for (const auto& api : index.publicApis) {
        apis.push_back({
            {"name", api.name},
            {"type", toString(api.kind)},
            {"module", api.module}
        });
    }

    j = json{
        {"file_to_concepts", index.fileToConcepts},
        {"concept_to_files", index.conceptToFiles},
        {"hot_spots", index.hotSpots},
        {"entry_points", index.entryPoints},
        {"public_apis", apis},
        {"stats", {
            {"total_files", index.stats.totalFiles},
            {"total_concepts", index.stats.totalConcepts},
            {"total_public_apis", index.stats.totalPublicApis},
            {"total_hot_spots", index.stats.totalHotSpots},
            {"total_entry_points", index.stats.totalEntryPoints}
        }}
    };
}
