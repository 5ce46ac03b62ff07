#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "knowledge_types.hpp"

// Navigation index over the entity graph: file <-> concept maps, the most
// connected names, program entry points and the public API subset.
class SemanticIndexer {
public:
    static constexpr size_t MAX_HOT_SPOTS = 20;

    // `entryFiles` are project-relative paths checked against the canonical
    // entry files (src/main.rs, src/lib.rs, lib.rs, main.rs)
    static SemanticIndex buildSemanticIndex(const std::vector<Entity>& entities,
                                            const std::vector<Edge>& edges,
                                            const std::vector<std::string>& entryFiles = {});

    // Undirected degree per edge endpoint, descending; ties keep first appearance
    static std::vector<HotSpot> rankHotSpots(const std::vector<Edge>& edges, size_t limit = MAX_HOT_SPOTS);

    static std::vector<EntryPoint> detectEntryPoints(const std::vector<Entity>& entities,
                                                     const std::vector<std::string>& entryFiles);

    // Canonical entry files that exist under `projectRoot`, whether scanned or not
    static std::vector<std::string> findEntryFiles(const std::filesystem::path& projectRoot);

    // Entities with visibility pub and kind fn, struct or trait
    static bool isPublicApi(const Entity& entity);
};
