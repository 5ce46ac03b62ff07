#include "semantic_indexer.hpp"
#include <algorithm>
#include <system_error>
#include <unordered_map>
#include <unordered_set>

namespace {

struct EntryFile {
    const char* path;
    const char* type;
    const char* description;
};

const EntryFile ENTRY_FILES[] = {
    {"src/main.rs", "main", "Binary entry point"},
    {"src/lib.rs", "lib", "Library entry point"},
    {"lib.rs", "lib", "Library entry point"},
    {"main.rs", "main", "Binary entry point"}
};

void appendUnique(std::vector<std::string>& values, const std::string& value) {
    if (std::find(values.begin(), values.end(), value) == values.end()) {
        values.push_back(value);
    }
}

} // namespace

SemanticIndex SemanticIndexer::buildSemanticIndex(const std::vector<Entity>& entities,
                                                  const std::vector<Edge>& edges,
                                                  const std::vector<std::string>& entryFiles) {
    SemanticIndex index;

    for (const auto& entity : entities) {
        appendUnique(index.fileToConcepts[entity.module], entity.name);
        appendUnique(index.conceptToFiles[entity.name], entity.module);

        if (isPublicApi(entity)) {
            index.publicApis.push_back(entity);
        }
    }

    index.hotSpots = rankHotSpots(edges);
    index.entryPoints = detectEntryPoints(entities, entryFiles);

    index.stats.totalFiles = index.fileToConcepts.size();
    index.stats.totalConcepts = index.conceptToFiles.size();
    index.stats.totalPublicApis = index.publicApis.size();
    index.stats.totalHotSpots = index.hotSpots.size();
    index.stats.totalEntryPoints = index.entryPoints.size();

    return index;
}

std::vector<HotSpot> SemanticIndexer::rankHotSpots(const std::vector<Edge>& edges, size_t limit) {
    std::vector<HotSpot> degrees;
    std::unordered_map<std::string, size_t> position;

    auto count = [&](const std::string& name) {
        auto it = position.find(name);
        if (it == position.end()) {
            position.emplace(name, degrees.size());
            degrees.push_back({name, 1});
        } else {
            ++degrees[it->second].degree;
        }
    };

    for (const auto& edge : edges) {
        count(edge.from);
        count(edge.to);
    }

    std::stable_sort(degrees.begin(), degrees.end(),
        [](const HotSpot& a, const HotSpot& b) { return a.degree > b.degree; });

    if (degrees.size() > limit) {
        degrees.resize(limit);
    }
    return degrees;
}

std::vector<EntryPoint> SemanticIndexer::detectEntryPoints(const std::vector<Entity>& entities,
                                                           const std::vector<std::string>& entryFiles) {
    std::vector<EntryPoint> entryPoints;
    const std::unordered_set<std::string> files(entryFiles.begin(), entryFiles.end());

    for (const auto& entry : ENTRY_FILES) {
        if (files.count(entry.path) > 0) {
            entryPoints.push_back({entry.path, entry.type, entry.description});
        }
    }

    // Only the first main function is reported
    for (const auto& entity : entities) {
        if (entity.name == "main" && entity.kind == EntityKind::Function) {
            entryPoints.push_back({entity.module, "main_function", "main() function"});
            break;
        }
    }

    return entryPoints;
}

std::vector<std::string> SemanticIndexer::findEntryFiles(const std::filesystem::path& projectRoot) {
    std::vector<std::string> found;
    for (const auto& entry : ENTRY_FILES) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(projectRoot / entry.path, ec)) {
            found.push_back(entry.path);
        }
    }
    return found;
}

bool SemanticIndexer::isPublicApi(const Entity& entity) {
    if (entity.visibility != Visibility::Pub) {
        return false;
    }
    return entity.kind == EntityKind::Function ||
           entity.kind == EntityKind::Struct ||
           entity.kind == EntityKind::Trait;
}
