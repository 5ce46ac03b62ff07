#include "api_surface.hpp"
#include <filesystem>

namespace fs = std::filesystem;
using json = nlohmann::json;

ApiSurface ApiSurfaceAnalyzer::analyze(const std::vector<Entity>& entities) {
    ApiSurface surface;

    for (const auto& entity : entities) {
        if (entity.visibility == Visibility::Private || entity.kind == EntityKind::Impl) {
            continue;
        }

        surface.items.push_back(entity);
        surface.byType[toString(entity.kind)].push_back(entity.name);
        surface.byVisibility[toString(entity.visibility)].push_back(entity.name);
        surface.byModule[moduleOf(entity.module)].push_back(entity.name);

        switch (entity.kind) {
            case EntityKind::Struct:   ++surface.stats.pubStructs; break;
            case EntityKind::Enum:     ++surface.stats.pubEnums; break;
            case EntityKind::Trait:    ++surface.stats.pubTraits; break;
            case EntityKind::Function: ++surface.stats.pubFunctions; break;
            case EntityKind::Module:   ++surface.stats.pubModules; break;
            default: break;
        }
    }

    surface.stats.totalPubItems = surface.items.size();
    return surface;
}

std::string ApiSurfaceAnalyzer::moduleOf(const std::string& filePath) {
    const std::string parent = fs::path(filePath).parent_path().generic_string();
    return parent.empty() || parent == "." ? "root" : parent;
}

void to_json(json& j, const ApiSurface& surface) {
    j = json{
        {"items", surface.items},
        {"by_type", surface.byType},
        {"by_visibility", surface.byVisibility},
        {"by_module", surface.byModule},
        {"stats", {
            {"total_pub_items", surface.stats.totalPubItems},
            {"pub_structs", surface.stats.pubStructs},
            {"pub_enums", surface.stats.pubEnums},
            {"pub_traits", surface.stats.pubTraits},
            {"pub_functions", surface.stats.pubFunctions},
            {"pub_modules", surface.stats.pubModules}
        }}
    };
}
