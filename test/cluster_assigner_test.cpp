#include <catch2/catch_test_macros.hpp>
#include "cluster_assigner.hpp"
#include <algorithm>
#include <set>

namespace {

Entity entityIn(const std::string& name, const std::string& module) {
    Entity entity;
    entity.name = name;
    entity.module = module;
    return entity;
}

} // namespace

TEST_CASE("ClusterAssigner maps paths to layers", "[ClusterAssigner]") {
    REQUIRE(ClusterAssigner::layerFor("src/domain/user.rs") == "Domain Layer");
    REQUIRE(ClusterAssigner::layerFor("src/services/auth.rs") == "Application Layer");
    REQUIRE(ClusterAssigner::layerFor("src/db/pool.rs") == "Infrastructure Layer");
    REQUIRE(ClusterAssigner::layerFor("src/api/routes.rs") == "Interface Layer");
    REQUIRE(ClusterAssigner::layerFor("src/utils/fmt.rs") == "Utilities");

    SECTION("First matching rule wins") {
        REQUIRE(ClusterAssigner::layerFor("src/model/api.rs") == "Domain Layer");
    }

    SECTION("Unmatched paths fall back to their directory") {
        REQUIRE(ClusterAssigner::layerFor("src/engine/core.rs") == "Module: engine");
        REQUIRE(ClusterAssigner::layerFor("src/lib.rs") == "Module: src");
        REQUIRE(ClusterAssigner::layerFor("lib.rs") == "Core");
    }
}

TEST_CASE("ClusterAssigner partitions entities", "[ClusterAssigner]") {
    const std::vector<Entity> entities = {
        entityIn("User", "src/domain/user.rs"),
        entityIn("Account", "src/domain/account.rs"),
        entityIn("AuthService", "src/services/auth.rs"),
        entityIn("Pool", "src/db/pool.rs"),
        entityIn("Engine", "src/engine/core.rs"),
        entityIn("run", "main.rs")
    };

    auto clusters = ClusterAssigner::assignClusters(entities);

    REQUIRE(clusters.size() == 5);

    SECTION("Clusters are sorted by name") {
        std::vector<std::string> names;
        for (const auto& cluster : clusters) {
            names.push_back(cluster.name);
        }
        REQUIRE(std::is_sorted(names.begin(), names.end()));
        REQUIRE(names.front() == "Application Layer");
    }

    SECTION("Every entity lands in exactly one cluster") {
        std::multiset<std::string> members;
        for (const auto& cluster : clusters) {
            REQUIRE(std::is_sorted(cluster.entityIds.begin(), cluster.entityIds.end()));
            members.insert(cluster.entityIds.begin(), cluster.entityIds.end());
        }
        REQUIRE(members.size() == entities.size());
        for (const auto& entity : entities) {
            REQUIRE(members.count(entity.name) == 1);
        }
    }

    SECTION("Members of one layer are grouped") {
        auto domain = std::find_if(clusters.begin(), clusters.end(),
            [](const Cluster& c) { return c.name == "Domain Layer"; });
        REQUIRE(domain != clusters.end());
        REQUIRE(domain->entityIds == std::vector<std::string>{"Account", "User"});
    }
}

TEST_CASE("ClusterAssigner handles no entities", "[ClusterAssigner]") {
    REQUIRE(ClusterAssigner::assignClusters({}).empty());
}
