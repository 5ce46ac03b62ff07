#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

struct PackageInfo {
    std::string name;
    std::string version;
    std::string description;
    std::vector<std::string> dependencies;
    std::vector<std::string> features;
};

// Package and workspace metadata of a project
struct ManifestInfo {
    std::string text;                           // Raw Cargo.toml, empty if absent
    bool isWorkspace = false;                   // More than one package
    size_t packageCount = 0;
    std::vector<PackageInfo> packages;
    std::vector<std::string> workspaceMembers;
};

// Reads Cargo.toml, optionally enriched by `cargo metadata --format-version 1`
// output that the caller saved to a file. Never runs cargo itself.
class ManifestReader {
public:
    explicit ManifestReader(bool verbose = false);

    // Missing or unreadable files degrade to an empty ManifestInfo
    ManifestInfo read(const fs::path& projectRoot, const fs::path& metadataFile = fs::path()) const;

    // Build from parsed metadata JSON. Throws nlohmann::json::exception on
    // documents without the expected shape.
    static ManifestInfo fromMetadata(const nlohmann::json& metadata);

    // Build from manifest text alone
    static ManifestInfo fromManifestText(const std::string& text, const fs::path& projectRoot);

    // Entries of `members = [...]` in the [workspace] section
    static std::vector<std::string> parseWorkspaceMembers(const std::string& text);

private:
    bool verbose_;

    static std::vector<std::string> expandMember(const std::string& member, const fs::path& projectRoot);
};

void to_json(nlohmann::json& j, const PackageInfo& package);
void to_json(nlohmann::json& j, const ManifestInfo& manifest);
