#include "manifest_reader.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <regex>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

std::string trim(const std::string& str) {
    const auto first = str.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = str.find_last_not_of(" \t\r");
    return str.substr(first, last - first + 1);
}

// Drop a trailing `# comment` that is not inside a string
std::string stripComment(const std::string& line) {
    bool inString = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') {
            inString = !inString;
        } else if (line[i] == '#' && !inString) {
            return line.substr(0, i);
        }
    }
    return line;
}

// "[dependencies.serde]" -> "dependencies.serde", "[[bin]]" -> "bin"
std::string sectionName(const std::string& header) {
    std::string name = header;
    name.erase(std::remove(name.begin(), name.end(), '['), name.end());
    name.erase(std::remove(name.begin(), name.end(), ']'), name.end());
    return trim(name);
}

std::vector<std::string> quotedStrings(const std::string& text) {
    static const std::regex quoted(R"re("([^"]*)")re");
    std::vector<std::string> values;

    std::sregex_iterator it(text.begin(), text.end(), quoted);
    std::sregex_iterator end;
    for (; it != end; ++it) {
        values.push_back(it->str(1));
    }
    return values;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        lines.push_back(stripComment(line));
    }
    return lines;
}

std::string readText(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open " + path.string());
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

ManifestReader::ManifestReader(bool verbose)
    : verbose_(verbose) {
}

ManifestInfo ManifestReader::read(const fs::path& projectRoot, const fs::path& metadataFile) const {
    std::string text;
    const fs::path manifestPath = projectRoot / "Cargo.toml";

    std::error_code ec;
    if (fs::is_regular_file(manifestPath, ec)) {
        try {
            text = readText(manifestPath);
        } catch (const std::exception& e) {
            std::cerr << "Warning: Cannot read manifest: " << e.what() << std::endl;
        }
    } else if (verbose_) {
        std::cout << "No Cargo.toml found in " << projectRoot << std::endl;
    }

    if (!metadataFile.empty()) {
        try {
            ManifestInfo info = fromMetadata(json::parse(readText(metadataFile)));
            info.text = text;
            if (verbose_) {
                std::cout << "Loaded metadata for " << info.packageCount << " packages from "
                          << metadataFile << std::endl;
            }
            return info;
        } catch (const std::exception& e) {
            std::cerr << "Warning: Ignoring metadata file " << metadataFile << ": " << e.what() << std::endl;
        }
    }

    return fromManifestText(text, projectRoot);
}

ManifestInfo ManifestReader::fromMetadata(const json& metadata) {
    ManifestInfo info;

    for (const auto& pkg : metadata.at("packages")) {
        PackageInfo package;
        package.name = pkg.at("name").get<std::string>();
        package.version = pkg.value("version", "");

        // description is null for packages without one
        auto description = pkg.find("description");
        if (description != pkg.end() && description->is_string()) {
            package.description = description->get<std::string>();
        }

        auto dependencies = pkg.find("dependencies");
        if (dependencies != pkg.end() && dependencies->is_array()) {
            for (const auto& dep : *dependencies) {
                package.dependencies.push_back(dep.at("name").get<std::string>());
            }
        }

        auto features = pkg.find("features");
        if (features != pkg.end() && features->is_object()) {
            for (auto it = features->begin(); it != features->end(); ++it) {
                package.features.push_back(it.key());
            }
        }

        info.packages.push_back(std::move(package));
    }

    auto members = metadata.find("workspace_members");
    if (members != metadata.end() && members->is_array()) {
        for (const auto& member : *members) {
            if (member.is_string()) {
                info.workspaceMembers.push_back(member.get<std::string>());
            }
        }
    }

    info.packageCount = info.packages.size();
    info.isWorkspace = info.packageCount > 1;
    return info;
}

ManifestInfo ManifestReader::fromManifestText(const std::string& text, const fs::path& projectRoot) {
    ManifestInfo info;
    info.text = text;

    PackageInfo rootPackage;
    bool hasRootPackage = false;
    std::string section;

    static const std::regex keyValue(R"re(^\s*([A-Za-z0-9_\-]+)\s*=\s*(.*)$)re");

    for (const auto& rawLine : splitLines(text)) {
        const std::string line = trim(rawLine);
        if (line.empty()) {
            continue;
        }

        if (line[0] == '[') {
            section = sectionName(line);
            if (section == "package") {
                hasRootPackage = true;
            } else if (section.compare(0, 13, "dependencies.") == 0) {
                rootPackage.dependencies.push_back(section.substr(13));
            }
            continue;
        }

        std::smatch match;
        if (!std::regex_match(line, match, keyValue)) {
            continue;
        }

        const std::string key = match.str(1);
        const std::string value = match.str(2);

        if (section == "package") {
            const auto strings = quotedStrings(value);
            const std::string first = strings.empty() ? "" : strings.front();
            if (key == "name") {
                rootPackage.name = first;
            } else if (key == "version") {
                rootPackage.version = first;
            } else if (key == "description") {
                rootPackage.description = first;
            }
        } else if (section == "dependencies") {
            rootPackage.dependencies.push_back(key);
        } else if (section == "features") {
            rootPackage.features.push_back(key);
        }
    }

    for (const auto& member : parseWorkspaceMembers(text)) {
        if (member == "." && hasRootPackage) {
            continue;
        }
        for (const auto& expanded : expandMember(member, projectRoot)) {
            info.workspaceMembers.push_back(expanded);

            PackageInfo package;
            package.name = fs::path(expanded).filename().string();
            info.packages.push_back(std::move(package));
        }
    }

    if (hasRootPackage) {
        info.packages.insert(info.packages.begin(), std::move(rootPackage));
    }

    info.packageCount = info.packages.size();
    info.isWorkspace = info.packageCount > 1;
    return info;
}

std::vector<std::string> ManifestReader::parseWorkspaceMembers(const std::string& text) {
    std::vector<std::string> members;
    std::string section;

    const auto lines = splitLines(text);
    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string line = trim(lines[i]);
        if (!line.empty() && line[0] == '[' && line.find('=') == std::string::npos) {
            section = sectionName(line);
            continue;
        }

        if (section != "workspace" || line.compare(0, 7, "members") != 0) {
            continue;
        }

        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        // The array may span several lines
        std::string array = line.substr(eq + 1);
        while (array.find(']') == std::string::npos && i + 1 < lines.size()) {
            array += " " + trim(lines[++i]);
        }

        for (auto& member : quotedStrings(array)) {
            members.push_back(std::move(member));
        }
    }

    return members;
}

std::vector<std::string> ManifestReader::expandMember(const std::string& member, const fs::path& projectRoot) {
    const bool isGlob = member.size() >= 2 && member.compare(member.size() - 2, 2, "/*") == 0;
    if (!isGlob) {
        return {member};
    }

    // "crates/*" names every subdirectory holding a Cargo.toml
    const std::string prefix = member.substr(0, member.size() - 2);
    std::vector<std::string> expanded;

    std::error_code ec;
    fs::directory_iterator it(projectRoot / prefix, ec);
    if (ec) {
        return expanded;
    }

    fs::directory_iterator end;
    while (it != end) {
        std::error_code entryEc;
        if (it->is_directory(entryEc) && fs::is_regular_file(it->path() / "Cargo.toml", entryEc)) {
            expanded.push_back(prefix + "/" + it->path().filename().string());
        }

        it.increment(ec);
        if (ec) {
            std::cerr << "Warning: Error while listing " << (projectRoot / prefix) << ": "
                      << ec.message() << std::endl;
            break;
        }
    }

    std::sort(expanded.begin(), expanded.end());
    return expanded;
}

void to_json(json& j, const PackageInfo& package) {
    j = json{
        {"name", package.name},
        {"version", package.version},
        {"description", package.description},
        {"dependencies", package.dependencies},
        {"features", package.features}
    };
}

void to_json(json& j, const ManifestInfo& manifest) {
    j = json{
        {"is_workspace", manifest.isWorkspace},
        {"package_count", manifest.packageCount},
        {"packages", manifest.packages},
        {"workspace_members", manifest.workspaceMembers}
    };
}
