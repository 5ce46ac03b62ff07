#include "relationship_extractor.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& str) {
    const auto first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

// Last `::` segment of a path ("a::b::C" -> "C", "a::" -> "")
std::string lastSegment(const std::string& path) {
    const auto pos = path.rfind("::");
    return pos == std::string::npos ? path : path.substr(pos + 2);
}

bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

size_t skipSpaces(const std::string& text, size_t pos) {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    return pos;
}

size_t skipWord(const std::string& text, size_t pos) {
    while (pos < text.size() && isWordChar(text[pos])) {
        ++pos;
    }
    return pos;
}

bool hasPrefixAt(const std::string& text, size_t pos, const char* prefix) {
    return text.compare(pos, std::char_traits<char>::length(prefix), prefix) == 0;
}

} // namespace

RelationshipExtractor::RelationshipExtractor()
    : implementsRegex_(R"(\bimpl(?:\s*<[^>]{0,256}>)?\s+(?:\w+::)*(\w+)(?:<[^>]{0,256}>)?\s+for\s+(\w+))"),
      derivesRegex_(R"(#\[derive\(([^)]{1,512})\)\]\s*(?:#\[[^\]]{0,512}\]\s*)*(?:pub(?:\s*\([^)]{0,128}\))?\s+)?(?:struct|enum)\s+(\w+))"),
      modRegex_(R"(\bmod\s+(\w+))"),
      useRegex_(R"(\buse\s+(?:(?:crate|self|super)::)*([A-Za-z_][A-Za-z0-9_:]{0,512})(?:\s*\{([^}]{0,1024})\})?)") {
}

bool RelationshipExtractor::isPrimitive(const std::string& typeName) {
    static const std::unordered_set<std::string> primitives = {
        "str", "String", "usize", "isize",
        "i8", "i16", "i32", "i64", "i128",
        "u8", "u16", "u32", "u64", "u128",
        "f32", "f64", "bool", "char", "Self"
    };
    return primitives.count(typeName) > 0;
}

std::string RelationshipExtractor::fileStem(const std::string& filePath) {
    return fs::path(filePath).stem().string();
}

std::vector<Edge> RelationshipExtractor::extractRelationships(
    const std::string& content,
    const std::string& filePath,
    const std::unordered_set<std::string>& knownEntities
) const {
    std::vector<Edge> edges;

    extractImplements(content, filePath, edges);
    extractDerives(content, filePath, edges);
    extractContains(content, filePath, edges);
    extractUses(content, filePath, knownEntities, edges);
    extractReferences(content, filePath, knownEntities, edges);

    return edges;
}

void RelationshipExtractor::extractImplements(const std::string& content, const std::string& filePath,
                                              std::vector<Edge>& edges) const {
    std::sregex_iterator it(content.begin(), content.end(), implementsRegex_);
    std::sregex_iterator end;

    for (; it != end; ++it) {
        // impl Trait for Type: the type implements the trait
        edges.push_back({it->str(2), it->str(1), RelationshipKind::Implements, filePath});
    }
}

void RelationshipExtractor::extractDerives(const std::string& content, const std::string& filePath,
                                           std::vector<Edge>& edges) const {
    std::sregex_iterator it(content.begin(), content.end(), derivesRegex_);
    std::sregex_iterator end;

    for (; it != end; ++it) {
        const std::string typeName = it->str(2);
        std::stringstream traits(it->str(1));
        std::string trait;

        while (std::getline(traits, trait, ',')) {
            trait = trim(trait);
            if (!trait.empty()) {
                edges.push_back({typeName, trait, RelationshipKind::Derives, filePath});
            }
        }
    }
}

void RelationshipExtractor::extractContains(const std::string& content, const std::string& filePath,
                                            std::vector<Edge>& edges) const {
    // Nested inline modules are not tracked: the file is the only parent scope
    const std::string parent = fileStem(filePath);

    std::sregex_iterator it(content.begin(), content.end(), modRegex_);
    std::sregex_iterator end;

    for (; it != end; ++it) {
        edges.push_back({parent, it->str(1), RelationshipKind::Contains, filePath});
    }
}

void RelationshipExtractor::extractUses(const std::string& content, const std::string& filePath,
                                        const std::unordered_set<std::string>& knownEntities,
                                        std::vector<Edge>& edges) const {
    const std::string moduleName = fileStem(filePath);

    auto addUse = [&](const std::string& imported) {
        if (!imported.empty() && knownEntities.count(imported) > 0) {
            edges.push_back({moduleName, imported, RelationshipKind::Uses, filePath});
        }
    };

    std::sregex_iterator it(content.begin(), content.end(), useRegex_);
    std::sregex_iterator end;

    for (; it != end; ++it) {
        const auto& match = *it;
        addUse(lastSegment(match.str(1)));

        if (!match[2].matched) {
            continue;
        }

        // use a::{B, c::D, E as F}
        std::stringstream items(match.str(2));
        std::string item;
        while (std::getline(items, item, ',')) {
            item.erase(std::remove(item.begin(), item.end(), '{'), item.end());
            item = trim(item);

            const auto asPos = item.find(" as ");
            if (asPos != std::string::npos) {
                item = trim(item.substr(0, asPos));
            }
            addUse(lastSegment(item));
        }
    }
}

void RelationshipExtractor::extractReferences(const std::string& content, const std::string& filePath,
                                              const std::unordered_set<std::string>& knownEntities,
                                              std::vector<Edge>& edges) const {
    size_t pos = 0;
    while (pos < content.size()) {
        if (!isWordChar(content[pos])) {
            ++pos;
            continue;
        }

        const size_t fieldEnd = skipWord(content, pos);
        auto fieldType = matchFieldType(content, fieldEnd);
        if (!fieldType) {
            pos = fieldEnd;
            continue;
        }

        const std::string& typeName = fieldType->first;
        if (knownEntities.count(typeName) > 0 && !isPrimitive(typeName)) {
            edges.push_back({FIELD_USAGE_NODE, typeName, RelationshipKind::References, filePath});
        }
        pos = fieldType->second;
    }
}

std::optional<std::pair<std::string, size_t>> RelationshipExtractor::matchFieldType(const std::string& content,
                                                                                     size_t pos) {
    static const char* const wrappers[] = {"Option<", "Vec<", "Box<", "Arc<", "Rc<"};

    pos = skipSpaces(content, pos);
    if (pos >= content.size() || content[pos] != ':') {
        return std::nullopt;
    }
    pos = skipSpaces(content, pos + 1);

    if (pos < content.size() && content[pos] == '&') {
        ++pos;
    }
    if (hasPrefixAt(content, pos, "mut")) {
        const size_t afterMut = skipSpaces(content, pos + 3);
        if (afterMut > pos + 3 && afterMut < content.size() && isWordChar(content[afterMut])) {
            pos = afterMut;
        }
    }

    // A wrapper applies only when a type name follows it, otherwise the wrapper itself is the type
    for (const char* wrapper : wrappers) {
        const size_t afterWrapper = pos + std::char_traits<char>::length(wrapper);
        if (hasPrefixAt(content, pos, wrapper) && afterWrapper < content.size() && isWordChar(content[afterWrapper])) {
            pos = afterWrapper;
            break;
        }
    }

    const size_t typeEnd = skipWord(content, pos);
    if (typeEnd == pos) {
        return std::nullopt;
    }
    return std::make_pair(content.substr(pos, typeEnd - pos), typeEnd);
}
