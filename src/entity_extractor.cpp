#include "entity_extractor.hpp"
#include <algorithm>
#include <sstream>

namespace {

// Optional visibility qualifier captured as group 1
const std::string VISIBILITY_PREFIX = R"((?:\b(pub(?:\s*\([^)]{0,128}\))?)\s+)?)";

// Qualifiers that may sit between visibility and `fn`
const std::string FN_QUALIFIERS = R"((?:(?:const|async|unsafe)\s+|extern\s+"[^"]{0,64}"\s+)*)";

// Declaration keyword at the start of a line, used to find the item a doc block documents
const std::regex DOCUMENTED_DECLARATION(
    R"(^\s*(?:pub(?:\s*\([^)]{0,128}\))?\s+)?(?:(?:const|async|unsafe)\s+|extern\s+"[^"]{0,64}"\s+)*)"
    R"((?:struct|enum|trait|fn|mod|type|const|static)\s+(?:mut\s+)?(\w+))");

std::string trim(const std::string& str) {
    const auto first = str.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = str.find_last_not_of(" \t\r");
    return str.substr(first, last - first + 1);
}

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.compare(0, prefix.size(), prefix) == 0;
}

// Cut to at most maxLength bytes without splitting a UTF-8 sequence
std::string truncateUtf8(const std::string& str, size_t maxLength) {
    if (str.size() <= maxLength) {
        return str;
    }
    size_t cut = maxLength;
    while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return str.substr(0, cut);
}

} // namespace

// Factory method implementation
std::unique_ptr<EntityExtractor> EntityExtractor::create(const ExtractionOptions& options) {
    return std::make_unique<RegexEntityExtractor>(options);
}

LineIndex::LineIndex(const std::string& content) {
    lineStarts_.push_back(0);
    for (size_t i = 0; i < content.size(); ++i) {
        if (content[i] == '\n') {
            lineStarts_.push_back(i + 1);
        }
    }
}

size_t LineIndex::lineAt(size_t offset) const {
    auto it = std::upper_bound(lineStarts_.begin(), lineStarts_.end(), offset);
    return static_cast<size_t>(it - lineStarts_.begin());
}

RegexEntityExtractor::RegexEntityExtractor(const ExtractionOptions& options)
    : options_(options),
      patterns_(buildPatternTable()) {
}

std::vector<RegexEntityExtractor::DeclarationPattern> RegexEntityExtractor::buildPatternTable() {
    std::vector<DeclarationPattern> table;

    // Visibility-aware declarations: group 1 = qualifier, group 2 = name
    table.push_back({EntityKind::Struct, std::regex(VISIBILITY_PREFIX + R"(\bstruct\s+(\w+))"), true});
    table.push_back({EntityKind::Enum, std::regex(VISIBILITY_PREFIX + R"(\benum\s+(\w+))"), true});
    table.push_back({EntityKind::Trait, std::regex(VISIBILITY_PREFIX + R"((?:unsafe\s+)?\btrait\s+(\w+))"), true});
    table.push_back({EntityKind::Function, std::regex(VISIBILITY_PREFIX + FN_QUALIFIERS + R"(\bfn\s+(\w+))"), true});
    table.push_back({EntityKind::Module, std::regex(VISIBILITY_PREFIX + R"(\bmod\s+(\w+))"), true});
    table.push_back({EntityKind::TypeAlias, std::regex(VISIBILITY_PREFIX + R"(\btype\s+(\w+))"), true});
    table.push_back({EntityKind::Const, std::regex(VISIBILITY_PREFIX + R"(\bconst\s+(\w+)\s*:)"), true});
    table.push_back({EntityKind::Static, std::regex(VISIBILITY_PREFIX + R"(\bstatic\s+(?:mut\s+)?(\w+)\s*:)"), true});

    // impl blocks carry no visibility: group 1 = the implemented name
    table.push_back({EntityKind::Impl, std::regex(R"(\bimpl(?:\s*<[^>]{0,256}>)?\s+(\w+))"), false});

    return table;
}

Visibility RegexEntityExtractor::parseVisibility(const std::string& qualifier) {
    static const std::regex pubIn(R"(^pub\s*\(\s*in\s+)");
    static const std::regex pubSelf(R"(^pub\s*\(\s*self\s*\))");
    static const std::regex pubSuper(R"(^pub\s*\(\s*super\s*\))");
    static const std::regex pubCrate(R"(^pub\s*\(\s*crate\s*\))");

    const std::string vis = trim(qualifier);

    // Most specific qualifier wins
    if (std::regex_search(vis, pubIn)) {
        return Visibility::PubIn;
    }
    if (std::regex_search(vis, pubSelf)) {
        return Visibility::PubSelf;
    }
    if (std::regex_search(vis, pubSuper)) {
        return Visibility::PubSuper;
    }
    if (std::regex_search(vis, pubCrate)) {
        return Visibility::PubCrate;
    }
    if (startsWith(vis, "pub")) {
        return Visibility::Pub;
    }
    return Visibility::Private;
}

std::vector<Entity> RegexEntityExtractor::extractEntities(
    const std::string& content,
    const std::string& filePath
) const {
    struct Candidate {
        size_t offset;
        Entity entity;
    };

    std::vector<Candidate> candidates;
    LineIndex lines(content);

    for (const auto& pattern : patterns_) {
        std::sregex_iterator it(content.begin(), content.end(), pattern.regex);
        std::sregex_iterator end;

        for (; it != end; ++it) {
            const auto& match = *it;
            const size_t nameGroup = pattern.hasVisibility ? 2 : 1;
            if (match.size() <= nameGroup || !match[nameGroup].matched) {
                continue;
            }

            std::string name = match.str(nameGroup);
            if (options_.noiseNames.count(name) > 0) {
                continue;
            }

            Entity entity;
            entity.name = std::move(name);
            entity.kind = pattern.kind;
            entity.visibility = (pattern.hasVisibility && match[1].matched)
                ? parseVisibility(match.str(1))
                : Visibility::Private;
            entity.module = filePath;

            const auto offset = static_cast<size_t>(match.position(0));
            entity.line = lines.lineAt(offset);

            candidates.push_back({offset, std::move(entity)});
        }
    }

    // File order; ties keep pattern-table order
    std::stable_sort(candidates.begin(), candidates.end(),
        [](const Candidate& a, const Candidate& b) { return a.offset < b.offset; });

    std::vector<Entity> entities;
    entities.reserve(candidates.size());
    for (auto& candidate : candidates) {
        entities.push_back(std::move(candidate.entity));
    }

    if (options_.attachDocs && !entities.empty()) {
        attachDocs(entities, content);
    }

    return entities;
}

std::vector<RegexEntityExtractor::DocBlock> RegexEntityExtractor::extractDocBlocks(const std::string& content) const {
    std::vector<std::string> lines;
    {
        std::istringstream iss(content);
        std::string line;
        while (std::getline(iss, line)) {
            lines.push_back(line);
        }
    }

    std::vector<DocBlock> blocks;
    size_t i = 0;
    while (i < lines.size()) {
        const std::string trimmed = trim(lines[i]);
        std::vector<std::string> textLines;
        const size_t startIndex = i;

        if ((startsWith(trimmed, "///") && !startsWith(trimmed, "////")) || startsWith(trimmed, "//!")) {
            // Contiguous line doc comments
            while (i < lines.size()) {
                const std::string t = trim(lines[i]);
                if (!((startsWith(t, "///") && !startsWith(t, "////")) || startsWith(t, "//!"))) {
                    break;
                }
                textLines.push_back(trim(t.substr(3)));
                ++i;
            }
        } else if (startsWith(trimmed, "/**") && !startsWith(trimmed, "/**/")) {
            // Block doc comment, possibly spanning lines
            std::string body = trimmed.substr(3);
            while (true) {
                const auto close = body.find("*/");
                std::string part = close == std::string::npos ? body : body.substr(0, close);
                part = trim(part);
                if (startsWith(part, "*")) {
                    part = trim(part.substr(1));
                }
                textLines.push_back(part);
                ++i;
                if (close != std::string::npos || i >= lines.size()) {
                    break;
                }
                body = trim(lines[i]);
            }
        } else {
            ++i;
            continue;
        }

        DocBlock block;
        block.startLine = startIndex + 1;

        std::string text;
        for (const auto& textLine : textLines) {
            if (textLine.empty()) {
                continue;
            }
            if (!text.empty()) {
                text += "\n";
            }
            text += textLine;
        }
        block.text = truncateUtf8(text, options_.maxDocLength);

        // Find the declaration the block documents: skip blank and attribute lines
        const size_t endLine = i;  // 1-based line of the block's last line
        for (size_t j = i; j < lines.size() && j + 1 - endLine <= options_.docWindowLines; ++j) {
            const std::string next = trim(lines[j]);
            if (next.empty() || startsWith(next, "#[")) {
                continue;
            }
            std::smatch match;
            if (std::regex_search(next, match, DOCUMENTED_DECLARATION)) {
                block.declaredName = match.str(1);
            }
            break;
        }

        if (!block.text.empty() && !block.declaredName.empty()) {
            blocks.push_back(std::move(block));
        }
    }

    return blocks;
}

void RegexEntityExtractor::attachDocs(std::vector<Entity>& entities, const std::string& content) const {
    for (const auto& block : extractDocBlocks(content)) {
        for (auto& entity : entities) {
            if (entity.doc || entity.name != block.declaredName) {
                continue;
            }
            const size_t distance = entity.line > block.startLine
                ? entity.line - block.startLine
                : block.startLine - entity.line;
            if (distance <= options_.docWindowLines) {
                entity.doc = block.text;
                break;
            }
        }
    }
}
