#include "signature.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

const char* DEFAULT_CATALOG_VERSION = "1";

Signature makeSignature(const std::string& name,
                        const std::vector<std::string>& keywords,
                        const std::vector<std::string>& imports,
                        const std::vector<std::string>& patterns,
                        const std::vector<std::string>& traits,
                        const std::string& description = "") {
    Signature signature;
    signature.name = name;
    signature.description = description;

    for (const auto& keyword : keywords) {
        signature.evidence.push_back(Evidence::keyword(keyword));
    }
    for (const auto& imp : imports) {
        signature.evidence.push_back(Evidence::import(imp));
    }
    for (const auto& pattern : patterns) {
        signature.evidence.push_back(Evidence::pattern(pattern));
    }
    for (const auto& trait : traits) {
        signature.evidence.push_back(Evidence::trait(trait));
    }

    return signature;
}

std::vector<std::string> stringList(const json& object, const char* key) {
    std::vector<std::string> values;
    auto it = object.find(key);
    if (it == object.end() || !it->is_array()) {
        return values;
    }
    for (const auto& value : *it) {
        if (value.is_string()) {
            values.push_back(value.get<std::string>());
        }
    }
    return values;
}

Signature signatureFromJson(const json& object) {
    Signature signature;
    signature.name = object.value("name", "");
    signature.description = object.value("description", "");

    for (const auto& keyword : stringList(object, "keywords")) {
        signature.evidence.push_back(Evidence::keyword(keyword));
    }
    for (const auto& imp : stringList(object, "imports")) {
        signature.evidence.push_back(Evidence::import(imp));
    }
    for (const auto& pattern : stringList(object, "patterns")) {
        try {
            signature.evidence.push_back(Evidence::pattern(pattern));
        } catch (const std::regex_error& e) {
            std::cerr << "Warning: Dropping invalid pattern '" << pattern << "' in signature '"
                      << signature.name << "': " << e.what() << std::endl;
        }
    }
    for (const auto& trait : stringList(object, "traits")) {
        signature.evidence.push_back(Evidence::trait(trait));
    }

    return signature;
}

std::vector<Signature> signaturesFromJson(const json& document, const char* key,
                                          const std::vector<Signature>& fallback) {
    auto it = document.find(key);
    if (it == document.end()) {
        return fallback;
    }
    if (!it->is_array()) {
        std::cerr << "Warning: Catalog section '" << key << "' is not an array, using defaults" << std::endl;
        return fallback;
    }

    std::vector<Signature> signatures;
    for (const auto& entry : *it) {
        if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
            std::cerr << "Warning: Skipping unnamed signature in '" << key << "'" << std::endl;
            continue;
        }
        signatures.push_back(signatureFromJson(entry));
    }
    return signatures;
}

} // namespace

Evidence Evidence::keyword(const std::string& value) {
    return {EvidenceKind::Keyword, value, defaultWeight(EvidenceKind::Keyword), nullptr};
}

Evidence Evidence::import(const std::string& value) {
    return {EvidenceKind::Import, value, defaultWeight(EvidenceKind::Import), nullptr};
}

Evidence Evidence::trait(const std::string& value) {
    return {EvidenceKind::Trait, value, defaultWeight(EvidenceKind::Trait), nullptr};
}

Evidence Evidence::pattern(const std::string& value) {
    return {EvidenceKind::Pattern, value, defaultWeight(EvidenceKind::Pattern),
            std::make_shared<const std::regex>(value)};
}

int Evidence::defaultWeight(EvidenceKind kind) {
    // Imports are the strongest signal
    return kind == EvidenceKind::Import ? 2 : 1;
}

bool Evidence::matches(const std::string& corpus, const std::string& manifest) const {
    switch (kind) {
        case EvidenceKind::Keyword:
        case EvidenceKind::Trait:
            return corpus.find(value) != std::string::npos;
        case EvidenceKind::Import:
            return manifest.find(value) != std::string::npos ||
                   corpus.find("use " + value) != std::string::npos;
        case EvidenceKind::Pattern:
            return regex && std::regex_search(corpus, *regex);
    }
    return false;
}

std::string Evidence::describe() const {
    if (kind == EvidenceKind::Pattern) {
        return "pattern: " + value.substr(0, 30) + "...";
    }
    return toString(kind) + ": " + value;
}

std::vector<std::string> Signature::values(EvidenceKind kind) const {
    std::vector<std::string> result;
    for (const auto& item : evidence) {
        if (item.kind == kind) {
            result.push_back(item.value);
        }
    }
    return result;
}

SignatureCatalog SignatureCatalog::defaults() {
    SignatureCatalog catalog;
    catalog.version = DEFAULT_CATALOG_VERSION;

    // Design patterns: name, keywords, imports, patterns, traits
    catalog.designPatterns = {
        makeSignature("Tower Service",
            {"ServiceBuilder", "tower::"},
            {"tower", "tower_http", "tower_service"},
            {},
            {"Service<Request>", "tower::Service"}),
        makeSignature("Actor Model",
            {"Addr<", "Handler<", "Recipient<"},
            {"actix", "actix_web", "xactor", "ractor"},
            {}, {}),
        makeSignature("ECS (Entity-Component-System)",
            {"Query<", "Commands", "Res<", "ResMut<"},
            {"bevy_ecs", "specs", "legion", "hecs"},
            {}, {}),
        makeSignature("Type-State",
            {}, {},
            {R"(struct\s+\w+<\w+>)", R"(impl\s+\w+<\w+>)", R"(fn\s+\w+\(self\)\s*->\s*\w+<\w+>)"},
            {}),
        makeSignature("Builder",
            {"Builder", "build()", "with_", "set_"},
            {},
            {R"(fn\s+builder\s*\()", R"(fn\s+build\s*\(self\))", R"(fn\s+with_\w+\s*\(self)"},
            {}),
        makeSignature("Error Handling (thiserror)",
            {},
            {"thiserror"},
            {R"(#\[derive\([^)]{0,512}Error[^)]{0,512}\)\])"},
            {}),
        makeSignature("Error Handling (anyhow)",
            {".context(", "anyhow!", "bail!"},
            {"anyhow"},
            {}, {}),
        makeSignature("Async/Await Runtime",
            {"#[tokio::main]", "#[async_std::main]", "async fn", ".await"},
            {"tokio", "async_std", "smol"},
            {}, {}),
        makeSignature("CRDT",
            {"CRDT", "Replica", "Merge", "conflictfree"},
            {"crdt", "yrs", "automerge"},
            {}, {}),
    };

    // Architecture styles are keyword-only; the first two are decided by
    // workspace shape and carry no evidence
    catalog.architectureStyles = {
        makeSignature("Modular Monolith", {}, {}, {}, {},
            "Single crate with well-organized internal modules by domain"),
        makeSignature("Multi-Crate Workspace", {}, {}, {}, {},
            "Multiple crates in a workspace, each with specific responsibility"),
        makeSignature("Plugin Architecture",
            {"plugin", "Plugin", "add_plugin", "PluginGroup"}, {}, {}, {},
            "Core system with extensible plugin-based functionality"),
        makeSignature("Hexagonal/Ports-Adapters",
            {"port", "adapter", "domain", "infrastructure", "Storage", "Backend"}, {}, {}, {},
            "Domain logic separated from infrastructure through traits (pluggable storage)"),
        makeSignature("Event-Driven",
            {"Event", "EventReader", "EventWriter", "on_event", "emit"}, {}, {}, {},
            "Components communicate through events and messages"),
        makeSignature("Actor Model",
            {"actix", "xactor", "ractor", "Addr<", "Handler<"}, {}, {}, {},
            "Concurrent computation using actors with message mailboxes"),
        makeSignature("Reactor/Proactor",
            {"Future", "Poll::", "Waker", "async fn", ".await", "executor"}, {}, {}, {},
            "Async I/O with event loop (Tokio, async-std style)"),
        makeSignature("Work-Stealing Scheduler",
            {"work_steal", "multi_thread", "Runtime::new", "tokio::runtime"}, {}, {}, {},
            "Load-balanced task scheduling across worker threads"),
        makeSignature("ECS (Entity-Component-System)",
            {"bevy_ecs", "specs", "legion", "hecs", "World", "Query<"}, {}, {}, {},
            "Data-oriented design with entities, components, and systems"),
    };

    catalog.communicationPatterns = {
        makeSignature("Channel-based (tokio)",
            {"tokio::sync::mpsc", "tokio::sync::oneshot", "tokio::sync::broadcast"}, {}, {}, {}),
        makeSignature("Channel-based (crossbeam)",
            {"crossbeam-channel", "crossbeam::channel"}, {}, {}, {}),
        makeSignature("Shared State (Mutex)",
            {"Arc<Mutex", "Mutex<", "std::sync::Mutex"}, {}, {}, {}),
        makeSignature("Shared State (RwLock)",
            {"Arc<RwLock", "RwLock<", "std::sync::RwLock"}, {}, {}, {}),
        makeSignature("Async Channels",
            {"async_channel", "flume"}, {}, {}, {}),
        makeSignature("Message Passing",
            {"actix", "xactor", "ractor"}, {}, {}, {}),
    };

    return catalog;
}

SignatureCatalog SignatureCatalog::fromJson(const json& document) {
    if (!document.is_object()) {
        throw std::runtime_error("Signature catalog must be a JSON object");
    }

    const SignatureCatalog builtin = defaults();

    SignatureCatalog catalog;
    catalog.version = document.contains("version") && document["version"].is_string()
        ? document["version"].get<std::string>()
        : builtin.version;
    catalog.designPatterns = signaturesFromJson(document, "design_patterns", builtin.designPatterns);
    catalog.architectureStyles = signaturesFromJson(document, "architecture_styles", builtin.architectureStyles);
    catalog.communicationPatterns = signaturesFromJson(document, "communication_patterns",
                                                       builtin.communicationPatterns);

    return catalog;
}

SignatureCatalog SignatureCatalog::loadFile(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open signature catalog: " + path.string());
    }

    try {
        json document;
        file >> document;
        return fromJson(document);
    } catch (const json::exception& e) {
        throw std::runtime_error("Failed to parse signature catalog " + path.string() + ": " + e.what());
    }
}

const Signature* SignatureCatalog::find(const std::vector<Signature>& signatures, const std::string& name) {
    for (const auto& signature : signatures) {
        if (signature.name == name) {
            return &signature;
        }
    }
    return nullptr;
}

std::string toString(EvidenceKind kind) {
    switch (kind) {
        case EvidenceKind::Keyword: return "keyword";
        case EvidenceKind::Import:  return "import";
        case EvidenceKind::Pattern: return "pattern";
        case EvidenceKind::Trait:   return "trait";
    }
    return "keyword";
}

void to_json(json& j, const Signature& signature) {
    j = json{
        {"name", signature.name},
        {"keywords", signature.values(EvidenceKind::Keyword)},
        {"imports", signature.values(EvidenceKind::Import)},
        {"patterns", signature.values(EvidenceKind::Pattern)},
        {"traits", signature.values(EvidenceKind::Trait)}
    };
    if (!signature.description.empty()) {
        j["description"] = signature.description;
    }
}

void to_json(json& j, const SignatureCatalog& catalog) {
    j = json{
        {"version", catalog.version},
        {"design_patterns", catalog.designPatterns},
        {"architecture_styles", catalog.architectureStyles},
        {"communication_patterns", catalog.communicationPatterns}
    };
}
