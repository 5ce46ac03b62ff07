#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

// Decides which files under a project root are analyzed.
//
// Three rule sets are applied to paths relative to the project root:
// glob ignore patterns (gitignore-like), path-substring exclusion rules for
// test/bench/example code, and source extensions.
class PatternMatcher {
public:
    // Default constructor with default ignore and exclusion rules
    PatternMatcher();

    // Constructor with additional ignore patterns
    explicit PatternMatcher(const std::vector<std::string>& ignorePatterns);

    // Add a glob ignore pattern
    void addIgnorePattern(const std::string& pattern);

    // Add ignore patterns from a comma-separated string (e.g., "generated/**,*_pb.rs")
    void setExcludePatterns(const std::string& patternsStr);

    // Add a path-substring exclusion rule
    void addExclusionRule(const std::string& substring);

    // Enable or disable the test/bench/example exclusion rules
    void setIncludeTests(bool includeTests) { includeTests_ = includeTests; }

    // Check if a relative path should be analyzed
    bool shouldProcess(const fs::path& relativePath) const;

    // Check if a relative path matches any glob ignore pattern
    bool isIgnored(const fs::path& relativePath) const;

    // Check if a relative path is test/bench/example code
    bool isTestPath(const fs::path& relativePath) const;

    // Check if the file extension is a source extension
    bool isSourceFile(const fs::path& relativePath) const;

    const std::vector<std::string>& exclusionRules() const { return exclusionRules_; }

private:
    std::vector<std::string> ignorePatterns_;
    std::vector<std::regex> ignoreRegexes_;
    std::vector<std::string> exclusionRules_;
    std::vector<std::string> sourceExtensions_;
    bool includeTests_ = false;

    // Helper methods
    std::regex patternToRegex(const std::string& pattern) const;
    std::vector<std::string> splitPatternString(const std::string& patternsStr) const;
    static std::string toGenericString(const fs::path& path);
};
