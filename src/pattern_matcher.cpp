#include "pattern_matcher.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

PatternMatcher::PatternMatcher()
    : sourceExtensions_{".rs"} {
    // Version control and build output
    addIgnorePattern(".git/**");
    addIgnorePattern("target/**");

    // Test, bench and example code is excluded unless requested
    for (const char* rule : {"/tests/", "/test/", "/benches/", "/bench/", "/examples/", "/example/",
                             "_test.rs", "_tests.rs", "_bench.rs", "/fuzz/", "/stress/"}) {
        addExclusionRule(rule);
    }
}

PatternMatcher::PatternMatcher(const std::vector<std::string>& ignorePatterns)
    : PatternMatcher() {

    for (const auto& pattern : ignorePatterns) {
        addIgnorePattern(pattern);
    }
}

void PatternMatcher::addIgnorePattern(const std::string& pattern) {
    ignorePatterns_.push_back(pattern);
    ignoreRegexes_.push_back(patternToRegex(pattern));
}

void PatternMatcher::setExcludePatterns(const std::string& patternsStr) {
    for (const auto& pattern : splitPatternString(patternsStr)) {
        addIgnorePattern(pattern);
    }
}

void PatternMatcher::addExclusionRule(const std::string& substring) {
    if (!substring.empty()) {
        exclusionRules_.push_back(substring);
    }
}

std::vector<std::string> PatternMatcher::splitPatternString(const std::string& patternsStr) const {
    std::vector<std::string> patterns;
    std::stringstream ss(patternsStr);
    std::string pattern;

    while (std::getline(ss, pattern, ',')) {
        // Trim whitespace
        pattern.erase(pattern.begin(), std::find_if(pattern.begin(), pattern.end(),
            [](unsigned char ch) { return !std::isspace(ch); }));
        pattern.erase(std::find_if(pattern.rbegin(), pattern.rend(),
            [](unsigned char ch) { return !std::isspace(ch); }).base(), pattern.end());

        if (!pattern.empty()) {
            patterns.push_back(pattern);
        }
    }

    return patterns;
}

std::string PatternMatcher::toGenericString(const fs::path& path) {
    std::string str = path.generic_string();
    // Leading "./" would defeat anchored patterns
    while (str.size() >= 2 && str[0] == '.' && str[1] == '/') {
        str.erase(0, 2);
    }
    return str;
}

bool PatternMatcher::shouldProcess(const fs::path& relativePath) const {
    if (!isSourceFile(relativePath)) {
        return false;
    }

    if (isIgnored(relativePath)) {
        return false;
    }

    if (!includeTests_ && isTestPath(relativePath)) {
        return false;
    }

    return true;
}

bool PatternMatcher::isIgnored(const fs::path& relativePath) const {
    const auto pathStr = toGenericString(relativePath);

    // Any "target" directory component is build output
    for (const auto& part : relativePath.parent_path()) {
        if (part == "target") {
            return true;
        }
    }

    for (size_t i = 0; i < ignorePatterns_.size(); ++i) {
        const auto& pattern = ignorePatterns_[i];
        const auto& regex = ignoreRegexes_[i];

        if (std::regex_match(pathStr, regex)) {
            return true;
        }

        // Extension-only patterns like "*.rs.bk" apply to the filename at any depth
        if (pattern.size() >= 2 && pattern[0] == '*' && pattern.find('/') == std::string::npos) {
            const std::string filename = relativePath.filename().string();
            if (std::regex_match(filename, regex)) {
                return true;
            }
        }
    }

    return false;
}

bool PatternMatcher::isTestPath(const fs::path& relativePath) const {
    // Prefix with "/" so rules like "/tests/" also match a top-level tests directory
    const std::string pathStr = "/" + toGenericString(relativePath);

    for (const auto& rule : exclusionRules_) {
        if (pathStr.find(rule) != std::string::npos) {
            return true;
        }
    }

    return false;
}

bool PatternMatcher::isSourceFile(const fs::path& relativePath) const {
    const std::string extension = relativePath.extension().string();
    return std::find(sourceExtensions_.begin(), sourceExtensions_.end(), extension) != sourceExtensions_.end();
}

std::regex PatternMatcher::patternToRegex(const std::string& pattern) const {
    std::string regexStr = "^";

    size_t start = 0;
    if (!pattern.empty() && pattern[0] == '/') {
        // Leading slash anchors at the project root, which relative paths already are
        start = 1;
    }

    for (size_t i = start; i < pattern.size(); ++i) {
        const char c = pattern[i];

        if (c == '*') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
                if (i + 2 < pattern.size() && pattern[i + 2] == '/') {
                    // **/ matches any directory depth, including none
                    regexStr += "(?:.*/)?";
                    i += 2;
                } else {
                    regexStr += ".*";
                    i++;
                }
            } else {
                // * matches any character except directory separator
                regexStr += "[^/]*";
            }
        } else if (c == '?') {
            regexStr += "[^/]";
        } else if (c == '.' || c == '(' || c == ')' || c == '[' || c == ']' || c == '{' ||
                   c == '}' || c == '+' || c == '^' || c == '$' || c == '|' || c == '\\') {
            regexStr += '\\';
            regexStr += c;
        } else {
            regexStr += c;
        }
    }

    // A trailing slash names a directory and everything under it
    if (!pattern.empty() && pattern.back() == '/') {
        regexStr += ".*";
    }
    regexStr += "$";

    return std::regex(regexStr);
}
