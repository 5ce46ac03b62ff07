#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <filesystem>
#include "pattern_matcher.hpp"

namespace fs = std::filesystem;

// Enumerates and reads the source files of a project.
//
// Files are collected under the source root (<project>/src when it exists,
// otherwise the project root), filtered by the PatternMatcher using paths
// relative to the project root, and returned sorted by that relative path.
class SourceScanner {
public:
    struct ScannedFile {
        fs::path path;                  // Absolute or caller-relative path on disk
        std::string relativePath;       // Path relative to the project root, '/' separated
        std::string content;            // UTF-8 text, invalid bytes replaced by U+FFFD
        size_t lineCount = 0;
        size_t byteSize = 0;
        bool hadInvalidUtf8 = false;    // Content needed lossy decoding
        bool processed = false;         // Read successfully
        bool skipped = false;           // Deliberately not read (too large)
        std::string error;              // Error message if reading failed
    };

    explicit SourceScanner(const PatternMatcher& patternMatcher, bool verbose = false);

    // Scan a project. Throws std::invalid_argument for an empty path and
    // std::runtime_error when the path is not a directory. Unreadable files are
    // skipped with a warning.
    std::vector<ScannedFile> scanProject(const fs::path& projectRoot);

    // Read a single file; failures are reported through ScannedFile::error
    ScannedFile scanFile(const fs::path& filePath, const fs::path& projectRoot) const;

    // Number of files that matched but could not be read in the last scan
    size_t failedFileCount() const { return failedFiles_; }

    static fs::path resolveSourceRoot(const fs::path& projectRoot);

    // Decode bytes as UTF-8, replacing each invalid sequence with U+FFFD
    static std::string decodeUtf8Lossy(const std::string& bytes, bool* replaced = nullptr);

    static size_t countLines(const std::string& content);

private:
    const PatternMatcher& patternMatcher_;
    bool verbose_;
    size_t failedFiles_ = 0;

    // Collect candidate files as (path, relative path) pairs
    std::vector<std::pair<fs::path, std::string>> collectFiles(const fs::path& sourceRoot,
                                                               const fs::path& projectRoot) const;

    std::string readFile(const fs::path& filePath) const;

    // Maximum file size to read (10 MB)
    static constexpr uintmax_t MAX_FILE_SIZE = 10 * 1024 * 1024;
};
