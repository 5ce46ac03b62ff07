#include "source_scanner.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <cstdint>

namespace {

constexpr const char* REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

bool isContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

SourceScanner::SourceScanner(const PatternMatcher& patternMatcher, bool verbose)
    : patternMatcher_(patternMatcher),
      verbose_(verbose) {
}

fs::path SourceScanner::resolveSourceRoot(const fs::path& projectRoot) {
    std::error_code ec;
    const fs::path srcDir = projectRoot / "src";
    if (fs::is_directory(srcDir, ec)) {
        return srcDir;
    }
    return projectRoot;
}

std::vector<SourceScanner::ScannedFile> SourceScanner::scanProject(const fs::path& projectRoot) {
    if (projectRoot.empty()) {
        throw std::invalid_argument("Project path must not be empty");
    }

    std::error_code ec;
    if (!fs::is_directory(projectRoot, ec)) {
        throw std::runtime_error("Invalid project directory: " + projectRoot.string());
    }

    failedFiles_ = 0;
    std::vector<ScannedFile> results;

    const fs::path sourceRoot = resolveSourceRoot(projectRoot);
    auto candidates = collectFiles(sourceRoot, projectRoot);

    if (verbose_) {
        std::cout << "Found " << candidates.size() << " source files under " << sourceRoot << std::endl;
    }

    results.reserve(candidates.size());
    for (const auto& [filePath, relativePath] : candidates) {
        ScannedFile file = scanFile(filePath, projectRoot);

        if (!file.processed) {
            ++failedFiles_;
            std::cerr << "Warning: Skipping " << relativePath << ": " << file.error << std::endl;
            continue;
        }

        if (file.hadInvalidUtf8 && verbose_) {
            std::cout << "Replaced invalid UTF-8 bytes in " << relativePath << std::endl;
        }

        results.push_back(std::move(file));
    }

    return results;
}

std::vector<std::pair<fs::path, std::string>> SourceScanner::collectFiles(const fs::path& sourceRoot,
                                                                          const fs::path& projectRoot) const {
    std::vector<std::pair<fs::path, std::string>> files;

    std::error_code ec;
    fs::recursive_directory_iterator it(sourceRoot, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        std::cerr << "Warning: Cannot read directory " << sourceRoot << ": " << ec.message() << std::endl;
        return files;
    }

    fs::recursive_directory_iterator end;
    while (it != end) {
        const auto& entry = *it;
        std::error_code entryEc;

        if (entry.is_directory(entryEc)) {
            // Do not descend into build output or version control
            const auto name = entry.path().filename().string();
            if (name == "target" || name == ".git") {
                it.disable_recursion_pending();
            }
        } else if (entry.is_regular_file(entryEc)) {
            const fs::path relative = entry.path().lexically_relative(projectRoot);
            if (patternMatcher_.shouldProcess(relative)) {
                files.emplace_back(entry.path(), relative.generic_string());
            }
        }

        it.increment(ec);
        if (ec) {
            std::cerr << "Warning: Error while walking " << sourceRoot << ": " << ec.message() << std::endl;
            break;
        }
    }

    // Stable processing order
    std::sort(files.begin(), files.end(),
        [](const auto& a, const auto& b) { return a.second < b.second; });

    return files;
}

SourceScanner::ScannedFile SourceScanner::scanFile(const fs::path& filePath, const fs::path& projectRoot) const {
    ScannedFile result;
    result.path = filePath;
    result.relativePath = filePath.lexically_relative(projectRoot).generic_string();

    std::error_code ec;
    if (!fs::is_regular_file(filePath, ec)) {
        result.error = "File does not exist or is not a regular file";
        return result;
    }

    auto fileSize = fs::file_size(filePath, ec);
    if (ec) {
        result.error = "Error getting file size: " + ec.message();
        return result;
    }

    if (fileSize > MAX_FILE_SIZE) {
        result.error = "File too large, skipping";
        result.skipped = true;
        return result;
    }

    try {
        const std::string bytes = readFile(filePath);
        result.byteSize = bytes.size();
        result.content = decodeUtf8Lossy(bytes, &result.hadInvalidUtf8);
        result.lineCount = countLines(result.content);
        result.processed = true;
    } catch (const std::exception& e) {
        result.error = std::string("Error reading file: ") + e.what();
    }

    return result;
}

std::string SourceScanner::readFile(const fs::path& filePath) const {
    std::ifstream file(filePath, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + filePath.string());
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Failed to read file: " + filePath.string());
    }

    return buffer.str();
}

std::string SourceScanner::decodeUtf8Lossy(const std::string& bytes, bool* replaced) {
    std::string out;
    out.reserve(bytes.size());
    bool anyReplaced = false;

    const size_t n = bytes.size();
    size_t i = 0;
    while (i < n) {
        const auto c = static_cast<unsigned char>(bytes[i]);

        if (c < 0x80) {
            out += static_cast<char>(c);
            ++i;
            continue;
        }

        size_t length = 0;
        uint32_t codePoint = 0;
        if ((c & 0xE0) == 0xC0) {
            length = 2;
            codePoint = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            length = 3;
            codePoint = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            length = 4;
            codePoint = c & 0x07;
        }

        bool valid = length > 0 && i + length <= n;
        for (size_t k = 1; valid && k < length; ++k) {
            const auto next = static_cast<unsigned char>(bytes[i + k]);
            if (!isContinuation(next)) {
                valid = false;
            } else {
                codePoint = (codePoint << 6) | (next & 0x3F);
            }
        }

        if (valid) {
            // Reject overlong encodings, surrogates and out-of-range values
            if ((length == 2 && codePoint < 0x80) ||
                (length == 3 && codePoint < 0x800) ||
                (length == 4 && codePoint < 0x10000) ||
                (codePoint >= 0xD800 && codePoint <= 0xDFFF) ||
                codePoint > 0x10FFFF) {
                valid = false;
            }
        }

        if (valid) {
            out.append(bytes, i, length);
            i += length;
        } else {
            out += REPLACEMENT_CHARACTER;
            anyReplaced = true;
            ++i;
        }
    }

    if (replaced) {
        *replaced = anyReplaced;
    }
    return out;
}

size_t SourceScanner::countLines(const std::string& content) {
    size_t count = std::count(content.begin(), content.end(), '\n');

    // If the last line doesn't end with a newline, count it too
    if (!content.empty() && content.back() != '\n') {
        ++count;
    }

    return count;
}
