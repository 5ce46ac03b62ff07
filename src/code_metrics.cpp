#include "code_metrics.hpp"

using json = nlohmann::json;

void CodeMetrics::addFile(const std::string& content) {
    ++files;

    size_t start = 0;
    while (true) {
        const auto newline = content.find('\n', start);
        const std::string line = content.substr(start, newline == std::string::npos ? std::string::npos
                                                                                    : newline - start);
        ++lines;

        const auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos) {
            ++blanks;
        } else if (line.compare(first, 2, "//") == 0 || line.compare(first, 2, "/*") == 0) {
            ++comments;
        } else {
            ++code;
        }

        if (newline == std::string::npos) {
            break;
        }
        start = newline + 1;
    }
}

CodeMetrics CodeMetrics::collect(const std::vector<SourceScanner::ScannedFile>& files) {
    CodeMetrics metrics;
    for (const auto& file : files) {
        metrics.addFile(file.content);
    }
    return metrics;
}

void to_json(json& j, const CodeMetrics& metrics) {
    j = json{
        {"lines", metrics.lines},
        {"code", metrics.code},
        {"comments", metrics.comments},
        {"blanks", metrics.blanks},
        {"rust_files", metrics.files}
    };
}
