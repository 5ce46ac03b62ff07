#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "source_scanner.hpp"

// Line counts over the scanned source files
struct CodeMetrics {
    size_t files = 0;
    size_t lines = 0;
    size_t code = 0;
    size_t comments = 0;
    size_t blanks = 0;

    // Classify each '\n'-separated line of one file as blank, comment or code
    void addFile(const std::string& content);

    static CodeMetrics collect(const std::vector<SourceScanner::ScannedFile>& files);
};

void to_json(nlohmann::json& j, const CodeMetrics& metrics);
