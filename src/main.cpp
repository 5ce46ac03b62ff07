#include <iostream>
#include <fstream>
#include <CLI/CLI.hpp>
#include "archlens.hpp"
#include "pattern_comparison.hpp"

int main(int argc, char** argv) {
    try {
        CLI::App app{"ArchLens - Recover architecture knowledge from a Rust source tree"};
        app.require_subcommand(1);

        // analyze: full pipeline on one project
        ArchLensOptions options;
        auto analyzeCmd = app.add_subcommand("analyze", "Extract entities, relationships, patterns and indexes");

        analyzeCmd->add_option("-i,--input", options.inputDir, "Project directory (required)")
            ->required();
        analyzeCmd->add_option("-o,--output", options.outputDir,
                               "Output directory for the JSON files (default: archlens-output)");
        analyzeCmd->add_option("--metadata", options.metadataFile,
                               "Saved output of `cargo metadata --format-version 1`");
        analyzeCmd->add_option("--signatures", options.signaturesFile,
                               "Custom signature catalog (JSON)");
        analyzeCmd->add_option("--exclude", options.excludePatterns,
                               "Comma-separated list of glob patterns for files to exclude (e.g. generated/**,*_pb.rs)");
        analyzeCmd->add_flag("--include-tests", options.includeTests,
                             "Also analyze test, bench and example code");
        analyzeCmd->add_flag("-v,--verbose", options.verbose, "Enable verbose output");
        analyzeCmd->add_flag("-t,--timing", options.showTiming, "Show detailed timing information");

        // compare: detection across several projects
        std::vector<std::string> comparePaths;
        std::string compareOutput;
        ComparisonOptions compareOptions;
        auto compareCmd = app.add_subcommand("compare", "Compare detected patterns across projects");

        compareCmd->add_option("-i,--input", comparePaths, "Project directories (repeatable)")
            ->required();
        compareCmd->add_option("-o,--output", compareOutput, "Write the comparison JSON to this file");
        compareCmd->add_option("--signatures", compareOptions.signaturesFile, "Custom signature catalog (JSON)");
        compareCmd->add_flag("--include-tests", compareOptions.includeTests,
                             "Also analyze test, bench and example code");
        compareCmd->add_flag("-v,--verbose", compareOptions.verbose, "Enable verbose output");

        // Parse command line arguments
        CLI11_PARSE(app, argc, argv);

        if (*analyzeCmd) {
            ArchLens lens(options);
            if (!lens.run()) {
                return 1;
            }

            std::cout << lens.getSummary();
            if (options.showTiming) {
                std::cout << lens.getTimingInfo();
            }
            return 0;
        }

        std::vector<fs::path> projects(comparePaths.begin(), comparePaths.end());
        nlohmann::json comparison = comparePatterns(projects, compareOptions);

        if (compareOutput.empty()) {
            std::cout << comparison.dump(2) << std::endl;
        } else {
            std::ofstream outFile(compareOutput);
            if (!outFile) {
                std::cerr << "Error: Could not open output file: " << compareOutput << std::endl;
                return 1;
            }
            outFile << comparison.dump(2) << std::endl;
            if (compareOptions.verbose) {
                std::cout << "Comparison written to " << compareOutput << std::endl;
            }
        }

        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
