#include <iostream>
#include <CLI/CLI.hpp>
#include "analysis_config.hpp"
#include "codegauge.hpp"

int main(int argc, char** argv) {
    try {
        CLI::App app{"codegauge - Score the maintainability of a source tree"};

        fs::path inputDir;
        fs::path configPath;
        fs::path outputFile;
        fs::path grammarDir;
        std::string includePatterns;
        std::string excludePatterns;
        unsigned int threads = 0;
        size_t top = 0;
        bool verbose = false;
        bool quiet = false;

        // Required project directory
        app.add_option("-i,--input", inputDir, "Project directory to analyze (required)")
            ->required()
            ->check(CLI::ExistingDirectory);

        // Optional config file; defaults to .codegaugerc.json in the project
        app.add_option("-c,--config", configPath, "JSON config file")
            ->check(CLI::ExistingFile);

        app.add_option("-o,--output", outputFile, "Write the JSON report to this file");

        app.add_option("--include", includePatterns,
                       "Comma-separated list of glob patterns for files to include (e.g. src/**,*.py)");
        app.add_option("--exclude", excludePatterns,
                       "Comma-separated list of glob patterns for files to exclude (e.g. *_test.go,gen/**)");

        app.add_option("--threads", threads, "Number of worker threads (default: 2)")
            ->check(CLI::Range(1u, 32u));

        app.add_option("--grammar-dir", grammarDir, "Directory holding tree-sitter grammar libraries")
            ->check(CLI::ExistingDirectory);

        app.add_option("--top", top, "Number of lowest scoring files listed in the summary (default: 10)")
            ->check(CLI::Range(static_cast<size_t>(1), static_cast<size_t>(1000)));

        app.add_flag("-v,--verbose", verbose, "Enable verbose output");
        app.add_flag("-q,--quiet", quiet, "Only write the JSON report");

        CLI11_PARSE(app, argc, argv);

        if (configPath.empty()) {
            configPath = findConfigFile(inputDir);
        }

        // Config file first, command line on top
        RuntimeConfig config;
        if (!configPath.empty()) {
            config = loadRuntimeConfig(configPath);
        }
        config.projectPath = inputDir;
        if (threads > 0) {
            config.concurrency = threads;
        }
        if (top > 0) {
            config.summaryTop = top;
        }
        if (!grammarDir.empty()) {
            config.grammarDir = grammarDir;
        }
        if (verbose) {
            config.verbose = true;
        }
        for (const auto& pattern : splitPatternList(includePatterns)) {
            config.include.push_back(pattern);
        }
        for (const auto& pattern : splitPatternList(excludePatterns)) {
            config.exclude.push_back(pattern);
        }
        validateRuntimeConfig(config);

        if (config.verbose && !configPath.empty()) {
            std::cout << "Using config file: " << configPath << std::endl;
        }

        Codegauge codegauge(config);
        if (!codegauge.run()) {
            return 1;
        }

        if (!outputFile.empty()) {
            codegauge.writeJsonReport(outputFile);
        } else if (quiet) {
            std::cout << codegauge.getJsonReport() << std::endl;
        }

        if (!quiet) {
            std::cout << codegauge.getSummary();
        }

        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
