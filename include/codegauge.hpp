#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <memory>
#include "analysis_config.hpp"
#include "file_analyzer.hpp"
#include "pattern_matcher.hpp"

namespace fs = std::filesystem;

// Walks a project, analyzes every supported source file and renders the results
class Codegauge {
public:
    explicit Codegauge(const RuntimeConfig& config, std::shared_ptr<ParserSelector> selector = nullptr);

    // Discover and analyze; returns false when the run could not complete
    bool run();

    // Files that pass the ignore/include rules and have a known language.
    // Also counts files rejected for an unknown language.
    std::vector<SourceFile> discoverFiles();

    const ProjectAnalysisResult& getResult() const { return result_; }

    // Pretty-printed JSON report of the last run
    std::string getJsonReport() const;

    // Plain-text summary of the last run
    std::string getSummary() const;

    // Write the JSON report; throws std::runtime_error when the file cannot be written
    void writeJsonReport(const fs::path& outputFile) const;

private:
    RuntimeConfig config_;
    std::unique_ptr<PatternMatcher> patternMatcher_;
    std::unique_ptr<FileAnalyzer> fileAnalyzer_;
    ProjectAnalysisResult result_;

    size_t scannedFiles_ = 0;
    size_t unsupportedFiles_ = 0;
};
