#pragma once

#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "file_analyzer.hpp"

using json = nlohmann::json;

// Line totals across the analyzed files
struct ProjectStats {
    long long totalCodeLines = 0;
    long long totalCommentLines = 0;
    long long totalLines = 0;
    double commentRatio = 0.0;              // Comment lines per code line, in percent
    long long averageFileLines = 0;
    std::string largestFile;
    int largestFileLines = 0;
    std::vector<std::pair<std::string, size_t>> languageCounts;  // Most common first
};

struct RankedFunction {
    std::string name;
    std::string filePath;
    int complexity = 0;
    int nestingDepth = 0;
    int lineCount = 0;
};

ProjectStats aggregateProjectStats(const ProjectAnalysisResult& result);

// Functions across all files, highest complexity first
std::vector<RankedFunction> collectWorstFunctions(const ProjectAnalysisResult& result, size_t limit = 10);

// Files with the lowest scores first
std::vector<const FileAnalysisResult*> collectWorstFiles(const ProjectAnalysisResult& result, size_t limit = 10);

json metricResultToJson(const MetricResult& metric);
json projectResultToJson(const ProjectAnalysisResult& result);

// Plain-text report; verbose adds line statistics and the most complex functions
std::string renderSummary(const ProjectAnalysisResult& result, size_t top, bool verbose);
