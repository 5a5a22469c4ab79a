#include "report.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>

ProjectStats aggregateProjectStats(const ProjectAnalysisResult& result) {
    ProjectStats stats;
    std::map<std::string, size_t> languages;

    for (const auto& file : result.fileResults) {
        const ParseResult& parsed = file.parseResult;
        stats.totalCodeLines += parsed.codeLines;
        stats.totalCommentLines += parsed.commentLines;
        stats.totalLines += parsed.totalLines;

        if (parsed.totalLines > stats.largestFileLines) {
            stats.largestFileLines = parsed.totalLines;
            stats.largestFile = file.filePath;
        }
        if (parsed.language != Language::Unknown) {
            ++languages[languageToString(parsed.language)];
        }
    }

    if (stats.totalCodeLines > 0) {
        stats.commentRatio = static_cast<double>(stats.totalCommentLines) / stats.totalCodeLines * 100.0;
    }
    if (!result.fileResults.empty()) {
        stats.averageFileLines = std::llround(static_cast<double>(stats.totalLines) / result.fileResults.size());
    }

    stats.languageCounts.assign(languages.begin(), languages.end());
    std::stable_sort(stats.languageCounts.begin(), stats.languageCounts.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    return stats;
}

std::vector<RankedFunction> collectWorstFunctions(const ProjectAnalysisResult& result, size_t limit) {
    std::vector<RankedFunction> ranked;
    for (const auto& file : result.fileResults) {
        for (const auto& fn : file.parseResult.functions) {
            ranked.push_back({fn.name, file.filePath, fn.complexity, fn.nestingDepth, fn.lineCount});
        }
    }

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const RankedFunction& a, const RankedFunction& b) { return a.complexity > b.complexity; });
    if (ranked.size() > limit) {
        ranked.resize(limit);
    }
    return ranked;
}

std::vector<const FileAnalysisResult*> collectWorstFiles(const ProjectAnalysisResult& result, size_t limit) {
    std::vector<const FileAnalysisResult*> files;
    files.reserve(result.fileResults.size());
    for (const auto& file : result.fileResults) {
        files.push_back(&file);
    }

    std::stable_sort(files.begin(), files.end(),
                     [](const FileAnalysisResult* a, const FileAnalysisResult* b) { return a->score < b->score; });
    if (files.size() > limit) {
        files.resize(limit);
    }
    return files;
}

json metricResultToJson(const MetricResult& metric) {
    json j = {
        {"name", metric.name},
        {"category", categoryToString(metric.category)},
        {"value", metric.value},
        {"normalizedScore", metric.normalizedScore},
        {"severity", severityToString(metric.severity)},
        {"details", metric.details}
    };

    json locations = json::array();
    for (const auto& location : metric.locations) {
        json entry = {{"line", location.line}};
        if (!location.functionName.empty()) {
            entry["function"] = location.functionName;
        }
        if (!location.message.empty()) {
            entry["message"] = location.message;
        }
        locations.push_back(entry);
    }
    if (!locations.empty()) {
        j["locations"] = locations;
    }
    return j;
}

json projectResultToJson(const ProjectAnalysisResult& result) {
    json report;
    report["projectPath"] = result.projectPath;
    report["overallScore"] = roundScore(result.overallScore);
    report["summary"] = {
        {"totalFiles", result.totalFiles},
        {"analyzedFiles", result.analyzedFiles},
        {"skippedFiles", result.skippedFiles},
        {"failedFiles", result.failedFiles},
        {"analysisTimeMs", result.analysisTimeMs}
    };

    json aggregated = json::array();
    for (const auto& metric : result.aggregatedMetrics) {
        aggregated.push_back({
            {"name", metric.name},
            {"category", categoryToString(metric.category)},
            {"average", roundScore(metric.average)},
            {"min", roundScore(metric.min)},
            {"max", roundScore(metric.max)},
            {"median", roundScore(metric.median)},
            {"weight", metric.weight}
        });
    }
    report["aggregatedMetrics"] = aggregated;

    json files = json::array();
    for (const auto& file : result.fileResults) {
        json metrics = json::array();
        for (const auto& metric : file.metrics) {
            metrics.push_back(metricResultToJson(metric));
        }

        const ParseResult& parsed = file.parseResult;
        json parseSummary = {
            {"language", languageToString(parsed.language)},
            {"totalLines", parsed.totalLines},
            {"codeLines", parsed.codeLines},
            {"commentLines", parsed.commentLines},
            {"blankLines", parsed.blankLines},
            {"functionCount", parsed.functions.size()},
            {"classCount", parsed.classes.size()},
            {"importCount", parsed.imports.size()}
        };
        if (!parsed.errors.empty()) {
            parseSummary["errors"] = parsed.errors;
        }

        files.push_back({
            {"path", file.filePath},
            {"score", roundScore(file.score)},
            {"metrics", metrics},
            {"parseResult", parseSummary}
        });
    }
    report["files"] = files;
    return report;
}

std::string renderSummary(const ProjectAnalysisResult& result, size_t top, bool verbose) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);

    ss << "Code quality summary for " << result.projectPath << std::endl;
    ss << "  Overall score: " << result.overallScore << " / 100" << std::endl;
    ss << "  Files analyzed: " << result.analyzedFiles << " of " << result.totalFiles << std::endl;
    if (result.skippedFiles > 0) {
        ss << "  Files skipped: " << result.skippedFiles << std::endl;
    }
    if (result.failedFiles > 0) {
        ss << "  Files failed: " << result.failedFiles << std::endl;
    }
    ss << "  Analysis time: " << result.analysisTimeMs << " ms" << std::endl;

    if (verbose) {
        const ProjectStats stats = aggregateProjectStats(result);
        ss << std::endl << "Project overview:" << std::endl;
        ss << "  Code lines: " << stats.totalCodeLines << std::endl;
        ss << "  Comment lines: " << stats.totalCommentLines << std::endl;
        ss << "  Comment ratio: " << stats.commentRatio << "%" << std::endl;
        ss << "  Average file size: " << stats.averageFileLines << " lines" << std::endl;
        if (!stats.largestFile.empty()) {
            ss << "  Largest file: " << stats.largestFile << " (" << stats.largestFileLines << " lines)"
               << std::endl;
        }
        for (const auto& language : stats.languageCounts) {
            ss << "  " << language.first << ": " << language.second << " files" << std::endl;
        }
    }

    if (!result.aggregatedMetrics.empty()) {
        ss << std::endl << "Metrics (average score):" << std::endl;
        for (const auto& metric : result.aggregatedMetrics) {
            ss << "  " << std::left << std::setw(24) << metric.name << std::right << std::setw(7) << metric.average
               << "  (min " << metric.min << ", max " << metric.max << ")" << std::endl;
        }
    }

    const auto worstFiles = collectWorstFiles(result, top);
    if (!worstFiles.empty()) {
        ss << std::endl << "Lowest scoring files:" << std::endl;
        for (const FileAnalysisResult* file : worstFiles) {
            ss << "  " << std::setw(7) << file->score << "  " << file->filePath << std::endl;
        }
    }

    if (verbose) {
        const auto worstFunctions = collectWorstFunctions(result, top);
        if (!worstFunctions.empty()) {
            ss << std::endl << "Most complex functions:" << std::endl;
            for (const auto& fn : worstFunctions) {
                ss << "  " << fn.name << " (" << fn.filePath << "): complexity " << fn.complexity << ", nesting "
                   << fn.nestingDepth << ", " << fn.lineCount << " lines" << std::endl;
            }
        }
    }
    return ss.str();
}
