#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "report.hpp"

namespace {

FileAnalysisResult fileResult(const std::string& path, Language language, double score, int totalLines,
                              int codeLines, int commentLines) {
    FileAnalysisResult file;
    file.filePath = path;
    file.score = score;
    file.parseResult.filePath = path;
    file.parseResult.language = language;
    file.parseResult.totalLines = totalLines;
    file.parseResult.codeLines = codeLines;
    file.parseResult.commentLines = commentLines;
    return file;
}

FunctionInfo function(const std::string& name, int complexity) {
    FunctionInfo fn;
    fn.name = name;
    fn.complexity = complexity;
    fn.lineCount = 5;
    return fn;
}

ProjectAnalysisResult sampleProject() {
    ProjectAnalysisResult project;
    project.projectPath = "/work/sample";
    project.totalFiles = 4;
    project.analyzedFiles = 3;
    project.skippedFiles = 1;
    project.overallScore = 81.234;

    auto a = fileResult("a.js", Language::JavaScript, 90.0, 100, 80, 10);
    a.parseResult.functions = {function("alpha", 3), function("beta", 9)};
    auto b = fileResult("b.py", Language::Python, 60.0, 300, 200, 20);
    b.parseResult.functions = {function("gamma", 9), function("delta", 12)};
    b.parseResult.errors = {"Syntax error at line 4"};
    auto c = fileResult("c.js", Language::JavaScript, 75.0, 50, 40, 0);

    MetricResult metric;
    metric.name = "nesting_depth";
    metric.normalizedScore = 70.0;
    metric.locations.push_back({"b.py", 12, "delta", "Nesting depth: 6"});
    b.metrics.push_back(metric);

    project.fileResults = {a, b, c};

    AggregatedMetric aggregated;
    aggregated.name = "nesting_depth";
    aggregated.average = 70.0;
    aggregated.min = 70.0;
    aggregated.max = 70.0;
    aggregated.median = 70.0;
    aggregated.weight = 0.32;
    project.aggregatedMetrics.push_back(aggregated);
    return project;
}

} // namespace

TEST_CASE("Project statistics", "[Report]") {
    auto stats = aggregateProjectStats(sampleProject());

    REQUIRE(stats.totalCodeLines == 320);
    REQUIRE(stats.totalCommentLines == 30);
    REQUIRE(stats.totalLines == 450);
    REQUIRE(stats.commentRatio == Catch::Approx(9.375));
    REQUIRE(stats.averageFileLines == 150);
    REQUIRE(stats.largestFile == "b.py");
    REQUIRE(stats.largestFileLines == 300);
    REQUIRE(stats.languageCounts.size() == 2);
    REQUIRE(stats.languageCounts[0].first == "javascript");
    REQUIRE(stats.languageCounts[0].second == 2);

    auto empty = aggregateProjectStats(ProjectAnalysisResult());
    REQUIRE(empty.commentRatio == 0.0);
    REQUIRE(empty.averageFileLines == 0);
    REQUIRE(empty.largestFile.empty());
}

TEST_CASE("Worst functions and files", "[Report]") {
    auto project = sampleProject();

    auto functions = collectWorstFunctions(project, 3);
    REQUIRE(functions.size() == 3);
    REQUIRE(functions[0].name == "delta");
    // Ties keep file order
    REQUIRE(functions[1].name == "beta");
    REQUIRE(functions[2].name == "gamma");
    REQUIRE(functions[2].filePath == "b.py");

    auto files = collectWorstFiles(project, 2);
    REQUIRE(files.size() == 2);
    REQUIRE(files[0]->filePath == "b.py");
    REQUIRE(files[1]->filePath == "c.js");
}

TEST_CASE("JSON report layout", "[Report]") {
    auto report = projectResultToJson(sampleProject());

    REQUIRE(report["projectPath"] == "/work/sample");
    REQUIRE(report["overallScore"].get<double>() == Catch::Approx(81.2));
    REQUIRE(report["summary"]["skippedFiles"] == 1);
    REQUIRE(report["summary"]["failedFiles"] == 0);
    REQUIRE(report["aggregatedMetrics"][0]["category"] == "complexity");
    REQUIRE(report["files"].size() == 3);

    const auto& python = report["files"][1];
    REQUIRE(python["path"] == "b.py");
    REQUIRE(python["parseResult"]["functionCount"] == 2);
    REQUIRE(python["parseResult"]["errors"].size() == 1);
    REQUIRE(report["files"][0]["parseResult"].contains("errors") == false);

    const auto& metric = python["metrics"][0];
    REQUIRE(metric["severity"] == "info");
    REQUIRE(metric["locations"][0]["line"] == 12);
    REQUIRE(metric["locations"][0]["function"] == "delta");
    REQUIRE(metric["locations"][0]["message"] == "Nesting depth: 6");

    MetricResult clean;
    clean.name = "file_length";
    REQUIRE_FALSE(metricResultToJson(clean).contains("locations"));
}

TEST_CASE("Text summary", "[Report]") {
    auto project = sampleProject();

    auto brief = renderSummary(project, 10, false);
    REQUIRE(brief.find("Code quality summary for /work/sample") != std::string::npos);
    REQUIRE(brief.find("Overall score: 81.23 / 100") != std::string::npos);
    REQUIRE(brief.find("Files analyzed: 3 of 4") != std::string::npos);
    REQUIRE(brief.find("Files skipped: 1") != std::string::npos);
    REQUIRE(brief.find("Files failed") == std::string::npos);
    REQUIRE(brief.find("Metrics (average score):") != std::string::npos);
    REQUIRE(brief.find("Project overview:") == std::string::npos);
    REQUIRE(brief.find("b.py") < brief.find("c.js"));

    auto verbose = renderSummary(project, 1, true);
    REQUIRE(verbose.find("Project overview:") != std::string::npos);
    REQUIRE(verbose.find("Largest file: b.py (300 lines)") != std::string::npos);
    REQUIRE(verbose.find("Most complex functions:") != std::string::npos);
    REQUIRE(verbose.find("delta (b.py): complexity 12") != std::string::npos);
    REQUIRE(verbose.find("alpha") == std::string::npos);
}
