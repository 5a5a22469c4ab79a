#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>
#include "analysis_config.hpp"
#include "metrics.hpp"
#include "parse_result.hpp"
#include "parser_selector.hpp"
#include "scoring.hpp"

namespace fs = std::filesystem;

// A discovered file queued for analysis
struct SourceFile {
    fs::path path;
    std::string relativePath;    // Reported path, relative to the project root
    Language language = Language::Unknown;
};

struct FileAnalysisResult {
    std::string filePath;
    ParseResult parseResult;
    std::vector<MetricResult> metrics;
    double score = 100.0;
};

struct ProjectAnalysisResult {
    std::string projectPath;
    size_t totalFiles = 0;
    size_t analyzedFiles = 0;
    size_t skippedFiles = 0;     // Oversized or unsupported
    size_t failedFiles = 0;      // Read or parse errors
    std::vector<FileAnalysisResult> fileResults;
    std::vector<AggregatedMetric> aggregatedMetrics;
    double overallScore = 100.0;
    long long analysisTimeMs = 0;
};

class FileAnalyzer {
public:
    // Invoked after each file finishes, whether analyzed, skipped or failed
    using ProgressCallback = std::function<void(size_t completed, size_t total)>;

    explicit FileAnalyzer(const RuntimeConfig& config, std::shared_ptr<ParserSelector> selector = nullptr);
    ~FileAnalyzer();

    // Analyze files on a pool of config.concurrency worker threads
    ProjectAnalysisResult analyzeFiles(const std::vector<SourceFile>& files, ProgressCallback progress = nullptr);

    // Read, parse and score one file; std::nullopt when it is skipped for size
    std::optional<FileAnalysisResult> analyzeFile(const SourceFile& file) const;

    // Parse and score in-memory content
    FileAnalysisResult analyzeSource(Language language, const std::string& filePath, const std::string& content) const;

private:
    RuntimeConfig config_;
    std::shared_ptr<ParserSelector> selector_;

    std::vector<std::thread> workers_;
    std::queue<SourceFile> fileQueue_;
    std::vector<FileAnalysisResult> results_;
    std::mutex queueMutex_;
    std::mutex resultsMutex_;
    std::mutex progressMutex_;
    std::atomic<size_t> skipped_{0};
    std::atomic<size_t> failed_{0};
    size_t completed_ = 0;
    size_t total_ = 0;
    ProgressCallback progress_;

    void workerThread();
    void reportProgress();

    std::string readFile(const fs::path& filePath) const;

    static constexpr size_t FILE_BUFFER_SIZE = 64 * 1024;
};
