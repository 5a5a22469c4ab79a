#include "file_analyzer.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>

FileAnalyzer::FileAnalyzer(const RuntimeConfig& config, std::shared_ptr<ParserSelector> selector)
    : config_(config), selector_(std::move(selector)) {
    if (config_.concurrency == 0) {
        config_.concurrency = 1;
    }
    if (!selector_) {
        selector_ = std::make_shared<ParserSelector>(ParserSelector::treeSitterFactory(config_.grammarDir));
    }
}

FileAnalyzer::~FileAnalyzer() {
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

ProjectAnalysisResult FileAnalyzer::analyzeFiles(const std::vector<SourceFile>& files, ProgressCallback progress) {
    auto startTime = std::chrono::steady_clock::now();

    // Reset state
    fileQueue_ = std::queue<SourceFile>();
    results_.clear();
    skipped_ = 0;
    failed_ = 0;
    completed_ = 0;
    total_ = files.size();
    progress_ = std::move(progress);

    for (const auto& file : files) {
        fileQueue_.push(file);
    }

    if (!fileQueue_.empty()) {
        unsigned int actualThreads = std::min(config_.concurrency, static_cast<unsigned int>(fileQueue_.size()));
        workers_.clear();

        for (unsigned int i = 0; i < actualThreads; ++i) {
            try {
                workers_.emplace_back(&FileAnalyzer::workerThread, this);
            } catch (const std::system_error& e) {
                std::cerr << "Warning: Could not create worker thread: " << e.what() << std::endl;
                break;
            }
        }

        // Without any worker the calling thread drains the queue itself
        if (workers_.empty()) {
            std::cerr << "Warning: Falling back to single-threaded analysis" << std::endl;
            workerThread();
        }

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
    }

    ProjectAnalysisResult project;
    project.projectPath = config_.projectPath.string();
    project.totalFiles = files.size();
    project.skippedFiles = skipped_;
    project.failedFiles = failed_;
    project.fileResults = std::move(results_);
    results_.clear();

    // Workers finish in any order
    std::sort(project.fileResults.begin(), project.fileResults.end(),
              [](const FileAnalysisResult& a, const FileAnalysisResult& b) { return a.filePath < b.filePath; });
    project.analyzedFiles = project.fileResults.size();

    std::vector<std::vector<MetricResult>> perFileMetrics;
    std::vector<std::pair<double, double>> weightedScores;
    perFileMetrics.reserve(project.fileResults.size());
    weightedScores.reserve(project.fileResults.size());
    for (const auto& fileResult : project.fileResults) {
        perFileMetrics.push_back(fileResult.metrics);
        weightedScores.emplace_back(fileResult.score, static_cast<double>(fileResult.parseResult.codeLines));
    }
    project.aggregatedMetrics = aggregateMetrics(perFileMetrics, config_.weights);
    project.overallScore = overallScore(weightedScores);

    auto endTime = std::chrono::steady_clock::now();
    project.analysisTimeMs = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime).count();
    return project;
}

void FileAnalyzer::workerThread() {
    while (true) {
        SourceFile file;

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (fileQueue_.empty()) {
                return;
            }
            file = fileQueue_.front();
            fileQueue_.pop();
        }

        // Analyze outside the lock
        try {
            auto result = analyzeFile(file);
            if (result) {
                std::lock_guard<std::mutex> lock(resultsMutex_);
                results_.push_back(std::move(*result));
            } else {
                ++skipped_;
            }
        } catch (const std::exception& e) {
            std::cerr << "Error analyzing file " << file.relativePath << ": " << e.what() << std::endl;
            ++failed_;
        }

        reportProgress();
    }
}

void FileAnalyzer::reportProgress() {
    std::lock_guard<std::mutex> lock(progressMutex_);
    ++completed_;
    if (progress_) {
        progress_(completed_, total_);
    }
}

std::optional<FileAnalysisResult> FileAnalyzer::analyzeFile(const SourceFile& file) const {
    std::error_code ec;
    uintmax_t fileSize = fs::file_size(file.path, ec);
    if (ec) {
        throw std::runtime_error("Error getting file size: " + ec.message());
    }

    if (fileSize > config_.maxFileSizeKB * 1024) {
        std::cerr << "Warning: Skipping large file " << file.relativePath << " (" << fileSize / 1024 << " KB)"
                  << std::endl;
        return std::nullopt;
    }

    const std::string reportedPath = file.relativePath.empty() ? file.path.string() : file.relativePath;
    return analyzeSource(file.language, reportedPath, readFile(file.path));
}

FileAnalysisResult FileAnalyzer::analyzeSource(Language language, const std::string& filePath,
                                               const std::string& content) const {
    FileAnalysisResult result;
    result.filePath = filePath;
    result.parseResult = selector_->parse(language, filePath, content);
    result.parseResult.content = content;

    for (const auto& metric : createMetrics(language)) {
        result.metrics.push_back(metric->calculate(result.parseResult));
    }
    result.score = calculateScore(result.metrics, config_.weights);
    return result;
}

std::string FileAnalyzer::readFile(const fs::path& filePath) const {
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + filePath.string());
    }

    std::string content;
    std::vector<char> buffer(FILE_BUFFER_SIZE);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        content.append(buffer.data(), static_cast<size_t>(file.gcount()));
    }
    if (file.bad()) {
        throw std::runtime_error("Failed to read file: " + filePath.string());
    }
    return content;
}
