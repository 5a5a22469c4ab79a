#include "codegauge.hpp"
#include "report.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>

Codegauge::Codegauge(const RuntimeConfig& config, std::shared_ptr<ParserSelector> selector)
    : config_(config) {

    patternMatcher_ = std::make_unique<PatternMatcher>();

    // Root .gitignore; nested ones are picked up during the walk
    const auto gitignorePath = config_.projectPath / ".gitignore";
    if (fs::exists(gitignorePath)) {
        patternMatcher_->loadGitignore(gitignorePath);
    }

    if (!config_.exclude.empty()) {
        patternMatcher_->addIgnorePatterns(config_.exclude);
        if (config_.verbose) {
            std::cout << "Using " << config_.exclude.size() << " exclude pattern(s)" << std::endl;
        }
    }

    if (!config_.include.empty()) {
        patternMatcher_->addIncludePatterns(config_.include);
        if (config_.verbose) {
            std::cout << "Using " << config_.include.size() << " include pattern(s)" << std::endl;
        }
    }

    fileAnalyzer_ = std::make_unique<FileAnalyzer>(config_, std::move(selector));
}

std::vector<SourceFile> Codegauge::discoverFiles() {
    std::vector<SourceFile> files;
    scannedFiles_ = 0;
    unsupportedFiles_ = 0;

    std::error_code ec;
    fs::recursive_directory_iterator it(config_.projectPath, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw std::runtime_error("Cannot read directory " + config_.projectPath.string() + ": " + ec.message());
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            std::cerr << "Warning: " << ec.message() << std::endl;
            ec.clear();
            continue;
        }

        const fs::path relative = it->path().lexically_relative(config_.projectPath);

        if (it->is_directory(ec)) {
            if (patternMatcher_->isIgnoredDirectory(relative)) {
                it.disable_recursion_pending();
                continue;
            }
            const fs::path nestedIgnore = it->path() / ".gitignore";
            if (fs::is_regular_file(nestedIgnore, ec)) {
                patternMatcher_->loadGitignore(nestedIgnore, relative.generic_string());
            }
            continue;
        }

        if (!it->is_regular_file(ec) || !patternMatcher_->shouldProcess(relative)) {
            continue;
        }

        ++scannedFiles_;
        const Language language = detectLanguage(it->path());
        if (language == Language::Unknown) {
            ++unsupportedFiles_;
            continue;
        }
        files.push_back({it->path(), relative.generic_string(), language});
    }

    std::sort(files.begin(), files.end(),
              [](const SourceFile& a, const SourceFile& b) { return a.relativePath < b.relativePath; });
    return files;
}

bool Codegauge::run() {
    try {
        auto startTime = std::chrono::steady_clock::now();

        if (config_.verbose) {
            std::cout << "Analyzing directory: " << config_.projectPath << std::endl;
        }

        const auto files = discoverFiles();

        if (config_.verbose) {
            std::cout << "Found " << files.size() << " source files (" << unsupportedFiles_
                      << " unsupported)" << std::endl;
        }

        FileAnalyzer::ProgressCallback progress;
        if (config_.verbose) {
            progress = [](size_t completed, size_t total) {
                std::cout << "\rAnalyzed " << completed << "/" << total << std::flush;
                if (completed == total) {
                    std::cout << std::endl;
                }
            };
        }

        result_ = fileAnalyzer_->analyzeFiles(files, progress);
        result_.projectPath = config_.projectPath.string();
        result_.totalFiles = scannedFiles_;
        result_.skippedFiles += unsupportedFiles_;

        auto endTime = std::chrono::steady_clock::now();
        result_.analysisTimeMs = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime).count();
        return true;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return false;
    }
}

std::string Codegauge::getJsonReport() const {
    return projectResultToJson(result_).dump(2);
}

std::string Codegauge::getSummary() const {
    return renderSummary(result_, config_.summaryTop, config_.verbose);
}

void Codegauge::writeJsonReport(const fs::path& outputFile) const {
    std::ofstream outFile(outputFile);
    if (!outFile) {
        throw std::runtime_error("Could not open output file: " + outputFile.string());
    }
    outFile << getJsonReport() << std::endl;
    if (!outFile) {
        throw std::runtime_error("Failed to write output file: " + outputFile.string());
    }
    if (config_.verbose) {
        std::cout << "Report written to " << outputFile << std::endl;
    }
}
