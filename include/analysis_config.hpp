#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

// Category weights; each in [0, 1], conceptually summing to 1.0
struct MetricWeights {
    double complexity = 0.32;       // Cyclomatic, cognitive and nesting each
    double duplication = 0.20;
    double size = 0.18;             // Function length, file length and parameters each
    double structure = 0.12;
    double error = 0.08;
    double documentation = 0.05;
    double naming = 0.05;
};

struct RuntimeConfig {
    fs::path projectPath;
    unsigned int concurrency = 2;        // Worker threads, 1-32
    bool verbose = false;
    MetricWeights weights;
    std::vector<std::string> include;    // Glob patterns; empty means every file
    std::vector<std::string> exclude;    // Glob patterns added to the built-in ignores
    fs::path grammarDir;                 // Extra directory searched for grammar libraries
    size_t maxFileSizeKB = 500;          // Larger files are skipped
    size_t summaryTop = 10;              // Worst files listed in the text summary
};

// Name of the per-project config file looked up in the project root
constexpr const char* CONFIG_FILE_NAME = ".codegaugerc.json";

// Config file in the project root, or an empty path when there is none
fs::path findConfigFile(const fs::path& projectPath);

// Read a JSON config file over the defaults in base.
// Throws std::runtime_error for unreadable or malformed files and
// std::invalid_argument for out-of-range values.
RuntimeConfig loadRuntimeConfig(const fs::path& configPath, RuntimeConfig base = RuntimeConfig());

// Range checks shared by the file loader and the command line
void validateRuntimeConfig(const RuntimeConfig& config);

// "a, b,c" -> {"a", "b", "c"}; empty segments are dropped
std::vector<std::string> splitPatternList(const std::string& patterns);
