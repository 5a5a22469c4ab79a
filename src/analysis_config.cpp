#include "analysis_config.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

void readWeight(const json& weights, const char* key, double& target) {
    if (!weights.contains(key)) {
        return;
    }
    if (!weights[key].is_number()) {
        throw std::invalid_argument(std::string("metrics.weights.") + key + " must be a number");
    }
    target = weights[key].get<double>();
}

std::vector<std::string> readPatterns(const json& value, const char* key) {
    if (!value.is_array()) {
        throw std::invalid_argument(std::string(key) + " must be an array of glob patterns");
    }
    std::vector<std::string> patterns;
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw std::invalid_argument(std::string(key) + " must be an array of glob patterns");
        }
        patterns.push_back(item.get<std::string>());
    }
    return patterns;
}

void checkWeight(const char* name, double value) {
    if (value < 0.0 || value > 1.0) {
        throw std::invalid_argument(std::string("Weight ") + name + " must be between 0 and 1");
    }
}

} // namespace

fs::path findConfigFile(const fs::path& projectPath) {
    fs::path candidate = projectPath / CONFIG_FILE_NAME;
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec)) {
        return candidate;
    }
    return fs::path();
}

RuntimeConfig loadRuntimeConfig(const fs::path& configPath, RuntimeConfig base) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + configPath.string());
    }

    json root;
    try {
        file >> root;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + configPath.string() + ": " + e.what());
    }
    if (!root.is_object()) {
        throw std::runtime_error("Config file " + configPath.string() + " must contain a JSON object");
    }

    try {
        if (root.contains("concurrency")) {
            int concurrency = root["concurrency"].get<int>();
            if (concurrency < 1 || concurrency > 32) {
                throw std::invalid_argument("concurrency must be between 1 and 32");
            }
            base.concurrency = static_cast<unsigned int>(concurrency);
        }
        if (root.contains("verbose")) {
            base.verbose = root["verbose"].get<bool>();
        }
        if (root.contains("include")) {
            base.include = readPatterns(root["include"], "include");
        }
        if (root.contains("exclude")) {
            base.exclude = readPatterns(root["exclude"], "exclude");
        }
        if (root.contains("grammarDir")) {
            base.grammarDir = root["grammarDir"].get<std::string>();
        }
        if (root.contains("maxFileSizeKB")) {
            int maxSize = root["maxFileSizeKB"].get<int>();
            if (maxSize < 1) {
                throw std::invalid_argument("maxFileSizeKB must be positive");
            }
            base.maxFileSizeKB = static_cast<size_t>(maxSize);
        }
        if (root.contains("output") && root["output"].contains("top")) {
            int top = root["output"]["top"].get<int>();
            if (top < 1) {
                throw std::invalid_argument("output.top must be at least 1");
            }
            base.summaryTop = static_cast<size_t>(top);
        }
        if (root.contains("metrics") && root["metrics"].contains("weights")) {
            const json& weights = root["metrics"]["weights"];
            readWeight(weights, "complexity", base.weights.complexity);
            readWeight(weights, "duplication", base.weights.duplication);
            readWeight(weights, "size", base.weights.size);
            readWeight(weights, "structure", base.weights.structure);
            readWeight(weights, "error", base.weights.error);
            readWeight(weights, "documentation", base.weights.documentation);
            readWeight(weights, "naming", base.weights.naming);
        }
    } catch (const json::type_error& e) {
        throw std::invalid_argument("Invalid value in " + configPath.string() + ": " + e.what());
    }

    validateRuntimeConfig(base);
    return base;
}

void validateRuntimeConfig(const RuntimeConfig& config) {
    if (config.concurrency < 1 || config.concurrency > 32) {
        throw std::invalid_argument("concurrency must be between 1 and 32");
    }
    checkWeight("complexity", config.weights.complexity);
    checkWeight("duplication", config.weights.duplication);
    checkWeight("size", config.weights.size);
    checkWeight("structure", config.weights.structure);
    checkWeight("error", config.weights.error);
    checkWeight("documentation", config.weights.documentation);
    checkWeight("naming", config.weights.naming);
}

std::vector<std::string> splitPatternList(const std::string& patterns) {
    std::vector<std::string> result;
    std::stringstream ss(patterns);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t start = item.find_first_not_of(" \t");
        size_t end = item.find_last_not_of(" \t");
        if (start != std::string::npos) {
            result.push_back(item.substr(start, end - start + 1));
        }
    }
    return result;
}
