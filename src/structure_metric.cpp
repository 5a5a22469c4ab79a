#include "metrics.hpp"
#include "code_parser.hpp"
#include <algorithm>
#include <regex>

namespace {

constexpr int NESTING_HIGH = 5;
constexpr int NESTING_MEDIUM = 3;
constexpr int FILE_LARGE = 1000;
constexpr int FILE_MEDIUM = 500;
constexpr size_t FUNCTIONS_HIGH = 50;
constexpr size_t FUNCTIONS_MEDIUM = 30;
constexpr int IMPORTS_HIGH = 20;
constexpr int IMPORTS_MEDIUM = 15;

const std::regex IMPORT_LINE(R"(^import\s+|^from\s+.*\s+import\s+|^#include\s+|^using\s+|\brequire\s*\()");
const std::regex PACKAGE_DECLARATION(R"(^package\s+(\w+))");
const std::regex MODULE_DECLARATION(R"(^module\s+['"]([^'"]+)['"])");
const std::regex SELF_IMPORT_LINE(R"(^import\s+|^from\s+|\brequire\s*\()");

int countImports(const std::vector<std::string>& lines) {
    int count = 0;
    for (const auto& line : lines) {
        if (parser_utils::searchLine(IMPORT_LINE, parser_utils::trim(line))) {
            ++count;
        }
    }
    return count;
}

// Imports naming the file's own package or module
int detectCircular(const std::vector<std::string>& lines) {
    std::string moduleName;
    for (size_t i = 0; i < std::min<size_t>(20, lines.size()); ++i) {
        const std::string trimmed = parser_utils::trim(lines[i]);
        std::smatch match;
        if (parser_utils::searchLine(PACKAGE_DECLARATION, trimmed, &match) ||
            parser_utils::searchLine(MODULE_DECLARATION, trimmed, &match)) {
            moduleName = match[1].str();
            break;
        }
    }
    if (moduleName.empty()) {
        return 0;
    }

    int count = 0;
    for (const auto& line : lines) {
        const std::string trimmed = parser_utils::trim(line);
        if (parser_utils::searchLine(SELF_IMPORT_LINE, trimmed) && trimmed.find(moduleName) != std::string::npos) {
            ++count;
        }
    }
    return count;
}

} // namespace

StructureAnalysisMetric::StructureAnalysisMetric()
    : Metric("structure_analysis", MetricCategory::Structure) {
}

MetricResult StructureAnalysisMetric::calculate(const ParseResult& parseResult) const {
    const auto& functions = parseResult.functions;
    if (functions.empty()) {
        return neutralResult(0.0, "No functions");
    }
    if (!parseResult.content) {
        return calculateSimplified(parseResult);
    }

    MetricResult result = makeResult();
    const std::string& path = parseResult.filePath;
    int deepNesting = 0;
    int mediumNesting = 0;

    for (const auto& fn : functions) {
        if (fn.nestingDepth >= NESTING_HIGH) {
            ++deepNesting;
            result.locations.push_back(
                {path, fn.startLine, fn.name, "High nesting depth: " + std::to_string(fn.nestingDepth)});
        } else if (fn.nestingDepth >= NESTING_MEDIUM) {
            ++mediumNesting;
            result.locations.push_back(
                {path, fn.startLine, fn.name, "Medium nesting depth: " + std::to_string(fn.nestingDepth)});
        }
    }

    const auto lines = parser_utils::splitLines(*parseResult.content);
    const bool largeFile = parseResult.totalLines > FILE_LARGE;
    const bool mediumFile = !largeFile && parseResult.totalLines > FILE_MEDIUM;
    const bool tooManyFunctions = functions.size() > FUNCTIONS_HIGH;
    const bool manyFunctions = !tooManyFunctions && functions.size() > FUNCTIONS_MEDIUM;
    const int importCount = countImports(lines);
    const bool tooManyImports = importCount > IMPORTS_HIGH;
    const bool manyImports = !tooManyImports && importCount > IMPORTS_MEDIUM;
    const int circularCount = detectCircular(lines);

    if (largeFile) {
        result.locations.push_back({path, 1, "", "File too large: " + std::to_string(parseResult.totalLines) + " lines"});
    }
    if (tooManyFunctions) {
        result.locations.push_back({path, 1, "", "Too many functions: " + std::to_string(functions.size())});
    }
    if (tooManyImports) {
        result.locations.push_back({path, 1, "", "Too many imports: " + std::to_string(importCount)});
    }
    if (circularCount > 0) {
        result.locations.push_back({path, 1, "", "Circular dependencies: " + std::to_string(circularCount)});
    }

    double nestingScore = std::max(0.0, 100.0 - deepNesting * 15.0 - mediumNesting * 5.0);

    double fileScore = 100.0;
    fileScore -= largeFile ? 40.0 : (mediumFile ? 20.0 : 0.0);
    fileScore -= tooManyFunctions ? 40.0 : (manyFunctions ? 20.0 : 0.0);
    fileScore = std::max(0.0, fileScore);

    double importScore = 100.0;
    importScore -= tooManyImports ? 50.0 : (manyImports ? 25.0 : 0.0);
    importScore -= circularCount * 30.0;
    importScore = std::max(0.0, importScore);

    if (circularCount > 0 || deepNesting >= 3) {
        result.severity = Severity::Critical;
    } else if (largeFile || tooManyFunctions || tooManyImports || deepNesting > 0) {
        result.severity = Severity::Error;
    } else if (mediumFile || manyFunctions || manyImports || mediumNesting > 0) {
        result.severity = Severity::Warning;
    } else {
        result.severity = Severity::Info;
    }

    const int issues = deepNesting + mediumNesting + (largeFile ? 1 : 0) + (tooManyFunctions ? 1 : 0) +
                       (tooManyImports ? 1 : 0) + circularCount;
    result.value = issues;
    result.normalizedScore = roundScore(nestingScore * 0.6 + fileScore * 0.25 + importScore * 0.15);
    result.details = std::to_string(issues) + " structure issues";
    return result;
}

MetricResult StructureAnalysisMetric::calculateSimplified(const ParseResult& parseResult) const {
    int deepNesting = 0;
    for (const auto& fn : parseResult.functions) {
        if (fn.nestingDepth >= NESTING_HIGH) {
            ++deepNesting;
        }
    }
    const bool largeFile = parseResult.totalLines > FILE_LARGE;
    const bool tooManyFunctions = parseResult.functions.size() > FUNCTIONS_HIGH;
    const int issues = deepNesting + (largeFile ? 1 : 0) + (tooManyFunctions ? 1 : 0);

    MetricResult result = makeResult();
    result.value = issues;
    result.normalizedScore = std::max(0.0, roundScore(100.0 - 15.0 * issues));
    result.severity = issues > 3 ? Severity::Error : (issues > 0 ? Severity::Warning : Severity::Info);
    result.details = std::to_string(issues) + " structure issues";
    return result;
}
