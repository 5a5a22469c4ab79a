#include "metrics.hpp"
#include "code_parser.hpp"
#include <regex>

namespace {

const ScoreCurve ERROR_CURVE{20.0, 35.0, 30.0, 15.0, 20.0};
const ThresholdConfig ERROR_THRESHOLDS{5.0, 15.0, 30.0, 50.0};

// I/O, network, serialization and database calls
const std::vector<std::regex>& errorPronePatterns() {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(\b(?:open|read|write|close|create|remove|rename|mkdir|readFile|writeFile|readdir|stat|access)\s*\()"),
        std::regex(R"(\b(?:fetch|get|post|put|delete|request|send|connect|listen|accept)\s*\()"),
        std::regex(R"(\b(?:parse|stringify|marshal|unmarshal|decode|encode)\s*\()"),
        std::regex(R"(\b(?:query|exec|execute|prepare|transaction|commit|rollback)\s*\()")
    };
    return patterns;
}

const std::regex TRY_OPEN(R"(\btry\s*\{)");
const std::regex CATCH_LINE(R"(\bcatch\s*[({])");
const std::regex HANDLER_CHAIN(R"(\.(?:catch|then)\s*\(|\bthrow\b)");
const std::regex DISCARD_ASSIGNMENT(R"(\b_\s*[=:])");
const std::regex DECLARATION(R"(\b(?:const|let|var)\s+\w)");
const std::regex RETURN_KEYWORD(R"(\breturn\b)");

bool isErrorProneCall(const std::string& line) {
    for (const auto& pattern : errorPronePatterns()) {
        if (parser_utils::searchLine(pattern, line)) {
            return true;
        }
    }
    return false;
}

} // namespace

ErrorHandlingMetric::ErrorHandlingMetric()
    : Metric("error_handling", MetricCategory::Error) {
}

MetricResult ErrorHandlingMetric::calculate(const ParseResult& parseResult) const {
    if (parseResult.functions.empty() || !parseResult.content) {
        return neutralResult(0.0, "No functions");
    }

    MetricResult result = makeResult();
    const auto lines = parser_utils::splitLines(*parseResult.content);
    int callCount = 0;
    int tryDepth = 0;

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string trimmed = parser_utils::trim(lines[i]);
        if (trimmed.empty()) {
            continue;
        }

        if (parser_utils::searchLine(TRY_OPEN, trimmed)) {
            ++tryDepth;
            continue;
        }
        if (parser_utils::searchLine(CATCH_LINE, trimmed)) {
            continue;
        }
        if (tryDepth > 0 && trimmed == "}") {
            --tryDepth;
            continue;
        }
        if (parser_utils::searchLine(HANDLER_CHAIN, trimmed) || !isErrorProneCall(trimmed)) {
            continue;
        }

        ++callCount;
        if (tryDepth > 0) {
            continue;
        }

        const int line = static_cast<int>(i) + 1;
        if (parser_utils::searchLine(DISCARD_ASSIGNMENT, trimmed)) {
            result.locations.push_back({parseResult.filePath, line, "", "Error result ignored"});
        } else if (!parser_utils::searchLine(DECLARATION, trimmed) &&
                   !parser_utils::searchLine(RETURN_KEYWORD, trimmed) &&
                   trimmed.find('=') == std::string::npos) {
            result.locations.push_back({parseResult.filePath, line, "", "Unhandled error-prone call"});
        }
    }

    if (callCount == 0) {
        return neutralResult(0.0, "No error-prone calls");
    }

    const int ignored = static_cast<int>(result.locations.size());
    const double percent = static_cast<double>(ignored) / callCount * 100.0;
    result.value = percent;
    result.normalizedScore = roundScore(scoreOnCurve(percent, ERROR_THRESHOLDS, ERROR_CURVE));
    result.severity = severityFor(percent, ERROR_THRESHOLDS);
    result.details = std::to_string(ignored) + " of " + std::to_string(callCount) + " error-prone calls unhandled (" +
                     formatDecimal(percent) + "%)";
    return result;
}
