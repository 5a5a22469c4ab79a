#include "metrics.hpp"
#include <algorithm>

namespace {

const ScoreCurve FUNCTION_LENGTH_CURVE{15.0, 35.0, 35.0, 15.0, 50.0};
const ScoreCurve FILE_LENGTH_CURVE{15.0, 35.0, 35.0, 15.0, 500.0};
const ScoreCurve PARAMETER_CURVE{15.0, 35.0, 35.0, 15.0, 3.0};

} // namespace

FunctionLengthMetric::FunctionLengthMetric(Language language)
    : Metric("function_length", MetricCategory::Size),
      thresholds_(getLanguageThresholds(language).functionLength) {
}

MetricResult FunctionLengthMetric::calculate(const ParseResult& parseResult) const {
    const auto& functions = parseResult.functions;
    if (functions.empty()) {
        return neutralResult(0.0, "No functions");
    }

    MetricResult result = makeResult();
    int total = 0;
    int longest = 0;
    for (const auto& fn : functions) {
        total += fn.lineCount;
        longest = std::max(longest, fn.lineCount);
        if (fn.lineCount > thresholds_.good) {
            result.locations.push_back({parseResult.filePath, fn.startLine, fn.name,
                                        std::to_string(fn.lineCount) + " lines"});
        }
    }

    const double average = static_cast<double>(total) / functions.size();
    result.value = average;
    result.normalizedScore = roundScore(scoreOnCurve(average, thresholds_, FUNCTION_LENGTH_CURVE));
    result.severity = severityFor(longest, thresholds_);
    result.details = "avg " + formatDecimal(average) + " lines, max " + std::to_string(longest) + " lines";
    return result;
}

FileLengthMetric::FileLengthMetric(Language language)
    : Metric("file_length", MetricCategory::Size),
      thresholds_(getLanguageThresholds(language).fileLength) {
}

MetricResult FileLengthMetric::calculate(const ParseResult& parseResult) const {
    const double codeLines = parseResult.codeLines;

    MetricResult result = makeResult();
    result.value = codeLines;
    result.normalizedScore = roundScore(scoreOnCurve(codeLines, thresholds_, FILE_LENGTH_CURVE));
    result.severity = severityFor(codeLines, thresholds_);
    result.details = std::to_string(parseResult.codeLines) + " code lines, " +
                     std::to_string(parseResult.totalLines) + " total";
    if (codeLines > thresholds_.good) {
        result.locations.push_back({parseResult.filePath, 1, "",
                                    "File has " + std::to_string(parseResult.codeLines) + " code lines"});
    }
    return result;
}

ParameterCountMetric::ParameterCountMetric(Language language)
    : Metric("parameter_count", MetricCategory::Size),
      thresholds_(getLanguageThresholds(language).parameterCount) {
}

MetricResult ParameterCountMetric::calculate(const ParseResult& parseResult) const {
    const auto& functions = parseResult.functions;
    if (functions.empty()) {
        return neutralResult(0.0, "No functions");
    }

    MetricResult result = makeResult();
    int total = 0;
    int maximum = 0;
    for (const auto& fn : functions) {
        total += fn.parameterCount;
        maximum = std::max(maximum, fn.parameterCount);
        if (fn.parameterCount > thresholds_.good) {
            result.locations.push_back({parseResult.filePath, fn.startLine, fn.name,
                                        std::to_string(fn.parameterCount) + " parameters"});
        }
    }

    const double average = static_cast<double>(total) / functions.size();
    result.value = maximum;
    result.normalizedScore = roundScore(scoreOnCurve(maximum, thresholds_, PARAMETER_CURVE));
    result.severity = severityFor(maximum, thresholds_);
    result.details = "avg " + formatDecimal(average) + ", max " + std::to_string(maximum);
    return result;
}
