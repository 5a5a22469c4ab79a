#include "metrics.hpp"
#include <algorithm>

namespace {

const ScoreCurve CYCLOMATIC_CURVE{20.0, 30.0, 50.0, 0.0, 1.0};
const ScoreCurve COGNITIVE_CURVE{20.0, 35.0, 30.0, 15.0, 15.0};
const ScoreCurve NESTING_CURVE{20.0, 35.0, 30.0, 15.0, 3.0};

std::string avgMaxDetails(double average, int maximum) {
    return "avg " + formatDecimal(average) + ", max " + std::to_string(maximum);
}

MetricLocation functionLocation(const ParseResult& parseResult, const FunctionInfo& fn, const std::string& message) {
    MetricLocation location;
    location.filePath = parseResult.filePath;
    location.line = fn.startLine;
    location.functionName = fn.name;
    location.message = message;
    return location;
}

} // namespace

CyclomaticComplexityMetric::CyclomaticComplexityMetric(Language language)
    : Metric("cyclomatic_complexity", MetricCategory::Complexity),
      thresholds_(getLanguageThresholds(language).cyclomaticComplexity) {
}

MetricResult CyclomaticComplexityMetric::calculate(const ParseResult& parseResult) const {
    const auto& functions = parseResult.functions;
    if (functions.empty()) {
        return neutralResult(1.0, "No functions");
    }

    MetricResult result = makeResult();
    int total = 0;
    int maximum = 0;
    for (const auto& fn : functions) {
        total += fn.complexity;
        maximum = std::max(maximum, fn.complexity);
        if (fn.complexity > thresholds_.good) {
            result.locations.push_back(
                functionLocation(parseResult, fn, "Complexity: " + std::to_string(fn.complexity)));
        }
    }

    const double average = static_cast<double>(total) / functions.size();
    // Typical and worst functions count equally
    const double score = 0.5 * scoreOnCurve(average, thresholds_, CYCLOMATIC_CURVE) +
                         0.5 * scoreOnCurve(maximum, thresholds_, CYCLOMATIC_CURVE);

    result.value = average;
    result.normalizedScore = roundScore(score);
    result.severity = severityFor(maximum, thresholds_);
    result.details = avgMaxDetails(average, maximum);
    return result;
}

CognitiveComplexityMetric::CognitiveComplexityMetric(Language language)
    : Metric("cognitive_complexity", MetricCategory::Complexity),
      thresholds_(getLanguageThresholds(language).cognitiveComplexity) {
}

MetricResult CognitiveComplexityMetric::calculate(const ParseResult& parseResult) const {
    const auto& functions = parseResult.functions;
    if (functions.empty()) {
        return neutralResult(0.0, "No functions");
    }

    MetricResult result = makeResult();
    int total = 0;
    int maximum = 0;
    for (const auto& fn : functions) {
        // Nesting weighs double
        const int cognitive = fn.complexity + 2 * fn.nestingDepth;
        total += cognitive;
        maximum = std::max(maximum, cognitive);
        if (cognitive > thresholds_.good) {
            result.locations.push_back(
                functionLocation(parseResult, fn, "Cognitive complexity: " + std::to_string(cognitive)));
        }
    }

    const double average = static_cast<double>(total) / functions.size();
    result.value = average;
    result.normalizedScore = roundScore(scoreOnCurve(average, thresholds_, COGNITIVE_CURVE));
    result.severity = severityFor(maximum, thresholds_);
    result.details = avgMaxDetails(average, maximum);
    return result;
}

NestingDepthMetric::NestingDepthMetric(Language language)
    : Metric("nesting_depth", MetricCategory::Complexity),
      thresholds_(getLanguageThresholds(language).nestingDepth) {
}

MetricResult NestingDepthMetric::calculate(const ParseResult& parseResult) const {
    const auto& functions = parseResult.functions;
    if (functions.empty()) {
        return neutralResult(0.0, "No functions");
    }

    MetricResult result = makeResult();
    int total = 0;
    int maximum = 0;
    for (const auto& fn : functions) {
        total += fn.nestingDepth;
        maximum = std::max(maximum, fn.nestingDepth);
        if (fn.nestingDepth > thresholds_.good) {
            result.locations.push_back(
                functionLocation(parseResult, fn, "Nesting depth: " + std::to_string(fn.nestingDepth)));
        }
    }

    const double average = static_cast<double>(total) / functions.size();
    result.value = maximum;
    result.normalizedScore = roundScore(scoreOnCurve(maximum, thresholds_, NESTING_CURVE));
    result.severity = severityFor(maximum, thresholds_);
    result.details = avgMaxDetails(average, maximum);
    return result;
}
