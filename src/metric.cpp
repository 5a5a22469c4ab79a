#include "metrics.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

double scoreOnCurve(double x, const ThresholdConfig& t, const ScoreCurve& curve) {
    if (x <= t.excellent) {
        return 100.0;
    }
    if (x <= t.good) {
        return 100.0 - (x - t.excellent) / (t.good - t.excellent) * curve.z1;
    }
    if (x <= t.acceptable) {
        return (100.0 - curve.z1) - (x - t.good) / (t.acceptable - t.good) * curve.z2;
    }
    if (x <= t.poor) {
        return (100.0 - curve.z1 - curve.z2) - (x - t.acceptable) / (t.poor - t.acceptable) * curve.z3;
    }
    if (curve.tailStart <= 0.0 || curve.tailDecay <= 0.0) {
        return 0.0;
    }
    return std::max(0.0, curve.tailStart * std::exp(-(x - t.poor) / curve.tailDecay));
}

Severity severityFor(double worst, const ThresholdConfig& t) {
    if (worst <= t.good) {
        return Severity::Info;
    }
    if (worst <= t.acceptable) {
        return Severity::Warning;
    }
    if (worst <= t.poor) {
        return Severity::Error;
    }
    return Severity::Critical;
}

double roundScore(double score) {
    return std::round(score * 10.0) / 10.0;
}

std::string formatDecimal(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << value;
    return ss.str();
}

std::string categoryToString(MetricCategory category) {
    switch (category) {
        case MetricCategory::Complexity: return "complexity";
        case MetricCategory::Size: return "size";
        case MetricCategory::Duplication: return "duplication";
        case MetricCategory::Documentation: return "documentation";
        case MetricCategory::Naming: return "naming";
        case MetricCategory::Structure: return "structure";
        case MetricCategory::Error: return "error";
    }
    return "unknown";
}

std::string severityToString(Severity severity) {
    switch (severity) {
        case Severity::Info: return "info";
        case Severity::Warning: return "warning";
        case Severity::Error: return "error";
        case Severity::Critical: return "critical";
    }
    return "info";
}

MetricResult Metric::makeResult() const {
    MetricResult result;
    result.name = name_;
    result.category = category_;
    return result;
}

MetricResult Metric::neutralResult(double value, const std::string& details) const {
    MetricResult result = makeResult();
    result.value = value;
    result.normalizedScore = 100.0;
    result.severity = Severity::Info;
    result.details = details;
    return result;
}

std::vector<std::unique_ptr<Metric>> createMetrics(Language language) {
    std::vector<std::unique_ptr<Metric>> metrics;
    metrics.push_back(std::make_unique<CyclomaticComplexityMetric>(language));
    metrics.push_back(std::make_unique<CognitiveComplexityMetric>(language));
    metrics.push_back(std::make_unique<NestingDepthMetric>(language));
    metrics.push_back(std::make_unique<FunctionLengthMetric>(language));
    metrics.push_back(std::make_unique<FileLengthMetric>(language));
    metrics.push_back(std::make_unique<ParameterCountMetric>(language));
    metrics.push_back(std::make_unique<CodeDuplicationMetric>());
    metrics.push_back(std::make_unique<StructureAnalysisMetric>());
    metrics.push_back(std::make_unique<ErrorHandlingMetric>());
    metrics.push_back(std::make_unique<CommentRatioMetric>());
    metrics.push_back(std::make_unique<NamingConventionMetric>(language));
    return metrics;
}
