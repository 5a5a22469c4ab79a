#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "language.hpp"
#include "parse_result.hpp"
#include "thresholds.hpp"

enum class MetricCategory {
    Complexity,
    Size,
    Duplication,
    Documentation,
    Naming,
    Structure,
    Error
};

enum class Severity {
    Info,
    Warning,
    Error,
    Critical
};

struct MetricLocation {
    std::string filePath;
    int line = 0;
    std::string functionName;    // Empty for file-level findings
    std::string message;
};

struct MetricResult {
    std::string name;
    MetricCategory category = MetricCategory::Complexity;
    double value = 0.0;
    double normalizedScore = 100.0;  // 0-100, 100 is best
    Severity severity = Severity::Info;
    std::string details;
    std::vector<MetricLocation> locations;
};

// Zone drops for the four-zone curve. The tail starts at tailStart (100 - z1 - z2 - z3)
// and decays as exp(-(x - poor) / tailDecay).
struct ScoreCurve {
    double z1 = 20.0;
    double z2 = 35.0;
    double z3 = 30.0;
    double tailStart = 15.0;
    double tailDecay = 20.0;
};

// Flat at 100 up to excellent, linear through good/acceptable/poor, exponential tail
double scoreOnCurve(double x, const ThresholdConfig& thresholds, const ScoreCurve& curve);

// info up to good, warning up to acceptable, error up to poor, critical beyond
Severity severityFor(double worst, const ThresholdConfig& thresholds);

// One decimal place
double roundScore(double score);

// Fixed one-decimal text for details strings ("3.2")
std::string formatDecimal(double value);

std::string categoryToString(MetricCategory category);
std::string severityToString(Severity severity);

// A single quality dimension computed from one file's parse result
class Metric {
public:
    Metric(std::string name, MetricCategory category)
        : name_(std::move(name)), category_(category) {}
    virtual ~Metric() = default;

    const std::string& name() const { return name_; }
    MetricCategory category() const { return category_; }

    virtual MetricResult calculate(const ParseResult& parseResult) const = 0;

protected:
    std::string name_;
    MetricCategory category_;

    // Result with this metric's name and category filled in
    MetricResult makeResult() const;

    // "Insufficient data" result: score 100, severity info
    MetricResult neutralResult(double value, const std::string& details) const;
};

class CyclomaticComplexityMetric : public Metric {
public:
    explicit CyclomaticComplexityMetric(Language language);
    MetricResult calculate(const ParseResult& parseResult) const override;

private:
    ThresholdConfig thresholds_;
};

class CognitiveComplexityMetric : public Metric {
public:
    explicit CognitiveComplexityMetric(Language language);
    MetricResult calculate(const ParseResult& parseResult) const override;

private:
    ThresholdConfig thresholds_;
};

class NestingDepthMetric : public Metric {
public:
    explicit NestingDepthMetric(Language language);
    MetricResult calculate(const ParseResult& parseResult) const override;

private:
    ThresholdConfig thresholds_;
};

class FunctionLengthMetric : public Metric {
public:
    explicit FunctionLengthMetric(Language language);
    MetricResult calculate(const ParseResult& parseResult) const override;

private:
    ThresholdConfig thresholds_;
};

class FileLengthMetric : public Metric {
public:
    explicit FileLengthMetric(Language language);
    MetricResult calculate(const ParseResult& parseResult) const override;

private:
    ThresholdConfig thresholds_;
};

class ParameterCountMetric : public Metric {
public:
    explicit ParameterCountMetric(Language language);
    MetricResult calculate(const ParseResult& parseResult) const override;

private:
    ThresholdConfig thresholds_;
};

class CodeDuplicationMetric : public Metric {
public:
    CodeDuplicationMetric();
    MetricResult calculate(const ParseResult& parseResult) const override;

    // Control-flow signature of lines [startLine, endLine], one letter per significant line
    static std::string controlFlowSignature(const std::vector<std::string>& lines, int startLine, int endLine);

    static constexpr size_t MIN_SIGNATURE_LENGTH = 4;
};

class StructureAnalysisMetric : public Metric {
public:
    StructureAnalysisMetric();
    MetricResult calculate(const ParseResult& parseResult) const override;

private:
    MetricResult calculateSimplified(const ParseResult& parseResult) const;
};

class ErrorHandlingMetric : public Metric {
public:
    ErrorHandlingMetric();
    MetricResult calculate(const ParseResult& parseResult) const override;
};

class CommentRatioMetric : public Metric {
public:
    CommentRatioMetric();
    MetricResult calculate(const ParseResult& parseResult) const override;
};

class NamingConventionMetric : public Metric {
public:
    explicit NamingConventionMetric(Language language);
    MetricResult calculate(const ParseResult& parseResult) const override;

private:
    Language language_;
};

// All eleven metrics for a language; scoring weighs them by category
std::vector<std::unique_ptr<Metric>> createMetrics(Language language);
