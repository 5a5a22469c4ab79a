#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "metrics.hpp"

namespace {

FunctionInfo makeFunction(const std::string& name, int startLine, int complexity, int nesting = 0) {
    FunctionInfo fn;
    fn.name = name;
    fn.startLine = startLine;
    fn.endLine = startLine + 9;
    fn.lineCount = 10;
    fn.complexity = complexity;
    fn.nestingDepth = nesting;
    return fn;
}

} // namespace

TEST_CASE("Cyclomatic complexity blends average and maximum", "[ComplexityMetrics]") {
    CyclomaticComplexityMetric metric(Language::JavaScript);

    ParseResult parsed;
    parsed.filePath = "app.js";
    parsed.functions = {makeFunction("small", 1, 3), makeFunction("medium", 20, 12), makeFunction("large", 40, 25)};

    auto result = metric.calculate(parsed);

    REQUIRE(result.name == "cyclomatic_complexity");
    REQUIRE(result.category == MetricCategory::Complexity);
    REQUIRE(result.value == Catch::Approx(13.333).epsilon(0.001));
    // average scores 70 in the good-acceptable zone, maximum scores 25 in acceptable-poor
    REQUIRE(result.normalizedScore == Catch::Approx(47.5));
    REQUIRE(result.severity == Severity::Error);
    REQUIRE(result.details == "avg 13.3, max 25");

    REQUIRE(result.locations.size() == 2);
    REQUIRE(result.locations[0].functionName == "medium");
    REQUIRE(result.locations[0].line == 20);
    REQUIRE(result.locations[0].message == "Complexity: 12");
    REQUIRE(result.locations[1].functionName == "large");
}

TEST_CASE("Complexity metrics are neutral without functions", "[ComplexityMetrics]") {
    ParseResult parsed;
    parsed.codeLines = 10;

    auto cyclomatic = CyclomaticComplexityMetric(Language::Go).calculate(parsed);
    REQUIRE(cyclomatic.normalizedScore == 100.0);
    REQUIRE(cyclomatic.severity == Severity::Info);
    REQUIRE(cyclomatic.value == 1.0);

    auto cognitive = CognitiveComplexityMetric(Language::Go).calculate(parsed);
    REQUIRE(cognitive.normalizedScore == 100.0);
    REQUIRE(cognitive.severity == Severity::Info);

    auto nesting = NestingDepthMetric(Language::Go).calculate(parsed);
    REQUIRE(nesting.normalizedScore == 100.0);
    REQUIRE(nesting.severity == Severity::Info);
}

TEST_CASE("Cognitive complexity weighs nesting", "[ComplexityMetrics]") {
    CognitiveComplexityMetric metric(Language::Python);

    ParseResult parsed;
    parsed.functions = {makeFunction("flat", 1, 3, 0), makeFunction("deep", 20, 5, 4)};

    auto result = metric.calculate(parsed);

    // 3 and 5 + 2*4 = 13
    REQUIRE(result.value == Catch::Approx(8.0));
    REQUIRE(result.severity == Severity::Warning);
    REQUIRE(result.locations.size() == 1);
    REQUIRE(result.locations[0].message == "Cognitive complexity: 13");
    REQUIRE(result.normalizedScore < 100.0);
    REQUIRE(result.normalizedScore > 80.0);
}

TEST_CASE("Nesting depth is scored on the deepest function", "[ComplexityMetrics]") {
    NestingDepthMetric metric(Language::JavaScript);

    ParseResult parsed;
    parsed.functions = {makeFunction("shallow", 1, 1, 1), makeFunction("deep", 20, 1, 6)};

    auto result = metric.calculate(parsed);

    REQUIRE(result.value == 6.0);
    REQUIRE(result.severity == Severity::Error);
    REQUIRE(result.details == "avg 3.5, max 6");
    REQUIRE(result.locations.size() == 1);
    REQUIRE(result.locations[0].functionName == "deep");

    parsed.functions = {makeFunction("shallow", 1, 1, 2)};
    auto clean = metric.calculate(parsed);
    REQUIRE(clean.normalizedScore == 100.0);
    REQUIRE(clean.severity == Severity::Info);
    REQUIRE(clean.locations.empty());
}
