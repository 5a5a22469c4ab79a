#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "metrics.hpp"

namespace {

ParseResult withRatio(int commentLines, int codeLines) {
    ParseResult parsed;
    parsed.commentLines = commentLines;
    parsed.codeLines = codeLines;
    return parsed;
}

FunctionInfo named(const std::string& name, int line) {
    FunctionInfo fn;
    fn.name = name;
    fn.startLine = line;
    fn.endLine = line;
    return fn;
}

} // namespace

TEST_CASE("Comment ratio bands", "[Documentation]") {
    CommentRatioMetric metric;

    SECTION("Optimal") {
        auto result = metric.calculate(withRatio(15, 100));
        REQUIRE(result.name == "comment_ratio");
        REQUIRE(result.value == Catch::Approx(15.0));
        REQUIRE(result.normalizedScore == 100.0);
        REQUIRE(result.severity == Severity::Info);
        REQUIRE(result.details == "15.0% (15 comment / 100 code lines)");
    }

    SECTION("Slightly under-commented") {
        auto result = metric.calculate(withRatio(7, 100));
        REQUIRE(result.normalizedScore == Catch::Approx(82.0));
        REQUIRE(result.severity == Severity::Warning);
    }

    SECTION("Barely commented") {
        auto result = metric.calculate(withRatio(2, 100));
        REQUIRE(result.normalizedScore == Catch::Approx(28.0));
        REQUIRE(result.severity == Severity::Error);
    }

    SECTION("Somewhat over-commented") {
        auto result = metric.calculate(withRatio(30, 100));
        REQUIRE(result.normalizedScore == Catch::Approx(86.7));
        REQUIRE(result.severity == Severity::Warning);
    }

    SECTION("Heavily over-commented") {
        auto result = metric.calculate(withRatio(50, 100));
        REQUIRE(result.normalizedScore == Catch::Approx(45.0));
        REQUIRE(result.severity == Severity::Error);
    }

    SECTION("No code") {
        auto result = metric.calculate(withRatio(5, 0));
        REQUIRE(result.normalizedScore == 100.0);
        REQUIRE(result.severity == Severity::Info);
    }
}

TEST_CASE("Naming conventions follow the language", "[Documentation]") {
    SECTION("JavaScript accepts camelCase and PascalCase") {
        NamingConventionMetric metric(Language::JavaScript);
        ParseResult parsed;
        parsed.filePath = "names.js";
        parsed.functions = {named("getValue", 1), named("ParseItem", 5), named("bad_name", 9)};
        ClassInfo widget;
        widget.name = "widget";
        widget.startLine = 12;
        parsed.classes.push_back(widget);

        auto result = metric.calculate(parsed);
        REQUIRE(result.name == "naming_convention");
        REQUIRE(result.category == MetricCategory::Naming);
        REQUIRE(result.value == Catch::Approx(50.0));
        REQUIRE(result.severity == Severity::Error);
        REQUIRE(result.details == "2 violations");
        REQUIRE(result.locations.size() == 2);
        REQUIRE(result.locations[0].functionName == "bad_name");
        REQUIRE(result.locations[0].message == "\"bad_name\" - camelCase/PascalCase");
        REQUIRE(result.locations[1].line == 12);
        REQUIRE(result.locations[1].message == "\"widget\" - PascalCase");
    }

    SECTION("Python expects snake_case") {
        NamingConventionMetric metric(Language::Python);
        ParseResult parsed;
        parsed.functions = {named("load_data", 1), named("loadData", 4), named("__init__", 8)};

        auto result = metric.calculate(parsed);
        REQUIRE(result.normalizedScore == Catch::Approx(66.7));
        REQUIRE(result.severity == Severity::Error);
        REQUIRE(result.locations.size() == 1);
        REQUIRE(result.locations[0].functionName == "loadData");
    }

    SECTION("Qualified and operator names") {
        NamingConventionMetric metric(Language::Cpp);
        ParseResult parsed;
        parsed.functions = {named("Widget::resize", 1), named("~Widget", 3), named("operator+", 5)};

        auto result = metric.calculate(parsed);
        REQUIRE(result.value == Catch::Approx(100.0));
        REQUIRE(result.severity == Severity::Info);
        REQUIRE(result.details == "No violations");
    }

    SECTION("Locations are capped") {
        NamingConventionMetric metric(Language::Python);
        ParseResult parsed;
        for (int i = 1; i <= 12; ++i) {
            parsed.functions.push_back(named("BadName" + std::to_string(i), i));
        }

        auto result = metric.calculate(parsed);
        REQUIRE(result.value == 0.0);
        REQUIRE(result.severity == Severity::Critical);
        REQUIRE(result.details == "12 violations");
        REQUIRE(result.locations.size() == 10);
    }

    SECTION("Nothing to check") {
        auto result = NamingConventionMetric(Language::Go).calculate(ParseResult());
        REQUIRE(result.value == 100.0);
        REQUIRE(result.normalizedScore == 100.0);
    }
}
