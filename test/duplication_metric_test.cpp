#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "code_parser.hpp"
#include "metrics.hpp"

namespace {

const char* DUPLICATED_SOURCE = R"(function a(x) {
  const y = x + 1;
  if (y > 2) {
    return y;
  }
  return 0;
}
function b(z) {
  let w = z * 2;
  if (w > 4) {
    return w;
  }
  return 1;
}
function c(items) {
  for (const i of items) {
    total += i;
  }
  return total;
}
function d(n) {
  while (n > 0) {
    n = n - 1;
  }
  let done = true;
  return done;
}
)";

FunctionInfo span(const std::string& name, int startLine, int endLine) {
    FunctionInfo fn;
    fn.name = name;
    fn.startLine = startLine;
    fn.endLine = endLine;
    fn.lineCount = endLine - startLine + 1;
    return fn;
}

ParseResult duplicatedFile() {
    ParseResult parsed;
    parsed.filePath = "dup.js";
    parsed.language = Language::JavaScript;
    parsed.functions = {span("a", 1, 7), span("b", 8, 14), span("c", 15, 20), span("d", 21, 27)};
    parsed.content = DUPLICATED_SOURCE;
    return parsed;
}

} // namespace

TEST_CASE("Control flow signatures", "[Duplication]") {
    auto lines = parser_utils::splitLines(DUPLICATED_SOURCE);

    REQUIRE(CodeDuplicationMetric::controlFlowSignature(lines, 1, 7) == "AIRR");
    REQUIRE(CodeDuplicationMetric::controlFlowSignature(lines, 8, 14) == "AIRR");
    REQUIRE(CodeDuplicationMetric::controlFlowSignature(lines, 15, 20) == "FAR");
    REQUIRE(CodeDuplicationMetric::controlFlowSignature(lines, 21, 27) == "WAAR");

    SECTION("Ranges are clamped to the file") {
        REQUIRE(CodeDuplicationMetric::controlFlowSignature(lines, 0, 1000).size() > 10);
        REQUIRE(CodeDuplicationMetric::controlFlowSignature(lines, 500, 600).empty());
    }
}

TEST_CASE("Functions sharing a signature are reported as duplicates", "[Duplication]") {
    CodeDuplicationMetric metric;
    auto result = metric.calculate(duplicatedFile());

    REQUIRE(result.name == "code_duplication");
    REQUIRE(result.value == Catch::Approx(25.0));
    REQUIRE(result.normalizedScore == Catch::Approx(35.0));
    REQUIRE(result.severity == Severity::Error);
    REQUIRE(result.locations.size() == 1);
    REQUIRE(result.locations[0].line == 1);
    REQUIRE(result.locations[0].message == "Duplicate pattern: a, b");
}

TEST_CASE("Duplication needs content and at least three functions", "[Duplication]") {
    CodeDuplicationMetric metric;

    SECTION("Without content") {
        auto parsed = duplicatedFile();
        parsed.content.reset();
        auto result = metric.calculate(parsed);
        REQUIRE(result.normalizedScore == 100.0);
        REQUIRE(result.locations.empty());
    }

    SECTION("Two functions") {
        auto parsed = duplicatedFile();
        parsed.functions.resize(2);
        auto result = metric.calculate(parsed);
        REQUIRE(result.normalizedScore == 100.0);
        REQUIRE(result.severity == Severity::Info);
    }

    SECTION("Distinct signatures") {
        auto parsed = duplicatedFile();
        parsed.functions = {parsed.functions[0], parsed.functions[2], parsed.functions[3]};
        auto result = metric.calculate(parsed);
        REQUIRE(result.value == 0.0);
        REQUIRE(result.normalizedScore == 100.0);
        REQUIRE(result.locations.empty());
    }
}
