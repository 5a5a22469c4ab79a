#include <catch2/catch_test_macros.hpp>
#include "code_parser.hpp"
#include <memory>
#include <stdexcept>

namespace {

// Parser for the language, or nullptr when its grammar library is not installed
std::unique_ptr<TreeSitterParser> loadParser(Language language) {
    try {
        return std::make_unique<TreeSitterParser>(language, *getGrammarConfig(language));
    } catch (const std::runtime_error&) {
        return nullptr;
    }
}

std::unique_ptr<TreeSitterParser> loadJavaScriptParser() {
    return loadParser(Language::JavaScript);
}

} // namespace

TEST_CASE("TreeSitterParser reports a missing grammar", "[TreeSitterParser]") {
    const LanguageGrammarConfig* config = getGrammarConfig(Language::Go);
    REQUIRE(config != nullptr);
    REQUIRE_THROWS_AS(TreeSitterParser(Language::Go, *config, "/nonexistent/codegauge/grammars"),
                      std::runtime_error);
}

TEST_CASE("TreeSitterParser extracts JavaScript structure", "[TreeSitterParser]") {
    auto parser = loadJavaScriptParser();
    if (!parser) {
        SKIP("tree-sitter-javascript grammar library not installed");
    }

    auto result = parser->parse("math.js",
                                "// Adds numbers\n"
                                "function add(a, b) {\n"
                                "  return a + b;\n"
                                "}\n"
                                "\n"
                                "function check(x) {\n"
                                "  if (x > 0) {\n"
                                "    for (let i = 0; i < x; i++) {\n"
                                "      console.log(i);\n"
                                "    }\n"
                                "  }\n"
                                "  return x > 1 && x < 10;\n"
                                "}");

    REQUIRE(result.totalLines == 13);
    REQUIRE(result.commentLines == 1);
    REQUIRE(result.blankLines == 1);
    REQUIRE(result.codeLines == 11);
    REQUIRE(result.errors.empty());

    REQUIRE(result.functions.size() == 2);
    REQUIRE(result.functions[0].name == "add");
    REQUIRE(result.functions[0].parameterCount == 2);
    REQUIRE(result.functions[0].complexity == 1);
    REQUIRE(result.functions[0].hasDocstring);

    REQUIRE(result.functions[1].name == "check");
    REQUIRE(result.functions[1].startLine == 6);
    REQUIRE(result.functions[1].endLine == 13);
    REQUIRE(result.functions[1].complexity == 4);
    REQUIRE(result.functions[1].nestingDepth == 2);
}

TEST_CASE("TreeSitterParser keeps nested functions separate", "[TreeSitterParser]") {
    auto parser = loadJavaScriptParser();
    if (!parser) {
        SKIP("tree-sitter-javascript grammar library not installed");
    }

    auto result = parser->parse("nested.js",
                                "import { readFile } from 'fs';\n"
                                "function outer() {\n"
                                "  const inner = () => {\n"
                                "    if (a) { if (b) { run(); } }\n"
                                "  };\n"
                                "  return inner;\n"
                                "}\n");

    REQUIRE(result.imports.size() == 1);
    REQUIRE(result.imports[0] == "fs");

    REQUIRE(result.functions.size() == 2);
    const auto& outer = result.functions[0];
    REQUIRE(outer.name == "outer");
    REQUIRE(outer.complexity == 1);
    REQUIRE(outer.nestingDepth == 0);

    const auto& inner = result.functions[1];
    REQUIRE(inner.name == "inner");
    REQUIRE(inner.complexity == 3);
    REQUIRE(inner.nestingDepth == 2);
}

TEST_CASE("TreeSitterParser flags syntax errors without throwing", "[TreeSitterParser]") {
    auto parser = loadJavaScriptParser();
    if (!parser) {
        SKIP("tree-sitter-javascript grammar library not installed");
    }

    ParseResult result;
    REQUIRE_NOTHROW(result = parser->parse("broken.js", "function broken( {\n  if (\n}}}}\n"));
    REQUIRE_FALSE(result.errors.empty());
    REQUIRE(result.blankLines + result.commentLines + result.codeLines == result.totalLines);
}

TEST_CASE("TreeSitterParser handles Go declarations", "[TreeSitterParser]") {
    auto parser = loadParser(Language::Go);
    if (!parser) {
        SKIP("tree-sitter-go grammar library not installed");
    }

    auto result = parser->parse("point.go",
                                "package geo\n"
                                "\n"
                                "type Point struct {\n"
                                "\tX int\n"
                                "\tY int\n"
                                "}\n"
                                "\n"
                                "func (p Point) Scale(a, b int) int {\n"
                                "\tif a > 0 && b > 0 {\n"
                                "\t\treturn p.X*a + p.Y*b\n"
                                "\t}\n"
                                "\treturn 0\n"
                                "}\n"
                                "\n"
                                "func Sum(prefix string, values ...int) int {\n"
                                "\treturn len(prefix) + len(values) - 1\n"
                                "}\n");

    REQUIRE(result.errors.empty());

    SECTION("Struct type specs are named classes with their fields") {
        REQUIRE(result.classes.size() == 1);
        REQUIRE(result.classes[0].name == "Point");
        REQUIRE(result.classes[0].startLine == 3);
        REQUIRE(result.classes[0].endLine == 6);
        REQUIRE(result.classes[0].fieldCount == 2);
    }

    SECTION("Grouped parameter names count individually") {
        REQUIRE(result.functions.size() == 2);
        REQUIRE(result.functions[0].name == "Scale");
        REQUIRE(result.functions[0].parameterCount == 2);
        REQUIRE(result.functions[1].name == "Sum");
        REQUIRE(result.functions[1].parameterCount == 2);
    }

    SECTION("Only logical operators add complexity") {
        REQUIRE(result.functions[0].complexity == 3);
        REQUIRE(result.functions[1].complexity == 1);
    }
}

TEST_CASE("TreeSitterParser handles C parameter lists and operators", "[TreeSitterParser]") {
    auto parser = loadParser(Language::C);
    if (!parser) {
        SKIP("tree-sitter-c grammar library not installed");
    }

    auto result = parser->parse("pick.c",
                                "int zero(void) {\n"
                                "    return 0;\n"
                                "}\n"
                                "\n"
                                "int pick(int a, int b) {\n"
                                "    return a > 0 && b > 0 ? a * b : a - b;\n"
                                "}\n");

    REQUIRE(result.functions.size() == 2);
    REQUIRE(result.functions[0].name == "zero");
    REQUIRE(result.functions[0].parameterCount == 0);
    REQUIRE(result.functions[0].complexity == 1);

    REQUIRE(result.functions[1].name == "pick");
    REQUIRE(result.functions[1].parameterCount == 2);
    REQUIRE(result.functions[1].complexity == 3);
}

TEST_CASE("TreeSitterParser handles Python docstrings and boolean operators", "[TreeSitterParser]") {
    auto parser = loadParser(Language::Python);
    if (!parser) {
        SKIP("tree-sitter-python grammar library not installed");
    }

    auto result = parser->parse("greet.py",
                                "def greet(name):\n"
                                "    \"\"\"Say hello.\"\"\"\n"
                                "    return \"hi \" + name\n"
                                "\n"
                                "\n"
                                "def either(x, y):\n"
                                "    return x and not y or y\n");

    REQUIRE(result.functions.size() == 2);
    REQUIRE(result.functions[0].name == "greet");
    REQUIRE(result.functions[0].hasDocstring);
    REQUIRE(result.functions[0].parameterCount == 1);
    REQUIRE(result.functions[0].complexity == 1);

    REQUIRE(result.functions[1].name == "either");
    REQUIRE_FALSE(result.functions[1].hasDocstring);
    REQUIRE(result.functions[1].parameterCount == 2);
    REQUIRE(result.functions[1].complexity == 3);
}
