#include <catch2/catch_test_macros.hpp>
#include "code_parser.hpp"

TEST_CASE("GenericParser finds functions across syntaxes", "[GenericParser]") {
    GenericParser parser;

    SECTION("Brace-delimited body") {
        auto result = parser.parse("main.unknown",
                                   "fn main() {\n"
                                   "    println!(\"hi\");\n"
                                   "}\n");
        REQUIRE(result.language == Language::Unknown);
        REQUIRE(result.functions.size() == 1);
        REQUIRE(result.functions[0].name == "main");
        REQUIRE(result.functions[0].startLine == 1);
        REQUIRE(result.functions[0].endLine == 3);
        REQUIRE(result.functions[0].lineCount == 3);
        REQUIRE(result.functions[0].parameterCount == 0);
        REQUIRE(result.functions[0].complexity == 1);
    }

    SECTION("Indentation fallback") {
        auto result = parser.parse("script",
                                   "def run(x, y):\n"
                                   "    return x\n"
                                   "\n"
                                   "print(1)\n");
        REQUIRE(result.functions.size() == 1);
        REQUIRE(result.functions[0].name == "run");
        REQUIRE(result.functions[0].endLine == 2);
        REQUIRE(result.functions[0].parameterCount == 2);
    }

    SECTION("Control keywords are not functions") {
        auto result = parser.parse("flow",
                                   "else if (ready) {\n"
                                   "    go();\n"
                                   "}\n");
        REQUIRE(result.functions.empty());
    }
}

TEST_CASE("GenericParser classifies lines and imports", "[GenericParser]") {
    GenericParser parser;
    auto result = parser.parse("mixed",
                               "#include <stdio.h>\n"
                               "-- a comment\n"
                               "/* block\n"
                               "   still comment */\n"
                               "struct Point {\n"
                               "    int x;\n"
                               "};\n");

    REQUIRE(result.totalLines == 8);
    REQUIRE(result.commentLines == 4);
    REQUIRE(result.codeLines == 3);
    REQUIRE(result.blankLines == 1);

    REQUIRE(result.imports.size() == 1);
    REQUIRE(result.imports[0] == "stdio.h");

    REQUIRE(result.classes.size() == 1);
    REQUIRE(result.classes[0].name == "Point");
    REQUIRE(result.classes[0].endLine == 7);
}
