#include <catch2/catch_test_macros.hpp>
#include "language.hpp"

TEST_CASE("detectLanguage maps extensions to languages", "[Language]") {
    SECTION("Common extensions") {
        REQUIRE(detectLanguage("main.go") == Language::Go);
        REQUIRE(detectLanguage("src/app.js") == Language::JavaScript);
        REQUIRE(detectLanguage("src/app.jsx") == Language::JavaScript);
        REQUIRE(detectLanguage("types.d.ts") == Language::TypeScript);
        REQUIRE(detectLanguage("view.tsx") == Language::TypeScript);
        REQUIRE(detectLanguage("tool.py") == Language::Python);
        REQUIRE(detectLanguage("Main.java") == Language::Java);
        REQUIRE(detectLanguage("lib.c") == Language::C);
        REQUIRE(detectLanguage("lib.h") == Language::C);
        REQUIRE(detectLanguage("engine.cpp") == Language::Cpp);
        REQUIRE(detectLanguage("engine.hpp") == Language::Cpp);
        REQUIRE(detectLanguage("lib.rs") == Language::Rust);
        REQUIRE(detectLanguage("Program.cs") == Language::CSharp);
        REQUIRE(detectLanguage("init.lua") == Language::Lua);
        REQUIRE(detectLanguage("index.php") == Language::Php);
        REQUIRE(detectLanguage("app.rb") == Language::Ruby);
        REQUIRE(detectLanguage("View.swift") == Language::Swift);
        REQUIRE(detectLanguage("build.sh") == Language::Shell);
    }

    SECTION("Extensions are case-insensitive") {
        REQUIRE(detectLanguage("MAIN.GO") == Language::Go);
        REQUIRE(detectLanguage("Script.Py") == Language::Python);
    }

    SECTION("Unsupported files") {
        REQUIRE(detectLanguage("README.md") == Language::Unknown);
        REQUIRE(detectLanguage("Makefile") == Language::Unknown);
        REQUIRE(detectLanguage("archive.tar.gz") == Language::Unknown);
    }
}

TEST_CASE("Language tags round-trip through strings", "[Language]") {
    for (Language language : supportedLanguageList()) {
        REQUIRE(languageFromString(languageToString(language)) == language);
    }

    REQUIRE(languageToString(Language::Cpp) == "cpp");
    REQUIRE(languageToString(Language::CSharp) == "csharp");
    REQUIRE(languageToString(Language::Unknown) == "unknown");
    REQUIRE(languageFromString("cobol") == Language::Unknown);
    REQUIRE(supportedLanguageList().size() == 14);
}
