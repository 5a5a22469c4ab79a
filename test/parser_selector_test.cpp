#include <catch2/catch_test_macros.hpp>
#include "parser_selector.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

// Stands in for an AST parser whose grammar loads but which fails on every file
class ThrowingParser : public CodeParser {
public:
    ParseResult parse(const std::string&, const std::string&) const override {
        throw std::runtime_error("parser crashed");
    }
    std::vector<Language> supportedLanguages() const override { return {Language::JavaScript}; }
    std::string name() const override { return "throwing"; }
};

ParserSelector::AstParserFactory failingFactory() {
    return [](Language, const LanguageGrammarConfig&) -> std::shared_ptr<CodeParser> {
        throw std::runtime_error("grammar unavailable");
    };
}

} // namespace

TEST_CASE("ParserSelector falls back when the AST parser cannot load", "[ParserSelector]") {
    ParserSelector selector(failingFactory());

    SECTION("Configured language gets the pattern parser") {
        auto parser = selector.select(Language::Python);
        REQUIRE(parser != nullptr);
        REQUIRE(parser->name() == "pattern");
        REQUIRE(selector.select(Language::Python) == parser);
    }

    SECTION("Unknown language gets the generic parser") {
        auto parser = selector.select(Language::Unknown);
        REQUIRE(parser->name() == "generic");
    }

    SECTION("A null parser from the factory is also a load failure") {
        ParserSelector nullSelector([](Language, const LanguageGrammarConfig&) -> std::shared_ptr<CodeParser> {
            return nullptr;
        });
        REQUIRE(nullSelector.select(Language::Go)->name() == "pattern");
    }
}

TEST_CASE("ParserSelector demotes a parser that throws during parsing", "[ParserSelector]") {
    std::atomic<int> created{0};
    ParserSelector selector([&created](Language, const LanguageGrammarConfig&) -> std::shared_ptr<CodeParser> {
        ++created;
        return std::make_shared<ThrowingParser>();
    });

    REQUIRE(selector.select(Language::JavaScript)->name() == "throwing");

    ParseResult result;
    REQUIRE_NOTHROW(result = selector.parse(Language::JavaScript, "app.js", "function run(a) {\n  return a;\n}\n"));
    REQUIRE(result.language == Language::JavaScript);
    REQUIRE(result.totalLines == 4);
    REQUIRE(result.blankLines + result.commentLines + result.codeLines == result.totalLines);
    REQUIRE(result.functions.size() == 1);
    REQUIRE(result.functions[0].name == "run");

    // The fallback sticks for the rest of the run
    REQUIRE(selector.select(Language::JavaScript)->name() == "pattern");
    REQUIRE_NOTHROW(selector.parse(Language::JavaScript, "other.js", "const x = 1;\n"));
    REQUIRE(created == 1);
}

TEST_CASE("ParserSelector initializes each language once under contention", "[ParserSelector]") {
    std::atomic<int> initializations{0};
    ParserSelector selector([&initializations](Language language,
                                               const LanguageGrammarConfig&) -> std::shared_ptr<CodeParser> {
        ++initializations;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return std::make_shared<PatternParser>(language);
    });

    constexpr int THREAD_COUNT = 8;
    std::vector<std::shared_ptr<CodeParser>> selected(THREAD_COUNT);
    std::vector<std::thread> threads;
    for (int i = 0; i < THREAD_COUNT; ++i) {
        threads.emplace_back([&selector, &selected, i]() { selected[i] = selector.select(Language::Go); });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(initializations == 1);
    for (const auto& parser : selected) {
        REQUIRE(parser != nullptr);
        REQUIRE(parser == selected.front());
    }
}

TEST_CASE("ParserSelector hands a non-standard exception to every caller", "[ParserSelector]") {
    std::atomic<int> initializations{0};
    ParserSelector selector([&initializations](Language, const LanguageGrammarConfig&) -> std::shared_ptr<CodeParser> {
        ++initializations;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        throw 42;
    });

    constexpr int THREAD_COUNT = 4;
    std::atomic<int> caught{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < THREAD_COUNT; ++i) {
        threads.emplace_back([&selector, &caught]() {
            try {
                selector.select(Language::Go);
            } catch (int code) {
                if (code == 42) {
                    ++caught;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(caught == THREAD_COUNT);
    REQUIRE_THROWS_AS(selector.select(Language::Go), int);
    REQUIRE(initializations == 1);
}
