#pragma once

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include "code_parser.hpp"

// Chooses and memoizes the parser for each language.
// AST parser when its grammar loads, pattern parser when it does not,
// generic parser for languages without a grammar configuration.
class ParserSelector {
public:
    using AstParserFactory =
        std::function<std::shared_ptr<CodeParser>(Language, const LanguageGrammarConfig&)>;

    // Factory building TreeSitterParser instances from an optional grammar directory
    static AstParserFactory treeSitterFactory(const fs::path& grammarDir = fs::path());

    explicit ParserSelector(AstParserFactory factory = treeSitterFactory());

    // Memoized parser for the language; concurrent first calls share one initialization
    std::shared_ptr<CodeParser> select(Language language);

    // Parse with the selected parser. An AST parser that throws is replaced by the
    // pattern parser for the rest of the run and the file is parsed again.
    ParseResult parse(Language language, const std::string& filePath, const std::string& content);

private:
    using ParserFuture = std::shared_future<std::shared_ptr<CodeParser>>;

    AstParserFactory factory_;
    std::mutex mutex_;
    std::unordered_map<Language, ParserFuture> parsers_;
    std::set<Language> demoted_;

    std::shared_ptr<CodeParser> initialize(Language language);
    std::shared_ptr<CodeParser> demote(Language language, const std::shared_ptr<CodeParser>& failed,
                                       const std::string& reason);
};
