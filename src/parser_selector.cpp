#include "parser_selector.hpp"
#include <chrono>
#include <exception>
#include <iostream>
#include <stdexcept>

ParserSelector::ParserSelector(AstParserFactory factory) : factory_(std::move(factory)) {
}

ParserSelector::AstParserFactory ParserSelector::treeSitterFactory(const fs::path& grammarDir) {
    return [grammarDir](Language language, const LanguageGrammarConfig& config) -> std::shared_ptr<CodeParser> {
        return std::make_shared<TreeSitterParser>(language, config, grammarDir);
    };
}

std::shared_ptr<CodeParser> ParserSelector::select(Language language) {
    std::promise<std::shared_ptr<CodeParser>> promise;
    ParserFuture future;
    bool owner = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = parsers_.find(language);
        if (it != parsers_.end()) {
            future = it->second;
        } else {
            future = promise.get_future().share();
            parsers_.emplace(language, future);
            owner = true;
        }
    }

    // Only the first caller initializes; everyone else waits on the shared result
    if (owner) {
        try {
            promise.set_value(initialize(language));
        } catch (...) {
            // Waiters must see the failure rather than a broken promise
            promise.set_exception(std::current_exception());
        }
    }
    return future.get();
}

std::shared_ptr<CodeParser> ParserSelector::initialize(Language language) {
    const LanguageGrammarConfig* config = getGrammarConfig(language);
    if (!config) {
        return std::make_shared<GenericParser>();
    }

    if (factory_) {
        try {
            auto parser = factory_(language, *config);
            if (parser) {
                return parser;
            }
            std::cerr << "Warning: No AST parser for " << languageToString(language) << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "Warning: Failed to initialize tree-sitter for " << languageToString(language)
                      << ": " << e.what() << std::endl;
        }
        std::cerr << "Warning: Falling back to pattern parser for " << languageToString(language) << std::endl;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    demoted_.insert(language);
    return std::make_shared<PatternParser>(language);
}

std::shared_ptr<CodeParser> ParserSelector::demote(Language language, const std::shared_ptr<CodeParser>& failed,
                                                   const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = parsers_.find(language);
    if (it != parsers_.end() && it->second.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        auto current = it->second.get();
        if (current != failed) {
            // Another thread already replaced it
            return current;
        }
    }

    // The failing parser is already the last resort for this language
    if (demoted_.count(language) || getGrammarConfig(language) == nullptr) {
        return nullptr;
    }

    std::cerr << "Warning: Tree-sitter parse failed for " << languageToString(language) << " (" << reason
              << "), falling back to pattern parser" << std::endl;

    std::shared_ptr<CodeParser> fallback = std::make_shared<PatternParser>(language);
    std::promise<std::shared_ptr<CodeParser>> ready;
    ready.set_value(fallback);
    parsers_[language] = ready.get_future().share();
    demoted_.insert(language);
    return fallback;
}

ParseResult ParserSelector::parse(Language language, const std::string& filePath, const std::string& content) {
    std::shared_ptr<CodeParser> parser = select(language);
    try {
        return parser->parse(filePath, content);
    } catch (const std::exception& e) {
        auto fallback = demote(language, parser, e.what());
        if (!fallback) {
            throw;
        }
        parser = fallback;
    }
    return parser->parse(filePath, content);
}
