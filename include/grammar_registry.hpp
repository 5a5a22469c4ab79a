#pragma once

#include <string>
#include <vector>
#include "language.hpp"

// Syntax-node roles for one tree-sitter grammar
struct LanguageGrammarConfig {
    std::string grammarName;                      // Entry symbol is tree_sitter_<grammarName>
    std::vector<std::string> functionNodeTypes;
    std::vector<std::string> classNodeTypes;
    std::vector<std::string> importNodeTypes;
    std::vector<std::string> complexityNodeTypes;
    std::vector<std::string> nestingNodeTypes;
    std::vector<std::string> commentNodeTypes;
    std::string functionNameField = "name";
    std::string functionParamsField = "parameters";
    std::string functionBodyField = "body";
    std::string classNameField = "name";
    std::string classBodyField = "body";
    std::vector<std::string> methodNodeTypes;
    std::vector<std::string> fieldNodeTypes;
};

// Grammar configuration for a language, or nullptr when the language has none
const LanguageGrammarConfig* getGrammarConfig(Language language);

// Candidate shared-library file names for a grammar, most specific first
std::vector<std::string> grammarLibraryNames(const LanguageGrammarConfig& config);
