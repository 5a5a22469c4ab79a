#pragma once

#include <string>
#include <vector>
#include "language.hpp"

// Regex tables for the pattern parser. Patterns are ECMAScript syntax and are matched
// against trimmed lines unless noted otherwise.
struct PatternLanguageRules {
    std::vector<std::string> functionPatterns;   // Capture group 1 is the name
    std::vector<std::string> classPatterns;      // Capture group 1 is the name
    std::string singleComment;
    std::string multiCommentStart;
    std::string multiCommentEnd;
    std::vector<std::string> branchKeywords;
    std::vector<std::string> loopKeywords;
    bool indentBased = false;
    int indentUnit = 4;
    std::string blockEnd;                        // Closing line of an indent block, e.g. "end"
    std::vector<std::string> methodPatterns;     // Matched against the untrimmed line
    std::vector<std::string> fieldPatterns;      // Matched against the untrimmed line
    bool singleQuoteStrings = false;             // '...' is a string, not a char literal
};

// Rules for a language, or nullptr when it has no table
const PatternLanguageRules* getPatternRules(Language language);

// Import statement patterns shared by every language
const std::vector<std::string>& importPatternList();

// Names that a declaration pattern can capture but which are control keywords
const std::vector<std::string>& controlKeywordList();
