#pragma once

#include <string>
#include <vector>
#include <optional>
#include "language.hpp"

// One function, method, or named anonymous function
struct FunctionInfo {
    std::string name;
    int startLine = 0;          // 1-based, inclusive
    int endLine = 0;            // 1-based, inclusive
    int lineCount = 0;
    int complexity = 1;         // Branch + logical operator occurrences, base 1
    int parameterCount = 0;
    int nestingDepth = 0;       // Excludes constructs inside nested function bodies
    bool hasDocstring = false;
};

// One class, struct, interface, or enum
struct ClassInfo {
    std::string name;
    int startLine = 0;
    int endLine = 0;
    int methodCount = 0;
    int fieldCount = 0;
};

// Structural facts extracted from one file
struct ParseResult {
    std::string filePath;
    Language language = Language::Unknown;
    int totalLines = 0;
    int codeLines = 0;
    int commentLines = 0;
    int blankLines = 0;
    std::vector<FunctionInfo> functions;
    std::vector<ClassInfo> classes;
    std::vector<std::string> imports;
    std::vector<std::string> errors;
    std::optional<std::string> content;  // Raw text, attached by the analyzer
};
