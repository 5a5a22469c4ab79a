#include "code_parser.hpp"
#include <algorithm>

using namespace parser_utils;

namespace {

const std::vector<std::string> GENERIC_FUNCTION_PATTERNS = {
    R"(^(?:export\s+)?(?:async\s+)?function\s+(\w+))",
    R"(^(?:pub\s+)?(?:async\s+)?fn\s+(\w+))",
    R"(^(?:async\s+)?def\s+(\w+))",
    R"(^func\s+(?:\([^)]+\)\s+)?(\w+))",
    R"(^(?:public|private|protected)?\s*(?:static\s+)?(?:\w+\s+)+(\w+)\s*\([^)]*\)\s*\{)",
    R"(^(?:local\s+)?function\s+(\w+))"
};

const std::vector<std::string> GENERIC_CLASS_PATTERNS = {
    R"(^(?:export\s+)?(?:abstract\s+)?class\s+(\w+))",
    R"(^(?:pub\s+)?struct\s+(\w+))",
    R"(^type\s+(\w+)\s+struct)",
    R"(^(?:pub\s+)?enum\s+(\w+))"
};

bool startsWith(const std::string& text, const char* prefix) {
    return text.rfind(prefix, 0) == 0;
}

bool isControlKeyword(const std::string& name) {
    const auto& keywords = controlKeywordList();
    return std::find(keywords.begin(), keywords.end(), name) != keywords.end();
}

// First capture of the first matching pattern, empty when none match
std::string firstCapture(const std::vector<std::regex>& patterns, const std::string& line) {
    std::smatch match;
    for (const auto& pattern : patterns) {
        if (searchLine(pattern, line, &match) && match.size() > 1 && match[1].matched) {
            return match[1].str();
        }
    }
    return std::string();
}

} // namespace

GenericParser::GenericParser() {
    for (const auto& pattern : GENERIC_FUNCTION_PATTERNS) {
        functionPatterns_.emplace_back(pattern);
    }
    for (const auto& pattern : GENERIC_CLASS_PATTERNS) {
        classPatterns_.emplace_back(pattern);
    }
    for (const auto& pattern : importPatternList()) {
        importPatterns_.emplace_back(pattern);
    }
}

std::vector<Language> GenericParser::supportedLanguages() const {
    return {Language::Unknown};
}

std::vector<bool> GenericParser::markCommentLines(const std::vector<std::string>& lines) const {
    std::vector<bool> marks(lines.size(), false);
    bool inBlock = false;

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string trimmed = trim(lines[i]);
        if (trimmed.empty()) {
            continue;
        }
        if (inBlock) {
            marks[i] = true;
            if (trimmed.find("*/") != std::string::npos) {
                inBlock = false;
            }
            continue;
        }
        if (startsWith(trimmed, "/*")) {
            marks[i] = true;
            if (trimmed.find("*/", 2) == std::string::npos) {
                inBlock = true;
            }
            continue;
        }
        if (startsWith(trimmed, "//") || startsWith(trimmed, "#") || startsWith(trimmed, "--")) {
            marks[i] = true;
        }
    }
    return marks;
}

int GenericParser::findBlockEnd(const std::vector<std::string>& lines, size_t start) const {
    int braceCount = 0;
    bool foundBrace = false;

    for (size_t i = start; i < lines.size(); ++i) {
        for (char ch : lines[i]) {
            if (ch == '{') {
                ++braceCount;
                foundBrace = true;
            } else if (ch == '}') {
                --braceCount;
            }
        }
        if (foundBrace && braceCount == 0) {
            return static_cast<int>(i) + 1;
        }
    }

    // No balanced braces: the block ends before the next line at or left of the header
    const size_t baseIndent = indentOf(lines[start]);
    int lastBodyLine = static_cast<int>(start) + 1;
    for (size_t i = start + 1; i < lines.size(); ++i) {
        if (trim(lines[i]).empty()) {
            continue;
        }
        if (indentOf(lines[i]) <= baseIndent) {
            return lastBodyLine;
        }
        lastBodyLine = static_cast<int>(i) + 1;
    }
    return lastBodyLine;
}

ParseResult GenericParser::parse(const std::string& filePath, const std::string& content) const {
    ParseResult result;
    result.filePath = filePath;
    result.language = Language::Unknown;

    const auto lines = splitLines(content);
    const auto commentLines = markCommentLines(lines);
    result.totalLines = static_cast<int>(lines.size());

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string trimmed = trim(lines[i]);
        if (trimmed.empty()) {
            ++result.blankLines;
            continue;
        }
        if (commentLines[i]) {
            ++result.commentLines;
            continue;
        }
        ++result.codeLines;

        std::string name = firstCapture(functionPatterns_, trimmed);
        if (!name.empty() && !isControlKeyword(name)) {
            FunctionInfo fn;
            fn.name = name;
            fn.startLine = static_cast<int>(i) + 1;
            fn.endLine = std::max(fn.startLine, findBlockEnd(lines, i));
            fn.lineCount = fn.endLine - fn.startLine + 1;
            fn.parameterCount = countParameters(trimmed);
            result.functions.push_back(fn);
            continue;
        }

        name = firstCapture(classPatterns_, trimmed);
        if (!name.empty()) {
            ClassInfo cls;
            cls.name = name;
            cls.startLine = static_cast<int>(i) + 1;
            cls.endLine = std::max(cls.startLine, findBlockEnd(lines, i));
            result.classes.push_back(cls);
        }
    }

    // Imports are read from every line; "#include" looks like a comment here
    for (const auto& line : lines) {
        std::string module = firstCapture(importPatterns_, trim(line));
        if (!module.empty()) {
            result.imports.push_back(module);
        }
    }
    return result;
}
