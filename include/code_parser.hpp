#pragma once

#include <string>
#include <vector>
#include <memory>
#include <regex>
#include <filesystem>
#include "language.hpp"
#include "parse_result.hpp"
#include "grammar_registry.hpp"
#include "pattern_rules.hpp"

namespace fs = std::filesystem;

// Base class for the structural extraction strategies
class CodeParser {
public:
    virtual ~CodeParser() = default;

    // Extract functions, classes, imports and line counts from file content
    virtual ParseResult parse(const std::string& filePath, const std::string& content) const = 0;

    // Languages this parser can service
    virtual std::vector<Language> supportedLanguages() const = 0;

    // Short name for log messages ("tree-sitter", "pattern", "generic")
    virtual std::string name() const = 0;
};

// Tree-sitter based parser, highest precision
class TreeSitterParser : public CodeParser {
public:
    // Loads the grammar shared library; throws std::runtime_error if it is unavailable
    TreeSitterParser(Language language, const LanguageGrammarConfig& config,
                     const fs::path& grammarDir = fs::path());
    ~TreeSitterParser() override;

    ParseResult parse(const std::string& filePath, const std::string& content) const override;
    std::vector<Language> supportedLanguages() const override;
    std::string name() const override { return "tree-sitter"; }

private:
    Language language_;
    LanguageGrammarConfig config_;

    struct TreeSitterImpl;
    std::unique_ptr<TreeSitterImpl> impl_;
};

// Regex and brace/indent tracking parser, used when tree-sitter is unavailable
class PatternParser : public CodeParser {
public:
    explicit PatternParser(Language language);

    ParseResult parse(const std::string& filePath, const std::string& content) const override;
    std::vector<Language> supportedLanguages() const override;
    std::string name() const override { return "pattern"; }

private:
    struct CompiledRules {
        std::vector<std::regex> functionPatterns;
        std::vector<std::regex> classPatterns;
        std::regex singleComment;
        std::regex multiStart;
        std::regex multiEnd;
        std::vector<std::regex> complexityPatterns;
        std::vector<std::regex> methodPatterns;
        std::vector<std::regex> fieldPatterns;
        std::vector<std::regex> importPatterns;
        std::regex blockEnd;
        bool hasSingleComment = false;
        bool hasMultiComment = false;
        bool hasBlockEnd = false;
        bool indentBased = false;
        bool singleQuoteStrings = false;
        int indentUnit = 4;
    };

    enum class MemberKind { None, Method, Field };

    Language language_;
    CompiledRules rules_;

    void countLines(const std::vector<std::string>& lines, const std::vector<bool>& commentLines,
                    ParseResult& result) const;
    std::vector<bool> markCommentLines(const std::vector<std::string>& lines) const;
    std::vector<FunctionInfo> extractFunctionsBrace(const std::vector<std::string>& lines,
                                                    const std::vector<bool>& commentLines) const;
    std::vector<FunctionInfo> extractFunctionsIndent(const std::vector<std::string>& lines,
                                                     const std::vector<bool>& commentLines) const;
    std::vector<ClassInfo> extractClassesBrace(const std::vector<std::string>& lines,
                                               const std::vector<bool>& commentLines) const;
    std::vector<ClassInfo> extractClassesIndent(const std::vector<std::string>& lines,
                                                const std::vector<bool>& commentLines) const;
    std::vector<std::string> extractImports(const std::vector<std::string>& lines,
                                            const std::vector<bool>& commentLines) const;

    bool matchFunction(const std::string& trimmed, std::string& name) const;
    int lineComplexity(const std::string& trimmed) const;
    bool hasDocstring(const std::vector<std::string>& lines, const std::vector<bool>& commentLines,
                      size_t index) const;
    MemberKind classifyMember(const std::string& line, std::string& memberName) const;
    size_t indentWidth(const std::string& line) const;
};

// Cross-language keyword parser, the terminal fallback for unconfigured languages
class GenericParser : public CodeParser {
public:
    GenericParser();

    ParseResult parse(const std::string& filePath, const std::string& content) const override;
    std::vector<Language> supportedLanguages() const override;
    std::string name() const override { return "generic"; }

private:
    std::vector<std::regex> functionPatterns_;
    std::vector<std::regex> classPatterns_;
    std::vector<std::regex> importPatterns_;

    std::vector<bool> markCommentLines(const std::vector<std::string>& lines) const;
    int findBlockEnd(const std::vector<std::string>& lines, size_t start) const;
};

// Line helpers shared by the text-based parsers
namespace parser_utils {

// Split on '\n'; "a\nb\n" yields three lines, the last one empty
std::vector<std::string> splitLines(const std::string& content);

std::string trim(const std::string& text);

// Number of leading whitespace characters
size_t indentOf(const std::string& line);

// Count parameters in the first parenthesized list of a declaration line
int countParameters(const std::string& line);

// Lines longer than this are never handed to std::regex
constexpr size_t MAX_REGEX_LINE_LENGTH = 4096;

// regex_search guarded by MAX_REGEX_LINE_LENGTH
bool searchLine(const std::regex& pattern, const std::string& line, std::smatch* match = nullptr);

// Number of non-overlapping matches in the line
int countMatches(const std::regex& pattern, const std::string& line);

// Escape regex metacharacters so the text matches literally
std::string escapeRegex(const std::string& text);

} // namespace parser_utils
