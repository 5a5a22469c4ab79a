#include "code_parser.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

using namespace parser_utils;

namespace {

std::regex compile(const std::string& pattern) {
    return std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
}

std::vector<std::regex> compileAll(const std::vector<std::string>& patterns) {
    std::vector<std::regex> compiled;
    compiled.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        compiled.push_back(compile(pattern));
    }
    return compiled;
}

// Keyword to counting regex. Word keywords get word boundaries, operators match literally.
std::regex keywordPattern(const std::string& keyword) {
    if (keyword == "?") {
        // Ternary only; skip "??", "?." and optional markers "?:"
        return compile(R"((?:^|[^?])\?(?![?.:]))");
    }
    std::string pattern = escapeRegex(keyword);
    auto isWord = [](char ch) { return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_'; };
    if (isWord(keyword.front())) {
        pattern = "\\b" + pattern;
    }
    if (isWord(keyword.back())) {
        pattern += "\\b";
    }
    return compile(pattern);
}

bool isControlKeyword(const std::string& name) {
    const auto& keywords = controlKeywordList();
    return std::find(keywords.begin(), keywords.end(), name) != keywords.end();
}

// Index of the closing quote when a literal starts at pos, npos when pos is plain code.
// Unterminated strings run to the end of the line.
size_t literalEnd(const std::string& line, size_t pos, bool singleQuoteStrings) {
    const char quote = line[pos];
    if (quote == '\'' && !singleQuoteStrings) {
        // Char literals only ('x', '\n', '\u{41}'); Rust lifetimes stay code
        const size_t next = pos + 1;
        if (next < line.size() && line[next] == '\\') {
            const size_t close = line.find('\'', next + 2);
            return close != std::string::npos && close - pos <= 12 ? close : std::string::npos;
        }
        return next + 1 < line.size() && line[next + 1] == '\'' ? next + 1 : std::string::npos;
    }
    if (quote != '"' && quote != '\'' && quote != '`') {
        return std::string::npos;
    }
    for (size_t i = pos + 1; i < line.size(); ++i) {
        if (line[i] == '\\') {
            ++i;
        } else if (line[i] == quote) {
            return i;
        }
    }
    return line.size();
}

// Net brace change on a line, ignoring braces inside string and char literals
int braceDelta(const std::string& line, int& opens, bool singleQuoteStrings) {
    int delta = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        const size_t end = literalEnd(line, i, singleQuoteStrings);
        if (end != std::string::npos) {
            i = end;
            continue;
        }
        if (line[i] == '{') {
            ++delta;
            ++opens;
        } else if (line[i] == '}') {
            --delta;
        }
    }
    return delta;
}

} // namespace

PatternParser::PatternParser(Language language) : language_(language) {
    const PatternLanguageRules* rules = getPatternRules(language);
    if (!rules) {
        rules = getPatternRules(Language::JavaScript);
    }

    try {
        rules_.functionPatterns = compileAll(rules->functionPatterns);
        rules_.classPatterns = compileAll(rules->classPatterns);
        rules_.methodPatterns = compileAll(rules->methodPatterns);
        rules_.fieldPatterns = compileAll(rules->fieldPatterns);
        rules_.importPatterns = compileAll(importPatternList());

        if (!rules->singleComment.empty()) {
            rules_.singleComment = compile(rules->singleComment);
            rules_.hasSingleComment = true;
        }
        if (!rules->multiCommentStart.empty() && !rules->multiCommentEnd.empty()) {
            rules_.multiStart = compile(rules->multiCommentStart);
            rules_.multiEnd = compile(rules->multiCommentEnd);
            rules_.hasMultiComment = true;
        }
        if (!rules->blockEnd.empty()) {
            rules_.blockEnd = compile(rules->blockEnd);
            rules_.hasBlockEnd = true;
        }

        const bool hasIf = std::find(rules->branchKeywords.begin(), rules->branchKeywords.end(), "if") !=
                           rules->branchKeywords.end();
        for (const auto& keyword : rules->branchKeywords) {
            // "if" already counts every "else if"
            if (hasIf && keyword == "else if") {
                continue;
            }
            rules_.complexityPatterns.push_back(keywordPattern(keyword));
        }
        for (const auto& keyword : rules->loopKeywords) {
            rules_.complexityPatterns.push_back(keywordPattern(keyword));
        }
    } catch (const std::regex_error& e) {
        throw std::runtime_error("Invalid pattern rule for " + languageToString(language) + ": " + e.what());
    }

    rules_.indentBased = rules->indentBased;
    rules_.singleQuoteStrings = rules->singleQuoteStrings;
    rules_.indentUnit = std::max(1, rules->indentUnit);
}

std::vector<Language> PatternParser::supportedLanguages() const {
    return {language_};
}

ParseResult PatternParser::parse(const std::string& filePath, const std::string& content) const {
    ParseResult result;
    result.filePath = filePath;
    result.language = language_;

    const auto lines = splitLines(content);
    const auto commentLines = markCommentLines(lines);
    countLines(lines, commentLines, result);

    if (rules_.indentBased) {
        result.functions = extractFunctionsIndent(lines, commentLines);
        result.classes = extractClassesIndent(lines, commentLines);
    } else {
        result.functions = extractFunctionsBrace(lines, commentLines);
        result.classes = extractClassesBrace(lines, commentLines);
    }
    result.imports = extractImports(lines, commentLines);
    return result;
}

std::vector<bool> PatternParser::markCommentLines(const std::vector<std::string>& lines) const {
    std::vector<bool> marks(lines.size(), false);
    bool inBlock = false;

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string trimmed = trim(lines[i]);

        if (inBlock) {
            marks[i] = !trimmed.empty();
            if (searchLine(rules_.multiEnd, trimmed)) {
                inBlock = false;
            }
            continue;
        }
        if (trimmed.empty()) {
            continue;
        }
        if (rules_.hasSingleComment && searchLine(rules_.singleComment, trimmed)) {
            marks[i] = true;
            continue;
        }

        std::smatch match;
        if (rules_.hasMultiComment && searchLine(rules_.multiStart, trimmed, &match)) {
            // Code ahead of the opening marker keeps the line a code line
            marks[i] = match.position(0) == 0;
            // The closing marker must come after the opening one
            const std::string rest = match.suffix().str();
            if (!searchLine(rules_.multiEnd, rest)) {
                inBlock = true;
            }
        }
    }
    return marks;
}

void PatternParser::countLines(const std::vector<std::string>& lines, const std::vector<bool>& commentLines,
                               ParseResult& result) const {
    result.totalLines = static_cast<int>(lines.size());
    for (size_t i = 0; i < lines.size(); ++i) {
        if (trim(lines[i]).empty()) {
            ++result.blankLines;
        } else if (commentLines[i]) {
            ++result.commentLines;
        } else {
            ++result.codeLines;
        }
    }
}

bool PatternParser::matchFunction(const std::string& trimmed, std::string& name) const {
    std::smatch match;
    for (const auto& pattern : rules_.functionPatterns) {
        if (!searchLine(pattern, trimmed, &match)) {
            continue;
        }
        std::string captured = match.size() > 1 ? match[1].str() : std::string();
        if (captured.empty() || isControlKeyword(captured)) {
            continue;
        }
        name = captured;
        return true;
    }
    return false;
}

int PatternParser::lineComplexity(const std::string& trimmed) const {
    int total = 0;
    for (const auto& pattern : rules_.complexityPatterns) {
        total += countMatches(pattern, trimmed);
    }
    return total;
}

bool PatternParser::hasDocstring(const std::vector<std::string>& lines, const std::vector<bool>& commentLines,
                                 size_t index) const {
    if (index > 0 && commentLines[index - 1]) {
        return true;
    }
    if (rules_.indentBased) {
        for (size_t j = index + 1; j < lines.size(); ++j) {
            const std::string next = trim(lines[j]);
            if (next.empty()) {
                continue;
            }
            return next.rfind("\"\"\"", 0) == 0 || next.rfind("'''", 0) == 0;
        }
    }
    return false;
}

size_t PatternParser::indentWidth(const std::string& line) const {
    size_t width = 0;
    for (char ch : line) {
        if (ch == ' ') {
            ++width;
        } else if (ch == '\t') {
            width += static_cast<size_t>(rules_.indentUnit);
        } else {
            break;
        }
    }
    return width;
}

std::vector<FunctionInfo> PatternParser::extractFunctionsBrace(const std::vector<std::string>& lines,
                                                               const std::vector<bool>& commentLines) const {
    struct OpenFunction {
        FunctionInfo info;
        int baseDepth = 0;
        bool bodyOpened = false;
    };

    std::vector<FunctionInfo> functions;
    std::vector<OpenFunction> open;
    int depth = 0;

    auto close = [&](OpenFunction& fn, size_t index) {
        fn.info.endLine = static_cast<int>(index) + 1;
        fn.info.lineCount = fn.info.endLine - fn.info.startLine + 1;
        functions.push_back(fn.info);
    };

    // A match that never opened a body was only a declaration or a call.
    // Its branches belong to the enclosing function.
    auto dropUnopened = [&]() {
        if (open.empty() || open.back().bodyOpened) {
            return;
        }
        const int branches = open.back().info.complexity - 1;
        open.pop_back();
        if (!open.empty()) {
            open.back().info.complexity += branches;
        }
    };

    for (size_t i = 0; i < lines.size(); ++i) {
        if (commentLines[i]) {
            continue;
        }
        const std::string& line = lines[i];
        const std::string trimmed = trim(line);
        if (trimmed.empty()) {
            continue;
        }

        // Inside a body only a line that opens its own block can start a nested function
        std::string name;
        int lineOpens = 0;
        braceDelta(line, lineOpens, rules_.singleQuoteStrings);
        const bool insideBody = !open.empty() && open.back().bodyOpened;
        if ((!insideBody || lineOpens > 0) && matchFunction(trimmed, name)) {
            dropUnopened();
            OpenFunction fn;
            fn.info.name = name;
            fn.info.startLine = static_cast<int>(i) + 1;
            fn.info.parameterCount = countParameters(trimmed);
            fn.info.hasDocstring = hasDocstring(lines, commentLines, i);
            fn.baseDepth = depth;
            open.push_back(fn);
        }
        if (!open.empty()) {
            open.back().info.complexity += lineComplexity(trimmed);
        }

        for (size_t c = 0; c < line.size(); ++c) {
            const size_t end = literalEnd(line, c, rules_.singleQuoteStrings);
            if (end != std::string::npos) {
                c = end;
                continue;
            }

            const char ch = line[c];
            if (ch == ';') {
                dropUnopened();
            } else if (ch == '{') {
                ++depth;
                if (open.empty()) {
                    continue;
                }
                auto& current = open.back();
                if (!current.bodyOpened && depth == current.baseDepth + 1) {
                    current.bodyOpened = true;
                } else if (current.bodyOpened) {
                    current.info.nestingDepth = std::max(current.info.nestingDepth,
                                                         depth - current.baseDepth - 1);
                }
            } else if (ch == '}') {
                if (depth > 0) {
                    --depth;
                }
                while (!open.empty() && open.back().bodyOpened && depth <= open.back().baseDepth) {
                    close(open.back(), i);
                    open.pop_back();
                }
            }
        }
    }

    // Unterminated bodies run to the end of the file
    while (!open.empty()) {
        if (open.back().bodyOpened && !lines.empty()) {
            close(open.back(), lines.size() - 1);
        }
        open.pop_back();
    }

    std::stable_sort(functions.begin(), functions.end(),
                     [](const FunctionInfo& a, const FunctionInfo& b) { return a.startLine < b.startLine; });
    return functions;
}

std::vector<FunctionInfo> PatternParser::extractFunctionsIndent(const std::vector<std::string>& lines,
                                                                const std::vector<bool>& commentLines) const {
    std::vector<FunctionInfo> functions;
    const int unit = rules_.indentUnit;

    for (size_t i = 0; i < lines.size(); ++i) {
        if (commentLines[i]) {
            continue;
        }
        const std::string trimmed = trim(lines[i]);
        std::string name;
        if (trimmed.empty() || !matchFunction(trimmed, name)) {
            continue;
        }

        FunctionInfo fn;
        fn.name = name;
        fn.startLine = static_cast<int>(i) + 1;
        fn.endLine = fn.startLine;
        fn.parameterCount = countParameters(trimmed);
        fn.hasDocstring = hasDocstring(lines, commentLines, i);

        const size_t defIndent = indentWidth(lines[i]);
        long nestedIndent = -1;

        for (size_t j = i + 1; j < lines.size(); ++j) {
            const std::string body = trim(lines[j]);
            if (body.empty()) {
                continue;
            }
            const size_t bodyIndent = indentWidth(lines[j]);
            if (bodyIndent <= defIndent) {
                if (rules_.hasBlockEnd && bodyIndent == defIndent && searchLine(rules_.blockEnd, body)) {
                    fn.endLine = static_cast<int>(j) + 1;
                }
                break;
            }
            fn.endLine = static_cast<int>(j) + 1;
            if (commentLines[j]) {
                continue;
            }

            // Nested definitions are reported separately
            if (nestedIndent >= 0) {
                if (static_cast<long>(bodyIndent) > nestedIndent) {
                    continue;
                }
                nestedIndent = -1;
            }
            std::string nestedName;
            if (matchFunction(body, nestedName)) {
                nestedIndent = static_cast<long>(bodyIndent);
                continue;
            }

            fn.complexity += lineComplexity(body);
            const long offset = static_cast<long>(bodyIndent) - static_cast<long>(defIndent) - unit;
            if (offset > 0) {
                fn.nestingDepth = std::max(fn.nestingDepth, static_cast<int>(offset / unit));
            }
        }

        fn.lineCount = fn.endLine - fn.startLine + 1;
        functions.push_back(fn);
    }
    return functions;
}

PatternParser::MemberKind PatternParser::classifyMember(const std::string& line, std::string& memberName) const {
    std::smatch match;
    memberName.clear();

    if (rules_.methodPatterns.empty()) {
        if (matchFunction(trim(line), memberName)) {
            return MemberKind::Method;
        }
    } else {
        for (const auto& pattern : rules_.methodPatterns) {
            if (searchLine(pattern, line, &match)) {
                memberName = match.size() > 1 ? match[1].str() : std::string();
                if (!isControlKeyword(memberName)) {
                    return MemberKind::Method;
                }
            }
        }
    }

    for (const auto& pattern : rules_.fieldPatterns) {
        if (searchLine(pattern, line, &match)) {
            memberName = match.size() > 1 ? match[1].str() : std::string();
            if (!isControlKeyword(memberName)) {
                return MemberKind::Field;
            }
        }
    }
    memberName.clear();
    return MemberKind::None;
}

std::vector<ClassInfo> PatternParser::extractClassesBrace(const std::vector<std::string>& lines,
                                                          const std::vector<bool>& commentLines) const {
    std::vector<ClassInfo> classes;

    for (size_t i = 0; i < lines.size(); ++i) {
        if (commentLines[i]) {
            continue;
        }
        const std::string trimmed = trim(lines[i]);
        std::smatch match;
        bool matched = false;
        for (const auto& pattern : rules_.classPatterns) {
            if (searchLine(pattern, trimmed, &match)) {
                matched = true;
                break;
            }
        }
        if (!matched) {
            continue;
        }

        ClassInfo cls;
        cls.name = match.size() > 1 ? match[1].str() : std::string();
        cls.startLine = static_cast<int>(i) + 1;
        cls.endLine = cls.startLine;

        int opens = 0;
        int depth = braceDelta(lines[i], opens, rules_.singleQuoteStrings);
        size_t j = i + 1;
        if (opens == 0 || depth > 0) {
            for (; j < lines.size(); ++j) {
                if (commentLines[j]) {
                    continue;
                }
                // Members sit directly inside the class braces
                if (depth == 1 && !trim(lines[j]).empty()) {
                    std::string memberName;
                    MemberKind kind = classifyMember(lines[j], memberName);
                    if (kind == MemberKind::Method) {
                        ++cls.methodCount;
                    } else if (kind == MemberKind::Field) {
                        ++cls.fieldCount;
                    }
                }
                depth += braceDelta(lines[j], opens, rules_.singleQuoteStrings);
                if (opens > 0 && depth <= 0) {
                    cls.endLine = static_cast<int>(j) + 1;
                    break;
                }
                // A declaration without a body
                if (opens == 0 && trim(lines[j]).find(';') != std::string::npos) {
                    break;
                }
            }
            if (j == lines.size() && opens > 0 && !lines.empty()) {
                cls.endLine = static_cast<int>(lines.size());
            }
        }
        classes.push_back(cls);
    }
    return classes;
}

std::vector<ClassInfo> PatternParser::extractClassesIndent(const std::vector<std::string>& lines,
                                                           const std::vector<bool>& commentLines) const {
    std::vector<ClassInfo> classes;

    for (size_t i = 0; i < lines.size(); ++i) {
        if (commentLines[i]) {
            continue;
        }
        const std::string trimmed = trim(lines[i]);
        std::smatch match;
        bool matched = false;
        for (const auto& pattern : rules_.classPatterns) {
            if (searchLine(pattern, trimmed, &match)) {
                matched = true;
                break;
            }
        }
        if (!matched) {
            continue;
        }

        ClassInfo cls;
        cls.name = match.size() > 1 ? match[1].str() : std::string();
        cls.startLine = static_cast<int>(i) + 1;
        cls.endLine = cls.startLine;

        const size_t classIndent = indentWidth(lines[i]);
        long memberIndent = -1;
        std::set<std::string> fieldNames;
        int unnamedFields = 0;

        for (size_t j = i + 1; j < lines.size(); ++j) {
            const std::string body = trim(lines[j]);
            if (body.empty()) {
                continue;
            }
            const size_t bodyIndent = indentWidth(lines[j]);
            if (bodyIndent <= classIndent) {
                if (rules_.hasBlockEnd && bodyIndent == classIndent && searchLine(rules_.blockEnd, body)) {
                    cls.endLine = static_cast<int>(j) + 1;
                }
                break;
            }
            cls.endLine = static_cast<int>(j) + 1;
            if (commentLines[j]) {
                continue;
            }
            if (memberIndent < 0) {
                memberIndent = static_cast<long>(bodyIndent);
            }

            std::string memberName;
            MemberKind kind = classifyMember(lines[j], memberName);
            if (kind == MemberKind::Method && static_cast<long>(bodyIndent) == memberIndent) {
                ++cls.methodCount;
            } else if (kind == MemberKind::Field) {
                // self.x / @x assignments repeat across methods
                if (memberName.empty()) {
                    ++unnamedFields;
                } else {
                    fieldNames.insert(memberName);
                }
            }
        }

        cls.fieldCount = static_cast<int>(fieldNames.size()) + unnamedFields;
        classes.push_back(cls);
    }
    return classes;
}

std::vector<std::string> PatternParser::extractImports(const std::vector<std::string>& lines,
                                                       const std::vector<bool>& commentLines) const {
    std::vector<std::string> imports;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (commentLines[i]) {
            continue;
        }
        const std::string trimmed = trim(lines[i]);
        if (trimmed.empty()) {
            continue;
        }
        std::smatch match;
        for (const auto& pattern : rules_.importPatterns) {
            if (searchLine(pattern, trimmed, &match) && match.size() > 1 && match[1].matched) {
                imports.push_back(match[1].str());
                break;
            }
        }
    }
    return imports;
}
