#include "pattern_rules.hpp"
#include <unordered_map>

namespace {

const char* const C_SINGLE = R"(^\s*//)";
const char* const C_MULTI_START = R"(/\*)";
const char* const C_MULTI_END = R"(\*/)";

PatternLanguageRules goRules() {
    PatternLanguageRules rules;
    rules.functionPatterns = {R"(^func\s+(?:\([^)]+\)\s+)?(\w+)\s*\()"};
    rules.classPatterns = {R"(^type\s+(\w+)\s+struct\s*\{)"};
    rules.singleComment = C_SINGLE;
    rules.multiCommentStart = C_MULTI_START;
    rules.multiCommentEnd = C_MULTI_END;
    rules.branchKeywords = {"if", "else if", "case", "default", "&&", "||"};
    rules.loopKeywords = {"for", "range"};
    rules.methodPatterns = {R"(^func\s+\([^)]+\)\s+(\w+)\s*\()"};
    rules.fieldPatterns = {R"(^\s+\w+\s+\S+)"};
    return rules;
}

PatternLanguageRules javascriptRules() {
    PatternLanguageRules rules;
    rules.functionPatterns = {
        R"(^(?:export\s+)?(?:default\s+)?(?:async\s+)?function\s*\*?\s*(\w+)\s*\()",
        R"(^(?:export\s+)?(?:const|let|var)\s+(\w+)\s*=\s*(?:async\s+)?(?:function|\([^)]*\)\s*=>|\w+\s*=>))",
        R"(^(?:async\s+)?(\w+)\s*\([^)]*\)\s*\{)"
    };
    rules.classPatterns = {R"(^(?:export\s+)?(?:default\s+)?class\s+(\w+))"};
    rules.singleComment = C_SINGLE;
    rules.multiCommentStart = C_MULTI_START;
    rules.multiCommentEnd = C_MULTI_END;
    rules.branchKeywords = {"if", "else if", "case", "default", "?", "&&", "||", "??"};
    rules.loopKeywords = {"for", "while", "do"};
    rules.methodPatterns = {R"(^\s+(?:static\s+)?(?:async\s+)?(\w+)\s*\([^)]*\)\s*\{)"};
    rules.fieldPatterns = {R"(^\s+(?:static\s+)?#?(\w+)\s*[=;])"};
    rules.singleQuoteStrings = true;
    return rules;
}

PatternLanguageRules typescriptRules() {
    PatternLanguageRules rules = javascriptRules();
    rules.functionPatterns = {
        R"(^(?:export\s+)?(?:default\s+)?(?:async\s+)?function\s*\*?\s*(\w+)\s*[<(])",
        R"(^(?:export\s+)?(?:const|let|var)\s+(\w+)\s*(?::\s*[^=]+)?\s*=\s*(?:async\s+)?(?:function|\([^)]*\)\s*=>|\w+\s*=>))",
        R"(^(?:public|private|protected)?\s*(?:static\s+)?(?:async\s+)?(\w+)\s*\([^)]*\)\s*(?::\s*[^{]+)?\s*\{)"
    };
    rules.classPatterns = {
        R"(^(?:export\s+)?(?:default\s+)?(?:abstract\s+)?class\s+(\w+))",
        R"(^(?:export\s+)?interface\s+(\w+))"
    };
    rules.methodPatterns = {
        R"(^\s+(?:public|private|protected)?\s*(?:static\s+)?(?:async\s+)?(\w+)\s*\([^)]*\))"
    };
    rules.fieldPatterns = {
        R"(^\s+(?:public|private|protected)?\s*(?:static\s+)?(?:readonly\s+)?(\w+)\s*[?:;=])"
    };
    return rules;
}

PatternLanguageRules pythonRules() {
    PatternLanguageRules rules;
    rules.functionPatterns = {R"(^(?:async\s+)?def\s+(\w+)\s*\()"};
    rules.classPatterns = {R"(^class\s+(\w+))"};
    rules.singleComment = R"(^\s*#)";
    rules.multiCommentStart = R"(^(?:"""|'''))";
    rules.multiCommentEnd = R"((?:"""|''')$)";
    rules.branchKeywords = {"if", "elif", "else", "and", "or", "except"};
    rules.loopKeywords = {"for", "while"};
    rules.indentBased = true;
    rules.indentUnit = 4;
    rules.methodPatterns = {R"(^\s+(?:async\s+)?def\s+(\w+)\s*\()"};
    rules.fieldPatterns = {R"(^\s+self\.(\w+)\s*=)"};
    rules.singleQuoteStrings = true;
    return rules;
}

PatternLanguageRules javaRules() {
    PatternLanguageRules rules;
    rules.functionPatterns = {
        R"(^(?:public|private|protected)?\s*(?:static\s+)?(?:final\s+)?(?:synchronized\s+)?(?:\w+(?:<[^>]+>)?(?:\[\])?)\s+(\w+)\s*\()"
    };
    rules.classPatterns = {
        R"(^(?:public\s+|private\s+|protected\s+)?(?:static\s+)?(?:abstract\s+)?(?:final\s+)?(?:class|interface|enum)\s+(\w+))"
    };
    rules.singleComment = C_SINGLE;
    rules.multiCommentStart = C_MULTI_START;
    rules.multiCommentEnd = C_MULTI_END;
    rules.branchKeywords = {"if", "else if", "case", "default", "?", "&&", "||"};
    rules.loopKeywords = {"for", "while", "do"};
    rules.methodPatterns = {
        R"(^\s+(?:public|private|protected)?\s*(?:static\s+)?(?:final\s+)?(?:\w+(?:<[^>]+>)?(?:\[\])?)\s+(\w+)\s*\()"
    };
    rules.fieldPatterns = {
        R"(^\s+(?:public|private|protected)?\s*(?:static\s+)?(?:final\s+)?(?:\w+(?:<[^>]+>)?(?:\[\])?)\s+(\w+)\s*[;=])"
    };
    return rules;
}

PatternLanguageRules cRules() {
    PatternLanguageRules rules;
    rules.functionPatterns = {R"(^(?:\w+\s+\**)+\**(\w+)\s*\([^)]*\)\s*\{)"};
    rules.classPatterns = {R"(^(?:typedef\s+)?(?:struct|union|enum)\s+(\w+))"};
    rules.singleComment = C_SINGLE;
    rules.multiCommentStart = C_MULTI_START;
    rules.multiCommentEnd = C_MULTI_END;
    rules.branchKeywords = {"if", "else if", "case", "default", "?", "&&", "||"};
    rules.loopKeywords = {"for", "while", "do"};
    rules.fieldPatterns = {R"(^\s+(?:const\s+)?(?:struct\s+)?\w+\s+\**\w+(?:\[[^\]]*\])?\s*;)"};
    return rules;
}

PatternLanguageRules cppRules() {
    PatternLanguageRules rules;
    rules.functionPatterns = {
        R"(^(?:virtual\s+|static\s+|inline\s+)*(?:[\w:]+(?:<[^>]+>)?[\s*&]+)+([\w:~]+)\s*\([^)]*\)\s*(?:const\s*)?(?:noexcept\s*)?(?:override\s*)?\{)"
    };
    rules.classPatterns = {
        R"(^(?:template\s*<[^>]+>\s*)?(?:class|struct)\s+(\w+)(?:\s*final)?\s*(?::[^{;]*)?\{?\s*$)"
    };
    rules.singleComment = C_SINGLE;
    rules.multiCommentStart = C_MULTI_START;
    rules.multiCommentEnd = C_MULTI_END;
    rules.branchKeywords = {"if", "else if", "case", "default", "?", "&&", "||"};
    rules.loopKeywords = {"for", "while", "do"};
    rules.methodPatterns = {
        R"(^\s+(?:virtual\s+|static\s+|inline\s+|explicit\s+)*(?:[\w:]+(?:<[^>]+>)?[\s*&]+)*~?(\w+)\s*\([^)]*\)\s*(?:const\s*)?(?:noexcept\s*)?(?:override\s*)?(?:=\s*\w+\s*)?[{;])"
    };
    rules.fieldPatterns = {R"(^\s+(?:static\s+|const\s+|mutable\s+)*[\w:]+(?:<[^>]+>)?[\s*&]+\w+\s*(?:=[^;(]*)?;)"};
    return rules;
}

PatternLanguageRules rustRules() {
    PatternLanguageRules rules;
    rules.functionPatterns = {R"(^(?:pub(?:\([^)]*\))?\s+)?(?:const\s+)?(?:async\s+)?(?:unsafe\s+)?fn\s+(\w+))"};
    rules.classPatterns = {
        R"(^(?:pub(?:\([^)]*\))?\s+)?struct\s+(\w+))",
        R"(^(?:pub(?:\([^)]*\))?\s+)?enum\s+(\w+))",
        R"(^(?:pub(?:\([^)]*\))?\s+)?trait\s+(\w+))"
    };
    rules.singleComment = C_SINGLE;
    rules.multiCommentStart = C_MULTI_START;
    rules.multiCommentEnd = C_MULTI_END;
    rules.branchKeywords = {"if", "else if", "match", "=>", "&&", "||"};
    rules.loopKeywords = {"for", "while", "loop"};
    rules.methodPatterns = {R"(^\s+(?:pub(?:\([^)]*\))?\s+)?(?:async\s+)?fn\s+(\w+))"};
    rules.fieldPatterns = {R"(^\s+(?:pub(?:\([^)]*\))?\s+)?\w+\s*:)"};
    return rules;
}

PatternLanguageRules csharpRules() {
    PatternLanguageRules rules;
    rules.functionPatterns = {
        R"(^(?:public|private|protected|internal)?\s*(?:static\s+)?(?:virtual\s+|override\s+|abstract\s+)?(?:async\s+)?(?:\w+(?:<[^>]+>)?(?:\[\])?\??)\s+(\w+)\s*\()"
    };
    rules.classPatterns = {
        R"(^(?:public\s+|internal\s+|private\s+)?(?:static\s+)?(?:abstract\s+)?(?:sealed\s+)?(?:partial\s+)?(?:class|struct|interface)\s+(\w+))"
    };
    rules.singleComment = C_SINGLE;
    rules.multiCommentStart = C_MULTI_START;
    rules.multiCommentEnd = C_MULTI_END;
    rules.branchKeywords = {"if", "else if", "case", "default", "?", "&&", "||", "??"};
    rules.loopKeywords = {"for", "foreach", "while", "do"};
    rules.methodPatterns = {
        R"(^\s+(?:public|private|protected|internal)?\s*(?:static\s+)?(?:virtual\s+|override\s+|abstract\s+)?(?:async\s+)?(?:\w+(?:<[^>]+>)?(?:\[\])?\??)\s+(\w+)\s*\()"
    };
    rules.fieldPatterns = {
        R"(^\s+(?:public|private|protected|internal)?\s*(?:static\s+)?(?:readonly\s+)?(?:\w+(?:<[^>]+>)?(?:\[\])?\??)\s+(\w+)\s*(?:[;=]|\{\s*get))"
    };
    return rules;
}

PatternLanguageRules luaRules() {
    PatternLanguageRules rules;
    rules.functionPatterns = {
        R"(^(?:local\s+)?function\s+(\w+(?:[.:]\w+)*)\s*\()",
        R"(^(?:local\s+)?(\w+(?:\.\w+)*)\s*=\s*function\s*\()"
    };
    rules.singleComment = R"(^\s*--(?!\[\[))";
    rules.multiCommentStart = R"(--\[\[)";
    rules.multiCommentEnd = R"(\]\])";
    rules.branchKeywords = {"if", "elseif", "and", "or"};
    rules.loopKeywords = {"for", "while", "repeat"};
    rules.indentBased = true;
    rules.indentUnit = 4;
    rules.blockEnd = R"(^end\b)";
    rules.singleQuoteStrings = true;
    return rules;
}

PatternLanguageRules phpRules() {
    PatternLanguageRules rules;
    rules.functionPatterns = {
        R"(^(?:(?:public|private|protected|static|abstract|final)\s+)*function\s+&?(\w+)\s*\()"
    };
    rules.classPatterns = {
        R"(^(?:(?:abstract|final|readonly)\s+)*(?:class|interface|trait|enum)\s+(\w+))"
    };
    rules.singleComment = R"(^\s*(?://|#))";
    rules.multiCommentStart = C_MULTI_START;
    rules.multiCommentEnd = C_MULTI_END;
    rules.branchKeywords = {"if", "elseif", "else if", "case", "default", "?", "&&", "||", "??"};
    rules.loopKeywords = {"for", "foreach", "while", "do"};
    rules.methodPatterns = {
        R"(^\s+(?:(?:public|private|protected|static|abstract|final)\s+)*function\s+&?(\w+)\s*\()"
    };
    rules.fieldPatterns = {
        R"(^\s+(?:(?:public|private|protected|static|readonly|var)\s+)+(?:\??[\w\\]+\s+)?\$(\w+))"
    };
    rules.singleQuoteStrings = true;
    return rules;
}

PatternLanguageRules rubyRules() {
    PatternLanguageRules rules;
    rules.functionPatterns = {R"(^def\s+(?:self\.)?(\w+[?!=]?))"};
    rules.classPatterns = {R"(^(?:class|module)\s+([A-Za-z_]\w*))"};
    rules.singleComment = R"(^\s*#)";
    rules.multiCommentStart = R"(^=begin)";
    rules.multiCommentEnd = R"(^=end)";
    rules.branchKeywords = {"if", "elsif", "unless", "case", "when", "rescue", "and", "or", "&&", "||"};
    rules.loopKeywords = {"for", "while", "until", "loop"};
    rules.indentBased = true;
    rules.indentUnit = 2;
    rules.blockEnd = R"(^end\b)";
    rules.methodPatterns = {R"(^\s+def\s+(?:self\.)?(\w+))"};
    rules.fieldPatterns = {
        R"(^\s+attr_(?:accessor|reader|writer)\b)",
        R"(^\s+@(\w+)\s*=[^=])"
    };
    rules.singleQuoteStrings = true;
    return rules;
}

PatternLanguageRules swiftRules() {
    PatternLanguageRules rules;
    rules.functionPatterns = {
        R"(^(?:(?:public|private|fileprivate|internal|open|static|class|override|mutating|final|@\w+)\s+)*func\s+(\w+))"
    };
    rules.classPatterns = {
        R"(^(?:(?:public|private|fileprivate|internal|open|final)\s+)*(?:class|struct|protocol|enum|actor)\s+(\w+))"
    };
    rules.singleComment = C_SINGLE;
    rules.multiCommentStart = C_MULTI_START;
    rules.multiCommentEnd = C_MULTI_END;
    rules.branchKeywords = {"if", "else if", "guard", "case", "default", "?", "&&", "||", "??"};
    rules.loopKeywords = {"for", "while", "repeat"};
    rules.methodPatterns = {
        R"(^\s+(?:(?:public|private|fileprivate|internal|open|static|class|override|mutating|final|@\w+)\s+)*func\s+(\w+))"
    };
    rules.fieldPatterns = {
        R"(^\s+(?:(?:public|private|fileprivate|internal|open|static|lazy|weak|final|@\w+)\s+)*(?:var|let)\s+(\w+))"
    };
    return rules;
}

PatternLanguageRules shellRules() {
    PatternLanguageRules rules;
    rules.functionPatterns = {
        R"(^function\s+([-\w]+)\s*(?:\(\s*\))?)",
        R"(^([-\w]+)\s*\(\s*\))"
    };
    rules.singleComment = R"(^\s*#)";
    rules.multiCommentStart = R"(^:\s*<<\s*['"]?COMMENT)";
    rules.multiCommentEnd = R"(^COMMENT$)";
    rules.branchKeywords = {"if", "elif", "case", "&&", "||"};
    rules.loopKeywords = {"for", "while", "until"};
    rules.singleQuoteStrings = true;
    return rules;
}

const std::unordered_map<Language, PatternLanguageRules>& rulesTable() {
    static const std::unordered_map<Language, PatternLanguageRules> table = {
        {Language::Go, goRules()},
        {Language::JavaScript, javascriptRules()},
        {Language::TypeScript, typescriptRules()},
        {Language::Python, pythonRules()},
        {Language::Java, javaRules()},
        {Language::C, cRules()},
        {Language::Cpp, cppRules()},
        {Language::Rust, rustRules()},
        {Language::CSharp, csharpRules()},
        {Language::Lua, luaRules()},
        {Language::Php, phpRules()},
        {Language::Ruby, rubyRules()},
        {Language::Swift, swiftRules()},
        {Language::Shell, shellRules()}
    };
    return table;
}

} // namespace

const PatternLanguageRules* getPatternRules(Language language) {
    const auto& table = rulesTable();
    auto it = table.find(language);
    if (it == table.end()) {
        return nullptr;
    }
    return &it->second;
}

const std::vector<std::string>& importPatternList() {
    static const std::vector<std::string> patterns = {
        R"(^import\s+["']([^"']+)["'])",
        R"(^import\s+.*\s+from\s+["']([^"']+)["'])",
        R"(^from\s+(\S+)\s+import)",
        R"(^(?:const|let|var)\s+.*=\s*require\s*\(\s*["']([^"']+)["']\s*\))",
        R"(^require(?:_relative)?\s*\(?\s*["']([^"']+)["'])",
        R"(^#include\s*[<"]([^>"]+)[>"])",
        R"(^use\s+([^;\s]+))",
        R"(^using\s+([^;\s]+))",
        R"re(^import\s+"([^"]+)")re",
        R"(^import\s+([\w.]+))"
    };
    return patterns;
}

const std::vector<std::string>& controlKeywordList() {
    static const std::vector<std::string> keywords = {
        "if", "else", "elif", "for", "foreach", "while", "do", "switch", "case", "catch",
        "return", "with", "until", "guard", "sizeof", "typeof", "function", "new", "delete"
    };
    return keywords;
}
