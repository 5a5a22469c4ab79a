#include "grammar_registry.hpp"
#include <algorithm>
#include <unordered_map>

namespace {

LanguageGrammarConfig goGrammar() {
    LanguageGrammarConfig config;
    config.grammarName = "go";
    config.functionNodeTypes = {"function_declaration", "method_declaration"};
    config.classNodeTypes = {"type_declaration"};
    config.importNodeTypes = {"import_declaration"};
    config.complexityNodeTypes = {
        "if_statement", "for_statement", "expression_switch_statement", "type_switch_statement",
        "select_statement", "expression_case", "type_case", "default_case", "binary_expression"
    };
    config.nestingNodeTypes = {
        "if_statement", "for_statement", "expression_switch_statement", "type_switch_statement",
        "select_statement", "func_literal"
    };
    config.commentNodeTypes = {"comment"};
    config.classBodyField = "type";
    config.methodNodeTypes = {"method_declaration"};
    config.fieldNodeTypes = {"field_declaration"};
    return config;
}

LanguageGrammarConfig javascriptGrammar() {
    LanguageGrammarConfig config;
    config.grammarName = "javascript";
    config.functionNodeTypes = {
        "function_declaration", "method_definition", "arrow_function", "generator_function_declaration"
    };
    config.classNodeTypes = {"class_declaration"};
    config.importNodeTypes = {"import_statement"};
    config.complexityNodeTypes = {
        "if_statement", "for_statement", "for_in_statement", "while_statement", "do_statement",
        "switch_case", "catch_clause", "ternary_expression", "binary_expression"
    };
    config.nestingNodeTypes = {
        "if_statement", "for_statement", "for_in_statement", "while_statement", "do_statement",
        "switch_statement", "arrow_function", "function"
    };
    config.commentNodeTypes = {"comment"};
    config.methodNodeTypes = {"method_definition"};
    config.fieldNodeTypes = {"field_definition", "public_field_definition"};
    return config;
}

LanguageGrammarConfig typescriptGrammar() {
    LanguageGrammarConfig config = javascriptGrammar();
    config.grammarName = "typescript";
    config.classNodeTypes = {"class_declaration", "interface_declaration"};
    config.methodNodeTypes = {"method_definition", "method_signature"};
    config.fieldNodeTypes = {"public_field_definition", "property_signature"};
    return config;
}

LanguageGrammarConfig pythonGrammar() {
    LanguageGrammarConfig config;
    config.grammarName = "python";
    config.functionNodeTypes = {"function_definition"};
    config.classNodeTypes = {"class_definition"};
    config.importNodeTypes = {"import_statement", "import_from_statement"};
    config.complexityNodeTypes = {
        "if_statement", "elif_clause", "for_statement", "while_statement", "except_clause",
        "with_statement", "conditional_expression", "boolean_operator"
    };
    config.nestingNodeTypes = {
        "if_statement", "for_statement", "while_statement", "with_statement", "try_statement",
        "function_definition", "class_definition"
    };
    config.commentNodeTypes = {"comment"};
    config.methodNodeTypes = {"function_definition"};
    config.fieldNodeTypes = {"expression_statement"};
    return config;
}

LanguageGrammarConfig javaGrammar() {
    LanguageGrammarConfig config;
    config.grammarName = "java";
    config.functionNodeTypes = {"method_declaration", "constructor_declaration"};
    config.classNodeTypes = {"class_declaration", "interface_declaration", "enum_declaration"};
    config.importNodeTypes = {"import_declaration"};
    config.complexityNodeTypes = {
        "if_statement", "for_statement", "enhanced_for_statement", "while_statement", "do_statement",
        "switch_expression", "catch_clause", "ternary_expression", "binary_expression"
    };
    config.nestingNodeTypes = {
        "if_statement", "for_statement", "enhanced_for_statement", "while_statement", "do_statement",
        "switch_expression", "try_statement", "lambda_expression"
    };
    config.commentNodeTypes = {"line_comment", "block_comment"};
    config.methodNodeTypes = {"method_declaration", "constructor_declaration"};
    config.fieldNodeTypes = {"field_declaration"};
    return config;
}

LanguageGrammarConfig cGrammar() {
    LanguageGrammarConfig config;
    config.grammarName = "c";
    config.functionNodeTypes = {"function_definition"};
    config.classNodeTypes = {"struct_specifier", "enum_specifier", "union_specifier"};
    config.importNodeTypes = {"preproc_include"};
    config.complexityNodeTypes = {
        "if_statement", "for_statement", "while_statement", "do_statement", "case_statement",
        "conditional_expression", "binary_expression"
    };
    config.nestingNodeTypes = {
        "if_statement", "for_statement", "while_statement", "do_statement", "switch_statement"
    };
    config.commentNodeTypes = {"comment"};
    config.functionNameField = "declarator";
    config.functionParamsField = "declarator";
    config.fieldNodeTypes = {"field_declaration"};
    return config;
}

LanguageGrammarConfig cppGrammar() {
    LanguageGrammarConfig config;
    config.grammarName = "cpp";
    config.functionNodeTypes = {"function_definition"};
    config.classNodeTypes = {"class_specifier", "struct_specifier", "enum_specifier"};
    config.importNodeTypes = {"preproc_include"};
    config.complexityNodeTypes = {
        "if_statement", "for_statement", "for_range_loop", "while_statement", "do_statement",
        "case_statement", "catch_clause", "conditional_expression", "binary_expression"
    };
    config.nestingNodeTypes = {
        "if_statement", "for_statement", "for_range_loop", "while_statement", "do_statement",
        "switch_statement", "try_statement", "lambda_expression"
    };
    config.commentNodeTypes = {"comment"};
    config.functionNameField = "declarator";
    config.functionParamsField = "declarator";
    config.methodNodeTypes = {"function_definition"};
    config.fieldNodeTypes = {"field_declaration"};
    return config;
}

LanguageGrammarConfig rustGrammar() {
    LanguageGrammarConfig config;
    config.grammarName = "rust";
    config.functionNodeTypes = {"function_item"};
    config.classNodeTypes = {"struct_item", "enum_item", "impl_item", "trait_item"};
    config.importNodeTypes = {"use_declaration"};
    config.complexityNodeTypes = {
        "if_expression", "for_expression", "while_expression", "loop_expression", "match_arm",
        "closure_expression", "binary_expression"
    };
    config.nestingNodeTypes = {
        "if_expression", "for_expression", "while_expression", "loop_expression",
        "match_expression", "closure_expression"
    };
    config.commentNodeTypes = {"line_comment", "block_comment"};
    config.methodNodeTypes = {"function_item"};
    config.fieldNodeTypes = {"field_declaration"};
    return config;
}

LanguageGrammarConfig csharpGrammar() {
    LanguageGrammarConfig config;
    config.grammarName = "c_sharp";
    config.functionNodeTypes = {"method_declaration", "constructor_declaration", "local_function_statement"};
    config.classNodeTypes = {
        "class_declaration", "interface_declaration", "struct_declaration", "enum_declaration"
    };
    config.importNodeTypes = {"using_directive"};
    config.complexityNodeTypes = {
        "if_statement", "for_statement", "for_each_statement", "while_statement", "do_statement",
        "switch_section", "catch_clause", "conditional_expression", "binary_expression"
    };
    config.nestingNodeTypes = {
        "if_statement", "for_statement", "for_each_statement", "while_statement", "do_statement",
        "switch_statement", "try_statement", "lambda_expression"
    };
    config.commentNodeTypes = {"comment"};
    config.methodNodeTypes = {"method_declaration", "constructor_declaration"};
    config.fieldNodeTypes = {"field_declaration", "property_declaration"};
    return config;
}

LanguageGrammarConfig luaGrammar() {
    LanguageGrammarConfig config;
    config.grammarName = "lua";
    config.functionNodeTypes = {"function_definition_statement", "local_function_definition_statement"};
    config.complexityNodeTypes = {
        "if_statement", "elseif_clause", "for_statement", "for_in_statement", "while_statement",
        "repeat_statement"
    };
    config.nestingNodeTypes = {
        "if_statement", "for_statement", "for_in_statement", "while_statement", "repeat_statement",
        "function_definition_statement"
    };
    config.commentNodeTypes = {"comment"};
    return config;
}

LanguageGrammarConfig phpGrammar() {
    LanguageGrammarConfig config;
    config.grammarName = "php";
    config.functionNodeTypes = {"function_definition", "method_declaration"};
    config.classNodeTypes = {"class_declaration"};
    config.importNodeTypes = {"namespace_use_declaration"};
    config.complexityNodeTypes = {
        "if_statement", "for_statement", "foreach_statement", "while_statement", "do_statement",
        "switch_statement", "case_statement", "catch_clause", "conditional_expression",
        "binary_expression"
    };
    config.nestingNodeTypes = {
        "if_statement", "for_statement", "foreach_statement", "while_statement", "do_statement",
        "switch_statement", "try_statement", "function_definition"
    };
    config.commentNodeTypes = {"comment"};
    config.classBodyField = "body";
    config.methodNodeTypes = {"method_declaration"};
    config.fieldNodeTypes = {"property_declaration"};
    return config;
}

LanguageGrammarConfig rubyGrammar() {
    LanguageGrammarConfig config;
    config.grammarName = "ruby";
    config.functionNodeTypes = {"method"};
    config.classNodeTypes = {"class"};
    config.importNodeTypes = {"call"};
    config.complexityNodeTypes = {
        "if", "unless", "case", "when", "for", "while", "until", "rescue", "conditional"
    };
    config.nestingNodeTypes = {"if", "unless", "case", "for", "while", "until", "begin", "method"};
    config.commentNodeTypes = {"comment"};
    config.methodNodeTypes = {"method"};
    config.fieldNodeTypes = {"instance_variable"};
    return config;
}

LanguageGrammarConfig swiftGrammar() {
    LanguageGrammarConfig config;
    config.grammarName = "swift";
    config.functionNodeTypes = {"function_declaration"};
    config.classNodeTypes = {"class_declaration", "struct_declaration", "protocol_declaration"};
    config.importNodeTypes = {"import_declaration"};
    config.complexityNodeTypes = {
        "if_statement", "guard_statement", "switch_statement", "switch_entry", "for_statement",
        "while_statement", "repeat_while_statement", "catch_clause", "ternary_expression"
    };
    config.nestingNodeTypes = {
        "if_statement", "guard_statement", "switch_statement", "for_statement", "while_statement",
        "repeat_while_statement", "do_statement", "function_declaration"
    };
    config.commentNodeTypes = {"comment", "multiline_comment"};
    config.methodNodeTypes = {"function_declaration"};
    config.fieldNodeTypes = {"property_declaration"};
    return config;
}

LanguageGrammarConfig shellGrammar() {
    LanguageGrammarConfig config;
    config.grammarName = "bash";
    config.functionNodeTypes = {"function_definition"};
    config.complexityNodeTypes = {
        "if_statement", "case_statement", "case_item", "for_statement", "while_statement",
        "until_statement", "elif_clause"
    };
    config.nestingNodeTypes = {
        "if_statement", "case_statement", "for_statement", "while_statement", "until_statement",
        "function_definition", "subshell"
    };
    config.commentNodeTypes = {"comment"};
    // Shell functions have no parameter list
    config.functionParamsField = "";
    return config;
}

const std::unordered_map<Language, LanguageGrammarConfig>& grammarTable() {
    static const std::unordered_map<Language, LanguageGrammarConfig> table = {
        {Language::Go, goGrammar()},
        {Language::JavaScript, javascriptGrammar()},
        {Language::TypeScript, typescriptGrammar()},
        {Language::Python, pythonGrammar()},
        {Language::Java, javaGrammar()},
        {Language::C, cGrammar()},
        {Language::Cpp, cppGrammar()},
        {Language::Rust, rustGrammar()},
        {Language::CSharp, csharpGrammar()},
        {Language::Lua, luaGrammar()},
        {Language::Php, phpGrammar()},
        {Language::Ruby, rubyGrammar()},
        {Language::Swift, swiftGrammar()},
        {Language::Shell, shellGrammar()}
    };
    return table;
}

} // namespace

const LanguageGrammarConfig* getGrammarConfig(Language language) {
    const auto& table = grammarTable();
    auto it = table.find(language);
    if (it == table.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> grammarLibraryNames(const LanguageGrammarConfig& config) {
    std::string dashed = config.grammarName;
    std::replace(dashed.begin(), dashed.end(), '_', '-');

    std::vector<std::string> names;
    for (const auto& stem : {dashed, config.grammarName}) {
        for (const char* suffix : {".so", ".so.0"}) {
            std::string name = "libtree-sitter-" + stem + suffix;
            if (std::find(names.begin(), names.end(), name) == names.end()) {
                names.push_back(name);
            }
        }
    }
    return names;
}
