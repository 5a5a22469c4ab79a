/**
 * @file tree_sitter_parser.cpp
 * @brief AST-driven extraction of functions, classes, imports and line counts
 *
 * Grammars are shared libraries (libtree-sitter-<name>.so) opened at runtime, so the
 * binary links only against the tree-sitter core. Node kinds and field names come
 * from the grammar registry; the traversal itself is language-agnostic apart from a
 * few grammar quirks (C declarators, Go type specs, Python docstrings).
 */

#include "code_parser.hpp"
#include <tree_sitter/api.h>
#include <dlfcn.h>
#include <algorithm>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <unordered_set>
#include <utility>

using namespace parser_utils;

namespace {

using NodeKinds = std::unordered_set<std::string>;

NodeKinds toSet(const std::vector<std::string>& kinds) {
    return NodeKinds(kinds.begin(), kinds.end());
}

std::string nodeKind(TSNode node) {
    return ts_node_type(node);
}

std::string nodeText(TSNode node, const std::string& source) {
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (start >= source.size() || end <= start) {
        return std::string();
    }
    end = std::min<uint32_t>(end, static_cast<uint32_t>(source.size()));
    return source.substr(start, end - start);
}

// Null node when the field is empty or absent
TSNode childByField(TSNode node, const std::string& field) {
    if (field.empty()) {
        TSNode none{};
        return none;
    }
    return ts_node_child_by_field_name(node, field.c_str(), static_cast<uint32_t>(field.size()));
}

std::vector<TSNode> namedChildren(TSNode node) {
    std::vector<TSNode> children;
    uint32_t count = ts_node_named_child_count(node);
    children.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        children.push_back(ts_node_named_child(node, i));
    }
    return children;
}

int startRow(TSNode node) {
    return static_cast<int>(ts_node_start_point(node).row);
}

int endRow(TSNode node) {
    return static_cast<int>(ts_node_end_point(node).row);
}

// Preorder walk over named nodes; the visitor returns false to skip a subtree
template <typename Visitor>
void walkNamed(TSNode root, Visitor visit) {
    std::vector<TSNode> stack{root};
    while (!stack.empty()) {
        TSNode node = stack.back();
        stack.pop_back();
        if (!visit(node)) {
            continue;
        }
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = count; i > 0; --i) {
            stack.push_back(ts_node_named_child(node, i - 1));
        }
    }
}

// First descendant (self included) of the given kind in preorder
TSNode findFirstDescendant(TSNode root, const char* kind) {
    TSNode found{};
    bool done = false;
    walkNamed(root, [&](TSNode node) {
        if (done) {
            return false;
        }
        if (std::strcmp(ts_node_type(node), kind) == 0) {
            found = node;
            done = true;
            return false;
        }
        return true;
    });
    return found;
}

std::string stripQuotes(std::string text) {
    auto isQuote = [](char ch) { return ch == '"' || ch == '\'' || ch == '`'; };
    if (!text.empty() && isQuote(text.front())) {
        text.erase(text.begin());
    }
    if (!text.empty() && isQuote(text.back())) {
        text.pop_back();
    }
    return text;
}

struct TreeDeleter {
    void operator()(TSTree* tree) const { ts_tree_delete(tree); }
};

struct ParserDeleter {
    void operator()(TSParser* parser) const { ts_parser_delete(parser); }
};

const NodeKinds PARAMETER_KINDS = {
    "parameter_declaration", "parameter", "formal_parameter", "required_parameter",
    "optional_parameter", "rest_parameter", "typed_parameter", "typed_default_parameter",
    "default_parameter", "identifier", "variadic_parameter_declaration", "variadic_parameter",
    "spread_parameter", "simple_parameter", "optional_parameter_declaration"
};

const NodeKinds LOGICAL_OPERATORS = {"&&", "||", "and", "or"};

// Wrappers whose previous sibling carries the comment for the wrapped declaration
const NodeKinds DECLARATION_WRAPPERS = {"export_statement", "decorated_definition"};

const char* const IMPORT_TARGET_KINDS[] = {
    "interpreted_string_literal", "string", "string_literal", "dotted_name",
    "scoped_identifier", "qualified_name", "identifier"
};

} // namespace

struct TreeSitterParser::TreeSitterImpl {
    void* handle = nullptr;
    const TSLanguage* language = nullptr;

    NodeKinds functionKinds;
    NodeKinds classKinds;
    NodeKinds importKinds;
    NodeKinds complexityKinds;
    NodeKinds nestingKinds;
    NodeKinds commentKinds;
    NodeKinds methodKinds;
    NodeKinds fieldKinds;

    ~TreeSitterImpl() {
        if (handle) {
            dlclose(handle);
        }
    }
};

namespace {

struct ExtractionContext {
    const std::string& source;
    const LanguageGrammarConfig& config;
    Language language;
    const NodeKinds& functionKinds;
    const NodeKinds& commentKinds;
    const NodeKinds& complexityKinds;
    const NodeKinds& nestingKinds;
};

// Drill through C/C++ declarator wrappers down to the declared name
std::string declaratorName(TSNode node, const std::string& source) {
    TSNode current = node;
    while (!ts_node_is_null(current)) {
        const std::string kind = nodeKind(current);
        if (kind == "qualified_identifier") {
            TSNode name = childByField(current, "name");
            if (ts_node_is_null(name)) {
                return nodeText(current, source);
            }
            current = name;
            continue;
        }
        if (kind.size() > 11 && kind.compare(kind.size() - 11, 11, "_declarator") == 0) {
            TSNode inner = childByField(current, "declarator");
            if (ts_node_is_null(inner) && ts_node_named_child_count(current) > 0) {
                inner = ts_node_named_child(current, 0);
            }
            if (ts_node_is_null(inner)) {
                return nodeText(current, source);
            }
            current = inner;
            continue;
        }
        return nodeText(current, source);
    }
    return std::string();
}

std::string functionName(TSNode node, const ExtractionContext& ctx) {
    TSNode nameNode = childByField(node, ctx.config.functionNameField);
    if (!ts_node_is_null(nameNode)) {
        const std::string kind = nodeKind(nameNode);
        if (kind == "function_declarator" || kind == "pointer_declarator" ||
            kind == "reference_declarator" || kind == "qualified_identifier") {
            return declaratorName(nameNode, ctx.source);
        }
        return nodeText(nameNode, ctx.source);
    }

    // Anonymous functions bound to a variable take the variable's name
    TSNode parent = ts_node_parent(node);
    if (!ts_node_is_null(parent) && nodeKind(parent) == "variable_declarator") {
        TSNode variable = childByField(parent, "name");
        if (!ts_node_is_null(variable)) {
            return nodeText(variable, ctx.source);
        }
    }
    return std::string();
}

int countParameters(TSNode node, const ExtractionContext& ctx) {
    TSNode params{};
    if (ctx.config.functionParamsField == "declarator") {
        TSNode declarator = childByField(node, "declarator");
        if (ts_node_is_null(declarator)) {
            return 0;
        }
        TSNode functionDeclarator = findFirstDescendant(declarator, "function_declarator");
        if (!ts_node_is_null(functionDeclarator)) {
            params = childByField(functionDeclarator, "parameters");
        }
        if (ts_node_is_null(params)) {
            params = findFirstDescendant(declarator, "parameter_list");
        }
    } else {
        params = childByField(node, ctx.config.functionParamsField);
    }
    if (ts_node_is_null(params)) {
        return 0;
    }

    const auto children = namedChildren(params);

    // Go groups names under one declaration: (a, b int)
    if (ctx.language == Language::Go) {
        int count = 0;
        for (const auto& child : children) {
            const std::string kind = nodeKind(child);
            if (kind != "parameter_declaration" && kind != "variadic_parameter_declaration") {
                continue;
            }
            for (const auto& inner : namedChildren(child)) {
                if (nodeKind(inner) == "identifier") {
                    ++count;
                }
            }
        }
        return count;
    }

    // C "(void)" declares no parameters
    if ((ctx.language == Language::C || ctx.language == Language::Cpp) && children.size() == 1 &&
        trim(nodeText(children.front(), ctx.source)) == "void") {
        return 0;
    }

    int count = 0;
    for (const auto& child : children) {
        if (PARAMETER_KINDS.count(nodeKind(child))) {
            ++count;
        }
    }
    return count;
}

bool hasDocstring(TSNode node, const ExtractionContext& ctx) {
    TSNode anchor = node;
    TSNode parent = ts_node_parent(node);
    if (!ts_node_is_null(parent) && DECLARATION_WRAPPERS.count(nodeKind(parent))) {
        anchor = parent;
    }

    TSNode prev = ts_node_prev_named_sibling(anchor);
    if (!ts_node_is_null(prev) && ctx.commentKinds.count(nodeKind(prev))) {
        const std::string text = nodeText(prev, ctx.source);
        for (const char* marker : {"/**", "///", "\"\"\"", "'''", "--["}) {
            if (text.rfind(marker, 0) == 0) {
                return true;
            }
        }
        if (endRow(prev) == startRow(anchor) - 1) {
            return true;
        }
    }

    if (ctx.language == Language::Python) {
        TSNode body = childByField(node, "body");
        if (!ts_node_is_null(body) && ts_node_named_child_count(body) > 0) {
            TSNode first = ts_node_named_child(body, 0);
            if (nodeKind(first) == "expression_statement" && ts_node_named_child_count(first) > 0 &&
                nodeKind(ts_node_named_child(first, 0)) == "string") {
                return true;
            }
        }
    }
    return false;
}

int calculateComplexity(TSNode body, const ExtractionContext& ctx) {
    int complexity = 0;
    walkNamed(body, [&](TSNode node) {
        const std::string kind = nodeKind(node);
        if (!ts_node_eq(node, body) && ctx.functionKinds.count(kind)) {
            return false;
        }
        if (ctx.complexityKinds.count(kind)) {
            if (kind == "binary_expression" || kind == "boolean_operator") {
                TSNode op = ts_node_child_by_field_name(node, "operator", 8);
                if (!ts_node_is_null(op) && LOGICAL_OPERATORS.count(nodeText(op, ctx.source))) {
                    ++complexity;
                }
            } else {
                ++complexity;
            }
        }
        return true;
    });
    return complexity;
}

int calculateMaxNesting(TSNode body, const ExtractionContext& ctx) {
    int maxDepth = 0;
    std::vector<std::pair<TSNode, int>> stack{{body, 0}};
    while (!stack.empty()) {
        auto [node, depth] = stack.back();
        stack.pop_back();
        maxDepth = std::max(maxDepth, depth);

        for (const auto& child : namedChildren(node)) {
            const std::string kind = nodeKind(child);
            if (ctx.functionKinds.count(kind)) {
                continue;
            }
            stack.emplace_back(child, ctx.nestingKinds.count(kind) ? depth + 1 : depth);
        }
    }
    return maxDepth;
}

std::string importTarget(TSNode node, const std::string& source) {
    // Ruby imports are calls to require/require_relative
    if (nodeKind(node) == "call") {
        TSNode method = childByField(node, "method");
        const std::string name = ts_node_is_null(method) ? std::string() : nodeText(method, source);
        if (name != "require" && name != "require_relative") {
            return std::string();
        }
        TSNode content = findFirstDescendant(node, "string_content");
        return ts_node_is_null(content) ? std::string() : nodeText(content, source);
    }

    TSNode target{};
    for (const char* kind : IMPORT_TARGET_KINDS) {
        target = findFirstDescendant(node, kind);
        if (!ts_node_is_null(target)) {
            break;
        }
    }
    for (const char* field : {"path", "source", "name"}) {
        if (!ts_node_is_null(target)) {
            break;
        }
        target = childByField(node, field);
    }
    if (ts_node_is_null(target)) {
        return std::string();
    }
    return stripQuotes(nodeText(target, source));
}

} // namespace

TreeSitterParser::TreeSitterParser(Language language, const LanguageGrammarConfig& config,
                                   const fs::path& grammarDir)
    : language_(language), config_(config), impl_(std::make_unique<TreeSitterImpl>()) {
    std::string lastError = "no candidate library";
    for (const auto& name : grammarLibraryNames(config_)) {
        const std::string candidate = grammarDir.empty() ? name : (grammarDir / name).string();
        impl_->handle = dlopen(candidate.c_str(), RTLD_NOW | RTLD_LOCAL);
        if (impl_->handle) {
            break;
        }
        const char* error = dlerror();
        lastError = error ? error : candidate;
    }
    if (!impl_->handle) {
        throw std::runtime_error("Grammar library for " + config_.grammarName + " not found: " + lastError);
    }

    using LanguageFn = const TSLanguage* (*)();
    const std::string symbol = "tree_sitter_" + config_.grammarName;
    dlerror();
    auto entry = reinterpret_cast<LanguageFn>(dlsym(impl_->handle, symbol.c_str()));
    if (!entry) {
        throw std::runtime_error("Grammar symbol " + symbol + " not found");
    }
    impl_->language = entry();

    // Check the ABI once so an incompatible grammar fails here, not per file
    std::unique_ptr<TSParser, ParserDeleter> check(ts_parser_new());
    if (!impl_->language || !ts_parser_set_language(check.get(), impl_->language)) {
        throw std::runtime_error("Grammar " + config_.grammarName + " has an incompatible ABI version");
    }

    impl_->functionKinds = toSet(config_.functionNodeTypes);
    impl_->classKinds = toSet(config_.classNodeTypes);
    impl_->importKinds = toSet(config_.importNodeTypes);
    impl_->complexityKinds = toSet(config_.complexityNodeTypes);
    impl_->nestingKinds = toSet(config_.nestingNodeTypes);
    impl_->commentKinds = toSet(config_.commentNodeTypes);
    impl_->methodKinds = toSet(config_.methodNodeTypes);
    impl_->fieldKinds = toSet(config_.fieldNodeTypes);
}

TreeSitterParser::~TreeSitterParser() = default;

std::vector<Language> TreeSitterParser::supportedLanguages() const {
    return {language_};
}

ParseResult TreeSitterParser::parse(const std::string& filePath, const std::string& content) const {
    // TSParser is not thread-safe, the TSLanguage is
    std::unique_ptr<TSParser, ParserDeleter> parser(ts_parser_new());
    if (!parser || !ts_parser_set_language(parser.get(), impl_->language)) {
        throw std::runtime_error("Tree-sitter parse failed: cannot set language " + config_.grammarName);
    }

    std::unique_ptr<TSTree, TreeDeleter> tree(
        ts_parser_parse_string(parser.get(), nullptr, content.c_str(), static_cast<uint32_t>(content.size())));
    if (!tree) {
        throw std::runtime_error("Tree-sitter parse failed: no tree for " + filePath);
    }
    TSNode root = ts_tree_root_node(tree.get());

    const ExtractionContext ctx{content, config_, language_, impl_->functionKinds,
                                impl_->commentKinds, impl_->complexityKinds, impl_->nestingKinds};

    ParseResult result;
    result.filePath = filePath;
    result.language = language_;

    std::unordered_set<int> commentRows;

    walkNamed(root, [&](TSNode node) {
        const std::string kind = nodeKind(node);

        if (impl_->commentKinds.count(kind)) {
            for (int row = startRow(node); row <= endRow(node); ++row) {
                commentRows.insert(row);
            }
        }

        if (impl_->importKinds.count(kind)) {
            std::string target = importTarget(node, content);
            if (!target.empty()) {
                result.imports.push_back(target);
            }
        }

        if (impl_->functionKinds.count(kind)) {
            std::string name = functionName(node, ctx);
            if (!name.empty()) {
                FunctionInfo fn;
                fn.name = name;
                fn.startLine = startRow(node) + 1;
                fn.endLine = endRow(node) + 1;
                fn.lineCount = fn.endLine - fn.startLine + 1;
                fn.parameterCount = countParameters(node, ctx);
                TSNode body = childByField(node, config_.functionBodyField);
                if (!ts_node_is_null(body)) {
                    fn.complexity = calculateComplexity(body, ctx) + 1;
                    fn.nestingDepth = calculateMaxNesting(body, ctx);
                }
                fn.hasDocstring = hasDocstring(node, ctx);
                result.functions.push_back(fn);
            }
        }

        if (impl_->classKinds.count(kind)) {
            std::string name;
            TSNode body{};
            if (language_ == Language::Go && kind == "type_declaration") {
                for (const auto& child : namedChildren(node)) {
                    if (nodeKind(child) == "type_spec") {
                        TSNode nameNode = childByField(child, "name");
                        if (!ts_node_is_null(nameNode)) {
                            name = nodeText(nameNode, content);
                        }
                        body = childByField(child, "type");
                        break;
                    }
                }
            } else {
                TSNode nameNode = childByField(node, config_.classNameField);
                if (!ts_node_is_null(nameNode)) {
                    name = nodeText(nameNode, content);
                }
                body = childByField(node, config_.classBodyField);
            }

            if (!name.empty()) {
                ClassInfo cls;
                cls.name = name;
                cls.startLine = startRow(node) + 1;
                cls.endLine = endRow(node) + 1;
                if (!ts_node_is_null(body)) {
                    walkNamed(body, [&](TSNode member) {
                        if (ts_node_eq(member, body)) {
                            return true;
                        }
                        const std::string memberKind = nodeKind(member);
                        if (impl_->methodKinds.count(memberKind)) {
                            ++cls.methodCount;
                            return false;
                        }
                        if (impl_->fieldKinds.count(memberKind)) {
                            ++cls.fieldCount;
                            return false;
                        }
                        return memberKind.find("_list") != std::string::npos ||
                               memberKind.find("_body") != std::string::npos;
                    });
                }
                result.classes.push_back(cls);
            }
        }
        return true;
    });

    const auto lines = splitLines(content);
    result.totalLines = static_cast<int>(lines.size());
    for (size_t i = 0; i < lines.size(); ++i) {
        if (trim(lines[i]).empty()) {
            ++result.blankLines;
        } else if (commentRows.count(static_cast<int>(i))) {
            ++result.commentLines;
        }
    }
    result.codeLines = result.totalLines - result.commentLines - result.blankLines;

    if (ts_node_has_error(root)) {
        result.errors.push_back("Syntax errors present in " + filePath);
    }
    return result;
}
