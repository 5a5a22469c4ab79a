#include "pattern_matcher.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

namespace {

std::string normalizePath(const fs::path& path) {
    std::string text = path.generic_string();
    while (text.rfind("./", 0) == 0) {
        text.erase(0, 2);
    }
    while (!text.empty() && text.back() == '/') {
        text.pop_back();
    }
    return text;
}

std::string trimPattern(const std::string& text) {
    auto begin = std::find_if(text.begin(), text.end(), [](unsigned char ch) { return !std::isspace(ch); });
    auto end = std::find_if(text.rbegin(), text.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

PatternMatcher::PatternMatcher() {
    // Version control
    addIgnorePattern(".git/");
    addIgnorePattern(".svn/");
    addIgnorePattern(".hg/");

    // Dependencies and virtual environments
    addIgnorePattern("node_modules/");
    addIgnorePattern("vendor/");
    addIgnorePattern(".venv/");
    addIgnorePattern("venv/");
    addIgnorePattern("__pycache__/");

    // Build output
    addIgnorePattern("dist/");
    addIgnorePattern("build/");
    addIgnorePattern("target/");
    addIgnorePattern(".next/");

    // Generated and minified sources
    addIgnorePattern("*.min.js");
    addIgnorePattern("*.bundle.js");
}

PatternMatcher::PatternMatcher(const std::vector<std::string>& ignorePatterns) : PatternMatcher() {
    addIgnorePatterns(ignorePatterns);
}

void PatternMatcher::addIgnorePattern(const std::string& pattern, const std::string& baseDir) {
    const std::string trimmed = trimPattern(pattern);
    if (trimmed.empty() || trimmed == "!" || trimmed[0] == '#') {
        return;
    }
    ignoreRules_.push_back(makeRule(trimmed, normalizePath(baseDir)));
}

void PatternMatcher::addIgnorePatterns(const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        addIgnorePattern(pattern);
    }
}

void PatternMatcher::addIncludePattern(const std::string& pattern) {
    const std::string trimmed = trimPattern(pattern);
    if (trimmed.empty()) {
        return;
    }
    includeRules_.push_back(makeRule(trimmed, ""));
}

void PatternMatcher::addIncludePatterns(const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        addIncludePattern(pattern);
    }
}

bool PatternMatcher::loadGitignore(const fs::path& gitignorePath, const std::string& baseDir) {
    std::ifstream file(gitignorePath);
    if (!file) {
        std::cerr << "Warning: Failed to open .gitignore file: " << gitignorePath << std::endl;
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        addIgnorePattern(line, baseDir);
    }
    return true;
}

bool PatternMatcher::shouldProcess(const fs::path& relativePath) const {
    if (isIgnored(relativePath)) {
        return false;
    }
    return isIncluded(relativePath);
}

bool PatternMatcher::isIgnored(const fs::path& relativePath) const {
    return ignoredByRules(normalizePath(relativePath), false);
}

bool PatternMatcher::isIgnoredDirectory(const fs::path& relativeDir) const {
    return ignoredByRules(normalizePath(relativeDir), true);
}

bool PatternMatcher::isIncluded(const fs::path& relativePath) const {
    if (includeRules_.empty()) {
        return true;
    }
    const std::string path = normalizePath(relativePath);
    return std::any_of(includeRules_.begin(), includeRules_.end(),
                       [&path](const Rule& rule) { return ruleMatches(rule, path, false); });
}

bool PatternMatcher::ignoredByRules(const std::string& path, bool isDirectory) const {
    if (path.empty()) {
        return false;
    }

    // Last matching rule wins, as in git
    bool ignored = false;
    for (const auto& rule : ignoreRules_) {
        if (ruleMatches(rule, path, isDirectory)) {
            ignored = !rule.negated;
        }
    }
    return ignored;
}

PatternMatcher::Rule PatternMatcher::makeRule(const std::string& pattern, const std::string& baseDir) {
    Rule rule;
    rule.pattern = pattern;
    rule.baseDir = baseDir;

    std::string glob = pattern;
    if (glob[0] == '!') {
        rule.negated = true;
        glob.erase(0, 1);
    }
    if (glob.size() > 1 && glob[0] == '\\' && (glob[1] == '!' || glob[1] == '#')) {
        glob.erase(0, 1);
    }

    // "dir/**" ignores everything below dir, and the slash anchors it like "/dir/"
    bool anchored = false;
    if (glob.size() > 3 && glob.compare(glob.size() - 3, 3, "/**") == 0) {
        glob.erase(glob.size() - 3);
        rule.directoryOnly = true;
        anchored = true;
    }
    if (!glob.empty() && glob.back() == '/') {
        glob.pop_back();
        rule.directoryOnly = true;
    }

    if (!glob.empty() && glob[0] == '/') {
        glob.erase(0, 1);
        anchored = true;
    }
    if (glob.rfind("**/", 0) == 0 && glob.find('/', 3) == std::string::npos) {
        glob.erase(0, 3);
        anchored = false;
    }

    rule.basenameOnly = !anchored && glob.find('/') == std::string::npos;
    rule.regex = std::regex(globToRegex(glob));
    return rule;
}

std::string PatternMatcher::globToRegex(const std::string& glob) {
    std::string regexStr;

    for (size_t i = 0; i < glob.size(); ++i) {
        const char c = glob[i];

        if (c == '*') {
            if (i + 1 < glob.size() && glob[i + 1] == '*') {
                if (i + 2 < glob.size() && glob[i + 2] == '/') {
                    // "**/" spans zero or more directories
                    regexStr += "(?:.*/)?";
                    i += 2;
                } else {
                    regexStr += ".*";
                    ++i;
                }
            } else {
                regexStr += "[^/]*";
            }
        } else if (c == '?') {
            regexStr += "[^/]";
        } else if (c == '[') {
            size_t close = glob.find(']', i + 1);
            if (close == std::string::npos) {
                regexStr += "\\[";
                continue;
            }
            std::string set = glob.substr(i + 1, close - i - 1);
            if (!set.empty() && set[0] == '!') {
                set[0] = '^';
            }
            regexStr += "[" + set + "]";
            i = close;
        } else if (c == '\\' && i + 1 < glob.size()) {
            regexStr += '\\';
            regexStr += glob[++i];
        } else if (std::string(".()+^$|{}]").find(c) != std::string::npos) {
            regexStr += '\\';
            regexStr += c;
        } else {
            regexStr += c;
        }
    }
    return regexStr;
}

std::vector<std::string> PatternMatcher::components(const std::string& path) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) {
            slash = path.size();
        }
        if (slash > start) {
            parts.push_back(path.substr(start, slash - start));
        }
        start = slash + 1;
    }
    return parts;
}

bool PatternMatcher::ruleMatches(const Rule& rule, const std::string& path, bool isDirectory) {
    std::string scoped = path;
    if (!rule.baseDir.empty()) {
        if (path.size() <= rule.baseDir.size() || path.compare(0, rule.baseDir.size(), rule.baseDir) != 0 ||
            path[rule.baseDir.size()] != '/') {
            return false;
        }
        scoped = path.substr(rule.baseDir.size() + 1);
    }

    const auto parts = components(scoped);
    if (parts.empty()) {
        return false;
    }

    // Components [0, dirCount) are directories; the last one is the path itself
    const size_t dirCount = isDirectory ? parts.size() : parts.size() - 1;

    if (rule.basenameOnly) {
        for (size_t i = 0; i < parts.size(); ++i) {
            const bool componentIsDir = i < dirCount;
            if (rule.directoryOnly && !componentIsDir) {
                continue;
            }
            if (std::regex_match(parts[i], rule.regex)) {
                return true;
            }
        }
        return false;
    }

    // Path rules match the full path or any directory prefix of it
    std::string prefix;
    for (size_t i = 0; i < parts.size(); ++i) {
        prefix += (i == 0 ? "" : "/") + parts[i];
        const bool prefixIsDir = i < dirCount;
        if (rule.directoryOnly && !prefixIsDir) {
            continue;
        }
        if (std::regex_match(prefix, rule.regex)) {
            return true;
        }
    }
    return false;
}
