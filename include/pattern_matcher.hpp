#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

// Gitignore-style path filter. Paths are relative to the project root and use '/'.
class PatternMatcher {
public:
    // Built-in ignores for VCS metadata, dependency and build directories
    PatternMatcher();

    // Built-in ignores plus custom ignore patterns
    explicit PatternMatcher(const std::vector<std::string>& ignorePatterns);

    // Later patterns take precedence; "!pattern" re-includes
    void addIgnorePattern(const std::string& pattern, const std::string& baseDir = "");
    void addIgnorePatterns(const std::vector<std::string>& patterns);

    // Files must match at least one include pattern once any is added
    void addIncludePattern(const std::string& pattern);
    void addIncludePatterns(const std::vector<std::string>& patterns);

    // Load rules from a .gitignore file; baseDir scopes them to that subdirectory.
    // Returns false when the file cannot be opened.
    bool loadGitignore(const fs::path& gitignorePath, const std::string& baseDir = "");

    // Not ignored, and included when include patterns exist
    bool shouldProcess(const fs::path& relativePath) const;

    bool isIgnored(const fs::path& relativePath) const;

    // True when the directory itself is ignored, so its subtree can be pruned
    bool isIgnoredDirectory(const fs::path& relativeDir) const;

    bool isIncluded(const fs::path& relativePath) const;

    bool hasIncludePatterns() const { return !includeRules_.empty(); }

private:
    struct Rule {
        std::string pattern;
        std::regex regex;
        std::string baseDir;       // Empty for project-wide rules
        bool negated = false;
        bool directoryOnly = false;
        bool basenameOnly = false; // No '/' in the pattern: matches at any depth
    };

    std::vector<Rule> ignoreRules_;
    std::vector<Rule> includeRules_;

    static Rule makeRule(const std::string& pattern, const std::string& baseDir);
    static std::string globToRegex(const std::string& glob);
    static std::vector<std::string> components(const std::string& path);

    // Does the rule match the path, or (for directory rules) any directory above it
    static bool ruleMatches(const Rule& rule, const std::string& path, bool isDirectory);
    bool ignoredByRules(const std::string& path, bool isDirectory) const;
};
