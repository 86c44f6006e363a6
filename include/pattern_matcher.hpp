#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

// Gitignore-style path matcher.
//
// Paths are always repo-relative with forward slashes. Rules are evaluated in
// insertion order and the last matching rule decides, so a later "!pattern"
// re-includes what an earlier pattern excluded. Anything below an ignored
// directory stays ignored, as with git.
class PatternMatcher {
public:
    // Default constructor with the built-in deny-list
    PatternMatcher();

    // Constructor with extra ignore patterns appended after the defaults
    PatternMatcher(const std::vector<std::string>& ignorePatterns);

    // Add a new ignore pattern (gitignore syntax, "!" negates). A pattern that
    // does not compile is skipped with a warning.
    void addIgnorePattern(const std::string& pattern);

    // Add include patterns (files that match these will be processed)
    void addIncludePattern(const std::string& pattern);

    // Set include patterns from a comma-separated string (e.g., "*.py,src/**")
    void setIncludePatterns(const std::string& patternsStr);

    // Set exclude patterns from a comma-separated string (e.g., "*.txt,docs/")
    void setExcludePatterns(const std::string& patternsStr);

    // Load patterns from a .gitignore file. Returns false if it can't be read.
    bool loadGitignore(const fs::path& gitignorePath);

    // Check if a file should be processed (not ignored and, when include
    // patterns exist, matching one of them)
    bool shouldProcess(const fs::path& relativePath) const;

    // Check if a path is ignored. Directory-only rules ("build/") apply only
    // when isDirectory is set or when the rule matches one of the parents.
    bool isIgnored(const fs::path& relativePath, bool isDirectory = false) const;

    // Check if a file matches any include pattern
    bool isIncluded(const fs::path& relativePath) const;

    // Check if any include patterns have been specified
    bool hasIncludePatterns() const { return !includeRules_.empty(); }

    // Number of ignore rules currently loaded
    size_t ignoreRuleCount() const { return ignoreRules_.size(); }

    // Built-in deny-list: VCS, caches, build output, minified files, OS metadata
    static const std::vector<std::string>& defaultIgnorePatterns();

private:
    struct Rule {
        std::string pattern;
        std::regex regex;
        bool negated = false;
        bool directoryOnly = false;
    };

    std::vector<Rule> ignoreRules_;
    std::vector<Rule> includeRules_;

    // Helper methods
    Rule compileRule(const std::string& pattern) const;
    std::string globToRegex(const std::string& glob) const;
    bool matchesIgnoreRules(const std::string& path, bool isDirectory) const;
    std::vector<std::string> splitPatternString(const std::string& patternsStr) const;
    static std::string normalizePath(const fs::path& path);
};
