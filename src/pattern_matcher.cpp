#include "pattern_matcher.hpp"
#include <fstream>
#include <iostream>
#include <algorithm>
#include <sstream>

namespace {

std::string trim(const std::string& input) {
    std::string value = input;
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
        [](unsigned char ch) { return !std::isspace(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
        [](unsigned char ch) { return !std::isspace(ch); }).base(), value.end());
    return value;
}

} // namespace

const std::vector<std::string>& PatternMatcher::defaultIgnorePatterns() {
    static const std::vector<std::string> patterns = {
        // Version control
        ".git/",
        ".git",

        // Caches and virtual environments
        "__pycache__/",
        "*.pyc",
        "node_modules/",
        ".venv/",
        "venv/",
        ".env",
        ".pytest_cache/",
        ".mypy_cache/",
        ".ruff_cache/",

        // Build output
        "dist/",
        "build/",
        "*.egg-info/",
        "coverage/",

        // IDE and editor files
        ".idea/",
        ".vscode/",

        // Minified and generated files
        "*.min.js",
        "*.min.css",
        "*.map",
        "*.log",

        // OS metadata
        ".DS_Store",
        "Thumbs.db"
    };
    return patterns;
}

PatternMatcher::PatternMatcher() {
    for (const auto& pattern : defaultIgnorePatterns()) {
        addIgnorePattern(pattern);
    }
}

PatternMatcher::PatternMatcher(const std::vector<std::string>& ignorePatterns)
    : PatternMatcher() {

    for (const auto& pattern : ignorePatterns) {
        addIgnorePattern(pattern);
    }
}

void PatternMatcher::addIgnorePattern(const std::string& pattern) {
    if (trim(pattern).empty()) {
        return;
    }
    try {
        ignoreRules_.push_back(compileRule(pattern));
    } catch (const std::regex_error& e) {
        std::cerr << "Warning: Invalid pattern '" << pattern << "': " << e.what() << std::endl;
    }
}

void PatternMatcher::addIncludePattern(const std::string& pattern) {
    if (trim(pattern).empty()) {
        return;
    }
    try {
        includeRules_.push_back(compileRule(pattern));
    } catch (const std::regex_error& e) {
        std::cerr << "Warning: Invalid pattern '" << pattern << "': " << e.what() << std::endl;
    }
}

void PatternMatcher::setIncludePatterns(const std::string& patternsStr) {
    // Clear existing include patterns
    includeRules_.clear();

    for (const auto& pattern : splitPatternString(patternsStr)) {
        addIncludePattern(pattern);
    }
}

void PatternMatcher::setExcludePatterns(const std::string& patternsStr) {
    // Exclude patterns are plain ignore rules appended after .gitignore
    for (const auto& pattern : splitPatternString(patternsStr)) {
        addIgnorePattern(pattern);
    }
}

std::vector<std::string> PatternMatcher::splitPatternString(const std::string& patternsStr) const {
    std::vector<std::string> patterns;
    std::stringstream ss(patternsStr);
    std::string pattern;

    while (std::getline(ss, pattern, ',')) {
        pattern = trim(pattern);
        if (!pattern.empty()) {
            patterns.push_back(pattern);
        }
    }

    return patterns;
}

bool PatternMatcher::loadGitignore(const fs::path& gitignorePath) {
    std::ifstream file(gitignorePath);
    if (!file) {
        std::cerr << "Warning: Failed to open .gitignore file: " << gitignorePath << std::endl;
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        addIgnorePattern(line);
    }

    return true;
}

bool PatternMatcher::shouldProcess(const fs::path& relativePath) const {
    if (isIgnored(relativePath)) {
        return false;
    }

    // If there are include patterns, file must match at least one
    if (!includeRules_.empty()) {
        return isIncluded(relativePath);
    }

    return true;
}

bool PatternMatcher::isIgnored(const fs::path& relativePath, bool isDirectory) const {
    const std::string pathStr = normalizePath(relativePath);
    if (pathStr.empty()) {
        return false;
    }

    // A file can't be re-included once one of its parent directories is excluded
    size_t slash = pathStr.find('/');
    while (slash != std::string::npos) {
        if (matchesIgnoreRules(pathStr.substr(0, slash), true)) {
            return true;
        }
        slash = pathStr.find('/', slash + 1);
    }

    return matchesIgnoreRules(pathStr, isDirectory);
}

bool PatternMatcher::isIncluded(const fs::path& relativePath) const {
    if (includeRules_.empty()) {
        return true;
    }

    const std::string pathStr = normalizePath(relativePath);

    // Including a directory ("src/") includes everything below it
    size_t slash = pathStr.find('/');
    while (slash != std::string::npos) {
        const std::string parent = pathStr.substr(0, slash);
        for (const auto& rule : includeRules_) {
            if (std::regex_match(parent, rule.regex)) {
                return true;
            }
        }
        slash = pathStr.find('/', slash + 1);
    }

    for (const auto& rule : includeRules_) {
        if (!rule.directoryOnly && std::regex_match(pathStr, rule.regex)) {
            return true;
        }
    }

    return false;
}

bool PatternMatcher::matchesIgnoreRules(const std::string& path, bool isDirectory) const {
    bool ignored = false;

    for (const auto& rule : ignoreRules_) {
        if (rule.directoryOnly && !isDirectory) {
            continue;
        }
        if (ignored != rule.negated) {
            // This rule can't change the outcome
            continue;
        }
        if (std::regex_match(path, rule.regex)) {
            ignored = !rule.negated;
        }
    }

    return ignored;
}

PatternMatcher::Rule PatternMatcher::compileRule(const std::string& pattern) const {
    Rule rule;
    rule.pattern = trim(pattern);

    std::string body = rule.pattern;

    if (!body.empty() && body[0] == '!') {
        rule.negated = true;
        body.erase(0, 1);
    } else if (body.size() > 1 && body[0] == '\\' && (body[1] == '!' || body[1] == '#')) {
        // Escaped leading "!" or "#" is a literal character
        body.erase(0, 1);
    }

    if (!body.empty() && body.back() == '/') {
        rule.directoryOnly = true;
        while (!body.empty() && body.back() == '/') {
            body.pop_back();
        }
    }

    // A leading or embedded slash anchors the pattern to the root; otherwise
    // it may match at any depth
    bool anchored = false;
    if (!body.empty() && body[0] == '/') {
        anchored = true;
        body.erase(0, 1);
    } else if (body.find('/') != std::string::npos) {
        anchored = true;
    }

    std::string regexStr = anchored ? "" : "(?:.*/)?";
    regexStr += globToRegex(body);

    rule.regex = std::regex(regexStr);
    return rule;
}

std::string PatternMatcher::globToRegex(const std::string& glob) const {
    std::string regexStr;

    for (size_t i = 0; i < glob.size(); ++i) {
        const char c = glob[i];

        if (c == '*') {
            if (i + 1 < glob.size() && glob[i + 1] == '*') {
                if (i + 2 < glob.size() && glob[i + 2] == '/') {
                    // **/ matches zero or more directories
                    regexStr += "(?:.*/)?";
                    i += 2;
                } else {
                    // ** matches anything, separators included
                    regexStr += ".*";
                    i++;
                }
            } else {
                // * matches any character except directory separator
                regexStr += "[^/]*";
            }
        } else if (c == '?') {
            regexStr += "[^/]";
        } else if (c == '[') {
            const size_t close = glob.find(']', i + 1);
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
        } else if (c == '.' || c == '(' || c == ')' || c == ']' || c == '{' || c == '}' ||
                   c == '+' || c == '^' || c == '$' || c == '|') {
            regexStr += '\\';
            regexStr += c;
        } else {
            regexStr += c;
        }
    }

    return regexStr;
}

std::string PatternMatcher::normalizePath(const fs::path& path) {
    std::string pathStr = path.generic_string();

    while (pathStr.size() >= 2 && pathStr.compare(0, 2, "./") == 0) {
        pathStr.erase(0, 2);
    }
    while (!pathStr.empty() && pathStr.back() == '/') {
        pathStr.pop_back();
    }

    return pathStr;
}
