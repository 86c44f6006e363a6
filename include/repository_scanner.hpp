#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <functional>
#include <map>
#include "code_model.hpp"
#include "pattern_matcher.hpp"

namespace fs = std::filesystem;

// Scan limits and filters
struct ScanOptions {
    int maxDepth = 15;                       // Directories deeper than this are not descended into
    uintmax_t maxFileSize = 1000000;         // Files larger than this (in bytes) are skipped
    std::vector<std::string> includeExtensions; // Restrict to these extensions (empty = all)
};

// Repository statistics
struct RepoStats {
    size_t totalFiles = 0;
    size_t totalLines = 0;
    std::map<std::string, size_t> languages;    // Language name -> file count
    std::map<std::string, size_t> fileTypes;    // Extension -> file count
};

class RepositoryScanner {
public:
    using Visitor = std::function<void(const FileDescriptor&)>;

    // Throws std::runtime_error if root is not an existing directory
    RepositoryScanner(const fs::path& root, const PatternMatcher& patternMatcher,
                      const ScanOptions& options = ScanOptions());

    // Walk the tree and hand every accepted file to the visitor as it is found.
    // Entries of a directory are visited in name order.
    void scan(const Visitor& visitor) const;

    // Collect all accepted files
    std::vector<FileDescriptor> scanAll() const;

    const fs::path& root() const { return root_; }

private:
    fs::path root_;
    const PatternMatcher& patternMatcher_;
    ScanOptions options_;

    // Recursive directory walk with pruning
    void collectFiles(const fs::path& dir, int depth, const Visitor& visitor) const;

    // Build a descriptor, or return false if the file must be skipped
    bool describeFile(const fs::path& filePath, const std::string& relativePath,
                      FileDescriptor& descriptor) const;

    bool shouldDescend(const std::string& name, const std::string& relativePath, int depth) const;
    bool hasIncludedExtension(const std::string& extension) const;
};

// Read a whole file. Throws std::runtime_error if it can't be opened.
std::string readFile(const fs::path& filePath);

// Number of lines, counting a trailing line without newline
size_t countLines(const std::string& content);

// Split content into lines without their terminators
std::vector<std::string> splitLines(const std::string& content);

// Repo-relative path with forward slashes
std::string toRelativePath(const fs::path& path, const fs::path& root);

// Build a pattern matcher with the default deny-list and the root .gitignore
PatternMatcher makeRepositoryMatcher(const fs::path& root);

// File, line and language counts for every scannable file
RepoStats getRepoStats(const fs::path& root, const PatternMatcher& patternMatcher,
                       const ScanOptions& options = ScanOptions());
