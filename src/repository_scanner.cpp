#include "repository_scanner.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <system_error>

// Buffer size for reading files
constexpr size_t FILE_BUFFER_SIZE = 128 * 1024; // 128 KB

RepositoryScanner::RepositoryScanner(const fs::path& root, const PatternMatcher& patternMatcher,
                                     const ScanOptions& options)
    : patternMatcher_(patternMatcher),
      options_(options) {
    std::error_code ec;
    if (!fs::exists(root, ec) || !fs::is_directory(root, ec)) {
        throw std::runtime_error("Project path does not exist: " + root.string());
    }

    root_ = fs::canonical(root, ec);
    if (ec) {
        root_ = fs::absolute(root);
    }
}

void RepositoryScanner::scan(const Visitor& visitor) const {
    collectFiles(root_, 0, visitor);
}

std::vector<FileDescriptor> RepositoryScanner::scanAll() const {
    std::vector<FileDescriptor> files;
    files.reserve(256);

    scan([&files](const FileDescriptor& file) {
        files.push_back(file);
    });

    return files;
}

void RepositoryScanner::collectFiles(const fs::path& dir, int depth, const Visitor& visitor) const {
    std::error_code ec;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        // Unreadable directory contributes nothing
        return;
    }

    // Sort entries so repeated scans of the same tree are identical
    std::vector<fs::directory_entry> entries;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        entries.push_back(*it);
    }
    std::sort(entries.begin(), entries.end(),
        [](const fs::directory_entry& a, const fs::directory_entry& b) {
            return a.path().filename().string() < b.path().filename().string();
        });

    for (const auto& entry : entries) {
        const std::string name = entry.path().filename().string();
        const std::string relativePath = toRelativePath(entry.path(), root_);

        std::error_code typeEc;
        if (entry.is_directory(typeEc) && !entry.is_symlink(typeEc)) {
            if (shouldDescend(name, relativePath, depth + 1)) {
                collectFiles(entry.path(), depth + 1, visitor);
            }
            continue;
        }

        if (!entry.is_regular_file(typeEc)) {
            continue;
        }

        FileDescriptor descriptor;
        if (describeFile(entry.path(), relativePath, descriptor)) {
            visitor(descriptor);
        }
    }
}

bool RepositoryScanner::shouldDescend(const std::string& name, const std::string& relativePath,
                                      int depth) const {
    // Hidden directories are never visited
    if (!name.empty() && name[0] == '.') {
        return false;
    }

    if (depth > options_.maxDepth) {
        return false;
    }

    return !patternMatcher_.isIgnored(relativePath, true);
}

bool RepositoryScanner::describeFile(const fs::path& filePath, const std::string& relativePath,
                                     FileDescriptor& descriptor) const {
    if (!patternMatcher_.shouldProcess(relativePath)) {
        return false;
    }

    std::string extension = filePath.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (!hasIncludedExtension(extension)) {
        return false;
    }

    // Skip if file exceeds size limit
    std::error_code ec;
    const uintmax_t fileSize = fs::file_size(filePath, ec);
    if (ec || fileSize > options_.maxFileSize) {
        return false;
    }

    descriptor.path = filePath;
    descriptor.relativePath = relativePath;
    descriptor.extension = extension;
    descriptor.sizeBytes = fileSize;
    descriptor.language = languageFromExtension(extension);
    descriptor.languageName = languageNameForExtension(extension);
    return true;
}

bool RepositoryScanner::hasIncludedExtension(const std::string& extension) const {
    if (options_.includeExtensions.empty()) {
        return true;
    }

    return std::find(options_.includeExtensions.begin(), options_.includeExtensions.end(),
                     extension) != options_.includeExtensions.end();
}

std::string readFile(const fs::path& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + filePath.string());
    }

    std::error_code ec;
    const uintmax_t fileSize = fs::file_size(filePath, ec);

    std::string content;
    if (!ec) {
        content.reserve(static_cast<size_t>(fileSize));
    }

    // Read the file in chunks
    std::vector<char> buffer(FILE_BUFFER_SIZE);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        content.append(buffer.data(), static_cast<size_t>(file.gcount()));
    }

    return content;
}

size_t countLines(const std::string& content) {
    size_t count = std::count(content.begin(), content.end(), '\n');

    // If the last line doesn't end with a newline, count it too
    if (!content.empty() && content.back() != '\n') {
        ++count;
    }

    return count;
}

std::vector<std::string> splitLines(const std::string& content) {
    std::vector<std::string> lines;
    std::istringstream iss(content);
    std::string line;

    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }

    return lines;
}

std::string toRelativePath(const fs::path& path, const fs::path& root) {
    return path.lexically_relative(root).generic_string();
}

PatternMatcher makeRepositoryMatcher(const fs::path& root) {
    PatternMatcher matcher;

    const auto gitignorePath = root / ".gitignore";
    std::error_code ec;
    if (fs::exists(gitignorePath, ec)) {
        // An unreadable file is reported by loadGitignore and leaves the defaults
        matcher.loadGitignore(gitignorePath);
    }

    return matcher;
}

RepoStats getRepoStats(const fs::path& root, const PatternMatcher& patternMatcher,
                       const ScanOptions& options) {
    RepoStats stats;
    RepositoryScanner scanner(root, patternMatcher, options);

    scanner.scan([&stats](const FileDescriptor& file) {
        stats.totalFiles++;
        stats.languages[file.languageName]++;
        stats.fileTypes[file.extension.empty() ? "no_extension" : file.extension]++;

        try {
            stats.totalLines += countLines(readFile(file.path));
        } catch (const std::exception& e) {
            // Unreadable files still count, without lines
            std::cerr << "Warning: " << e.what() << std::endl;
        }
    });

    return stats;
}
