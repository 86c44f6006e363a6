#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "code_model.hpp"

namespace fs = std::filesystem;

// Maps relative imports to repo-relative file paths by probing the filesystem.
//
// Only imports anchored at the importing file are resolved. Python style
// references (".", "..pkg.mod") ascend one directory per leading dot past the
// first; path style references ("./util", "../lib/x") are joined onto the
// importing file's directory. The target is then tried as a source file and
// as a package directory. When nothing exists a best-effort candidate is
// returned anyway; callers decide whether it names a real file.
class ImportResolver {
public:
    explicit ImportResolver(const fs::path& root);

    // Resolve an import seen in importingFile (repo-relative).
    // Returns std::nullopt for package imports, empty modules and paths
    // that would leave the repository.
    std::optional<std::string> resolve(const std::string& importingFile, const Import& import) const;

    // Extensions tried after the path as written
    static const std::vector<std::string>& candidateExtensions();

    // Directory entry files tried last
    static const std::vector<std::string>& indexFiles();

private:
    fs::path root_;

    // Repo-relative target without extension, nullopt if outside the root
    std::optional<fs::path> dottedTarget(const fs::path& baseDir, const std::string& module) const;
    std::optional<fs::path> pathTarget(const fs::path& baseDir, const std::string& module) const;

    bool isFile(const fs::path& relativePath) const;
};
