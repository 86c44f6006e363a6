#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <filesystem>
#include "code_model.hpp"
#include "pattern_matcher.hpp"
#include "repository_scanner.hpp"

namespace fs = std::filesystem;

// Resolved file-level import edges, kept in both directions
class ImportGraph {
public:
    // Record that "from" imports "to". Both directions are updated together.
    void addEdge(const std::string& from, const std::string& to);

    // Files a file imports, or an empty set
    const std::set<std::string>& importsOf(const std::string& file) const;

    // Files importing a file, or an empty set
    const std::set<std::string>& importedBy(const std::string& file) const;

    const std::map<std::string, std::set<std::string>>& forward() const { return importsOf_; }
    const std::map<std::string, std::set<std::string>>& reverse() const { return importedBy_; }

    size_t edgeCount() const;

private:
    std::map<std::string, std::set<std::string>> importsOf_;
    std::map<std::string, std::set<std::string>> importedBy_;
};

struct SymbolLocation {
    std::string relativePath;
    Symbol symbol;
};

struct SymbolIndex {
    fs::path root;
    std::vector<std::string> files;                                  // Indexed files in scan order
    std::map<std::string, std::vector<Symbol>> symbolsByFile;        // Declaration order
    std::map<std::string, std::vector<SymbolLocation>> symbolsByName; // Scan order, first match wins
    std::map<std::string, std::vector<Import>> importsByFile;
    std::map<std::string, Language> fileLanguages;
    ImportGraph importGraph;
    size_t skippedFiles = 0;                                         // Unparseable or unreadable

    bool hasFile(const std::string& relativePath) const {
        return symbolsByFile.find(relativePath) != symbolsByFile.end();
    }
};

struct FileDependencies {
    std::string file;
    std::vector<std::string> imports;
    std::vector<std::string> importedBy;
    std::vector<Symbol> symbols;
    std::string error;
};

class SymbolIndexBuilder {
public:
    SymbolIndexBuilder(const fs::path& root, const PatternMatcher& patternMatcher,
                       const ScanOptions& options = ScanOptions(), bool verbose = false);

    // Scan, parse and link every parseable file under the root.
    // Throws std::runtime_error if the root does not exist.
    SymbolIndex build() const;

private:
    fs::path root_;
    const PatternMatcher& patternMatcher_;
    ScanOptions options_;
    bool verbose_;
};

// All definitions of a name in scan order
std::vector<SymbolLocation> findSymbol(const SymbolIndex& index, const std::string& name);

// First definition of a name, nullptr if unknown
const SymbolLocation* firstDefinition(const SymbolIndex& index, const std::string& name);

// Imports, dependents and symbols of one file
FileDependencies fileDependencies(const SymbolIndex& index, const std::string& relativePath);
