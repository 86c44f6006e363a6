#include "symbol_index.hpp"
#include "import_resolver.hpp"
#include "parse_adapter.hpp"
#include <iostream>
#include <system_error>

namespace {

const std::set<std::string>& emptySet() {
    static const std::set<std::string> empty;
    return empty;
}

} // namespace

// ImportGraph

void ImportGraph::addEdge(const std::string& from, const std::string& to) {
    importsOf_[from].insert(to);
    importedBy_[to].insert(from);
}

const std::set<std::string>& ImportGraph::importsOf(const std::string& file) const {
    auto it = importsOf_.find(file);
    return it != importsOf_.end() ? it->second : emptySet();
}

const std::set<std::string>& ImportGraph::importedBy(const std::string& file) const {
    auto it = importedBy_.find(file);
    return it != importedBy_.end() ? it->second : emptySet();
}

size_t ImportGraph::edgeCount() const {
    size_t count = 0;
    for (const auto& [file, targets] : importsOf_) {
        count += targets.size();
    }
    return count;
}

// SymbolIndexBuilder

SymbolIndexBuilder::SymbolIndexBuilder(const fs::path& root, const PatternMatcher& patternMatcher,
                                       const ScanOptions& options, bool verbose)
    : root_(root),
      patternMatcher_(patternMatcher),
      options_(options),
      verbose_(verbose) {
    if (options_.includeExtensions.empty()) {
        options_.includeExtensions = parseableExtensions();
    }
}

SymbolIndex SymbolIndexBuilder::build() const {
    RepositoryScanner scanner(root_, patternMatcher_, options_);

    SymbolIndex index;
    index.root = scanner.root();

    scanner.scan([&](const FileDescriptor& file) {
        const ParseAdapter* adapter = ParserRegistry::instance().adapterForExtension(file.extension);
        if (!adapter) {
            return;
        }

        std::string content;
        try {
            content = readFile(file.path);
        } catch (const std::exception& e) {
            if (verbose_) {
                std::cerr << "Warning: " << e.what() << std::endl;
            }
            ++index.skippedFiles;
            return;
        }

        std::optional<ParsedFile> parsed = adapter->parse(content);
        if (!parsed) {
            if (verbose_) {
                std::cerr << "Warning: Could not parse " << file.relativePath << std::endl;
            }
            ++index.skippedFiles;
            return;
        }

        const std::string& relPath = file.relativePath;
        index.files.push_back(relPath);
        index.fileLanguages[relPath] = parsed->language;

        for (const auto& symbol : parsed->symbols) {
            index.symbolsByName[symbol.name].push_back({relPath, symbol});
        }
        index.symbolsByFile[relPath] = std::move(parsed->symbols);
        index.importsByFile[relPath] = std::move(parsed->imports);
    });

    // Link once every file is known so resolution does not depend on scan order
    ImportResolver resolver(index.root);
    for (const auto& relPath : index.files) {
        for (const auto& imp : index.importsByFile[relPath]) {
            std::optional<std::string> target = resolver.resolve(relPath, imp);
            if (!target || *target == relPath) {
                continue;
            }

            std::error_code ec;
            if (!fs::is_regular_file(index.root / *target, ec)) {
                continue;
            }
            index.importGraph.addEdge(relPath, *target);
        }
    }

    if (verbose_) {
        std::cout << "Indexed " << index.files.size() << " files, "
                  << index.symbolsByName.size() << " distinct symbols, "
                  << index.importGraph.edgeCount() << " import edges" << std::endl;
    }

    return index;
}

// Queries

std::vector<SymbolLocation> findSymbol(const SymbolIndex& index, const std::string& name) {
    auto it = index.symbolsByName.find(name);
    if (it == index.symbolsByName.end()) {
        return {};
    }
    return it->second;
}

const SymbolLocation* firstDefinition(const SymbolIndex& index, const std::string& name) {
    auto it = index.symbolsByName.find(name);
    if (it == index.symbolsByName.end() || it->second.empty()) {
        return nullptr;
    }
    return &it->second.front();
}

FileDependencies fileDependencies(const SymbolIndex& index, const std::string& relativePath) {
    FileDependencies deps;
    deps.file = relativePath;

    auto it = index.symbolsByFile.find(relativePath);
    if (it == index.symbolsByFile.end()) {
        deps.error = "File not found in index: " + relativePath;
        return deps;
    }

    deps.symbols = it->second;

    const auto& imports = index.importGraph.importsOf(relativePath);
    deps.imports.assign(imports.begin(), imports.end());

    const auto& importedBy = index.importGraph.importedBy(relativePath);
    deps.importedBy.assign(importedBy.begin(), importedBy.end());

    return deps;
}
