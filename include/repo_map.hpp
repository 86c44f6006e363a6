#pragma once

#include <string>
#include "symbol_index.hpp"

struct RepoMapOptions {
    size_t maxTokens = 8000;          // Truncate the map beyond this estimate
    bool includeDocstrings = false;
    size_t maxImportsPerFile = 5;
    size_t maxItemsPerImport = 3;
};

// Condensed outline of every indexed file, grouped by directory:
//
//   # Repository Map: project
//
//   ## src/
//
//   ### app.py
//     imports: {helper} from .util
//     class App(Base):
//       def run(self)
//     def main()
std::string generateRepoMap(const SymbolIndex& index, const std::string& projectName,
                            const RepoMapOptions& options = RepoMapOptions());
