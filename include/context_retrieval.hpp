#pragma once

#include <string>
#include <vector>
#include "call_graph.hpp"
#include "symbol_index.hpp"

struct RetrievalOptions {
    size_t maxCandidateFiles = 20;     // Highest scoring files considered by smartContext
    size_t truncateBelowFiles = 3;     // Over-budget files are cut, not skipped, until this many are kept
    size_t usagesPerKeyword = 5;       // Content hits per keyword in search
    size_t maxRelatedFiles = 5;        // Per relationship in fileContext
    size_t maxRelatedSymbols = 10;
    size_t charsPerToken = 4;
};

struct RelevantFile {
    std::string file;
    int score = 0;
    std::vector<std::string> matchedSymbols;   // Sorted, unique
    std::string content;
};

struct SmartContext {
    std::string question;
    std::vector<std::string> keywords;
    size_t filesAnalyzed = 0;                  // Files with a non-zero score
    std::vector<RelevantFile> files;           // Highest score first
    size_t estimatedTokens = 0;
    std::string error;
};

struct SearchHit {
    std::string file;
    uint32_t line = 0;
    bool symbolMatch = false;                  // Symbol name match, otherwise a content line
    std::string symbol;                        // describeSymbol text for symbol matches
    std::string content;                       // Source line for content matches
    std::string usageType;
    bool exact = false;                        // Keyword equals the symbol name
};

struct SearchResults {
    std::string query;
    std::vector<std::string> keywords;
    std::vector<SearchHit> hits;
    std::string error;
};

struct RelatedFile {
    std::string file;
    std::string relationship;                  // "imports" or "used_by"
    std::vector<std::string> symbols;          // Only for "imports"
};

struct FileContext {
    std::string file;
    std::string content;
    std::string language;
    std::vector<std::string> symbols;
    std::vector<std::string> imports;          // Module references as written
    std::vector<RelatedFile> related;
    std::string error;
};

// Identifiers of a free-text question longer than two characters, stop words
// removed, first occurrence order
std::vector<std::string> extractKeywords(const std::string& text);

// Keyword-driven retrieval over a built index.
//
// Files score 10 per exact symbol name match, 5 per partial (case-insensitive
// substring) match and 1 per textual usage of a keyword.
class ContextRetriever {
public:
    ContextRetriever(const SymbolIndex& index, const RetrievalOptions& options = RetrievalOptions(),
                     const CallGraphOptions& callGraphOptions = CallGraphOptions());

    // Highest scoring files with their content, packed into maxTokens
    SmartContext smartContext(const std::string& question, size_t maxTokens = 15000) const;

    // Symbol matches first (exact before partial), then content lines, at most topK
    SearchResults search(const std::string& query, size_t topK = 10) const;

    // One file with its symbols, imports and the files on either side of its import edges
    FileContext fileContext(const std::string& relativePath) const;

private:
    const SymbolIndex& index_;
    RetrievalOptions options_;
    CallGraphAnalyzer analyzer_;
};
