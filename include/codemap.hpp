#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <chrono>
#include <memory>
#include "code_model.hpp"
#include "pattern_matcher.hpp"
#include "repository_scanner.hpp"
#include "symbol_index.hpp"
#include "call_graph.hpp"
#include "change_impact.hpp"
#include "context_compressor.hpp"
#include "repo_map.hpp"
#include "context_retrieval.hpp"

namespace fs = std::filesystem;

struct CodeMapOptions {
    fs::path inputDir;
    bool verbose = false;
    bool showTiming = false;
    std::string includePatterns;   // Comma-separated list of glob patterns to include
    std::string excludePatterns;   // Comma-separated list of glob patterns to exclude
    ScanOptions scan;              // Depth and size bounds
    CallGraphOptions callGraph;
    CompressorOptions compressor;
    RepoMapOptions repoMap;
    RetrievalOptions retrieval;
};

struct ScanReport {
    std::vector<FileDescriptor> files;
    std::string error;
};

struct StatsReport {
    RepoStats stats;
    std::string error;
};

struct ParseReport {
    std::string file;
    std::optional<ParsedFile> parsed;
    std::string error;
};

struct SymbolLookup {
    std::string name;
    std::vector<SymbolLocation> locations;
    std::string error;
};

struct UsageReport {
    std::string name;
    std::vector<Usage> usages;
    std::string error;
};

struct RepoMapReport {
    std::string content;
    std::string error;
};

struct IndexSummary {
    size_t files = 0;
    size_t symbols = 0;
    size_t imports = 0;
    size_t importEdges = 0;
    size_t skippedFiles = 0;
    std::string error;
};

// Entry point for every query against one project root.
//
// Each query builds a fresh index, runs, and returns a result value; missing
// roots, files or symbols are reported in the result's error field instead of
// being thrown.
class CodeMap {
public:
    CodeMap(const CodeMapOptions& options);

    // Build the index. Throws std::runtime_error if the root does not exist.
    SymbolIndex buildIndex();

    IndexSummary summarizeIndex();
    ScanReport scan();
    StatsReport stats();
    ParseReport parseFile(const std::string& file);
    SymbolLookup findSymbol(const std::string& name);
    FileDependencies fileDependencies(const std::string& file);
    CallGraphResult callGraph(const std::string& name, CallDirection direction, int depth = 1);
    FlowTrace traceFlow(const std::string& entryPoint, int maxDepth = 10);
    UsageReport findUsages(const std::string& name);
    ChangeImpact impact(const std::string& file);
    CompressionResult compress(const std::vector<std::string>& files, CompressionMode mode,
                               size_t tokenBudget = 0);
    RepoMapReport repoMap();
    SmartContext smartContext(const std::string& question, size_t maxTokens = 15000);
    SearchResults search(const std::string& query, size_t topK = 10);
    FileContext fileContext(const std::string& file);

    // Timings of the last query
    std::string getTimingInfo() const;

    // Repo-relative form of a user supplied path ("./a.py", absolute paths inside the root)
    std::string normalizeFilePath(const std::string& file) const;

private:
    CodeMapOptions options_;
    std::unique_ptr<PatternMatcher> patternMatcher_;

    // Timing info
    std::chrono::milliseconds indexDuration_{0};
    std::chrono::milliseconds queryDuration_{0};

    // Build the index, run a query on it and time both phases
    template <typename Result, typename Query>
    Result withIndex(Query query);

    template <typename Result, typename Query>
    Result timed(Query query);
};
