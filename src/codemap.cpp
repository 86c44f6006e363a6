#include "codemap.hpp"
#include "parse_adapter.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>

CodeMap::CodeMap(const CodeMapOptions& options)
    : options_(options) {

    // Default deny-list plus the project's .gitignore
    patternMatcher_ = std::make_unique<PatternMatcher>(makeRepositoryMatcher(options_.inputDir));

    if (!options_.includePatterns.empty()) {
        patternMatcher_->setIncludePatterns(options_.includePatterns);
    }
    if (!options_.excludePatterns.empty()) {
        patternMatcher_->setExcludePatterns(options_.excludePatterns);
    }

    if (options_.verbose) {
        std::cout << "Loaded " << patternMatcher_->ignoreRuleCount() << " ignore rules" << std::endl;
    }
}

SymbolIndex CodeMap::buildIndex() {
    auto start = std::chrono::steady_clock::now();

    if (options_.verbose) {
        std::cout << "Indexing directory: " << options_.inputDir << std::endl;
    }

    SymbolIndexBuilder builder(options_.inputDir, *patternMatcher_, options_.scan, options_.verbose);
    SymbolIndex index = builder.build();

    indexDuration_ = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (options_.showTiming) {
        std::cout << "Index built in " << indexDuration_.count() << " ms" << std::endl;
    }

    return index;
}

template <typename Result, typename Query>
Result CodeMap::timed(Query query) {
    Result result;
    indexDuration_ = std::chrono::milliseconds{0};

    auto start = std::chrono::steady_clock::now();
    try {
        result = query();
    } catch (const std::exception& e) {
        result.error = e.what();
        if (options_.verbose) {
            std::cerr << "Error: " << e.what() << std::endl;
        }
    }
    queryDuration_ = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start) - indexDuration_;

    return result;
}

template <typename Result, typename Query>
Result CodeMap::withIndex(Query query) {
    return timed<Result>([&]() {
        SymbolIndex index = buildIndex();
        return query(index);
    });
}

IndexSummary CodeMap::summarizeIndex() {
    return withIndex<IndexSummary>([](const SymbolIndex& index) {
        IndexSummary summary;
        summary.files = index.files.size();
        summary.skippedFiles = index.skippedFiles;
        summary.importEdges = index.importGraph.edgeCount();
        for (const auto& [file, symbols] : index.symbolsByFile) {
            summary.symbols += symbols.size();
        }
        for (const auto& [file, imports] : index.importsByFile) {
            summary.imports += imports.size();
        }
        return summary;
    });
}

ScanReport CodeMap::scan() {
    return timed<ScanReport>([this]() {
        RepositoryScanner scanner(options_.inputDir, *patternMatcher_, options_.scan);

        ScanReport report;
        report.files = scanner.scanAll();

        if (options_.verbose) {
            std::cout << "Files scanned: " << report.files.size() << std::endl;
        }
        return report;
    });
}

StatsReport CodeMap::stats() {
    return timed<StatsReport>([this]() {
        StatsReport report;
        report.stats = getRepoStats(options_.inputDir, *patternMatcher_, options_.scan);
        return report;
    });
}

ParseReport CodeMap::parseFile(const std::string& file) {
    return timed<ParseReport>([&]() {
        ParseReport report;
        report.file = normalizeFilePath(file);

        const fs::path fullPath = options_.inputDir / report.file;
        std::error_code ec;
        if (!fs::is_regular_file(fullPath, ec)) {
            report.error = "File not found: " + report.file;
            return report;
        }

        report.parsed = ::parseFile(fullPath);
        if (!report.parsed) {
            report.error = "Could not parse " + report.file;
        }
        return report;
    });
}

SymbolLookup CodeMap::findSymbol(const std::string& name) {
    return withIndex<SymbolLookup>([&](const SymbolIndex& index) {
        SymbolLookup lookup;
        lookup.name = name;
        lookup.locations = ::findSymbol(index, name);
        return lookup;
    });
}

FileDependencies CodeMap::fileDependencies(const std::string& file) {
    return withIndex<FileDependencies>([&](const SymbolIndex& index) {
        return ::fileDependencies(index, normalizeFilePath(file));
    });
}

CallGraphResult CodeMap::callGraph(const std::string& name, CallDirection direction, int depth) {
    return withIndex<CallGraphResult>([&](const SymbolIndex& index) {
        CallGraphAnalyzer analyzer(index, options_.callGraph);
        return analyzer.callGraph(name, direction, depth);
    });
}

FlowTrace CodeMap::traceFlow(const std::string& entryPoint, int maxDepth) {
    return withIndex<FlowTrace>([&](const SymbolIndex& index) {
        CallGraphAnalyzer analyzer(index, options_.callGraph);
        return analyzer.traceFlow(entryPoint, maxDepth);
    });
}

UsageReport CodeMap::findUsages(const std::string& name) {
    return withIndex<UsageReport>([&](const SymbolIndex& index) {
        CallGraphAnalyzer analyzer(index, options_.callGraph);

        UsageReport report;
        report.name = name;
        report.usages = analyzer.findUsages(name);
        return report;
    });
}

ChangeImpact CodeMap::impact(const std::string& file) {
    return withIndex<ChangeImpact>([&](const SymbolIndex& index) {
        return analyzeChangeImpact(index, normalizeFilePath(file));
    });
}

CompressionResult CodeMap::compress(const std::vector<std::string>& files, CompressionMode mode,
                                    size_t tokenBudget) {
    return timed<CompressionResult>([&]() {
        std::error_code ec;
        if (!fs::is_directory(options_.inputDir, ec)) {
            throw std::runtime_error("Project path does not exist: " + options_.inputDir.string());
        }

        std::vector<std::string> normalized;
        normalized.reserve(files.size());
        for (const auto& file : files) {
            normalized.push_back(normalizeFilePath(file));
        }

        ContextCompressor compressor(options_.inputDir, options_.compressor);
        return compressor.compress(normalized, mode, tokenBudget);
    });
}

RepoMapReport CodeMap::repoMap() {
    return withIndex<RepoMapReport>([&](const SymbolIndex& index) {
        RepoMapReport report;
        report.content = generateRepoMap(index, index.root.filename().string(), options_.repoMap);
        return report;
    });
}

SmartContext CodeMap::smartContext(const std::string& question, size_t maxTokens) {
    return withIndex<SmartContext>([&](const SymbolIndex& index) {
        ContextRetriever retriever(index, options_.retrieval, options_.callGraph);
        return retriever.smartContext(question, maxTokens);
    });
}

SearchResults CodeMap::search(const std::string& query, size_t topK) {
    return withIndex<SearchResults>([&](const SymbolIndex& index) {
        ContextRetriever retriever(index, options_.retrieval, options_.callGraph);
        return retriever.search(query, topK);
    });
}

FileContext CodeMap::fileContext(const std::string& file) {
    return withIndex<FileContext>([&](const SymbolIndex& index) {
        ContextRetriever retriever(index, options_.retrieval, options_.callGraph);
        return retriever.fileContext(normalizeFilePath(file));
    });
}

std::string CodeMap::normalizeFilePath(const std::string& file) const {
    fs::path path(file);

    if (path.is_absolute()) {
        std::error_code ec;
        fs::path root = fs::weakly_canonical(options_.inputDir, ec);
        if (ec) {
            root = fs::absolute(options_.inputDir);
        }
        fs::path target = fs::weakly_canonical(path, ec);
        if (ec) {
            target = path;
        }
        path = target.lexically_relative(root);
    }

    std::string normalized = path.lexically_normal().generic_string();
    while (normalized.compare(0, 2, "./") == 0) {
        normalized.erase(0, 2);
    }
    return normalized;
}

std::string CodeMap::getTimingInfo() const {
    std::stringstream ss;
    const auto total = indexDuration_ + queryDuration_;

    ss << "Timing Information:" << std::endl;
    ss << "- Total time: " << total.count() << "ms" << std::endl;
    ss << "- Index build time: " << indexDuration_.count() << "ms ("
       << (indexDuration_.count() * 100 / (total.count() ? total.count() : 1)) << "%)" << std::endl;
    ss << "- Query time: " << queryDuration_.count() << "ms ("
       << (queryDuration_.count() * 100 / (total.count() ? total.count() : 1)) << "%)" << std::endl;

    return ss.str();
}
