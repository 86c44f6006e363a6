#include <iostream>
#include <CLI/CLI.hpp>
#include "codemap.hpp"
#include "report_json.hpp"

namespace {

// Print a structured result and turn its error field into the exit code
template <typename Result>
int printReport(const Result& result, const CodeMap& codemap, const CodeMapOptions& options) {
    json j = result;
    std::cout << j.dump(2) << std::endl;

    if (options.showTiming) {
        std::cout << codemap.getTimingInfo();
    }

    return result.error.empty() ? 0 : 1;
}

// Positional words back into one question
std::string joinWords(const std::vector<std::string>& words) {
    std::string joined;
    for (const auto& word : words) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += word;
    }
    return joined;
}

} // namespace

int main(int argc, char** argv) {
    try {
        CLI::App app{"codemap - Symbol index, import graph and call graph queries for source repositories"};
        app.require_subcommand(1);
        app.fallthrough();

        CodeMapOptions options;

        // Required input directory
        app.add_option("-i,--input", options.inputDir, "Project root directory (required)")
            ->required();

        // Scan bounds
        app.add_option("--max-depth", options.scan.maxDepth, "Maximum directory depth to scan (default: 15)")
            ->check(CLI::Range(0, 1000));
        app.add_option("--max-file-size", options.scan.maxFileSize, "Skip files larger than this many bytes (default: 1000000)");

        // Optional include patterns
        app.add_option("--include", options.includePatterns,
                     "Comma-separated list of glob patterns for files to include (e.g. src/**,*.py)");

        // Optional exclude patterns
        app.add_option("--exclude", options.excludePatterns,
                     "Comma-separated list of glob patterns for files to exclude (e.g. tests/,*.spec.ts)");

        // Optional verbose flag
        app.add_flag("-v,--verbose", options.verbose, "Enable verbose output");

        // Optional timing flag
        app.add_flag("-t,--timing", options.showTiming, "Show detailed timing information");

        // map
        auto* mapCmd = app.add_subcommand("map", "Print a condensed repository map");
        mapCmd->add_option("--max-tokens", options.repoMap.maxTokens, "Token budget for the map (default: 8000)");
        mapCmd->add_flag("--docstrings", options.repoMap.includeDocstrings, "Include truncated docstrings");

        // scan
        auto* scanCmd = app.add_subcommand("scan", "List files that pass the ignore rules");

        // stats
        auto* statsCmd = app.add_subcommand("stats", "File, line and language counts");

        // index summary
        auto* indexCmd = app.add_subcommand("index", "Build the index and summarize it");

        // parse
        std::string parseTarget;
        auto* parseCmd = app.add_subcommand("parse", "Symbols and imports of one file");
        parseCmd->add_option("file", parseTarget, "File path relative to the project root")->required();

        // symbols
        std::string symbolName;
        auto* symbolsCmd = app.add_subcommand("symbols", "Find every definition of a symbol");
        symbolsCmd->add_option("name", symbolName, "Symbol name")->required();

        // deps
        std::string depsTarget;
        auto* depsCmd = app.add_subcommand("deps", "Imports and dependents of one file");
        depsCmd->add_option("file", depsTarget, "File path relative to the project root")->required();

        // callgraph
        std::string callTarget;
        std::string directionStr = "both";
        int callDepth = 1;
        auto* callCmd = app.add_subcommand("callgraph", "Callers and callees of a function");
        callCmd->add_option("function", callTarget, "Function or method name")->required();
        callCmd->add_option("-d,--direction", directionStr, "callers, callees or both (default: both)")
            ->check(CLI::IsMember({"callers", "callees", "both"}));
        callCmd->add_option("--depth", callDepth, "Levels to expand (default: 1)")
            ->check(CLI::Range(1, 10));

        // trace
        std::string traceEntry;
        int traceDepth = 10;
        auto* traceCmd = app.add_subcommand("trace", "Follow calls from an entry point");
        traceCmd->add_option("entry", traceEntry, "Entry point function name")->required();
        traceCmd->add_option("--depth", traceDepth, "Maximum call depth (default: 10)")
            ->check(CLI::Range(0, 50));

        // usages
        std::string usageName;
        auto* usagesCmd = app.add_subcommand("usages", "Every textual usage of a symbol");
        usagesCmd->add_option("name", usageName, "Symbol name")->required();

        // impact
        std::string impactTarget;
        auto* impactCmd = app.add_subcommand("impact", "Files affected by changing a file");
        impactCmd->add_option("file", impactTarget, "File path relative to the project root")->required();

        // compress
        std::vector<std::string> compressFiles;
        std::string modeStr = "smart";
        size_t tokenBudget = 0;
        bool textOutput = false;
        auto* compressCmd = app.add_subcommand("compress", "Render files in a token-efficient form");
        compressCmd->add_option("files", compressFiles, "Files relative to the project root")->required();
        compressCmd->add_option("-m,--mode", modeStr, "full, signatures or smart (default: smart)")
            ->check(CLI::IsMember({"full", "signatures", "smart"}));
        compressCmd->add_option("--budget", tokenBudget, "Approximate token budget, 0 for none (default: 0)");
        compressCmd->add_flag("--text", textOutput, "Print the rendered text instead of JSON");

        // context
        std::vector<std::string> questionWords;
        size_t contextTokens = 15000;
        auto* contextCmd = app.add_subcommand("context", "Most relevant files for a question, within a token budget");
        contextCmd->add_option("question", questionWords, "Free-text question")->required();
        contextCmd->add_option("--max-tokens", contextTokens, "Token budget for file contents (default: 15000)");

        // search
        std::vector<std::string> queryWords;
        size_t topK = 10;
        auto* searchCmd = app.add_subcommand("search", "Keyword search over symbol names and source lines");
        searchCmd->add_option("query", queryWords, "Search terms")->required();
        searchCmd->add_option("--top", topK, "Maximum number of results (default: 10)")
            ->check(CLI::Range(1, 1000));

        // file
        std::string contextTarget;
        auto* fileCmd = app.add_subcommand("file", "One file with the files it imports and the files using it");
        fileCmd->add_option("file", contextTarget, "File path relative to the project root")->required();

        // Parse command line arguments
        CLI11_PARSE(app, argc, argv);

        CodeMap codemap(options);

        if (*mapCmd) {
            RepoMapReport report = codemap.repoMap();
            if (!report.error.empty()) {
                std::cerr << "Error: " << report.error << std::endl;
                return 1;
            }
            std::cout << report.content << std::endl;
            if (options.showTiming) {
                std::cout << codemap.getTimingInfo();
            }
            return 0;
        }

        if (*scanCmd) {
            return printReport(codemap.scan(), codemap, options);
        }

        if (*statsCmd) {
            return printReport(codemap.stats(), codemap, options);
        }

        if (*indexCmd) {
            return printReport(codemap.summarizeIndex(), codemap, options);
        }

        if (*parseCmd) {
            return printReport(codemap.parseFile(parseTarget), codemap, options);
        }

        if (*symbolsCmd) {
            return printReport(codemap.findSymbol(symbolName), codemap, options);
        }

        if (*depsCmd) {
            return printReport(codemap.fileDependencies(depsTarget), codemap, options);
        }

        if (*callCmd) {
            return printReport(codemap.callGraph(callTarget, callDirectionFromString(directionStr), callDepth),
                               codemap, options);
        }

        if (*traceCmd) {
            return printReport(codemap.traceFlow(traceEntry, traceDepth), codemap, options);
        }

        if (*usagesCmd) {
            return printReport(codemap.findUsages(usageName), codemap, options);
        }

        if (*impactCmd) {
            return printReport(codemap.impact(impactTarget), codemap, options);
        }

        if (*contextCmd) {
            return printReport(codemap.smartContext(joinWords(questionWords), contextTokens), codemap, options);
        }

        if (*searchCmd) {
            return printReport(codemap.search(joinWords(queryWords), topK), codemap, options);
        }

        if (*fileCmd) {
            return printReport(codemap.fileContext(contextTarget), codemap, options);
        }

        if (*compressCmd) {
            CompressionResult result = codemap.compress(compressFiles, compressionModeFromString(modeStr), tokenBudget);
            if (textOutput && result.error.empty()) {
                std::cout << result.content;
                return 0;
            }
            return printReport(result, codemap, options);
        }

        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
