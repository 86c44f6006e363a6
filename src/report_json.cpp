#include "report_json.hpp"

namespace {

json errorObject(const std::string& error) {
    json j;
    j["error"] = error;
    return j;
}

} // namespace

void to_json(json& j, const FileDescriptor& file) {
    j = json{
        {"path", file.relativePath},
        {"extension", file.extension},
        {"size", file.sizeBytes},
        {"language", file.languageName}
    };
}

void to_json(json& j, const Symbol& symbol) {
    j = json{
        {"name", symbol.name},
        {"kind", symbolKindToString(symbol.kind)},
        {"signature", symbol.signature},
        {"start_line", symbol.startLine},
        {"end_line", symbol.endLine}
    };
    if (!symbol.docstring.empty()) {
        j["docstring"] = symbol.docstring;
    }
    if (!symbol.parent.empty()) {
        j["parent"] = symbol.parent;
    }
}

void to_json(json& j, const Import& import) {
    j = json{
        {"module", import.module},
        {"items", import.items},
        {"is_relative", import.isRelative}
    };
    if (!import.alias.empty()) {
        j["alias"] = import.alias;
    }
}

void to_json(json& j, const ParsedFile& parsed) {
    j = json{
        {"language", languageToString(parsed.language)},
        {"symbols", parsed.symbols},
        {"imports", parsed.imports},
        {"exports", parsed.exports}
    };
}

void to_json(json& j, const SymbolLocation& location) {
    j = location.symbol;
    j["file"] = location.relativePath;
}

void to_json(json& j, const RepoStats& stats) {
    j = json{
        {"total_files", stats.totalFiles},
        {"total_lines", stats.totalLines},
        {"languages", stats.languages},
        {"file_types", stats.fileTypes}
    };
}

void to_json(json& j, const IndexSummary& summary) {
    if (!summary.error.empty()) {
        j = errorObject(summary.error);
        return;
    }
    j = json{
        {"files", summary.files},
        {"symbols", summary.symbols},
        {"imports", summary.imports},
        {"import_edges", summary.importEdges},
        {"skipped_files", summary.skippedFiles}
    };
}

void to_json(json& j, const ScanReport& report) {
    if (!report.error.empty()) {
        j = errorObject(report.error);
        return;
    }
    j = json{
        {"total_files", report.files.size()},
        {"files", report.files}
    };
}

void to_json(json& j, const StatsReport& report) {
    if (!report.error.empty()) {
        j = errorObject(report.error);
        return;
    }
    j = report.stats;
}

void to_json(json& j, const ParseReport& report) {
    if (!report.error.empty()) {
        j = errorObject(report.error);
        j["file"] = report.file;
        return;
    }
    j = *report.parsed;
    j["file"] = report.file;
}

void to_json(json& j, const SymbolLookup& lookup) {
    if (!lookup.error.empty()) {
        j = errorObject(lookup.error);
        return;
    }
    j = json{
        {"name", lookup.name},
        {"definitions", lookup.locations}
    };
}

void to_json(json& j, const FileDependencies& deps) {
    if (!deps.error.empty()) {
        j = errorObject(deps.error);
        return;
    }
    j = json{
        {"file", deps.file},
        {"imports", deps.imports},
        {"imported_by", deps.importedBy},
        {"symbols", deps.symbols}
    };
}

void to_json(json& j, const CallerInfo& caller) {
    j = json{
        {"file", caller.file},
        {"function", caller.function},
        {"line", caller.line},
        {"level", caller.level}
    };
}

void to_json(json& j, const CalleeInfo& callee) {
    j = json{
        {"function", callee.function},
        {"level", callee.level}
    };
    if (!callee.file.empty()) {
        j["file"] = callee.file;
        j["line"] = callee.line;
    }
}

void to_json(json& j, const CallGraphResult& result) {
    if (!result.error.empty()) {
        j = errorObject(result.error);
        return;
    }
    j = json{
        {"function", result.function},
        {"file", result.file},
        {"line", result.line},
        {"depth", result.depth}
    };
    if (result.direction != CallDirection::Callees) {
        j["callers"] = result.callers;
    }
    if (result.direction != CallDirection::Callers) {
        j["callees"] = result.callees;
    }
}

void to_json(json& j, const FlowStep& step) {
    j = json{
        {"depth", step.depth},
        {"function", step.function},
        {"file", step.file},
        {"type", step.external ? "external" : "internal"}
    };
    if (!step.external) {
        j["line"] = step.line;
        j["signature"] = step.signature;
    }
}

void to_json(json& j, const FlowTrace& trace) {
    if (!trace.error.empty()) {
        j = errorObject(trace.error);
        return;
    }
    j = json{
        {"entry_point", trace.entryPoint},
        {"total_steps", trace.steps.size()},
        {"flow", trace.steps},
        {"flow_text", formatFlow(trace)}
    };
}

void to_json(json& j, const Usage& usage) {
    j = json{
        {"file", usage.file},
        {"line", usage.line},
        {"content", usage.content},
        {"type", usage.type}
    };
}

void to_json(json& j, const UsageReport& report) {
    if (!report.error.empty()) {
        j = errorObject(report.error);
        return;
    }
    j = json{
        {"symbol", report.name},
        {"total_usages", report.usages.size()},
        {"usages", report.usages}
    };
}

void to_json(json& j, const ChangeImpact& impact) {
    if (!impact.error.empty()) {
        j = errorObject(impact.error);
        return;
    }
    j = json{
        {"file", impact.file},
        {"symbols_exported", impact.exportedSymbols},
        {"direct_dependents", impact.directDependents},
        {"indirect_dependents", impact.indirectDependents},
        {"total_affected_files", impact.totalAffected},
        {"risk_level", riskLevelToString(impact.risk)},
        {"recommendation", impact.recommendation}
    };
}

void to_json(json& j, const CompressionResult& result) {
    if (!result.error.empty()) {
        j = errorObject(result.error);
        return;
    }
    j = json{
        {"content", result.content},
        {"files_included", result.filesIncluded},
        {"omitted_files", result.omittedFiles},
        {"estimated_tokens", result.estimatedTokens},
        {"mode", compressionModeToString(result.mode)}
    };
}

void to_json(json& j, const RelevantFile& file) {
    j = json{
        {"file", file.file},
        {"relevance_score", file.score},
        {"matched_symbols", file.matchedSymbols},
        {"content", file.content}
    };
}

void to_json(json& j, const SmartContext& context) {
    if (!context.error.empty()) {
        j = errorObject(context.error);
        return;
    }
    j = json{
        {"question", context.question},
        {"keywords_detected", context.keywords},
        {"files_analyzed", context.filesAnalyzed},
        {"relevant_files", context.files},
        {"total_tokens_estimate", context.estimatedTokens}
    };
}

void to_json(json& j, const SearchHit& hit) {
    j = json{
        {"file", hit.file},
        {"line", hit.line},
        {"match_type", hit.symbolMatch ? "symbol" : "content"},
        {"relevance", hit.exact ? "high" : "medium"}
    };
    if (hit.symbolMatch) {
        j["symbol"] = hit.symbol;
    } else {
        j["content"] = hit.content;
        j["usage_type"] = hit.usageType;
    }
}

void to_json(json& j, const SearchResults& results) {
    if (!results.error.empty()) {
        j = errorObject(results.error);
        return;
    }
    j = json{
        {"query", results.query},
        {"keywords_detected", results.keywords},
        {"results", results.hits}
    };
}

void to_json(json& j, const RelatedFile& related) {
    j = json{
        {"file", related.file},
        {"relationship", related.relationship}
    };
    if (related.relationship == "imports") {
        j["symbols"] = related.symbols;
    }
}

void to_json(json& j, const FileContext& context) {
    if (!context.error.empty()) {
        j = errorObject(context.error);
        return;
    }
    j = json{
        {"file", {
            {"path", context.file},
            {"content", context.content},
            {"language", context.language},
            {"symbols", context.symbols},
            {"imports", context.imports}
        }},
        {"related_files", context.related}
    };
}
