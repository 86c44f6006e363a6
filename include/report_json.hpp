#pragma once

#include <nlohmann/json.hpp>
#include "codemap.hpp"

using json = nlohmann::json;

// JSON forms of the data model and query results. Fields that only make sense
// on success are left out when a result carries an error.

void to_json(json& j, const FileDescriptor& file);
void to_json(json& j, const Symbol& symbol);
void to_json(json& j, const Import& import);
void to_json(json& j, const ParsedFile& parsed);
void to_json(json& j, const SymbolLocation& location);
void to_json(json& j, const RepoStats& stats);

void to_json(json& j, const IndexSummary& summary);
void to_json(json& j, const ScanReport& report);
void to_json(json& j, const StatsReport& report);
void to_json(json& j, const ParseReport& report);
void to_json(json& j, const SymbolLookup& lookup);
void to_json(json& j, const FileDependencies& deps);
void to_json(json& j, const CallerInfo& caller);
void to_json(json& j, const CalleeInfo& callee);
void to_json(json& j, const CallGraphResult& result);
void to_json(json& j, const FlowStep& step);
void to_json(json& j, const FlowTrace& trace);
void to_json(json& j, const Usage& usage);
void to_json(json& j, const UsageReport& report);
void to_json(json& j, const ChangeImpact& impact);
void to_json(json& j, const CompressionResult& result);
void to_json(json& j, const RelevantFile& file);
void to_json(json& j, const SmartContext& context);
void to_json(json& j, const SearchHit& hit);
void to_json(json& j, const SearchResults& results);
void to_json(json& j, const RelatedFile& related);
void to_json(json& j, const FileContext& context);
