#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include "code_model.hpp"
#include "symbol_index.hpp"

enum class CallDirection {
    Callers,
    Callees,
    Both
};

// Parse "callers", "callees" or "both"; throws std::invalid_argument otherwise
CallDirection callDirectionFromString(const std::string& value);
std::string callDirectionToString(CallDirection direction);

struct CallGraphOptions {
    size_t maxCallers = 50;      // Cap on reported callers
    size_t maxCallees = 30;      // Cap on callees per scanned body and on the result
    size_t flowFanout = 5;       // Callees followed per step by traceFlow
};

struct CallerInfo {
    std::string file;
    std::string function;
    uint32_t line = 0;
    int level = 1;               // 1 = calls the target directly
};

struct CalleeInfo {
    std::string function;
    std::string file;            // Empty when no definition is indexed
    uint32_t line = 0;
    int level = 1;
};

struct CallGraphResult {
    std::string function;
    std::string file;
    uint32_t line = 0;
    CallDirection direction = CallDirection::Both;
    int depth = 1;
    std::vector<CallerInfo> callers;
    std::vector<CalleeInfo> callees;
    std::string error;
};

struct FlowStep {
    int depth = 0;
    std::string function;
    std::string file;            // "(external)" for names without a definition
    uint32_t line = 0;
    std::string signature;
    bool external = false;
};

struct FlowTrace {
    std::string entryPoint;
    std::vector<FlowStep> steps;
    std::string error;
};

struct Usage {
    std::string file;
    uint32_t line = 0;
    std::string content;         // Trimmed, at most 150 characters
    std::string type;            // definition, import, call, attribute, assignment, reference
};

// Textual call analysis over a built index.
//
// Callees come from scanning a symbol's body for "name(" tokens, callers from
// finding "target(" inside other functions' line ranges. No type information
// is used, so overloaded names resolve to their first definition.
class CallGraphAnalyzer {
public:
    CallGraphAnalyzer(const SymbolIndex& index, const CallGraphOptions& options = CallGraphOptions());

    // Callers and/or callees of the first definition of name, expanded level by
    // level up to depth (>= 1) without revisiting a name
    CallGraphResult callGraph(const std::string& name, CallDirection direction, int depth = 1) const;

    // Depth-first callee expansion from an entry point, never deeper than maxDepth
    FlowTrace traceFlow(const std::string& entryPoint, int maxDepth = 10) const;

    // Every whole-word occurrence of name in the indexed files
    std::vector<Usage> findUsages(const std::string& name) const;

    // Names called from a symbol's body, keywords and builtins excluded
    std::vector<std::string> directCallees(const SymbolLocation& location) const;

    // Functions and methods whose body calls name
    std::vector<CallerInfo> directCallers(const std::string& name) const;

private:
    const SymbolIndex& index_;
    CallGraphOptions options_;

    // Files are read at most once per analyzer
    mutable std::map<std::string, std::vector<std::string>> lineCache_;

    const std::vector<std::string>& fileLines(const std::string& relativePath) const;
    std::string bodyText(const std::string& relativePath, const Symbol& symbol) const;

    void traceStep(const std::string& name, int depth, int maxDepth,
                   std::set<std::string>& visited, std::vector<FlowStep>& steps) const;
};

// Indented text rendering, one step per line
std::string formatFlow(const FlowTrace& trace);

// Classify one source line that mentions name
std::string classifyUsage(const std::string& line, const std::string& name);
