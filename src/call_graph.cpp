#include "call_graph.hpp"
#include "repository_scanner.hpp"
#include <algorithm>
#include <iostream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace {

constexpr size_t MAX_USAGE_CONTENT = 150;

// Control flow keywords and builtins that look like calls
const std::unordered_set<std::string>& pythonNonCalls() {
    static const std::unordered_set<std::string> names = {
        "if", "elif", "for", "while", "with", "try", "except", "return", "assert",
        "not", "and", "or", "in", "lambda", "yield", "await", "del",
        "print", "len", "str", "int", "float", "bool", "list", "dict", "set",
        "tuple", "range", "enumerate", "zip", "map", "filter", "sorted", "open",
        "super", "isinstance", "type"
    };
    return names;
}

const std::unordered_set<std::string>& ecmaScriptNonCalls() {
    static const std::unordered_set<std::string> names = {
        "if", "for", "while", "switch", "catch", "return", "function", "typeof",
        "new", "await", "async", "yield", "import", "require", "super", "void",
        "delete", "in", "of", "constructor", "String", "Number", "Boolean",
        "Array", "Object", "parseInt", "parseFloat", "setTimeout", "setInterval"
    };
    return names;
}

const std::unordered_set<std::string>& nonCallsFor(Language language) {
    if (language == Language::Python) {
        return pythonNonCalls();
    }
    return ecmaScriptNonCalls();
}

std::string escapeRegex(const std::string& text) {
    static const std::string specials = "\\^$.|?*+()[]{}";
    std::string escaped;
    for (char c : text) {
        if (specials.find(c) != std::string::npos) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

std::string trim(const std::string& text) {
    const size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    const size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

} // namespace

CallDirection callDirectionFromString(const std::string& value) {
    if (value == "callers") return CallDirection::Callers;
    if (value == "callees") return CallDirection::Callees;
    if (value == "both") return CallDirection::Both;
    throw std::invalid_argument("Unknown call direction: " + value);
}

std::string callDirectionToString(CallDirection direction) {
    switch (direction) {
        case CallDirection::Callers:
            return "callers";
        case CallDirection::Callees:
            return "callees";
        case CallDirection::Both:
        default:
            return "both";
    }
}

CallGraphAnalyzer::CallGraphAnalyzer(const SymbolIndex& index, const CallGraphOptions& options)
    : index_(index),
      options_(options) {
}

const std::vector<std::string>& CallGraphAnalyzer::fileLines(const std::string& relativePath) const {
    auto it = lineCache_.find(relativePath);
    if (it != lineCache_.end()) {
        return it->second;
    }

    std::vector<std::string> lines;
    try {
        lines = splitLines(readFile(index_.root / relativePath));
    } catch (const std::exception& e) {
        // A file that vanished since the build has no body to scan
        std::cerr << "Warning: " << e.what() << std::endl;
    }

    return lineCache_.emplace(relativePath, std::move(lines)).first->second;
}

std::string CallGraphAnalyzer::bodyText(const std::string& relativePath, const Symbol& symbol) const {
    const auto& lines = fileLines(relativePath);

    std::string body;
    const size_t first = symbol.startLine > 0 ? symbol.startLine - 1 : 0;
    const size_t last = std::min<size_t>(symbol.endLine, lines.size());
    for (size_t i = first; i < last; ++i) {
        body += lines[i];
        body += '\n';
    }
    return body;
}

std::vector<std::string> CallGraphAnalyzer::directCallees(const SymbolLocation& location) const {
    static const std::regex callPattern(R"(\b([A-Za-z_][A-Za-z0-9_]*)\s*\()");

    auto langIt = index_.fileLanguages.find(location.relativePath);
    const Language language = langIt != index_.fileLanguages.end() ? langIt->second : Language::Unknown;
    const auto& excluded = nonCallsFor(language);

    const std::string body = bodyText(location.relativePath, location.symbol);

    std::vector<std::string> callees;
    std::unordered_set<std::string> seen;

    for (std::sregex_iterator it(body.begin(), body.end(), callPattern), end; it != end; ++it) {
        const std::string name = (*it)[1].str();
        if (name == location.symbol.name || excluded.count(name) || !seen.insert(name).second) {
            continue;
        }
        callees.push_back(name);
        if (callees.size() >= options_.maxCallees) {
            break;
        }
    }

    return callees;
}

std::vector<CallerInfo> CallGraphAnalyzer::directCallers(const std::string& name) const {
    const std::regex callPattern("\\b" + escapeRegex(name) + "\\s*\\(");

    std::vector<CallerInfo> callers;

    for (const auto& file : index_.files) {
        auto symbolsIt = index_.symbolsByFile.find(file);
        if (symbolsIt == index_.symbolsByFile.end()) {
            continue;
        }

        // Cheap whole-file check before looking at individual bodies
        const auto& lines = fileLines(file);
        const bool mentioned = std::any_of(lines.begin(), lines.end(), [&](const std::string& line) {
            return std::regex_search(line, callPattern);
        });
        if (!mentioned) {
            continue;
        }

        for (const auto& symbol : symbolsIt->second) {
            if (symbol.kind != SymbolKind::Function && symbol.kind != SymbolKind::Method) {
                continue;
            }
            if (symbol.name == name) {
                continue;
            }
            if (!std::regex_search(bodyText(file, symbol), callPattern)) {
                continue;
            }

            CallerInfo caller;
            caller.file = file;
            caller.function = symbol.name;
            caller.line = symbol.startLine;
            callers.push_back(caller);

            if (callers.size() >= options_.maxCallers) {
                return callers;
            }
        }
    }

    return callers;
}

CallGraphResult CallGraphAnalyzer::callGraph(const std::string& name, CallDirection direction, int depth) const {
    CallGraphResult result;
    result.function = name;
    result.direction = direction;
    result.depth = std::max(depth, 1);

    const SymbolLocation* target = firstDefinition(index_, name);
    if (!target) {
        result.error = "Symbol '" + name + "' not found";
        return result;
    }

    result.file = target->relativePath;
    result.line = target->symbol.startLine;

    if (direction == CallDirection::Callers || direction == CallDirection::Both) {
        std::set<std::string> visited = {name};
        std::vector<std::string> frontier = {name};

        for (int level = 1; level <= result.depth && !frontier.empty(); ++level) {
            std::vector<std::string> next;
            for (const auto& current : frontier) {
                for (auto& caller : directCallers(current)) {
                    if (result.callers.size() >= options_.maxCallers) {
                        break;
                    }
                    if (level > 1 && visited.count(caller.function)) {
                        continue;
                    }
                    caller.level = level;
                    if (visited.insert(caller.function).second) {
                        next.push_back(caller.function);
                    }
                    result.callers.push_back(caller);
                }
            }
            frontier = std::move(next);
        }
    }

    if (direction == CallDirection::Callees || direction == CallDirection::Both) {
        std::set<std::string> visited = {name};
        std::vector<const SymbolLocation*> frontier = {target};

        for (int level = 1; level <= result.depth && !frontier.empty(); ++level) {
            std::vector<const SymbolLocation*> next;
            for (const SymbolLocation* current : frontier) {
                for (const auto& calleeName : directCallees(*current)) {
                    if (result.callees.size() >= options_.maxCallees) {
                        break;
                    }
                    if (!visited.insert(calleeName).second) {
                        continue;
                    }

                    CalleeInfo callee;
                    callee.function = calleeName;
                    callee.level = level;

                    if (const SymbolLocation* definition = firstDefinition(index_, calleeName)) {
                        callee.file = definition->relativePath;
                        callee.line = definition->symbol.startLine;
                        next.push_back(definition);
                    }
                    result.callees.push_back(callee);
                }
            }
            frontier = std::move(next);
        }
    }

    return result;
}

FlowTrace CallGraphAnalyzer::traceFlow(const std::string& entryPoint, int maxDepth) const {
    FlowTrace trace;
    trace.entryPoint = entryPoint;

    if (!firstDefinition(index_, entryPoint)) {
        trace.error = "Entry point '" + entryPoint + "' not found";
        return trace;
    }

    std::set<std::string> visited;
    traceStep(entryPoint, 0, std::max(maxDepth, 0), visited, trace.steps);
    return trace;
}

void CallGraphAnalyzer::traceStep(const std::string& name, int depth, int maxDepth,
                                  std::set<std::string>& visited, std::vector<FlowStep>& steps) const {
    if (depth > maxDepth || !visited.insert(name).second) {
        return;
    }

    FlowStep step;
    step.depth = depth;
    step.function = name;

    const SymbolLocation* definition = firstDefinition(index_, name);
    if (!definition) {
        step.file = "(external)";
        step.external = true;
        steps.push_back(step);
        return;
    }

    step.file = definition->relativePath;
    step.line = definition->symbol.startLine;
    step.signature = definition->symbol.signature;
    steps.push_back(step);

    const std::vector<std::string> callees = directCallees(*definition);
    const size_t count = std::min(callees.size(), options_.flowFanout);
    for (size_t i = 0; i < count; ++i) {
        traceStep(callees[i], depth + 1, maxDepth, visited, steps);
    }
}

std::vector<Usage> CallGraphAnalyzer::findUsages(const std::string& name) const {
    std::vector<Usage> usages;
    if (name.empty()) {
        return usages;
    }

    const std::regex wordPattern("\\b" + escapeRegex(name) + "\\b");

    for (const auto& file : index_.files) {
        const auto& lines = fileLines(file);
        for (size_t i = 0; i < lines.size(); ++i) {
            if (!std::regex_search(lines[i], wordPattern)) {
                continue;
            }

            Usage usage;
            usage.file = file;
            usage.line = static_cast<uint32_t>(i + 1);
            usage.content = trim(lines[i]).substr(0, MAX_USAGE_CONTENT);
            usage.type = classifyUsage(lines[i], name);
            usages.push_back(usage);
        }
    }

    return usages;
}

std::string classifyUsage(const std::string& line, const std::string& name) {
    const std::string text = trim(line);

    if ((startsWith(text, "def ") || startsWith(text, "async def ")) && contains(text, name + "(")) {
        return "definition";
    }
    if (contains(text, "function " + name) || contains(text, "function* " + name)) {
        return "definition";
    }
    if ((startsWith(text, "class ") || startsWith(text, "export class ") ||
         startsWith(text, "export default class ")) && contains(text, name)) {
        return "definition";
    }
    if ((contains(text, "import") || contains(text, "require(")) && contains(text, name)) {
        return "import";
    }
    if (contains(text, name + "(")) {
        return "call";
    }
    if (contains(text, "." + name)) {
        return "attribute";
    }
    if (contains(text, name + " =") || contains(text, name + ":")) {
        return "assignment";
    }
    return "reference";
}

std::string formatFlow(const FlowTrace& trace) {
    std::ostringstream ss;

    for (size_t i = 0; i < trace.steps.size(); ++i) {
        const FlowStep& step = trace.steps[i];
        if (i > 0) {
            ss << "\n";
        }

        ss << std::string(static_cast<size_t>(step.depth) * 2, ' ') << "-> " << step.function << "()";
        if (step.external) {
            ss << " [external]";
        } else {
            ss << " @ " << step.file << ":" << step.line;
        }
    }

    return ss.str();
}
